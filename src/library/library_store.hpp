#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"
#include "timeline/entity_reader.hpp"
#include "timeline/mutation_recorder.hpp"

namespace leafline {

class Database;
class StatsCache;

struct NewBook {
    std::string title;
    std::vector<std::int64_t> authorIds;
    std::optional<std::int64_t> primaryGenreId;
    std::optional<std::int64_t> secondaryGenreId;
    std::optional<int> pageCount;
    std::optional<int> yearPublished;
};

struct NewReading {
    std::int64_t userId = 0;
    std::int64_t bookId = 0;
    std::optional<ReadingFormat> format;
    // Defaults to the store clock.
    std::optional<std::chrono::system_clock::time_point> startedAt;
};

// LibraryStore owns the entity tables. Every tracked mutation runs in one
// transaction together with its timeline event and the stats invalidation;
// any failure rolls all three back.
class LibraryStore : public EntityReader {
public:
    LibraryStore(Database &db,
                 MutationRecorder &recorder,
                 StatsCache &statsCache,
                 Clock clock = systemClock());

    std::int64_t addUser(const std::string &username);
    // Deletes the user's readings (recorded), their shelf and cached stats.
    // Timeline events they authored keep existing without attribution.
    void removeUser(std::int64_t userId);

    std::int64_t createGenre(const std::string &name,
                             std::optional<std::int64_t> actingUserId = std::nullopt);
    void renameGenre(std::int64_t genreId,
                     const std::string &name,
                     std::optional<std::int64_t> actingUserId = std::nullopt);
    void deleteGenre(std::int64_t genreId,
                     std::optional<std::int64_t> actingUserId = std::nullopt);

    std::int64_t createAuthor(const std::string &name,
                              std::optional<std::int64_t> actingUserId = std::nullopt);
    void renameAuthor(std::int64_t authorId,
                      const std::string &name,
                      std::optional<std::int64_t> actingUserId = std::nullopt);
    void deleteAuthor(std::int64_t authorId,
                      std::optional<std::int64_t> actingUserId = std::nullopt);

    std::int64_t createBook(const NewBook &book,
                            std::optional<std::int64_t> actingUserId = std::nullopt);
    void updateBook(std::int64_t bookId,
                    const NewBook &book,
                    std::optional<std::int64_t> actingUserId = std::nullopt);
    // Readings of the book are deleted first, each with its own event.
    void deleteBook(std::int64_t bookId,
                    std::optional<std::int64_t> actingUserId = std::nullopt);

    void shelveBook(std::int64_t userId, std::int64_t bookId, Shelf shelf);
    void unshelveBook(std::int64_t userId, std::int64_t bookId);

    std::int64_t startReading(const NewReading &reading);
    void finishReading(std::int64_t readingId,
                       std::optional<double> rating = std::nullopt,
                       std::optional<std::chrono::system_clock::time_point> finishedAt = std::nullopt);
    void abandonReading(std::int64_t readingId);
    void rateReading(std::int64_t readingId, std::optional<double> rating);
    void deleteReading(std::int64_t readingId);

    // Called after an update to an author, genre, book or reading has
    // committed, so events that embed the entity can be brought up to date.
    // The mutation stays committed whatever the hook does.
    using RefreshHook = std::function<void(const EntityKey &)>;
    void setRefreshHook(RefreshHook hook);

    std::optional<EntitySnapshot> fetch(const EntityKey &key) const override;
    std::vector<EntityKey> dependents(const EntityKey &key) const override;

private:
    std::optional<BookSnapshot> loadBook(std::int64_t bookId) const;
    std::optional<AuthorSnapshot> loadAuthor(std::int64_t authorId) const;
    std::optional<GenreSnapshot> loadGenre(std::int64_t genreId) const;
    std::optional<ReadingSnapshot> loadReading(std::int64_t readingId) const;
    std::vector<std::string> bookAuthorNames(std::int64_t bookId) const;
    std::vector<std::int64_t> readingIdsForBook(std::int64_t bookId) const;
    std::vector<std::int64_t> readingIdsForUser(std::int64_t userId) const;

    void writeBookAuthors(std::int64_t bookId, const std::vector<std::int64_t> &authorIds);
    void deleteReadingRecorded(Transaction &tx, std::int64_t readingId);
    void recordReading(Transaction &tx, std::int64_t readingId, const std::string &action);
    void notifyCommitted(const EntityKey &key);

    Database &m_db;
    MutationRecorder &m_recorder;
    StatsCache &m_statsCache;
    Clock m_clock;
    RefreshHook m_refreshHook;
};

} // namespace leafline
