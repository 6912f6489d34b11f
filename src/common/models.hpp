#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/enums.hpp"

namespace leafline {

struct EntityKey {
    EntityType type = EntityType::Book;
    std::int64_t id = 0;

    bool operator==(const EntityKey &other) const
    {
        return type == other.type && id == other.id;
    }

    bool operator!=(const EntityKey &other) const
    {
        return !(*this == other);
    }

    bool operator<(const EntityKey &other) const
    {
        if (type != other.type) {
            return static_cast<int>(type) < static_cast<int>(other.type);
        }
        return id < other.id;
    }
};

// One display row of an event, e.g. {"Author", "Frank Herbert"}.
struct TimelineDetail {
    std::string label;
    std::string value;
};

struct TimelineReadingData {
    std::int64_t bookId = 0;
    ReadingStatus status = ReadingStatus::Reading;
    std::optional<double> rating;
};

// Denormalized columns of a timeline event. These are the only fields the
// rebuilder is allowed to rewrite.
struct TimelinePayload {
    std::string title;
    std::string detailsJson;
    std::optional<std::string> genresJson;
    std::optional<std::string> readingDataJson;

    bool operator==(const TimelinePayload &other) const
    {
        return title == other.title
            && detailsJson == other.detailsJson
            && genresJson == other.genresJson
            && readingDataJson == other.readingDataJson;
    }
};

struct TimelineEvent {
    std::int64_t id = 0;
    EntityType entityType = EntityType::Book;
    std::int64_t entityId = 0;
    std::string action;
    std::chrono::system_clock::time_point occurredAt;
    std::optional<std::int64_t> userId;
    TimelinePayload payload;

    EntityKey key() const
    {
        return EntityKey{entityType, entityId};
    }
};

// Position in the (occurred_at, id) ordering of the feed.
struct TimelineCursor {
    std::chrono::system_clock::time_point occurredAt;
    std::int64_t id = 0;
};

// Entity snapshots: the current (or pre-delete) state of one tracked
// entity, as handed to the recorder or fetched by the rebuilder.
struct BookSnapshot {
    std::int64_t id = 0;
    std::string title;
    std::vector<std::string> authors;
    std::optional<std::string> primaryGenre;
    std::optional<std::string> secondaryGenre;
    std::optional<int> pageCount;
    std::optional<int> yearPublished;
};

struct AuthorSnapshot {
    std::int64_t id = 0;
    std::string name;
};

struct GenreSnapshot {
    std::int64_t id = 0;
    std::string name;
};

struct ReadingSnapshot {
    std::int64_t id = 0;
    std::int64_t userId = 0;
    std::int64_t bookId = 0;
    std::string bookTitle;
    std::vector<std::string> authors;
    ReadingStatus status = ReadingStatus::Reading;
    std::optional<ReadingFormat> format;
    std::optional<double> rating;
};

using EntitySnapshot =
    std::variant<BookSnapshot, AuthorSnapshot, GenreSnapshot, ReadingSnapshot>;

// Display-ready feed entry; no joins needed by the caller.
struct TimelineEntry {
    std::int64_t id = 0;
    EntityType entityType = EntityType::Book;
    std::int64_t entityId = 0;
    std::string action;
    std::chrono::system_clock::time_point occurredAt;
    std::string title;
    std::vector<TimelineDetail> details;
    std::optional<std::vector<std::string>> genres;
    std::optional<TimelineReadingData> readingData;
};

struct TimelineQuery {
    TimelineScope scope = TimelineScope::Global;
    std::optional<std::int64_t> userId;
    std::optional<TimelineCursor> cursor;
    std::optional<int> limit;
};

struct TimelinePage {
    std::vector<TimelineEntry> entries;
    std::optional<TimelineCursor> nextCursor;
};

using NameCount = std::pair<std::string, std::int64_t>;

struct BookSummaryStats {
    std::int64_t totalBooks = 0;
    std::int64_t totalAuthors = 0;
    std::int64_t uniqueGenres = 0;
    std::optional<std::string> topGenre;
    std::optional<std::string> topAuthor;
    std::vector<NameCount> genreCounts;
    std::int64_t maxGenreCount = 0;
    std::vector<NameCount> pageCountDistribution;
    std::vector<NameCount> yearPublishedDistribution;
    std::vector<NameCount> topAuthors;
    std::optional<NameCount> longestBook;
    std::optional<NameCount> shortestBook;
};

struct ReadingStats {
    std::int64_t booksLast30Days = 0;
    std::int64_t booksAllTime = 0;
    std::int64_t pagesLast30Days = 0;
    std::int64_t pagesAllTime = 0;
    std::int64_t booksInProgress = 0;
    std::int64_t booksOnShelf = 0;
    std::int64_t booksOnWishlist = 0;
    std::int64_t booksAbandoned = 0;
    std::optional<double> averageRating;
    std::optional<double> averageDaysToFinish;
    std::vector<std::pair<double, std::int64_t>> ratingDistribution;
    std::vector<NameCount> monthlyBooks;
    std::vector<NameCount> yearlyBooks;
    std::vector<NameCount> paceDistribution;
    std::vector<NameCount> formatCounts;
};

// Complete statistics snapshot, stored as the cache row's data column.
struct CachedStats {
    BookSummaryStats bookSummary;
    ReadingStats reading;
    std::string computedAt;
};

struct StatsCacheEntry {
    std::int64_t userId = 0;
    nlohmann::json data;
    std::string computedAt;
};

struct RebuildOptions {
    int batchSize = 100;
    OrphanPolicy orphanPolicy = OrphanPolicy::Freeze;
    // Ignore a persisted resume cursor and start from the first key.
    bool restart = false;
};

struct RebuildReport {
    int scanned = 0;
    int updated = 0;
    int orphaned = 0;
    int errors = 0;
    bool interrupted = false;

    RebuildReport &operator+=(const RebuildReport &other)
    {
        scanned += other.scanned;
        updated += other.updated;
        orphaned += other.orphaned;
        errors += other.errors;
        return *this;
    }
};

} // namespace leafline
