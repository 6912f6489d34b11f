#include "library/library_store.hpp"

#include <utility>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "stats/stats_cache.hpp"
#include "store/database.hpp"
#include "store/sqlite_utils.hpp"

namespace leafline {

namespace {

constexpr const char *kActionCreated = "created";
constexpr const char *kActionUpdated = "updated";
constexpr const char *kActionDeleted = "deleted";

void bindOptionalId(sqlite3_stmt *stmt, int index, const std::optional<std::int64_t> &id)
{
    sqlite::bindOptionalInt64(stmt, index, id);
}

std::optional<std::string> formatColumn(const std::optional<ReadingFormat> &format)
{
    if (!format.has_value()) {
        return std::nullopt;
    }
    return toReadingFormatString(*format);
}

} // namespace

LibraryStore::LibraryStore(Database &db,
                           MutationRecorder &recorder,
                           StatsCache &statsCache,
                           Clock clock)
    : m_db(db)
    , m_recorder(recorder)
    , m_statsCache(statsCache)
    , m_clock(std::move(clock))
{
}

std::int64_t LibraryStore::addUser(const std::string &username)
{
    sqlite::Statement stmt(m_db.handle(), "INSERT INTO users (username) VALUES (?);");
    sqlite::bindText(stmt.get(), 1, username);
    stmt.run("failed to add user");
    return m_db.lastInsertRowId();
}

void LibraryStore::removeUser(std::int64_t userId)
{
    Transaction tx(m_db);
    const std::vector<std::int64_t> readings = readingIdsForUser(userId);
    for (const std::int64_t readingId : readings) {
        deleteReadingRecorded(tx, readingId);
    }

    sqlite::Statement stmt(m_db.handle(), "DELETE FROM users WHERE id = ?;");
    sqlite3_bind_int64(stmt.get(), 1, userId);
    stmt.run("failed to remove user");
    if (m_db.changes() == 0) {
        throw NotFoundError("user " + std::to_string(userId) + " not found");
    }
    tx.commit();

    LLOG_INFO(QStringLiteral("LibraryStore"),
              QStringLiteral("LibraryStore::removeUser"),
              QStringLiteral("user_removed"),
              QStringLiteral("admin_request"),
              QStringLiteral("delete"),
              logging::userWho(userId),
              QString(),
              (nlohmann::json{{"readingsDeleted", readings.size()}}));
}

std::int64_t LibraryStore::createGenre(const std::string &name,
                                       std::optional<std::int64_t> actingUserId)
{
    Transaction tx(m_db);
    sqlite::Statement stmt(m_db.handle(), "INSERT INTO genres (name) VALUES (?);");
    sqlite::bindText(stmt.get(), 1, name);
    stmt.run("failed to create genre");
    const std::int64_t id = m_db.lastInsertRowId();

    m_recorder.record(tx, MutationNotice{EntityType::Genre, id, kActionCreated, actingUserId,
                                         GenreSnapshot{id, name}});
    tx.commit();
    return id;
}

void LibraryStore::renameGenre(std::int64_t genreId,
                               const std::string &name,
                               std::optional<std::int64_t> actingUserId)
{
    Transaction tx(m_db);
    sqlite::Statement stmt(m_db.handle(), "UPDATE genres SET name = ? WHERE id = ?;");
    sqlite::bindText(stmt.get(), 1, name);
    sqlite3_bind_int64(stmt.get(), 2, genreId);
    stmt.run("failed to rename genre");
    if (m_db.changes() == 0) {
        throw NotFoundError("genre " + std::to_string(genreId) + " not found");
    }

    m_recorder.record(tx, MutationNotice{EntityType::Genre, genreId, kActionUpdated, actingUserId,
                                         GenreSnapshot{genreId, name}});
    m_statsCache.invalidateAll();
    tx.commit();
    notifyCommitted(EntityKey{EntityType::Genre, genreId});
}

void LibraryStore::deleteGenre(std::int64_t genreId, std::optional<std::int64_t> actingUserId)
{
    Transaction tx(m_db);
    const auto genre = loadGenre(genreId);
    if (!genre.has_value()) {
        throw NotFoundError("genre " + std::to_string(genreId) + " not found");
    }

    sqlite::Statement stmt(m_db.handle(), "DELETE FROM genres WHERE id = ?;");
    sqlite3_bind_int64(stmt.get(), 1, genreId);
    stmt.run("failed to delete genre");

    m_recorder.record(tx, MutationNotice{EntityType::Genre, genreId, kActionDeleted, actingUserId,
                                         *genre});
    m_statsCache.invalidateAll();
    tx.commit();
}

std::int64_t LibraryStore::createAuthor(const std::string &name,
                                        std::optional<std::int64_t> actingUserId)
{
    Transaction tx(m_db);
    sqlite::Statement stmt(m_db.handle(), "INSERT INTO authors (name) VALUES (?);");
    sqlite::bindText(stmt.get(), 1, name);
    stmt.run("failed to create author");
    const std::int64_t id = m_db.lastInsertRowId();

    m_recorder.record(tx, MutationNotice{EntityType::Author, id, kActionCreated, actingUserId,
                                         AuthorSnapshot{id, name}});
    tx.commit();
    return id;
}

void LibraryStore::renameAuthor(std::int64_t authorId,
                                const std::string &name,
                                std::optional<std::int64_t> actingUserId)
{
    Transaction tx(m_db);
    sqlite::Statement stmt(m_db.handle(), "UPDATE authors SET name = ? WHERE id = ?;");
    sqlite::bindText(stmt.get(), 1, name);
    sqlite3_bind_int64(stmt.get(), 2, authorId);
    stmt.run("failed to rename author");
    if (m_db.changes() == 0) {
        throw NotFoundError("author " + std::to_string(authorId) + " not found");
    }

    m_recorder.record(tx, MutationNotice{EntityType::Author, authorId, kActionUpdated,
                                         actingUserId, AuthorSnapshot{authorId, name}});
    m_statsCache.invalidateAll();
    tx.commit();
    notifyCommitted(EntityKey{EntityType::Author, authorId});
}

void LibraryStore::deleteAuthor(std::int64_t authorId, std::optional<std::int64_t> actingUserId)
{
    Transaction tx(m_db);
    const auto author = loadAuthor(authorId);
    if (!author.has_value()) {
        throw NotFoundError("author " + std::to_string(authorId) + " not found");
    }

    sqlite::Statement stmt(m_db.handle(), "DELETE FROM authors WHERE id = ?;");
    sqlite3_bind_int64(stmt.get(), 1, authorId);
    stmt.run("failed to delete author");

    m_recorder.record(tx, MutationNotice{EntityType::Author, authorId, kActionDeleted,
                                         actingUserId, *author});
    m_statsCache.invalidateAll();
    tx.commit();
}

std::int64_t LibraryStore::createBook(const NewBook &book, std::optional<std::int64_t> actingUserId)
{
    Transaction tx(m_db);
    sqlite::Statement stmt(m_db.handle(),
                           "INSERT INTO books (title, page_count, year_published,"
                           " primary_genre_id, secondary_genre_id)"
                           " VALUES (?, ?, ?, ?, ?);");
    sqlite::bindText(stmt.get(), 1, book.title);
    sqlite::bindOptionalInt(stmt.get(), 2, book.pageCount);
    sqlite::bindOptionalInt(stmt.get(), 3, book.yearPublished);
    bindOptionalId(stmt.get(), 4, book.primaryGenreId);
    bindOptionalId(stmt.get(), 5, book.secondaryGenreId);
    stmt.run("failed to create book");
    const std::int64_t id = m_db.lastInsertRowId();

    writeBookAuthors(id, book.authorIds);

    m_recorder.record(tx, MutationNotice{EntityType::Book, id, kActionCreated, actingUserId,
                                         loadBook(id)});
    tx.commit();
    return id;
}

void LibraryStore::updateBook(std::int64_t bookId,
                              const NewBook &book,
                              std::optional<std::int64_t> actingUserId)
{
    Transaction tx(m_db);
    sqlite::Statement stmt(m_db.handle(),
                           "UPDATE books SET title = ?, page_count = ?, year_published = ?,"
                           " primary_genre_id = ?, secondary_genre_id = ?"
                           " WHERE id = ?;");
    sqlite::bindText(stmt.get(), 1, book.title);
    sqlite::bindOptionalInt(stmt.get(), 2, book.pageCount);
    sqlite::bindOptionalInt(stmt.get(), 3, book.yearPublished);
    bindOptionalId(stmt.get(), 4, book.primaryGenreId);
    bindOptionalId(stmt.get(), 5, book.secondaryGenreId);
    sqlite3_bind_int64(stmt.get(), 6, bookId);
    stmt.run("failed to update book");
    if (m_db.changes() == 0) {
        throw NotFoundError("book " + std::to_string(bookId) + " not found");
    }

    sqlite::Statement clear(m_db.handle(), "DELETE FROM book_authors WHERE book_id = ?;");
    sqlite3_bind_int64(clear.get(), 1, bookId);
    clear.run("failed to clear book authors");
    writeBookAuthors(bookId, book.authorIds);

    m_recorder.record(tx, MutationNotice{EntityType::Book, bookId, kActionUpdated, actingUserId,
                                         loadBook(bookId)});
    m_statsCache.invalidateAll();
    tx.commit();
    notifyCommitted(EntityKey{EntityType::Book, bookId});
}

void LibraryStore::deleteBook(std::int64_t bookId, std::optional<std::int64_t> actingUserId)
{
    Transaction tx(m_db);
    const auto book = loadBook(bookId);
    if (!book.has_value()) {
        throw NotFoundError("book " + std::to_string(bookId) + " not found");
    }

    for (const std::int64_t readingId : readingIdsForBook(bookId)) {
        deleteReadingRecorded(tx, readingId);
    }

    sqlite::Statement stmt(m_db.handle(), "DELETE FROM books WHERE id = ?;");
    sqlite3_bind_int64(stmt.get(), 1, bookId);
    stmt.run("failed to delete book");

    m_recorder.record(tx, MutationNotice{EntityType::Book, bookId, kActionDeleted, actingUserId,
                                         *book});
    m_statsCache.invalidateAll();
    tx.commit();
}

void LibraryStore::shelveBook(std::int64_t userId, std::int64_t bookId, Shelf shelf)
{
    Transaction tx(m_db);
    sqlite::Statement stmt(m_db.handle(),
                           "INSERT INTO user_books (user_id, book_id, shelf) VALUES (?, ?, ?)"
                           " ON CONFLICT(user_id, book_id) DO UPDATE SET shelf = excluded.shelf;");
    sqlite3_bind_int64(stmt.get(), 1, userId);
    sqlite3_bind_int64(stmt.get(), 2, bookId);
    sqlite::bindText(stmt.get(), 3, toShelfString(shelf));
    stmt.run("failed to shelve book");

    m_statsCache.invalidate(userId);
    tx.commit();
}

void LibraryStore::unshelveBook(std::int64_t userId, std::int64_t bookId)
{
    Transaction tx(m_db);
    sqlite::Statement stmt(m_db.handle(),
                           "DELETE FROM user_books WHERE user_id = ? AND book_id = ?;");
    sqlite3_bind_int64(stmt.get(), 1, userId);
    sqlite3_bind_int64(stmt.get(), 2, bookId);
    stmt.run("failed to unshelve book");

    m_statsCache.invalidate(userId);
    tx.commit();
}

std::int64_t LibraryStore::startReading(const NewReading &reading)
{
    const std::string now = toIso8601Utc(m_clock());
    const std::string startedAt =
        reading.startedAt.has_value() ? toIso8601Utc(*reading.startedAt) : now;

    Transaction tx(m_db);
    sqlite::Statement stmt(m_db.handle(),
                           "INSERT INTO readings (user_id, book_id, status, format, started_at,"
                           " created_at, updated_at)"
                           " VALUES (?, ?, 'reading', ?, ?, ?, ?);");
    sqlite3_bind_int64(stmt.get(), 1, reading.userId);
    sqlite3_bind_int64(stmt.get(), 2, reading.bookId);
    sqlite::bindOptionalText(stmt.get(), 3, formatColumn(reading.format));
    sqlite::bindText(stmt.get(), 4, startedAt);
    sqlite::bindText(stmt.get(), 5, now);
    sqlite::bindText(stmt.get(), 6, now);
    stmt.run("failed to start reading");
    const std::int64_t id = m_db.lastInsertRowId();

    recordReading(tx, id, "started");
    tx.commit();
    return id;
}

void LibraryStore::finishReading(std::int64_t readingId,
                                 std::optional<double> rating,
                                 std::optional<std::chrono::system_clock::time_point> finishedAt)
{
    const auto now = m_clock();
    Transaction tx(m_db);
    sqlite::Statement stmt(m_db.handle(),
                           "UPDATE readings SET status = 'read', rating = COALESCE(?, rating),"
                           " finished_at = ?, updated_at = ? WHERE id = ?;");
    sqlite::bindOptionalDouble(stmt.get(), 1, rating);
    sqlite::bindText(stmt.get(), 2, toIso8601Utc(finishedAt.value_or(now)));
    sqlite::bindText(stmt.get(), 3, toIso8601Utc(now));
    sqlite3_bind_int64(stmt.get(), 4, readingId);
    stmt.run("failed to finish reading");
    if (m_db.changes() == 0) {
        throw NotFoundError("reading " + std::to_string(readingId) + " not found");
    }

    recordReading(tx, readingId, "finished");
    tx.commit();
}

void LibraryStore::abandonReading(std::int64_t readingId)
{
    Transaction tx(m_db);
    sqlite::Statement stmt(m_db.handle(),
                           "UPDATE readings SET status = 'abandoned', updated_at = ? WHERE id = ?;");
    sqlite::bindText(stmt.get(), 1, toIso8601Utc(m_clock()));
    sqlite3_bind_int64(stmt.get(), 2, readingId);
    stmt.run("failed to abandon reading");
    if (m_db.changes() == 0) {
        throw NotFoundError("reading " + std::to_string(readingId) + " not found");
    }

    recordReading(tx, readingId, "abandoned");
    tx.commit();
}

void LibraryStore::rateReading(std::int64_t readingId, std::optional<double> rating)
{
    Transaction tx(m_db);
    sqlite::Statement stmt(m_db.handle(),
                           "UPDATE readings SET rating = ?, updated_at = ? WHERE id = ?;");
    sqlite::bindOptionalDouble(stmt.get(), 1, rating);
    sqlite::bindText(stmt.get(), 2, toIso8601Utc(m_clock()));
    sqlite3_bind_int64(stmt.get(), 3, readingId);
    stmt.run("failed to rate reading");
    if (m_db.changes() == 0) {
        throw NotFoundError("reading " + std::to_string(readingId) + " not found");
    }

    recordReading(tx, readingId, kActionUpdated);
    tx.commit();
    notifyCommitted(EntityKey{EntityType::Reading, readingId});
}

void LibraryStore::deleteReading(std::int64_t readingId)
{
    Transaction tx(m_db);
    deleteReadingRecorded(tx, readingId);
    tx.commit();
}

void LibraryStore::setRefreshHook(RefreshHook hook)
{
    m_refreshHook = std::move(hook);
}

void LibraryStore::notifyCommitted(const EntityKey &key)
{
    if (m_refreshHook) {
        m_refreshHook(key);
    }
}

void LibraryStore::recordReading(Transaction &tx, std::int64_t readingId, const std::string &action)
{
    const auto reading = loadReading(readingId);
    if (!reading.has_value()) {
        throw NotFoundError("reading " + std::to_string(readingId) + " not found");
    }
    m_recorder.record(tx, MutationNotice{EntityType::Reading, readingId, action,
                                         reading->userId, *reading});
    m_statsCache.invalidate(reading->userId);
}

void LibraryStore::deleteReadingRecorded(Transaction &tx, std::int64_t readingId)
{
    const auto reading = loadReading(readingId);
    if (!reading.has_value()) {
        throw NotFoundError("reading " + std::to_string(readingId) + " not found");
    }

    sqlite::Statement stmt(m_db.handle(), "DELETE FROM readings WHERE id = ?;");
    sqlite3_bind_int64(stmt.get(), 1, readingId);
    stmt.run("failed to delete reading");

    m_recorder.record(tx, MutationNotice{EntityType::Reading, readingId, kActionDeleted,
                                         reading->userId, *reading});
    m_statsCache.invalidate(reading->userId);
}

void LibraryStore::writeBookAuthors(std::int64_t bookId, const std::vector<std::int64_t> &authorIds)
{
    int position = 0;
    for (const std::int64_t authorId : authorIds) {
        sqlite::Statement stmt(m_db.handle(),
                               "INSERT OR IGNORE INTO book_authors (book_id, author_id, position)"
                               " VALUES (?, ?, ?);");
        sqlite3_bind_int64(stmt.get(), 1, bookId);
        sqlite3_bind_int64(stmt.get(), 2, authorId);
        sqlite3_bind_int(stmt.get(), 3, position++);
        stmt.run("failed to link book author");
    }
}

std::optional<EntitySnapshot> LibraryStore::fetch(const EntityKey &key) const
{
    switch (key.type) {
    case EntityType::Book:
        if (auto book = loadBook(key.id)) {
            return EntitySnapshot{std::move(*book)};
        }
        return std::nullopt;
    case EntityType::Author:
        if (auto author = loadAuthor(key.id)) {
            return EntitySnapshot{std::move(*author)};
        }
        return std::nullopt;
    case EntityType::Genre:
        if (auto genre = loadGenre(key.id)) {
            return EntitySnapshot{std::move(*genre)};
        }
        return std::nullopt;
    case EntityType::Reading:
        if (auto reading = loadReading(key.id)) {
            return EntitySnapshot{std::move(*reading)};
        }
        return std::nullopt;
    }
    return std::nullopt;
}

std::vector<EntityKey> LibraryStore::dependents(const EntityKey &key) const
{
    std::vector<EntityKey> keys;
    switch (key.type) {
    case EntityType::Author: {
        sqlite::Statement stmt(m_db.handle(),
                               "SELECT book_id FROM book_authors WHERE author_id = ?"
                               " ORDER BY book_id;");
        sqlite3_bind_int64(stmt.get(), 1, key.id);
        std::vector<std::int64_t> books;
        while (stmt.step()) {
            books.push_back(sqlite3_column_int64(stmt.get(), 0));
        }
        for (const std::int64_t bookId : books) {
            keys.push_back(EntityKey{EntityType::Book, bookId});
            for (const std::int64_t readingId : readingIdsForBook(bookId)) {
                keys.push_back(EntityKey{EntityType::Reading, readingId});
            }
        }
        break;
    }
    case EntityType::Genre: {
        sqlite::Statement stmt(m_db.handle(),
                               "SELECT id FROM books"
                               " WHERE primary_genre_id = ?1 OR secondary_genre_id = ?1"
                               " ORDER BY id;");
        sqlite3_bind_int64(stmt.get(), 1, key.id);
        while (stmt.step()) {
            keys.push_back(EntityKey{EntityType::Book, sqlite3_column_int64(stmt.get(), 0)});
        }
        break;
    }
    case EntityType::Book:
        for (const std::int64_t readingId : readingIdsForBook(key.id)) {
            keys.push_back(EntityKey{EntityType::Reading, readingId});
        }
        break;
    case EntityType::Reading:
        break;
    }
    return keys;
}

std::optional<BookSnapshot> LibraryStore::loadBook(std::int64_t bookId) const
{
    sqlite::Statement stmt(m_db.handle(),
                           "SELECT b.title, b.page_count, b.year_published, pg.name, sg.name"
                           " FROM books b"
                           " LEFT JOIN genres pg ON pg.id = b.primary_genre_id"
                           " LEFT JOIN genres sg ON sg.id = b.secondary_genre_id"
                           " WHERE b.id = ? LIMIT 1;");
    sqlite3_bind_int64(stmt.get(), 1, bookId);
    if (!stmt.step()) {
        return std::nullopt;
    }

    BookSnapshot book;
    book.id = bookId;
    book.title = sqlite::columnText(stmt.get(), 0);
    book.pageCount = sqlite::columnOptionalInt(stmt.get(), 1);
    book.yearPublished = sqlite::columnOptionalInt(stmt.get(), 2);
    book.primaryGenre = sqlite::columnOptionalText(stmt.get(), 3);
    book.secondaryGenre = sqlite::columnOptionalText(stmt.get(), 4);
    book.authors = bookAuthorNames(bookId);
    return book;
}

std::optional<AuthorSnapshot> LibraryStore::loadAuthor(std::int64_t authorId) const
{
    sqlite::Statement stmt(m_db.handle(), "SELECT name FROM authors WHERE id = ? LIMIT 1;");
    sqlite3_bind_int64(stmt.get(), 1, authorId);
    if (!stmt.step()) {
        return std::nullopt;
    }
    return AuthorSnapshot{authorId, sqlite::columnText(stmt.get(), 0)};
}

std::optional<GenreSnapshot> LibraryStore::loadGenre(std::int64_t genreId) const
{
    sqlite::Statement stmt(m_db.handle(), "SELECT name FROM genres WHERE id = ? LIMIT 1;");
    sqlite3_bind_int64(stmt.get(), 1, genreId);
    if (!stmt.step()) {
        return std::nullopt;
    }
    return GenreSnapshot{genreId, sqlite::columnText(stmt.get(), 0)};
}

std::optional<ReadingSnapshot> LibraryStore::loadReading(std::int64_t readingId) const
{
    sqlite::Statement stmt(m_db.handle(),
                           "SELECT r.user_id, r.book_id, r.status, r.format, r.rating, b.title"
                           " FROM readings r JOIN books b ON b.id = r.book_id"
                           " WHERE r.id = ? LIMIT 1;");
    sqlite3_bind_int64(stmt.get(), 1, readingId);
    if (!stmt.step()) {
        return std::nullopt;
    }

    ReadingSnapshot reading;
    reading.id = readingId;
    reading.userId = sqlite3_column_int64(stmt.get(), 0);
    reading.bookId = sqlite3_column_int64(stmt.get(), 1);
    const std::string status = sqlite::columnText(stmt.get(), 2);
    const auto parsedStatus = parseReadingStatusString(status);
    if (!parsedStatus.has_value()) {
        throw StorageError("unknown reading status: " + status);
    }
    reading.status = *parsedStatus;
    if (const auto format = sqlite::columnOptionalText(stmt.get(), 3)) {
        reading.format = parseReadingFormatString(*format);
    }
    reading.rating = sqlite::columnOptionalDouble(stmt.get(), 4);
    reading.bookTitle = sqlite::columnText(stmt.get(), 5);
    reading.authors = bookAuthorNames(reading.bookId);
    return reading;
}

std::vector<std::string> LibraryStore::bookAuthorNames(std::int64_t bookId) const
{
    sqlite::Statement stmt(m_db.handle(),
                           "SELECT a.name FROM book_authors ba"
                           " JOIN authors a ON a.id = ba.author_id"
                           " WHERE ba.book_id = ? ORDER BY ba.position, a.id;");
    sqlite3_bind_int64(stmt.get(), 1, bookId);

    std::vector<std::string> names;
    while (stmt.step()) {
        names.push_back(sqlite::columnText(stmt.get(), 0));
    }
    return names;
}

std::vector<std::int64_t> LibraryStore::readingIdsForBook(std::int64_t bookId) const
{
    sqlite::Statement stmt(m_db.handle(), "SELECT id FROM readings WHERE book_id = ? ORDER BY id;");
    sqlite3_bind_int64(stmt.get(), 1, bookId);

    std::vector<std::int64_t> ids;
    while (stmt.step()) {
        ids.push_back(sqlite3_column_int64(stmt.get(), 0));
    }
    return ids;
}

std::vector<std::int64_t> LibraryStore::readingIdsForUser(std::int64_t userId) const
{
    sqlite::Statement stmt(m_db.handle(), "SELECT id FROM readings WHERE user_id = ? ORDER BY id;");
    sqlite3_bind_int64(stmt.get(), 1, userId);

    std::vector<std::int64_t> ids;
    while (stmt.step()) {
        ids.push_back(sqlite3_column_int64(stmt.get(), 0));
    }
    return ids;
}

} // namespace leafline
