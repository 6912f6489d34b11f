#include "store/database.hpp"

#include <filesystem>
#include <utility>

#include "common/errors.hpp"
#include "common/logging.hpp"
#include "store/sqlite_utils.hpp"

namespace leafline {

namespace {

constexpr const char *kCreateUsersTable =
    "CREATE TABLE IF NOT EXISTS users ("
    "    id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "    username TEXT NOT NULL UNIQUE,"
    "    created_at TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%fZ', 'now'))"
    ");";

constexpr const char *kCreateGenresTable =
    "CREATE TABLE IF NOT EXISTS genres ("
    "    id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "    name TEXT NOT NULL,"
    "    created_at TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%fZ', 'now'))"
    ");"
    "CREATE UNIQUE INDEX IF NOT EXISTS idx_genres_name ON genres(LOWER(TRIM(name)));";

constexpr const char *kCreateAuthorsTable =
    "CREATE TABLE IF NOT EXISTS authors ("
    "    id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "    name TEXT NOT NULL,"
    "    created_at TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%fZ', 'now'))"
    ");"
    "CREATE UNIQUE INDEX IF NOT EXISTS idx_authors_name ON authors(LOWER(TRIM(name)));";

constexpr const char *kCreateBooksTable =
    "CREATE TABLE IF NOT EXISTS books ("
    "    id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "    title TEXT NOT NULL,"
    "    page_count INTEGER,"
    "    year_published INTEGER,"
    "    primary_genre_id INTEGER REFERENCES genres(id) ON DELETE SET NULL,"
    "    secondary_genre_id INTEGER REFERENCES genres(id) ON DELETE SET NULL,"
    "    created_at TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%fZ', 'now'))"
    ");"
    "CREATE UNIQUE INDEX IF NOT EXISTS idx_books_title ON books(LOWER(TRIM(title)));"
    "CREATE INDEX IF NOT EXISTS idx_books_primary_genre ON books(primary_genre_id);"
    "CREATE INDEX IF NOT EXISTS idx_books_secondary_genre ON books(secondary_genre_id);";

constexpr const char *kCreateBookAuthorsTable =
    "CREATE TABLE IF NOT EXISTS book_authors ("
    "    book_id INTEGER NOT NULL REFERENCES books(id) ON DELETE CASCADE,"
    "    author_id INTEGER NOT NULL REFERENCES authors(id) ON DELETE CASCADE,"
    "    position INTEGER NOT NULL DEFAULT 0,"
    "    PRIMARY KEY (book_id, author_id)"
    ");"
    "CREATE INDEX IF NOT EXISTS idx_book_authors_author ON book_authors(author_id);";

constexpr const char *kCreateUserBooksTable =
    "CREATE TABLE IF NOT EXISTS user_books ("
    "    id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "    user_id INTEGER NOT NULL REFERENCES users(id) ON DELETE CASCADE,"
    "    book_id INTEGER NOT NULL REFERENCES books(id) ON DELETE CASCADE,"
    "    shelf TEXT NOT NULL DEFAULT 'library' CHECK (shelf IN ('library', 'wishlist')),"
    "    created_at TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%fZ', 'now')),"
    "    UNIQUE(user_id, book_id)"
    ");"
    "CREATE INDEX IF NOT EXISTS idx_user_books_book_id ON user_books(book_id);"
    "CREATE INDEX IF NOT EXISTS idx_user_books_shelf ON user_books(user_id, shelf);";

constexpr const char *kCreateReadingsTable =
    "CREATE TABLE IF NOT EXISTS readings ("
    "    id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "    user_id INTEGER NOT NULL REFERENCES users(id) ON DELETE CASCADE,"
    "    book_id INTEGER NOT NULL REFERENCES books(id) ON DELETE CASCADE,"
    "    status TEXT NOT NULL DEFAULT 'reading'"
    "        CHECK (status IN ('reading', 'read', 'abandoned')),"
    "    started_at TEXT,"
    "    finished_at TEXT,"
    "    rating REAL CHECK (rating IS NULL OR (rating >= 0.5 AND rating <= 5.0"
    "        AND (rating * 2) = CAST(rating * 2 AS INTEGER))),"
    "    format TEXT CHECK (format IS NULL OR format IN ('physical', 'ereader', 'audiobook')),"
    "    created_at TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%fZ', 'now')),"
    "    updated_at TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%fZ', 'now'))"
    ");"
    "CREATE INDEX IF NOT EXISTS idx_readings_book_id ON readings(book_id);"
    "CREATE INDEX IF NOT EXISTS idx_readings_user_status_finished"
    "    ON readings(user_id, status, finished_at);";

constexpr const char *kCreateTimelineTable =
    "CREATE TABLE IF NOT EXISTS timeline_events ("
    "    id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "    entity_type TEXT NOT NULL"
    "        CHECK (entity_type IN ('author', 'book', 'reading', 'genre')),"
    "    entity_id INTEGER NOT NULL,"
    "    action TEXT NOT NULL,"
    "    occurred_at INTEGER NOT NULL,"
    "    title TEXT NOT NULL,"
    "    details_json TEXT,"
    "    genres_json TEXT,"
    "    user_id INTEGER REFERENCES users(id) ON DELETE SET NULL"
    ");"
    "CREATE INDEX IF NOT EXISTS idx_timeline_events_entity"
    "    ON timeline_events(entity_type, entity_id);"
    "CREATE INDEX IF NOT EXISTS idx_timeline_events_occurred_at"
    "    ON timeline_events(occurred_at DESC, id DESC);"
    "CREATE INDEX IF NOT EXISTS idx_timeline_user_occurred"
    "    ON timeline_events(user_id, occurred_at DESC, id DESC);";

constexpr const char *kCreateStatsCacheTable =
    "CREATE TABLE IF NOT EXISTS stats_cache ("
    "    id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "    user_id INTEGER NOT NULL REFERENCES users(id) ON DELETE CASCADE,"
    "    data TEXT NOT NULL,"
    "    computed_at TEXT NOT NULL,"
    "    UNIQUE(user_id)"
    ");";

constexpr const char *kCreateMetaTable =
    "CREATE TABLE IF NOT EXISTS meta ("
    "    key TEXT PRIMARY KEY,"
    "    value TEXT NOT NULL"
    ");";

} // namespace

struct Database::Impl {
    sqlite3 *db = nullptr;
    std::string path;

    ~Impl()
    {
        if (db) {
            sqlite3_close(db);
        }
    }
};

Database::Database(const std::string &path, int busyTimeoutMs)
    : impl(std::make_unique<Impl>())
{
    impl->path = path;
    if (path != ":memory:") {
        const std::filesystem::path parent = std::filesystem::path(path).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent);
        }
    }

    if (sqlite3_open(path.c_str(), &impl->db) != SQLITE_OK) {
        const std::string message = impl->db ? sqlite3_errmsg(impl->db) : "out of memory";
        sqlite3_close(impl->db);
        impl->db = nullptr;
        throw StorageError("failed to open leafline database " + path + ": " + message);
    }

    sqlite3_busy_timeout(impl->db, busyTimeoutMs);
    sqlite::execOrThrow(impl->db, "PRAGMA foreign_keys = ON;");
    if (path != ":memory:") {
        sqlite::execOrThrow(impl->db, "PRAGMA journal_mode = WAL;");
    }

    sqlite::execOrThrow(impl->db, "BEGIN IMMEDIATE;");
    try {
        sqlite::execOrThrow(impl->db, kCreateUsersTable);
        sqlite::execOrThrow(impl->db, kCreateGenresTable);
        sqlite::execOrThrow(impl->db, kCreateAuthorsTable);
        sqlite::execOrThrow(impl->db, kCreateBooksTable);
        sqlite::execOrThrow(impl->db, kCreateBookAuthorsTable);
        sqlite::execOrThrow(impl->db, kCreateUserBooksTable);
        sqlite::execOrThrow(impl->db, kCreateReadingsTable);
        sqlite::execOrThrow(impl->db, kCreateTimelineTable);
        sqlite::execOrThrow(impl->db, kCreateStatsCacheTable);
        sqlite::execOrThrow(impl->db, kCreateMetaTable);

        // Databases created before reading events carried structured data.
        if (!sqlite::columnExists(impl->db, "timeline_events", "reading_data_json")) {
            sqlite::execOrThrow(impl->db,
                                "ALTER TABLE timeline_events ADD COLUMN reading_data_json TEXT;");
            LLOG_INFO(QStringLiteral("Database"),
                      QStringLiteral("Database::Database"),
                      QStringLiteral("column_added"),
                      QStringLiteral("schema_migration"),
                      QStringLiteral("alter_table"),
                      logging::defaultWho(),
                      QString(),
                      (nlohmann::json{{"table", "timeline_events"},
                                     {"column", "reading_data_json"}}));
        }
        sqlite::execOrThrow(impl->db, "COMMIT;");
    } catch (const StorageError &) {
        sqlite3_exec(impl->db, "ROLLBACK;", nullptr, nullptr, nullptr);
        throw;
    }

    LLOG_DEBUG(QStringLiteral("Database"),
               QStringLiteral("Database::Database"),
               QStringLiteral("database_opened"),
               QStringLiteral("startup"),
               QStringLiteral("sqlite3_open"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"path", path}, {"busyTimeoutMs", busyTimeoutMs}}));
}

Database::~Database() = default;

sqlite3 *Database::handle() const
{
    return impl->db;
}

const std::string &Database::path() const
{
    return impl->path;
}

std::optional<std::string> Database::getMeta(const std::string &key) const
{
    sqlite::Statement stmt(impl->db, "SELECT value FROM meta WHERE key = ? LIMIT 1;");
    sqlite::bindText(stmt.get(), 1, key);

    if (!stmt.step()) {
        return std::nullopt;
    }
    return sqlite::columnText(stmt.get(), 0);
}

void Database::setMeta(const std::string &key, const std::string &value)
{
    sqlite::Statement stmt(impl->db,
                           "INSERT OR REPLACE INTO meta (key, value) VALUES (?, ?);");
    sqlite::bindText(stmt.get(), 1, key);
    sqlite::bindText(stmt.get(), 2, value);
    stmt.run("failed to set meta value");
}

void Database::deleteMeta(const std::string &key)
{
    sqlite::Statement stmt(impl->db, "DELETE FROM meta WHERE key = ?;");
    sqlite::bindText(stmt.get(), 1, key);
    stmt.run("failed to delete meta value");
}

bool Database::integrityCheck(std::string *message) const
{
    sqlite::Statement stmt(impl->db, "PRAGMA integrity_check;");

    if (!stmt.step()) {
        if (message) {
            *message = "integrity_check failed to return a result";
        }
        return false;
    }

    const std::string result = sqlite::columnText(stmt.get(), 0);
    if (message) {
        *message = result;
    }
    return result == "ok";
}

bool Database::inTransaction() const
{
    return sqlite3_get_autocommit(impl->db) == 0;
}

std::int64_t Database::lastInsertRowId() const
{
    return sqlite3_last_insert_rowid(impl->db);
}

int Database::changes() const
{
    return sqlite3_changes(impl->db);
}

Transaction::Transaction(Database &db, Mode mode)
    : m_db(db)
{
    sqlite::execOrThrow(m_db.handle(),
                        mode == Mode::Immediate ? "BEGIN IMMEDIATE;" : "BEGIN DEFERRED;");
    m_open = true;
}

Transaction::~Transaction()
{
    if (!m_open) {
        return;
    }
    char *error = nullptr;
    if (sqlite3_exec(m_db.handle(), "ROLLBACK;", nullptr, nullptr, &error) != SQLITE_OK) {
        LLOG_ERROR(QStringLiteral("Database"),
                   QStringLiteral("Transaction::~Transaction"),
                   QStringLiteral("rollback_failed"),
                   QStringLiteral("transaction_abandoned"),
                   QStringLiteral("sqlite3_exec"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"error", error ? error : "unknown"}}));
    }
    sqlite3_free(error);
}

void Transaction::commit()
{
    if (!m_open) {
        throw StorageError("commit on a closed transaction");
    }
    sqlite::execOrThrow(m_db.handle(), "COMMIT;");
    m_open = false;
}

Savepoint::Savepoint(Transaction &tx, std::string name)
    : m_db(tx.database())
    , m_name(std::move(name))
{
    sqlite::execOrThrow(m_db.handle(), ("SAVEPOINT " + m_name + ";").c_str());
    m_active = true;
}

Savepoint::~Savepoint()
{
    if (!m_active) {
        return;
    }
    const std::string sql = "ROLLBACK TO " + m_name + "; RELEASE " + m_name + ";";
    if (sqlite3_exec(m_db.handle(), sql.c_str(), nullptr, nullptr, nullptr) != SQLITE_OK) {
        LLOG_ERROR(QStringLiteral("Database"),
                   QStringLiteral("Savepoint::~Savepoint"),
                   QStringLiteral("savepoint_rollback_failed"),
                   QStringLiteral("savepoint_abandoned"),
                   QStringLiteral("sqlite3_exec"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"savepoint", m_name},
                                  {"error", sqlite3_errmsg(m_db.handle())}}));
    }
}

void Savepoint::release()
{
    sqlite::execOrThrow(m_db.handle(), ("RELEASE " + m_name + ";").c_str());
    m_active = false;
}

void Savepoint::rollback()
{
    const std::string sql = "ROLLBACK TO " + m_name + "; RELEASE " + m_name + ";";
    sqlite::execOrThrow(m_db.handle(), sql.c_str());
    m_active = false;
}

} // namespace leafline
