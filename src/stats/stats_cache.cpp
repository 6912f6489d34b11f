#include "stats/stats_cache.hpp"

#include "common/errors.hpp"
#include "store/database.hpp"
#include "store/sqlite_utils.hpp"

namespace leafline {

StatsCache::StatsCache(Database &db)
    : m_db(db)
{
}

std::optional<StatsCacheEntry> StatsCache::get(std::int64_t userId) const
{
    sqlite::Statement stmt(m_db.handle(),
                           "SELECT data, computed_at FROM stats_cache WHERE user_id = ? LIMIT 1;");
    sqlite3_bind_int64(stmt.get(), 1, userId);

    if (!stmt.step()) {
        return std::nullopt;
    }

    StatsCacheEntry entry;
    entry.userId = userId;
    try {
        entry.data = nlohmann::json::parse(sqlite::columnText(stmt.get(), 0));
    } catch (const nlohmann::json::parse_error &error) {
        throw StorageError(std::string("corrupt stats_cache row: ") + error.what());
    }
    entry.computedAt = sqlite::columnText(stmt.get(), 1);
    return entry;
}

void StatsCache::upsert(std::int64_t userId,
                        const nlohmann::json &data,
                        const std::string &computedAt)
{
    sqlite::Statement stmt(m_db.handle(),
                           "INSERT INTO stats_cache (user_id, data, computed_at)"
                           " VALUES (?1, ?2, ?3)"
                           " ON CONFLICT(user_id) DO UPDATE SET"
                           "     data = excluded.data,"
                           "     computed_at = excluded.computed_at;");
    sqlite3_bind_int64(stmt.get(), 1, userId);
    sqlite::bindText(stmt.get(), 2, data.dump());
    sqlite::bindText(stmt.get(), 3, computedAt);
    stmt.run("failed to upsert stats cache");
}

void StatsCache::invalidate(std::int64_t userId)
{
    sqlite::Statement stmt(m_db.handle(), "DELETE FROM stats_cache WHERE user_id = ?;");
    sqlite3_bind_int64(stmt.get(), 1, userId);
    stmt.run("failed to invalidate stats cache");
}

void StatsCache::invalidateAll()
{
    sqlite::execOrThrow(m_db.handle(), "DELETE FROM stats_cache;");
}

std::int64_t StatsCache::countForUser(std::int64_t userId) const
{
    sqlite::Statement stmt(m_db.handle(), "SELECT COUNT(*) FROM stats_cache WHERE user_id = ?;");
    sqlite3_bind_int64(stmt.get(), 1, userId);
    if (!stmt.step()) {
        return 0;
    }
    return sqlite3_column_int64(stmt.get(), 0);
}

} // namespace leafline
