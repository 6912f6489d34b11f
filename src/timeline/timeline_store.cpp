#include "timeline/timeline_store.hpp"

#include <string>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "store/database.hpp"
#include "store/sqlite_utils.hpp"

namespace leafline {

namespace {

constexpr const char *kEventColumns =
    "id, entity_type, entity_id, action, occurred_at, title, details_json,"
    " genres_json, reading_data_json, user_id";

TimelineEvent eventFromRow(sqlite3_stmt *stmt)
{
    TimelineEvent event;
    event.id = sqlite3_column_int64(stmt, 0);

    const std::string type = sqlite::columnText(stmt, 1);
    const auto parsed = parseEntityTypeString(type);
    if (!parsed.has_value()) {
        throw StorageError("unknown entity_type in timeline_events: " + type);
    }
    event.entityType = *parsed;
    event.entityId = sqlite3_column_int64(stmt, 2);
    event.action = sqlite::columnText(stmt, 3);
    event.occurredAt = fromEpochMillis(sqlite3_column_int64(stmt, 4));
    event.payload.title = sqlite::columnText(stmt, 5);
    event.payload.detailsJson = sqlite::columnOptionalText(stmt, 6).value_or("[]");
    event.payload.genresJson = sqlite::columnOptionalText(stmt, 7);
    event.payload.readingDataJson = sqlite::columnOptionalText(stmt, 8);
    event.userId = sqlite::columnOptionalInt64(stmt, 9);
    return event;
}

} // namespace

TimelineStore::TimelineStore(Database &db)
    : m_db(db)
{
}

std::int64_t TimelineStore::append(const TimelineEvent &event)
{
    sqlite::Statement stmt(m_db.handle(),
                           "INSERT INTO timeline_events (entity_type, entity_id, action,"
                           " occurred_at, title, details_json, genres_json,"
                           " reading_data_json, user_id)"
                           " VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?);");
    sqlite::bindText(stmt.get(), 1, toEntityTypeString(event.entityType));
    sqlite3_bind_int64(stmt.get(), 2, event.entityId);
    sqlite::bindText(stmt.get(), 3, event.action);
    sqlite3_bind_int64(stmt.get(), 4, toEpochMillis(event.occurredAt));
    sqlite::bindText(stmt.get(), 5, event.payload.title);
    sqlite::bindText(stmt.get(), 6, event.payload.detailsJson);
    sqlite::bindOptionalText(stmt.get(), 7, event.payload.genresJson);
    sqlite::bindOptionalText(stmt.get(), 8, event.payload.readingDataJson);
    sqlite::bindOptionalInt64(stmt.get(), 9, event.userId);
    stmt.run("failed to append timeline event");

    return m_db.lastInsertRowId();
}

std::vector<TimelineEvent> TimelineStore::listByUser(
    std::int64_t userId,
    const std::optional<TimelineCursor> &cursor,
    int limit) const
{
    return listPage(userId, cursor, limit);
}

std::vector<TimelineEvent> TimelineStore::listGlobal(
    const std::optional<TimelineCursor> &cursor,
    int limit) const
{
    return listPage(std::nullopt, cursor, limit);
}

std::vector<TimelineEvent> TimelineStore::listPage(
    const std::optional<std::int64_t> &userId,
    const std::optional<TimelineCursor> &cursor,
    int limit) const
{
    std::string sql = std::string("SELECT ") + kEventColumns + " FROM timeline_events WHERE 1 = 1";
    if (userId.has_value()) {
        sql += " AND user_id = :user";
    }
    if (cursor.has_value()) {
        sql += " AND (occurred_at < :at OR (occurred_at = :at AND id < :id))";
    }
    sql += " ORDER BY occurred_at DESC, id DESC LIMIT :limit;";

    sqlite::Statement stmt(m_db.handle(), sql);
    if (userId.has_value()) {
        sqlite3_bind_int64(stmt.get(),
                           sqlite3_bind_parameter_index(stmt.get(), ":user"),
                           *userId);
    }
    if (cursor.has_value()) {
        sqlite3_bind_int64(stmt.get(),
                           sqlite3_bind_parameter_index(stmt.get(), ":at"),
                           toEpochMillis(cursor->occurredAt));
        sqlite3_bind_int64(stmt.get(),
                           sqlite3_bind_parameter_index(stmt.get(), ":id"),
                           cursor->id);
    }
    sqlite3_bind_int(stmt.get(), sqlite3_bind_parameter_index(stmt.get(), ":limit"), limit);

    std::vector<TimelineEvent> events;
    while (stmt.step()) {
        events.push_back(eventFromRow(stmt.get()));
    }
    return events;
}

std::vector<TimelineEvent> TimelineStore::listByEntity(const EntityKey &key) const
{
    sqlite::Statement stmt(m_db.handle(),
                           std::string("SELECT ") + kEventColumns
                               + " FROM timeline_events"
                                 " WHERE entity_type = ? AND entity_id = ?"
                                 " ORDER BY occurred_at ASC, id ASC;");
    sqlite::bindText(stmt.get(), 1, toEntityTypeString(key.type));
    sqlite3_bind_int64(stmt.get(), 2, key.id);

    std::vector<TimelineEvent> events;
    while (stmt.step()) {
        events.push_back(eventFromRow(stmt.get()));
    }
    return events;
}

std::optional<TimelineEvent> TimelineStore::getEvent(std::int64_t id) const
{
    sqlite::Statement stmt(m_db.handle(),
                           std::string("SELECT ") + kEventColumns
                               + " FROM timeline_events WHERE id = ? LIMIT 1;");
    sqlite3_bind_int64(stmt.get(), 1, id);

    if (!stmt.step()) {
        return std::nullopt;
    }
    return eventFromRow(stmt.get());
}

std::vector<EntityKey> TimelineStore::entityKeysAfter(const std::optional<EntityKey> &after,
                                                      int limit) const
{
    std::string sql = "SELECT DISTINCT entity_type, entity_id FROM timeline_events";
    if (after.has_value()) {
        sql += " WHERE entity_type > ?1 OR (entity_type = ?1 AND entity_id > ?2)";
    }
    sql += " ORDER BY entity_type ASC, entity_id ASC LIMIT ?3;";

    sqlite::Statement stmt(m_db.handle(), sql);
    if (after.has_value()) {
        sqlite::bindText(stmt.get(), 1, toEntityTypeString(after->type));
        sqlite3_bind_int64(stmt.get(), 2, after->id);
    }
    sqlite3_bind_int(stmt.get(), 3, limit);

    std::vector<EntityKey> keys;
    while (stmt.step()) {
        const std::string type = sqlite::columnText(stmt.get(), 0);
        const auto parsed = parseEntityTypeString(type);
        if (!parsed.has_value()) {
            throw StorageError("unknown entity_type in timeline_events: " + type);
        }
        keys.push_back(EntityKey{*parsed, sqlite3_column_int64(stmt.get(), 1)});
    }
    return keys;
}

int TimelineStore::updatePayload(const EntityKey &key, const TimelinePayload &payload)
{
    sqlite::Statement stmt(m_db.handle(),
                           "UPDATE timeline_events"
                           " SET title = ?1, details_json = ?2, genres_json = ?3,"
                           "     reading_data_json = ?4"
                           " WHERE entity_type = ?5 AND entity_id = ?6"
                           "   AND (title IS NOT ?1 OR details_json IS NOT ?2"
                           "        OR genres_json IS NOT ?3 OR reading_data_json IS NOT ?4);");
    sqlite::bindText(stmt.get(), 1, payload.title);
    sqlite::bindText(stmt.get(), 2, payload.detailsJson);
    sqlite::bindOptionalText(stmt.get(), 3, payload.genresJson);
    sqlite::bindOptionalText(stmt.get(), 4, payload.readingDataJson);
    sqlite::bindText(stmt.get(), 5, toEntityTypeString(key.type));
    sqlite3_bind_int64(stmt.get(), 6, key.id);
    stmt.run("failed to update timeline payload");

    return m_db.changes();
}

int TimelineStore::deleteByEntity(const EntityKey &key)
{
    sqlite::Statement stmt(m_db.handle(),
                           "DELETE FROM timeline_events WHERE entity_type = ? AND entity_id = ?;");
    sqlite::bindText(stmt.get(), 1, toEntityTypeString(key.type));
    sqlite3_bind_int64(stmt.get(), 2, key.id);
    stmt.run("failed to delete timeline events");

    return m_db.changes();
}

std::int64_t TimelineStore::count() const
{
    sqlite::Statement stmt(m_db.handle(), "SELECT COUNT(*) FROM timeline_events;");
    if (!stmt.step()) {
        return 0;
    }
    return sqlite3_column_int64(stmt.get(), 0);
}

std::int64_t TimelineStore::countByEntity(const EntityKey &key) const
{
    sqlite::Statement stmt(m_db.handle(),
                           "SELECT COUNT(*) FROM timeline_events"
                           " WHERE entity_type = ? AND entity_id = ?;");
    sqlite::bindText(stmt.get(), 1, toEntityTypeString(key.type));
    sqlite3_bind_int64(stmt.get(), 2, key.id);
    if (!stmt.step()) {
        return 0;
    }
    return sqlite3_column_int64(stmt.get(), 0);
}

} // namespace leafline
