#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "common/models.hpp"

namespace leafline {

class Database;

// TimelineStore is the durable event log. Identity columns are written once
// by append(); only updatePayload() and deleteByEntity() touch existing rows,
// and only the rebuilder calls them.
class TimelineStore {
public:
    explicit TimelineStore(Database &db);

    // Inserts the event and returns its id. event.id is ignored.
    std::int64_t append(const TimelineEvent &event);

    // Newest first: (occurred_at desc, id desc), strictly after the cursor.
    std::vector<TimelineEvent> listByUser(std::int64_t userId,
                                          const std::optional<TimelineCursor> &cursor,
                                          int limit) const;
    std::vector<TimelineEvent> listGlobal(const std::optional<TimelineCursor> &cursor,
                                          int limit) const;

    // Oldest first: (occurred_at asc, id asc).
    std::vector<TimelineEvent> listByEntity(const EntityKey &key) const;

    std::optional<TimelineEvent> getEvent(std::int64_t id) const;

    // Distinct keys ordered by (entity_type, entity_id), strictly after `after`.
    std::vector<EntityKey> entityKeysAfter(const std::optional<EntityKey> &after,
                                           int limit) const;

    // Rewrites the payload of every event of one entity. Returns the number of
    // rows whose payload actually differed.
    int updatePayload(const EntityKey &key, const TimelinePayload &payload);
    int deleteByEntity(const EntityKey &key);

    std::int64_t count() const;
    std::int64_t countByEntity(const EntityKey &key) const;

    Database &database() const
    {
        return m_db;
    }

private:
    std::vector<TimelineEvent> listPage(const std::optional<std::int64_t> &userId,
                                        const std::optional<TimelineCursor> &cursor,
                                        int limit) const;

    Database &m_db;
};

} // namespace leafline
