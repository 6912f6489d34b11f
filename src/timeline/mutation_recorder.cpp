#include "timeline/mutation_recorder.hpp"

#include <utility>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "store/database.hpp"
#include "timeline/snapshot_codec.hpp"
#include "timeline/timeline_store.hpp"

namespace leafline {

Clock systemClock()
{
    return [] { return std::chrono::system_clock::now(); };
}

MutationRecorder::MutationRecorder(TimelineStore &store, Clock clock)
    : m_store(store)
    , m_clock(std::move(clock))
{
}

std::int64_t MutationRecorder::record(Transaction &tx, const MutationNotice &notice)
{
    if (!tx.isOpen() || &tx.database() != &m_store.database()) {
        throw StorageError("timeline events must be recorded inside the mutation transaction");
    }
    if (notice.action.empty()) {
        throw ValidationError("mutation notice has no action");
    }
    if (notice.entityId <= 0) {
        throw ValidationError("mutation notice has no entity id");
    }
    if (!notice.snapshot.has_value()) {
        throw ValidationError("mutation notice for " + toEntityTypeString(notice.entityType)
                              + " has no snapshot");
    }
    if (snapshotType(*notice.snapshot) != notice.entityType) {
        throw ValidationError("snapshot type does not match entity type "
                              + toEntityTypeString(notice.entityType));
    }
    if (snapshotId(*notice.snapshot) != notice.entityId) {
        throw ValidationError("snapshot id does not match entity id");
    }

    TimelineEvent event;
    event.entityType = notice.entityType;
    event.entityId = notice.entityId;
    event.action = notice.action;
    event.occurredAt = m_clock();
    event.userId = notice.actingUserId;
    event.payload = buildPayload(*notice.snapshot);

    const std::int64_t id = m_store.append(event);

    LLOG_DEBUG(QStringLiteral("MutationRecorder"),
               QStringLiteral("MutationRecorder::record"),
               QStringLiteral("timeline_event_recorded"),
               QStringLiteral("entity_mutation"),
               QStringLiteral("append"),
               logging::userWho(notice.actingUserId),
               QString(),
               (nlohmann::json{{"eventId", id},
                              {"entity", encodeEntityKey(event.key())},
                              {"action", event.action}}));
    return id;
}

} // namespace leafline
