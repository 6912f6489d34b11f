#include "timeline/snapshot_rebuilder.hpp"

#include <algorithm>
#include <chrono>
#include <string>
#include <vector>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "store/database.hpp"
#include "timeline/entity_reader.hpp"
#include "timeline/snapshot_codec.hpp"
#include "timeline/timeline_store.hpp"

namespace leafline {

SnapshotRebuilder::SnapshotRebuilder(Database &db,
                                     TimelineStore &store,
                                     const EntityReader &reader)
    : m_db(db)
    , m_store(store)
    , m_reader(reader)
{
}

std::optional<EntityKey> SnapshotRebuilder::resumeCursor() const
{
    const auto stored = m_db.getMeta(kCursorMetaKey);
    if (!stored.has_value()) {
        return std::nullopt;
    }
    const auto key = parseEntityKey(*stored);
    if (!key.has_value()) {
        LLOG_WARN(QStringLiteral("SnapshotRebuilder"),
                  QStringLiteral("SnapshotRebuilder::resumeCursor"),
                  QStringLiteral("rebuild_cursor_ignored"),
                  QStringLiteral("unparseable_cursor"),
                  QStringLiteral("meta"),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"value", *stored}}));
    }
    return key;
}

RebuildReport SnapshotRebuilder::run(const RebuildOptions &options, const std::atomic<bool> *stop)
{
    if (options.batchSize <= 0) {
        throw ValidationError("rebuild batch size must be positive");
    }

    if (options.restart) {
        m_db.deleteMeta(kCursorMetaKey);
    }
    std::optional<EntityKey> cursor = resumeCursor();

    const auto started = std::chrono::steady_clock::now();
    LLOG_INFO(QStringLiteral("SnapshotRebuilder"),
              QStringLiteral("SnapshotRebuilder::run"),
              QStringLiteral("rebuild_started"),
              QStringLiteral("admin_request"),
              QStringLiteral("batched_rebuild"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"batchSize", options.batchSize},
                             {"orphanPolicy", toOrphanPolicyString(options.orphanPolicy)},
                             {"resumeFrom", cursor ? encodeEntityKey(*cursor) : std::string()}}));

    RebuildReport report;
    int batches = 0;
    while (true) {
        if (stop && stop->load()) {
            report.interrupted = true;
            break;
        }

        const std::vector<EntityKey> keys = m_store.entityKeysAfter(cursor, options.batchSize);
        if (keys.empty()) {
            break;
        }

        RebuildReport batch;
        try {
            Transaction tx(m_db);
            for (const auto &key : keys) {
                rebuildKey(tx, key, options.orphanPolicy, batch);
            }
            m_db.setMeta(kCursorMetaKey, encodeEntityKey(keys.back()));
            tx.commit();
            report += batch;
        } catch (const StorageError &error) {
            report.errors += static_cast<int>(keys.size());
            LLOG_ERROR(QStringLiteral("SnapshotRebuilder"),
                       QStringLiteral("SnapshotRebuilder::run"),
                       QStringLiteral("rebuild_batch_failed"),
                       QStringLiteral("batch_commit"),
                       QStringLiteral("transaction"),
                       logging::defaultWho(),
                       QString(),
                       (nlohmann::json{{"error", error.what()},
                                      {"firstKey", encodeEntityKey(keys.front())},
                                      {"lastKey", encodeEntityKey(keys.back())}}));
        }
        cursor = keys.back();
        ++batches;
    }

    if (!report.interrupted) {
        m_db.deleteMeta(kCursorMetaKey);
    }

    const auto durationMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                                std::chrono::steady_clock::now() - started)
                                .count();
    LLOG_INFO(QStringLiteral("SnapshotRebuilder"),
              QStringLiteral("SnapshotRebuilder::run"),
              report.interrupted ? QStringLiteral("rebuild_interrupted")
                                 : QStringLiteral("rebuild_completed"),
              QStringLiteral("admin_request"),
              QStringLiteral("batched_rebuild"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"report", report},
                             {"batches", batches},
                             {"durationMs", durationMs}}));
    return report;
}

RebuildReport SnapshotRebuilder::refreshEntity(const EntityKey &key, OrphanPolicy policy)
{
    std::vector<EntityKey> keys{key};
    for (const auto &dependent : m_reader.dependents(key)) {
        if (std::find(keys.begin(), keys.end(), dependent) == keys.end()) {
            keys.push_back(dependent);
        }
    }

    RebuildReport report;
    Transaction tx(m_db);
    for (const auto &target : keys) {
        rebuildKey(tx, target, policy, report);
    }
    tx.commit();

    LLOG_DEBUG(QStringLiteral("SnapshotRebuilder"),
               QStringLiteral("SnapshotRebuilder::refreshEntity"),
               QStringLiteral("entity_refreshed"),
               QStringLiteral("targeted_refresh"),
               QStringLiteral("cascade"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"entity", encodeEntityKey(key)},
                              {"keys", keys.size()},
                              {"report", report}}));
    return report;
}

void SnapshotRebuilder::rebuildKey(Transaction &tx,
                                   const EntityKey &key,
                                   OrphanPolicy policy,
                                   RebuildReport &report)
{
    Savepoint savepoint(tx, "rebuild_entity");
    RebuildReport entity;
    try {
        rebuildSnapshot(key, policy, entity);
        savepoint.release();
    } catch (const std::exception &error) {
        savepoint.rollback();
        report.errors += 1;
        LLOG_WARN(QStringLiteral("SnapshotRebuilder"),
                  QStringLiteral("SnapshotRebuilder::rebuildKey"),
                  QStringLiteral("entity_rebuild_failed"),
                  QStringLiteral("entity_error"),
                  QStringLiteral("savepoint_rollback"),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"entity", encodeEntityKey(key)}, {"error", error.what()}}));
        return;
    }
    report += entity;
}

void SnapshotRebuilder::rebuildSnapshot(const EntityKey &key,
                                        OrphanPolicy policy,
                                        RebuildReport &report)
{
    const std::int64_t events = m_store.countByEntity(key);
    const auto snapshot = m_reader.fetch(key);

    if (!snapshot.has_value()) {
        report.scanned += static_cast<int>(events);
        report.orphaned += 1;
        if (policy == OrphanPolicy::Prune) {
            m_store.deleteByEntity(key);
        }
        return;
    }

    if (snapshotType(*snapshot) != key.type || snapshotId(*snapshot) != key.id) {
        throw StorageError("entity reader returned a snapshot for another entity than "
                           + encodeEntityKey(key));
    }

    const TimelinePayload payload = buildPayload(*snapshot);
    report.updated += m_store.updatePayload(key, payload);
    report.scanned += static_cast<int>(events);
}

} // namespace leafline
