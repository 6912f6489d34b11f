#pragma once

#include <atomic>
#include <optional>

#include "common/models.hpp"

namespace leafline {

class Database;
class EntityReader;
class TimelineStore;
class Transaction;

// SnapshotRebuilder rewrites the denormalized payload of existing timeline
// events from current entity state. Event identity is never touched.
//
// A full run walks distinct entity keys in batches. Each batch is one
// transaction that also stores the resume cursor, and each key runs under its
// own savepoint so a failing entity only rolls back itself.
class SnapshotRebuilder {
public:
    static constexpr const char *kCursorMetaKey = "timeline_rebuild_cursor";

    SnapshotRebuilder(Database &db, TimelineStore &store, const EntityReader &reader);

    // Stops between batches once *stop becomes true; the cursor is kept so the
    // next run resumes.
    RebuildReport run(const RebuildOptions &options, const std::atomic<bool> *stop = nullptr);

    // Rebuilds one entity and its dependents in a single transaction.
    RebuildReport refreshEntity(const EntityKey &key, OrphanPolicy policy = OrphanPolicy::Freeze);

    std::optional<EntityKey> resumeCursor() const;

private:
    void rebuildKey(Transaction &tx, const EntityKey &key, OrphanPolicy policy, RebuildReport &report);
    void rebuildSnapshot(const EntityKey &key, OrphanPolicy policy, RebuildReport &report);

    Database &m_db;
    TimelineStore &m_store;
    const EntityReader &m_reader;
};

} // namespace leafline
