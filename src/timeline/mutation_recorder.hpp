#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "common/models.hpp"

namespace leafline {

class TimelineStore;
class Transaction;

// One accepted entity mutation. For deletes the snapshot is the pre-delete
// state.
struct MutationNotice {
    EntityType entityType = EntityType::Book;
    std::int64_t entityId = 0;
    std::string action;
    std::optional<std::int64_t> actingUserId;
    std::optional<EntitySnapshot> snapshot;
};

using Clock = std::function<std::chrono::system_clock::time_point()>;

Clock systemClock();

// MutationRecorder appends exactly one timeline event per entity mutation,
// inside the caller's transaction. A ValidationError leaves the transaction
// to be rolled back by its owner.
class MutationRecorder {
public:
    explicit MutationRecorder(TimelineStore &store, Clock clock = systemClock());

    std::int64_t record(Transaction &tx, const MutationNotice &notice);

private:
    TimelineStore &m_store;
    Clock m_clock;
};

} // namespace leafline
