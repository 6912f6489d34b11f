#pragma once

#include <atomic>
#include <cstdint>
#include <vector>

#include "common/config.hpp"
#include "common/models.hpp"

namespace leafline {

class SnapshotRebuilder;
class StatsAggregator;
class StatsCache;
class TimelineStore;

// QueryFacade is the read API: the activity feed and per-user statistics,
// plus the administrative rebuild entry points.
class QueryFacade {
public:
    QueryFacade(TimelineStore &timeline,
                StatsCache &statsCache,
                StatsAggregator &aggregator,
                SnapshotRebuilder &rebuilder,
                int defaultPageSize = 20);

    // Display-ready page, newest first. The limit is clamped to
    // [1, kMaxTimelinePageSize]. Throws ValidationError for a "mine" query
    // without a user.
    TimelinePage timeline(const TimelineQuery &query) const;

    // Cached row, recomputed first when absent.
    StatsCacheEntry stats(std::int64_t userId);
    StatsCacheEntry statsForYear(std::int64_t userId, int year) const;
    std::vector<int> availableYears(std::int64_t userId) const;

    RebuildReport rebuild(const RebuildOptions &options, const std::atomic<bool> *stop = nullptr);
    RebuildReport refreshEntity(const EntityKey &key, OrphanPolicy policy = OrphanPolicy::Freeze);

private:
    TimelineStore &m_timeline;
    StatsCache &m_statsCache;
    StatsAggregator &m_aggregator;
    SnapshotRebuilder &m_rebuilder;
    int m_defaultPageSize = 20;
};

} // namespace leafline
