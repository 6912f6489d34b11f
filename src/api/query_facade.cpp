#include "api/query_facade.hpp"

#include <algorithm>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "stats/stats_aggregator.hpp"
#include "stats/stats_cache.hpp"
#include "timeline/snapshot_codec.hpp"
#include "timeline/snapshot_rebuilder.hpp"
#include "timeline/timeline_store.hpp"

namespace leafline {

QueryFacade::QueryFacade(TimelineStore &timeline,
                         StatsCache &statsCache,
                         StatsAggregator &aggregator,
                         SnapshotRebuilder &rebuilder,
                         int defaultPageSize)
    : m_timeline(timeline)
    , m_statsCache(statsCache)
    , m_aggregator(aggregator)
    , m_rebuilder(rebuilder)
    , m_defaultPageSize(std::clamp(defaultPageSize, 1, kMaxTimelinePageSize))
{
}

TimelinePage QueryFacade::timeline(const TimelineQuery &query) const
{
    const int limit = std::clamp(query.limit.value_or(m_defaultPageSize), 1, kMaxTimelinePageSize);

    std::vector<TimelineEvent> events;
    if (query.scope == TimelineScope::Mine) {
        if (!query.userId.has_value()) {
            throw ValidationError("scope \"mine\" requires a user");
        }
        events = m_timeline.listByUser(*query.userId, query.cursor, limit);
    } else {
        events = m_timeline.listGlobal(query.cursor, limit);
    }

    TimelinePage page;
    page.entries.reserve(events.size());
    for (const auto &event : events) {
        page.entries.push_back(toEntry(event));
    }
    if (static_cast<int>(events.size()) == limit) {
        page.nextCursor = TimelineCursor{events.back().occurredAt, events.back().id};
    }
    return page;
}

StatsCacheEntry QueryFacade::stats(std::int64_t userId)
{
    if (auto cached = m_statsCache.get(userId)) {
        return *cached;
    }
    return m_aggregator.refresh(userId);
}

StatsCacheEntry QueryFacade::statsForYear(std::int64_t userId, int year) const
{
    if (!m_aggregator.userExists(userId)) {
        throw NotFoundError("user " + std::to_string(userId) + " not found");
    }
    const CachedStats stats = m_aggregator.computeForYear(userId, year);

    StatsCacheEntry entry;
    entry.userId = userId;
    entry.data = stats;
    entry.computedAt = stats.computedAt;
    return entry;
}

std::vector<int> QueryFacade::availableYears(std::int64_t userId) const
{
    return m_aggregator.availableYears(userId);
}

RebuildReport QueryFacade::rebuild(const RebuildOptions &options, const std::atomic<bool> *stop)
{
    return m_rebuilder.run(options, stop);
}

RebuildReport QueryFacade::refreshEntity(const EntityKey &key, OrphanPolicy policy)
{
    return m_rebuilder.refreshEntity(key, policy);
}

} // namespace leafline
