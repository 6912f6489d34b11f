#include "api/engine.hpp"

#include <exception>

#include "api/query_facade.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "library/library_store.hpp"
#include "stats/stats_aggregator.hpp"
#include "stats/stats_cache.hpp"
#include "store/database.hpp"
#include "timeline/snapshot_rebuilder.hpp"
#include "timeline/timeline_store.hpp"

namespace leafline {

Engine::Engine(const Config &config, Clock clock)
    : m_config(config)
    , m_db(std::make_unique<Database>(config.databasePath, config.busyTimeoutMs))
{
    m_timeline = std::make_unique<TimelineStore>(*m_db);
    m_recorder = std::make_unique<MutationRecorder>(*m_timeline, clock);
    m_statsCache = std::make_unique<StatsCache>(*m_db);
    m_library = std::make_unique<LibraryStore>(*m_db, *m_recorder, *m_statsCache, clock);
    m_rebuilder = std::make_unique<SnapshotRebuilder>(*m_db, *m_timeline, *m_library);
    m_aggregator = std::make_unique<StatsAggregator>(*m_db, *m_statsCache, clock);
    m_facade = std::make_unique<QueryFacade>(*m_timeline,
                                             *m_statsCache,
                                             *m_aggregator,
                                             *m_rebuilder,
                                             config.timelinePageSize);

    if (config.autoRefreshTimeline) {
        m_library->setRefreshHook([this](const EntityKey &key) {
            refreshAfterUpdate(key);
        });
    }
}

void Engine::refreshAfterUpdate(const EntityKey &key)
{
    try {
        const RebuildReport report = m_rebuilder->refreshEntity(key, m_config.orphanPolicy);
        if (report.errors > 0) {
            LLOG_WARN(QStringLiteral("Engine"),
                      QStringLiteral("Engine::refreshAfterUpdate"),
                      QStringLiteral("timeline_refresh_partial"),
                      QStringLiteral("entity_updated"),
                      QStringLiteral("cascade_refresh"),
                      logging::defaultWho(),
                      QString(),
                      (nlohmann::json{{"entity", encodeEntityKey(key)},
                                     {"updated", report.updated},
                                     {"errors", report.errors}}));
        }
    } catch (const std::exception &error) {
        // The update itself is committed; a later rebuild picks up the rest.
        LLOG_WARN(QStringLiteral("Engine"),
                  QStringLiteral("Engine::refreshAfterUpdate"),
                  QStringLiteral("timeline_refresh_failed"),
                  QStringLiteral("entity_updated"),
                  QStringLiteral("cascade_refresh"),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"entity", encodeEntityKey(key)}, {"error", error.what()}}));
    }
}

Engine::~Engine() = default;

Database &Engine::database()
{
    return *m_db;
}

TimelineStore &Engine::timeline()
{
    return *m_timeline;
}

MutationRecorder &Engine::recorder()
{
    return *m_recorder;
}

StatsCache &Engine::statsCache()
{
    return *m_statsCache;
}

LibraryStore &Engine::library()
{
    return *m_library;
}

SnapshotRebuilder &Engine::rebuilder()
{
    return *m_rebuilder;
}

StatsAggregator &Engine::aggregator()
{
    return *m_aggregator;
}

QueryFacade &Engine::facade()
{
    return *m_facade;
}

RebuildOptions Engine::defaultRebuildOptions() const
{
    RebuildOptions options;
    options.batchSize = m_config.rebuildBatchSize;
    options.orphanPolicy = m_config.orphanPolicy;
    return options;
}

} // namespace leafline
