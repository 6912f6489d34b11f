#pragma once

#include <memory>

#include "common/config.hpp"
#include "timeline/mutation_recorder.hpp"

namespace leafline {

class Database;
class LibraryStore;
class QueryFacade;
class SnapshotRebuilder;
class StatsAggregator;
class StatsCache;
class TimelineStore;

// Engine wires every component onto one database connection. One Engine per
// thread; they may share the database file.
class Engine {
public:
    explicit Engine(const Config &config, Clock clock = systemClock());
    ~Engine();

    Engine(const Engine &) = delete;
    Engine &operator=(const Engine &) = delete;

    const Config &config() const
    {
        return m_config;
    }

    Database &database();
    TimelineStore &timeline();
    MutationRecorder &recorder();
    StatsCache &statsCache();
    LibraryStore &library();
    SnapshotRebuilder &rebuilder();
    StatsAggregator &aggregator();
    QueryFacade &facade();

    RebuildOptions defaultRebuildOptions() const;

private:
    void refreshAfterUpdate(const EntityKey &key);

    Config m_config;
    std::unique_ptr<Database> m_db;
    std::unique_ptr<TimelineStore> m_timeline;
    std::unique_ptr<MutationRecorder> m_recorder;
    std::unique_ptr<StatsCache> m_statsCache;
    std::unique_ptr<LibraryStore> m_library;
    std::unique_ptr<SnapshotRebuilder> m_rebuilder;
    std::unique_ptr<StatsAggregator> m_aggregator;
    std::unique_ptr<QueryFacade> m_facade;
};

} // namespace leafline
