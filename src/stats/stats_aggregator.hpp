#pragma once

#include <cstdint>
#include <vector>

#include "common/models.hpp"
#include "timeline/mutation_recorder.hpp"

namespace leafline {

class Database;
class StatsCache;

// StatsAggregator recomputes a user's statistics from scratch out of the
// entity tables and writes them into the stats cache. Nothing is maintained
// incrementally.
class StatsAggregator {
public:
    StatsAggregator(Database &db, StatsCache &cache, Clock clock = systemClock());

    // Computes and upserts. Throws NotFoundError for an unknown user.
    StatsCacheEntry refresh(std::int64_t userId);

    // All-time view: library shelf, last 30 days, monthly books of the
    // current year. Read-only.
    CachedStats compute(std::int64_t userId) const;
    // Books and readings finished in `year`. Never cached.
    CachedStats computeForYear(std::int64_t userId, int year) const;

    // Years with at least one finished reading, newest first.
    std::vector<int> availableYears(std::int64_t userId) const;

    bool userExists(std::int64_t userId) const;

private:
    // Runs the all-time queries on the caller's open transaction.
    CachedStats computeInTransaction(std::int64_t userId) const;

    Database &m_db;
    StatsCache &m_cache;
    Clock m_clock;
};

} // namespace leafline
