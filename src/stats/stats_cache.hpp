#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace leafline {

class Database;

// Single-row-per-user store of computed statistics.
class StatsCache {
public:
    explicit StatsCache(Database &db);

    std::optional<StatsCacheEntry> get(std::int64_t userId) const;

    // Replaces the user's row in one statement; concurrent writers race and
    // the last complete write wins.
    void upsert(std::int64_t userId, const nlohmann::json &data, const std::string &computedAt);

    void invalidate(std::int64_t userId);
    void invalidateAll();

    std::int64_t countForUser(std::int64_t userId) const;

private:
    Database &m_db;
};

} // namespace leafline
