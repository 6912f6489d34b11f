#include "common/config.hpp"

#include <cstdlib>
#include <filesystem>

#include <QString>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace leafline {

namespace {

// Positive integer from the environment, or the fallback when unset or invalid.
int positiveIntFromEnv(const char *name, int fallback)
{
    if (!qEnvironmentVariableIsSet(name)) {
        return fallback;
    }
    bool ok = false;
    const int value = qEnvironmentVariableIntValue(name, &ok);
    if (!ok || value <= 0) {
        LLOG_WARN(QStringLiteral("Config"),
                  QStringLiteral("fromEnvironment"),
                  QStringLiteral("config_value_ignored"),
                  QStringLiteral("invalid_integer"),
                  QStringLiteral("env"),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"name", name},
                                 {"value", qEnvironmentVariable(name).toStdString()},
                                 {"fallback", fallback}}));
        return fallback;
    }
    return value;
}

} // namespace

std::string defaultDatabasePath()
{
    const char *home = std::getenv("HOME");
    std::filesystem::path basePath = home ? home : ".";
    basePath /= ".local/share/leafline";
    return (basePath / "leafline.db").string();
}

Config Config::fromEnvironment()
{
    Config config;

    const QString dbPath = qEnvironmentVariable("LEAFLINE_DB_PATH");
    config.databasePath = dbPath.isEmpty() ? defaultDatabasePath() : dbPath.toStdString();

    config.busyTimeoutMs = positiveIntFromEnv("LEAFLINE_BUSY_TIMEOUT_MS", config.busyTimeoutMs);
    config.rebuildBatchSize =
        positiveIntFromEnv("LEAFLINE_REBUILD_BATCH_SIZE", config.rebuildBatchSize);
    config.timelinePageSize =
        positiveIntFromEnv("LEAFLINE_TIMELINE_PAGE_SIZE", config.timelinePageSize);
    if (config.timelinePageSize > kMaxTimelinePageSize) {
        config.timelinePageSize = kMaxTimelinePageSize;
    }

    if (qEnvironmentVariableIsSet("LEAFLINE_REBUILD_INTERVAL_MINUTES")) {
        bool ok = false;
        const int minutes =
            qEnvironmentVariableIntValue("LEAFLINE_REBUILD_INTERVAL_MINUTES", &ok);
        config.rebuildIntervalMinutes = (ok && minutes > 0) ? minutes : 0;
        if (config.rebuildIntervalMinutes > kMaxRebuildIntervalMinutes) {
            LLOG_WARN(QStringLiteral("Config"),
                      QStringLiteral("fromEnvironment"),
                      QStringLiteral("config_value_clamped"),
                      QStringLiteral("interval_too_large"),
                      QStringLiteral("env"),
                      logging::defaultWho(),
                      QString(),
                      (nlohmann::json{{"name", "LEAFLINE_REBUILD_INTERVAL_MINUTES"},
                                     {"value", minutes},
                                     {"max", kMaxRebuildIntervalMinutes}}));
            config.rebuildIntervalMinutes = kMaxRebuildIntervalMinutes;
        }
    }

    const QString policy = qEnvironmentVariable("LEAFLINE_ORPHAN_POLICY");
    if (!policy.isEmpty()) {
        const auto parsed = parseOrphanPolicyString(policy.toLower().toStdString());
        if (parsed.has_value()) {
            config.orphanPolicy = *parsed;
        } else {
            LLOG_WARN(QStringLiteral("Config"),
                      QStringLiteral("fromEnvironment"),
                      QStringLiteral("config_value_ignored"),
                      QStringLiteral("unknown_orphan_policy"),
                      QStringLiteral("env"),
                      logging::defaultWho(),
                      QString(),
                      (nlohmann::json{{"value", policy.toStdString()}}));
        }
    }

    if (qEnvironmentVariableIsSet("LEAFLINE_AUTO_REFRESH")) {
        config.autoRefreshTimeline = qEnvironmentVariableIntValue("LEAFLINE_AUTO_REFRESH") != 0;
    }
    config.traceEnabled = qEnvironmentVariableIntValue("LEAFLINE_TRACE") == 1;
    return config;
}

} // namespace leafline
