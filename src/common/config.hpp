#pragma once

#include <string>

#include "common/enums.hpp"

namespace leafline {

// Runtime settings. Every field has a LEAFLINE_* environment variable; the
// command-line tools override individual fields after loading.
struct Config {
    std::string databasePath;
    int busyTimeoutMs = 5000;
    int rebuildBatchSize = 100;
    OrphanPolicy orphanPolicy = OrphanPolicy::Freeze;
    int timelinePageSize = 20;
    // Daemon only; 0 disables the scheduled rebuild.
    int rebuildIntervalMinutes = 0;
    // Refresh the events that embed an author, genre, book or reading right
    // after it is updated.
    bool autoRefreshTimeline = true;
    bool traceEnabled = false;

    static Config fromEnvironment();
};

// $HOME/.local/share/leafline/leafline.db
std::string defaultDatabasePath();

constexpr int kMaxTimelinePageSize = 100;
// One week.
constexpr int kMaxRebuildIntervalMinutes = 7 * 24 * 60;

} // namespace leafline
