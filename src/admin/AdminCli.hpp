#pragma once

#include <optional>

#include <QString>
#include <QStringList>

#include "common/config.hpp"

namespace leafline {

class Engine;

class AdminCli
{
public:
    // CLI dispatcher for rebuilds, feed inspection and statistics.
    // returns exit code
    int run(int argc, char *argv[]);

private:
    // Each subcommand opens the database named by --db (or LEAFLINE_DB_PATH)
    // and renders output in the chosen format.
    int runRebuild(const QStringList &args);
    int runTimeline(const QStringList &args);
    int runStats(const QStringList &args);
    int runRefresh(const QStringList &args);
    int runYears(const QStringList &args);

    Config loadConfig(const QStringList &args) const;
    std::optional<long long> parseInteger(const QString &value) const;
};

} // namespace leafline
