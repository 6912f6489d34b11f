#include <QCoreApplication>
#include <QDebug>

#include <nlohmann/json.hpp>

#include "common/config.hpp"
#include "common/logging.hpp"
#include "daemon/leafline_daemon.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    QCoreApplication::setApplicationName(QStringLiteral("leafline-daemon"));

    leafline::Config config;
    try {
        config = leafline::Config::fromEnvironment();
    } catch (const std::exception &ex) {
        qCritical() << "Leafline: invalid configuration:" << ex.what();
        return 2;
    }

    for (int i = 1; i < argc; ++i) {
        if (QString::fromLocal8Bit(argv[i]) == QStringLiteral("--trace")) {
            config.traceEnabled = true;
        }
    }
    leafline::logging::initLogging(QStringLiteral("leafline-daemon"), config.traceEnabled);
    LLOG_INFO(QStringLiteral("main"),
              QStringLiteral("main"),
              QStringLiteral("daemon_start"),
              QStringLiteral("user_start"),
              QStringLiteral("environment_config"),
              leafline::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"databasePath", config.databasePath},
                             {"rebuildIntervalMinutes", config.rebuildIntervalMinutes}}));

    try {
        // The daemon lives for the lifetime of the process.
        leafline::LeaflineDaemon daemon(config);
        if (!daemon.start()) {
            return 1;
        }
        return app.exec();
    } catch (const std::exception &ex) {
        qCritical() << "Leafline: daemon failed:" << ex.what();
        return 1;
    }
}
