#include "daemon/leafline_daemon.hpp"

#include <algorithm>
#include <chrono>
#include <limits>

#include <QTimer>
#include <QDebug>

#include <nlohmann/json.hpp>

#include "api/engine.hpp"
#include "api/query_facade.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "daemon/leafline_api_server.hpp"
#include "store/database.hpp"

namespace leafline {

LeaflineDaemon::LeaflineDaemon(const Config &config, QObject *parent)
    : QObject(parent)
    , m_engine(std::make_unique<Engine>(config))
{
    std::string integrityMessage;
    if (!m_engine->database().integrityCheck(&integrityMessage)) {
        qWarning() << "Leafline: SQLite integrity check failed, scheduled rebuilds disabled:"
                   << QString::fromStdString(integrityMessage);
        m_rebuildEnabled = false;
    }
}

LeaflineDaemon::~LeaflineDaemon() = default;

bool LeaflineDaemon::start()
{
    qInfo() << "Leafline: daemon starting, database"
            << QString::fromStdString(m_engine->config().databasePath);

    if (!m_apiServer) {
        m_apiServer = std::make_unique<LeaflineApiServer>(*m_engine);
        if (!m_apiServer->start()) {
            return false;
        }
    }

    const int minutes = m_engine->config().rebuildIntervalMinutes;
    if (minutes > 0) {
        auto *timer = new QTimer(this);
        const auto interval = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::minutes(minutes));
        timer->setInterval(static_cast<int>(
            std::min<std::chrono::milliseconds::rep>(interval.count(),
                                                      std::numeric_limits<int>::max())));
        connect(timer, &QTimer::timeout, this, &LeaflineDaemon::runScheduledRebuild);
        timer->start();
    }
    return true;
}

void LeaflineDaemon::runScheduledRebuild()
{
    if (!m_rebuildEnabled) {
        return;
    }

    try {
        const RebuildReport report =
            m_engine->facade().rebuild(m_engine->defaultRebuildOptions());
        LLOG_INFO(QStringLiteral("LeaflineDaemon"),
                  QStringLiteral("LeaflineDaemon::runScheduledRebuild"),
                  QStringLiteral("scheduled_rebuild_finished"),
                  QStringLiteral("timer"),
                  QStringLiteral("batched_rebuild"),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"report", report}}));
    } catch (const std::exception &ex) {
        LLOG_ERROR(QStringLiteral("LeaflineDaemon"),
                   QStringLiteral("LeaflineDaemon::runScheduledRebuild"),
                   QStringLiteral("scheduled_rebuild_failed"),
                   QStringLiteral("timer"),
                   QStringLiteral("batched_rebuild"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"what", ex.what()}}));
    }
}

} // namespace leafline
