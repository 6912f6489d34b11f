#pragma once

#include <memory>

#include <QObject>

#include "common/config.hpp"

namespace leafline {

class Engine;
class LeaflineApiServer;

/**
 * LeaflineDaemon owns the engine and the API server, and optionally runs a
 * scheduled timeline rebuild.
 *
 * It is designed to be owned from main() and driven by Qt's event loop.
 */
class LeaflineDaemon : public QObject
{
    Q_OBJECT
public:
    explicit LeaflineDaemon(const Config &config, QObject *parent = nullptr);
    ~LeaflineDaemon() override;

    // Starts the API server and the rebuild timer. Returns false when the
    // socket could not be opened.
    bool start();

private slots:
    void runScheduledRebuild();

private:
    std::unique_ptr<Engine> m_engine;
    std::unique_ptr<LeaflineApiServer> m_apiServer;
    bool m_rebuildEnabled = true;
};

} // namespace leafline
