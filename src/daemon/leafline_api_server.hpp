#pragma once

#include <QObject>
#include <QLocalServer>
#include <QLocalSocket>

#include <nlohmann/json.hpp>

namespace leafline {

class Engine;

/**
 * LeaflineApiServer exposes the timeline feed, statistics and rebuild
 * operations over a local UNIX socket using a minimal JSON-RPC-like protocol.
 *
 * Methods: get_timeline, get_stats, get_available_years, rebuild,
 * refresh_entity.
 */
class LeaflineApiServer : public QObject
{
    Q_OBJECT
public:
    explicit LeaflineApiServer(Engine &engine, QObject *parent = nullptr);
    ~LeaflineApiServer() override;

    // Start listening on $XDG_RUNTIME_DIR/leafline.sock
    bool start();
    // Process a single JSON-RPC payload without a socket round-trip.
    QByteArray handleRequestPayload(const QByteArray &payload);

private slots:
    void handleNewConnection();
    void handleClientReadyRead();

private:
    void handleRequest(QLocalSocket *socket, const QByteArray &payload);
    nlohmann::json dispatch(const std::string &method, const nlohmann::json &params);
    QByteArray makeErrorResponse(const QString &message, int id = -1) const;
    QByteArray makeResultResponse(const nlohmann::json &result, int id) const;

    Engine &m_engine;
    QLocalServer m_server;
};

} // namespace leafline
