#include "daemon/leafline_api_server.hpp"

#include <chrono>
#include <cstdint>
#include <limits>
#include <optional>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QStandardPaths>
#include <QDebug>
#include <QUuid>

#include <unistd.h>

#include "api/engine.hpp"
#include "api/query_facade.hpp"
#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace leafline {

namespace {

// Reported to the client without the exception text.
class UnknownMethod : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

QString runtimeSocketPath()
{
    const QString socketName = qEnvironmentVariable("LEAFLINE_SOCKET_NAME");
    if (!socketName.isEmpty()) {
        return socketName;
    }

    QString runtimeDir = qEnvironmentVariable("XDG_RUNTIME_DIR");
    if (runtimeDir.isEmpty()) {
        runtimeDir =
            QStandardPaths::writableLocation(QStandardPaths::RuntimeLocation);
    }
    if (runtimeDir.isEmpty()) {
        runtimeDir = QStringLiteral("/run/user/%1").arg(getuid());
    }
    return runtimeDir + QStringLiteral("/leafline.sock");
}

std::int64_t requireId(const nlohmann::json &params, const char *name)
{
    if (!params.contains(name) || !params[name].is_number_integer()) {
        throw ValidationError(std::string("missing or invalid ") + name);
    }
    return params[name].get<std::int64_t>();
}

std::optional<std::int64_t> optionalId(const nlohmann::json &params, const char *name)
{
    if (!params.contains(name) || params[name].is_null()) {
        return std::nullopt;
    }
    return requireId(params, name);
}

// Integer member that must fit an int; wider values are rejected rather
// than truncated.
int intParam(const nlohmann::json &params, const char *name)
{
    const nlohmann::json &value = params[name];
    if (!value.is_number_integer()) {
        throw ValidationError(std::string(name) + " must be an integer");
    }
    if (value.is_number_unsigned()) {
        if (value.get<std::uint64_t>()
            > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
            throw ValidationError(std::string(name) + " out of range");
        }
        return static_cast<int>(value.get<std::uint64_t>());
    }
    const std::int64_t wide = value.get<std::int64_t>();
    if (wide < std::numeric_limits<int>::min() || wide > std::numeric_limits<int>::max()) {
        throw ValidationError(std::string(name) + " out of range");
    }
    return static_cast<int>(wide);
}

OrphanPolicy orphanPolicyParam(const nlohmann::json &params, OrphanPolicy fallback)
{
    if (!params.contains("orphan_policy")) {
        return fallback;
    }
    const auto policy = params["orphan_policy"].is_string()
        ? parseOrphanPolicyString(params["orphan_policy"].get<std::string>())
        : std::nullopt;
    if (!policy.has_value()) {
        throw ValidationError("orphan_policy must be \"freeze\" or \"prune\"");
    }
    return *policy;
}

} // namespace

LeaflineApiServer::LeaflineApiServer(Engine &engine, QObject *parent)
    : QObject(parent)
    , m_engine(engine)
{
}

LeaflineApiServer::~LeaflineApiServer() = default;

bool LeaflineApiServer::start()
{
    const QString socketPath = runtimeSocketPath();
    if (socketPath.contains('/')) {
        const QFileInfo socketInfo(socketPath);
        if (!QDir().mkpath(socketInfo.absolutePath())) {
            qWarning() << "Failed to create runtime socket directory"
                       << socketInfo.absolutePath();
            return false;
        }

        if (QFile::exists(socketPath)) {
            if (!QLocalServer::removeServer(socketPath)) {
                qWarning() << "Failed to remove existing Leafline socket" << socketPath;
                return false;
            }
        }
    } else {
        QLocalServer::removeServer(socketPath);
    }

    if (!m_server.listen(socketPath)) {
        qWarning() << "Failed to listen on Leafline socket" << socketPath
                   << m_server.errorString();
        return false;
    }

    connect(&m_server, &QLocalServer::newConnection,
            this, &LeaflineApiServer::handleNewConnection);

    qInfo() << "Leafline API server listening on" << socketPath;
    return true;
}

void LeaflineApiServer::handleNewConnection()
{
    while (m_server.hasPendingConnections()) {
        QLocalSocket *socket = m_server.nextPendingConnection();
        if (!socket) {
            continue;
        }
        connect(socket, &QLocalSocket::readyRead,
                this, &LeaflineApiServer::handleClientReadyRead);
        connect(socket, &QLocalSocket::disconnected,
                socket, &QObject::deleteLater);
    }
}

void LeaflineApiServer::handleClientReadyRead()
{
    auto *socket = qobject_cast<QLocalSocket *>(sender());
    if (!socket) {
        return;
    }

    const QByteArray payload = socket->readAll();
    if (payload.isEmpty()) {
        return;
    }

    handleRequest(socket, payload);
}

void LeaflineApiServer::handleRequest(QLocalSocket *socket, const QByteArray &payload)
{
    if (!socket) {
        return;
    }
    const QByteArray response = handleRequestPayload(payload);
    socket->write(response);
    socket->flush();
    socket->disconnectFromServer();
}

QByteArray LeaflineApiServer::handleRequestPayload(const QByteArray &payload)
{
    const QString corrId = QUuid::createUuid().toString(QUuid::WithoutBraces);
    logging::CorrelationScope corrScope(corrId);
    const auto parsed = nlohmann::json::parse(payload.toStdString(), nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        LLOG_WARN(QStringLiteral("LeaflineApiServer"),
                  QStringLiteral("handleRequest"),
                  QStringLiteral("api_request_error"),
                  QStringLiteral("parse_payload"),
                  QStringLiteral("json_parse"),
                  logging::defaultWho(),
                  corrId,
                  nlohmann::json::object());
        return makeErrorResponse("Invalid JSON payload");
    }

    int id = -1;
    if (parsed.contains("id") && parsed["id"].is_number_integer()) {
        try {
            id = intParam(parsed, "id");
        } catch (const ValidationError &) {
            return makeErrorResponse("id out of range");
        }
    }

    if (!parsed.contains("method") || !parsed["method"].is_string()) {
        LLOG_WARN(QStringLiteral("LeaflineApiServer"),
                  QStringLiteral("handleRequest"),
                  QStringLiteral("api_request_error"),
                  QStringLiteral("missing_method"),
                  QStringLiteral("json_parse"),
                  logging::defaultWho(),
                  corrId,
                  nlohmann::json::object());
        return makeErrorResponse("Missing method", id);
    }

    const std::string method = parsed["method"].get<std::string>();
    nlohmann::json params = nlohmann::json::object();
    if (parsed.contains("params")) {
        if (!parsed["params"].is_object()) {
            return makeErrorResponse("Invalid params", id);
        }
        params = parsed["params"];
    }

    nlohmann::json paramKeys = nlohmann::json::array();
    for (auto it = params.begin(); it != params.end(); ++it) {
        paramKeys.push_back(it.key());
    }
    LLOG_INFO(QStringLiteral("LeaflineApiServer"),
              QStringLiteral("handleRequest"),
              QStringLiteral("api_request_received"),
              QStringLiteral("client_call"),
              QStringLiteral("json_rpc"),
              logging::defaultWho(),
              corrId,
              (nlohmann::json{{"method", method},
                             {"paramKeys", paramKeys}}));

    const auto start = std::chrono::steady_clock::now();
    try {
        const nlohmann::json result = dispatch(method, params);
        LLOG_INFO(QStringLiteral("LeaflineApiServer"),
                  QStringLiteral("handleRequest"),
                  QStringLiteral("api_request_completed"),
                  QStringLiteral("client_call"),
                  QStringLiteral("json_rpc"),
                  logging::defaultWho(),
                  corrId,
                  (nlohmann::json{{"method", method},
                                 {"durationMs",
                                  std::chrono::duration_cast<std::chrono::milliseconds>(
                                      std::chrono::steady_clock::now() - start).count()}}));
        return makeResultResponse(result, id);
    } catch (const UnknownMethod &) {
        LLOG_WARN(QStringLiteral("LeaflineApiServer"),
                  QStringLiteral("handleRequest"),
                  QStringLiteral("api_request_error"),
                  QStringLiteral("unknown_method"),
                  QStringLiteral("json_rpc"),
                  logging::defaultWho(),
                  corrId,
                  (nlohmann::json{{"method", method}}));
        return makeErrorResponse("Unknown method", id);
    } catch (const std::exception &ex) {
        LLOG_ERROR(QStringLiteral("LeaflineApiServer"),
                   QStringLiteral("handleRequest"),
                   QStringLiteral("api_request_error"),
                   QStringLiteral("exception"),
                   QStringLiteral("json_rpc"),
                   logging::defaultWho(),
                   corrId,
                   (nlohmann::json{{"method", method}, {"what", ex.what()}}));
        return makeErrorResponse(QString::fromUtf8(ex.what()), id);
    }
}

nlohmann::json LeaflineApiServer::dispatch(const std::string &method,
                                           const nlohmann::json &params)
{
    QueryFacade &facade = m_engine.facade();

    if (method == "get_timeline") {
        TimelineQuery query;
        const std::string scope = params.value("scope", "global");
        const auto parsedScope = parseScopeString(scope);
        if (!parsedScope.has_value()) {
            throw ValidationError("scope must be \"mine\" or \"global\"");
        }
        query.scope = *parsedScope;
        query.userId = optionalId(params, "user_id");
        if (params.contains("cursor") && !params["cursor"].is_null()) {
            const auto cursor = params["cursor"].is_string()
                ? parseCursor(params["cursor"].get<std::string>())
                : std::nullopt;
            if (!cursor.has_value()) {
                throw ValidationError("invalid cursor");
            }
            query.cursor = cursor;
        }
        if (params.contains("limit")) {
            query.limit = intParam(params, "limit");
        }
        return facade.timeline(query);
    }

    if (method == "get_stats") {
        const std::int64_t userId = requireId(params, "user_id");
        StatsCacheEntry entry;
        if (params.contains("year") && !params["year"].is_null()) {
            entry = facade.statsForYear(userId, intParam(params, "year"));
        } else {
            entry = facade.stats(userId);
        }
        return nlohmann::json{{"data", entry.data}, {"computed_at", entry.computedAt}};
    }

    if (method == "get_available_years") {
        const std::int64_t userId = requireId(params, "user_id");
        return nlohmann::json{{"years", facade.availableYears(userId)}};
    }

    if (method == "rebuild") {
        RebuildOptions options = m_engine.defaultRebuildOptions();
        if (params.contains("batch_size")) {
            options.batchSize = intParam(params, "batch_size");
        }
        options.orphanPolicy = orphanPolicyParam(params, options.orphanPolicy);
        options.restart = params.value("restart", false);
        return facade.rebuild(options);
    }

    if (method == "refresh_entity") {
        const std::string typeValue = params.value("entity_type", "");
        const auto type = parseEntityTypeString(typeValue);
        if (!type.has_value()) {
            throw ValidationError("unknown entity_type \"" + typeValue + "\"");
        }
        const EntityKey key{*type, requireId(params, "entity_id")};
        const OrphanPolicy policy =
            orphanPolicyParam(params, m_engine.config().orphanPolicy);
        return facade.refreshEntity(key, policy);
    }

    throw UnknownMethod(method);
}

QByteArray LeaflineApiServer::makeErrorResponse(const QString &message, int id) const
{
    nlohmann::json response;
    response["error"] = message.toStdString();
    response["id"] = id;
    return QByteArray::fromStdString(response.dump());
}

QByteArray LeaflineApiServer::makeResultResponse(const nlohmann::json &result, int id) const
{
    nlohmann::json response;
    response["result"] = result;
    response["id"] = id;
    return QByteArray::fromStdString(response.dump());
}

} // namespace leafline
