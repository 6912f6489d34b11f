#pragma once

#include <cstdint>
#include <optional>

#include <QString>

#include <nlohmann/json.hpp>

namespace leafline::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main().
// With trace enabled, Debug lines are written and every line is mirrored
// into <process>-trace.log.
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();

// Directory holding the log files. LEAFLINE_LOG_DIR overrides the default
// $HOME/.local/share/leafline/logs.
QString logsDirPath();

// Thread-local correlation support for linking related log events.
void setCorrelationId(const QString &corrId);
QString currentCorrelationId();

class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

private:
    QString m_prev;
};

// Structured log event. All fields are required; use empty strings where unknown.
void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context = nlohmann::json::object());

QString defaultProcessName();
QString defaultWho();
// "user:<id>" for attributed work, defaultWho() otherwise.
QString userWho(const std::optional<std::int64_t> &userId);

} // namespace leafline::logging

#define LLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::leafline::logging::logEvent(::leafline::logging::LogLevel::Debug, \
                                  ::leafline::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define LLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::leafline::logging::logEvent(::leafline::logging::LogLevel::Info, \
                                  ::leafline::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define LLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::leafline::logging::logEvent(::leafline::logging::LogLevel::Warn, \
                                  ::leafline::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define LLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::leafline::logging::logEvent(::leafline::logging::LogLevel::Error, \
                                  ::leafline::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
