#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace timekeep::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main().
// Trace mode lowers the main file's threshold to Debug and mirrors every event
// into <process>-trace.log; TIMEKEEP_LOG_LEVEL overrides the threshold.
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();

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

QString logsDirPath();
QString defaultProcessName();
QString defaultWho();

} // namespace timekeep::logging

#define TKLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::timekeep::logging::logEvent(::timekeep::logging::LogLevel::Debug, \
                                  ::timekeep::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define TKLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::timekeep::logging::logEvent(::timekeep::logging::LogLevel::Info, \
                                  ::timekeep::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define TKLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::timekeep::logging::logEvent(::timekeep::logging::LogLevel::Warn, \
                                  ::timekeep::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define TKLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::timekeep::logging::logEvent(::timekeep::logging::LogLevel::Error, \
                                  ::timekeep::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
