#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace bluemeter::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main().
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();

// Thread-local correlation support for linking the log lines of one
// reconciliation pass or one watch task.
void setCorrelationId(const QString &corrId);
QString currentCorrelationId();
QString newCorrelationId(const QString &prefix);

class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

    CorrelationScope(const CorrelationScope &) = delete;
    CorrelationScope &operator=(const CorrelationScope &) = delete;

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
QString logsDirPath();

} // namespace bluemeter::logging

#define BMLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::bluemeter::logging::logEvent(::bluemeter::logging::LogLevel::Debug, \
                                   ::bluemeter::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define BMLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::bluemeter::logging::logEvent(::bluemeter::logging::LogLevel::Info, \
                                   ::bluemeter::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define BMLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::bluemeter::logging::logEvent(::bluemeter::logging::LogLevel::Warn, \
                                   ::bluemeter::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define BMLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::bluemeter::logging::logEvent(::bluemeter::logging::LogLevel::Error, \
                                   ::bluemeter::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
