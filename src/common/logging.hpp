#pragma once

#include <QString>

#include <nlohmann/json.hpp>

#include "common/config.hpp"

namespace timetrack::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Points the log at config.logDirectory and fixes the process name for the
// rest of the run. Lines logged before this go to the default directory.
// Debug lines are kept only with config.traceEnabled, which also mirrors
// every line into <process>-trace.log.
void initLogging(const QString &processName, const TrackerConfig &config);

// One id per command invocation; every line logged inside the scope carries it.
class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

    CorrelationScope(const CorrelationScope &) = delete;
    CorrelationScope &operator=(const CorrelationScope &) = delete;

private:
    QString m_prev;
};

QString currentCorrelationId();

// Appends one JSON line: ts, level, process, pid, component, where, what,
// why, how, who, corr, context.
void logEvent(LogLevel level,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const nlohmann::json &context = nlohmann::json::object());

} // namespace timetrack::logging

#define TTLOG_DEBUG(component, where, what, why, how, ctxJson) \
    ::timetrack::logging::logEvent(::timetrack::logging::LogLevel::Debug, \
                                   (component), (where), (what), (why), (how), (ctxJson))

#define TTLOG_INFO(component, where, what, why, how, ctxJson) \
    ::timetrack::logging::logEvent(::timetrack::logging::LogLevel::Info, \
                                   (component), (where), (what), (why), (how), (ctxJson))

#define TTLOG_WARN(component, where, what, why, how, ctxJson) \
    ::timetrack::logging::logEvent(::timetrack::logging::LogLevel::Warn, \
                                   (component), (where), (what), (why), (how), (ctxJson))

#define TTLOG_ERROR(component, where, what, why, how, ctxJson) \
    ::timetrack::logging::logEvent(::timetrack::logging::LogLevel::Error, \
                                   (component), (where), (what), (why), (how), (ctxJson))
