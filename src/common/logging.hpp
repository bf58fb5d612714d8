#pragma once

#include <QDateTime>
#include <QString>

#include <nlohmann/json.hpp>

namespace gpuscrub::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main().
// transcriptPath receives every event of the run; when empty, events go to
// <log dir>/<processName>.log instead.
void initLogging(const QString &processName,
                 const QString &transcriptPath,
                 bool traceEnabled);

bool isTraceEnabled();

QString transcriptPath();

// "<prefix>-yyyyMMdd-HHmmss.log" for a run started at `when`.
QString transcriptFileName(const QString &prefix, const QDateTime &when);

// GPUSCRUB_LOG_DIR; otherwise /var/log for root and
// ~/.local/share/gpuscrub/logs for everyone else.
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

// Operator-facing line: printed to stdout and recorded in the transcript.
void announce(const QString &component, const QString &message);

QString defaultProcessName();
QString defaultWho();

} // namespace gpuscrub::logging

#define GSLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::gpuscrub::logging::logEvent(::gpuscrub::logging::LogLevel::Debug, \
                                  ::gpuscrub::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define GSLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::gpuscrub::logging::logEvent(::gpuscrub::logging::LogLevel::Info, \
                                  ::gpuscrub::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define GSLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::gpuscrub::logging::logEvent(::gpuscrub::logging::LogLevel::Warn, \
                                  ::gpuscrub::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define GSLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::gpuscrub::logging::logEvent(::gpuscrub::logging::LogLevel::Error, \
                                  ::gpuscrub::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
