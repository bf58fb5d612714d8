#include "common/logging.hpp"

#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QThread>

#include <unistd.h>

#include <cstdio>
#include <iostream>
#include <mutex>

namespace gpuscrub::logging {

namespace {

constexpr qint64 kMaxLogSizeBytes = 5 * 1024 * 1024;

std::mutex g_logMutex;
bool g_traceEnabled = false;
QString g_processName;
QString g_transcriptPath;

thread_local QString t_corrId;

QString levelToString(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:
        return QStringLiteral("DEBUG");
    case LogLevel::Info:
        return QStringLiteral("INFO");
    case LogLevel::Warn:
        return QStringLiteral("WARN");
    case LogLevel::Error:
        return QStringLiteral("ERROR");
    }
    return QStringLiteral("INFO");
}

QString fallbackLogPath(const QString &processName)
{
    const QString base = processName.isEmpty()
        ? QStringLiteral("gpuscrub")
        : processName;
    return logsDirPath() + QDir::separator() + base + QStringLiteral(".log");
}

// Only the per-process fallback log rotates; transcripts are one file per run.
void rotateIfNeeded(const QString &path)
{
    QFileInfo info(path);
    if (!info.exists() || info.size() < kMaxLogSizeBytes) {
        return;
    }

    const QString rotated = path + QStringLiteral(".1");
    QFile::remove(rotated);
    QFile::rename(path, rotated);
}

void writeLine(const QString &path, const QString &line, bool rotate)
{
    QDir().mkpath(QFileInfo(path).absolutePath());
    if (rotate) {
        rotateIfNeeded(path);
    }

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        fprintf(stderr, "%s\n", line.toUtf8().constData());
        return;
    }

    file.write(line.toUtf8());
    file.write("\n");
}

QString threadIdString()
{
    return QStringLiteral("0x%1")
        .arg(reinterpret_cast<quintptr>(QThread::currentThreadId()), 0, 16);
}

} // namespace

void initLogging(const QString &processName,
                 const QString &transcriptPath,
                 bool traceEnabled)
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_processName = processName;
    g_transcriptPath = transcriptPath;
    g_traceEnabled = traceEnabled;
}

bool isTraceEnabled()
{
    return g_traceEnabled;
}

QString transcriptPath()
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    return g_transcriptPath;
}

QString transcriptFileName(const QString &prefix, const QDateTime &when)
{
    return prefix + QStringLiteral("-")
        + when.toString(QStringLiteral("yyyyMMdd-HHmmss"))
        + QStringLiteral(".log");
}

QString logsDirPath()
{
    const QString override = qEnvironmentVariable("GPUSCRUB_LOG_DIR");
    if (!override.isEmpty()) {
        return override;
    }
    if (geteuid() == 0) {
        return QStringLiteral("/var/log");
    }
    const QString home = qEnvironmentVariable("HOME");
    if (home.isEmpty()) {
        return QStringLiteral(".local/share/gpuscrub/logs");
    }
    return home + QStringLiteral("/.local/share/gpuscrub/logs");
}

void setCorrelationId(const QString &corrId)
{
    t_corrId = corrId;
}

QString currentCorrelationId()
{
    return t_corrId;
}

CorrelationScope::CorrelationScope(const QString &corrId)
    : m_prev(t_corrId)
{
    t_corrId = corrId;
}

CorrelationScope::~CorrelationScope()
{
    t_corrId = m_prev;
}

QString defaultProcessName()
{
    if (!g_processName.isEmpty()) {
        return g_processName;
    }
    if (QCoreApplication::instance()) {
        const QString appName = QCoreApplication::applicationName();
        if (!appName.isEmpty()) {
            return appName;
        }
    }
    return QStringLiteral("gpuscrub");
}

QString defaultWho()
{
    char hostname[256] = {};
    if (gethostname(hostname, sizeof(hostname)) != 0) {
        hostname[0] = '\0';
    }
    return QStringLiteral("host:%1,uid:%2")
        .arg(QString::fromUtf8(hostname))
        .arg(static_cast<int>(getuid()));
}

void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context)
{
    if (level == LogLevel::Debug && !g_traceEnabled) {
        return;
    }

    const QString corr = correlationId.isEmpty() ? currentCorrelationId() : correlationId;
    nlohmann::json payload = {
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"level", levelToString(level).toStdString()},
        {"process", processName.toStdString()},
        {"thread", threadIdString().toStdString()},
        {"component", component.toStdString()},
        {"where", where.toStdString()},
        {"what", what.toStdString()},
        {"why", why.toStdString()},
        {"how", how.toStdString()},
        {"who", who.toStdString()},
        {"corr", corr.toStdString()},
        {"context", context}
    };

    const QString line = QString::fromStdString(
        payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));

    std::lock_guard<std::mutex> lock(g_logMutex);
    if (!g_transcriptPath.isEmpty()) {
        writeLine(g_transcriptPath, line, false);
        return;
    }

    const QString process = processName.isEmpty() ? defaultProcessName() : processName;
    writeLine(fallbackLogPath(process), line, true);
}

void announce(const QString &component, const QString &message)
{
    std::cout << message.toStdString() << std::endl;
    logEvent(LogLevel::Info,
             defaultProcessName(),
             component,
             QStringLiteral("announce"),
             QStringLiteral("console_message"),
             QStringLiteral("operator_feedback"),
             QStringLiteral("stdout"),
             defaultWho(),
             QString(),
             nlohmann::json{{"message", message.toStdString()}});
}

} // namespace gpuscrub::logging
