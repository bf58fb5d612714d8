#include "common/process_utils.hpp"

#include <QFileInfo>
#include <QProcess>
#include <QStandardPaths>

#include "common/logging.hpp"
#include <nlohmann/json.hpp>

namespace gpuscrub {

QString describeCommand(const QString &program, const QStringList &arguments)
{
    if (arguments.isEmpty()) {
        return program;
    }
    return program + QChar(' ') + arguments.join(QChar(' '));
}

ProcessRunner::ProcessRunner()
    : m_environment(QProcessEnvironment::systemEnvironment())
{
    // apt-get and dpkg must never stop to ask a question mid-run.
    m_environment.insert(QStringLiteral("DEBIAN_FRONTEND"),
                         QStringLiteral("noninteractive"));
}

bool ProcessRunner::hasProgram(const QString &program) const
{
    if (program.startsWith(QChar('/'))) {
        QFileInfo info(program);
        return info.exists() && info.isExecutable();
    }
    return !QStandardPaths::findExecutable(program).isEmpty();
}

CommandResult ProcessRunner::run(const QString &program, const QStringList &arguments)
{
    CommandResult result;
    const QString commandLine = describeCommand(program, arguments);

    GSLOG_DEBUG(QStringLiteral("ProcessRunner"),
                QStringLiteral("run"),
                QStringLiteral("command_start"),
                QStringLiteral("external_tool"),
                QStringLiteral("qprocess"),
                logging::defaultWho(),
                QString(),
                nlohmann::json{{"command", commandLine.toStdString()}});

    QProcess process;
    process.setProcessEnvironment(m_environment);
    process.start(program, arguments);
    if (!process.waitForStarted()) {
        GSLOG_WARN(QStringLiteral("ProcessRunner"),
                   QStringLiteral("run"),
                   QStringLiteral("command_not_started"),
                   QStringLiteral("external_tool"),
                   QStringLiteral("qprocess"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"command", commandLine.toStdString()},
                                   {"error", process.errorString().toStdString()}}));
        return result;
    }

    process.closeWriteChannel();

    if (!process.waitForFinished(-1)) {
        GSLOG_WARN(QStringLiteral("ProcessRunner"),
                   QStringLiteral("run"),
                   QStringLiteral("command_wait_failed"),
                   QStringLiteral("external_tool"),
                   QStringLiteral("qprocess"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"command", commandLine.toStdString()},
                                   {"error", process.errorString().toStdString()}}));
        return result;
    }

    result.started = true;
    result.stdoutText = QString::fromUtf8(process.readAllStandardOutput()).toStdString();
    result.stderrText = QString::fromUtf8(process.readAllStandardError()).toStdString();
    result.exitCode = process.exitStatus() == QProcess::NormalExit
        ? process.exitCode()
        : -1;

    GSLOG_INFO(QStringLiteral("ProcessRunner"),
               QStringLiteral("run"),
               QStringLiteral("command_finished"),
               QStringLiteral("external_tool"),
               QStringLiteral("qprocess"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"command", commandLine.toStdString()},
                               {"exitCode", result.exitCode},
                               {"stdout", result.stdoutText},
                               {"stderr", result.stderrText}}));
    return result;
}

} // namespace gpuscrub
