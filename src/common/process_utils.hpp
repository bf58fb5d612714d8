#pragma once

#include <string>

#include <QProcessEnvironment>
#include <QString>
#include <QStringList>

namespace gpuscrub {

struct CommandResult {
    bool started = false;
    int exitCode = -1;
    std::string stdoutText;
    std::string stderrText;

    bool ok() const { return started && exitCode == 0; }
};

/**
 * Blocking access to external programs. Every package-manager, dkms and
 * boot-tool call goes through this seam so tests can replace the host.
 */
class CommandRunner
{
public:
    virtual ~CommandRunner() = default;

    virtual CommandResult run(const QString &program, const QStringList &arguments) = 0;
    virtual bool hasProgram(const QString &program) const = 0;
};

/**
 * CommandRunner backed by QProcess. Waits for each command without a
 * timeout: apt and dkms hold locks that the next step needs released.
 * Command lines, exit codes and output are written to the transcript.
 */
class ProcessRunner : public CommandRunner
{
public:
    ProcessRunner();

    CommandResult run(const QString &program, const QStringList &arguments) override;
    bool hasProgram(const QString &program) const override;

private:
    QProcessEnvironment m_environment;
};

QString describeCommand(const QString &program, const QStringList &arguments);

} // namespace gpuscrub
