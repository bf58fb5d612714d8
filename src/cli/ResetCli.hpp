#pragma once

#include <cstddef>
#include <memory>
#include <optional>

#include <QString>
#include <QStringList>

#include "common/enums.hpp"
#include "common/process_utils.hpp"

namespace gpuscrub {

// Everything the command line and GPUSCRUB_* environment decide for a run.
struct RunOptions {
    ResetMode mode = ResetMode::Full;
    bool autoReboot = false;
    bool dryRun = false;
    bool trace = false;
    QString root = QStringLiteral("/");
    QString logDir;
    QString backupDir;
    QString policyFile;
    QString expectedRelease;
    // Negative: the policy's delay.
    int releaseDelaySeconds = -1;
    bool helpRequested = false;
    QString helpText;
};

/**
 * Parses `arguments` (program name first). Flags win over the GPUSCRUB_*
 * environment variables. Returns std::nullopt and fills `error` on a
 * usage error.
 */
std::optional<RunOptions> parseRunOptions(const QStringList &arguments, QString *error);

class ResetCli
{
public:
    // Runs real commands as the current effective user.
    ResetCli();
    ResetCli(CommandRunner &runner, unsigned effectiveUid);

    // Exit codes: 0 run finished, 1 precondition failed, 2 usage or policy error.
    int run(const QStringList &arguments);

    void setRebootDelaySeconds(int seconds) { m_rebootDelaySeconds = seconds; }

private:
    void printFinalHints(const RunOptions &options, std::size_t failures,
                         const QString &transcript, const QString &reportPath) const;
    void rebootHost();

    std::unique_ptr<ProcessRunner> m_ownedRunner;
    CommandRunner *m_runner = nullptr;
    unsigned m_effectiveUid = 0;
    int m_rebootDelaySeconds = 10;
};

} // namespace gpuscrub
