#include "cli/ResetCli.hpp"

#include <iostream>
#include <stdexcept>

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QDateTime>
#include <QDir>
#include <QThread>

#include <unistd.h>

#include <nlohmann/json.hpp>

#include "common/host_layout.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "engine/host_tools.hpp"
#include "engine/reset_engine.hpp"
#include "engine/rule_policy.hpp"

namespace gpuscrub {

namespace {

constexpr int kExitOk = 0;
constexpr int kExitPrecondition = 1;
constexpr int kExitUsage = 2;

QString envOr(const QString &value, const char *variable)
{
    if (!value.isEmpty()) {
        return value;
    }
    return qEnvironmentVariable(variable);
}

} // namespace

std::optional<RunOptions> parseRunOptions(const QStringList &arguments, QString *error)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Remove third-party AMD GPU driver stacks and restore the stock "
                       "Ubuntu/Debian graphics stack."));
    const QCommandLineOption helpOption = parser.addHelpOption();
    QCommandLineOption userlandOption(QStringList() << "userland-only",
                                      "Only reset the userland graphics/compute libraries.");
    QCommandLineOption rebootOption(QStringList() << "auto-reboot",
                                    "Reboot 10 seconds after the run finishes.");
    QCommandLineOption dryRunOption(QStringList() << "dry-run",
                                    "Collect and classify only; print the plan.");
    QCommandLineOption rootOption(QStringList() << "root",
                                  "Resolve every host path under DIR.", "DIR");
    QCommandLineOption logDirOption(QStringList() << "log-dir",
                                    "Write the transcript and report to DIR.", "DIR");
    QCommandLineOption backupDirOption(QStringList() << "backup-dir",
                                       "Quarantine files under DIR.", "DIR");
    QCommandLineOption policyOption(QStringList() << "policy",
                                    "JSON file overriding the built-in rules.", "FILE");
    QCommandLineOption releaseOption(QStringList() << "expected-release",
                                     "Release VERSION_ID the run is tuned for.", "VER");
    QCommandLineOption traceOption(QStringList() << "trace",
                                   "Include debug events in the transcript.");
    for (const auto &option : {userlandOption, rebootOption, dryRunOption, rootOption,
                               logDirOption, backupDirOption, policyOption, releaseOption,
                               traceOption}) {
        parser.addOption(option);
    }

    if (!parser.parse(arguments)) {
        if (error) {
            *error = parser.errorText();
        }
        return std::nullopt;
    }
    if (!parser.positionalArguments().isEmpty()) {
        if (error) {
            *error = QStringLiteral("unexpected argument: %1")
                         .arg(parser.positionalArguments().first());
        }
        return std::nullopt;
    }

    RunOptions options;
    if (parser.isSet(helpOption)) {
        options.helpRequested = true;
        options.helpText = parser.helpText();
        return options;
    }

    options.mode = parser.isSet(userlandOption) ? ResetMode::Userland : ResetMode::Full;
    options.autoReboot = parser.isSet(rebootOption);
    options.dryRun = parser.isSet(dryRunOption);
    options.trace = parser.isSet(traceOption)
        || qEnvironmentVariableIntValue("GPUSCRUB_TRACE") == 1;

    const QString root = envOr(parser.value(rootOption), "GPUSCRUB_ROOT");
    if (!root.isEmpty()) {
        options.root = root;
    }
    options.logDir = envOr(parser.value(logDirOption), "GPUSCRUB_LOG_DIR");
    options.backupDir = envOr(parser.value(backupDirOption), "GPUSCRUB_BACKUP_DIR");
    options.policyFile = parser.value(policyOption);
    options.expectedRelease = parser.value(releaseOption);

    const QString delay = qEnvironmentVariable("GPUSCRUB_RELEASE_DELAY");
    if (!delay.isEmpty()) {
        bool ok = false;
        const int seconds = delay.toInt(&ok);
        if (!ok || seconds < 0) {
            if (error) {
                *error = QStringLiteral("GPUSCRUB_RELEASE_DELAY must be a non-negative integer");
            }
            return std::nullopt;
        }
        options.releaseDelaySeconds = seconds;
    }
    return options;
}

ResetCli::ResetCli()
    : m_ownedRunner(std::make_unique<ProcessRunner>())
    , m_runner(m_ownedRunner.get())
    , m_effectiveUid(geteuid())
{
}

ResetCli::ResetCli(CommandRunner &runner, unsigned effectiveUid)
    : m_runner(&runner)
    , m_effectiveUid(effectiveUid)
{
}

int ResetCli::run(const QStringList &arguments)
{
    QString error;
    const std::optional<RunOptions> parsed = parseRunOptions(arguments, &error);
    if (!parsed) {
        std::cerr << "gpuscrub: " << error.toStdString() << std::endl;
        std::cerr << "Try 'gpuscrub --help'." << std::endl;
        return kExitUsage;
    }
    const RunOptions &options = *parsed;
    if (options.helpRequested) {
        std::cout << options.helpText.toStdString();
        return kExitOk;
    }

    const QString logDir = options.logDir.isEmpty() ? logging::logsDirPath() : options.logDir;
    const QString prefix = options.mode == ResetMode::Userland
        ? QStringLiteral("gpuscrub-userland")
        : QStringLiteral("gpuscrub");
    const QString transcript = QDir(logDir).filePath(
        logging::transcriptFileName(prefix, QDateTime::currentDateTime()));
    const QString reportPath = transcript + QStringLiteral(".report.json");
    logging::initLogging(QStringLiteral("gpuscrub"), transcript, options.trace);

    GSLOG_INFO(QStringLiteral("ResetCli"),
               QStringLiteral("run"),
               QStringLiteral("cli_start"),
               QStringLiteral("user_invocation"),
               QStringLiteral("cli"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"args", arguments.join(QChar(' ')).toStdString()},
                               {"mode", toModeString(options.mode)},
                               {"transcript", transcript.toStdString()}}));

    RulePolicy policy;
    try {
        policy = options.policyFile.isEmpty()
            ? RulePolicy::defaults(options.mode)
            : loadPolicyFile(options.policyFile, options.mode);
    } catch (const PolicyError &policyError) {
        GSLOG_ERROR(QStringLiteral("ResetCli"),
                    QStringLiteral("run"),
                    QStringLiteral("policy_rejected"),
                    QStringLiteral("invalid_policy_file"),
                    QStringLiteral("nlohmann_json"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"error", policyError.what()}}));
        std::cerr << "gpuscrub: " << policyError.what() << std::endl;
        return kExitUsage;
    }
    if (!options.expectedRelease.isEmpty()) {
        policy.expectedRelease = options.expectedRelease.toStdString();
    }

    const HostLayout layout(options.root, options.backupDir);

    std::optional<ResetEngine> engine;
    try {
        engine.emplace(*m_runner, policy, layout);
    } catch (const std::invalid_argument &patternError) {
        GSLOG_ERROR(QStringLiteral("ResetCli"),
                    QStringLiteral("run"),
                    QStringLiteral("policy_rejected"),
                    QStringLiteral("invalid_pattern"),
                    QStringLiteral("std_regex"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"error", patternError.what()}}));
        std::cerr << "gpuscrub: " << patternError.what() << std::endl;
        return kExitUsage;
    }

    EngineOptions engineOptions;
    engineOptions.dryRun = options.dryRun;
    engineOptions.effectiveUid = m_effectiveUid;
    engineOptions.releaseDelaySeconds = options.releaseDelaySeconds;
    engineOptions.reportPath = reportPath;

    const EngineResult result = engine->run(engineOptions);
    if (result.precondition) {
        std::cerr << "gpuscrub: " << result.precondition->message << std::endl;
        return kExitPrecondition;
    }
    if (result.stoppedBy) {
        std::cerr << "gpuscrub: stopped at " << result.stoppedBy->step << ": "
                  << result.stoppedBy->reason << std::endl;
        return kExitPrecondition;
    }

    printFinalHints(options, result.report.failureCount(), transcript, reportPath);
    if (options.autoReboot && !options.dryRun) {
        rebootHost();
    }
    return kExitOk;
}

void ResetCli::printFinalHints(const RunOptions &options, std::size_t failures,
                               const QString &transcript, const QString &reportPath) const
{
    const QString component = QStringLiteral("ResetCli");
    if (options.dryRun) {
        logging::announce(component, QStringLiteral("Dry run: nothing was changed."));
    } else {
        if (failures > 0) {
            logging::announce(component,
                              QStringLiteral("%1 action(s) failed; see the transcript for details.")
                                  .arg(failures));
        }
        if (options.mode == ResetMode::Userland) {
            logging::announce(component,
                              QStringLiteral("Userland graphics stack reset. Log out and back in "
                                             "(or reboot), then check:"));
            logging::announce(component, QStringLiteral("  glxinfo -B"));
            logging::announce(component, QStringLiteral("  vulkaninfo --summary"));
        } else if (!options.autoReboot) {
            logging::announce(component,
                              QStringLiteral("Driver stack reset. Reboot now to boot the stock "
                                             "kernel driver."));
        }
    }
    logging::announce(component, QStringLiteral("Transcript: %1").arg(transcript));
    logging::announce(component, QStringLiteral("Report: %1").arg(reportPath));
}

void ResetCli::rebootHost()
{
    logging::announce(QStringLiteral("ResetCli"),
                      QStringLiteral("Rebooting in %1 seconds (Ctrl-C to cancel)...")
                          .arg(m_rebootDelaySeconds));
    if (m_rebootDelaySeconds > 0) {
        QThread::sleep(static_cast<unsigned long>(m_rebootDelaySeconds));
    }

    HostTools tools(*m_runner);
    const Outcome outcome = tools.reboot("auto-reboot");
    if (outcome.failed()) {
        logging::announce(QStringLiteral("ResetCli"),
                          QStringLiteral("Reboot failed (%1); reboot manually.")
                              .arg(QString::fromStdString(outcome.reason)));
    }
}

} // namespace gpuscrub
