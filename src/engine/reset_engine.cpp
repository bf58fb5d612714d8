#include "engine/reset_engine.hpp"

#include <chrono>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QThread>
#include <QUuid>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "engine/error_policy.hpp"
#include "engine/host_tools.hpp"
#include "engine/inventory_collector.hpp"
#include "engine/module_builder.hpp"
#include "engine/package_manager.hpp"
#include "engine/pipeline.hpp"
#include "engine/remediator.hpp"
#include "engine/restorer.hpp"

namespace gpuscrub {

namespace {

const QString kComponent = QStringLiteral("ResetEngine");

void enterStage(RunReport &report, Stage stage)
{
    report.stages.push_back(stage);
    report.finalStage = stage;
    GSLOG_INFO(kComponent,
               QStringLiteral("run"),
               QStringLiteral("stage_entered"),
               QStringLiteral("linear_state_machine"),
               QStringLiteral("stage_order"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"stage", stage}}));
}

QString describeAction(const RemediationAction &action)
{
    const QString subject = action.item.path.empty()
        ? QString::fromStdString(action.item.name)
        : QString::fromStdString(action.item.path);
    QString line = QStringLiteral("  %1 %2 %3 [%4]")
                       .arg(QString::fromStdString(toActionString(action.kind)),
                            QString::fromStdString(toKindString(action.item.kind)),
                            subject,
                            QString::fromStdString(action.ruleId));
    if (!action.backupPath.empty()) {
        line += QStringLiteral(" -> ") + QString::fromStdString(action.backupPath);
    }
    return line;
}

} // namespace

ResetEngine::ResetEngine(CommandRunner &runner, const RulePolicy &policy,
                         const HostLayout &layout)
    : m_runner(runner)
    , m_policy(policy)
    , m_layout(layout)
    , m_classifier(policy)
{
}

void ResetEngine::warnOnReleaseMismatch(const EngineOptions &options)
{
    if (m_policy.expectedRelease.empty()) {
        return;
    }
    const ReleaseCheck release = checkRelease(m_layout, m_policy.expectedRelease);
    if (release.matches()) {
        return;
    }

    const int delay = options.releaseDelaySeconds >= 0 ? options.releaseDelaySeconds
                                                       : m_policy.releaseMismatchDelaySeconds;
    GSLOG_WARN(kComponent,
               QStringLiteral("checkRelease"),
               QStringLiteral("release_mismatch"),
               QStringLiteral("untested_release"),
               QStringLiteral("os_release_version_id"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"found", release.found},
                               {"expected", release.expected},
                               {"delaySeconds", delay}}));
    logging::announce(kComponent,
                      QStringLiteral("Warning: this tool targets release %1, found '%2'. "
                                     "Continuing in %3 s (Ctrl-C to abort).")
                          .arg(QString::fromStdString(release.expected),
                               QString::fromStdString(release.found))
                          .arg(delay));
    if (delay > 0 && !options.dryRun) {
        QThread::sleep(static_cast<unsigned long>(delay));
    }
}

void ResetEngine::announcePlan(const std::vector<RemediationAction> &actions, bool dryRun) const
{
    if (actions.empty()) {
        logging::announce(kComponent, QStringLiteral("No foreign GPU driver artifacts found."));
        return;
    }
    logging::announce(kComponent,
                      QStringLiteral("%1 %2 foreign artifact(s):")
                          .arg(dryRun ? QStringLiteral("Would remediate")
                                      : QStringLiteral("Remediating"))
                          .arg(actions.size()));
    for (const auto &action : actions) {
        logging::announce(kComponent, describeAction(action));
    }
}

EngineResult ResetEngine::run(const EngineOptions &options)
{
    EngineResult result;
    RunReport &report = result.report;
    report.runId = QUuid::createUuid().toString(QUuid::WithoutBraces).toStdString();
    report.mode = m_policy.mode;
    report.dryRun = options.dryRun;
    report.startedAt = std::chrono::system_clock::now();
    report.finalStage = Stage::Start;

    logging::CorrelationScope correlation(QString::fromStdString(report.runId));
    GSLOG_INFO(kComponent,
               QStringLiteral("run"),
               QStringLiteral("run_started"),
               QStringLiteral("operator_request"),
               QStringLiteral("cli"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"mode", toModeString(m_policy.mode)},
                               {"dryRun", options.dryRun},
                               {"root", m_layout.root().toStdString()},
                               {"backupRoot", m_layout.backupRoot().toStdString()}}));

    result.precondition = checkPreconditions(m_runner, options.effectiveUid, options.dryRun);
    if (result.precondition && severityFor(result.precondition->failure) != Severity::Fatal) {
        GSLOG_WARN(kComponent,
                   QStringLiteral("run"),
                   QStringLiteral("precondition_failed"),
                   QString::fromStdString(toFailureString(result.precondition->failure)),
                   QStringLiteral("best_effort_continue"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"message", result.precondition->message}}));
        result.precondition.reset();
    }
    if (result.precondition) {
        GSLOG_ERROR(kComponent,
                    QStringLiteral("run"),
                    QStringLiteral("precondition_failed"),
                    QString::fromStdString(toFailureString(result.precondition->failure)),
                    QStringLiteral("abort_before_collecting"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"message", result.precondition->message}}));
        report.finishedAt = std::chrono::system_clock::now();
        return result;
    }

    warnOnReleaseMismatch(options);

    // One timestamp names every backup this run makes.
    const std::string timestamp = std::to_string(
        std::chrono::duration_cast<std::chrono::seconds>(report.startedAt.time_since_epoch())
            .count());

    PackageManager packages(m_runner);
    ModuleBuilder modules(m_runner);
    HostTools tools(m_runner);

    enterStage(report, Stage::Collecting);
    logging::announce(kComponent, QStringLiteral("Collecting GPU driver inventory"));
    InventoryCollector collector(m_layout, packages, modules, m_policy);
    report.inventory = collector.collect();

    enterStage(report, Stage::Classifying);
    report.classifications = m_classifier.classifyAll(report.inventory);
    report.actions = planRemediation(report.classifications, m_layout, timestamp);
    announcePlan(report.actions, options.dryRun);

    if (!options.dryRun) {
        Pipeline pipeline;
        Remediator remediator(m_layout, packages, modules, timestamp);
        remediator.declareSteps(pipeline, report.actions);
        Restorer restorer(m_layout, packages, tools, m_policy.restoration);
        restorer.declareSteps(pipeline);

        PipelineRun pipelineRun = pipeline.run();
        for (Stage stage : pipelineRun.stages) {
            report.stages.push_back(stage);
            report.finalStage = stage;
        }
        report.executedSteps = std::move(pipelineRun.executedSteps);
        report.outcomes = std::move(pipelineRun.outcomes);
        result.stoppedBy = std::move(pipelineRun.stoppedBy);
        if (!result.stoppedBy) {
            enterStage(report, Stage::Done);
        }
    }

    report.finishedAt = std::chrono::system_clock::now();
    GSLOG_INFO(kComponent,
               QStringLiteral("run"),
               QStringLiteral("run_finished"),
               QStringLiteral("pipeline_complete"),
               QStringLiteral("stage_order"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"finalStage", report.finalStage},
                               {"actions", report.actions.size()},
                               {"outcomes", report.outcomes.size()},
                               {"failures", report.failureCount()}}));

    if (!options.reportPath.isEmpty() && !writeRunReport(report, options.reportPath)) {
        GSLOG_WARN(kComponent,
                   QStringLiteral("run"),
                   QStringLiteral("report_write_failed"),
                   QStringLiteral("io_error"),
                   QStringLiteral("qfile"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"path", options.reportPath.toStdString()}}));
    }
    return result;
}

bool writeRunReport(const RunReport &report, const QString &path)
{
    QDir().mkpath(QFileInfo(path).absolutePath());
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text)) {
        return false;
    }
    const nlohmann::json doc = report;
    const QByteArray data = QByteArray::fromStdString(
        doc.dump(2, ' ', false, nlohmann::json::error_handler_t::replace));
    return file.write(data) == data.size();
}

} // namespace gpuscrub
