#include "engine/error_policy.hpp"

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace gpuscrub {

namespace {

std::string lastLine(const std::string &text)
{
    std::size_t end = text.find_last_not_of(" \t\r\n");
    if (end == std::string::npos) {
        return {};
    }
    std::size_t start = text.find_last_of('\n', end);
    start = start == std::string::npos ? 0 : start + 1;
    return text.substr(start, end - start + 1);
}

} // namespace

Severity severityFor(FailureClass failure)
{
    switch (failure) {
    case FailureClass::NotPrivileged:
    case FailureClass::PackageManagerMissing:
    case FailureClass::PackageQueryMissing:
        return Severity::Fatal;
    case FailureClass::CommandNotStarted:
    case FailureClass::CommandFailed:
    case FailureClass::FileOperationFailed:
        return Severity::Logged;
    }
    return Severity::Logged;
}

bool stopsRun(const Outcome &outcome)
{
    return outcome.failed() && outcome.failure
           && severityFor(*outcome.failure) == Severity::Fatal;
}

std::string toFailureString(FailureClass failure)
{
    switch (failure) {
    case FailureClass::NotPrivileged:
        return "not_privileged";
    case FailureClass::PackageManagerMissing:
        return "package_manager_missing";
    case FailureClass::PackageQueryMissing:
        return "package_query_missing";
    case FailureClass::CommandNotStarted:
        return "command_not_started";
    case FailureClass::CommandFailed:
        return "command_failed";
    case FailureClass::FileOperationFailed:
        return "file_operation_failed";
    }
    return "command_failed";
}

Outcome succeeded(const std::string &step, const std::string &subject,
                  const std::string &detail)
{
    Outcome outcome;
    outcome.step = step;
    outcome.subject = subject;
    outcome.status = OutcomeStatus::Succeeded;
    outcome.detail = detail;
    return outcome;
}

Outcome skipped(const std::string &step, const std::string &subject,
                const std::string &reason)
{
    Outcome outcome;
    outcome.step = step;
    outcome.subject = subject;
    outcome.status = OutcomeStatus::Skipped;
    outcome.reason = reason;
    return outcome;
}

Outcome failed(const std::string &step, const std::string &subject,
               FailureClass failure, const std::string &reason)
{
    Outcome outcome;
    outcome.step = step;
    outcome.subject = subject;
    outcome.status = OutcomeStatus::Failed;
    outcome.failure = failure;
    outcome.reason = toFailureString(failure);
    if (!reason.empty()) {
        outcome.reason += ": " + reason;
    }
    return outcome;
}

Outcome outcomeFromCommand(const std::string &step, const std::string &subject,
                           const QString &program, const QStringList &arguments,
                           const CommandResult &result)
{
    const std::string command = describeCommand(program, arguments).toStdString();
    if (!result.started) {
        return failed(step, subject, FailureClass::CommandNotStarted, command);
    }
    if (result.exitCode != 0) {
        std::string reason = command + " exited with " + std::to_string(result.exitCode);
        const std::string tail = lastLine(result.stderrText);
        if (!tail.empty()) {
            reason += " (" + tail + ")";
        }
        return failed(step, subject, FailureClass::CommandFailed, reason);
    }
    return succeeded(step, subject, command);
}

void logOutcome(const QString &component, const Outcome &outcome)
{
    const nlohmann::json context = outcome;
    if (stopsRun(outcome)) {
        GSLOG_ERROR(component,
                    QString::fromStdString(outcome.step),
                    QStringLiteral("action_failed"),
                    QStringLiteral("fatal_failure"),
                    QStringLiteral("stop_run"),
                    logging::defaultWho(),
                    QString(),
                    context);
        return;
    }
    if (outcome.failed()) {
        GSLOG_WARN(component,
                   QString::fromStdString(outcome.step),
                   QStringLiteral("action_failed"),
                   QStringLiteral("best_effort_continue"),
                   QStringLiteral("outcome"),
                   logging::defaultWho(),
                   QString(),
                   context);
        return;
    }
    GSLOG_DEBUG(component,
                QString::fromStdString(outcome.step),
                QStringLiteral("action_outcome"),
                QStringLiteral("best_effort_continue"),
                QStringLiteral("outcome"),
                logging::defaultWho(),
                QString(),
                context);
}

} // namespace gpuscrub
