#pragma once

#include <string>

#include <QString>

#include "common/models.hpp"
#include "common/process_utils.hpp"

namespace gpuscrub {

enum class Severity {
    Fatal,
    Logged
};

// Only precondition failures stop a run; everything else is recorded and
// the next action proceeds.
Severity severityFor(FailureClass failure);

// True for a failed outcome whose failure class is Fatal.
bool stopsRun(const Outcome &outcome);

std::string toFailureString(FailureClass failure);

Outcome succeeded(const std::string &step, const std::string &subject,
                  const std::string &detail = std::string());
Outcome skipped(const std::string &step, const std::string &subject,
                const std::string &reason);
Outcome failed(const std::string &step, const std::string &subject,
               FailureClass failure, const std::string &reason);

// Maps a finished command to an outcome for `subject`.
Outcome outcomeFromCommand(const std::string &step, const std::string &subject,
                           const QString &program, const QStringList &arguments,
                           const CommandResult &result);

// Writes an Error event for fatal outcomes, a Warn event for other failed
// outcomes and a Debug event otherwise.
void logOutcome(const QString &component, const Outcome &outcome);

} // namespace gpuscrub
