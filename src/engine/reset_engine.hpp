#pragma once

#include <optional>
#include <string>

#include <QString>

#include "common/host_layout.hpp"
#include "common/models.hpp"
#include "common/process_utils.hpp"
#include "engine/classifier.hpp"
#include "engine/preconditions.hpp"
#include "engine/rule_policy.hpp"

namespace gpuscrub {

struct EngineOptions {
    bool dryRun = false;
    unsigned effectiveUid = 0;
    // Negative: use the policy's delay.
    int releaseDelaySeconds = -1;
    // Where the JSON run report goes; empty to skip writing it.
    QString reportPath;
};

struct EngineResult {
    // Set when the run stopped before Collecting.
    std::optional<PreconditionError> precondition;
    // Set when a step failed with a Fatal failure class; the run did not
    // reach Done.
    std::optional<Outcome> stoppedBy;
    RunReport report;
};

/**
 * Drives one reset run through Start -> Collecting -> Classifying ->
 * Remediating -> Restoring -> Done. A dry run stops after Classifying with
 * the planned actions in the report.
 *
 * The constructor compiles the policy's patterns and throws
 * std::invalid_argument when one is malformed.
 */
class ResetEngine
{
public:
    ResetEngine(CommandRunner &runner, const RulePolicy &policy, const HostLayout &layout);

    EngineResult run(const EngineOptions &options);

private:
    void warnOnReleaseMismatch(const EngineOptions &options);
    void announcePlan(const std::vector<RemediationAction> &actions, bool dryRun) const;

    CommandRunner &m_runner;
    const RulePolicy &m_policy;
    const HostLayout &m_layout;
    Classifier m_classifier;
};

// Writes `report` as indented JSON. Returns false when the file cannot be
// written.
bool writeRunReport(const RunReport &report, const QString &path);

} // namespace gpuscrub
