#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace gpuscrub {

using StepFunction = std::function<std::vector<Outcome>()>;

struct PipelineStep {
    std::string name;
    Stage stage = Stage::Remediating;
    std::vector<std::string> dependsOn;
    StepFunction run;
};

struct PipelineRun {
    std::vector<Stage> stages;
    std::vector<std::string> executedSteps;
    std::vector<Outcome> outcomes;
    // The first outcome whose failure class is Fatal; no later step ran.
    std::optional<Outcome> stoppedBy;
};

/**
 * Ordered list of named steps. Declaration order is execution order, and
 * addStep() rejects a step whose dependency is not already declared or
 * whose stage would move the run backwards, so the order tests read from
 * stepNames() is the order the host sees.
 */
class Pipeline
{
public:
    // Throws std::logic_error on an unknown/later dependency, a duplicate
    // name or a stage earlier than the previous step's.
    void addStep(const std::string &name, Stage stage,
                 std::vector<std::string> dependsOn, StepFunction run);

    std::vector<std::string> stepNames() const;
    const std::vector<PipelineStep> &steps() const { return m_steps; }
    bool contains(const std::string &name) const;

    // Runs every step once. Step failures are outcomes and the next step
    // runs, unless the failure class is Fatal: then the step finishes and
    // the run stops there.
    PipelineRun run() const;

private:
    std::vector<PipelineStep> m_steps;
};

} // namespace gpuscrub
