#include "engine/pipeline.hpp"

#include <stdexcept>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "engine/error_policy.hpp"

namespace gpuscrub {

void Pipeline::addStep(const std::string &name, Stage stage,
                       std::vector<std::string> dependsOn, StepFunction run)
{
    if (contains(name)) {
        throw std::logic_error("pipeline step declared twice: " + name);
    }
    for (const auto &dependency : dependsOn) {
        if (!contains(dependency)) {
            throw std::logic_error("pipeline step " + name + " depends on undeclared step "
                                   + dependency);
        }
    }
    if (!m_steps.empty() && static_cast<int>(stage) < static_cast<int>(m_steps.back().stage)) {
        throw std::logic_error("pipeline step " + name + " belongs to stage "
                               + toStageString(stage) + " after stage "
                               + toStageString(m_steps.back().stage) + " started");
    }

    PipelineStep step;
    step.name = name;
    step.stage = stage;
    step.dependsOn = std::move(dependsOn);
    step.run = std::move(run);
    m_steps.push_back(std::move(step));
}

std::vector<std::string> Pipeline::stepNames() const
{
    std::vector<std::string> names;
    names.reserve(m_steps.size());
    for (const auto &step : m_steps) {
        names.push_back(step.name);
    }
    return names;
}

bool Pipeline::contains(const std::string &name) const
{
    for (const auto &step : m_steps) {
        if (step.name == name) {
            return true;
        }
    }
    return false;
}

PipelineRun Pipeline::run() const
{
    PipelineRun result;
    for (const auto &step : m_steps) {
        if (result.stages.empty() || result.stages.back() != step.stage) {
            result.stages.push_back(step.stage);
            GSLOG_INFO(QStringLiteral("Pipeline"),
                       QStringLiteral("run"),
                       QStringLiteral("stage_entered"),
                       QStringLiteral("linear_state_machine"),
                       QStringLiteral("declared_order"),
                       logging::defaultWho(),
                       QString(),
                       (nlohmann::json{{"stage", step.stage}}));
        }

        GSLOG_DEBUG(QStringLiteral("Pipeline"),
                    QStringLiteral("run"),
                    QStringLiteral("step_start"),
                    QStringLiteral("linear_state_machine"),
                    QStringLiteral("declared_order"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"step", step.name}}));

        std::vector<Outcome> outcomes = step.run();
        result.executedSteps.push_back(step.name);

        std::size_t failures = 0;
        for (auto &outcome : outcomes) {
            if (outcome.step.empty()) {
                outcome.step = step.name;
            }
            if (outcome.failed()) {
                ++failures;
            }
            if (!result.stoppedBy && stopsRun(outcome)) {
                result.stoppedBy = outcome;
            }
            result.outcomes.push_back(std::move(outcome));
        }

        GSLOG_INFO(QStringLiteral("Pipeline"),
                   QStringLiteral("run"),
                   QStringLiteral("step_finished"),
                   QStringLiteral("linear_state_machine"),
                   QStringLiteral("declared_order"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"step", step.name},
                                   {"outcomes", outcomes.size()},
                                   {"failures", failures}}));

        if (result.stoppedBy) {
            GSLOG_ERROR(QStringLiteral("Pipeline"),
                        QStringLiteral("run"),
                        QStringLiteral("run_stopped"),
                        QStringLiteral("fatal_failure"),
                        QStringLiteral("skip_remaining_steps"),
                        logging::defaultWho(),
                        QString(),
                        (nlohmann::json{{"step", step.name},
                                        {"reason", result.stoppedBy->reason}}));
            break;
        }
    }
    return result;
}

} // namespace gpuscrub
