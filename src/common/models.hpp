#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/enums.hpp"

namespace gpuscrub {

// A discovered artifact. Built by the collector and never modified afterwards.
struct InventoryItem {
    ItemKind kind = ItemKind::Package;
    std::string name;
    // Empty for packages and module builds.
    std::string path;
    nlohmann::json metadata = nlohmann::json::object();
};

struct ClassificationResult {
    InventoryItem item;
    Label label = Label::Stock;
    std::string ruleId;
};

struct RemediationAction {
    ActionKind kind = ActionKind::PurgePackage;
    InventoryItem item;
    std::string ruleId;
    // Where the artifact ends up. Empty when the package manager or dkms
    // owns the undo path, or when the artifact is deleted outright.
    std::string backupPath;
};

struct RestorationTarget {
    RestorationKind kind = RestorationKind::Package;
    // Package name; "{kernel}" expands to the running kernel release.
    std::string name;
    std::string batch;
    // ConfigFile only: host path and full file content.
    std::string path;
    std::string content;
};

// Result of one sub-action. Failures are data, not control flow.
struct Outcome {
    std::string step;
    std::string subject;
    OutcomeStatus status = OutcomeStatus::Succeeded;
    std::string reason;
    std::string detail;
    // Set together with status Failed.
    std::optional<FailureClass> failure;

    bool failed() const { return status == OutcomeStatus::Failed; }
};

struct RunReport {
    std::string runId;
    ResetMode mode = ResetMode::Full;
    bool dryRun = false;
    std::chrono::system_clock::time_point startedAt;
    std::chrono::system_clock::time_point finishedAt;
    Stage finalStage = Stage::Start;

    std::vector<Stage> stages;
    std::vector<InventoryItem> inventory;
    std::vector<ClassificationResult> classifications;
    std::vector<RemediationAction> actions;
    std::vector<std::string> executedSteps;
    std::vector<Outcome> outcomes;

    std::size_t failureCount() const
    {
        std::size_t count = 0;
        for (const auto &outcome : outcomes) {
            if (outcome.failed()) {
                ++count;
            }
        }
        return count;
    }
};

} // namespace gpuscrub
