#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace gpuscrub {

inline std::string toIso8601Utc(std::chrono::system_clock::time_point timestamp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
    gmtime_r(&time, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

inline std::string toKindString(ItemKind kind)
{
    switch (kind) {
    case ItemKind::Package:
        return "package";
    case ItemKind::RepositorySource:
        return "repository_source";
    case ItemKind::PinRule:
        return "pin_rule";
    case ItemKind::RepositoryKey:
        return "repository_key";
    case ItemKind::ModuleBuild:
        return "module_build";
    case ItemKind::ModuleConfigFile:
        return "module_config_file";
    case ItemKind::VendorDirectory:
        return "vendor_directory";
    case ItemKind::CacheDirectory:
        return "cache_directory";
    case ItemKind::VulkanICD:
        return "vulkan_icd";
    case ItemKind::OpenCLVendorFile:
        return "opencl_vendor_file";
    }
    return "package";
}

inline std::optional<ItemKind> parseKindString(const std::string &value)
{
    static const ItemKind kinds[] = {
        ItemKind::Package,          ItemKind::RepositorySource,
        ItemKind::PinRule,          ItemKind::RepositoryKey,
        ItemKind::ModuleBuild,      ItemKind::ModuleConfigFile,
        ItemKind::VendorDirectory,  ItemKind::CacheDirectory,
        ItemKind::VulkanICD,        ItemKind::OpenCLVendorFile,
    };
    for (ItemKind kind : kinds) {
        if (toKindString(kind) == value) {
            return kind;
        }
    }
    return std::nullopt;
}

inline std::string toLabelString(Label label)
{
    return label == Label::Foreign ? "foreign" : "stock";
}

inline std::string toActionString(ActionKind kind)
{
    switch (kind) {
    case ActionKind::DisableSource:
        return "disable_source";
    case ActionKind::RemovePin:
        return "remove_pin";
    case ActionKind::PurgePackage:
        return "purge_package";
    case ActionKind::DeregisterModuleBuild:
        return "deregister_module_build";
    case ActionKind::QuarantineFile:
        return "quarantine_file";
    case ActionKind::RemoveDirectory:
        return "remove_directory";
    }
    return "purge_package";
}

inline std::string toModeString(ResetMode mode)
{
    return mode == ResetMode::Userland ? "userland" : "full";
}

inline std::string toStageString(Stage stage)
{
    switch (stage) {
    case Stage::Start:
        return "start";
    case Stage::Collecting:
        return "collecting";
    case Stage::Classifying:
        return "classifying";
    case Stage::Remediating:
        return "remediating";
    case Stage::Restoring:
        return "restoring";
    case Stage::Done:
        return "done";
    }
    return "start";
}

inline std::string toStatusString(OutcomeStatus status)
{
    switch (status) {
    case OutcomeStatus::Succeeded:
        return "succeeded";
    case OutcomeStatus::Failed:
        return "failed";
    case OutcomeStatus::Skipped:
        return "skipped";
    }
    return "failed";
}

inline void to_json(nlohmann::json &j, const ItemKind &kind)
{
    j = toKindString(kind);
}

inline void to_json(nlohmann::json &j, const Label &label)
{
    j = toLabelString(label);
}

inline void to_json(nlohmann::json &j, const ActionKind &kind)
{
    j = toActionString(kind);
}

inline void to_json(nlohmann::json &j, const Stage &stage)
{
    j = toStageString(stage);
}

inline void to_json(nlohmann::json &j, const OutcomeStatus &status)
{
    j = toStatusString(status);
}

inline void to_json(nlohmann::json &j, const InventoryItem &item)
{
    j = nlohmann::json{
        {"kind", item.kind},
        {"name", item.name},
        {"path", item.path},
        {"metadata", item.metadata}
    };
}

inline void to_json(nlohmann::json &j, const ClassificationResult &result)
{
    j = nlohmann::json{
        {"kind", result.item.kind},
        {"name", result.item.name},
        {"path", result.item.path},
        {"label", result.label},
        {"ruleId", result.ruleId}
    };
}

inline void to_json(nlohmann::json &j, const RemediationAction &action)
{
    j = nlohmann::json{
        {"action", action.kind},
        {"kind", action.item.kind},
        {"name", action.item.name},
        {"path", action.item.path},
        {"ruleId", action.ruleId},
        {"backupPath", action.backupPath}
    };
}

inline void to_json(nlohmann::json &j, const Outcome &outcome)
{
    j = nlohmann::json{
        {"step", outcome.step},
        {"subject", outcome.subject},
        {"status", outcome.status},
        {"reason", outcome.reason},
        {"detail", outcome.detail}
    };
}

inline void to_json(nlohmann::json &j, const RunReport &report)
{
    j = nlohmann::json{
        {"runId", report.runId},
        {"mode", toModeString(report.mode)},
        {"dryRun", report.dryRun},
        {"startedAt", toIso8601Utc(report.startedAt)},
        {"finishedAt", toIso8601Utc(report.finishedAt)},
        {"finalStage", report.finalStage},
        {"stages", report.stages},
        {"inventory", report.inventory},
        {"classifications", report.classifications},
        {"actions", report.actions},
        {"executedSteps", report.executedSteps},
        {"outcomes", report.outcomes},
        {"failures", report.failureCount()}
    };
}

} // namespace gpuscrub
