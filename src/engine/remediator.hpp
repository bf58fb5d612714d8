#pragma once

#include <string>
#include <vector>

#include "common/host_layout.hpp"
#include "common/models.hpp"
#include "engine/module_builder.hpp"
#include "engine/package_manager.hpp"
#include "engine/pipeline.hpp"

namespace gpuscrub {

/**
 * One action per Foreign result, none for Stock. Backup paths are fixed
 * here: repository sources, pins and modprobe overrides are renamed in
 * place to "<file>.disabled.<timestamp>"; repository keys, Vulkan ICDs and
 * OpenCL vendor files move under the backup root. A name already taken on
 * disk gets a ".N" suffix.
 */
std::vector<RemediationAction> planRemediation(const std::vector<ClassificationResult> &results,
                                               const HostLayout &layout,
                                               const std::string &timestamp);

class Remediator
{
public:
    Remediator(const HostLayout &layout,
               PackageManager &packages,
               ModuleBuilder &modules,
               const std::string &timestamp);

    // Appends the remediation steps, in their fixed order, to `pipeline`.
    void declareSteps(Pipeline &pipeline, const std::vector<RemediationAction> &actions);

    std::vector<Outcome> backupSources();
    std::vector<Outcome> renameInPlace(const std::string &step,
                                       const std::vector<RemediationAction> &actions);
    // Autoremove runs only when the plan removes something.
    std::vector<Outcome> refreshMetadata(const std::string &step, bool autoremove,
                                         bool forcedAutoremove);
    std::vector<Outcome> purgePackages(const std::vector<RemediationAction> &actions);
    std::vector<Outcome> deregisterModuleBuilds(const std::vector<RemediationAction> &actions);
    std::vector<Outcome> quarantineAndRemove(const std::vector<RemediationAction> &actions);

private:
    Outcome moveToBackup(const std::string &step, const RemediationAction &action);
    Outcome removeDirectory(const std::string &step, const RemediationAction &action);

    const HostLayout &m_layout;
    PackageManager &m_packages;
    ModuleBuilder &m_modules;
    std::string m_timestamp;
};

// Package argument for apt: "name:arch" unless the package is
// architecture-independent.
std::string packageSpec(const InventoryItem &item);

} // namespace gpuscrub
