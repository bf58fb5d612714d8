#pragma once

#include <vector>

#include "common/host_layout.hpp"
#include "common/models.hpp"
#include "engine/module_builder.hpp"
#include "engine/package_manager.hpp"
#include "engine/rule_policy.hpp"

namespace gpuscrub {

/**
 * Read-only snapshot of everything the classifier may need to look at.
 *
 * Each category is collected independently; a failing query or a missing
 * directory yields an empty category and a warning, never an abort.
 * Files already renamed with a ".disabled." marker are skipped so a second
 * run does not pick up its own backups.
 */
class InventoryCollector
{
public:
    InventoryCollector(const HostLayout &layout,
                       PackageManager &packages,
                       ModuleBuilder &modules,
                       const RulePolicy &policy);

    std::vector<InventoryItem> collect();

    std::vector<InventoryItem> collectPackages();
    std::vector<InventoryItem> collectRepositorySources();
    std::vector<InventoryItem> collectPinRules();
    std::vector<InventoryItem> collectRepositoryKeys();
    std::vector<InventoryItem> collectModuleBuilds();
    std::vector<InventoryItem> collectModuleConfigFiles();
    std::vector<InventoryItem> collectVendorDirectories();
    std::vector<InventoryItem> collectCacheDirectories();
    std::vector<InventoryItem> collectVulkanIcds();
    std::vector<InventoryItem> collectOpenClVendors();

private:
    const HostLayout &m_layout;
    PackageManager &m_packages;
    ModuleBuilder &m_modules;
    const RulePolicy &m_policy;
};

} // namespace gpuscrub
