#pragma once

#include <string>
#include <utility>
#include <vector>

#include "common/host_layout.hpp"
#include "common/models.hpp"
#include "engine/host_tools.hpp"
#include "engine/package_manager.hpp"
#include "engine/pipeline.hpp"
#include "engine/rule_policy.hpp"

namespace gpuscrub {

/**
 * Brings the host back to the stock driver stack described by a
 * RestorationPlan: package refresh and reinstall, boot artifacts, the
 * amdgpu module preference and the GL alternatives.
 *
 * Only the steps the plan asks for are declared. Every step records its
 * failures and lets the next one run.
 */
class Restorer
{
public:
    Restorer(const HostLayout &layout,
             PackageManager &packages,
             HostTools &tools,
             const RestorationPlan &plan);

    void declareSteps(Pipeline &pipeline);

    std::vector<Outcome> refresh();
    std::vector<Outcome> enableForeignArchitecture();
    std::vector<Outcome> installStockPackages();
    std::vector<Outcome> regenerateInitramfs();
    std::vector<Outcome> updateBootloader();
    std::vector<Outcome> writeModulePreference();
    std::vector<Outcome> resetGlAlternatives();
    std::vector<Outcome> tidy();
    std::vector<Outcome> loadDriverModule();

private:
    const HostLayout &m_layout;
    PackageManager &m_packages;
    HostTools &m_tools;
    const RestorationPlan &m_plan;
};

// Package targets grouped by batch, batches in first-seen order.
std::vector<std::pair<std::string, std::vector<std::string>>> packageBatches(
    const std::vector<RestorationTarget> &targets);

// Replaces "{kernel}" in `name` with `kernelRelease`.
std::string expandKernel(const std::string &name, const std::string &kernelRelease);

} // namespace gpuscrub
