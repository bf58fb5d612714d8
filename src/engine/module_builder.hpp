#pragma once

#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"
#include "common/process_utils.hpp"

namespace gpuscrub {

struct ModuleBuildEntry {
    std::string name;
    std::string version;
    std::string kernel;
    std::string architecture;
    std::string state;
};

/**
 * Parse `dkms status`. Both layouts are accepted:
 *   amdgpu/6.7.0-1756574.24.04, 6.8.0-31-generic, x86_64: installed
 *   amdgpu, 6.7.0, 6.8.0-31-generic, x86_64: installed
 * Lines for a source-only registration ("amdgpu/6.7.0: added") carry no
 * kernel or architecture.
 */
std::vector<ModuleBuildEntry> parseDkmsStatus(const std::string &output);

class ModuleBuilder
{
public:
    explicit ModuleBuilder(CommandRunner &runner);

    bool isAvailable() const;

    // std::nullopt when dkms is absent or `dkms status` fails.
    std::optional<std::vector<ModuleBuildEntry>> status();

    // dkms remove -m <name> -v <version> --all
    Outcome remove(const std::string &step, const std::string &name, const std::string &version);

private:
    CommandRunner &m_runner;
};

} // namespace gpuscrub
