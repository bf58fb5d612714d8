#pragma once

#include <optional>
#include <string>

#include "common/models.hpp"
#include "common/process_utils.hpp"

namespace gpuscrub {

// Boot artifacts, kernel modules and the dynamic linker.
class HostTools
{
public:
    explicit HostTools(CommandRunner &runner);

    // uname -r
    std::optional<std::string> runningKernel();

    // update-initramfs -c -k all, then -u -k all if create is refused.
    Outcome regenerateInitramfs(const std::string &step);
    Outcome updateBootloader(const std::string &step);
    Outcome loadModule(const std::string &step, const std::string &module);

    bool hasAlternative(const std::string &name);
    Outcome setAlternative(const std::string &step, const std::string &name,
                           const std::string &path);
    Outcome autoAlternative(const std::string &step, const std::string &name);
    Outcome ldconfig(const std::string &step);

    Outcome reboot(const std::string &step);

private:
    Outcome runTool(const std::string &step, const std::string &subject,
                    const QString &program, const QStringList &arguments);

    CommandRunner &m_runner;
};

} // namespace gpuscrub
