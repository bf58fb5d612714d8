#pragma once

#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"
#include "common/process_utils.hpp"

namespace gpuscrub {

struct InstalledPackage {
    std::string name;
    std::string status;
    std::string version;
    std::string architecture;
};

/**
 * Parse `dpkg-query -W -f='${Package} ${db:Status-Status} ${Version} ${Architecture}\n'`.
 * Rows whose status is not "installed" (config-files, half-installed,
 * not-installed, ...) are dropped.
 */
std::vector<InstalledPackage> parseDpkgQueryOutput(const std::string &output);

/**
 * apt-get / dpkg front end. Batch operations fall back to one call per
 * package when the batch fails, so one missing or broken package cannot
 * hide the others; the returned outcomes are per package.
 */
class PackageManager
{
public:
    explicit PackageManager(CommandRunner &runner);

    bool isAvailable() const;

    // std::nullopt when dpkg-query cannot be run.
    std::optional<std::vector<InstalledPackage>> queryInstalled();

    std::vector<Outcome> purge(const std::string &step, const std::vector<std::string> &packages);
    std::vector<Outcome> install(const std::string &step, const std::vector<std::string> &packages,
                                 bool reinstall);

    Outcome update(const std::string &step);
    // forced adds -o APT::Get::AutomaticRemove=true.
    Outcome autoremove(const std::string &step, bool forced);
    Outcome autoclean(const std::string &step);

    std::optional<std::vector<std::string>> foreignArchitectures();
    Outcome addArchitecture(const std::string &step, const std::string &architecture);

private:
    std::vector<Outcome> runBatch(const std::string &step, const QString &verb,
                                  const QStringList &verbFlags,
                                  const std::vector<std::string> &packages);
    Outcome runAptGet(const std::string &step, const std::string &subject,
                      const QStringList &arguments);

    CommandRunner &m_runner;
};

} // namespace gpuscrub
