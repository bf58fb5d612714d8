#include "engine/package_manager.hpp"

#include <sstream>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "engine/error_policy.hpp"

namespace gpuscrub {

namespace {

const QString kAptGet = QStringLiteral("apt-get");
const QString kDpkg = QStringLiteral("dpkg");
const QString kDpkgQuery = QStringLiteral("dpkg-query");

// Keep new maintainer config files and never prompt.
QStringList aptFlags()
{
    return {QStringLiteral("-y"),
            QStringLiteral("-o"), QStringLiteral("Dpkg::Options::=--force-confnew"),
            QStringLiteral("-o"), QStringLiteral("Dpkg::Options::=--force-confdef")};
}

QStringList toQStringList(const std::vector<std::string> &values)
{
    QStringList out;
    out.reserve(static_cast<int>(values.size()));
    for (const auto &value : values) {
        out.push_back(QString::fromStdString(value));
    }
    return out;
}

} // namespace

std::vector<InstalledPackage> parseDpkgQueryOutput(const std::string &output)
{
    std::vector<InstalledPackage> packages;
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        std::istringstream fields(line);
        InstalledPackage package;
        if (!(fields >> package.name >> package.status)) {
            continue;
        }
        if (package.status != "installed") {
            continue;
        }
        fields >> package.version >> package.architecture;
        packages.push_back(std::move(package));
    }
    return packages;
}

PackageManager::PackageManager(CommandRunner &runner)
    : m_runner(runner)
{
}

bool PackageManager::isAvailable() const
{
    return m_runner.hasProgram(kAptGet);
}

std::optional<std::vector<InstalledPackage>> PackageManager::queryInstalled()
{
    const QStringList args = {
        QStringLiteral("-W"),
        QStringLiteral("-f=${Package} ${db:Status-Status} ${Version} ${Architecture}\\n")};
    const CommandResult result = m_runner.run(kDpkgQuery, args);
    if (!result.ok()) {
        GSLOG_WARN(QStringLiteral("PackageManager"),
                   QStringLiteral("queryInstalled"),
                   QStringLiteral("package_query_failed"),
                   QStringLiteral("inventory"),
                   QStringLiteral("dpkg_query"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"exitCode", result.exitCode},
                                   {"stderr", result.stderrText}}));
        return std::nullopt;
    }
    return parseDpkgQueryOutput(result.stdoutText);
}

Outcome PackageManager::runAptGet(const std::string &step, const std::string &subject,
                                  const QStringList &arguments)
{
    const QStringList args = aptFlags() + arguments;
    const CommandResult result = m_runner.run(kAptGet, args);
    Outcome outcome = outcomeFromCommand(step, subject, kAptGet, args, result);
    logOutcome(QStringLiteral("PackageManager"), outcome);
    return outcome;
}

std::vector<Outcome> PackageManager::runBatch(const std::string &step, const QString &verb,
                                              const QStringList &verbFlags,
                                              const std::vector<std::string> &packages)
{
    std::vector<Outcome> outcomes;
    if (packages.empty()) {
        return outcomes;
    }

    // One call first so apt resolves ordering between the packages itself.
    const QStringList batchArgs = QStringList{verb} + verbFlags + toQStringList(packages);
    const Outcome batch = runAptGet(step, "batch", batchArgs);
    if (!batch.failed()) {
        for (const auto &name : packages) {
            outcomes.push_back(succeeded(step, name, batch.detail));
        }
        return outcomes;
    }

    GSLOG_WARN(QStringLiteral("PackageManager"),
               QStringLiteral("runBatch"),
               QStringLiteral("batch_failed_retrying_individually"),
               QStringLiteral("partial_state"),
               QStringLiteral("per_package_fallback"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"verb", verb.toStdString()},
                               {"packages", packages},
                               {"reason", batch.reason}}));

    if (packages.size() == 1) {
        Outcome single = batch;
        single.subject = packages.front();
        outcomes.push_back(single);
        return outcomes;
    }

    for (const auto &name : packages) {
        const QStringList args = QStringList{verb} + verbFlags
            + QStringList{QString::fromStdString(name)};
        outcomes.push_back(runAptGet(step, name, args));
    }
    return outcomes;
}

std::vector<Outcome> PackageManager::purge(const std::string &step,
                                           const std::vector<std::string> &packages)
{
    return runBatch(step, QStringLiteral("purge"), {}, packages);
}

std::vector<Outcome> PackageManager::install(const std::string &step,
                                             const std::vector<std::string> &packages,
                                             bool reinstall)
{
    QStringList flags;
    if (reinstall) {
        flags << QStringLiteral("--reinstall");
    }
    return runBatch(step, QStringLiteral("install"), flags, packages);
}

Outcome PackageManager::update(const std::string &step)
{
    return runAptGet(step, "update", {QStringLiteral("update")});
}

Outcome PackageManager::autoremove(const std::string &step, bool forced)
{
    QStringList args;
    if (forced) {
        args << QStringLiteral("-o") << QStringLiteral("APT::Get::AutomaticRemove=true");
    }
    args << QStringLiteral("autoremove") << QStringLiteral("--purge");
    return runAptGet(step, "autoremove", args);
}

Outcome PackageManager::autoclean(const std::string &step)
{
    return runAptGet(step, "autoclean", {QStringLiteral("autoclean")});
}

std::optional<std::vector<std::string>> PackageManager::foreignArchitectures()
{
    const CommandResult result =
        m_runner.run(kDpkg, {QStringLiteral("--print-foreign-architectures")});
    if (!result.ok()) {
        return std::nullopt;
    }
    std::vector<std::string> architectures;
    std::istringstream stream(result.stdoutText);
    std::string arch;
    while (stream >> arch) {
        architectures.push_back(arch);
    }
    return architectures;
}

Outcome PackageManager::addArchitecture(const std::string &step, const std::string &architecture)
{
    const QStringList args = {QStringLiteral("--add-architecture"),
                              QString::fromStdString(architecture)};
    const CommandResult result = m_runner.run(kDpkg, args);
    Outcome outcome = outcomeFromCommand(step, architecture, kDpkg, args, result);
    logOutcome(QStringLiteral("PackageManager"), outcome);
    return outcome;
}

} // namespace gpuscrub
