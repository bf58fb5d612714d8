#include "engine/restorer.hpp"

#include <algorithm>
#include <iterator>
#include <optional>

#include <QDir>
#include <QFile>
#include <QFileInfo>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "engine/error_policy.hpp"

namespace gpuscrub {

namespace {

const std::string kRestoreRefresh = "restore-refresh";
const std::string kForeignArchitecture = "enable-foreign-architecture";
const std::string kInstallStock = "install-stock-packages";
const std::string kInitramfs = "regenerate-initramfs";
const std::string kBootloader = "update-bootloader";
const std::string kModulePreference = "write-module-preference";
const std::string kGlAlternatives = "reset-gl-alternatives";
const std::string kTidy = "tidy";
const std::string kLoadModule = "load-driver-module";

const QString kComponent = QStringLiteral("Restorer");

bool hasConfigFiles(const std::vector<RestorationTarget> &targets)
{
    return std::any_of(targets.begin(), targets.end(), [](const RestorationTarget &target) {
        return target.kind == RestorationKind::ConfigFile;
    });
}

} // namespace

std::string expandKernel(const std::string &name, const std::string &kernelRelease)
{
    static const std::string placeholder = "{kernel}";
    std::string out = name;
    std::size_t pos = 0;
    while ((pos = out.find(placeholder, pos)) != std::string::npos) {
        out.replace(pos, placeholder.size(), kernelRelease);
        pos += kernelRelease.size();
    }
    return out;
}

std::vector<std::pair<std::string, std::vector<std::string>>> packageBatches(
    const std::vector<RestorationTarget> &targets)
{
    std::vector<std::pair<std::string, std::vector<std::string>>> batches;
    for (const auto &target : targets) {
        if (target.kind != RestorationKind::Package) {
            continue;
        }
        auto it = std::find_if(batches.begin(), batches.end(), [&](const auto &batch) {
            return batch.first == target.batch;
        });
        if (it == batches.end()) {
            batches.push_back({target.batch, {}});
            it = std::prev(batches.end());
        }
        it->second.push_back(target.name);
    }
    return batches;
}

Restorer::Restorer(const HostLayout &layout,
                   PackageManager &packages,
                   HostTools &tools,
                   const RestorationPlan &plan)
    : m_layout(layout)
    , m_packages(packages)
    , m_tools(tools)
    , m_plan(plan)
{
}

void Restorer::declareSteps(Pipeline &pipeline)
{
    pipeline.addStep(kRestoreRefresh, Stage::Restoring, {}, [this]() { return refresh(); });

    std::vector<std::string> installDependsOn = {kRestoreRefresh};
    if (!m_plan.foreignArchitecture.empty()) {
        pipeline.addStep(kForeignArchitecture, Stage::Restoring, {kRestoreRefresh},
                         [this]() { return enableForeignArchitecture(); });
        installDependsOn.push_back(kForeignArchitecture);
    }
    pipeline.addStep(kInstallStock, Stage::Restoring, installDependsOn,
                     [this]() { return installStockPackages(); });

    // Boot artifacts are rebuilt against the reinstalled kernel packages.
    std::string previous = kInstallStock;
    if (m_plan.regenerateInitramfs) {
        pipeline.addStep(kInitramfs, Stage::Restoring, {previous},
                         [this]() { return regenerateInitramfs(); });
        previous = kInitramfs;
    }
    if (m_plan.updateBootloader) {
        pipeline.addStep(kBootloader, Stage::Restoring, {previous},
                         [this]() { return updateBootloader(); });
        previous = kBootloader;
    }
    if (hasConfigFiles(m_plan.targets)) {
        pipeline.addStep(kModulePreference, Stage::Restoring, {kInstallStock},
                         [this]() { return writeModulePreference(); });
        previous = kModulePreference;
    }
    if (m_plan.resetGlAlternatives) {
        pipeline.addStep(kGlAlternatives, Stage::Restoring, {kInstallStock},
                         [this]() { return resetGlAlternatives(); });
        previous = kGlAlternatives;
    }
    if (m_plan.tidy) {
        pipeline.addStep(kTidy, Stage::Restoring, {previous}, [this]() { return tidy(); });
        previous = kTidy;
    }
    if (!m_plan.driverModule.empty()) {
        pipeline.addStep(kLoadModule, Stage::Restoring, {previous},
                         [this]() { return loadDriverModule(); });
    }
}

std::vector<Outcome> Restorer::refresh()
{
    logging::announce(kComponent, QStringLiteral("Refreshing package lists"));
    return {m_packages.update(kRestoreRefresh)};
}

std::vector<Outcome> Restorer::enableForeignArchitecture()
{
    const std::string &architecture = m_plan.foreignArchitecture;
    const auto enabled = m_packages.foreignArchitectures();
    if (enabled && std::find(enabled->begin(), enabled->end(), architecture) != enabled->end()) {
        return {skipped(kForeignArchitecture, architecture, "already enabled")};
    }

    logging::announce(kComponent,
                      QStringLiteral("Enabling %1 architecture")
                          .arg(QString::fromStdString(architecture)));
    std::vector<Outcome> outcomes;
    outcomes.push_back(m_packages.addArchitecture(kForeignArchitecture, architecture));
    outcomes.push_back(m_packages.update(kForeignArchitecture));
    return outcomes;
}

std::vector<Outcome> Restorer::installStockPackages()
{
    std::vector<Outcome> outcomes;
    std::optional<std::string> kernel;
    bool kernelQueried = false;

    for (const auto &[batch, names] : packageBatches(m_plan.targets)) {
        std::vector<std::string> packages;
        for (const auto &name : names) {
            if (name.find("{kernel}") == std::string::npos) {
                packages.push_back(name);
                continue;
            }
            if (!kernelQueried) {
                kernel = m_tools.runningKernel();
                kernelQueried = true;
            }
            if (!kernel) {
                Outcome outcome = skipped(kInstallStock, name, "running kernel release unknown");
                logOutcome(kComponent, outcome);
                outcomes.push_back(outcome);
                continue;
            }
            packages.push_back(expandKernel(name, *kernel));
        }
        if (packages.empty()) {
            continue;
        }

        QStringList list;
        for (const auto &package : packages) {
            list.push_back(QString::fromStdString(package));
        }
        logging::announce(kComponent,
                          QStringLiteral("%1 %2 packages: %3")
                              .arg(m_plan.reinstall ? QStringLiteral("Reinstalling")
                                                    : QStringLiteral("Installing"),
                                   QString::fromStdString(batch),
                                   list.join(QChar(' '))));
        for (auto &outcome : m_packages.install(kInstallStock, packages, m_plan.reinstall)) {
            outcomes.push_back(std::move(outcome));
        }
    }
    return outcomes;
}

std::vector<Outcome> Restorer::regenerateInitramfs()
{
    logging::announce(kComponent, QStringLiteral("Regenerating initramfs for all kernels"));
    return {m_tools.regenerateInitramfs(kInitramfs)};
}

std::vector<Outcome> Restorer::updateBootloader()
{
    logging::announce(kComponent, QStringLiteral("Updating GRUB"));
    return {m_tools.updateBootloader(kBootloader)};
}

std::vector<Outcome> Restorer::writeModulePreference()
{
    std::vector<Outcome> outcomes;
    for (const auto &target : m_plan.targets) {
        if (target.kind != RestorationKind::ConfigFile) {
            continue;
        }

        const QString path = m_layout.path(QString::fromStdString(target.path));
        logging::announce(kComponent, QStringLiteral("Writing %1").arg(path));

        Outcome outcome;
        QFile file(path);
        if (!QDir().mkpath(QFileInfo(path).absolutePath())) {
            outcome = failed(kModulePreference, path.toStdString(),
                             FailureClass::FileOperationFailed, "cannot create parent directory");
        } else if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text)) {
            outcome = failed(kModulePreference, path.toStdString(),
                             FailureClass::FileOperationFailed, file.errorString().toStdString());
        } else {
            const QByteArray content = QByteArray::fromStdString(target.content);
            if (file.write(content) != content.size()) {
                outcome = failed(kModulePreference, path.toStdString(),
                                 FailureClass::FileOperationFailed,
                                 file.errorString().toStdString());
            } else {
                outcome = succeeded(kModulePreference, path.toStdString());
            }
            file.close();
        }
        logOutcome(kComponent, outcome);
        outcomes.push_back(outcome);
    }
    return outcomes;
}

std::vector<Outcome> Restorer::resetGlAlternatives()
{
    std::vector<Outcome> outcomes;
    for (const auto &alternative : m_plan.glAlternatives) {
        if (!m_tools.hasAlternative(alternative.name)) {
            outcomes.push_back(skipped(kGlAlternatives, alternative.name, "not registered"));
            continue;
        }
        const QString mesaConf = m_layout.path(QString::fromStdString(alternative.mesaConf));
        if (QFileInfo::exists(mesaConf)) {
            logging::announce(kComponent,
                              QStringLiteral("Pointing %1 at Mesa")
                                  .arg(QString::fromStdString(alternative.name)));
            outcomes.push_back(m_tools.setAlternative(kGlAlternatives, alternative.name,
                                                      alternative.mesaConf));
        } else {
            logging::announce(kComponent,
                              QStringLiteral("Returning %1 to automatic mode")
                                  .arg(QString::fromStdString(alternative.name)));
            outcomes.push_back(m_tools.autoAlternative(kGlAlternatives, alternative.name));
        }
    }
    outcomes.push_back(m_tools.ldconfig(kGlAlternatives));
    return outcomes;
}

std::vector<Outcome> Restorer::tidy()
{
    logging::announce(kComponent, QStringLiteral("Cleaning up leftover packages"));
    std::vector<Outcome> outcomes;
    outcomes.push_back(m_packages.autoremove(kTidy, true));
    outcomes.push_back(m_packages.autoclean(kTidy));
    outcomes.push_back(m_tools.ldconfig(kTidy));
    return outcomes;
}

std::vector<Outcome> Restorer::loadDriverModule()
{
    const Outcome loaded = m_tools.loadModule(kLoadModule, m_plan.driverModule);
    if (!loaded.failed()) {
        logging::announce(kComponent,
                          QStringLiteral("Loaded %1")
                              .arg(QString::fromStdString(m_plan.driverModule)));
        return {loaded};
    }
    // Expected inside chroots and while the old module is still in use;
    // the reboot loads it.
    logging::announce(kComponent,
                      QStringLiteral("%1 not loaded now; it will load on the next boot")
                          .arg(QString::fromStdString(m_plan.driverModule)));
    return {skipped(kLoadModule, m_plan.driverModule, loaded.reason)};
}

} // namespace gpuscrub
