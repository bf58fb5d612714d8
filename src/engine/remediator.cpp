#include "engine/remediator.hpp"

#include <filesystem>
#include <system_error>

#include <QDir>
#include <QFile>
#include <QFileInfo>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "engine/error_policy.hpp"

namespace gpuscrub {

namespace {

const std::string kBackupSources = "backup-sources";
const std::string kDisableSources = "disable-sources";
const std::string kRemovePins = "remove-pins";
const std::string kRefreshMetadata = "refresh-metadata";
const std::string kPurgePackages = "purge-packages";
const std::string kDeregisterModules = "deregister-module-builds";
const std::string kQuarantineFiles = "quarantine-files";
const std::string kRefreshMetadataAgain = "refresh-metadata-again";

QString uniquePath(const QString &candidate)
{
    if (!QFileInfo::exists(candidate)) {
        return candidate;
    }
    for (int n = 1;; ++n) {
        const QString next = candidate + QStringLiteral(".%1").arg(n);
        if (!QFileInfo::exists(next)) {
            return next;
        }
    }
}

QString disabledName(const QString &fileName, const std::string &timestamp)
{
    return fileName + QStringLiteral(".disabled.") + QString::fromStdString(timestamp);
}

std::string inPlaceBackup(const InventoryItem &item, const std::string &timestamp)
{
    return uniquePath(disabledName(QString::fromStdString(item.path), timestamp)).toStdString();
}

std::string backupDirFor(ItemKind kind)
{
    switch (kind) {
    case ItemKind::RepositoryKey:
        return "apt-keys-bak";
    case ItemKind::VulkanICD:
        return "vulkan-icd-bak";
    case ItemKind::OpenCLVendorFile:
        return "opencl-vendors-bak";
    default:
        return {};
    }
}

std::string quarantineBackup(const InventoryItem &item, const HostLayout &layout,
                             const std::string &timestamp)
{
    const QString dir = layout.backupPath(QString::fromStdString(backupDirFor(item.kind)));
    const QString target = dir + QChar('/')
        + disabledName(QString::fromStdString(item.name), timestamp);
    return uniquePath(target).toStdString();
}

std::vector<RemediationAction> ofKind(const std::vector<RemediationAction> &actions,
                                      std::initializer_list<ActionKind> kinds)
{
    std::vector<RemediationAction> selected;
    for (const auto &action : actions) {
        for (ActionKind kind : kinds) {
            if (action.kind == kind) {
                selected.push_back(action);
                break;
            }
        }
    }
    return selected;
}

void append(std::vector<Outcome> &into, std::vector<Outcome> more)
{
    for (auto &outcome : more) {
        into.push_back(std::move(outcome));
    }
}

QString announcementFor(const RemediationAction &action)
{
    const QString path = QString::fromStdString(action.item.path);
    switch (action.item.kind) {
    case ItemKind::RepositorySource:
        return QStringLiteral("Disabling repo: %1").arg(path);
    case ItemKind::PinRule:
        return QStringLiteral("Removing APT pin: %1").arg(path);
    case ItemKind::RepositoryKey:
        return QStringLiteral("Quarantining repository key: %1").arg(path);
    case ItemKind::ModuleConfigFile:
        return QStringLiteral("Disabling modprobe override: %1").arg(path);
    case ItemKind::VulkanICD:
        return QStringLiteral("Quarantining ICD: %1").arg(path);
    case ItemKind::OpenCLVendorFile:
        return QStringLiteral("Quarantining OpenCL ICD: %1").arg(path);
    default:
        return QStringLiteral("Moving %1").arg(path);
    }
}

} // namespace

std::string packageSpec(const InventoryItem &item)
{
    std::string architecture;
    if (item.metadata.is_object()) {
        architecture = item.metadata.value("architecture", "");
    }
    if (architecture.empty() || architecture == "all") {
        return item.name;
    }
    return item.name + ":" + architecture;
}

std::vector<RemediationAction> planRemediation(const std::vector<ClassificationResult> &results,
                                               const HostLayout &layout,
                                               const std::string &timestamp)
{
    std::vector<RemediationAction> actions;
    for (const auto &result : results) {
        if (result.label != Label::Foreign) {
            continue;
        }

        RemediationAction action;
        action.item = result.item;
        action.ruleId = result.ruleId;
        switch (result.item.kind) {
        case ItemKind::Package:
            action.kind = ActionKind::PurgePackage;
            break;
        case ItemKind::RepositorySource:
            action.kind = ActionKind::DisableSource;
            action.backupPath = inPlaceBackup(result.item, timestamp);
            break;
        case ItemKind::PinRule:
            action.kind = ActionKind::RemovePin;
            action.backupPath = inPlaceBackup(result.item, timestamp);
            break;
        case ItemKind::ModuleBuild:
            action.kind = ActionKind::DeregisterModuleBuild;
            break;
        case ItemKind::ModuleConfigFile:
            action.kind = ActionKind::QuarantineFile;
            action.backupPath = inPlaceBackup(result.item, timestamp);
            break;
        case ItemKind::RepositoryKey:
        case ItemKind::VulkanICD:
        case ItemKind::OpenCLVendorFile:
            action.kind = ActionKind::QuarantineFile;
            action.backupPath = quarantineBackup(result.item, layout, timestamp);
            break;
        case ItemKind::VendorDirectory:
        case ItemKind::CacheDirectory:
            action.kind = ActionKind::RemoveDirectory;
            break;
        }
        actions.push_back(std::move(action));
    }
    return actions;
}

Remediator::Remediator(const HostLayout &layout,
                       PackageManager &packages,
                       ModuleBuilder &modules,
                       const std::string &timestamp)
    : m_layout(layout)
    , m_packages(packages)
    , m_modules(modules)
    , m_timestamp(timestamp)
{
}

void Remediator::declareSteps(Pipeline &pipeline, const std::vector<RemediationAction> &actions)
{
    const auto sources = ofKind(actions, {ActionKind::DisableSource});
    const auto pins = ofKind(actions, {ActionKind::RemovePin});
    const auto purges = ofKind(actions, {ActionKind::PurgePackage});
    const auto modules = ofKind(actions, {ActionKind::DeregisterModuleBuild});
    const auto files = ofKind(actions, {ActionKind::QuarantineFile, ActionKind::RemoveDirectory});
    const bool autoremove = !actions.empty();

    pipeline.addStep(kBackupSources, Stage::Remediating, {},
                     [this]() { return backupSources(); });
    pipeline.addStep(kDisableSources, Stage::Remediating, {kBackupSources},
                     [this, sources]() { return renameInPlace(kDisableSources, sources); });
    pipeline.addStep(kRemovePins, Stage::Remediating, {kDisableSources},
                     [this, pins]() { return renameInPlace(kRemovePins, pins); });
    // The purge must see package lists without the vendor repositories.
    pipeline.addStep(kRefreshMetadata, Stage::Remediating, {kDisableSources, kRemovePins},
                     [this, autoremove]() {
                         return refreshMetadata(kRefreshMetadata, autoremove, false);
                     });
    pipeline.addStep(kPurgePackages, Stage::Remediating, {kRefreshMetadata},
                     [this, purges]() { return purgePackages(purges); });
    pipeline.addStep(kDeregisterModules, Stage::Remediating, {kPurgePackages},
                     [this, modules]() { return deregisterModuleBuilds(modules); });
    pipeline.addStep(kQuarantineFiles, Stage::Remediating, {kDeregisterModules},
                     [this, files]() { return quarantineAndRemove(files); });
    pipeline.addStep(kRefreshMetadataAgain, Stage::Remediating, {kQuarantineFiles},
                     [this, autoremove]() {
                         return refreshMetadata(kRefreshMetadataAgain, autoremove, true);
                     });
}

std::vector<Outcome> Remediator::backupSources()
{
    std::vector<Outcome> outcomes;
    int copied = 0;

    const QString sourcesList = m_layout.path(QStringLiteral("/etc/apt/sources.list"));
    if (QFileInfo::exists(sourcesList)) {
        const QString target = uniquePath(sourcesList + QStringLiteral(".bak-")
                                          + QString::fromStdString(m_timestamp));
        if (QFile::copy(sourcesList, target)) {
            ++copied;
        } else {
            outcomes.push_back(failed(kBackupSources, sourcesList.toStdString(),
                                      FailureClass::FileOperationFailed,
                                      "copy to " + target.toStdString() + " failed"));
        }
    }

    const QString sourcesDir = m_layout.path(QStringLiteral("/etc/apt/sources.list.d"));
    const QString backupDir = m_layout.path(QStringLiteral("/etc/apt/sources.list.d.bak"));
    const QFileInfoList entries = QDir(sourcesDir).entryInfoList(QDir::Files, QDir::Name);
    if (!entries.isEmpty() && !QDir().mkpath(backupDir)) {
        outcomes.push_back(failed(kBackupSources, backupDir.toStdString(),
                                  FailureClass::FileOperationFailed, "cannot create directory"));
        return outcomes;
    }
    for (const QFileInfo &info : entries) {
        const QString target = backupDir + QChar('/') + info.fileName();
        QFile::remove(target);
        if (QFile::copy(info.absoluteFilePath(), target)) {
            ++copied;
        } else {
            outcomes.push_back(failed(kBackupSources, info.absoluteFilePath().toStdString(),
                                      FailureClass::FileOperationFailed,
                                      "copy to " + target.toStdString() + " failed"));
        }
    }

    if (copied > 0) {
        logging::announce(QStringLiteral("Remediator"),
                          QStringLiteral("Backed up %1 APT source file(s) to %2")
                              .arg(copied)
                              .arg(backupDir));
    }
    outcomes.push_back(succeeded(kBackupSources, "apt-sources",
                                 std::to_string(copied) + " file(s) copied"));
    for (const auto &outcome : outcomes) {
        logOutcome(QStringLiteral("Remediator"), outcome);
    }
    return outcomes;
}

std::vector<Outcome> Remediator::renameInPlace(const std::string &step,
                                               const std::vector<RemediationAction> &actions)
{
    std::vector<Outcome> outcomes;
    for (const auto &action : actions) {
        outcomes.push_back(moveToBackup(step, action));
    }
    return outcomes;
}

Outcome Remediator::moveToBackup(const std::string &step, const RemediationAction &action)
{
    const QString source = QString::fromStdString(action.item.path);
    const QString target = QString::fromStdString(action.backupPath);

    Outcome outcome;
    if (!QFileInfo::exists(source)) {
        outcome = skipped(step, action.item.path, "already absent");
        logOutcome(QStringLiteral("Remediator"), outcome);
        return outcome;
    }

    logging::announce(QStringLiteral("Remediator"), announcementFor(action));

    const QString targetDir = QFileInfo(target).absolutePath();
    if (!QDir().mkpath(targetDir)) {
        outcome = failed(step, action.item.path, FailureClass::FileOperationFailed,
                         "cannot create " + targetDir.toStdString());
    } else if (!QFile::rename(source, target)) {
        outcome = failed(step, action.item.path, FailureClass::FileOperationFailed,
                         "rename to " + action.backupPath + " failed");
    } else {
        outcome = succeeded(step, action.item.path, action.backupPath);
    }
    logOutcome(QStringLiteral("Remediator"), outcome);
    return outcome;
}

Outcome Remediator::removeDirectory(const std::string &step, const RemediationAction &action)
{
    const std::filesystem::path path(action.item.path);
    std::error_code error;
    Outcome outcome;
    if (!std::filesystem::exists(std::filesystem::symlink_status(path, error))) {
        outcome = skipped(step, action.item.path, "already absent");
        logOutcome(QStringLiteral("Remediator"), outcome);
        return outcome;
    }

    logging::announce(QStringLiteral("Remediator"),
                      QStringLiteral("Removing directory: %1")
                          .arg(QString::fromStdString(action.item.path)));

    // A symlinked vendor dir (/opt/rocm -> /opt/rocm-6.x) is removed as a
    // link; the versioned tree is an inventory item of its own.
    std::filesystem::remove_all(path, error);
    if (error) {
        outcome = failed(step, action.item.path, FailureClass::FileOperationFailed,
                         error.message());
    } else {
        outcome = succeeded(step, action.item.path);
    }
    logOutcome(QStringLiteral("Remediator"), outcome);
    return outcome;
}

std::vector<Outcome> Remediator::refreshMetadata(const std::string &step, bool autoremove,
                                                 bool forcedAutoremove)
{
    std::vector<Outcome> outcomes;
    if (autoremove) {
        outcomes.push_back(m_packages.autoremove(step, false));
    }
    outcomes.push_back(m_packages.autoclean(step));
    outcomes.push_back(m_packages.update(step));
    if (autoremove && forcedAutoremove) {
        outcomes.push_back(m_packages.autoremove(step, true));
    }
    return outcomes;
}

std::vector<Outcome> Remediator::purgePackages(const std::vector<RemediationAction> &actions)
{
    if (actions.empty()) {
        logging::announce(QStringLiteral("Remediator"),
                          QStringLiteral("No matching third-party packages found."));
        return {};
    }

    std::vector<std::string> specs;
    QStringList names;
    for (const auto &action : actions) {
        specs.push_back(packageSpec(action.item));
        names.push_back(QString::fromStdString(specs.back()));
    }
    logging::announce(QStringLiteral("Remediator"),
                      QStringLiteral("Purging: %1").arg(names.join(QChar(' '))));
    return m_packages.purge(kPurgePackages, specs);
}

std::vector<Outcome> Remediator::deregisterModuleBuilds(const std::vector<RemediationAction> &actions)
{
    std::vector<Outcome> outcomes;
    for (const auto &action : actions) {
        const std::string version = action.item.metadata.value("version", "");
        logging::announce(QStringLiteral("Remediator"),
                          QStringLiteral("dkms remove -m %1 -v %2 --all")
                              .arg(QString::fromStdString(action.item.name),
                                   QString::fromStdString(version)));
        outcomes.push_back(m_modules.remove(kDeregisterModules, action.item.name, version));
    }
    return outcomes;
}

std::vector<Outcome> Remediator::quarantineAndRemove(const std::vector<RemediationAction> &actions)
{
    std::vector<Outcome> outcomes;
    for (const auto &action : actions) {
        if (action.kind == ActionKind::RemoveDirectory) {
            outcomes.push_back(removeDirectory(kQuarantineFiles, action));
        } else {
            outcomes.push_back(moveToBackup(kQuarantineFiles, action));
        }
    }
    return outcomes;
}

} // namespace gpuscrub
