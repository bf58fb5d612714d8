#include "engine/inventory_collector.hpp"

#include <optional>
#include <set>
#include <utility>

#include <QDir>
#include <QFile>
#include <QFileInfo>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace gpuscrub {

namespace {

const QString kDisabledMarker = QStringLiteral(".disabled.");

bool isOwnBackup(const QString &fileName)
{
    return fileName.contains(kDisabledMarker);
}

// Entries of `dir` matching `filters`, sorted by name. A missing directory
// is an empty category.
QFileInfoList listEntries(const QString &dir, const QStringList &filters, QDir::Filters kinds)
{
    QDir directory(dir);
    if (!directory.exists()) {
        GSLOG_DEBUG(QStringLiteral("InventoryCollector"),
                    QStringLiteral("listEntries"),
                    QStringLiteral("directory_missing"),
                    QStringLiteral("inventory"),
                    QStringLiteral("qdir"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"dir", dir.toStdString()}}));
        return {};
    }
    return directory.entryInfoList(filters, kinds | QDir::NoDotAndDotDot, QDir::Name);
}

std::optional<std::string> readText(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        GSLOG_WARN(QStringLiteral("InventoryCollector"),
                   QStringLiteral("readText"),
                   QStringLiteral("file_unreadable"),
                   QStringLiteral("inventory"),
                   QStringLiteral("qfile"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"path", path.toStdString()},
                                   {"error", file.errorString().toStdString()}}));
        return std::nullopt;
    }
    return QString::fromUtf8(file.readAll()).toStdString();
}

InventoryItem fileItem(ItemKind kind, const QFileInfo &info)
{
    InventoryItem item;
    item.kind = kind;
    item.name = info.fileName().toStdString();
    item.path = info.absoluteFilePath().toStdString();
    return item;
}

// Source and pin files are classified by content.
InventoryItem fileItemWithContent(ItemKind kind, const QFileInfo &info)
{
    InventoryItem item = fileItem(kind, info);
    const auto content = readText(info.absoluteFilePath());
    item.metadata["content"] = content.value_or("");
    item.metadata["readable"] = content.has_value();
    return item;
}

std::string trimmed(const std::string &value)
{
    return QString::fromStdString(value).trimmed().toStdString();
}

void logCategory(const char *category, std::size_t count)
{
    GSLOG_DEBUG(QStringLiteral("InventoryCollector"),
                QStringLiteral("collect"),
                QStringLiteral("category_collected"),
                QStringLiteral("inventory"),
                QStringLiteral("read_only_scan"),
                logging::defaultWho(),
                QString(),
                (nlohmann::json{{"category", category}, {"items", count}}));
}

} // namespace

InventoryCollector::InventoryCollector(const HostLayout &layout,
                                       PackageManager &packages,
                                       ModuleBuilder &modules,
                                       const RulePolicy &policy)
    : m_layout(layout)
    , m_packages(packages)
    , m_modules(modules)
    , m_policy(policy)
{
}

std::vector<InventoryItem> InventoryCollector::collect()
{
    using Collector = std::vector<InventoryItem> (InventoryCollector::*)();
    const std::pair<ItemKind, Collector> categories[] = {
        {ItemKind::Package, &InventoryCollector::collectPackages},
        {ItemKind::RepositorySource, &InventoryCollector::collectRepositorySources},
        {ItemKind::PinRule, &InventoryCollector::collectPinRules},
        {ItemKind::RepositoryKey, &InventoryCollector::collectRepositoryKeys},
        {ItemKind::ModuleBuild, &InventoryCollector::collectModuleBuilds},
        {ItemKind::ModuleConfigFile, &InventoryCollector::collectModuleConfigFiles},
        {ItemKind::VendorDirectory, &InventoryCollector::collectVendorDirectories},
        {ItemKind::CacheDirectory, &InventoryCollector::collectCacheDirectories},
        {ItemKind::VulkanICD, &InventoryCollector::collectVulkanIcds},
        {ItemKind::OpenCLVendorFile, &InventoryCollector::collectOpenClVendors},
    };

    std::vector<InventoryItem> items;
    for (const auto &[kind, collector] : categories) {
        if (!m_policy.collects(kind)) {
            continue;
        }
        std::vector<InventoryItem> found = (this->*collector)();
        logCategory(toKindString(kind).c_str(), found.size());
        for (auto &item : found) {
            items.push_back(std::move(item));
        }
    }

    GSLOG_INFO(QStringLiteral("InventoryCollector"),
               QStringLiteral("collect"),
               QStringLiteral("inventory_complete"),
               QStringLiteral("collecting_stage"),
               QStringLiteral("read_only_scan"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"items", items.size()},
                               {"root", m_layout.root().toStdString()}}));
    return items;
}

std::vector<InventoryItem> InventoryCollector::collectPackages()
{
    std::vector<InventoryItem> items;
    const auto installed = m_packages.queryInstalled();
    if (!installed.has_value()) {
        return items;
    }

    std::set<std::pair<std::string, std::string>> seen;
    for (const auto &package : *installed) {
        if (!seen.insert({package.name, package.architecture}).second) {
            continue;
        }
        InventoryItem item;
        item.kind = ItemKind::Package;
        item.name = package.name;
        item.metadata = nlohmann::json{{"status", package.status},
                                       {"version", package.version},
                                       {"architecture", package.architecture}};
        items.push_back(std::move(item));
    }
    return items;
}

std::vector<InventoryItem> InventoryCollector::collectRepositorySources()
{
    std::vector<InventoryItem> items;
    const QFileInfoList entries =
        listEntries(m_layout.path(QStringLiteral("/etc/apt/sources.list.d")),
                    {QStringLiteral("*.list"), QStringLiteral("*.sources")}, QDir::Files);
    for (const QFileInfo &info : entries) {
        if (isOwnBackup(info.fileName())) {
            continue;
        }
        items.push_back(fileItemWithContent(ItemKind::RepositorySource, info));
    }
    return items;
}

std::vector<InventoryItem> InventoryCollector::collectPinRules()
{
    std::vector<InventoryItem> items;
    const QFileInfoList entries =
        listEntries(m_layout.path(QStringLiteral("/etc/apt/preferences.d")), {}, QDir::Files);
    for (const QFileInfo &info : entries) {
        // apt only reads extension-less files and *.pref here.
        const QString suffix = info.suffix();
        if (isOwnBackup(info.fileName())
            || (!suffix.isEmpty() && suffix != QStringLiteral("pref"))) {
            continue;
        }
        items.push_back(fileItemWithContent(ItemKind::PinRule, info));
    }
    return items;
}

std::vector<InventoryItem> InventoryCollector::collectRepositoryKeys()
{
    std::vector<InventoryItem> items;
    const QFileInfoList entries =
        listEntries(m_layout.path(QStringLiteral("/etc/apt/trusted.gpg.d")), {}, QDir::Files);
    for (const QFileInfo &info : entries) {
        if (isOwnBackup(info.fileName())) {
            continue;
        }
        items.push_back(fileItem(ItemKind::RepositoryKey, info));
    }
    return items;
}

std::vector<InventoryItem> InventoryCollector::collectModuleBuilds()
{
    std::vector<InventoryItem> items;
    const auto entries = m_modules.status();
    if (!entries.has_value()) {
        return items;
    }

    // dkms lists one line per kernel; removal is per (module, version).
    std::set<std::pair<std::string, std::string>> seen;
    for (const auto &entry : *entries) {
        if (!seen.insert({entry.name, entry.version}).second) {
            continue;
        }
        InventoryItem item;
        item.kind = ItemKind::ModuleBuild;
        item.name = entry.name;
        item.metadata = nlohmann::json{{"version", entry.version},
                                       {"kernel", entry.kernel},
                                       {"state", entry.state}};
        items.push_back(std::move(item));
    }
    return items;
}

std::vector<InventoryItem> InventoryCollector::collectModuleConfigFiles()
{
    std::vector<InventoryItem> items;
    const QFileInfoList entries =
        listEntries(m_layout.path(QStringLiteral("/etc/modprobe.d")),
                    {QStringLiteral("*.conf")}, QDir::Files);
    for (const QFileInfo &info : entries) {
        items.push_back(fileItem(ItemKind::ModuleConfigFile, info));
    }
    return items;
}

std::vector<InventoryItem> InventoryCollector::collectVendorDirectories()
{
    std::vector<InventoryItem> items;
    const QFileInfoList entries =
        listEntries(m_layout.path(QStringLiteral("/opt")), {}, QDir::Dirs);
    for (const QFileInfo &info : entries) {
        InventoryItem item = fileItem(ItemKind::VendorDirectory, info);
        item.metadata["symlink"] = info.isSymLink();
        items.push_back(std::move(item));
    }
    return items;
}

std::vector<InventoryItem> InventoryCollector::collectCacheDirectories()
{
    std::vector<InventoryItem> items;

    QStringList homes;
    for (const QFileInfo &info :
         listEntries(m_layout.path(QStringLiteral("/home")), {}, QDir::Dirs)) {
        homes.push_back(info.absoluteFilePath());
    }
    homes.push_back(m_layout.path(QStringLiteral("/root")));

    for (const QString &home : homes) {
        for (const auto &name : m_policy.cacheDirectoryNames) {
            const QString path = home + QStringLiteral("/.cache/") + QString::fromStdString(name);
            QFileInfo info(path);
            if (!info.isDir()) {
                continue;
            }
            InventoryItem item = fileItem(ItemKind::CacheDirectory, info);
            item.metadata["home"] = home.toStdString();
            items.push_back(std::move(item));
        }
    }
    return items;
}

std::vector<InventoryItem> InventoryCollector::collectVulkanIcds()
{
    std::vector<InventoryItem> items;
    const QFileInfoList entries =
        listEntries(m_layout.path(QStringLiteral("/etc/vulkan/icd.d")),
                    {QStringLiteral("*.json")}, QDir::Files);
    for (const QFileInfo &info : entries) {
        InventoryItem item = fileItem(ItemKind::VulkanICD, info);
        std::string libraryPath;
        const auto content = readText(info.absoluteFilePath());
        if (content.has_value()) {
            try {
                const auto doc = nlohmann::json::parse(*content);
                if (doc.contains("ICD") && doc.at("ICD").is_object()) {
                    libraryPath = doc.at("ICD").value("library_path", "");
                }
            } catch (const nlohmann::json::exception &error) {
                GSLOG_WARN(QStringLiteral("InventoryCollector"),
                           QStringLiteral("collectVulkanIcds"),
                           QStringLiteral("icd_descriptor_unparseable"),
                           QStringLiteral("inventory"),
                           QStringLiteral("json_parse"),
                           logging::defaultWho(),
                           QString(),
                           (nlohmann::json{{"path", item.path}, {"error", error.what()}}));
            }
        }
        item.metadata["library_path"] = libraryPath;
        items.push_back(std::move(item));
    }
    return items;
}

std::vector<InventoryItem> InventoryCollector::collectOpenClVendors()
{
    std::vector<InventoryItem> items;
    const QFileInfoList entries =
        listEntries(m_layout.path(QStringLiteral("/etc/OpenCL/vendors")),
                    {QStringLiteral("*.icd")}, QDir::Files);
    for (const QFileInfo &info : entries) {
        InventoryItem item = fileItem(ItemKind::OpenCLVendorFile, info);
        std::string libraryPath;
        const auto content = readText(info.absoluteFilePath());
        if (content.has_value()) {
            // The loader reads the first line as the library to dlopen.
            for (const QString &line : QString::fromStdString(*content).split(QChar('\n'))) {
                const std::string candidate = trimmed(line.toStdString());
                if (!candidate.empty()) {
                    libraryPath = candidate;
                    break;
                }
            }
        }
        item.metadata["library_path"] = libraryPath;
        items.push_back(std::move(item));
    }
    return items;
}

} // namespace gpuscrub
