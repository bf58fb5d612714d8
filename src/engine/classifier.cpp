#include "engine/classifier.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include <QRegularExpression>
#include <QString>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace gpuscrub {

namespace {

std::string toLower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

bool containsCaseInsensitive(const std::string &value, const std::string &needle)
{
    if (needle.empty()) {
        return false;
    }
    return toLower(value).find(toLower(needle)) != std::string::npos;
}

bool globMatches(const std::string &glob, const std::string &name)
{
    const QRegularExpression pattern(
        QRegularExpression::wildcardToRegularExpression(QString::fromStdString(glob)),
        QRegularExpression::CaseInsensitiveOption);
    return pattern.match(QString::fromStdString(name)).hasMatch();
}

ClassificationResult labelled(const InventoryItem &item, Label label, std::string ruleId)
{
    ClassificationResult result;
    result.item = item;
    result.label = label;
    result.ruleId = std::move(ruleId);
    return result;
}

ClassificationResult defaultStock(const InventoryItem &item)
{
    return labelled(item, Label::Stock, Classifier::kDefaultStockRule);
}

std::string metadataString(const InventoryItem &item, const char *key)
{
    if (!item.metadata.is_object()) {
        return {};
    }
    const auto it = item.metadata.find(key);
    if (it == item.metadata.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

} // namespace

Classifier::Classifier(const RulePolicy &policy)
    : m_policy(policy)
    , m_packagePatterns(compilePatterns(policy.packagePatterns))
    , m_moduleBuildPatterns(compilePatterns(policy.moduleBuildPatterns))
    , m_managedModuleConfigs(policy.managedModuleConfigNames())
{
}

std::vector<Classifier::NamePattern> Classifier::compilePatterns(
    const std::vector<std::string> &patterns)
{
    std::vector<NamePattern> compiled;
    compiled.reserve(patterns.size());
    for (const auto &source : patterns) {
        NamePattern pattern;
        pattern.source = source;
        if (!source.empty() && source.front() == '^') {
            pattern.form = NamePattern::Form::Regex;
            try {
                pattern.regex = std::regex(source, std::regex::ECMAScript | std::regex::icase);
            } catch (const std::regex_error &error) {
                throw std::invalid_argument("invalid pattern '" + source + "': " + error.what());
            }
        } else if (!source.empty() && source.back() == '*') {
            pattern.form = NamePattern::Form::Prefix;
            pattern.literal = toLower(source.substr(0, source.size() - 1));
        } else {
            pattern.form = NamePattern::Form::Exact;
            pattern.literal = toLower(source);
        }
        compiled.push_back(std::move(pattern));
    }
    return compiled;
}

const Classifier::NamePattern *Classifier::firstMatch(const std::vector<NamePattern> &patterns,
                                                      const std::string &name)
{
    const std::string lowered = toLower(name);
    for (const auto &pattern : patterns) {
        switch (pattern.form) {
        case NamePattern::Form::Regex:
            if (std::regex_match(name, pattern.regex)) {
                return &pattern;
            }
            break;
        case NamePattern::Form::Prefix:
            if (lowered.rfind(pattern.literal, 0) == 0) {
                return &pattern;
            }
            break;
        case NamePattern::Form::Exact:
            if (lowered == pattern.literal) {
                return &pattern;
            }
            break;
        }
    }
    return nullptr;
}

ClassificationResult Classifier::byName(const InventoryItem &item,
                                        const std::vector<NamePattern> &patterns,
                                        const char *category) const
{
    if (const NamePattern *match = firstMatch(patterns, item.name)) {
        return labelled(item, Label::Foreign, std::string(category) + ":" + match->source);
    }
    return defaultStock(item);
}

ClassificationResult Classifier::byKeyword(const InventoryItem &item,
                                           const std::string &haystack,
                                           const std::vector<std::string> &keywords,
                                           const char *category) const
{
    for (const auto &keyword : keywords) {
        if (containsCaseInsensitive(haystack, keyword)) {
            return labelled(item, Label::Foreign, std::string(category) + ":" + keyword);
        }
    }
    return defaultStock(item);
}

ClassificationResult Classifier::byGlob(const InventoryItem &item,
                                        const std::vector<std::string> &globs,
                                        const char *category) const
{
    for (const auto &glob : globs) {
        if (globMatches(glob, item.name)) {
            return labelled(item, Label::Foreign, std::string(category) + ":" + glob);
        }
    }
    return defaultStock(item);
}

ClassificationResult Classifier::byAllowList(const InventoryItem &item,
                                             const std::vector<std::string> &tokens,
                                             const char *category) const
{
    const std::string libraryPath = metadataString(item, "library_path");
    for (const auto &token : tokens) {
        if (containsCaseInsensitive(libraryPath, token)) {
            return labelled(item, Label::Stock, std::string(category) + "-allow:" + token);
        }
    }
    return labelled(item, Label::Foreign, std::string(category) + "-not-allowed");
}

ClassificationResult Classifier::moduleConfig(const InventoryItem &item) const
{
    // The preference file the restorer writes matches *amdgpu*.conf itself.
    if (m_managedModuleConfigs.count(item.name) > 0) {
        return labelled(item, Label::Stock, "module-config-managed");
    }
    return byGlob(item, m_policy.moduleConfigGlobs, "module-config");
}

ClassificationResult Classifier::classify(const InventoryItem &item) const
{
    switch (item.kind) {
    case ItemKind::Package:
        return byName(item, m_packagePatterns, "package");
    case ItemKind::ModuleBuild:
        return byName(item, m_moduleBuildPatterns, "module-build");
    case ItemKind::RepositorySource:
        return byKeyword(item, metadataString(item, "content"), m_policy.sourceKeywords, "source");
    case ItemKind::PinRule:
        return byKeyword(item, metadataString(item, "content"), m_policy.pinKeywords, "pin");
    case ItemKind::RepositoryKey:
        return byKeyword(item, item.name, m_policy.keyKeywords, "repository-key");
    case ItemKind::ModuleConfigFile:
        return moduleConfig(item);
    case ItemKind::VendorDirectory:
        return byGlob(item, m_policy.vendorDirectoryGlobs, "vendor-directory");
    case ItemKind::CacheDirectory:
        for (const auto &name : m_policy.cacheDirectoryNames) {
            if (toLower(item.name) == toLower(name)) {
                return labelled(item, Label::Foreign, "cache:" + name);
            }
        }
        return defaultStock(item);
    case ItemKind::VulkanICD:
        return byAllowList(item, m_policy.vulkanAllowTokens, "vulkan-icd");
    case ItemKind::OpenCLVendorFile:
        return byAllowList(item, m_policy.openclAllowTokens, "opencl-vendor");
    }
    return defaultStock(item);
}

std::vector<ClassificationResult> Classifier::classifyAll(
    const std::vector<InventoryItem> &items) const
{
    std::vector<ClassificationResult> results;
    results.reserve(items.size());
    std::size_t foreign = 0;
    for (const auto &item : items) {
        results.push_back(classify(item));
        if (results.back().label == Label::Foreign) {
            ++foreign;
            GSLOG_INFO(QStringLiteral("Classifier"),
                       QStringLiteral("classifyAll"),
                       QStringLiteral("foreign_item"),
                       QStringLiteral("rule_match"),
                       QStringLiteral("static_rules"),
                       logging::defaultWho(),
                       QString(),
                       nlohmann::json(results.back()));
        }
    }

    GSLOG_INFO(QStringLiteral("Classifier"),
               QStringLiteral("classifyAll"),
               QStringLiteral("classification_complete"),
               QStringLiteral("classifying_stage"),
               QStringLiteral("static_rules"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"items", items.size()}, {"foreign", foreign}}));
    return results;
}

} // namespace gpuscrub
