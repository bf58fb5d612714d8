#pragma once

#include <regex>
#include <set>
#include <string>
#include <vector>

#include "common/models.hpp"
#include "engine/rule_policy.hpp"

namespace gpuscrub {

/**
 * Labels inventory items Foreign or Stock from a RulePolicy.
 *
 * Rules are partitioned by item kind, matched case-insensitively, and the
 * first match wins. Items nothing matches are Stock with rule id
 * "default-stock". Vulkan ICD and OpenCL vendor descriptors invert this:
 * they are Stock only when their library path names an allowed driver.
 *
 * Throws std::invalid_argument from the constructor when a pattern in the
 * policy is not a valid regular expression.
 */
class Classifier
{
public:
    explicit Classifier(const RulePolicy &policy);

    ClassificationResult classify(const InventoryItem &item) const;
    std::vector<ClassificationResult> classifyAll(const std::vector<InventoryItem> &items) const;

    static constexpr const char *kDefaultStockRule = "default-stock";

private:
    struct NamePattern {
        std::string source;
        enum class Form { Regex, Prefix, Exact } form;
        std::regex regex;
        std::string literal;
    };

    static std::vector<NamePattern> compilePatterns(const std::vector<std::string> &patterns);
    static const NamePattern *firstMatch(const std::vector<NamePattern> &patterns,
                                         const std::string &name);

    ClassificationResult byName(const InventoryItem &item,
                                const std::vector<NamePattern> &patterns,
                                const char *category) const;
    ClassificationResult byKeyword(const InventoryItem &item, const std::string &haystack,
                                   const std::vector<std::string> &keywords,
                                   const char *category) const;
    ClassificationResult byGlob(const InventoryItem &item,
                                const std::vector<std::string> &globs,
                                const char *category) const;
    ClassificationResult byAllowList(const InventoryItem &item,
                                     const std::vector<std::string> &tokens,
                                     const char *category) const;
    ClassificationResult moduleConfig(const InventoryItem &item) const;

    const RulePolicy &m_policy;
    std::vector<NamePattern> m_packagePatterns;
    std::vector<NamePattern> m_moduleBuildPatterns;
    std::set<std::string> m_managedModuleConfigs;
};

} // namespace gpuscrub
