#pragma once

#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include <QString>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace gpuscrub {

class PolicyError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

struct GlAlternative {
    std::string name;
    std::string mesaConf;
};

// What a clean system should have once foreign artifacts are gone.
struct RestorationPlan {
    std::vector<RestorationTarget> targets;
    bool reinstall = false;
    // Empty when no extra dpkg architecture is needed.
    std::string foreignArchitecture;
    bool regenerateInitramfs = false;
    bool updateBootloader = false;
    bool resetGlAlternatives = false;
    std::vector<GlAlternative> glAlternatives;
    bool tidy = false;
    // Empty to skip the immediate modprobe.
    std::string driverModule;
};

/**
 * Immutable rule set for one run. Built once in main() and handed to the
 * collector, classifier and restorer by const reference.
 *
 * Package and module-build patterns use three forms:
 * - "^...$"  anchored regular expression
 * - "name*"  prefix wildcard
 * - "name"   exact name
 * All matching is case-insensitive.
 */
struct RulePolicy {
    ResetMode mode = ResetMode::Full;
    std::set<ItemKind> collectedKinds;

    std::vector<std::string> packagePatterns;
    std::vector<std::string> sourceKeywords;
    std::vector<std::string> pinKeywords;
    std::vector<std::string> keyKeywords;
    std::vector<std::string> moduleBuildPatterns;
    std::vector<std::string> moduleConfigGlobs;
    std::vector<std::string> vendorDirectoryGlobs;
    std::vector<std::string> cacheDirectoryNames;
    // Allow-lists: a descriptor is stock only if its library path contains one.
    std::vector<std::string> vulkanAllowTokens;
    std::vector<std::string> openclAllowTokens;

    RestorationPlan restoration;

    std::string expectedRelease;
    int releaseMismatchDelaySeconds = 0;

    bool collects(ItemKind kind) const;

    // File names of config files the restorer writes under /etc/modprobe.d.
    std::set<std::string> managedModuleConfigNames() const;

    static RulePolicy defaults(ResetMode mode);
};

// Replaces every field present in `overrides`; throws PolicyError on a
// malformed document.
RulePolicy applyPolicyOverrides(RulePolicy base, const nlohmann::json &overrides);

RulePolicy loadPolicyFile(const QString &path, ResetMode mode);

} // namespace gpuscrub
