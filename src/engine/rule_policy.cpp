#include "engine/rule_policy.hpp"

#include <QFile>
#include <QFileInfo>

#include "common/json_utils.hpp"

namespace gpuscrub {

namespace {

constexpr auto kModulePreferencePath = "/etc/modprobe.d/10-amdgpu-prefer.conf";

RestorationTarget package(const std::string &name, const std::string &batch)
{
    RestorationTarget target;
    target.kind = RestorationKind::Package;
    target.name = name;
    target.batch = batch;
    return target;
}

RestorationTarget configFile(const std::string &path, const std::string &content)
{
    RestorationTarget target;
    target.kind = RestorationKind::ConfigFile;
    target.name = QFileInfo(QString::fromStdString(path)).fileName().toStdString();
    target.path = path;
    target.content = content;
    return target;
}

std::vector<GlAlternative> defaultGlAlternatives()
{
    return {
        {"x86_64-linux-gnu_gl_conf", "/usr/lib/x86_64-linux-gnu/mesa/ld.so.conf"},
        {"i386-linux-gnu_gl_conf", "/usr/lib/i386-linux-gnu/mesa/ld.so.conf"},
    };
}

RestorationPlan fullRestoration()
{
    RestorationPlan plan;
    for (const char *name : {"linux-generic", "linux-headers-generic",
                             "linux-image-generic", "linux-firmware",
                             "xserver-xorg-video-amdgpu", "libdrm2",
                             "libdrm-amdgpu1", "mesa-vulkan-drivers",
                             "libgl1-mesa-dri", "mesa-opencl-icd",
                             "vulkan-tools", "pciutils", "initramfs-tools"}) {
        plan.targets.push_back(package(name, "core"));
    }
    plan.targets.push_back(package("linux-headers-{kernel}", "running-kernel"));
    // Prefer amdgpu over radeon for Southern/Sea Islands parts.
    plan.targets.push_back(configFile(kModulePreferencePath,
                                      "options amdgpu si_support=1 cik_support=1\n"
                                      "options radeon si_support=0 cik_support=0\n"));
    plan.regenerateInitramfs = true;
    plan.updateBootloader = true;
    plan.resetGlAlternatives = true;
    plan.glAlternatives = defaultGlAlternatives();
    plan.driverModule = "amdgpu";
    return plan;
}

RestorationPlan userlandRestoration()
{
    RestorationPlan plan;
    for (const char *name : {"libdrm2", "libdrm-amdgpu1", "libdrm-common",
                             "libgl1", "libglx0", "libegl1", "libgbm1",
                             "libgl1-mesa-dri", "libglx-mesa0",
                             "mesa-vulkan-drivers", "libvulkan1",
                             "vulkan-tools", "mesa-utils",
                             "xserver-xorg-video-amdgpu"}) {
        plan.targets.push_back(package(name, "core"));
    }
    // 32-bit userspace for Steam/Proton.
    for (const char *name : {"libdrm2:i386", "libdrm-amdgpu1:i386", "libgl1:i386",
                             "libglx0:i386", "libegl1:i386", "libgbm1:i386",
                             "libgl1-mesa-dri:i386", "libglx-mesa0:i386",
                             "mesa-vulkan-drivers:i386", "libvulkan1:i386"}) {
        plan.targets.push_back(package(name, "i386"));
    }
    plan.reinstall = true;
    plan.foreignArchitecture = "i386";
    plan.resetGlAlternatives = true;
    plan.glAlternatives = defaultGlAlternatives();
    plan.tidy = true;
    return plan;
}

std::vector<std::string> readStringList(const nlohmann::json &doc, const char *key)
{
    const auto &value = doc.at(key);
    if (!value.is_array()) {
        throw PolicyError(std::string("policy field '") + key + "' must be an array of strings");
    }
    std::vector<std::string> out;
    for (const auto &entry : value) {
        if (!entry.is_string()) {
            throw PolicyError(std::string("policy field '") + key + "' must be an array of strings");
        }
        out.push_back(entry.get<std::string>());
    }
    return out;
}

void overrideList(const nlohmann::json &doc, const char *key, std::vector<std::string> &target)
{
    if (doc.contains(key)) {
        target = readStringList(doc, key);
    }
}

void overrideBool(const nlohmann::json &doc, const char *key, bool &target)
{
    if (!doc.contains(key)) {
        return;
    }
    if (!doc.at(key).is_boolean()) {
        throw PolicyError(std::string("policy field '") + key + "' must be a boolean");
    }
    target = doc.at(key).get<bool>();
}

void overrideString(const nlohmann::json &doc, const char *key, std::string &target)
{
    if (!doc.contains(key)) {
        return;
    }
    if (!doc.at(key).is_string()) {
        throw PolicyError(std::string("policy field '") + key + "' must be a string");
    }
    target = doc.at(key).get<std::string>();
}

RestorationTarget parseTarget(const nlohmann::json &entry)
{
    if (!entry.is_object()) {
        throw PolicyError("restoration target must be an object");
    }
    std::string path;
    std::string content;
    std::string name;
    std::string batch = "core";
    overrideString(entry, "path", path);
    overrideString(entry, "content", content);
    overrideString(entry, "name", name);
    overrideString(entry, "batch", batch);
    if (!path.empty()) {
        return configFile(path, content);
    }
    if (name.empty()) {
        throw PolicyError("restoration target needs a 'name' or a 'path'");
    }
    return package(name, batch);
}

void applyRestorationOverrides(RestorationPlan &plan, const nlohmann::json &doc)
{
    if (!doc.is_object()) {
        throw PolicyError("policy field 'restoration' must be an object");
    }
    if (doc.contains("targets")) {
        if (!doc.at("targets").is_array()) {
            throw PolicyError("policy field 'targets' must be an array");
        }
        plan.targets.clear();
        for (const auto &entry : doc.at("targets")) {
            plan.targets.push_back(parseTarget(entry));
        }
    }
    overrideBool(doc, "reinstall", plan.reinstall);
    overrideString(doc, "foreignArchitecture", plan.foreignArchitecture);
    overrideBool(doc, "regenerateInitramfs", plan.regenerateInitramfs);
    overrideBool(doc, "updateBootloader", plan.updateBootloader);
    overrideBool(doc, "resetGlAlternatives", plan.resetGlAlternatives);
    overrideBool(doc, "tidy", plan.tidy);
    overrideString(doc, "driverModule", plan.driverModule);
}

} // namespace

bool RulePolicy::collects(ItemKind kind) const
{
    return collectedKinds.count(kind) > 0;
}

std::set<std::string> RulePolicy::managedModuleConfigNames() const
{
    std::set<std::string> names;
    for (const auto &target : restoration.targets) {
        if (target.kind == RestorationKind::ConfigFile
            && target.path.rfind("/etc/modprobe.d/", 0) == 0) {
            names.insert(target.name);
        }
    }
    return names;
}

RulePolicy RulePolicy::defaults(ResetMode mode)
{
    RulePolicy policy;
    policy.mode = mode;
    policy.expectedRelease = "25.04";
    policy.cacheDirectoryNames = {"mesa_shader_cache"};
    policy.vulkanAllowTokens = {"radv"};
    policy.openclAllowTokens = {"libMesaOpenCL", "libRusticlOpenCL"};

    if (mode == ResetMode::Userland) {
        policy.collectedKinds = {ItemKind::Package, ItemKind::RepositorySource,
                                 ItemKind::VulkanICD, ItemKind::OpenCLVendorFile,
                                 ItemKind::CacheDirectory};
        policy.packagePatterns = {"amdvlk", "vulkan-amdgpu-pro*", "opencl-amdgpu*",
                                  "ocl-icd-amdgpu*"};
        policy.sourceKeywords = {"oibaf", "kisak", "llvm-toolchain",
                                 "repo.radeon.com", "rocm", "graphics-drivers"};
        policy.restoration = userlandRestoration();
        policy.releaseMismatchDelaySeconds = 5;
        return policy;
    }

    policy.collectedKinds = {ItemKind::Package, ItemKind::RepositorySource,
                             ItemKind::PinRule, ItemKind::RepositoryKey,
                             ItemKind::ModuleBuild, ItemKind::ModuleConfigFile,
                             ItemKind::VendorDirectory, ItemKind::CacheDirectory,
                             ItemKind::VulkanICD, ItemKind::OpenCLVendorFile};
    policy.packagePatterns = {
        "^amdgpu(-.*)?$", "^amdgpu-pro(-.*)?$", "^opencl-amdgpu(-.*)?$",
        "^ocl-icd-amdgpu(-.*)?$", "^vulkan-amdgpu(-.*)?$",
        "^hip(-.*)?$", "^hipblas(-.*)?$", "^hipfft(-.*)?$", "^hiprand(-.*)?$",
        "^hipsparse(-.*)?$",
        "^hsa(-.*)?$", "^hsakmt-roct(-.*)?$", "^hsa-rocr(-.*)?$",
        "^roc(-.*)?$", "^rocm(-.*)?$", "^rocr(-.*)?$", "^roct(-.*)?$",
        "^amf(-.*)?$",
        "amdvlk",
    };
    policy.sourceKeywords = {"repo.radeon.com", "rocm", "oibaf", "kisak",
                             "graphics-drivers"};
    policy.pinKeywords = {"amdgpu", "rocm", "radeon"};
    policy.keyKeywords = {"amdgpu", "rocm"};
    policy.moduleBuildPatterns = {"^amdgpu$", "^amf$", "^rocm$", "^roc.*$", "^hsa.*$"};
    policy.moduleConfigGlobs = {"*amdgpu*.conf", "*radeon*.conf"};
    policy.vendorDirectoryGlobs = {"amdgpu", "amdgpu-pro", "rocm*"};
    policy.restoration = fullRestoration();
    policy.releaseMismatchDelaySeconds = 10;
    return policy;
}

RulePolicy applyPolicyOverrides(RulePolicy base, const nlohmann::json &overrides)
{
    if (!overrides.is_object()) {
        throw PolicyError("policy document must be a JSON object");
    }

    if (overrides.contains("collect")) {
        base.collectedKinds.clear();
        for (const auto &name : readStringList(overrides, "collect")) {
            const auto kind = parseKindString(name);
            if (!kind.has_value()) {
                throw PolicyError("unknown item kind in 'collect': " + name);
            }
            base.collectedKinds.insert(*kind);
        }
    }

    overrideList(overrides, "packagePatterns", base.packagePatterns);
    overrideList(overrides, "sourceKeywords", base.sourceKeywords);
    overrideList(overrides, "pinKeywords", base.pinKeywords);
    overrideList(overrides, "keyKeywords", base.keyKeywords);
    overrideList(overrides, "moduleBuildPatterns", base.moduleBuildPatterns);
    overrideList(overrides, "moduleConfigGlobs", base.moduleConfigGlobs);
    overrideList(overrides, "vendorDirectoryGlobs", base.vendorDirectoryGlobs);
    overrideList(overrides, "cacheDirectoryNames", base.cacheDirectoryNames);
    overrideList(overrides, "vulkanAllowTokens", base.vulkanAllowTokens);
    overrideList(overrides, "openclAllowTokens", base.openclAllowTokens);
    overrideString(overrides, "expectedRelease", base.expectedRelease);

    if (overrides.contains("releaseDelaySeconds")) {
        if (!overrides.at("releaseDelaySeconds").is_number_integer()) {
            throw PolicyError("policy field 'releaseDelaySeconds' must be an integer");
        }
        base.releaseMismatchDelaySeconds = overrides.at("releaseDelaySeconds").get<int>();
    }

    if (overrides.contains("restoration")) {
        applyRestorationOverrides(base.restoration, overrides.at("restoration"));
    }

    return base;
}

RulePolicy loadPolicyFile(const QString &path, ResetMode mode)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        throw PolicyError("cannot open policy file " + path.toStdString() + ": "
                          + file.errorString().toStdString());
    }
    const QByteArray data = file.readAll();

    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(data.toStdString());
    } catch (const nlohmann::json::parse_error &error) {
        throw PolicyError("invalid policy file " + path.toStdString() + ": " + error.what());
    }

    return applyPolicyOverrides(RulePolicy::defaults(mode), doc);
}

} // namespace gpuscrub
