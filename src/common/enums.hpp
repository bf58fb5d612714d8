#pragma once

namespace gpuscrub {

enum class ItemKind {
    Package,
    RepositorySource,
    PinRule,
    RepositoryKey,
    ModuleBuild,
    ModuleConfigFile,
    VendorDirectory,
    CacheDirectory,
    VulkanICD,
    OpenCLVendorFile
};

enum class Label {
    Foreign,
    Stock
};

enum class ActionKind {
    DisableSource,
    RemovePin,
    PurgePackage,
    DeregisterModuleBuild,
    QuarantineFile,
    RemoveDirectory
};

enum class ResetMode {
    Full,
    Userland
};

enum class Stage {
    Start,
    Collecting,
    Classifying,
    Remediating,
    Restoring,
    Done
};

enum class OutcomeStatus {
    Succeeded,
    Failed,
    Skipped
};

enum class FailureClass {
    // Preconditions, checked before anything is collected.
    NotPrivileged,
    PackageManagerMissing,
    PackageQueryMissing,
    // Operational failures inside Remediating/Restoring.
    CommandNotStarted,
    CommandFailed,
    FileOperationFailed
};

enum class RestorationKind {
    Package,
    ConfigFile
};

} // namespace gpuscrub
