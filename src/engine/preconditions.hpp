#pragma once

#include <optional>
#include <string>

#include "common/host_layout.hpp"
#include "common/process_utils.hpp"
#include "engine/error_policy.hpp"

namespace gpuscrub {

struct PreconditionError {
    FailureClass failure = FailureClass::NotPrivileged;
    std::string message;
};

/**
 * Checks that must hold before anything is collected: root privileges
 * (not needed for a dry run), apt-get and dpkg-query on PATH.
 * Returns the first violated precondition.
 */
std::optional<PreconditionError> checkPreconditions(const CommandRunner &runner,
                                                    unsigned effectiveUid,
                                                    bool dryRun);

struct ReleaseCheck {
    std::string found;
    std::string expected;

    bool matches() const { return found == expected; }
};

// Value of `key` in an os-release style file, unquoted. Empty if absent.
std::string readOsReleaseField(const QString &path, const std::string &key);

ReleaseCheck checkRelease(const HostLayout &layout, const std::string &expected);

} // namespace gpuscrub
