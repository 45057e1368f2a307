#pragma once

#include <map>
#include <string>

#include "common/enums.hpp"

namespace buildstamp {

inline constexpr const char *kDefaultVersionVariable = "BUILDSTAMP_PKG_VERSION";

// Settings for the BUILDSTAMP_BUILD_* instructions.
//
// Defaults emit BUILDSTAMP_BUILD_TIMESTAMP (UTC) and BUILDSTAMP_BUILD_SEMVER.
// The date/time instructions are only produced when `timestamp` is set, and
// `kind` selects which of them.
struct BuildConfig {
    bool enabled = true;
    bool timestamp = true;
    TimeZone timezone = TimeZone::Utc;
    TimestampKind kind = TimestampKind::Timestamp;
    bool semver = true;

    // The category produces output only when switched on and at least one
    // sub-feature is active.
    bool hasEnabled() const
    {
        return enabled && (timestamp || semver);
    }
};

struct Instructions {
    BuildConfig build;
    // Environment variable holding the package version.
    std::string versionVariable = kDefaultVersionVariable;
};

// Ordered by key so every run iterates identically.
using InstructionMap = std::map<InstructionKey, std::string>;

} // namespace buildstamp
