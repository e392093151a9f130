#pragma once

#include "util/result.hpp"
#include "util/time_utils.hpp"

#include <string>

namespace relup {

struct ReleaseIdentity {
    std::string semantic_version;
    std::string source_revision;
    std::string build_date;
    std::string target_platform;

    // semantic_version-source_revision-build_date. For display and
    // traceability only, never for ordering.
    std::string FullVersion() const;
};

struct IdentityInputs {
    std::string declared_version;
    std::string source_dir;
    Clock::time_point now = Clock::now();
    // Overrides for reproducible builds; empty means "detect".
    std::string revision_override;
    std::string platform_override;
};

// Revision comes from `git rev-parse --short HEAD` in source_dir ("unknown"
// outside a work tree), the platform from uname(2) as <machine>-<os>.
Result DeriveReleaseIdentity(const IdentityInputs& in, ReleaseIdentity& out);

std::string DetectHostPlatform();

} // namespace relup
