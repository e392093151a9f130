#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace relup {

struct ManifestEntry {
    std::string version;
    std::string release_date;
    std::vector<std::string> changelog;
    std::string download_url;
    // sha256 of the package archive.
    std::string checksum;
    // sha256 of the detached signature file; empty when unsigned.
    std::string signature;
    std::uint64_t size_bytes = 0;
    std::string min_system_version;
    bool critical = false;
    bool rollback_allowed = true;
};

struct Manifest {
    std::string channel;
    // Version of the publisher's own build. Informational only.
    std::string current_version;
    std::string latest_version;
    // Newest first.
    std::vector<ManifestEntry> releases;
    std::string last_check;

    const ManifestEntry* FindRelease(const std::string& version) const;
    // The entry named by latest_version, falling back to releases.front().
    const ManifestEntry* LatestRelease() const;
};

inline constexpr const char* kKnownChannels[] = {"stable", "beta", "alpha", "development"};

// "dev" -> "development"; unknown names -> nullopt.
std::optional<std::string> NormalizeChannel(const std::string& name);

} // namespace relup
