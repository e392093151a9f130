#include "manifest/manifest.hpp"

#include "release/semantic_version.hpp"

namespace relup {

const ManifestEntry* Manifest::FindRelease(const std::string& version) const {
    for (const auto& e : releases) {
        if (CompareVersions(e.version, version) == 0) return &e;
    }
    return nullptr;
}

const ManifestEntry* Manifest::LatestRelease() const {
    if (!latest_version.empty()) {
        if (const auto* e = FindRelease(latest_version)) return e;
    }
    return releases.empty() ? nullptr : &releases.front();
}

std::optional<std::string> NormalizeChannel(const std::string& name) {
    if (name == "dev") return std::string("development");
    for (const char* c : kKnownChannels) {
        if (name == c) return name;
    }
    return std::nullopt;
}

} // namespace relup
