#pragma once

#include "manifest/manifest.hpp"
#include "util/result.hpp"
#include "util/time_utils.hpp"

#include <string>

namespace relup {

// Maintains <root>/<channel>/manifest.json, one document per channel.
class ManifestPublisher {
  public:
    explicit ManifestPublisher(std::string root_dir);

    // Adds the entry, or replaces the one with the same version, keeps the
    // list newest-first by semantic version and recomputes latest_version.
    // current_version is set to the version being published.
    Result Publish(const std::string& channel, const ManifestEntry& entry, Manifest& out,
                   Clock::time_point now = Clock::now()) const;

    // An absent manifest loads as an empty one for that channel.
    Result Load(const std::string& channel, Manifest& out) const;

    std::string ManifestPath(const std::string& channel) const;

  private:
    std::string root_dir_;
};

} // namespace relup
