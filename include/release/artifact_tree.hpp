#pragma once

#include "release/release_identity.hpp"
#include "util/result.hpp"

#include <string>

namespace relup {

struct ArtifactTreeInputs {
    std::string product_name;
    std::string binary_name;
    // The binary the build step produced.
    std::string built_binary;
    ReleaseIdentity identity;
    std::string install_dir;
    std::string config_dir;
};

// Directories every package carries at its root.
inline constexpr const char* kArtifactTreeDirs[] = {"bin", "config", "scripts", "docs"};

// Lays out tree_dir as
//   bin/<binary_name>      (0755)
//   config/default.toml
//   scripts/install        (0755)
//   scripts/uninstall      (0755)
//   docs/README
// with the version identity filled into every text file. tree_dir must not
// exist yet.
Result AssembleArtifactTree(const ArtifactTreeInputs& in, const std::string& tree_dir);

std::string RenderDefaultConfig(const ArtifactTreeInputs& in);
std::string RenderInstallScript(const ArtifactTreeInputs& in);
std::string RenderUninstallScript(const ArtifactTreeInputs& in);
std::string RenderReadme(const ArtifactTreeInputs& in);

} // namespace relup
