#pragma once

#include "release/release_identity.hpp"

#include <cstdint>
#include <expected>
#include <string>
#include <vector>

namespace relup {

// A signed release archive in the package store. Never modified after it has
// been published; a rebuild of the same version gets a new fullVersion.
struct Package {
    std::string name;
    ReleaseIdentity identity;

    std::string artifact_path;
    std::string signature_path;
    std::string metadata_path;
    std::string certificate_path;
    // Basename of artifact_path.
    std::string package_file;

    std::uint64_t size_bytes = 0;
    // Over the archive bytes only; the signature ships beside it.
    std::string sha256;
    std::vector<std::uint8_t> signature;
    std::string certificate_pem;
    std::string created_at;
};

// <name>-<fullVersion>.json, written next to the archive.
class PackageMetadataCodec {
  public:
    static std::string Serialize(const Package& pkg);
    // Fills the identity, file names, checksum, size and created_at.
    static std::expected<Package, std::string> Parse(const std::string& json_input);
};

} // namespace relup
