#pragma once

#include "manifest/manifest.hpp"

#include <expected>
#include <string>

namespace relup {

class ManifestCodec {
  public:
    static std::expected<Manifest, std::string> Parse(const std::string& json_input);
    static std::string Serialize(const Manifest& manifest);
};

} // namespace relup
