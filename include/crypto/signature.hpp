#pragma once

#include "crypto/key_manager.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace relup {

// Detached RSA-SHA256 (PKCS#1 v1.5) signature over the file bytes.
Result SignFile(const KeyMaterial& key, const std::string& path, std::vector<std::uint8_t>& out_sig);

// Ok, or ErrorKind::SignatureInvalid when the signature does not match the
// certificate's public key.
Result VerifyFileSignature(const std::string& certificate_pem,
                           const std::string& path,
                           std::span<const std::uint8_t> signature);

} // namespace relup
