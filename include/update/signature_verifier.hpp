#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace relup {

struct VerificationResult {
    bool checksum_ok = false;
    bool signature_ok = false;
};

// Decides whether a downloaded package may be trusted. The checksum is always
// mandatory. With require_signature a missing or bad signature is as fatal
// as a checksum mismatch; without it the problem is logged and the package
// passes on its checksum alone.
class SignatureVerifier {
  public:
    struct Policy {
        bool require_signature = true;
    };

    SignatureVerifier(std::string certificate_pem, Policy policy);

    // signature is nullopt when the package has no detached signature.
    // signature_ref is the manifest's sha256 of the signature file, checked
    // when non-empty.
    Result Verify(const std::string& package_path,
                  const std::string& expected_sha256,
                  const std::optional<std::vector<std::uint8_t>>& signature,
                  const std::string& signature_ref,
                  VerificationResult& out) const;

  private:
    Result CheckSignature(const std::string& package_path,
                          const std::optional<std::vector<std::uint8_t>>& signature,
                          const std::string& signature_ref) const;

    std::string certificate_pem_;
    Policy policy_;
};

} // namespace relup
