#pragma once

#include "util/result.hpp"

#include <string>

namespace relup {

// One signing identity: RSA keypair plus the self-signed certificate that
// binds it to an organization. The private key stays in the packaging
// workspace; only the certificate is shipped to clients.
struct KeyMaterial {
    std::string private_key_path;
    std::string public_key_path;
    std::string certificate_path;

    std::string private_key_pem;
    std::string public_key_pem;
    std::string certificate_pem;

    // sha256 over the DER certificate, for logs and package metadata.
    std::string certificate_fingerprint;
};

class KeyManager {
  public:
    struct Options {
        std::string key_dir;
        std::string file_prefix = "relup";
        std::string organization = "relup";
        std::string common_name = "relup Update Package";
        std::string country = "US";
        int rsa_bits = 4096;
        int certificate_days = 365;
    };

    static constexpr int kMinRsaBits = 4096;

    explicit KeyManager(Options opt);

    // Loads the identity from key_dir, generating it on first use. Creation is
    // serialized with a lock file so concurrent first runs agree on one key.
    Result EnsureKeyMaterial(KeyMaterial& out) const;

    // Moves the current identity to key_dir/retired/<timestamp>/ and creates a
    // new one. Signatures made with the retired key still verify against the
    // retired certificate.
    Result Rotate(KeyMaterial& out) const;

    std::string PrivateKeyPath() const;
    std::string PublicKeyPath() const;
    std::string CertificatePath() const;

  private:
    Result Load(KeyMaterial& out) const;
    Result Generate(KeyMaterial& out) const;
    std::string LockPath() const;

    Options opt_;
};

} // namespace relup
