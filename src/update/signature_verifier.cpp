#include "update/signature_verifier.hpp"

#include "crypto/digest.hpp"
#include "crypto/signature.hpp"
#include "util/logger.hpp"

namespace relup {

SignatureVerifier::SignatureVerifier(std::string certificate_pem, Policy policy)
    : certificate_pem_(std::move(certificate_pem)), policy_(policy) {}

Result SignatureVerifier::Verify(const std::string& package_path,
                                 const std::string& expected_sha256,
                                 const std::optional<std::vector<std::uint8_t>>& signature,
                                 const std::string& signature_ref,
                                 VerificationResult& out) const {
    out = VerificationResult{};

    std::string actual;
    if (auto r = Sha256HexFile(package_path, actual); !r.ok) return r;
    if (!HexDigestEquals(expected_sha256, actual)) {
        return Result::Fail(ErrorKind::ChecksumMismatch,
                            "checksum mismatch: expected " +
                                (expected_sha256.empty() ? std::string("<none>") : expected_sha256) +
                                ", got " + actual);
    }
    out.checksum_ok = true;
    LogInfo("Checksum verified: %s", actual.c_str());

    auto sr = CheckSignature(package_path, signature, signature_ref);
    if (sr.ok) {
        out.signature_ok = true;
        LogInfo("Signature verified");
        return Result::Ok();
    }
    if (policy_.require_signature) return sr;

    LogWarn("%s (continuing: signatures are not required)", sr.msg.c_str());
    return Result::Ok();
}

Result SignatureVerifier::CheckSignature(const std::string& package_path,
                                         const std::optional<std::vector<std::uint8_t>>& signature,
                                         const std::string& signature_ref) const {
    if (!signature || signature->empty()) {
        return Result::Fail(ErrorKind::SignatureMissing, "package has no signature");
    }
    if (!signature_ref.empty()) {
        const std::string sig_digest = Sha256Hex(std::span<const std::uint8_t>(*signature));
        if (!HexDigestEquals(signature_ref, sig_digest)) {
            return Result::Fail(ErrorKind::SignatureInvalid,
                                "signature file does not match the manifest reference");
        }
    }
    if (certificate_pem_.empty()) {
        return Result::Fail(ErrorKind::SignatureInvalid, "no trusted certificate configured");
    }
    return VerifyFileSignature(certificate_pem_, package_path, *signature);
}

} // namespace relup
