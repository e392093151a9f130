#include "crypto/signature.hpp"

#include "crypto/openssl_handles.hpp"
#include "io/file_reader.hpp"

#include <openssl/evp.h>

#include <cerrno>

namespace relup {

namespace {

// Feeds the file through update in 64K chunks.
template <typename UpdateFn>
Result StreamFile(const std::string& path, UpdateFn update) {
    FileReader reader;
    auto r = FileReader::Open(path, reader);
    if (!r.is_ok()) return r;

    std::vector<std::uint8_t> buf(64 * 1024);
    while (true) {
        const ssize_t n = reader.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0) break;
        if (n < 0) return Result::Fail(errno, "read failed: " + path);
        if (!update(buf.data(), static_cast<size_t>(n))) {
            return Result::Fail(-1, "digest update failed: " + OpenSslErrors());
        }
    }
    return Result::Ok();
}

} // namespace

Result SignFile(const KeyMaterial& key, const std::string& path, std::vector<std::uint8_t>& out_sig) {
    EvpPkeyPtr pkey = PrivateKeyFromPem(key.private_key_pem);
    if (!pkey) {
        return Result::Fail(ErrorKind::SigningFailure, "cannot load private key: " + OpenSslErrors());
    }

    EvpMdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr, pkey.get()) != 1) {
        return Result::Fail(ErrorKind::SigningFailure, "sign init failed: " + OpenSslErrors());
    }

    auto r = StreamFile(path, [&](const std::uint8_t* p, size_t n) {
        return EVP_DigestSignUpdate(ctx.get(), p, n) == 1;
    });
    if (!r.is_ok()) return r.As(ErrorKind::SigningFailure);

    size_t sig_len = 0;
    if (EVP_DigestSignFinal(ctx.get(), nullptr, &sig_len) != 1) {
        return Result::Fail(ErrorKind::SigningFailure, "sign size query failed: " + OpenSslErrors());
    }
    out_sig.resize(sig_len);
    if (EVP_DigestSignFinal(ctx.get(), out_sig.data(), &sig_len) != 1) {
        out_sig.clear();
        return Result::Fail(ErrorKind::SigningFailure, "sign failed: " + OpenSslErrors());
    }
    out_sig.resize(sig_len);
    return Result::Ok();
}

Result VerifyFileSignature(const std::string& certificate_pem,
                           const std::string& path,
                           std::span<const std::uint8_t> signature) {
    if (signature.empty()) return Result::Fail(ErrorKind::SignatureMissing, "empty signature");

    X509Ptr cert = CertificateFromPem(certificate_pem);
    if (!cert) {
        return Result::Fail(ErrorKind::SignatureInvalid, "cannot parse certificate: " + OpenSslErrors());
    }
    EvpPkeyPtr pkey(X509_get_pubkey(cert.get()));
    if (!pkey) {
        return Result::Fail(ErrorKind::SignatureInvalid, "certificate has no public key");
    }

    EvpMdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestVerifyInit(ctx.get(), nullptr, EVP_sha256(), nullptr, pkey.get()) != 1) {
        return Result::Fail(ErrorKind::SignatureInvalid, "verify init failed: " + OpenSslErrors());
    }

    auto r = StreamFile(path, [&](const std::uint8_t* p, size_t n) {
        return EVP_DigestVerifyUpdate(ctx.get(), p, n) == 1;
    });
    if (!r.is_ok()) return r;

    const int rc = EVP_DigestVerifyFinal(ctx.get(), signature.data(), signature.size());
    if (rc != 1) {
        (void)OpenSslErrors();
        return Result::Fail(ErrorKind::SignatureInvalid, "signature does not match certificate: " + path);
    }
    return Result::Ok();
}

} // namespace relup
