#include "crypto/key_manager.hpp"

#include "crypto/digest.hpp"
#include "crypto/openssl_handles.hpp"
#include "io/file_util.hpp"
#include "system/file_lock.hpp"
#include "util/logger.hpp"
#include "util/time_utils.hpp"

#include <openssl/pem.h>
#include <openssl/rand.h>
#include <openssl/rsa.h>
#include <openssl/x509v3.h>

#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

namespace relup {

namespace {

Result PemFromBio(BIO* bio, std::string& out) {
    char* data = nullptr;
    const long len = BIO_get_mem_data(bio, &data);
    if (len <= 0 || !data) return Result::Fail(ErrorKind::SigningFailure, "empty PEM output");
    out.assign(data, static_cast<size_t>(len));
    return Result::Ok();
}

std::string CertificateFingerprint(X509* cert) {
    unsigned char* der = nullptr;
    const int len = i2d_X509(cert, &der);
    if (len <= 0 || !der) return {};
    std::string hex = Sha256Hex(std::span<const std::uint8_t>(der, static_cast<size_t>(len)));
    OPENSSL_free(der);
    return hex;
}

Result AddNameEntry(X509_NAME* name, const char* field, const std::string& value) {
    if (value.empty()) return Result::Ok();
    if (X509_NAME_add_entry_by_txt(name, field, MBSTRING_UTF8,
                                   reinterpret_cast<const unsigned char*>(value.c_str()),
                                   -1, -1, 0) != 1) {
        return Result::Fail(ErrorKind::SigningFailure,
                            std::string("cannot set certificate ") + field + ": " + OpenSslErrors());
    }
    return Result::Ok();
}

Result AddExtension(X509* cert, int nid, const char* value) {
    X509V3_CTX ctx;
    X509V3_set_ctx_nodb(&ctx);
    X509V3_set_ctx(&ctx, cert, cert, nullptr, nullptr, 0);
    X509_EXTENSION* ext = X509V3_EXT_conf_nid(nullptr, &ctx, nid, value);
    if (!ext) {
        return Result::Fail(ErrorKind::SigningFailure, "cannot build certificate extension: " + OpenSslErrors());
    }
    const int rc = X509_add_ext(cert, ext, -1);
    X509_EXTENSION_free(ext);
    if (rc != 1) {
        return Result::Fail(ErrorKind::SigningFailure, "cannot add certificate extension: " + OpenSslErrors());
    }
    return Result::Ok();
}

} // namespace

KeyManager::KeyManager(Options opt) : opt_(std::move(opt)) {
    if (opt_.rsa_bits < kMinRsaBits) {
        LogWarn("rsa_bits=%d below minimum, using %d", opt_.rsa_bits, kMinRsaBits);
        opt_.rsa_bits = kMinRsaBits;
    }
}

std::string KeyManager::PrivateKeyPath() const {
    return (fs::path(opt_.key_dir) / (opt_.file_prefix + "-private.pem")).string();
}

std::string KeyManager::PublicKeyPath() const {
    return (fs::path(opt_.key_dir) / (opt_.file_prefix + "-public.pem")).string();
}

std::string KeyManager::CertificatePath() const {
    return (fs::path(opt_.key_dir) / (opt_.file_prefix + "-cert.pem")).string();
}

std::string KeyManager::LockPath() const {
    return (fs::path(opt_.key_dir) / ".keys.lock").string();
}

Result KeyManager::EnsureKeyMaterial(KeyMaterial& out) const {
    if (opt_.key_dir.empty()) return Result::Fail(ErrorKind::Config, "key directory not configured");

    std::error_code ec;
    fs::create_directories(opt_.key_dir, ec);
    if (ec) {
        return Result::Fail(ErrorKind::SigningFailure,
                            "cannot create key directory " + opt_.key_dir + ": " + ec.message());
    }
    fs::permissions(opt_.key_dir, fs::perms::owner_all, fs::perm_options::replace, ec);

    FileLock lock;
    auto lr = FileLock::Acquire(LockPath(), lock);
    if (!lr.is_ok()) return lr.As(ErrorKind::SigningFailure);

    const bool have_priv = fs::exists(PrivateKeyPath(), ec);
    const bool have_pub = fs::exists(PublicKeyPath(), ec);
    const bool have_cert = fs::exists(CertificatePath(), ec);

    if (have_priv && have_pub && have_cert) {
        LogInfo("Using existing signing keys in %s", opt_.key_dir.c_str());
        return Load(out);
    }
    if (have_priv) {
        // Never overwrite an existing private key: that would orphan every
        // signature already made with it.
        return Result::Fail(ErrorKind::SigningFailure,
                            "incomplete key material in " + opt_.key_dir +
                                " (expected private key, public key and certificate)");
    }

    LogInfo("Generating new signing keys (RSA %d) in %s", opt_.rsa_bits, opt_.key_dir.c_str());
    return Generate(out);
}

Result KeyManager::Rotate(KeyMaterial& out) const {
    std::error_code ec;
    fs::create_directories(opt_.key_dir, ec);

    {
        FileLock lock;
        auto lr = FileLock::Acquire(LockPath(), lock);
        if (!lr.is_ok()) return lr.As(ErrorKind::SigningFailure);

        const fs::path retired =
            fs::path(opt_.key_dir) / "retired" / FormatCompactUtc(Clock::now());
        fs::create_directories(retired, ec);
        if (ec) {
            return Result::Fail(ErrorKind::SigningFailure,
                                "cannot create " + retired.string() + ": " + ec.message());
        }
        for (const auto& p : {PrivateKeyPath(), PublicKeyPath(), CertificatePath()}) {
            if (!fs::exists(p, ec)) continue;
            fs::rename(p, retired / fs::path(p).filename(), ec);
            if (ec) {
                return Result::Fail(ErrorKind::SigningFailure, "cannot retire " + p + ": " + ec.message());
            }
        }
        LogInfo("Retired signing identity to %s", retired.string().c_str());
    }

    return EnsureKeyMaterial(out);
}

Result KeyManager::Load(KeyMaterial& out) const {
    KeyMaterial km;
    km.private_key_path = PrivateKeyPath();
    km.public_key_path = PublicKeyPath();
    km.certificate_path = CertificatePath();

    for (auto [path, dst] : {std::pair{&km.private_key_path, &km.private_key_pem},
                             std::pair{&km.public_key_path, &km.public_key_pem},
                             std::pair{&km.certificate_path, &km.certificate_pem}}) {
        auto r = ReadFileToString(*path, *dst);
        if (!r.is_ok()) return r.As(ErrorKind::SigningFailure);
    }

    if (!PrivateKeyFromPem(km.private_key_pem)) {
        return Result::Fail(ErrorKind::SigningFailure, "cannot parse private key: " + km.private_key_path);
    }
    X509Ptr cert = CertificateFromPem(km.certificate_pem);
    if (!cert) {
        return Result::Fail(ErrorKind::SigningFailure, "cannot parse certificate: " + km.certificate_path);
    }
    km.certificate_fingerprint = CertificateFingerprint(cert.get());

    out = std::move(km);
    return Result::Ok();
}

Result KeyManager::Generate(KeyMaterial& out) const {
    if (RAND_status() != 1) {
        return Result::Fail(ErrorKind::SigningFailure, "OpenSSL PRNG not seeded");
    }

    EvpPkeyCtxPtr kctx(EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr));
    if (!kctx || EVP_PKEY_keygen_init(kctx.get()) <= 0 ||
        EVP_PKEY_CTX_set_rsa_keygen_bits(kctx.get(), opt_.rsa_bits) <= 0) {
        return Result::Fail(ErrorKind::SigningFailure, "RSA keygen setup failed: " + OpenSslErrors());
    }
    EVP_PKEY* raw_key = nullptr;
    if (EVP_PKEY_keygen(kctx.get(), &raw_key) <= 0) {
        return Result::Fail(ErrorKind::SigningFailure, "RSA keygen failed: " + OpenSslErrors());
    }
    EvpPkeyPtr pkey(raw_key);

    X509Ptr cert(X509_new());
    if (!cert) return Result::Fail(ErrorKind::SigningFailure, "X509_new failed");

    X509_set_version(cert.get(), 2);

    std::uint64_t serial = 0;
    if (RAND_bytes(reinterpret_cast<unsigned char*>(&serial), sizeof(serial)) != 1) {
        return Result::Fail(ErrorKind::SigningFailure, "RAND_bytes failed: " + OpenSslErrors());
    }
    ASN1_INTEGER_set_uint64(X509_get_serialNumber(cert.get()), serial >> 1);

    X509_gmtime_adj(X509_getm_notBefore(cert.get()), 0);
    X509_gmtime_adj(X509_getm_notAfter(cert.get()), static_cast<long>(opt_.certificate_days) * 24 * 3600);
    X509_set_pubkey(cert.get(), pkey.get());

    X509_NAME* name = X509_get_subject_name(cert.get());
    for (auto [field, value] : {std::pair{"C", &opt_.country},
                                std::pair{"O", &opt_.organization},
                                std::pair{"CN", &opt_.common_name}}) {
        auto r = AddNameEntry(name, field, *value);
        if (!r.is_ok()) return r;
    }
    X509_set_issuer_name(cert.get(), name);

    auto er = AddExtension(cert.get(), NID_basic_constraints, "critical,CA:FALSE");
    if (er.is_ok()) er = AddExtension(cert.get(), NID_key_usage, "critical,digitalSignature");
    if (!er.is_ok()) return er;

    if (X509_sign(cert.get(), pkey.get(), EVP_sha256()) <= 0) {
        return Result::Fail(ErrorKind::SigningFailure, "certificate self-sign failed: " + OpenSslErrors());
    }

    KeyMaterial km;
    km.private_key_path = PrivateKeyPath();
    km.public_key_path = PublicKeyPath();
    km.certificate_path = CertificatePath();

    BioPtr priv_bio(BIO_new(BIO_s_mem()));
    BioPtr pub_bio(BIO_new(BIO_s_mem()));
    BioPtr cert_bio(BIO_new(BIO_s_mem()));
    if (!priv_bio || !pub_bio || !cert_bio) {
        return Result::Fail(ErrorKind::SigningFailure, "BIO_new failed");
    }
    if (PEM_write_bio_PrivateKey(priv_bio.get(), pkey.get(), nullptr, nullptr, 0, nullptr, nullptr) != 1 ||
        PEM_write_bio_PUBKEY(pub_bio.get(), pkey.get()) != 1 ||
        PEM_write_bio_X509(cert_bio.get(), cert.get()) != 1) {
        return Result::Fail(ErrorKind::SigningFailure, "PEM encoding failed: " + OpenSslErrors());
    }

    Result r = PemFromBio(priv_bio.get(), km.private_key_pem);
    if (r.is_ok()) r = PemFromBio(pub_bio.get(), km.public_key_pem);
    if (r.is_ok()) r = PemFromBio(cert_bio.get(), km.certificate_pem);
    if (!r.is_ok()) return r;

    // Private key last: its presence marks the identity as complete.
    r = WriteFileAtomic(km.certificate_path, km.certificate_pem, 0644);
    if (r.is_ok()) r = WriteFileAtomic(km.public_key_path, km.public_key_pem, 0644);
    if (r.is_ok()) r = WriteFileAtomic(km.private_key_path, km.private_key_pem, 0600);
    if (!r.is_ok()) return r.As(ErrorKind::SigningFailure);

    km.certificate_fingerprint = CertificateFingerprint(cert.get());
    LogInfo("Keys generated, certificate sha256=%s", km.certificate_fingerprint.c_str());

    out = std::move(km);
    return Result::Ok();
}

} // namespace relup
