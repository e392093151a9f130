#include "crypto/openssl_handles.hpp"

#include <openssl/err.h>
#include <openssl/pem.h>

namespace relup {

namespace {

BioPtr MemBio(const std::string& pem) {
    return BioPtr(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
}

} // namespace

std::string OpenSslErrors() {
    std::string out;
    unsigned long code = 0;
    char buf[256];
    while ((code = ERR_get_error()) != 0) {
        ERR_error_string_n(code, buf, sizeof(buf));
        if (!out.empty()) out += "; ";
        out += buf;
    }
    return out.empty() ? std::string("unknown openssl error") : out;
}

EvpPkeyPtr PrivateKeyFromPem(const std::string& pem) {
    BioPtr bio = MemBio(pem);
    if (!bio) return nullptr;
    return EvpPkeyPtr(PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr));
}

EvpPkeyPtr PublicKeyFromPem(const std::string& pem) {
    BioPtr bio = MemBio(pem);
    if (!bio) return nullptr;
    return EvpPkeyPtr(PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr));
}

X509Ptr CertificateFromPem(const std::string& pem) {
    BioPtr bio = MemBio(pem);
    if (!bio) return nullptr;
    return X509Ptr(PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr));
}

} // namespace relup
