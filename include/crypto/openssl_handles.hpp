#pragma once

#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/x509.h>

#include <memory>
#include <string>

namespace relup {

struct EvpPkeyDeleter {
    void operator()(EVP_PKEY* p) const {
        if (p) EVP_PKEY_free(p);
    }
};

struct EvpPkeyCtxDeleter {
    void operator()(EVP_PKEY_CTX* p) const {
        if (p) EVP_PKEY_CTX_free(p);
    }
};

struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* p) const {
        if (p) EVP_MD_CTX_free(p);
    }
};

struct X509Deleter {
    void operator()(X509* p) const {
        if (p) X509_free(p);
    }
};

struct BioDeleter {
    void operator()(BIO* p) const {
        if (p) BIO_free_all(p);
    }
};

using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, EvpPkeyDeleter>;
using EvpPkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, EvpPkeyCtxDeleter>;
using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;
using X509Ptr = std::unique_ptr<X509, X509Deleter>;
using BioPtr = std::unique_ptr<BIO, BioDeleter>;

// Drains the OpenSSL error queue into one line.
std::string OpenSslErrors();

EvpPkeyPtr PrivateKeyFromPem(const std::string& pem);
EvpPkeyPtr PublicKeyFromPem(const std::string& pem);
X509Ptr CertificateFromPem(const std::string& pem);

} // namespace relup
