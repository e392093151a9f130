#include "crypto/digest.hpp"

#include "io/file_reader.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <vector>

namespace relup {

namespace {

class EvpCtx final {
public:
    EvpCtx() : ctx_(EVP_MD_CTX_new()) {}
    EvpCtx(const EvpCtx&) = delete;
    EvpCtx& operator=(const EvpCtx&) = delete;
    ~EvpCtx() {
        if (ctx_) EVP_MD_CTX_free(ctx_);
    }

    EVP_MD_CTX* get() const { return ctx_; }
    bool ok() const { return ctx_ != nullptr; }

private:
    EVP_MD_CTX* ctx_ = nullptr;
};

const EVP_MD* MdFor(DigestAlgorithm algo) {
    switch (algo) {
        case DigestAlgorithm::Md5:    return EVP_md5();
        case DigestAlgorithm::Sha256: return EVP_sha256();
    }
    return EVP_sha256();
}

bool InitDigest(EvpCtx& ctx, DigestAlgorithm algo) {
    return ctx.ok() && EVP_DigestInit_ex(ctx.get(), MdFor(algo), nullptr) == 1;
}

bool UpdateDigest(EvpCtx& ctx, std::span<const std::uint8_t> data) {
    if (data.empty()) return true;
    return EVP_DigestUpdate(ctx.get(), data.data(), data.size()) == 1;
}

std::string FinalDigestHex(EvpCtx& ctx) {
    std::array<std::uint8_t, EVP_MAX_MD_SIZE> out{};
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), out.data(), &len) != 1) return {};
    return HexEncode(std::span<const std::uint8_t>(out.data(), len));
}

std::string DigestHex(DigestAlgorithm algo, IReader& reader) {
    EvpCtx ctx;
    if (!InitDigest(ctx, algo)) return {};

    std::vector<std::uint8_t> buf(64 * 1024);
    while (true) {
        const ssize_t n = reader.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0) break;
        if (n < 0) return {};
        if (!UpdateDigest(ctx, std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n)))) {
            return {};
        }
    }
    return FinalDigestHex(ctx);
}

std::string NormalizeHex(const std::string& s) {
    const auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    const auto e = s.find_last_not_of(" \t\r\n");
    std::string out = s.substr(b, e - b + 1);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

} // namespace

const char* DigestAlgorithmName(DigestAlgorithm algo) {
    return algo == DigestAlgorithm::Md5 ? "md5" : "sha256";
}

std::string HexEncode(std::span<const std::uint8_t> bytes) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.resize(bytes.size() * 2);
    for (size_t i = 0; i < bytes.size(); ++i) {
        out[i * 2] = kHex[(bytes[i] >> 4) & 0xF];
        out[i * 2 + 1] = kHex[bytes[i] & 0xF];
    }
    return out;
}

bool HexDigestEquals(const std::string& a, const std::string& b) {
    const std::string na = NormalizeHex(a);
    const std::string nb = NormalizeHex(b);
    return !na.empty() && na == nb;
}

struct DigestHasher::Impl {
    EvpCtx ctx;
    bool initialized = false;
    bool finalized = false;
};

DigestHasher::DigestHasher(DigestAlgorithm algo) : impl_(std::make_unique<Impl>()) {
    if (impl_ && InitDigest(impl_->ctx, algo)) {
        impl_->initialized = true;
    }
}

DigestHasher::DigestHasher(DigestHasher&&) noexcept = default;
DigestHasher& DigestHasher::operator=(DigestHasher&&) noexcept = default;
DigestHasher::~DigestHasher() = default;

void DigestHasher::Update(std::span<const std::uint8_t> data) {
    if (!impl_ || !impl_->initialized || impl_->finalized) return;
    if (!UpdateDigest(impl_->ctx, data)) {
        impl_->finalized = true;
    }
}

std::string DigestHasher::FinalHex() {
    if (!impl_ || !impl_->initialized || impl_->finalized) return {};
    impl_->finalized = true;
    return FinalDigestHex(impl_->ctx);
}

std::string Sha256Hex(std::span<const std::uint8_t> data) {
    EvpCtx ctx;
    if (!InitDigest(ctx, DigestAlgorithm::Sha256)) return {};
    if (!UpdateDigest(ctx, data)) return {};
    return FinalDigestHex(ctx);
}

std::string Sha256Hex(const std::string& data) {
    return Sha256Hex(std::span<const std::uint8_t>(
        reinterpret_cast<const std::uint8_t*>(data.data()), data.size()));
}

std::string Sha256Hex(IReader& reader) {
    return DigestHex(DigestAlgorithm::Sha256, reader);
}

Result Sha256HexFile(const std::string& path, std::string& out_hex) {
    return DigestHexFile(DigestAlgorithm::Sha256, path, out_hex);
}

Result DigestHexFile(DigestAlgorithm algo, const std::string& path, std::string& out_hex) {
    FileReader reader;
    auto r = FileReader::Open(path, reader);
    if (!r.is_ok()) return r;
    out_hex = DigestHex(algo, reader);
    if (out_hex.empty()) return Result::Fail(-1, std::string(DigestAlgorithmName(algo)) + " failed: " + path);
    return Result::Ok();
}

} // namespace relup
