#pragma once

#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <memory>
#include <span>
#include <string>

namespace relup {

enum class DigestAlgorithm {
    Sha256,
    Md5,
};

const char* DigestAlgorithmName(DigestAlgorithm algo);

std::string Sha256Hex(std::span<const std::uint8_t> data);
std::string Sha256Hex(const std::string& data);
std::string Sha256Hex(IReader& reader);
Result Sha256HexFile(const std::string& path, std::string& out_hex);
Result DigestHexFile(DigestAlgorithm algo, const std::string& path, std::string& out_hex);

std::string HexEncode(std::span<const std::uint8_t> bytes);
// Case-insensitive, surrounding whitespace ignored. Empty never matches.
bool HexDigestEquals(const std::string& a, const std::string& b);

class DigestHasher {
public:
    explicit DigestHasher(DigestAlgorithm algo = DigestAlgorithm::Sha256);
    DigestHasher(const DigestHasher&) = delete;
    DigestHasher& operator=(const DigestHasher&) = delete;
    DigestHasher(DigestHasher&&) noexcept;
    DigestHasher& operator=(DigestHasher&&) noexcept;
    ~DigestHasher();

    void Update(std::span<const std::uint8_t> data);
    std::string FinalHex();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace relup
