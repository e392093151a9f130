#include <gtest/gtest.h>

#include "crypto/digest.hpp"
#include "testing.hpp"

#include <string>

namespace relup {

TEST(DigestTest, Sha256KnownVector) {
    const std::string expected =
        "ba7816bf8f01cfea414140de5dae2223"
        "b00361a396177a9cb410ff61f20015ad";

    testutil::MemoryReader reader(std::string("abc"));
    EXPECT_EQ(Sha256Hex(reader), expected);
    EXPECT_EQ(Sha256Hex(std::string("abc")), expected);
}

TEST(DigestTest, Md5OfFile) {
    testutil::TemporaryDirectory tmp;
    testutil::WriteTextFile(tmp.Sub("abc.txt"), "abc");

    std::string hex;
    ASSERT_TRUE(DigestHexFile(DigestAlgorithm::Md5, tmp.Sub("abc.txt"), hex).ok);
    EXPECT_EQ(hex, "900150983cd24fb0d6963f7d28e17f72");
}

TEST(DigestTest, IncrementalMatchesOneShot) {
    const std::string data(100000, 'x');
    DigestHasher h;
    const auto* p = reinterpret_cast<const std::uint8_t*>(data.data());
    h.Update({p, 4096});
    h.Update({p + 4096, data.size() - 4096});
    EXPECT_EQ(h.FinalHex(), Sha256Hex(data));
}

TEST(DigestTest, MissingFileFails) {
    std::string hex;
    EXPECT_FALSE(Sha256HexFile("/nonexistent/relup/file", hex).ok);
}

TEST(DigestTest, HexDigestEqualsIgnoresCaseAndWhitespace) {
    EXPECT_TRUE(HexDigestEquals("ABCDEF01", " abcdef01\n"));
    EXPECT_FALSE(HexDigestEquals("abcdef01", "abcdef02"));
    EXPECT_FALSE(HexDigestEquals("", ""));
}

} // namespace relup
