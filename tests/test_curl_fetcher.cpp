#include "update/curl_fetcher.hpp"

#include "testing.hpp"

#include <chrono>
#include <gtest/gtest.h>

using namespace relup;
using namespace std::chrono_literals;

namespace {

TEST(CurlFetcherTest, ReadsFileUrlIntoMemory) {
    testutil::TemporaryDirectory tmp;
    testutil::WriteTextFile(tmp.Sub("manifest.json"), "{\"channel\": \"stable\"}");

    CurlFetcher fetcher;
    std::string body;
    auto r = fetcher.FetchToString("file://" + tmp.Sub("manifest.json"), 5s, body);
    ASSERT_TRUE(r.ok) << r.msg;
    EXPECT_EQ(body, "{\"channel\": \"stable\"}");
}

TEST(CurlFetcherTest, MissingFileIsNotFound) {
    testutil::TemporaryDirectory tmp;
    CurlFetcher fetcher;
    std::string body;
    auto r = fetcher.FetchToString("file://" + tmp.Sub("absent.sig"), 5s, body);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, ErrorKind::NetworkFailure);
    EXPECT_EQ(r.err, kFetchNotFound);
}

TEST(CurlFetcherTest, DownloadReplacesDestinationWhole) {
    testutil::TemporaryDirectory tmp;
    const std::string payload(300000, 'q');
    testutil::WriteTextFile(tmp.Sub("pkg.tar.gz"), payload);
    testutil::WriteTextFile(tmp.Sub("dest"), "old");

    CurlFetcher fetcher;
    ASSERT_TRUE(fetcher.FetchToFile("file://" + tmp.Sub("pkg.tar.gz"), tmp.Sub("dest"), 5s).ok);
    EXPECT_EQ(testutil::ReadTextFile(tmp.Sub("dest")), payload);
}

TEST(CurlFetcherTest, FailedDownloadKeepsOldFile) {
    testutil::TemporaryDirectory tmp;
    testutil::WriteTextFile(tmp.Sub("dest"), "old");

    CurlFetcher fetcher;
    EXPECT_FALSE(fetcher.FetchToFile("file://" + tmp.Sub("absent"), tmp.Sub("dest"), 5s).ok);
    EXPECT_EQ(testutil::ReadTextFile(tmp.Sub("dest")), "old");
}

TEST(CurlFetcherTest, OversizedBodyIsRejected) {
    testutil::TemporaryDirectory tmp;
    testutil::WriteTextFile(tmp.Sub("big"), std::string(4096, 'b'));

    CurlFetcher::Options opt;
    opt.max_in_memory_bytes = 1024;
    CurlFetcher fetcher(opt);
    std::string body;
    auto r = fetcher.FetchToString("file://" + tmp.Sub("big"), 5s, body);
    EXPECT_FALSE(r.ok);
}

} // namespace
