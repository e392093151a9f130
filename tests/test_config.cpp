#include "util/config.hpp"

#include "testing.hpp"

#include <cstdlib>
#include <gtest/gtest.h>

using namespace relup;
using nlohmann::json;

TEST(PackConfigTest, AppliesDefaults) {
    PackConfig c;
    auto r = PackConfig::FromJson(json{{"binary_name", "demo"}, {"version", "1.2.0"}, {"built_binary", "out/demo"}}, c);
    ASSERT_TRUE(r.ok) << r.msg;
    EXPECT_EQ(c.product_name, "demo");
    EXPECT_EQ(c.channel, "stable");
    EXPECT_EQ(c.certificate_days, 365u);
    EXPECT_TRUE(c.rollback_allowed);
    EXPECT_FALSE(c.critical);
}

TEST(PackConfigTest, RequiredFieldsAndTypes) {
    struct Case {
        json j;
        const char* msg_substr;
    };
    const Case cases[] = {
        {json{{"version", "1.0.0"}, {"built_binary", "x"}}, "binary_name"},
        {json{{"binary_name", "d"}, {"built_binary", "x"}}, "version"},
        {json{{"binary_name", "d"}, {"version", "1.0.0"}}, "built_binary"},
        {json{{"binary_name", "d"}, {"version", "1.0.0"}, {"built_binary", "x"}, {"critical", "yes"}}, "critical"},
        {json{{"binary_name", "d"}, {"version", "1.0.0"}, {"built_binary", "x"}, {"channel", "nightly"}}, "channel"},
        {json{{"binary_name", "d"}, {"version", "1.0.0"}, {"built_binary", "x"}, {"log_level", "loud"}}, "log_level"},
    };
    for (const auto& c : cases) {
        PackConfig out;
        auto r = PackConfig::FromJson(c.j, out);
        EXPECT_FALSE(r.ok) << c.j.dump();
        EXPECT_EQ(r.kind, ErrorKind::Config);
        EXPECT_NE(r.msg.find(c.msg_substr), std::string::npos) << r.msg;
    }
}

TEST(PackConfigTest, NormalizesChannelAliasAndExpandsHome) {
    ::setenv("HOME", "/home/builder", 1);
    PackConfig c;
    auto r = PackConfig::FromJson(json{{"binary_name", "demo"},
                                       {"version", "1.0.0"},
                                       {"built_binary", "~/src/demo"},
                                       {"channel", "dev"}},
                                  c);
    ASSERT_TRUE(r.ok) << r.msg;
    EXPECT_EQ(c.channel, "development");
    EXPECT_EQ(c.built_binary, "/home/builder/src/demo");
    EXPECT_EQ(c.workspace_dir, "/home/builder/.relup/releases");
}

TEST(UpdateConfigTest, LoadsFromFile) {
    testutil::TemporaryDirectory tmp;
    testutil::WriteTextFile(tmp.Sub("update.json"), R"({
        "install_dir": "/opt/demo/bin",
        "binary_name": "demo",
        "update_url": "https://updates.example.com/demo",
        "channel": "beta",
        "require_signature": false,
        "backup_retention": 3
    })");

    UpdateConfig c;
    auto r = UpdateConfig::LoadFromFile(tmp.Sub("update.json"), c);
    ASSERT_TRUE(r.ok) << r.msg;
    EXPECT_EQ(c.install_dir, "/opt/demo/bin");
    EXPECT_EQ(c.channel, "beta");
    EXPECT_FALSE(c.require_signature);
    EXPECT_EQ(c.backup_retention, 3u);
    EXPECT_EQ(c.state_dir, "/var/lib/relup");
    EXPECT_EQ(c.session_timeout_seconds, 300u);
}

TEST(UpdateConfigTest, RejectsBadDocuments) {
    testutil::TemporaryDirectory tmp;
    testutil::WriteTextFile(tmp.Sub("array.json"), "[1, 2]");
    testutil::WriteTextFile(tmp.Sub("broken.json"), "{ \"install_dir\": ");
    testutil::WriteTextFile(tmp.Sub("zero.json"),
                            R"({"install_dir": "/x", "binary_name": "d", "session_timeout_seconds": 0})");

    for (const char* name : {"array.json", "broken.json", "zero.json", "missing.json"}) {
        UpdateConfig c;
        auto r = UpdateConfig::LoadFromFile(tmp.Sub(name), c);
        EXPECT_FALSE(r.ok) << name;
        EXPECT_EQ(r.kind, ErrorKind::Config) << name << ": " << r.msg;
    }
}
