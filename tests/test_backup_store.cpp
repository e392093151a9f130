#include "update/backup_store.hpp"

#include "testing.hpp"

#include <chrono>
#include <filesystem>
#include <gtest/gtest.h>

using namespace relup;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace {

class BackupStoreTest : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;
    BackupStore store{tmp.Sub("backups")};
    const Clock::time_point t0 = Clock::time_point(std::chrono::seconds(1790000000));

    std::string Binary(const std::string& version) {
        const std::string p = tmp.Sub("demo");
        testutil::WriteVersionBinary(p, version);
        return p;
    }
};

TEST_F(BackupStoreTest, EmptyStoreHasNoLatest) {
    std::vector<BackupRecord> all;
    ASSERT_TRUE(store.List(all).ok);
    EXPECT_TRUE(all.empty());

    BackupRecord rec;
    auto r = store.Latest(rec);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, ErrorKind::NoBackupAvailable);
}

TEST_F(BackupStoreTest, LatestIsNewestAcrossVersions) {
    BackupRecord rec;
    ASSERT_TRUE(store.Backup(Binary("1.0.0"), "1.0.0", rec, t0).ok);
    ASSERT_TRUE(store.Backup(Binary("1.2.0"), "1.2.0", rec, t0 + 2h).ok);
    ASSERT_TRUE(store.Backup(Binary("1.1.0"), "1.1.0", rec, t0 + 1h).ok);

    BackupRecord latest;
    ASSERT_TRUE(store.Latest(latest).ok);
    EXPECT_EQ(latest.version_tag, "1.2.0");
    EXPECT_NE(testutil::ReadTextFile(latest.path).find("1.2.0"), std::string::npos);

    std::vector<BackupRecord> all;
    ASSERT_TRUE(store.List(all).ok);
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[1].version_tag, "1.1.0");
    EXPECT_EQ(all[2].version_tag, "1.0.0");
}

TEST_F(BackupStoreTest, SameInstantNeverOverwrites) {
    BackupRecord a;
    BackupRecord b;
    ASSERT_TRUE(store.Backup(Binary("1.0.0"), "1.0.0", a, t0).ok);
    ASSERT_TRUE(store.Backup(Binary("1.0.1"), "1.0.0", b, t0).ok);

    EXPECT_NE(a.path, b.path);
    EXPECT_NE(testutil::ReadTextFile(a.path).find("1.0.0"), std::string::npos);
    EXPECT_NE(testutil::ReadTextFile(b.path).find("1.0.1"), std::string::npos);
}

TEST_F(BackupStoreTest, TagIsSanitizedForFileName) {
    BackupRecord rec;
    ASSERT_TRUE(store.Backup(Binary("1.0.0"), "1.0/../x y", rec, t0).ok);
    EXPECT_EQ(fs::path(rec.path).parent_path(), fs::path(store.Dir()));
    EXPECT_EQ(rec.path.find(' '), std::string::npos);

    BackupRecord unknown;
    ASSERT_TRUE(store.Backup(Binary("1.0.0"), "", unknown, t0 + 1s).ok);
    EXPECT_EQ(unknown.version_tag, "unknown");
}

TEST_F(BackupStoreTest, RestoreReplacesTargetExecutable) {
    BackupRecord rec;
    ASSERT_TRUE(store.Backup(Binary("1.0.0"), "1.0.0", rec, t0).ok);

    const std::string target = tmp.Sub("installed");
    testutil::WriteTextFile(target, "broken", 0644);
    ASSERT_TRUE(store.Restore(rec, target).ok);

    EXPECT_EQ(testutil::ReadTextFile(target), testutil::VersionScript("1.0.0"));
    EXPECT_EQ(fs::status(target).permissions() & fs::perms::owner_exec, fs::perms::owner_exec);
    EXPECT_TRUE(fs::exists(rec.path));
}

TEST_F(BackupStoreTest, PruneKeepsNewestAndProtected) {
    std::vector<BackupRecord> made(5);
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(store.Backup(Binary("1.0." + std::to_string(i)), "1.0." + std::to_string(i), made[i],
                                 t0 + std::chrono::hours(i))
                        .ok);
    }

    std::size_t removed = 0;
    ASSERT_TRUE(store.Prune(2, made[0].path, removed).ok);
    EXPECT_EQ(removed, 2u);

    std::vector<BackupRecord> left;
    ASSERT_TRUE(store.List(left).ok);
    ASSERT_EQ(left.size(), 3u);
    EXPECT_EQ(left[0].version_tag, "1.0.4");
    EXPECT_EQ(left[1].version_tag, "1.0.3");
    EXPECT_EQ(left[2].version_tag, "1.0.0");
}

TEST_F(BackupStoreTest, PruneZeroKeepsEverything) {
    BackupRecord rec;
    ASSERT_TRUE(store.Backup(Binary("1.0.0"), "1.0.0", rec, t0).ok);
    ASSERT_TRUE(store.Backup(Binary("1.0.1"), "1.0.1", rec, t0 + 1s).ok);

    std::size_t removed = 7;
    ASSERT_TRUE(store.Prune(0, "", removed).ok);
    EXPECT_EQ(removed, 0u);
}

TEST_F(BackupStoreTest, ForeignFilesAreIgnored) {
    fs::create_directories(store.Dir());
    testutil::WriteTextFile(store.Dir() + "/notes.txt", "x");
    testutil::WriteTextFile(store.Dir() + "/garbage_1.0.0.bak", "x");

    std::vector<BackupRecord> all;
    ASSERT_TRUE(store.List(all).ok);
    EXPECT_TRUE(all.empty());
}

} // namespace
