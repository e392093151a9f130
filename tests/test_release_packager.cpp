#include "release/release_packager.hpp"

#include "crypto/digest.hpp"
#include "crypto/signature.hpp"
#include "release/checksum_listing.hpp"
#include "testing.hpp"
#include "util/time_utils.hpp"

#include <algorithm>
#include <filesystem>
#include <gtest/gtest.h>

using namespace relup;
namespace fs = std::filesystem;

namespace {

class ReleasePackagerTest : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;
    const KeyMaterial& km = testutil::SharedKeyMaterial();

    void SetUp() override {
        fs::create_directories(tmp.Sub("src/out"));
        testutil::WriteVersionBinary(tmp.Sub("src/out/demo"), "1.0.0");
    }

    PackConfig Config(const std::string& version = "1.0.0") const {
        PackConfig c;
        c.product_name = "Demo";
        c.binary_name = "demo";
        c.version = version;
        c.source_dir = tmp.Sub("src");
        c.built_binary = tmp.Sub("src/out/demo");
        c.workspace_dir = tmp.Sub("ws");
        c.required_tools = {"sh"};
        c.changelog = {"First release"};
        return c;
    }

    ReleaseContext Context(const PackConfig& cfg) const {
        ReleaseContext ctx = ReleaseContext::FromConfig(cfg);
        ctx.revision_override = "abc1234";
        ctx.platform_override = "x86_64-linux";
        return ctx;
    }

    // Generating RSA-4096 per test is slow; seed the workspace with the
    // shared identity instead.
    void SeedKeys(const ReleaseContext& ctx) const {
        fs::create_directories(ctx.KeysDir());
        for (const auto& p : {km.private_key_path, km.public_key_path, km.certificate_path}) {
            fs::copy_file(p, fs::path(ctx.KeysDir()) / fs::path(p).filename(),
                          fs::copy_options::overwrite_existing);
        }
    }
};

TEST_F(ReleasePackagerTest, CreateProducesSignedPublishedPackage) {
    auto ctx = Context(Config());
    SeedKeys(ctx);
    ReleasePackager packager(ctx);

    Package pkg;
    Manifest manifest;
    auto r = packager.Create(pkg, manifest);
    ASSERT_TRUE(r.ok) << r.msg;

    EXPECT_EQ(pkg.package_file, "demo-1.0.0-abc1234-" + pkg.identity.build_date + ".tar.gz");
    EXPECT_TRUE(fs::exists(pkg.artifact_path));
    EXPECT_TRUE(fs::exists(pkg.signature_path));
    EXPECT_TRUE(fs::exists(pkg.metadata_path));
    EXPECT_TRUE(fs::exists(pkg.certificate_path));
    EXPECT_TRUE(fs::exists(ctx.PackagesDir() + "/stable/" + pkg.package_file));
    EXPECT_TRUE(fs::exists(ctx.PackagesDir() + "/" + kReleaseSummaryName));
    EXPECT_FALSE(fs::exists(ctx.TempDir() + "/" + pkg.package_file));

    EXPECT_EQ(manifest.channel, "stable");
    EXPECT_EQ(manifest.latest_version, "1.0.0");
    ASSERT_EQ(manifest.releases.size(), 1u);
    const auto& entry = manifest.releases.front();
    EXPECT_EQ(entry.checksum, pkg.sha256);
    EXPECT_EQ(entry.size_bytes, pkg.size_bytes);
    EXPECT_EQ(entry.signature, Sha256Hex(std::span<const std::uint8_t>(pkg.signature)));
    EXPECT_EQ(entry.changelog, std::vector<std::string>{"First release"});
    EXPECT_EQ(entry.download_url.rfind("file://", 0), 0u) << entry.download_url;
    EXPECT_EQ(entry.download_url.substr(entry.download_url.size() - pkg.package_file.size() - 7),
              "stable/" + pkg.package_file);

    EXPECT_TRUE(VerifyFileSignature(km.certificate_pem, pkg.artifact_path, pkg.signature).ok);
}

TEST_F(ReleasePackagerTest, ChecksumListingMatchesRecomputedDigest) {
    auto ctx = Context(Config());
    SeedKeys(ctx);
    Package pkg;
    Manifest manifest;
    ASSERT_TRUE(ReleasePackager(ctx).Create(pkg, manifest).ok);

    std::string listed;
    ASSERT_TRUE(LookupChecksum(ctx.PackagesDir() + "/" + kSha256ListingName, pkg.package_file, listed).ok);
    std::string actual;
    ASSERT_TRUE(Sha256HexFile(pkg.artifact_path, actual).ok);
    EXPECT_EQ(listed, actual);

    std::string md5;
    ASSERT_TRUE(LookupChecksum(ctx.PackagesDir() + "/" + kMd5ListingName, pkg.package_file, md5).ok);
    EXPECT_EQ(md5.size(), 32u);
}

TEST_F(ReleasePackagerTest, PackageContainsFullLayout) {
    auto ctx = Context(Config());
    SeedKeys(ctx);
    Package pkg;
    Manifest manifest;
    ASSERT_TRUE(ReleasePackager(ctx).Create(pkg, manifest).ok);

    PackageVerifyReport report;
    auto r = VerifyPackage(pkg.artifact_path, km.certificate_pem, report);
    ASSERT_TRUE(r.ok) << r.msg;
    EXPECT_TRUE(report.checksum_ok);
    EXPECT_TRUE(report.signature_ok);
    EXPECT_TRUE(report.layout_ok);

    for (const char* want : {"bin/demo", "config/default.toml", "scripts/install", "scripts/uninstall", "docs/README"}) {
        EXPECT_NE(std::find(report.entries.begin(), report.entries.end(), want), report.entries.end()) << want;
    }
}

TEST_F(ReleasePackagerTest, MissingToolFailsBeforeAnythingIsWritten) {
    auto cfg = Config();
    cfg.required_tools = {"sh", "relup-missing-tool"};
    Package pkg;
    Manifest manifest;
    auto r = ReleasePackager(Context(cfg)).Create(pkg, manifest);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, ErrorKind::MissingDependency);
    EXPECT_FALSE(fs::exists(tmp.Sub("ws")));
}

TEST_F(ReleasePackagerTest, FailedBuildWritesNothing) {
    auto cfg = Config();
    cfg.build_command = {"sh", "-c", "exit 4"};
    Package pkg;
    Manifest manifest;
    auto r = ReleasePackager(Context(cfg)).Create(pkg, manifest);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, ErrorKind::BuildFailure);
    EXPECT_FALSE(fs::exists(tmp.Sub("ws/packages")));
}

TEST_F(ReleasePackagerTest, PublishedPackageIsNeverReplaced) {
    auto ctx = Context(Config());
    SeedKeys(ctx);
    Package first;
    Manifest manifest;
    ASSERT_TRUE(ReleasePackager(ctx).Create(first, manifest).ok);
    const std::string before = testutil::ReadTextFile(first.artifact_path);

    Package second;
    auto r = ReleasePackager(ctx).Create(second, manifest);
    ASSERT_FALSE(r.ok);
    EXPECT_NE(r.msg.find("already published"), std::string::npos) << r.msg;
    EXPECT_EQ(testutil::ReadTextFile(first.artifact_path), before);
}

TEST_F(ReleasePackagerTest, FailedMetadataCommitLeavesNoArchive) {
    auto ctx = Context(Config());
    SeedKeys(ctx);
    const std::string stem = "demo-1.0.0-abc1234-" + FormatDateUtc(ctx.now);

    // A non-empty directory in place of the metadata file makes its commit fail.
    const std::string meta_path = ctx.PackagesDir() + "/" + stem + ".json";
    fs::create_directories(meta_path);
    testutil::WriteTextFile(meta_path + "/occupied", "x");

    Package pkg;
    Manifest manifest;
    ASSERT_FALSE(ReleasePackager(ctx).Create(pkg, manifest).ok);
    EXPECT_FALSE(fs::exists(ctx.PackagesDir() + "/" + stem + ".tar.gz"));
    EXPECT_FALSE(fs::exists(ctx.PackagesDir() + "/" + stem + ".tar.gz.sig"));
    EXPECT_FALSE(fs::exists(ctx.PackagesDir() + "/stable/manifest.json"));
    EXPECT_TRUE(fs::is_empty(ctx.TempDir()));

    fs::remove_all(meta_path);
    auto r = ReleasePackager(ctx).Create(pkg, manifest);
    ASSERT_TRUE(r.ok) << r.msg;
    EXPECT_TRUE(fs::is_regular_file(pkg.metadata_path));
    EXPECT_TRUE(fs::exists(pkg.artifact_path));
}

TEST_F(ReleasePackagerTest, ManifestAccumulatesNewestFirst) {
    auto ctx = Context(Config("1.0.0"));
    SeedKeys(ctx);
    Package pkg;
    Manifest manifest;
    ASSERT_TRUE(ReleasePackager(ctx).Create(pkg, manifest).ok);

    auto next = Context(Config("1.1.0"));
    ASSERT_TRUE(ReleasePackager(next).Create(pkg, manifest).ok);

    ASSERT_EQ(manifest.releases.size(), 2u);
    EXPECT_EQ(manifest.releases[0].version, "1.1.0");
    EXPECT_EQ(manifest.latest_version, "1.1.0");
}

TEST_F(ReleasePackagerTest, VerifyDetectsTampering) {
    auto ctx = Context(Config());
    SeedKeys(ctx);
    Package pkg;
    Manifest manifest;
    ASSERT_TRUE(ReleasePackager(ctx).Create(pkg, manifest).ok);

    {
        std::ofstream os(pkg.artifact_path, std::ios::binary | std::ios::app);
        os << "x";
    }
    PackageVerifyReport report;
    auto r = VerifyPackage(pkg.artifact_path, km.certificate_pem, report);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, ErrorKind::ChecksumMismatch);
    EXPECT_FALSE(report.checksum_ok);
}

TEST_F(ReleasePackagerTest, VerifyRequiresDetachedSignature) {
    auto ctx = Context(Config());
    SeedKeys(ctx);
    Package pkg;
    Manifest manifest;
    ASSERT_TRUE(ReleasePackager(ctx).Create(pkg, manifest).ok);
    fs::remove(pkg.signature_path);

    PackageVerifyReport report;
    auto r = VerifyPackage(pkg.artifact_path, km.certificate_pem, report);
    EXPECT_EQ(r.kind, ErrorKind::SignatureMissing);
    EXPECT_TRUE(report.checksum_ok);
    EXPECT_FALSE(report.signature_ok);
}

TEST_F(ReleasePackagerTest, VerifyFallsBackToChecksumListing) {
    auto ctx = Context(Config());
    SeedKeys(ctx);
    Package pkg;
    Manifest manifest;
    ASSERT_TRUE(ReleasePackager(ctx).Create(pkg, manifest).ok);
    fs::remove(pkg.metadata_path);

    PackageVerifyReport report;
    auto r = VerifyPackage(pkg.artifact_path, km.certificate_pem, report);
    EXPECT_TRUE(r.ok) << r.msg;

    fs::remove(ctx.PackagesDir() + "/" + kSha256ListingName);
    r = VerifyPackage(pkg.artifact_path, km.certificate_pem, report);
    EXPECT_EQ(r.kind, ErrorKind::InvalidManifest);
}

TEST_F(ReleasePackagerTest, VerifyRejectsIncompleteLayout) {
    const std::string pkg_path = tmp.Sub("bare-1.0.0.tar.gz");
    testutil::WriteBytesFile(pkg_path, testutil::BuildTar({{"bin/demo", "x"}, {"docs/README", "r"}}, true));

    std::vector<std::uint8_t> sig;
    ASSERT_TRUE(SignFile(km, pkg_path, sig).ok);
    testutil::WriteBytesFile(pkg_path + ".sig", sig);
    std::string sha;
    ASSERT_TRUE(Sha256HexFile(pkg_path, sha).ok);
    testutil::WriteTextFile(tmp.Sub(kSha256ListingName), FormatChecksumListing({{sha, "bare-1.0.0.tar.gz"}}));

    PackageVerifyReport report;
    auto r = VerifyPackage(pkg_path, km.certificate_pem, report);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, ErrorKind::InvalidManifest);
    EXPECT_TRUE(report.signature_ok);
    EXPECT_FALSE(report.layout_ok);
}

TEST_F(ReleasePackagerTest, CleanKeepsSigningKeys) {
    auto ctx = Context(Config());
    SeedKeys(ctx);
    Package pkg;
    Manifest manifest;
    ASSERT_TRUE(ReleasePackager(ctx).Create(pkg, manifest).ok);

    ASSERT_TRUE(ReleasePackager(ctx).Clean().ok);
    EXPECT_FALSE(fs::exists(ctx.PackagesDir()));
    EXPECT_FALSE(fs::exists(ctx.BuildDir()));
    EXPECT_FALSE(fs::exists(ctx.TempDir()));
    EXPECT_TRUE(fs::exists(ctx.KeysDir() + "/relup-private.pem"));
}

TEST(ReleaseContextTest, DefaultDownloadBaseIsFileUrl) {
    PackConfig cfg;
    cfg.workspace_dir = "/srv/releases";
    auto ctx = ReleaseContext::FromConfig(cfg);
    EXPECT_EQ(ctx.DownloadBaseUrl(), "file:///srv/releases/packages");

    cfg.download_base_url = "https://updates.example.com/demo";
    EXPECT_EQ(ReleaseContext::FromConfig(cfg).DownloadBaseUrl(), "https://updates.example.com/demo");
}

} // namespace
