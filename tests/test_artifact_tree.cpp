#include "release/artifact_tree.hpp"
#include "release/archive_writer.hpp"
#include "release/package_archive_reader.hpp"
#include "io/file_reader.hpp"

#include "testing.hpp"

#include <filesystem>
#include <gtest/gtest.h>

using namespace relup;
namespace fs = std::filesystem;

namespace {

ArtifactTreeInputs Inputs(const std::string& built) {
    ArtifactTreeInputs in;
    in.product_name = "Demo";
    in.binary_name = "demo";
    in.built_binary = built;
    in.identity = {.semantic_version = "2.1.0",
                   .source_revision = "f00dbab",
                   .build_date = "2026-10-19",
                   .target_platform = "aarch64-linux"};
    return in;
}

TEST(ArtifactTreeTest, LaysOutEveryDirectory) {
    testutil::TemporaryDirectory tmp;
    testutil::WriteVersionBinary(tmp.Sub("built"), "2.1.0");

    ASSERT_TRUE(AssembleArtifactTree(Inputs(tmp.Sub("built")), tmp.Sub("tree")).ok);

    for (const char* rel : {"bin/demo", "config/default.toml", "scripts/install", "scripts/uninstall", "docs/README"}) {
        EXPECT_TRUE(fs::is_regular_file(tmp.Sub("tree/") + rel)) << rel;
    }
    const auto exec = fs::perms::owner_exec;
    EXPECT_EQ(fs::status(tmp.Sub("tree/bin/demo")).permissions() & exec, exec);
    EXPECT_EQ(fs::status(tmp.Sub("tree/scripts/install")).permissions() & exec, exec);
    EXPECT_EQ(testutil::ReadTextFile(tmp.Sub("tree/bin/demo")), testutil::VersionScript("2.1.0"));
}

TEST(ArtifactTreeTest, TemplatesCarryTheIdentity) {
    auto in = Inputs("unused");
    const std::string cfg = RenderDefaultConfig(in);
    EXPECT_NE(cfg.find("version = \"2.1.0\""), std::string::npos);
    EXPECT_NE(cfg.find("install_dir = \"/opt/demo\""), std::string::npos);

    const std::string readme = RenderReadme(in);
    EXPECT_NE(readme.find("2.1.0-f00dbab-2026-10-19"), std::string::npos);
    EXPECT_NE(readme.find("aarch64-linux"), std::string::npos);

    in.install_dir = "/srv/demo";
    EXPECT_NE(RenderInstallScript(in).find("INSTALL_DIR=\"/srv/demo\""), std::string::npos);
    EXPECT_EQ(RenderUninstallScript(in).rfind("#!/bin/sh\n", 0), 0u);
}

TEST(ArtifactTreeTest, ExistingTreeIsRefused) {
    testutil::TemporaryDirectory tmp;
    testutil::WriteVersionBinary(tmp.Sub("built"), "2.1.0");
    fs::create_directories(tmp.Sub("tree"));

    auto r = AssembleArtifactTree(Inputs(tmp.Sub("built")), tmp.Sub("tree"));
    ASSERT_FALSE(r.ok);
    EXPECT_TRUE(fs::is_empty(tmp.Sub("tree")));
}

TEST(ArtifactTreeTest, MissingBinaryIsBuildFailure) {
    testutil::TemporaryDirectory tmp;
    auto r = AssembleArtifactTree(Inputs(tmp.Sub("nope")), tmp.Sub("tree"));
    EXPECT_EQ(r.kind, ErrorKind::BuildFailure);
}

TEST(ArchiveWriterTest, TreeRoundTripsThroughTarGz) {
    testutil::TemporaryDirectory tmp;
    testutil::WriteVersionBinary(tmp.Sub("built"), "2.1.0");
    ASSERT_TRUE(AssembleArtifactTree(Inputs(tmp.Sub("built")), tmp.Sub("tree")).ok);
    ASSERT_TRUE(WriteTarGz(tmp.Sub("tree"), tmp.Sub("pkg.tar.gz")).ok);

    FileReader file;
    ASSERT_TRUE(FileReader::Open(tmp.Sub("pkg.tar.gz"), file).ok);
    PackageArchiveReader reader;
    ASSERT_TRUE(reader.Open(file).ok);

    std::vector<std::string> names;
    while (true) {
        PackageEntryInfo info;
        bool eof = false;
        ASSERT_TRUE(reader.Next(info, eof).ok);
        if (eof) break;
        ASSERT_TRUE(reader.SkipCurrent().ok);
        names.push_back(info.name);
    }
    const std::vector<std::string> expected = {"bin/demo", "config/default.toml", "docs/README",
                                               "scripts/install", "scripts/uninstall"};
    EXPECT_EQ(names, expected);
}

} // namespace
