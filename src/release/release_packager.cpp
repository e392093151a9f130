#include "release/release_packager.hpp"

#include "crypto/digest.hpp"
#include "crypto/key_manager.hpp"
#include "crypto/signature.hpp"
#include "io/file_reader.hpp"
#include "io/file_util.hpp"
#include "manifest/manifest_publisher.hpp"
#include "release/archive_writer.hpp"
#include "release/artifact_tree.hpp"
#include "release/build_step.hpp"
#include "release/checksum_listing.hpp"
#include "release/package_archive_reader.hpp"
#include "system/process_runner.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <algorithm>
#include <filesystem>
#include <set>
#include <string_view>

namespace fs = std::filesystem;

namespace relup {

namespace {

constexpr const char* kArchiveSuffix = ".tar.gz";
constexpr const char* kSignatureSuffix = ".sig";

Result MakeDirs(const std::string& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) return Result::Fail(ec.value(), "cannot create " + dir + ": " + ec.message());
    return Result::Ok();
}

Result RemoveTree(const std::string& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) return Result::Fail(ec.value(), "cannot remove " + path + ": " + ec.message());
    return Result::Ok();
}

// Published files are never replaced.
Result MoveIntoStore(const std::string& src, const std::string& dst) {
    std::error_code ec;
    if (fs::exists(dst, ec)) return Result::Fail(ErrorKind::Io, "already published: " + dst);
    fs::rename(src, dst, ec);
    if (ec) return Result::Fail(ec.value(), "cannot move " + src + " to " + dst + ": " + ec.message());
    return Result::Ok();
}

bool EndsWith(const std::string& s, std::string_view sfx) {
    return s.size() > sfx.size() && s.compare(s.size() - sfx.size(), sfx.size(), sfx) == 0;
}

std::string ArchiveStem(const std::string& file_name) {
    if (EndsWith(file_name, kArchiveSuffix)) {
        return file_name.substr(0, file_name.size() - std::string_view(kArchiveSuffix).size());
    }
    return fs::path(file_name).stem().string();
}

std::string AsString(std::span<const std::uint8_t> bytes) {
    return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

} // namespace

ReleaseContext ReleaseContext::FromConfig(const PackConfig& cfg) {
    ReleaseContext ctx;
    ctx.config = cfg;
    ctx.workspace_dir = ExpandHome(cfg.workspace_dir);
    return ctx;
}

std::string ReleaseContext::DownloadBaseUrl() const {
    if (!config.download_base_url.empty()) return config.download_base_url;
    std::error_code ec;
    const fs::path abs = fs::absolute(PackagesDir(), ec);
    return "file://" + (ec ? PackagesDir() : abs.lexically_normal().string());
}

ReleasePackager::ReleasePackager(ReleaseContext ctx) : ctx_(std::move(ctx)) {}

Result ReleasePackager::Preflight() const {
    const auto& cfg = ctx_.config;
    std::vector<std::string> tools = cfg.required_tools;
    if (!cfg.build_command.empty()) tools.push_back(cfg.build_command.front());

    LogInfo("Checking dependencies...");
    if (auto r = CheckRequiredTools(tools); !r.ok) return r;
    LogInfo("All dependencies found");
    return Result::Ok();
}

Result ReleasePackager::RunBuild() const {
    const auto& cfg = ctx_.config;
    BuildStep step;
    step.command = cfg.build_command;
    step.working_dir = cfg.source_dir;
    step.built_binary = cfg.built_binary;
    step.timeout = std::chrono::seconds(cfg.build_timeout_seconds);
    return RunBuildStep(step);
}

Result ReleasePackager::Create(Package& out_pkg, Manifest& out_manifest) const {
    if (auto r = Preflight(); !r.ok) return r;
    if (auto r = RunBuild(); !r.ok) return r;

    Package pkg;
    if (auto r = BuildRelease(ctx_.config.built_binary, pkg); !r.ok) return r;

    Manifest manifest;
    if (auto r = Publish(pkg, manifest); !r.ok) return r;
    if (auto r = WriteChecksumListings(); !r.ok) return r;
    if (auto r = WriteReleaseSummary(pkg); !r.ok) return r;

    LogInfo("Release %s published to channel %s", pkg.identity.FullVersion().c_str(),
            manifest.channel.c_str());
    out_pkg = std::move(pkg);
    out_manifest = std::move(manifest);
    return Result::Ok();
}

Result ReleasePackager::BuildRelease(const std::string& source_artifact, Package& out) const {
    const auto& cfg = ctx_.config;

    IdentityInputs in;
    in.declared_version = cfg.version;
    in.source_dir = cfg.source_dir;
    in.now = ctx_.now;
    in.revision_override = ctx_.revision_override;
    in.platform_override = ctx_.platform_override;

    ReleaseIdentity id;
    if (auto r = DeriveReleaseIdentity(in, id); !r.ok) return r;

    const std::string stem = cfg.binary_name + "-" + id.FullVersion();
    const std::string package_file = stem + kArchiveSuffix;
    const std::string final_archive = ctx_.PackagesDir() + "/" + package_file;
    const std::string final_sig = final_archive + kSignatureSuffix;
    const std::string final_meta = ctx_.PackagesDir() + "/" + stem + ".json";

    std::error_code ec;
    if (fs::exists(final_archive, ec)) {
        return Result::Fail(ErrorKind::Io, "package " + package_file + " is already published");
    }

    for (const auto& d : {ctx_.BuildDir(), ctx_.PackagesDir(), ctx_.KeysDir(), ctx_.TempDir()}) {
        if (auto r = MakeDirs(d); !r.ok) return r;
    }

    const std::string tree_dir = ctx_.BuildDir() + "/" + stem;
    if (auto r = RemoveTree(tree_dir); !r.ok) return r;

    ArtifactTreeInputs tree;
    tree.product_name = cfg.product_name;
    tree.binary_name = cfg.binary_name;
    tree.built_binary = source_artifact;
    tree.identity = id;
    if (auto r = AssembleArtifactTree(tree, tree_dir); !r.ok) return r;

    const std::string tmp_archive = ctx_.TempDir() + "/" + package_file;
    const std::string tmp_sig = tmp_archive + kSignatureSuffix;
    const std::string tmp_meta = ctx_.TempDir() + "/" + stem + ".json";
    const std::string tmp_cert = ctx_.TempDir() + "/" + stem + ".pem";
    auto discard_temp = [&]() {
        std::error_code rm_ec;
        for (const auto& p : {tmp_archive, tmp_sig, tmp_meta, tmp_cert}) fs::remove(p, rm_ec);
    };
    discard_temp();

    LogInfo("Creating package %s", package_file.c_str());
    if (auto r = WriteTarGz(tree_dir, tmp_archive); !r.ok) {
        discard_temp();
        return r;
    }

    KeyManager::Options kopt;
    kopt.key_dir = ctx_.KeysDir();
    kopt.organization = cfg.organization;
    kopt.common_name = cfg.product_name + " Update Package";
    kopt.certificate_days = static_cast<int>(cfg.certificate_days);
    KeyManager keys(kopt);

    KeyMaterial km;
    std::vector<std::uint8_t> signature;
    Result sr = keys.EnsureKeyMaterial(km);
    if (sr.ok) sr = SignFile(km, tmp_archive, signature);
    if (sr.ok) sr = VerifyFileSignature(km.certificate_pem, tmp_archive, signature);
    if (!sr.ok) {
        discard_temp();
        return Result::Fail(ErrorKind::SigningFailure, "signing " + package_file + ": " + sr.msg);
    }

    Package pkg;
    pkg.name = cfg.binary_name;
    pkg.identity = id;
    pkg.package_file = package_file;
    pkg.artifact_path = final_archive;
    pkg.signature_path = final_sig;
    pkg.metadata_path = final_meta;
    pkg.signature = std::move(signature);
    pkg.certificate_pem = km.certificate_pem;
    pkg.created_at = FormatIso8601Utc(ctx_.now);
    pkg.certificate_path = ctx_.PackagesDir() + "/" + kopt.file_prefix + "-cert-" +
                           km.certificate_fingerprint.substr(0, 16) + ".pem";

    if (auto r = Sha256HexFile(tmp_archive, pkg.sha256); !r.ok) {
        discard_temp();
        return r;
    }
    pkg.size_bytes = fs::file_size(tmp_archive, ec);
    if (ec) {
        discard_temp();
        return Result::Fail(ec.value(), "stat " + tmp_archive + ": " + ec.message());
    }

    // Everything is staged in temp/ first; the archive is the last file to
    // enter packages/, so its presence means the release is complete.
    Result pr = WriteFileAtomic(tmp_sig, AsString(pkg.signature), 0644);
    if (pr.ok) pr = WriteFileAtomic(tmp_cert, pkg.certificate_pem, 0644);
    if (pr.ok) pr = WriteFileAtomic(tmp_meta, PackageMetadataCodec::Serialize(pkg), 0644);
    if (!pr.ok) {
        discard_temp();
        return pr;
    }

    // No archive in packages/ means no release; a .sig or .json left there
    // by an interrupted run is replaced.
    auto commit = [&](const std::string& src, const std::string& dst) {
        fs::rename(src, dst, ec);
        if (ec) return Result::Fail(ec.value(), "cannot move " + src + " to " + dst + ": " + ec.message());
        return Result::Ok();
    };
    Result cr = commit(tmp_cert, pkg.certificate_path);
    if (cr.ok) cr = commit(tmp_sig, final_sig);
    if (cr.ok) cr = commit(tmp_meta, final_meta);
    if (cr.ok) cr = MoveIntoStore(tmp_archive, final_archive);
    if (!cr.ok) {
        std::error_code rm_ec;
        fs::remove(final_sig, rm_ec);
        fs::remove(final_meta, rm_ec);
        discard_temp();
        return cr;
    }

    LogInfo("Package: %s (%llu bytes, sha256 %s)", final_archive.c_str(),
            (unsigned long long)pkg.size_bytes, pkg.sha256.c_str());
    out = std::move(pkg);
    return Result::Ok();
}

Result ReleasePackager::Publish(const Package& pkg, Manifest& out) const {
    const auto& cfg = ctx_.config;
    const std::string channel_dir = ctx_.PackagesDir() + "/" + cfg.channel;
    if (auto r = MakeDirs(channel_dir); !r.ok) return r;

    const std::string cert_name = fs::path(pkg.certificate_path).filename().string();
    const std::pair<std::string, std::string> copies[] = {
        {pkg.artifact_path, channel_dir + "/" + pkg.package_file},
        {pkg.signature_path, channel_dir + "/" + pkg.package_file + kSignatureSuffix},
        {pkg.certificate_path, channel_dir + "/" + cert_name},
    };
    for (const auto& [src, dst] : copies) {
        if (auto r = CopyFileContents(src, dst, /*exclusive=*/false, 0644); !r.ok) return r;
    }

    ManifestEntry e;
    e.version = pkg.identity.semantic_version;
    e.release_date = pkg.created_at;
    e.changelog = cfg.changelog;
    e.download_url = JoinUrl(JoinUrl(ctx_.DownloadBaseUrl(), cfg.channel), pkg.package_file);
    e.checksum = pkg.sha256;
    e.signature = Sha256Hex(std::span<const std::uint8_t>(pkg.signature));
    e.size_bytes = pkg.size_bytes;
    e.min_system_version = cfg.min_system_version;
    e.critical = cfg.critical;
    e.rollback_allowed = cfg.rollback_allowed;

    ManifestPublisher publisher(ctx_.PackagesDir());
    return publisher.Publish(cfg.channel, e, out, ctx_.now);
}

Result ReleasePackager::WriteChecksumListings() const {
    const std::vector<std::string> suffixes = {kArchiveSuffix, kSignatureSuffix, ".json"};
    if (auto r = WriteChecksumListing(ctx_.PackagesDir(), kSha256ListingName, DigestAlgorithm::Sha256, suffixes);
        !r.ok) {
        return r;
    }
    return WriteChecksumListing(ctx_.PackagesDir(), kMd5ListingName, DigestAlgorithm::Md5, suffixes);
}

Result ReleasePackager::WriteReleaseSummary(const Package& pkg) const {
    const auto& id = pkg.identity;
    const auto& cfg = ctx_.config;

    std::string s;
    s += "# " + cfg.product_name + " Release Summary\n\n";
    s += "## Build Information\n";
    s += "- **Version**: " + id.semantic_version + "\n";
    s += "- **Git Commit**: " + id.source_revision + "\n";
    s += "- **Build Date**: " + id.build_date + "\n";
    s += "- **Target Platform**: " + id.target_platform + "\n";
    s += "- **Full Version**: " + id.FullVersion() + "\n";
    s += "- **Channel**: " + cfg.channel + "\n\n";

    s += "## Package Files\n\n";
    std::vector<std::pair<std::string, std::uintmax_t>> files;
    std::error_code ec;
    for (fs::directory_iterator it(ctx_.PackagesDir(), ec), end; !ec && it != end; it.increment(ec)) {
        const std::string name = it->path().filename().string();
        if (!it->is_regular_file(ec) || !EndsWith(name, kArchiveSuffix)) continue;
        files.emplace_back(name, it->file_size(ec));
    }
    std::sort(files.begin(), files.end());
    for (const auto& [name, size] : files) {
        s += "- `" + name + "` (" + std::to_string(size) + " bytes)\n";
    }

    std::string listing;
    if (auto r = ReadFileToString(ctx_.PackagesDir() + "/" + kSha256ListingName, listing); !r.ok) {
        listing = "No checksums available\n";
    }
    s += "\n## Checksums\n\n```\n" + listing + "```\n\n";

    s += "## Installation\n\n";
    s += "1. Download `" + pkg.package_file + "` and `" + pkg.package_file + kSignatureSuffix + "`\n";
    s += "2. Extract: `tar -xzf " + pkg.package_file + "`\n";
    s += "3. Install: `sudo ./scripts/install`\n\n";
    s += "## Verification\n\n```\ncd " + ctx_.PackagesDir() + "\nsha256sum -c " + kSha256ListingName + "\n```\n";

    return WriteFileAtomic(ctx_.PackagesDir() + "/" + kReleaseSummaryName, s, 0644);
}

Result ReleasePackager::Clean() const {
    for (const auto& d : {ctx_.BuildDir(), ctx_.TempDir(), ctx_.PackagesDir()}) {
        LogInfo("Removing %s", d.c_str());
        if (auto r = RemoveTree(d); !r.ok) return r;
    }
    LogInfo("Workspace cleaned (keys kept in %s)", ctx_.KeysDir().c_str());
    return Result::Ok();
}

Result VerifyPackage(const std::string& package_path,
                     const std::string& certificate_pem,
                     PackageVerifyReport& report) {
    report = PackageVerifyReport{};

    std::error_code ec;
    if (!fs::is_regular_file(package_path, ec)) {
        return Result::Fail(ErrorKind::Io, "no such package: " + package_path);
    }
    report.size_bytes = fs::file_size(package_path, ec);
    if (auto r = Sha256HexFile(package_path, report.sha256); !r.ok) return r;

    const fs::path p(package_path);
    const fs::path dir = p.has_parent_path() ? p.parent_path() : fs::path(".");
    const std::string file_name = p.filename().string();
    const std::string meta_path = (dir / (ArchiveStem(file_name) + ".json")).string();
    const std::string listing_path = (dir / kSha256ListingName).string();

    std::string expected;
    if (fs::exists(meta_path, ec)) {
        std::string text;
        if (auto r = ReadFileToString(meta_path, text); !r.ok) return r;
        auto meta = PackageMetadataCodec::Parse(text);
        if (!meta) return Result::Fail(ErrorKind::InvalidManifest, meta_path + ": " + meta.error());
        if (meta->size_bytes != 0 && meta->size_bytes != report.size_bytes) {
            return Result::Fail(ErrorKind::ChecksumMismatch,
                                "size mismatch: expected " + std::to_string(meta->size_bytes) + ", got " +
                                    std::to_string(report.size_bytes));
        }
        expected = meta->sha256;
    } else if (fs::exists(listing_path, ec)) {
        if (auto r = LookupChecksum(listing_path, file_name, expected); !r.ok) return r;
    }
    if (expected.empty()) {
        return Result::Fail(ErrorKind::InvalidManifest, "no reference checksum for " + file_name);
    }
    if (!HexDigestEquals(expected, report.sha256)) {
        return Result::Fail(ErrorKind::ChecksumMismatch,
                            "checksum mismatch: expected " + expected + ", got " + report.sha256);
    }
    report.checksum_ok = true;
    LogInfo("Checksum OK: %s", report.sha256.c_str());

    const std::string sig_path = package_path + kSignatureSuffix;
    if (!fs::exists(sig_path, ec)) {
        return Result::Fail(ErrorKind::SignatureMissing, "no detached signature " + sig_path);
    }
    if (certificate_pem.empty()) {
        return Result::Fail(ErrorKind::Config, "no certificate to verify the signature against");
    }
    std::vector<std::uint8_t> sig;
    if (auto r = ReadFileBytes(sig_path, sig); !r.ok) return r;
    if (auto r = VerifyFileSignature(certificate_pem, package_path, sig); !r.ok) return r;
    report.signature_ok = true;
    LogInfo("Signature OK");

    FileReader file;
    if (auto r = FileReader::Open(package_path, file); !r.ok) return r;
    PackageArchiveReader archive;
    if (auto r = archive.Open(file); !r.ok) return r;

    std::set<std::string> top_dirs;
    while (true) {
        PackageEntryInfo info;
        bool eof = false;
        if (auto r = archive.Next(info, eof); !r.ok) return r;
        if (eof) break;
        if (auto r = archive.SkipCurrent(); !r.ok) return r;

        const auto slash = info.name.find('/');
        if (slash != std::string::npos) top_dirs.insert(info.name.substr(0, slash));
        report.entries.push_back(std::move(info.name));
    }
    for (const char* d : kArtifactTreeDirs) {
        if (!top_dirs.count(d)) {
            return Result::Fail(ErrorKind::InvalidManifest, std::string("package layout: no files under ") + d + "/");
        }
    }
    report.layout_ok = true;
    LogInfo("Layout OK (%zu files)", report.entries.size());
    return Result::Ok();
}

} // namespace relup
