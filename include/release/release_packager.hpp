#pragma once

#include "manifest/manifest.hpp"
#include "release/package.hpp"
#include "util/config.hpp"
#include "util/result.hpp"
#include "util/time_utils.hpp"

#include <string>
#include <vector>

namespace relup {

// Everything the packager needs, resolved from PackConfig. Passed by value;
// there is no process-wide packaging state.
struct ReleaseContext {
    PackConfig config;
    std::string workspace_dir;
    Clock::time_point now = Clock::now();
    // Fixed identity parts for reproducible runs; empty means "detect".
    std::string revision_override;
    std::string platform_override;

    static ReleaseContext FromConfig(const PackConfig& cfg);

    std::string BuildDir() const { return workspace_dir + "/build"; }
    std::string PackagesDir() const { return workspace_dir + "/packages"; }
    std::string KeysDir() const { return workspace_dir + "/keys"; }
    std::string TempDir() const { return workspace_dir + "/temp"; }
    // download_base_url, or a file:// URL for PackagesDir().
    std::string DownloadBaseUrl() const;
};

struct PackageVerifyReport {
    std::string sha256;
    std::uint64_t size_bytes = 0;
    bool checksum_ok = false;
    bool signature_ok = false;
    bool layout_ok = false;
    std::vector<std::string> entries;
};

inline constexpr const char* kSha256ListingName = "checksums.sha256";
inline constexpr const char* kMd5ListingName = "checksums.md5";
inline constexpr const char* kReleaseSummaryName = "RELEASE_SUMMARY.md";

class ReleasePackager {
  public:
    explicit ReleasePackager(ReleaseContext ctx);

    // Pre-flight, build, BuildRelease, Publish, checksum listings and the
    // release summary, in that order. Nothing is written before pre-flight
    // and the build have passed.
    Result Create(Package& out_pkg, Manifest& out_manifest) const;

    // Every required tool (and the build program) must resolve in PATH.
    Result Preflight() const;

    // Runs build_command in source_dir. A no-op without a build_command, but
    // built_binary must exist either way.
    Result RunBuild() const;

    // Assemble, archive, sign and store source_artifact as a Package. The
    // archive only reaches the packages directory once it is signed.
    Result BuildRelease(const std::string& source_artifact, Package& out) const;

    // Copies the package into the channel directory and adds it to that
    // channel's manifest.
    Result Publish(const Package& pkg, Manifest& out) const;

    Result WriteChecksumListings() const;
    Result WriteReleaseSummary(const Package& pkg) const;

    // Removes build/, temp/ and packages/. keys/ is left alone.
    Result Clean() const;

    const ReleaseContext& Context() const { return ctx_; }

  private:
    ReleaseContext ctx_;
};

// Recomputes sha256 of package_path and compares it with the sibling
// metadata JSON (or the directory's checksums.sha256), checks the detached
// <package>.sig against certificate_pem and the archive layout. Fails with
// the first problem's ErrorKind; report is filled as far as checking got.
Result VerifyPackage(const std::string& package_path,
                     const std::string& certificate_pem,
                     PackageVerifyReport& report);

} // namespace relup
