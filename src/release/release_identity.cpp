#include "release/release_identity.hpp"

#include "release/semantic_version.hpp"
#include "system/process_runner.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <cctype>
#include <sys/utsname.h>

namespace relup {

namespace {

std::string Trim(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.pop_back();
    std::size_t b = 0;
    while (b < s.size() && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    return s.substr(b);
}

std::string Lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

std::string DetectRevision(const std::string& source_dir) {
    if (!FindExecutable("git")) return "unknown";

    ProcessOptions opt;
    opt.timeout = std::chrono::seconds(10);
    opt.working_dir = source_dir;

    ProcessResult pr;
    auto r = RunProcess({"git", "rev-parse", "--short", "HEAD"}, opt, pr);
    if (!r.is_ok() || !pr.Succeeded()) {
        LogDebug("git rev-parse failed in %s", source_dir.c_str());
        return "unknown";
    }
    std::string rev = Trim(pr.output);
    if (rev.empty() || rev.find_first_of(" \n") != std::string::npos) return "unknown";
    return rev;
}

} // namespace

std::string ReleaseIdentity::FullVersion() const {
    return semantic_version + "-" + source_revision + "-" + build_date;
}

std::string DetectHostPlatform() {
    struct utsname u{};
    if (::uname(&u) != 0) return "unknown-unknown";
    return std::string(u.machine) + "-" + Lower(u.sysname);
}

Result DeriveReleaseIdentity(const IdentityInputs& in, ReleaseIdentity& out) {
    auto parsed = SemanticVersion::Parse(in.declared_version);
    if (!parsed) {
        return Result::Fail(ErrorKind::Config,
                            "invalid version '" + in.declared_version + "': " + parsed.error());
    }

    ReleaseIdentity id;
    id.semantic_version = in.declared_version;
    id.source_revision = in.revision_override.empty() ? DetectRevision(in.source_dir) : in.revision_override;
    id.build_date = FormatDateUtc(in.now);
    id.target_platform = in.platform_override.empty() ? DetectHostPlatform() : in.platform_override;

    LogInfo("Version: %s", id.semantic_version.c_str());
    LogInfo("Git Commit: %s", id.source_revision.c_str());
    LogInfo("Build Date: %s", id.build_date.c_str());
    LogInfo("Target Platform: %s", id.target_platform.c_str());
    LogInfo("Full Version: %s", id.FullVersion().c_str());

    out = std::move(id);
    return Result::Ok();
}

} // namespace relup
