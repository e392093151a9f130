#include "update/installation_context.hpp"

#include "io/file_util.hpp"
#include "util/path_utils.hpp"

namespace relup {

Result InstallationContext::FromConfig(const UpdateConfig& cfg, InstallationContext& out) {
    InstallationContext ctx;
    ctx.install_dir = cfg.install_dir;
    ctx.binary_name = cfg.binary_name;
    ctx.state_dir = cfg.state_dir;
    ctx.update_url = cfg.update_url;
    ctx.channel = cfg.channel;
    ctx.trusted_certificate_path = cfg.trusted_certificate;
    ctx.require_signature = cfg.require_signature;
    ctx.session_timeout = std::chrono::seconds(cfg.session_timeout_seconds);
    ctx.terminate_grace = std::chrono::seconds(cfg.terminate_grace_seconds);
    ctx.version_probe_timeout = std::chrono::seconds(cfg.version_probe_timeout_seconds);
    ctx.backup_retention = static_cast<std::size_t>(cfg.backup_retention);
    ctx.download_retries = static_cast<unsigned>(cfg.download_retries);
    ctx.system_version = cfg.system_version;

    if (!ctx.trusted_certificate_path.empty()) {
        if (auto r = ReadFileToString(ctx.trusted_certificate_path, ctx.trusted_certificate_pem); !r.ok) {
            return Result::Fail(ErrorKind::Config, "cannot read trusted_certificate: " + r.msg);
        }
    }

    out = std::move(ctx);
    return Result::Ok();
}

std::string InstallationContext::ManifestUrl() const {
    return JoinUrl(JoinUrl(update_url, channel), "manifest.json");
}

} // namespace relup
