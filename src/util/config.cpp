#include "util/config.hpp"

#include "manifest/manifest.hpp"
#include "util/config_json_utils.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

namespace relup {

using namespace config::detail;

namespace {

Result CheckChannel(std::string& channel) {
    auto normalized = NormalizeChannel(channel);
    if (!normalized) return Result::Fail(ErrorKind::Config, "unknown channel: " + channel);
    channel = *normalized;
    return Result::Ok();
}

Result CheckLogLevel(const std::string& level) {
    if (!level.empty() && !ParseLogLevel(level)) {
        return Result::Fail(ErrorKind::Config, "unknown log_level: " + level);
    }
    return Result::Ok();
}

} // namespace

Result PackConfig::FromJson(const nlohmann::json& j, PackConfig& out) {
    PackConfig c;

    for (Result r : {
             GetString(j, "product_name", c.product_name),
             GetString(j, "binary_name", c.binary_name),
             GetString(j, "version", c.version),
             GetString(j, "source_dir", c.source_dir),
             GetStringList(j, "build_command", c.build_command),
             GetString(j, "built_binary", c.built_binary),
             GetString(j, "workspace_dir", c.workspace_dir),
             GetStringList(j, "required_tools", c.required_tools),
             GetString(j, "channel", c.channel),
             GetString(j, "download_base_url", c.download_base_url),
             GetString(j, "organization", c.organization),
             GetStringList(j, "changelog", c.changelog),
             GetString(j, "min_system_version", c.min_system_version),
             GetBool(j, "critical", c.critical),
             GetBool(j, "rollback_allowed", c.rollback_allowed),
             GetU64(j, "certificate_days", c.certificate_days),
             GetU64(j, "build_timeout_seconds", c.build_timeout_seconds),
             GetString(j, "log_level", c.log_level),
         }) {
        if (!r.ok) return r;
    }

    if (c.binary_name.empty()) return Result::Fail(ErrorKind::Config, "missing binary_name");
    if (c.version.empty()) return Result::Fail(ErrorKind::Config, "missing version");
    if (c.built_binary.empty()) return Result::Fail(ErrorKind::Config, "missing built_binary");
    if (c.product_name.empty()) c.product_name = c.binary_name;
    if (c.certificate_days == 0) return Result::Fail(ErrorKind::Config, "certificate_days must be positive");
    if (auto r = CheckChannel(c.channel); !r.ok) return r;
    if (auto r = CheckLogLevel(c.log_level); !r.ok) return r;

    c.workspace_dir = ExpandHome(c.workspace_dir);
    c.source_dir = ExpandHome(c.source_dir);
    c.built_binary = ExpandHome(c.built_binary);

    out = std::move(c);
    return Result::Ok();
}

Result PackConfig::LoadFromFile(const std::string& path, PackConfig& out) {
    nlohmann::json j;
    if (auto r = LoadJsonObjectFromFile(path, j); !r.ok) return r;
    if (auto r = FromJson(j, out); !r.ok) return Result::Fail(ErrorKind::Config, path + ": " + r.msg);
    return Result::Ok();
}

Result UpdateConfig::FromJson(const nlohmann::json& j, UpdateConfig& out) {
    UpdateConfig c;

    for (Result r : {
             GetString(j, "install_dir", c.install_dir),
             GetString(j, "binary_name", c.binary_name),
             GetString(j, "state_dir", c.state_dir),
             GetString(j, "update_url", c.update_url),
             GetString(j, "channel", c.channel),
             GetString(j, "trusted_certificate", c.trusted_certificate),
             GetBool(j, "require_signature", c.require_signature),
             GetU64(j, "session_timeout_seconds", c.session_timeout_seconds),
             GetU64(j, "terminate_grace_seconds", c.terminate_grace_seconds),
             GetU64(j, "version_probe_timeout_seconds", c.version_probe_timeout_seconds),
             GetU64(j, "backup_retention", c.backup_retention),
             GetU64(j, "download_retries", c.download_retries),
             GetString(j, "system_version", c.system_version),
             GetStringList(j, "build_command", c.build_command),
             GetString(j, "built_binary", c.built_binary),
             GetU64(j, "build_timeout_seconds", c.build_timeout_seconds),
             GetString(j, "log_level", c.log_level),
         }) {
        if (!r.ok) return r;
    }

    if (c.install_dir.empty()) return Result::Fail(ErrorKind::Config, "missing install_dir");
    if (c.binary_name.empty()) return Result::Fail(ErrorKind::Config, "missing binary_name");
    if (c.state_dir.empty()) return Result::Fail(ErrorKind::Config, "missing state_dir");
    if (c.session_timeout_seconds == 0) return Result::Fail(ErrorKind::Config, "session_timeout_seconds must be positive");
    if (auto r = CheckChannel(c.channel); !r.ok) return r;
    if (auto r = CheckLogLevel(c.log_level); !r.ok) return r;

    c.install_dir = ExpandHome(c.install_dir);
    c.state_dir = ExpandHome(c.state_dir);
    c.trusted_certificate = ExpandHome(c.trusted_certificate);

    out = std::move(c);
    return Result::Ok();
}

Result UpdateConfig::LoadFromFile(const std::string& path, UpdateConfig& out) {
    nlohmann::json j;
    if (auto r = LoadJsonObjectFromFile(path, j); !r.ok) return r;
    if (auto r = FromJson(j, out); !r.ok) return Result::Fail(ErrorKind::Config, path + ": " + r.msg);
    return Result::Ok();
}

} // namespace relup
