#pragma once

#include "util/config.hpp"
#include "util/result.hpp"

#include <chrono>
#include <cstddef>
#include <string>

namespace relup {

// One installation: where the binary lives, where its state goes and how
// updates for it are fetched and trusted. Every update component receives
// this by value, so tests run against isolated directories.
struct InstallationContext {
    std::string install_dir;
    std::string binary_name;
    std::string state_dir;
    std::string update_url;
    std::string channel = "stable";

    std::string trusted_certificate_path;
    std::string trusted_certificate_pem;
    bool require_signature = true;

    std::chrono::seconds session_timeout{300};
    std::chrono::milliseconds terminate_grace{std::chrono::seconds(5)};
    std::chrono::milliseconds version_probe_timeout{std::chrono::seconds(10)};
    std::chrono::milliseconds retry_base_delay{1000};
    std::size_t backup_retention = 5;
    unsigned download_retries = 2;

    std::string system_version;

    // Reads the trusted certificate when one is configured.
    static Result FromConfig(const UpdateConfig& cfg, InstallationContext& out);

    std::string BinaryPath() const { return install_dir + "/" + binary_name; }
    std::string StagingPath() const { return install_dir + "/." + binary_name + ".relup-new"; }
    std::string LockPath() const { return install_dir + "/." + binary_name + ".relup.lock"; }
    std::string BackupDir() const { return state_dir + "/backups"; }
    std::string DownloadDir() const { return state_dir + "/downloads"; }
    std::string VersionRecordPath() const { return state_dir + "/version.json"; }
    // <update_url>/<channel>/manifest.json
    std::string ManifestUrl() const;
};

} // namespace relup
