#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace relup {

inline constexpr const char* kDefaultPackConfigPath = "/etc/relup/pack.json";
inline constexpr const char* kDefaultUpdateConfigPath = "/etc/relup/update.json";

struct PackConfig {
    std::string product_name;
    std::string binary_name;
    std::string version;
    std::string source_dir = ".";
    std::vector<std::string> build_command;
    std::string built_binary;
    std::string workspace_dir = "~/.relup/releases";
    std::vector<std::string> required_tools;
    std::string channel = "stable";
    std::string download_base_url;
    std::string organization = "relup";
    std::vector<std::string> changelog;
    std::string min_system_version;
    bool critical = false;
    bool rollback_allowed = true;
    std::uint64_t certificate_days = 365;
    std::uint64_t build_timeout_seconds = 1800;
    std::string log_level;

    static Result LoadFromFile(const std::string& path, PackConfig& out);
    static Result FromJson(const nlohmann::json& j, PackConfig& out);
};

struct UpdateConfig {
    std::string install_dir;
    std::string binary_name;
    std::string state_dir = "/var/lib/relup";
    std::string update_url;
    std::string channel = "stable";
    std::string trusted_certificate;
    bool require_signature = true;
    std::uint64_t session_timeout_seconds = 300;
    std::uint64_t terminate_grace_seconds = 5;
    std::uint64_t version_probe_timeout_seconds = 10;
    std::uint64_t backup_retention = 5;
    std::uint64_t download_retries = 2;
    std::string system_version;
    std::vector<std::string> build_command;
    std::string built_binary;
    std::uint64_t build_timeout_seconds = 1800;
    std::string log_level;

    static Result LoadFromFile(const std::string& path, UpdateConfig& out);
    static Result FromJson(const nlohmann::json& j, UpdateConfig& out);
};

} // namespace relup
