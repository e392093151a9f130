#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace relup::config::detail {

Result LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out);

// Each getter leaves out untouched when the key is absent or null and fails
// with ErrorKind::Config when it is present with the wrong type.
Result GetString(const nlohmann::json& j, const char* key, std::string& out);
Result GetStringList(const nlohmann::json& j, const char* key, std::vector<std::string>& out);
Result GetBool(const nlohmann::json& j, const char* key, bool& out);
Result GetU64(const nlohmann::json& j, const char* key, std::uint64_t& out);

} // namespace relup::config::detail
