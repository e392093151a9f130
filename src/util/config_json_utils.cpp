#include "util/config_json_utils.hpp"

#include <fstream>

namespace relup::config::detail {

namespace {

Result TypeError(const char* key, const char* expected) {
    return Result::Fail(ErrorKind::Config, std::string("'") + key + "' must be " + expected);
}

} // namespace

Result LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out) {
    std::ifstream is(path);
    if (!is.good()) {
        return Result::Fail(ErrorKind::Config, "cannot open " + path);
    }

    try {
        is >> out;
    } catch (const nlohmann::json::exception& e) {
        return Result::Fail(ErrorKind::Config, "invalid JSON in " + path + ": " + e.what());
    }

    if (!out.is_object()) {
        return Result::Fail(ErrorKind::Config, "root must be JSON object: " + path);
    }

    return Result::Ok();
}

Result GetString(const nlohmann::json& j, const char* key, std::string& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return Result::Ok();
    if (!it->is_string())
        return TypeError(key, "a string");
    out = it->get<std::string>();
    return Result::Ok();
}

Result GetStringList(const nlohmann::json& j, const char* key, std::vector<std::string>& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return Result::Ok();
    if (!it->is_array())
        return TypeError(key, "an array of strings");

    std::vector<std::string> items;
    for (const auto& v : *it) {
        if (!v.is_string())
            return TypeError(key, "an array of strings");
        items.push_back(v.get<std::string>());
    }
    out = std::move(items);
    return Result::Ok();
}

Result GetBool(const nlohmann::json& j, const char* key, bool& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return Result::Ok();
    if (!it->is_boolean())
        return TypeError(key, "a boolean");
    out = it->get<bool>();
    return Result::Ok();
}

Result GetU64(const nlohmann::json& j, const char* key, std::uint64_t& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return Result::Ok();
    if (!(it->is_number_unsigned() || it->is_number_integer()))
        return TypeError(key, "a non-negative integer");
    const auto v = it->get<long long>();
    if (v < 0)
        return TypeError(key, "a non-negative integer");
    out = static_cast<std::uint64_t>(v);
    return Result::Ok();
}

} // namespace relup::config::detail
