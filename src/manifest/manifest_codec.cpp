#include "manifest/manifest_codec.hpp"

#include <nlohmann/json.hpp>

namespace relup {

using json = nlohmann::json;

namespace {

std::expected<ManifestEntry, std::string> ParseEntry(const json& item, std::size_t index) {
    if (!item.is_object()) {
        return std::unexpected("release #" + std::to_string(index) + " must be an object");
    }

    ManifestEntry e;
    e.version = item.value("version", "");
    if (e.version.empty()) {
        return std::unexpected("release #" + std::to_string(index) + " has no version");
    }
    e.release_date = item.value("release_date", "");
    e.download_url = item.value("download_url", "");
    e.checksum = item.value("checksum", "");
    e.size_bytes = item.value("size", 0ULL);
    e.critical = item.value("critical", false);
    e.rollback_allowed = item.value("rollback_allowed", true);

    // "none" is what unsigned legacy manifests carry.
    if (auto it = item.find("signature"); it != item.end() && it->is_string()) {
        e.signature = it->get<std::string>();
        if (e.signature == "none") e.signature.clear();
    }
    if (auto it = item.find("min_system_version"); it != item.end() && it->is_string()) {
        e.min_system_version = it->get<std::string>();
    }
    if (auto it = item.find("changelog"); it != item.end()) {
        if (!it->is_array()) {
            return std::unexpected("release " + e.version + ": 'changelog' must be an array");
        }
        for (const auto& line : *it) {
            if (line.is_string()) e.changelog.push_back(line.get<std::string>());
        }
    }
    return e;
}

json EntryToJson(const ManifestEntry& e) {
    json j = {
        {"version", e.version},
        {"release_date", e.release_date},
        {"changelog", e.changelog},
        {"download_url", e.download_url},
        {"checksum", e.checksum},
        {"signature", e.signature.empty() ? json(nullptr) : json(e.signature)},
        {"size", e.size_bytes},
        {"min_system_version", e.min_system_version.empty() ? json(nullptr) : json(e.min_system_version)},
        {"critical", e.critical},
        {"rollback_allowed", e.rollback_allowed},
    };
    return j;
}

} // namespace

std::expected<Manifest, std::string> ManifestCodec::Parse(const std::string& json_input) {
    try {
        if (json_input.find_first_not_of(" \t\n\r") == std::string::npos) {
            return std::unexpected("Empty input");
        }

        auto j = json::parse(json_input);
        if (!j.is_object()) {
            return std::unexpected("JSON root must be an object");
        }

        Manifest m;
        m.channel = j.value("channel", "");
        if (m.channel.empty()) m.channel = j.value("update_channel", "");
        m.current_version = j.value("current_version", "");
        m.latest_version = j.value("latest_version", "");
        if (auto it = j.find("last_check"); it != j.end() && it->is_string()) {
            m.last_check = it->get<std::string>();
        }

        if (auto it = j.find("releases"); it != j.end()) {
            if (!it->is_array()) return std::unexpected("'releases' must be an array");
            std::size_t index = 0;
            for (const auto& item : *it) {
                auto parsed = ParseEntry(item, index++);
                if (!parsed) return std::unexpected(parsed.error());
                m.releases.push_back(std::move(*parsed));
            }
        }

        return m;
    } catch (const json::parse_error& e) {
        return std::unexpected(std::string("Syntax Error: ") + e.what());
    } catch (const json::exception& e) {
        return std::unexpected(std::string("Type Error: ") + e.what());
    }
}

std::string ManifestCodec::Serialize(const Manifest& manifest) {
    json releases = json::array();
    for (const auto& e : manifest.releases) releases.push_back(EntryToJson(e));

    json j = {
        {"channel", manifest.channel},
        {"current_version", manifest.current_version},
        {"latest_version", manifest.latest_version},
        {"last_check", manifest.last_check.empty() ? json(nullptr) : json(manifest.last_check)},
        {"releases", std::move(releases)},
    };
    return j.dump(4) + "\n";
}

} // namespace relup
