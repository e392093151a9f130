#include "release/package.hpp"

#include "util/path_utils.hpp"

#include <nlohmann/json.hpp>

namespace relup {

using json = nlohmann::json;

std::string PackageMetadataCodec::Serialize(const Package& pkg) {
    json j = {
        {"name", pkg.name},
        {"version", pkg.identity.semantic_version},
        {"full_version", pkg.identity.FullVersion()},
        {"git_commit", pkg.identity.source_revision},
        {"build_date", pkg.identity.build_date},
        {"target_platform", pkg.identity.target_platform},
        {"package_file", pkg.package_file},
        {"checksum", pkg.sha256},
        {"size", pkg.size_bytes},
        {"created_at", pkg.created_at},
        {"signature_file", UrlBaseName(pkg.signature_path)},
        {"certificate_file", UrlBaseName(pkg.certificate_path)},
    };
    return j.dump(4) + "\n";
}

std::expected<Package, std::string> PackageMetadataCodec::Parse(const std::string& json_input) {
    try {
        auto j = json::parse(json_input);
        if (!j.is_object()) return std::unexpected("package metadata must be a JSON object");

        Package pkg;
        pkg.name = j.value("name", "");
        pkg.identity.semantic_version = j.value("version", "");
        pkg.identity.source_revision = j.value("git_commit", "");
        pkg.identity.build_date = j.value("build_date", "");
        pkg.identity.target_platform = j.value("target_platform", "");
        pkg.package_file = j.value("package_file", "");
        pkg.sha256 = j.value("checksum", "");
        pkg.size_bytes = j.value("size", 0ULL);
        pkg.created_at = j.value("created_at", "");
        pkg.signature_path = j.value("signature_file", "");
        pkg.certificate_path = j.value("certificate_file", "");

        if (pkg.identity.semantic_version.empty()) return std::unexpected("package metadata has no version");
        if (pkg.sha256.empty()) return std::unexpected("package metadata has no checksum");
        return pkg;
    } catch (const json::parse_error& e) {
        return std::unexpected(std::string("Syntax Error: ") + e.what());
    } catch (const json::exception& e) {
        return std::unexpected(std::string("Type Error: ") + e.what());
    }
}

} // namespace relup
