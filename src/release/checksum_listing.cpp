#include "release/checksum_listing.hpp"

#include "io/file_util.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <sstream>

namespace relup {

namespace {

bool IsHexString(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isxdigit(c) != 0; });
}

bool HasAnySuffix(const std::string& name, const std::vector<std::string>& suffixes) {
    for (const auto& sfx : suffixes) {
        if (name.size() >= sfx.size() && name.compare(name.size() - sfx.size(), sfx.size(), sfx) == 0) {
            return true;
        }
    }
    return false;
}

} // namespace

std::string FormatChecksumListing(const std::vector<ChecksumLine>& lines) {
    std::string out;
    for (const auto& l : lines) {
        out += l.hex;
        out += "  ";
        out += l.file_name;
        out += '\n';
    }
    return out;
}

std::expected<std::vector<ChecksumLine>, std::string> ParseChecksumListing(const std::string& text) {
    std::vector<ChecksumLine> out;
    std::istringstream is(text);
    std::string line;
    int lineno = 0;

    while (std::getline(is, line)) {
        ++lineno;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty() || line.front() == '#') continue;

        const auto sp = line.find(' ');
        if (sp == std::string::npos || sp + 1 >= line.size()) {
            return std::unexpected("malformed checksum line " + std::to_string(lineno));
        }

        ChecksumLine cl;
        cl.hex = line.substr(0, sp);
        std::size_t name_at = sp + 1;
        if (line[name_at] == ' ' || line[name_at] == '*') ++name_at;
        cl.file_name = line.substr(name_at);

        if (!IsHexString(cl.hex) || cl.file_name.empty()) {
            return std::unexpected("malformed checksum line " + std::to_string(lineno));
        }
        out.push_back(std::move(cl));
    }
    return out;
}

Result WriteChecksumListing(const std::string& dir,
                            const std::string& listing_name,
                            DigestAlgorithm algo,
                            const std::vector<std::string>& suffixes,
                            std::vector<ChecksumLine>* out_lines) {
    namespace fs = std::filesystem;

    std::vector<std::string> names;
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec)) continue;
        const std::string name = it->path().filename().string();
        if (name == listing_name) continue;
        if (HasAnySuffix(name, suffixes)) names.push_back(name);
    }
    if (ec) return Result::Fail(ec.value(), "cannot list " + dir + ": " + ec.message());

    std::sort(names.begin(), names.end());

    std::vector<ChecksumLine> lines;
    lines.reserve(names.size());
    for (const auto& name : names) {
        ChecksumLine cl;
        cl.file_name = name;
        if (auto r = DigestHexFile(algo, dir + "/" + name, cl.hex); !r.ok) return r;
        lines.push_back(std::move(cl));
    }

    if (auto r = WriteFileAtomic(dir + "/" + listing_name, FormatChecksumListing(lines)); !r.ok) return r;

    LogInfo("wrote %s listing for %zu file(s): %s/%s",
            DigestAlgorithmName(algo), lines.size(), dir.c_str(), listing_name.c_str());

    if (out_lines) *out_lines = std::move(lines);
    return Result::Ok();
}

Result LookupChecksum(const std::string& listing_path, const std::string& file_name, std::string& out_hex) {
    out_hex.clear();

    std::string text;
    if (auto r = ReadFileToString(listing_path, text); !r.ok) return r;

    auto parsed = ParseChecksumListing(text);
    if (!parsed) return Result::Fail(ErrorKind::InvalidManifest, listing_path + ": " + parsed.error());

    for (const auto& l : *parsed) {
        if (l.file_name == file_name) {
            out_hex = l.hex;
            break;
        }
    }
    return Result::Ok();
}

} // namespace relup
