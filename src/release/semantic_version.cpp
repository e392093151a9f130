#include "release/semantic_version.hpp"

#include <algorithm>
#include <charconv>
#include <ranges>
#include <regex>

namespace relup {

namespace {

bool IsNumericId(std::string_view s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

bool IsValidIdChar(char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '-';
}

std::expected<std::uint64_t, std::string> ParseNumber(std::string_view sv) {
    if (!IsNumericId(sv)) return std::unexpected("non-numeric component '" + std::string(sv) + "'");
    std::uint64_t v = 0;
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), v);
    if (ec != std::errc{} || ptr != sv.data() + sv.size()) {
        return std::unexpected("out of range component '" + std::string(sv) + "'");
    }
    return v;
}

std::strong_ordering ComparePrereleaseIds(const std::string& a, const std::string& b) {
    const bool an = IsNumericId(a);
    const bool bn = IsNumericId(b);
    if (an && bn) {
        if (a.size() != b.size()) return a.size() <=> b.size();
        return a.compare(b) <=> 0;
    }
    // Numeric identifiers have lower precedence than alphanumeric ones.
    if (an != bn) return an ? std::strong_ordering::less : std::strong_ordering::greater;
    return a.compare(b) <=> 0;
}

} // namespace

std::expected<SemanticVersion, std::string> SemanticVersion::Parse(std::string_view text) {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) text.remove_prefix(1);
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t' || text.back() == '\n' ||
                             text.back() == '\r')) {
        text.remove_suffix(1);
    }
    if (!text.empty() && (text.front() == 'v' || text.front() == 'V')) text.remove_prefix(1);
    if (text.empty()) return std::unexpected("empty version");

    SemanticVersion v;

    if (const auto plus = text.find('+'); plus != std::string_view::npos) {
        v.build_ = std::string(text.substr(plus + 1));
        text = text.substr(0, plus);
        if (v.build_.empty()) return std::unexpected("empty build metadata");
    }

    std::string_view core = text;
    if (const auto dash = text.find('-'); dash != std::string_view::npos) {
        core = text.substr(0, dash);
        const std::string_view pre = text.substr(dash + 1);
        if (pre.empty()) return std::unexpected("empty prerelease");
        for (auto part : pre | std::views::split('.')) {
            std::string id(part.begin(), part.end());
            if (id.empty()) return std::unexpected("empty prerelease identifier");
            for (char c : id) {
                if (!IsValidIdChar(c)) return std::unexpected("invalid prerelease identifier '" + id + "'");
            }
            v.prerelease_.push_back(std::move(id));
        }
    }

    std::uint64_t* fields[] = {&v.major_, &v.minor_, &v.patch_};
    std::size_t idx = 0;
    for (auto part : core | std::views::split('.')) {
        if (idx >= 3) return std::unexpected("too many version components in '" + std::string(text) + "'");
        auto n = ParseNumber(std::string_view(part.begin(), part.end()));
        if (!n) return std::unexpected(n.error());
        *fields[idx++] = *n;
    }
    if (idx == 0) return std::unexpected("missing major version");

    return v;
}

std::string SemanticVersion::ToString() const {
    std::string out = std::to_string(major_) + "." + std::to_string(minor_) + "." + std::to_string(patch_);
    if (!prerelease_.empty()) {
        out += "-";
        for (std::size_t i = 0; i < prerelease_.size(); ++i) {
            if (i) out += ".";
            out += prerelease_[i];
        }
    }
    if (!build_.empty()) out += "+" + build_;
    return out;
}

std::strong_ordering SemanticVersion::operator<=>(const SemanticVersion& other) const {
    if (auto c = major_ <=> other.major_; c != 0) return c;
    if (auto c = minor_ <=> other.minor_; c != 0) return c;
    if (auto c = patch_ <=> other.patch_; c != 0) return c;

    // A release ranks above any of its prereleases.
    if (prerelease_.empty() != other.prerelease_.empty()) {
        return prerelease_.empty() ? std::strong_ordering::greater : std::strong_ordering::less;
    }
    const std::size_t n = std::min(prerelease_.size(), other.prerelease_.size());
    for (std::size_t i = 0; i < n; ++i) {
        if (auto c = ComparePrereleaseIds(prerelease_[i], other.prerelease_[i]); c != 0) return c;
    }
    return prerelease_.size() <=> other.prerelease_.size();
}

int CompareVersions(const std::string& lhs, const std::string& rhs) {
    if (lhs == rhs) return 0;

    auto l = SemanticVersion::Parse(lhs);
    auto r = SemanticVersion::Parse(rhs);
    if (!l && !r) return lhs < rhs ? -1 : 1;
    if (!l) return -1;
    if (!r) return 1;

    const auto c = *l <=> *r;
    if (c < 0) return -1;
    if (c > 0) return 1;
    return 0;
}

bool IsNewerVersion(const std::string& candidate, const std::string& installed) {
    return CompareVersions(candidate, installed) > 0;
}

std::optional<std::string> FindVersionInText(std::string_view text) {
    static const std::regex kVersion(R"((?:^|[^0-9A-Za-z.])v?(\d+\.\d+(?:\.\d+)?(?:-[0-9A-Za-z.-]+)?(?:\+[0-9A-Za-z.-]+)?))");
    std::match_results<std::string_view::const_iterator> m;
    if (!std::regex_search(text.begin(), text.end(), m, kVersion)) return std::nullopt;
    return m[1].str();
}

} // namespace relup
