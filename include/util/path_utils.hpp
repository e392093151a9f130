#pragma once

#include <cstdlib>
#include <string>
#include <string_view>

namespace relup {

// Normalize tar path to a clean relative form:
// - strip leading "./"
// - strip leading "/" (avoid absolute)
// - collapse duplicate slashes
inline std::string NormalizeTarPath(std::string s) {
    while (s.rfind("./", 0) == 0) s.erase(0, 2);
    while (!s.empty() && s.front() == '/') s.erase(0, 1);

    std::string out;
    out.reserve(s.size());
    bool prev_slash = false;
    for (char c : s) {
        const bool slash = (c == '/');
        if (slash && prev_slash) continue;
        out.push_back(c);
        prev_slash = slash;
    }
    return out;
}

// "~" or "~/x" -> $HOME based path. Anything else is returned as-is.
inline std::string ExpandHome(const std::string& p) {
    if (p.empty() || p.front() != '~') return p;
    if (p.size() > 1 && p[1] != '/') return p;
    const char* home = std::getenv("HOME");
    if (!home || *home == '\0') return p;
    return std::string(home) + p.substr(1);
}

inline std::string JoinUrl(std::string_view base, std::string_view leaf) {
    std::string out(base);
    while (!out.empty() && out.back() == '/') out.pop_back();
    while (!leaf.empty() && leaf.front() == '/') leaf.remove_prefix(1);
    out.push_back('/');
    out.append(leaf);
    return out;
}

// Last path segment of a URL, without query or fragment.
inline std::string UrlBaseName(std::string_view url) {
    const auto cut = url.find_first_of("?#");
    if (cut != std::string_view::npos) url = url.substr(0, cut);
    const auto slash = url.rfind('/');
    if (slash != std::string_view::npos) url.remove_prefix(slash + 1);
    return std::string(url);
}

} // namespace relup
