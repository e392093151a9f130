#pragma once

#include <compare>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace relup {

// MAJOR.MINOR.PATCH[-PRERELEASE][+BUILD], ordered by semver 2.0 precedence.
// Build metadata is kept for display and ignored by comparisons.
class SemanticVersion {
  public:
    SemanticVersion() = default;
    SemanticVersion(std::uint64_t major, std::uint64_t minor, std::uint64_t patch)
        : major_(major), minor_(minor), patch_(patch) {}

    // Accepts an optional leading 'v' and a missing minor/patch ("2", "1.4").
    static std::expected<SemanticVersion, std::string> Parse(std::string_view text);

    std::uint64_t Major() const { return major_; }
    std::uint64_t Minor() const { return minor_; }
    std::uint64_t Patch() const { return patch_; }
    const std::vector<std::string>& Prerelease() const { return prerelease_; }
    const std::string& Build() const { return build_; }

    std::string ToString() const;

    std::strong_ordering operator<=>(const SemanticVersion& other) const;
    bool operator==(const SemanticVersion& other) const {
        return (*this <=> other) == std::strong_ordering::equal;
    }

  private:
    std::uint64_t major_ = 0;
    std::uint64_t minor_ = 0;
    std::uint64_t patch_ = 0;
    std::vector<std::string> prerelease_;
    std::string build_;
};

// -1, 0, 1. Unparseable versions sort below every valid one and compare
// equal only to an identical string.
int CompareVersions(const std::string& lhs, const std::string& rhs);

bool IsNewerVersion(const std::string& candidate, const std::string& installed);

// First version-looking token in free text, e.g. "app 1.2.3 (abc)" -> "1.2.3".
std::optional<std::string> FindVersionInText(std::string_view text);

} // namespace relup
