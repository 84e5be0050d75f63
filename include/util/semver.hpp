#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace lsmux {

struct SemanticVersion {
    std::uint64_t major = 0;
    std::uint64_t minor = 0;
    std::uint64_t patch = 0;
    std::vector<std::string> prerelease;
    std::string build;

    // MAJOR.MINOR.PATCH[-PRERELEASE][+BUILD], an optional leading 'v' is accepted.
    static std::expected<SemanticVersion, std::string> Parse(std::string_view text);

    bool IsPrerelease() const { return !prerelease.empty(); }
    std::string ToString() const;
};

class VersionComparator {
public:
    // Semantic-version precedence; build metadata is ignored.
    // Returns <0, 0 or >0.
    static int Compare(const SemanticVersion& lhs, const SemanticVersion& rhs);
};

inline bool operator<(const SemanticVersion& a, const SemanticVersion& b) {
    return VersionComparator::Compare(a, b) < 0;
}

} // namespace lsmux
