#include "util/semver.hpp"

#include <algorithm>
#include <charconv>
#include <ranges>

namespace lsmux {

namespace {

bool IsNumeric(std::string_view s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

bool IsIdentifierChar(char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '-';
}

std::expected<std::uint64_t, std::string> ParseCore(std::string_view part, const char* name) {
    if (!IsNumeric(part)) {
        return std::unexpected(std::string("invalid ") + name + " component: '" + std::string(part) + "'");
    }
    if (part.size() > 1 && part.front() == '0') {
        return std::unexpected(std::string("leading zero in ") + name + " component");
    }
    std::uint64_t v = 0;
    const auto [ptr, ec] = std::from_chars(part.data(), part.data() + part.size(), v);
    if (ec != std::errc{} || ptr != part.data() + part.size()) {
        return std::unexpected(std::string(name) + " component out of range");
    }
    return v;
}

int CompareIdentifier(const std::string& a, const std::string& b) {
    const bool a_num = IsNumeric(a);
    const bool b_num = IsNumeric(b);
    if (a_num && b_num) {
        // no leading zeros, so longer means larger
        if (a.size() != b.size()) return a.size() < b.size() ? -1 : 1;
        return a.compare(b) < 0 ? -1 : (a == b ? 0 : 1);
    }
    if (a_num) return -1;
    if (b_num) return 1;
    const int c = a.compare(b);
    return c < 0 ? -1 : (c > 0 ? 1 : 0);
}

} // namespace

std::expected<SemanticVersion, std::string> SemanticVersion::Parse(std::string_view text) {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) text.remove_prefix(1);
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t' || text.back() == '\n' ||
                             text.back() == '\r')) {
        text.remove_suffix(1);
    }
    if (!text.empty() && text.front() == 'v') text.remove_prefix(1);
    if (text.empty()) return std::unexpected("empty version");

    SemanticVersion out;

    if (const auto plus = text.find('+'); plus != std::string_view::npos) {
        out.build = std::string(text.substr(plus + 1));
        text = text.substr(0, plus);
        if (out.build.empty()) return std::unexpected("empty build metadata");
    }

    std::string_view pre;
    if (const auto dash = text.find('-'); dash != std::string_view::npos) {
        pre = text.substr(dash + 1);
        text = text.substr(0, dash);
        if (pre.empty()) return std::unexpected("empty prerelease");
    }

    std::vector<std::string_view> core;
    for (auto&& rng : text | std::views::split('.')) {
        core.emplace_back(rng.begin(), rng.end());
    }
    if (core.size() != 3) return std::unexpected("expected MAJOR.MINOR.PATCH");

    auto major = ParseCore(core[0], "major");
    if (!major) return std::unexpected(major.error());
    auto minor = ParseCore(core[1], "minor");
    if (!minor) return std::unexpected(minor.error());
    auto patch = ParseCore(core[2], "patch");
    if (!patch) return std::unexpected(patch.error());
    out.major = *major;
    out.minor = *minor;
    out.patch = *patch;

    if (!pre.empty()) {
        for (auto&& rng : pre | std::views::split('.')) {
            std::string id(rng.begin(), rng.end());
            if (id.empty()) return std::unexpected("empty prerelease identifier");
            for (char c : id) {
                if (!IsIdentifierChar(c)) {
                    return std::unexpected("invalid character in prerelease: '" + id + "'");
                }
            }
            if (IsNumeric(id) && id.size() > 1 && id.front() == '0') {
                return std::unexpected("leading zero in prerelease identifier");
            }
            out.prerelease.push_back(std::move(id));
        }
    }

    return out;
}

std::string SemanticVersion::ToString() const {
    std::string s = std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
    for (size_t i = 0; i < prerelease.size(); ++i) {
        s += (i == 0) ? "-" : ".";
        s += prerelease[i];
    }
    if (!build.empty()) s += "+" + build;
    return s;
}

int VersionComparator::Compare(const SemanticVersion& lhs, const SemanticVersion& rhs) {
    if (lhs.major != rhs.major) return lhs.major < rhs.major ? -1 : 1;
    if (lhs.minor != rhs.minor) return lhs.minor < rhs.minor ? -1 : 1;
    if (lhs.patch != rhs.patch) return lhs.patch < rhs.patch ? -1 : 1;

    // A release ranks above any of its prereleases.
    if (lhs.prerelease.empty() || rhs.prerelease.empty()) {
        if (lhs.prerelease.empty() && rhs.prerelease.empty()) return 0;
        return lhs.prerelease.empty() ? 1 : -1;
    }

    const size_t n = std::min(lhs.prerelease.size(), rhs.prerelease.size());
    for (size_t i = 0; i < n; ++i) {
        const int c = CompareIdentifier(lhs.prerelease[i], rhs.prerelease[i]);
        if (c != 0) return c;
    }
    if (lhs.prerelease.size() == rhs.prerelease.size()) return 0;
    return lhs.prerelease.size() < rhs.prerelease.size() ? -1 : 1;
}

} // namespace lsmux
