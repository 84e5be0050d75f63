#include <gtest/gtest.h>

#include "util/semver.hpp"

#include <algorithm>
#include <vector>

namespace lsmux {
namespace {

SemanticVersion V(const char* text) {
    auto v = SemanticVersion::Parse(text);
    EXPECT_TRUE(v.has_value()) << text << ": " << (v ? "" : v.error());
    return v.value_or(SemanticVersion{});
}

TEST(SemanticVersionTest, ParsesFullForm) {
    auto v = SemanticVersion::Parse("v1.2.3-beta.1+linux.amd64");
    ASSERT_TRUE(v.has_value()) << v.error();
    EXPECT_EQ(v->major, 1u);
    EXPECT_EQ(v->minor, 2u);
    EXPECT_EQ(v->patch, 3u);
    EXPECT_EQ(v->prerelease, (std::vector<std::string>{"beta", "1"}));
    EXPECT_EQ(v->build, "linux.amd64");
    EXPECT_TRUE(v->IsPrerelease());
    EXPECT_EQ(v->ToString(), "1.2.3-beta.1+linux.amd64");
}

TEST(SemanticVersionTest, RejectsMalformed) {
    for (const char* bad : {"", "1", "1.2", "1.2.3.4", "01.2.3", "1.2.x", "1.2.3-", "1.2.3-a..b",
                            "1.2.3+", "1.2.3-01", "latest"}) {
        EXPECT_FALSE(SemanticVersion::Parse(bad).has_value()) << bad;
    }
}

TEST(VersionComparatorTest, PrecedenceChain) {
    // Each entry is strictly greater than the one before it.
    const std::vector<const char*> chain = {
        "0.9.9", "1.0.0-alpha", "1.0.0-alpha.1", "1.0.0-alpha.beta", "1.0.0-beta",
        "1.0.0-beta.2", "1.0.0-beta.11", "1.0.0-rc.1", "1.0.0", "1.0.1", "1.1.0-beta", "1.1.0",
        "2.0.0",
    };
    for (size_t i = 1; i < chain.size(); ++i) {
        EXPECT_LT(VersionComparator::Compare(V(chain[i - 1]), V(chain[i])), 0)
            << chain[i - 1] << " < " << chain[i];
        EXPECT_GT(VersionComparator::Compare(V(chain[i]), V(chain[i - 1])), 0);
    }
}

TEST(VersionComparatorTest, BuildMetadataIgnored) {
    EXPECT_EQ(VersionComparator::Compare(V("1.0.0+a"), V("1.0.0+b")), 0);
    EXPECT_EQ(VersionComparator::Compare(V("v1.0.0"), V("1.0.0")), 0);
}

TEST(VersionComparatorTest, MaxPicksPrereleaseOfNewerMinor) {
    std::vector<SemanticVersion> versions = {V("1.0.0"), V("1.1.0-beta"), V("0.9.0")};
    const auto it = std::max_element(versions.begin(), versions.end());
    EXPECT_EQ(it->ToString(), "1.1.0-beta");
}

} // namespace
} // namespace lsmux
