#include <gtest/gtest.h>

#include "fakes.hpp"
#include "lsmux/client_registry.hpp"

namespace lsmux {
namespace {

std::unique_ptr<ILanguageClient> Running(testutil::FakeClientFactory& f, const std::string& root) {
    ClientLaunch l;
    l.root_uri = root;
    auto c = f.Create(l);
    EXPECT_TRUE(c->Start().is_ok());
    return c;
}

TEST(ClientRegistryTest, RejectsDuplicateRoots) {
    testutil::FakeClientFactory f;
    ClientRegistry reg;

    ASSERT_TRUE(reg.Insert("file:///a/", Running(f, "file:///a/")).is_ok());
    auto dup = reg.Insert("file:///a/", Running(f, "file:///a/"));
    EXPECT_FALSE(dup.is_ok());
    EXPECT_EQ(reg.Size(), 1u);
    EXPECT_TRUE(reg.Contains("file:///a/"));
    EXPECT_NE(reg.Find("file:///a/"), nullptr);
    EXPECT_EQ(reg.Find("file:///b/"), nullptr);
}

TEST(ClientRegistryTest, TakeUnregistersWithoutStopping) {
    testutil::FakeClientFactory f;
    ClientRegistry reg;
    ASSERT_TRUE(reg.Insert("file:///a/", Running(f, "file:///a/")).is_ok());

    auto c = reg.Take("file:///a/");
    ASSERT_NE(c, nullptr);
    EXPECT_EQ(c->State(), ClientState::Running);
    EXPECT_FALSE(reg.Contains("file:///a/"));
    EXPECT_EQ(reg.Take("file:///a/"), nullptr);
}

TEST(ClientRegistryTest, StopAllStopsEveryClientBeforeClearing) {
    testutil::FakeClientFactory f;
    ClientRegistry reg;
    for (const char* root : {"file:///a/", "file:///b/", "file:///c/"}) {
        ASSERT_TRUE(reg.Insert(root, Running(f, root)).is_ok());
    }
    EXPECT_EQ(f.journal->live.load(), 3);

    ASSERT_TRUE(reg.StopAll().is_ok());
    EXPECT_EQ(reg.Size(), 0u);
    EXPECT_EQ(f.journal->live.load(), 0);
    EXPECT_EQ(f.journal->stopped.size(), 3u);

    EXPECT_TRUE(reg.StopAll().is_ok());
}

TEST(ClientRegistryTest, KeysAreSorted) {
    testutil::FakeClientFactory f;
    ClientRegistry reg;
    ASSERT_TRUE(reg.Insert("file:///b/", Running(f, "file:///b/")).is_ok());
    ASSERT_TRUE(reg.Insert("file:///a/", Running(f, "file:///a/")).is_ok());
    EXPECT_EQ(reg.Keys(), (std::vector<std::string>{"file:///a/", "file:///b/"}));
}

} // namespace
} // namespace lsmux
