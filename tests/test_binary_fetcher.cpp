#include <gtest/gtest.h>

#include "net/binary_fetcher.hpp"
#include "testing.hpp"

namespace lsmux {
namespace {

constexpr const char kUa[] = "lsmux-test/1.0";
constexpr const char kPkgUrl[] = "https://releases.example.com/terraform-ls/0.2.1/pkg.zip";

class BinaryFetcherTest : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;
    testutil::FakeHttpClient http;
};

TEST_F(BinaryFetcherTest, DirectDownloadWritesBody) {
    http.Ok(kPkgUrl, "payload-bytes");
    BinaryFetcher fetcher(http);

    const std::string dest = tmp.Join("pkg.zip");
    auto r = fetcher.Download(kPkgUrl, dest, kUa);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(testutil::ReadFile(dest), "payload-bytes");
    EXPECT_EQ(http.LastUserAgent(), kUa);
}

TEST_F(BinaryFetcherTest, RedirectThenOkEqualsDirectDownload) {
    http.Ok("https://cdn.example.com/pkg.zip", "payload-bytes");
    http.Redirect(kPkgUrl, 302, "https://cdn.example.com/pkg.zip");
    BinaryFetcher fetcher(http);

    const std::string via_redirect = tmp.Join("a.zip");
    const std::string direct = tmp.Join("b.zip");
    ASSERT_TRUE(fetcher.Download(kPkgUrl, via_redirect, kUa).is_ok());
    ASSERT_TRUE(fetcher.Download("https://cdn.example.com/pkg.zip", direct, kUa).is_ok());

    EXPECT_EQ(testutil::ReadFile(via_redirect), testutil::ReadFile(direct));
    EXPECT_EQ(http.Count(kPkgUrl), 1);
}

TEST_F(BinaryFetcherTest, RelativeLocationIsResolved) {
    http.Redirect(kPkgUrl, 301, "/mirror/pkg.zip");
    http.Ok("https://releases.example.com/mirror/pkg.zip", "moved");
    BinaryFetcher fetcher(http);

    std::string body;
    auto r = fetcher.FetchToString(kPkgUrl, kUa, body);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(body, "moved");
}

TEST_F(BinaryFetcherTest, TooManyRedirectsFails) {
    for (int i = 0; i < 10; ++i) {
        http.Redirect("https://loop.example.com/" + std::to_string(i), 302,
                      "https://loop.example.com/" + std::to_string(i + 1));
    }
    BinaryFetcher fetcher(http);

    const std::string dest = tmp.Join("loop.zip");
    auto r = fetcher.Download("https://loop.example.com/0", dest, kUa);
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.kind, ErrorKind::Download);
    EXPECT_NE(r.msg.find("too many redirects"), std::string::npos);
    EXPECT_EQ(http.Total(), BinaryFetcher::kMaxRedirects + 1);
    EXPECT_FALSE(testutil::FileExists(dest));
}

TEST_F(BinaryFetcherTest, NotFoundCarriesStatusTextAndLeavesNoFile) {
    BinaryFetcher fetcher(http);

    const std::string dest = tmp.Join("missing.zip");
    auto r = fetcher.Download(kPkgUrl, dest, kUa);
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.kind, ErrorKind::Download);
    EXPECT_NE(r.msg.find("Not Found"), std::string::npos);
    EXPECT_FALSE(testutil::FileExists(dest));
}

TEST_F(BinaryFetcherTest, NetworkErrorIsReportedAsNetwork) {
    testutil::FakeRoute route;
    route.network_error = true;
    http.Set(kPkgUrl, route);
    BinaryFetcher fetcher(http);

    auto r = fetcher.Download(kPkgUrl, tmp.Join("x.zip"), kUa);
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.kind, ErrorKind::Network);
}

TEST_F(BinaryFetcherTest, RedirectBodyNeverReachesFile) {
    http.Redirect(kPkgUrl, 302, "https://cdn.example.com/pkg.zip");
    http.Ok("https://cdn.example.com/pkg.zip", "real");
    BinaryFetcher fetcher(http);

    const std::string dest = tmp.Join("pkg.zip");
    ASSERT_TRUE(fetcher.Download(kPkgUrl, dest, kUa).is_ok());
    EXPECT_EQ(testutil::ReadFile(dest), "real");
}

TEST(ResolveLocationTest, Variants) {
    const std::string base = "https://h.example.com/a/b/file.zip?x=1";
    EXPECT_EQ(BinaryFetcher::ResolveLocation(base, "https://o.example.com/z"), "https://o.example.com/z");
    EXPECT_EQ(BinaryFetcher::ResolveLocation(base, "//cdn.example.com/z"), "https://cdn.example.com/z");
    EXPECT_EQ(BinaryFetcher::ResolveLocation(base, "/root.zip"), "https://h.example.com/root.zip");
    EXPECT_EQ(BinaryFetcher::ResolveLocation(base, "other.zip"), "https://h.example.com/a/b/other.zip");
    EXPECT_EQ(BinaryFetcher::ResolveLocation("https://h.example.com", "x"), "https://h.example.com/x");
}

} // namespace
} // namespace lsmux
