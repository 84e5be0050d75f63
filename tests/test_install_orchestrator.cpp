#include <gtest/gtest.h>

#include "crypto/sha256.hpp"
#include "fakes.hpp"
#include "lsmux/install_orchestrator.hpp"
#include "testing.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace lsmux {
namespace {

constexpr const char kReleases[] = "https://releases.example.com/terraform-ls";
constexpr const char kIndexUrl[] = "https://releases.example.com/terraform-ls/index.json";

std::string BuildName(const std::string& version) {
    return "terraform-ls_" + version + "_linux_amd64.zip";
}
std::string BuildUrl(const std::string& version) {
    return std::string(kReleases) + "/" + version + "/" + BuildName(version);
}
std::string SumsUrl(const std::string& version) {
    return std::string(kReleases) + "/" + version + "/terraform-ls_" + version + "_SHA256SUMS";
}

std::string IndexJson(const std::vector<std::string>& versions) {
    nlohmann::json root;
    for (const auto& v : versions) {
        root["versions"][v] = {
            {"version", v},
            {"shasums", "terraform-ls_" + v + "_SHA256SUMS"},
            {"shasums_signature", "terraform-ls_" + v + "_SHA256SUMS.sig"},
            {"builds",
             {{{"os", "linux"}, {"arch", "amd64"}, {"filename", BuildName(v)}, {"url", BuildUrl(v)}},
              {{"os", "darwin"}, {"arch", "amd64"}, {"filename", "terraform-ls_" + v + "_darwin_amd64.zip"},
               {"url", std::string(kReleases) + "/" + v + "/terraform-ls_" + v + "_darwin_amd64.zip"}}}},
        };
    }
    return root.dump();
}

class InstallOrchestratorTest : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;
    testutil::FakeHttpClient http;
    testutil::FakeVersionProbe probe;
    testutil::FakeUserInterface ui;
    testutil::RecordingProgress progress;
    CancelToken cancel;
    std::string dir = tmp.Join("lsp");

    void SetUp() override { ui.answers["Install"] = "Install"; }

    InstallOrchestrator::Options Opts(Platform platform = {"linux", "amd64"}) {
        InstallOrchestrator::Options o;
        o.releases_url = kReleases;
        o.user_agent = "lsmux-test";
        o.platform = std::move(platform);
        o.progress_sink = &progress;
        o.cancel = &cancel;
        return o;
    }

    // Publishes `version` with a valid package and matching checksum manifest.
    std::string Publish(const std::string& version, const std::string& payload = "#!/bin/sh\necho ok\n") {
        const std::string zip = testutil::BuildZipString({{"terraform-ls", payload}});
        http.Ok(BuildUrl(version), zip);
        http.Ok(SumsUrl(version), Sha256Hex(std::string_view(zip)) + "  " + BuildName(version) + "\n");
        return zip;
    }

    std::string PackagePath(const std::string& version) {
        return dir + "/terraform-ls_v" + version + ".zip";
    }
};

TEST_F(InstallOrchestratorTest, FreshInstallUnpacksExecutable) {
    http.Ok(kIndexUrl, IndexJson({"0.1.0", "0.2.1"}));
    Publish("0.2.1", "binary-v0.2.1");

    InstallOrchestrator inst(http, probe, ui, Opts());
    auto r = inst.Install(dir);
    ASSERT_TRUE(r.is_ok()) << r.msg;

    const std::string bin = inst.BinaryPath(dir);
    EXPECT_EQ(bin, dir + "/terraform-ls");
    EXPECT_EQ(testutil::ReadFile(bin), "binary-v0.2.1");
    EXPECT_NE(fs::status(bin).permissions() & fs::perms::owner_exec, fs::perms::none);
    EXPECT_TRUE(inst.HasBinary(dir));
    EXPECT_FALSE(testutil::FileExists(PackagePath("0.2.1")));

    EXPECT_EQ(progress.percents, (std::vector<std::uint32_t>{33, 66, 100}));
    EXPECT_EQ(progress.stages, (std::vector<std::string>{"download", "verify", "unpack"}));
    ASSERT_FALSE(ui.prompts.empty());
    EXPECT_NE(ui.prompts.front().find("0.2.1"), std::string::npos);
    EXPECT_EQ(http.LastUserAgent(), "lsmux-test");
}

TEST_F(InstallOrchestratorTest, UpToDateSkipsDownload) {
    http.Ok(kIndexUrl, IndexJson({"0.2.1"}));
    Publish("0.2.1");
    probe.version = "0.2.1";

    InstallOrchestrator inst(http, probe, ui, Opts());
    ASSERT_TRUE(inst.Install(dir).is_ok());
    ASSERT_TRUE(inst.Install(dir).is_ok());

    EXPECT_EQ(http.Count(BuildUrl("0.2.1")), 0);
    EXPECT_EQ(http.Count(SumsUrl("0.2.1")), 0);
    EXPECT_EQ(http.Count(kIndexUrl), 2);
    EXPECT_TRUE(ui.prompts.empty());
    EXPECT_TRUE(progress.percents.empty());
}

TEST_F(InstallOrchestratorTest, NewerInstalledAlsoSkips) {
    http.Ok(kIndexUrl, IndexJson({"0.2.1"}));
    probe.version = "0.3.0";

    InstallOrchestrator inst(http, probe, ui, Opts());
    ASSERT_TRUE(inst.Install(dir).is_ok());
    EXPECT_EQ(http.Total(), 1);
}

TEST_F(InstallOrchestratorTest, PrereleaseUpgradePromptsUser) {
    http.Ok(kIndexUrl, IndexJson({"1.0.0", "1.1.0-beta"}));
    Publish("1.1.0-beta");
    probe.version = "1.0.0";

    InstallOrchestrator inst(http, probe, ui, Opts());
    ASSERT_TRUE(inst.Install(dir).is_ok());

    ASSERT_FALSE(ui.prompts.empty());
    EXPECT_NE(ui.prompts.front().find("1.1.0-beta"), std::string::npos);
    EXPECT_EQ(http.Count(BuildUrl("1.1.0-beta")), 1);
}

TEST_F(InstallOrchestratorTest, DeclineIsSuccessfulNoOp) {
    http.Ok(kIndexUrl, IndexJson({"0.2.1"}));
    Publish("0.2.1");
    ui.answers.clear();

    InstallOrchestrator inst(http, probe, ui, Opts());
    ASSERT_TRUE(inst.Install(dir).is_ok());
    EXPECT_EQ(http.Count(BuildUrl("0.2.1")), 0);
    EXPECT_FALSE(testutil::FileExists(dir));
    EXPECT_FALSE(inst.HasBinary(dir));
}

TEST_F(InstallOrchestratorTest, ChangelogOfferedAfterInstall) {
    http.Ok(kIndexUrl, IndexJson({"0.2.1"}));
    Publish("0.2.1");
    ui.answers["View Changelog"] = "View Changelog";

    InstallOrchestrator inst(http, probe, ui, Opts());
    ASSERT_TRUE(inst.Install(dir).is_ok());
    ASSERT_EQ(ui.opened.size(), 1u);
    EXPECT_EQ(ui.opened[0], "https://github.com/hashicorp/terraform-ls/releases/tag/v0.2.1");
}

TEST_F(InstallOrchestratorTest, UnsupportedPlatformNamesPairAndLeavesNoPackage) {
    http.Ok(kIndexUrl, IndexJson({"0.2.1"}));
    Publish("0.2.1");

    InstallOrchestrator inst(http, probe, ui, Opts({"freebsd", "arm"}));
    auto r = inst.Install(dir);
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.kind, ErrorKind::UnsupportedPlatform);
    EXPECT_NE(r.msg.find("freebsd/arm"), std::string::npos);
    EXPECT_EQ(http.Count(BuildUrl("0.2.1")), 0);
    EXPECT_FALSE(testutil::FileExists(PackagePath("0.2.1")));
}

TEST_F(InstallOrchestratorTest, ChecksumMismatchRemovesPackage) {
    http.Ok(kIndexUrl, IndexJson({"0.2.1"}));
    Publish("0.2.1");
    http.Ok(SumsUrl("0.2.1"), std::string(64, '0') + "  " + BuildName("0.2.1") + "\n");

    InstallOrchestrator inst(http, probe, ui, Opts());
    auto r = inst.Install(dir);
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.kind, ErrorKind::ChecksumMismatch);
    EXPECT_FALSE(testutil::FileExists(PackagePath("0.2.1")));
    EXPECT_FALSE(testutil::FileExists(dir + "/terraform-ls"));
}

TEST_F(InstallOrchestratorTest, DownloadFailureRemovesPackage) {
    http.Ok(kIndexUrl, IndexJson({"0.2.1"}));

    InstallOrchestrator inst(http, probe, ui, Opts());
    auto r = inst.Install(dir);
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.kind, ErrorKind::Download);
    EXPECT_FALSE(testutil::FileExists(PackagePath("0.2.1")));
}

TEST_F(InstallOrchestratorTest, CorruptArchiveRemovesPackage) {
    http.Ok(kIndexUrl, IndexJson({"0.2.1"}));
    const std::string junk = "definitely not a zip";
    http.Ok(BuildUrl("0.2.1"), junk);
    http.Ok(SumsUrl("0.2.1"), Sha256Hex(std::string_view(junk)) + "  " + BuildName("0.2.1") + "\n");

    InstallOrchestrator inst(http, probe, ui, Opts());
    auto r = inst.Install(dir);
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.kind, ErrorKind::Archive);
    EXPECT_FALSE(testutil::FileExists(PackagePath("0.2.1")));
}

TEST_F(InstallOrchestratorTest, CancelDuringDownloadRemovesPackage) {
    http.Ok(kIndexUrl, IndexJson({"0.2.1"}));
    Publish("0.2.1");
    http.OnRequest([this](const std::string& url) {
        if (url == BuildUrl("0.2.1")) cancel.Cancel();
    });

    InstallOrchestrator inst(http, probe, ui, Opts());
    auto r = inst.Install(dir);
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.kind, ErrorKind::Cancelled);
    EXPECT_FALSE(testutil::FileExists(PackagePath("0.2.1")));
    EXPECT_EQ(http.Count(SumsUrl("0.2.1")), 0);
}

TEST_F(InstallOrchestratorTest, DamagedEntryLeavesNeitherPackageNorBinary) {
    http.Ok(kIndexUrl, IndexJson({"0.2.1"}));
    const std::string zip = testutil::CorruptZipString("terraform-ls");
    http.Ok(BuildUrl("0.2.1"), zip);
    http.Ok(SumsUrl("0.2.1"), Sha256Hex(std::string_view(zip)) + "  " + BuildName("0.2.1") + "\n");
    probe.version = "0.1.0";
    fs::create_directories(dir);
    testutil::WriteFile(dir + "/terraform-ls", std::string("old"));

    InstallOrchestrator inst(http, probe, ui, Opts());
    auto r = inst.Install(dir);
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.kind, ErrorKind::Archive);
    EXPECT_FALSE(testutil::FileExists(PackagePath("0.2.1")));
    EXPECT_FALSE(testutil::FileExists(dir + "/terraform-ls"));
}

TEST_F(InstallOrchestratorTest, CancelDuringVerifyLeavesNeitherPackageNorBinary) {
    http.Ok(kIndexUrl, IndexJson({"0.2.1"}));
    Publish("0.2.1");
    http.OnRequest([this](const std::string& url) {
        if (url == SumsUrl("0.2.1")) cancel.Cancel();
    });

    InstallOrchestrator inst(http, probe, ui, Opts());
    auto r = inst.Install(dir);
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.kind, ErrorKind::Cancelled);
    EXPECT_FALSE(testutil::FileExists(PackagePath("0.2.1")));
    EXPECT_FALSE(testutil::FileExists(dir + "/terraform-ls"));
}

// Cancels once the given stage has reported.
class CancellingProgress final : public IProgress {
  public:
    CancellingProgress(CancelToken& cancel, std::string stage) : cancel_(cancel), stage_(std::move(stage)) {}

    void OnProgress(const ProgressEvent& e) override {
        if (e.stage == stage_) cancel_.Cancel();
    }

  private:
    CancelToken& cancel_;
    std::string stage_;
};

TEST_F(InstallOrchestratorTest, CancelBeforeUnpackLeavesNeitherPackageNorBinary) {
    http.Ok(kIndexUrl, IndexJson({"0.2.1"}));
    Publish("0.2.1");
    CancellingProgress sink(cancel, "verify");

    auto opts = Opts();
    opts.progress_sink = &sink;
    InstallOrchestrator inst(http, probe, ui, opts);
    auto r = inst.Install(dir);
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.kind, ErrorKind::Cancelled);
    EXPECT_FALSE(testutil::FileExists(PackagePath("0.2.1")));
    EXPECT_FALSE(testutil::FileExists(dir + "/terraform-ls"));
}

TEST_F(InstallOrchestratorTest, OldBinaryIsReplaced) {
    http.Ok(kIndexUrl, IndexJson({"0.2.1"}));
    Publish("0.2.1", "new");
    probe.version = "0.1.0";
    fs::create_directories(dir);
    testutil::WriteFile(dir + "/terraform-ls", std::string("old"));

    InstallOrchestrator inst(http, probe, ui, Opts());
    ASSERT_TRUE(inst.Install(dir).is_ok());
    EXPECT_EQ(testutil::ReadFile(dir + "/terraform-ls"), "new");
}

TEST_F(InstallOrchestratorTest, WindowsBinaryGetsExeSuffix) {
    InstallOrchestrator inst(http, probe, ui, Opts({"windows", "amd64"}));
    EXPECT_EQ(inst.BinaryPath("/x"), "/x/terraform-ls.exe");
}

TEST_F(InstallOrchestratorTest, IndexFailureIsNetworkError) {
    InstallOrchestrator inst(http, probe, ui, Opts());
    auto r = inst.Install(dir);
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.kind, ErrorKind::Network);
}

} // namespace
} // namespace lsmux
