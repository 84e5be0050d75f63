#pragma once

#include "lsmux/platform.hpp"
#include "lsmux/progress.hpp"
#include "lsmux/release.hpp"
#include "lsmux/user_interface.hpp"
#include "lsmux/version_probe.hpp"
#include "net/http_client.hpp"
#include "util/cancel_token.hpp"
#include "util/result.hpp"
#include "util/settings.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace lsmux {

class IInstaller {
public:
    virtual ~IInstaller() = default;
    // Brings the binary in `target_dir` up to the latest release. Declining
    // the upgrade and "already current" are both successful no-ops.
    virtual Result Install(const std::string& target_dir) = 0;
    virtual std::string BinaryPath(const std::string& target_dir) const = 0;
    // True when BinaryPath(target_dir) names an executable file.
    virtual bool HasBinary(const std::string& target_dir) const = 0;
};

class InstallOrchestrator final : public IInstaller {
public:
    struct Options {
        std::string binary_name = kDefaultBinaryName;
        std::string releases_url = kDefaultReleasesUrl;
        std::string user_agent;
        std::string changelog_url_prefix = "https://github.com/hashicorp/terraform-ls/releases/tag/v";
        Platform platform = HostPlatform();
        IProgress* progress_sink = nullptr;
        const CancelToken* cancel = nullptr;
    };

    InstallOrchestrator(IHttpClient& http, IVersionProbe& probe, IUserInterface& ui, Options opt);

    Result Install(const std::string& target_dir) override;

    std::string BinaryPath(const std::string& target_dir) const override;
    bool HasBinary(const std::string& target_dir) const override;
    std::string PackagePath(const std::string& target_dir, const Release& release) const;

private:
    InstalledBinaryRef ProbeInstalled(const std::string& target_dir);
    Result InstallPackage(const std::string& target_dir, const Release& release);
    Result DownloadVerifyUnpack(const std::string& target_dir,
                                const Release& release,
                                const BuildArtifact& build,
                                const std::string& package_path);
    void Report(std::string_view stage, std::uint32_t increment);
    Result CheckCancelled(std::string_view before) const;

    IHttpClient& http_;
    IVersionProbe& probe_;
    IUserInterface& ui_;
    Options opt_;
    std::uint32_t percent_ = 0;
};

} // namespace lsmux
