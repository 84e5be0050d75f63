#include "lsmux/install_orchestrator.hpp"

#include "lsmux/archive_unpacker.hpp"
#include "lsmux/checksum_verifier.hpp"
#include "lsmux/version_resolver.hpp"
#include "net/binary_fetcher.hpp"
#include "util/logger.hpp"

#include <filesystem>

#include <unistd.h>

namespace fs = std::filesystem;

namespace lsmux {

InstallOrchestrator::InstallOrchestrator(IHttpClient& http,
                                         IVersionProbe& probe,
                                         IUserInterface& ui,
                                         Options opt)
    : http_(http), probe_(probe), ui_(ui), opt_(std::move(opt)) {}

std::string InstallOrchestrator::BinaryPath(const std::string& target_dir) const {
    std::string name = opt_.binary_name;
    if (opt_.platform.os == "windows") name += ".exe";
    return (fs::path(target_dir) / name).string();
}

bool InstallOrchestrator::HasBinary(const std::string& target_dir) const {
    return ::access(BinaryPath(target_dir).c_str(), X_OK) == 0;
}

std::string InstallOrchestrator::PackagePath(const std::string& target_dir, const Release& release) const {
    return (fs::path(target_dir) / (opt_.binary_name + "_v" + release.version_text + ".zip")).string();
}

InstalledBinaryRef InstallOrchestrator::ProbeInstalled(const std::string& target_dir) {
    InstalledBinaryRef ref;
    ref.path = BinaryPath(target_dir);

    std::string version;
    auto pr = probe_.Probe(ref.path, version);
    if (!pr.is_ok()) {
        LogWarn("error executing %s --version: %s", ref.path.c_str(), pr.msg.c_str());
        return ref;
    }
    ref.reported_version = version;
    return ref;
}

Result InstallOrchestrator::Install(const std::string& target_dir) {
    const InstalledBinaryRef installed = ProbeInstalled(target_dir);

    BinaryFetcher fetcher(http_, opt_.cancel);
    VersionResolver resolver(fetcher, opt_.releases_url);
    Release latest;
    auto rr = resolver.ResolveLatest(opt_.user_agent, latest);
    if (!rr.is_ok()) return rr;

    if (!installed.reported_version.empty()) {
        auto current = SemanticVersion::Parse(installed.reported_version);
        if (!current) {
            LogWarn("installed version '%s' is not a semantic version: %s",
                    installed.reported_version.c_str(), current.error().c_str());
        } else if (VersionComparator::Compare(*current, latest.version) >= 0) {
            LogInfo("%s %s is up to date", opt_.binary_name.c_str(), installed.reported_version.c_str());
            return Result::Ok();
        }
    }

    const std::string prompt =
        "A new language server release is available: " + latest.version_text + ". Install now?";
    if (ui_.ShowInformation(prompt, {"Install", "Cancel"}) != "Install") {
        LogInfo("install of %s %s declined", opt_.binary_name.c_str(), latest.version_text.c_str());
        return Result::Ok();
    }

    return InstallPackage(target_dir, latest);
}

Result InstallOrchestrator::InstallPackage(const std::string& target_dir, const Release& release) {
    std::error_code ec;
    fs::create_directories(target_dir, ec);
    if (ec) {
        return Result::Fail(ErrorKind::Io, "cannot create " + target_dir + ": " + ec.message());
    }

    const BuildArtifact* build = FindBuild(release, opt_.platform);
    if (!build || build->url.empty()) {
        return Result::Fail(ErrorKind::UnsupportedPlatform,
                            "no matching " + opt_.binary_name + " binary for platform " +
                                opt_.platform.os + "/" + opt_.platform.arch);
    }

    const std::string binary_path = BinaryPath(target_dir);
    if (!fs::remove(binary_path, ec) && ec) {
        LogWarn("cannot remove old binary %s: %s", binary_path.c_str(), ec.message().c_str());
    }

    const std::string package_path = PackagePath(target_dir, release);
    percent_ = 0;

    auto r = DownloadVerifyUnpack(target_dir, release, *build, package_path);

    // The package file never outlives the install, verified or not.
    fs::remove(package_path, ec);
    if (ec) {
        LogWarn("cannot remove package %s: %s", package_path.c_str(), ec.message().c_str());
    }
    if (!r.is_ok()) {
        // The old binary is already gone; never leave a half-unpacked one in its place.
        if (!fs::remove(binary_path, ec) && ec) {
            LogWarn("cannot remove partial binary %s: %s", binary_path.c_str(), ec.message().c_str());
        }
        LogError("install of %s %s failed: %s",
                 opt_.binary_name.c_str(), release.version_text.c_str(), r.msg.c_str());
        return r;
    }

    LogInfo("Installed %s %s to %s",
            opt_.binary_name.c_str(), release.version_text.c_str(), target_dir.c_str());
    if (ui_.ShowInformation("Installed " + opt_.binary_name + " " + release.version_text + ".",
                            {"View Changelog"}) == "View Changelog") {
        ui_.OpenExternal(opt_.changelog_url_prefix + release.version_text);
    }
    return Result::Ok();
}

Result InstallOrchestrator::DownloadVerifyUnpack(const std::string& target_dir,
                                                 const Release& release,
                                                 const BuildArtifact& build,
                                                 const std::string& package_path) {
    if (auto c = CheckCancelled("download"); !c.is_ok()) return c;

    BinaryFetcher fetcher(http_, opt_.cancel);
    auto dr = fetcher.Download(build.url, package_path, opt_.user_agent);
    if (!dr.is_ok()) return dr;
    Report("download", 33);

    if (auto c = CheckCancelled("verify"); !c.is_ok()) return c;

    ChecksumVerifier verifier(fetcher, opt_.releases_url, opt_.user_agent, opt_.cancel);
    auto vr = verifier.Verify(release, package_path, build.filename);
    if (!vr.is_ok()) return vr;
    Report("verify", 33);

    if (auto c = CheckCancelled("unpack"); !c.is_ok()) return c;

    ArchiveUnpacker::Options uopt;
    uopt.cancel = opt_.cancel;
    auto ur = ArchiveUnpacker(uopt).Unpack(target_dir, package_path);
    if (!ur.is_ok()) return ur;
    Report("unpack", 34);

    return Result::Ok();
}

void InstallOrchestrator::Report(std::string_view stage, std::uint32_t increment) {
    percent_ += increment;
    if (!opt_.progress_sink) return;

    const std::string title = "Installing " + opt_.binary_name;
    ProgressEvent e{};
    e.title = title;
    e.stage = stage;
    e.increment = increment;
    e.percent = percent_;
    opt_.progress_sink->OnProgress(e);
}

Result InstallOrchestrator::CheckCancelled(std::string_view before) const {
    if (!IsCancelled(opt_.cancel)) return Result::Ok();
    return Result::Fail(ErrorKind::Cancelled, "install cancelled before " + std::string(before));
}

} // namespace lsmux
