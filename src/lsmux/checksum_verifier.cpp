#include "lsmux/checksum_verifier.hpp"

#include "crypto/sha256.hpp"
#include "util/logger.hpp"

#include <future>
#include <system_error>

namespace lsmux {

namespace {

struct DigestOutcome {
    Result result = Result::Ok();
    std::string digest;
};

bool IsSpace(char c) { return c == ' ' || c == '\t' || c == '\r'; }

} // namespace

std::optional<std::string> ChecksumVerifier::FindDigest(std::string_view manifest,
                                                        std::string_view build_filename) {
    while (!manifest.empty()) {
        const auto nl = manifest.find('\n');
        std::string_view line = manifest.substr(0, nl);
        manifest = nl == std::string_view::npos ? std::string_view{} : manifest.substr(nl + 1);

        while (!line.empty() && IsSpace(line.back())) line.remove_suffix(1);
        while (!line.empty() && IsSpace(line.front())) line.remove_prefix(1);

        size_t ws = 0;
        while (ws < line.size() && !IsSpace(line[ws])) ++ws;
        if (ws == 0 || ws == line.size()) continue;

        const std::string_view digest = line.substr(0, ws);
        std::string_view name = line.substr(ws);
        while (!name.empty() && IsSpace(name.front())) name.remove_prefix(1);
        if (!name.empty() && name.front() == '*') name.remove_prefix(1); // sha256sum binary marker

        if (name == build_filename) return std::string(digest);
    }
    return std::nullopt;
}

Result ChecksumVerifier::Verify(const Release& release,
                                const std::string& package_path,
                                const std::string& build_filename) const {
    if (release.shasums.empty()) {
        return Result::Fail(ErrorKind::ChecksumNotFound,
                            "release " + release.version_text + " publishes no checksum manifest");
    }

    auto hash_local = [this, &package_path]() {
        DigestOutcome out;
        out.result = Sha256HexFile(package_path, out.digest, cancel_);
        return out;
    };

    auto fetch_remote = [this, &release, &build_filename]() {
        DigestOutcome out;
        std::string manifest;
        auto fr = fetcher_.FetchToString(ManifestUrl(release), user_agent_, manifest);
        if (!fr.is_ok()) {
            out.result = fr.kind == ErrorKind::Cancelled
                             ? fr
                             : Result::Fail(ErrorKind::Network, "cannot fetch checksums: " + fr.msg);
            return out;
        }
        auto digest = FindDigest(manifest, build_filename);
        if (!digest) {
            out.result = Result::Fail(ErrorKind::ChecksumNotFound,
                                      "no matching SHA sum for " + build_filename);
            return out;
        }
        out.digest = std::move(*digest);
        return out;
    };

    DigestOutcome local;
    DigestOutcome remote;
    try {
        auto local_task = std::async(std::launch::async, hash_local);
        auto remote_task = std::async(std::launch::async, fetch_remote);
        local = local_task.get();
        remote = remote_task.get();
    } catch (const std::system_error& e) {
        return Result::Fail(ErrorKind::Io, std::string("cannot start verification tasks: ") + e.what());
    }

    if (!local.result.is_ok()) return local.result;
    if (!remote.result.is_ok()) return remote.result;

    if (remote.digest != local.digest) {
        return Result::Fail(ErrorKind::ChecksumMismatch,
                            "SHA sum for " + build_filename + " does not match.\n(expected: " +
                                remote.digest + " calculated: " + local.digest + ")");
    }

    LogInfo("Checksum OK for %s (%s)", build_filename.c_str(), local.digest.c_str());
    return Result::Ok();
}

} // namespace lsmux
