#pragma once

#include "lsmux/release.hpp"
#include "net/binary_fetcher.hpp"
#include "util/cancel_token.hpp"
#include "util/result.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace lsmux {

class ChecksumVerifier {
public:
    ChecksumVerifier(const BinaryFetcher& fetcher,
                     std::string releases_url,
                     std::string user_agent,
                     const CancelToken* cancel = nullptr)
        : fetcher_(fetcher),
          releases_url_(std::move(releases_url)),
          user_agent_(std::move(user_agent)),
          cancel_(cancel) {}

    // Hashes `package_path` and fetches the release's checksum manifest
    // concurrently, then compares the two hex digests byte for byte.
    Result Verify(const Release& release,
                  const std::string& package_path,
                  const std::string& build_filename) const;

    std::string ManifestUrl(const Release& release) const {
        return releases_url_ + "/" + release.version_text + "/" + release.shasums;
    }

    // Manifest lines are "<hex-digest><whitespace><filename>".
    static std::optional<std::string> FindDigest(std::string_view manifest,
                                                 std::string_view build_filename);

private:
    const BinaryFetcher& fetcher_;
    std::string releases_url_;
    std::string user_agent_;
    const CancelToken* cancel_ = nullptr;
};

} // namespace lsmux
