#pragma once

#include "lsmux/release.hpp"
#include "net/binary_fetcher.hpp"
#include "util/result.hpp"

#include <string>

namespace lsmux {

class VersionResolver {
public:
    VersionResolver(const BinaryFetcher& fetcher, std::string releases_url)
        : fetcher_(fetcher), releases_url_(std::move(releases_url)) {}

    // Fetches <releases_url>/index.json and returns the highest version,
    // prereleases included.
    Result ResolveLatest(const std::string& user_agent, Release& out) const;

    static Result SelectLatest(const ReleaseIndex& index, Release& out);

    std::string IndexUrl() const { return releases_url_ + "/index.json"; }

private:
    const BinaryFetcher& fetcher_;
    std::string releases_url_;
};

} // namespace lsmux
