#pragma once

#include "lsmux/release.hpp"

#include <string>
#include <string_view>

namespace lsmux {

struct Platform {
    std::string os;
    std::string arch;
};

// Maps host names to the release feed's vocabulary:
// win32 -> windows, x64 -> amd64, x32 -> 386; anything else passes through.
Platform NormalizePlatform(std::string_view os, std::string_view arch);

// uname(2) of the running host, already normalized.
Platform HostPlatform();

const BuildArtifact* FindBuild(const Release& release, const Platform& platform);

} // namespace lsmux
