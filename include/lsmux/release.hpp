#pragma once

#include "util/semver.hpp"

#include <map>
#include <string>
#include <vector>

namespace lsmux {

struct BuildArtifact {
    std::string os;
    std::string arch;
    std::string url;
    std::string filename;
};

struct Release {
    SemanticVersion version;
    std::string version_text;        // as published, used in URLs and file names
    std::vector<BuildArtifact> builds;
    std::string shasums;             // checksum manifest file name
    std::string shasums_signature;
};

// Version string -> release, as published in index.json.
using ReleaseIndex = std::map<std::string, Release>;

struct InstalledBinaryRef {
    std::string path;
    std::string reported_version; // empty: not installed or unreadable
};

} // namespace lsmux
