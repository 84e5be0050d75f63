#pragma once

#include "lsmux/release.hpp"

#include <expected>
#include <string>

namespace lsmux {

class ReleaseIndexParser {
  public:
    // Accepts {"versions": {...}} as published, or the version map itself.
    // Entries whose version does not parse are skipped with a warning.
    std::expected<ReleaseIndex, std::string> Parse(const std::string& json_input) const;
};

} // namespace lsmux
