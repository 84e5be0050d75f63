#pragma once

#include "util/result.hpp"

#include <string>

namespace lsmux {

class ArchivePathPolicy {
  public:
    explicit ArchivePathPolicy(bool safe_paths_only) : safe_paths_only_(safe_paths_only) {}

    // Normalizes `raw_path` to a relative path under the extraction root.
    // Empty output means "nothing to extract" (e.g. "./").
    Result NormalizeEntryPath(const char* raw_path, std::string& out_relative) const;

  private:
    static bool IsSafeRelativePath(const std::string& p);

    bool safe_paths_only_ = true;
};

} // namespace lsmux
