#pragma once

#include "util/cancel_token.hpp"
#include "util/result.hpp"

#include <string>
#include <sys/types.h>

namespace lsmux {

// Extracts a zip package entry by entry, streaming each entry's data to disk.
class ArchiveUnpacker {
  public:
    struct Options {
        bool safe_paths_only = true;
        mode_t executable_mode = 0755;
        const CancelToken* cancel = nullptr;
    };

    ArchiveUnpacker() = default;
    explicit ArchiveUnpacker(const Options& opt) : opt_(opt) {}

    // Writes every file entry under `target_dir` and marks the last written
    // file executable. Packages are expected to hold a single executable; extra
    // file entries are logged and the last one wins.
    Result Unpack(const std::string& target_dir,
                  const std::string& archive_path,
                  std::string* out_executable = nullptr) const;

  private:
    Options opt_{};
};

} // namespace lsmux
