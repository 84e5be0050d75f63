#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <span>
#include <string>

namespace lsmux {

// Creates/truncates a regular file and writes it sequentially.
class FileWriter final : public IWriter {
  public:
    static Result Open(std::string path, FileWriter& out, int mode = 0644);

    Result WriteAll(std::span<const std::uint8_t> in) override;
    Result Flush() override;
    Result Close();

    const std::string& Path() const { return path_; }

  private:
    std::string path_;
    Fd fd_;
};

} // namespace lsmux
