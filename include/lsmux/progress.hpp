#pragma once
#include <cstdint>
#include <string_view>

namespace lsmux {

struct ProgressEvent {
    std::string_view title;  // e.g. "Installing terraform-ls"
    std::string_view stage;  // "download", "verify", "unpack"
    std::uint32_t increment = 0;
    std::uint32_t percent = 0; // cumulative, 0..100
};

class IProgress {
  public:
    virtual ~IProgress() = default;
    virtual void OnProgress(const ProgressEvent& e) = 0;
};

} // namespace lsmux
