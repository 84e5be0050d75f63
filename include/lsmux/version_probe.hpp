#pragma once

#include "util/result.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace lsmux {

class IVersionProbe {
public:
    virtual ~IVersionProbe() = default;
    // Failures are ErrorKind::Probe; callers treat them as "not installed".
    virtual Result Probe(const std::string& binary_path, std::string& out_version) = 0;
};

// Runs "<binary> --version" and picks the first semantic version in its output.
class ExecVersionProbe final : public IVersionProbe {
public:
    explicit ExecVersionProbe(std::chrono::milliseconds timeout = std::chrono::seconds(10))
        : timeout_(timeout) {}

    Result Probe(const std::string& binary_path, std::string& out_version) override;

private:
    std::chrono::milliseconds timeout_;
};

// "terraform-ls v0.2.1\n" -> "0.2.1"
std::optional<std::string> ExtractVersion(std::string_view text);

} // namespace lsmux
