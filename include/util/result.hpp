#pragma once
#include <string>
#include <utility>

namespace lsmux {

enum class ErrorKind : int {
    None = 0,
    Network,
    Download,
    NoReleases,
    UnsupportedPlatform,
    ChecksumNotFound,
    ChecksumMismatch,
    Archive,
    Probe,
    Cancelled,
    Io,
    Config,
    Process,
};

const char* ErrorKindName(ErrorKind kind);

struct Result {
    bool ok{true};
    ErrorKind kind{ErrorKind::None};
    std::string msg;

    bool is_ok() const { return ok; }
    const std::string& message() const { return msg; }

    static Result Ok() { return {}; }
    static Result Fail(ErrorKind k, std::string m) {
        return {.ok = false, .kind = k, .msg = std::move(m)};
    }
};

} // namespace lsmux
