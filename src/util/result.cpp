#include "util/result.hpp"

namespace lsmux {

const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:                return "ok";
        case ErrorKind::Network:             return "network error";
        case ErrorKind::Download:            return "download error";
        case ErrorKind::NoReleases:          return "no releases";
        case ErrorKind::UnsupportedPlatform: return "unsupported platform";
        case ErrorKind::ChecksumNotFound:    return "checksum not found";
        case ErrorKind::ChecksumMismatch:    return "checksum mismatch";
        case ErrorKind::Archive:             return "archive error";
        case ErrorKind::Probe:               return "probe error";
        case ErrorKind::Cancelled:           return "cancelled";
        case ErrorKind::Io:                  return "i/o error";
        case ErrorKind::Config:              return "config error";
        case ErrorKind::Process:             return "process error";
    }
    return "error";
}

} // namespace lsmux
