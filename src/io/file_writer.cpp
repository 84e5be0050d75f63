#include "io/file_writer.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace lsmux {

Result FileWriter::Open(std::string path, FileWriter& out, int mode) {
    out.path_ = std::move(path);

    int fd = ::open(out.path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode);
    if (fd < 0) {
        return Result::Fail(ErrorKind::Io,
                            "Failed to open output: " + out.path_ + " (" + std::strerror(errno) + ")");
    }
    out.fd_.Reset(fd);
    return Result::Ok();
}

Result FileWriter::WriteAll(std::span<const std::uint8_t> in) {
    if (!fd_.Valid()) return Result::Fail(ErrorKind::Io, "write on closed file: " + path_);

    size_t rem = in.size();
    const std::uint8_t* p = in.data();

    while (rem > 0) {
        ssize_t n = ::write(fd_.Get(), p, rem);
        if (n > 0) {
            p += static_cast<size_t>(n);
            rem -= static_cast<size_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR) {
            continue;
        }
        return Result::Fail(ErrorKind::Io,
                            "Write failed: " + path_ + " (" + std::string(std::strerror(errno)) + ")");
    }

    return Result::Ok();
}

Result FileWriter::Flush() {
    if (!fd_.Valid()) return Result::Ok();
    if (::fsync(fd_.Get()) == -1) {
        return Result::Fail(ErrorKind::Io,
                            "fsync failed: " + path_ + " (" + std::string(std::strerror(errno)) + ")");
    }
    return Result::Ok();
}

Result FileWriter::Close() {
    if (!fd_.Valid()) return Result::Ok();
    const int fd = fd_.Release();
    if (::close(fd) != 0) {
        return Result::Fail(ErrorKind::Io,
                            "close failed: " + path_ + " (" + std::string(std::strerror(errno)) + ")");
    }
    return Result::Ok();
}

} // namespace lsmux
