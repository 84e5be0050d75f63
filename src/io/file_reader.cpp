#include "io/file_reader.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace lsmux {

Result FileReader::Open(std::string path, FileReader& out) {
    out.path_ = std::move(path);

    int fd = ::open(out.path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return Result::Fail(ErrorKind::Io,
                            "Failed to open input: " + out.path_ + " (" + std::strerror(errno) + ")");
    }
    out.fd_.Reset(fd);

    struct stat st{};
    if (::fstat(fd, &st) == 0 && S_ISREG(st.st_mode)) {
        out.size_ = static_cast<std::uint64_t>(st.st_size);
    } else {
        out.size_ = std::nullopt;
    }

    return Result::Ok();
}

std::optional<std::uint64_t> FileReader::TotalSize() const { return size_; }

ssize_t FileReader::Read(std::span<std::uint8_t> out) {
    while (true) {
        ssize_t n = ::read(fd_.Get(), out.data(), out.size());
        if (n >= 0) {
            return n;
        }
        if (errno == EINTR) {
            continue;
        }
        return -1;
    }
}

} // namespace lsmux
