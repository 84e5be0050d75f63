#include "lsmux/archive_unpacker.hpp"

#include "io/file_writer.hpp"
#include "lsmux/archive_path_policy.hpp"
#include "util/logger.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <filesystem>
#include <memory>
#include <span>
#include <vector>

namespace lsmux {

namespace {

namespace fs = std::filesystem;

struct ArchiveReadDeleter {
    void operator()(archive* a) const {
        if (a) archive_read_free(a);
    }
};

std::string ArchiveErr(archive* ar) {
    const char* s = ar ? archive_error_string(ar) : nullptr;
    return s ? std::string(s) : std::string("unknown");
}

Result CopyEntryData(archive* ar, FileWriter& writer, const CancelToken* cancel) {
    std::vector<std::uint8_t> buf(64 * 1024);
    while (true) {
        if (IsCancelled(cancel)) return Result::Fail(ErrorKind::Cancelled, "unpack cancelled");
        const la_ssize_t n = archive_read_data(ar, buf.data(), buf.size());
        if (n == 0) break;
        if (n < 0) return Result::Fail(ErrorKind::Archive, "archive_read_data: " + ArchiveErr(ar));
        auto wr = writer.WriteAll(std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n)));
        if (!wr.is_ok()) return Result::Fail(ErrorKind::Archive, wr.msg);
    }
    auto fr = writer.Flush();
    if (!fr.is_ok()) return Result::Fail(ErrorKind::Archive, fr.msg);
    auto cr = writer.Close();
    if (!cr.is_ok()) return Result::Fail(ErrorKind::Archive, cr.msg);
    return Result::Ok();
}

// A truncated entry must not be mistaken for an installed binary.
void RemovePartial(const fs::path& target) {
    std::error_code ec;
    if (!fs::remove(target, ec) && ec) {
        LogWarn("cannot remove partial entry %s: %s", target.c_str(), ec.message().c_str());
    }
}

} // namespace

Result ArchiveUnpacker::Unpack(const std::string& target_dir,
                               const std::string& archive_path,
                               std::string* out_executable) const {
    const fs::path base_dir(target_dir);

    std::error_code ec;
    if (!fs::is_directory(base_dir, ec) || ec) {
        return Result::Fail(ErrorKind::Archive, "Destination path is not a directory: " + target_dir);
    }

    std::unique_ptr<archive, ArchiveReadDeleter> ar(archive_read_new());
    if (!ar) return Result::Fail(ErrorKind::Archive, "archive_read_new failed");

    archive_read_support_format_zip(ar.get());

    if (archive_read_open_filename(ar.get(), archive_path.c_str(), 64 * 1024) != ARCHIVE_OK) {
        return Result::Fail(ErrorKind::Archive,
                            "cannot open " + archive_path + ": " + ArchiveErr(ar.get()));
    }

    ArchivePathPolicy path_policy(opt_.safe_paths_only);
    std::string executable;
    size_t files_written = 0;

    archive_entry* entry = nullptr;
    while (true) {
        if (IsCancelled(opt_.cancel)) return Result::Fail(ErrorKind::Cancelled, "unpack cancelled");

        const int r = archive_read_next_header(ar.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r != ARCHIVE_OK && r != ARCHIVE_WARN) {
            return Result::Fail(ErrorKind::Archive, "archive_read_next_header: " + ArchiveErr(ar.get()));
        }

        std::string rel;
        auto path_res = path_policy.NormalizeEntryPath(archive_entry_pathname(entry), rel);
        if (!path_res.is_ok()) return path_res;
        if (rel.empty()) {
            (void)archive_read_data_skip(ar.get());
            continue;
        }

        const fs::path target = base_dir / fs::path(rel);

        if (archive_entry_filetype(entry) == AE_IFDIR) {
            fs::create_directories(target, ec);
            if (ec) {
                return Result::Fail(ErrorKind::Archive,
                                    "create_directories failed: " + target.string() + ": " + ec.message());
            }
            continue;
        }
        if (archive_entry_filetype(entry) != AE_IFREG) {
            LogWarn("skipping non-regular archive entry: %s", rel.c_str());
            (void)archive_read_data_skip(ar.get());
            continue;
        }

        if (files_written > 0) {
            LogWarn("package holds more than one file, %s replaces %s as the executable",
                    rel.c_str(), executable.c_str());
        }

        if (target.has_parent_path()) {
            fs::create_directories(target.parent_path(), ec);
            if (ec) {
                return Result::Fail(ErrorKind::Archive,
                                    "create_directories failed: " + target.parent_path().string() +
                                        ": " + ec.message());
            }
        }

        LogDebug("unpack entry: %s", target.c_str());

        FileWriter writer;
        auto open_res = FileWriter::Open(target.string(), writer);
        if (!open_res.is_ok()) {
            RemovePartial(target);
            return Result::Fail(ErrorKind::Archive, open_res.msg);
        }

        auto copy_res = CopyEntryData(ar.get(), writer, opt_.cancel);
        if (!copy_res.is_ok()) {
            RemovePartial(target);
            return copy_res;
        }

        executable = target.string();
        ++files_written;
    }

    if (archive_read_close(ar.get()) != ARCHIVE_OK) {
        return Result::Fail(ErrorKind::Archive, "archive_read_close: " + ArchiveErr(ar.get()));
    }
    ar.reset();

    if (files_written == 0) {
        return Result::Fail(ErrorKind::Archive, "package contains no files: " + archive_path);
    }

    fs::permissions(executable,
                    static_cast<fs::perms>(opt_.executable_mode),
                    fs::perm_options::replace,
                    ec);
    if (ec) {
        return Result::Fail(ErrorKind::Archive, "chmod failed: " + executable + ": " + ec.message());
    }

    LogInfo("Unpacked %s -> %s", archive_path.c_str(), executable.c_str());
    if (out_executable) *out_executable = executable;
    return Result::Ok();
}

} // namespace lsmux
