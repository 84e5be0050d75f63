#include <gtest/gtest.h>

#include "lsmux/archive_unpacker.hpp"
#include "testing.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace lsmux {
namespace {

class ArchiveUnpackerTest : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;

    std::string Package(const std::vector<testutil::ZipEntry>& entries) {
        const std::string path = tmp.Join("pkg.zip");
        testutil::WriteFile(path, testutil::BuildZip(entries));
        return path;
    }

    std::string Target() {
        const std::string dir = tmp.Join("out");
        fs::create_directories(dir);
        return dir;
    }
};

TEST_F(ArchiveUnpackerTest, ExtractsSingleBinaryAndMarksExecutable) {
    const std::string payload = "#!/bin/sh\necho terraform-ls v0.2.1\n";
    const std::string pkg = Package({{"terraform-ls", payload}});
    const std::string dir = Target();

    std::string exe;
    auto r = ArchiveUnpacker().Unpack(dir, pkg, &exe);
    ASSERT_TRUE(r.is_ok()) << r.msg;

    EXPECT_EQ(exe, dir + "/terraform-ls");
    EXPECT_EQ(testutil::ReadFile(exe), payload);

    const auto perms = fs::status(exe).permissions();
    EXPECT_EQ(perms & fs::perms::all,
              fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                  fs::perms::others_read | fs::perms::others_exec);
}

TEST_F(ArchiveUnpackerTest, DirectoryEntriesAreCreated) {
    const std::string pkg = Package({
        {"bin/", "", AE_IFDIR},
        {"bin/terraform-ls", "binary"},
    });
    const std::string dir = Target();

    std::string exe;
    auto r = ArchiveUnpacker().Unpack(dir, pkg, &exe);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_TRUE(fs::is_directory(dir + "/bin"));
    EXPECT_EQ(exe, dir + "/bin/terraform-ls");
}

TEST_F(ArchiveUnpackerTest, SecondFileEntryWinsWithoutFailing) {
    const std::string pkg = Package({
        {"README.txt", "docs"},
        {"terraform-ls", "binary"},
    });
    const std::string dir = Target();

    std::string exe;
    auto r = ArchiveUnpacker().Unpack(dir, pkg, &exe);
    ASSERT_TRUE(r.is_ok()) << r.msg;

    EXPECT_EQ(exe, dir + "/terraform-ls");
    EXPECT_TRUE(testutil::FileExists(dir + "/README.txt"));
}

TEST_F(ArchiveUnpackerTest, RejectsEscapingEntry) {
    const std::string pkg = Package({{"../evil", "x"}});
    const std::string dir = Target();

    auto r = ArchiveUnpacker().Unpack(dir, pkg);
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.kind, ErrorKind::Archive);
    EXPECT_FALSE(testutil::FileExists(tmp.Join("evil")));
}

TEST_F(ArchiveUnpackerTest, ArchiveWithoutFilesFails) {
    const std::string pkg = Package({{"empty/", "", AE_IFDIR}});
    auto r = ArchiveUnpacker().Unpack(Target(), pkg);
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.kind, ErrorKind::Archive);
}

TEST_F(ArchiveUnpackerTest, GarbageInputFails) {
    const std::string pkg = tmp.Join("pkg.zip");
    testutil::WriteFile(pkg, std::string("this is not a zip file at all"));

    auto r = ArchiveUnpacker().Unpack(Target(), pkg);
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.kind, ErrorKind::Archive);
}

TEST_F(ArchiveUnpackerTest, MissingTargetDirectoryFails) {
    const std::string pkg = Package({{"terraform-ls", "x"}});
    auto r = ArchiveUnpacker().Unpack(tmp.Join("missing"), pkg);
    EXPECT_FALSE(r.is_ok());
}

TEST_F(ArchiveUnpackerTest, DamagedEntryLeavesNoPartialFile) {
    const std::string pkg = tmp.Join("pkg.zip");
    testutil::WriteFile(pkg, testutil::CorruptZipString("terraform-ls"));
    const std::string dir = Target();

    auto r = ArchiveUnpacker().Unpack(dir, pkg);
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.kind, ErrorKind::Archive);
    EXPECT_FALSE(testutil::FileExists(dir + "/terraform-ls"));
}

TEST_F(ArchiveUnpackerTest, CancelledBeforeStart) {
    const std::string pkg = Package({{"terraform-ls", "x"}});
    CancelToken cancel;
    cancel.Cancel();

    ArchiveUnpacker::Options opt;
    opt.cancel = &cancel;
    auto r = ArchiveUnpacker(opt).Unpack(Target(), pkg);
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.kind, ErrorKind::Cancelled);
}

} // namespace
} // namespace lsmux
