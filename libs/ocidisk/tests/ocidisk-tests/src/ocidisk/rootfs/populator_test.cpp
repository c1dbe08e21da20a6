// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include <gtest/gtest.h>

#include "common/tempdir.h"
#include "ocidisk/rootfs/populator.h"
#include "ocidisk/utils/file.h"

#include <array>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

using namespace ocidisk::rootfs;

namespace {

void setMtime(const std::filesystem::path &path, time_t seconds)
{
    std::array<struct timespec, 2> times{};
    times[0].tv_sec = seconds;
    times[1].tv_sec = seconds;
    ASSERT_EQ(::utimensat(AT_FDCWD, path.c_str(), times.data(), AT_SYMLINK_NOFOLLOW), 0);
}

} // namespace

class PopulatorTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(tmp.isValid());
        src = tmp.path() / "src";
        dst = tmp.path() / "dst";
        std::filesystem::create_directories(src);
        std::filesystem::create_directories(dst);
    }

    void write(const std::string &relative, const std::string &content)
    {
        auto path = src / relative;
        std::filesystem::create_directories(path.parent_path());
        ASSERT_TRUE(ocidisk::utils::writeFile(path, content));
    }

    TempDir tmp;
    std::filesystem::path src;
    std::filesystem::path dst;
};

TEST_F(PopulatorTest, EstimateTreeSize)
{
    write("a", "1");
    write("b", std::string(4097, 'b'));
    std::filesystem::create_directories(src / "d");
    std::filesystem::create_symlink("a", src / "l");

    auto estimate = estimateTreeSize(src);
    ASSERT_TRUE(estimate) << estimate.error().message();
    EXPECT_EQ(estimate->inodes, 4);
    EXPECT_EQ(estimate->bytes, 4 * 256 + 4096 + 8192 + 4096);
}

TEST_F(PopulatorTest, EstimateExcludesSubtree)
{
    write("etc/hostname", "x");
    write("boot/efi/EFI/BOOT/BOOTX64.EFI", std::string(10000, 'e'));

    auto all = estimateTreeSize(src);
    ASSERT_TRUE(all);
    auto rootOnly = estimateTreeSize(src, espMountPoint);
    ASSERT_TRUE(rootOnly);
    auto espOnly = estimateTreeSize(src / espMountPoint);
    ASSERT_TRUE(espOnly);

    // etc, etc/hostname and boot
    EXPECT_EQ(rootOnly->inodes, 3);
    EXPECT_EQ(all->inodes, rootOnly->inodes + 1 + espOnly->inodes);
    EXPECT_LT(rootOnly->bytes, 10000);
}

TEST_F(PopulatorTest, EstimateMissingRoot)
{
    EXPECT_FALSE(estimateTreeSize(tmp.path() / "missing"));
}

TEST_F(PopulatorTest, CopyTreeKeepsMetadata)
{
    write("etc/hostname", "ocidisk\n");
    write("etc/shadow", "root:*:1::::::\n");
    ASSERT_EQ(::chmod((src / "etc/shadow").c_str(), 0600), 0);
    write("usr/bin/gzip", "gzip");
    ASSERT_EQ(::chmod((src / "usr/bin/gzip").c_str(), 0755), 0);
    ASSERT_EQ(::link((src / "usr/bin/gzip").c_str(), (src / "usr/bin/gunzip").c_str()), 0);
    std::filesystem::create_symlink("usr/bin", src / "bin");
    ASSERT_EQ(::mkfifo((src / "initctl").c_str(), 0600), 0);
    write("readonly/file", "content");
    setMtime(src / "readonly/file", 1600000000);
    ASSERT_EQ(::chmod((src / "readonly").c_str(), 0555), 0);
    setMtime(src / "readonly", 1500000000);

    CopyOptions options;
    options.preserveOwnership = false;
    auto ret = copyTree(src, dst, options);
    ASSERT_TRUE(ret) << ret.error().message();

    EXPECT_EQ(*ocidisk::utils::readFile(dst / "etc/hostname"), "ocidisk\n");
    EXPECT_TRUE(std::filesystem::is_symlink(dst / "bin"));
    EXPECT_EQ(std::filesystem::read_symlink(dst / "bin"), "usr/bin");
    EXPECT_TRUE(std::filesystem::is_fifo(dst / "initctl"));

    struct stat st{};
    ASSERT_EQ(::stat((dst / "etc/shadow").c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 07777, 0600);

    struct stat gzip{};
    struct stat gunzip{};
    ASSERT_EQ(::stat((dst / "usr/bin/gzip").c_str(), &gzip), 0);
    ASSERT_EQ(::stat((dst / "usr/bin/gunzip").c_str(), &gunzip), 0);
    EXPECT_EQ(gzip.st_ino, gunzip.st_ino);
    EXPECT_EQ(gzip.st_mode & 07777, 0755);

    struct stat file{};
    ASSERT_EQ(::stat((dst / "readonly/file").c_str(), &file), 0);
    EXPECT_EQ(file.st_mtime, 1600000000);

    // applied after the content was copied in
    struct stat dir{};
    ASSERT_EQ(::stat((dst / "readonly").c_str(), &dir), 0);
    EXPECT_EQ(dir.st_mode & 07777, 0555);
    EXPECT_EQ(dir.st_mtime, 1500000000);

    // let TempDir clean up
    ::chmod((src / "readonly").c_str(), 0755);
    ::chmod((dst / "readonly").c_str(), 0755);
}

TEST_F(PopulatorTest, CopyTreeIntoPopulatedTarget)
{
    write("boot/efi/EFI/BOOT/BOOTX64.EFI", "efi");
    std::filesystem::create_directories(dst / "boot/efi");

    CopyOptions options;
    options.preserveOwnership = false;
    options.bestEffortPrefix = espMountPoint;
    auto ret = copyTree(src, dst, options);
    ASSERT_TRUE(ret) << ret.error().message();
    EXPECT_EQ(*ocidisk::utils::readFile(dst / "boot/efi/EFI/BOOT/BOOTX64.EFI"), "efi");
}

TEST_F(PopulatorTest, CopyTreeMissingSource)
{
    CopyOptions options;
    options.preserveOwnership = false;
    EXPECT_FALSE(copyTree(tmp.path() / "missing", dst, options));
}

TEST(FreeSpaceCheck, ExactFitIsAccepted)
{
    SpaceEstimate need{ 1000 * 4096, 50 };
    FreeSpace available{ 1000 * 4096, 50, true };
    auto ret = checkFreeSpace("root filesystem", need, available);
    EXPECT_TRUE(ret) << ret.error().message();
}

TEST(FreeSpaceCheck, OneByteOverIsInsufficient)
{
    SpaceEstimate need{ 1000 * 4096 + 1, 50 };
    FreeSpace available{ 1000 * 4096, 50, true };
    auto ret = checkFreeSpace("root filesystem", need, available);
    ASSERT_FALSE(ret);
    EXPECT_TRUE(ret.error().is(ocidisk::utils::error::ErrorCode::InsufficientSpace))
      << ret.error().message();
}

TEST(FreeSpaceCheck, HeadroomCounts)
{
    SpaceEstimate need{ 4096, 1 };
    FreeSpace available{ 8192, 10, true };
    EXPECT_TRUE(checkFreeSpace("root filesystem", need, available, 4096));

    auto ret = checkFreeSpace("root filesystem", need, available, 4097);
    ASSERT_FALSE(ret);
    EXPECT_TRUE(ret.error().is(ocidisk::utils::error::ErrorCode::InsufficientSpace));
    EXPECT_NE(ret.error().message().find("8193"), std::string::npos) << ret.error().message();
}

TEST(FreeSpaceCheck, Inodes)
{
    SpaceEstimate need{ 4096, 11 };
    FreeSpace available{ 1 << 20, 10, true };
    auto ret = checkFreeSpace("root filesystem", need, available);
    ASSERT_FALSE(ret);
    EXPECT_TRUE(ret.error().is(ocidisk::utils::error::ErrorCode::InsufficientSpace));

    available.inodesLimited = false;
    EXPECT_TRUE(checkFreeSpace("EFI system partition", need, available));
}

TEST(FreeSpaceCheck, QueriesMountedFilesystem)
{
    TempDir tmp;
    ASSERT_TRUE(tmp.isValid());
    auto available = freeSpace(tmp.path());
    ASSERT_TRUE(available) << available.error().message();
    EXPECT_GT(available->bytes, 0U);

    EXPECT_FALSE(freeSpace(tmp.path() / "missing"));
}
