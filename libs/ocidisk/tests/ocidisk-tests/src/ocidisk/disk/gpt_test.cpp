// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include <gtest/gtest.h>

#include "common/tempdir.h"
#include "ocidisk/disk/disk_image.h"
#include "ocidisk/disk/gpt.h"

#include <fstream>
#include <string>

#include <fcntl.h>
#include <unistd.h>

using namespace ocidisk::disk;
using ocidisk::utils::error::ErrorCode;

namespace {

std::vector<uint8_t> readSector(const std::filesystem::path &path, uint64_t lba)
{
    std::vector<uint8_t> sector(sectorSize);
    std::ifstream in(path, std::ios::binary);
    in.seekg(static_cast<std::streamoff>(lba * sectorSize));
    in.read(reinterpret_cast<char *>(sector.data()), static_cast<std::streamsize>(sector.size()));
    return sector;
}

void flipByte(const std::filesystem::path &path, uint64_t offset)
{
    int fd = ::open(path.c_str(), O_RDWR | O_CLOEXEC);
    ASSERT_GE(fd, 0);
    uint8_t byte = 0;
    ASSERT_EQ(::pread(fd, &byte, 1, static_cast<off_t>(offset)), 1);
    byte ^= 0xFFU;
    ASSERT_EQ(::pwrite(fd, &byte, 1, static_cast<off_t>(offset)), 1);
    ::close(fd);
}

} // namespace

TEST(Guid, ParseAndFormat)
{
    auto guid = Guid::fromString("C12A7328-F81F-11D2-BA4B-00A0C93EC93B");
    ASSERT_TRUE(guid) << guid.error().message();
    EXPECT_EQ(guid->toString(), "C12A7328-F81F-11D2-BA4B-00A0C93EC93B");
    EXPECT_EQ(*guid, espPartitionType());

    // the first three fields are stored little endian
    const std::array<uint8_t, 16> onDisk{ 0x28, 0x73, 0x2A, 0xC1, 0x1F, 0xF8, 0xD2, 0x11,
                                          0xBA, 0x4B, 0x00, 0xA0, 0xC9, 0x3E, 0xC9, 0x3B };
    EXPECT_EQ(guid->bytes(), onDisk);
    EXPECT_EQ(Guid::fromBytes(onDisk.data()), *guid);

    auto lower = Guid::fromString("0fc63daf-8483-4772-8e79-3d69d8477de4");
    ASSERT_TRUE(lower);
    EXPECT_EQ(*lower, linuxFilesystemPartitionType());

    EXPECT_FALSE(Guid::fromString("not-a-guid"));
    EXPECT_TRUE(Guid().isNull());
    EXPECT_FALSE(Guid::random().isNull());
    EXPECT_NE(Guid::random(), Guid::random());
}

TEST(Guid, RandomIsVersion4InMixedEndian)
{
    for (int i = 0; i < 16; ++i) {
        auto guid = Guid::random();
        // data3 is stored little endian, the version sits in its high byte
        EXPECT_EQ(guid.bytes()[7] >> 4, 4);
        EXPECT_EQ(guid.bytes()[8] & 0xC0, 0x80);

        auto text = guid.toString();
        EXPECT_EQ(text[14], '4') << text;
        EXPECT_NE(std::string("89AB").find(text[19]), std::string::npos) << text;
        EXPECT_EQ(*Guid::fromString(text), guid);
    }
}

TEST(Gpt, PlanOneGiB)
{
    auto layout = planPartitions(GiB);
    ASSERT_TRUE(layout) << layout.error().message();

    EXPECT_EQ(layout->totalSectors, GiB / sectorSize);
    EXPECT_EQ(layout->firstUsableLba, 2048);
    EXPECT_EQ(layout->lastUsableLba, GiB / sectorSize - 34);
    ASSERT_EQ(layout->partitions.size(), 2);

    const auto &esp = layout->partitions[0];
    EXPECT_EQ(esp.type, espPartitionType());
    EXPECT_EQ(esp.firstLba, 2048);
    EXPECT_EQ(esp.sizeBytes(), espSizeBytes);
    EXPECT_EQ(esp.attributes, requiredPartitionAttribute);
    EXPECT_EQ(esp.name, "EFI System Partition");

    const auto &root = layout->partitions[1];
    EXPECT_EQ(root.type, linuxFilesystemPartitionType());
    EXPECT_EQ(root.firstLba, esp.lastLba + 1);
    EXPECT_EQ(root.firstLba % alignmentSectors, 0);
    EXPECT_EQ((root.lastLba + 1) % alignmentSectors, 0);
    EXPECT_LE(root.lastLba, layout->lastUsableLba);
    EXPECT_EQ(root.name, "Linux filesystem");
    EXPECT_EQ(root.attributes, 0);

    EXPECT_NE(esp.unique, root.unique);
    EXPECT_NE(layout->diskGuid, esp.unique);
}

TEST(Gpt, MinimumDiskBoundary)
{
    EXPECT_EQ(minimumDiskBytes(), (2048 + espSizeBytes / sectorSize + 1 + 33) * sectorSize);

    auto tooSmall = planPartitions(minimumDiskBytes() - 1);
    ASSERT_FALSE(tooSmall);
    EXPECT_TRUE(tooSmall.error().is(ErrorCode::PartitionTableWriteFailure));

    auto exact = planPartitions(minimumDiskBytes());
    ASSERT_TRUE(exact) << exact.error().message();
    const auto &root = exact->partitions[1];
    EXPECT_EQ(root.firstLba, root.lastLba);
    EXPECT_EQ(root.lastLba, exact->lastUsableLba);
}

TEST(Gpt, WriteAndReadBack)
{
    TempDir dir;
    ASSERT_TRUE(dir.isValid());

    auto disk = allocateDiskImage(dir.path() / "disk.img", GiB);
    ASSERT_TRUE(disk);
    auto written = buildPartitionTable(*disk);
    ASSERT_TRUE(written) << written.error().message();

    auto read = readPartitionTable(disk->path);
    ASSERT_TRUE(read) << read.error().message();
    EXPECT_EQ(read->diskGuid, written->diskGuid);
    EXPECT_EQ(read->firstUsableLba, written->firstUsableLba);
    EXPECT_EQ(read->lastUsableLba, written->lastUsableLba);
    ASSERT_EQ(read->partitions.size(), 2);
    for (std::size_t i = 0; i < 2; ++i) {
        const auto &a = read->partitions[i];
        const auto &b = written->partitions[i];
        EXPECT_EQ(a.type, b.type);
        EXPECT_EQ(a.unique, b.unique);
        EXPECT_EQ(a.firstLba, b.firstLba);
        EXPECT_EQ(a.lastLba, b.lastLba);
        EXPECT_EQ(a.attributes, b.attributes);
        EXPECT_EQ(a.name, b.name);
    }

    auto mbr = readSector(disk->path, 0);
    EXPECT_EQ(mbr[450], 0xEE);
    EXPECT_EQ(mbr[510], 0x55);
    EXPECT_EQ(mbr[511], 0xAA);

    auto primary = readSector(disk->path, 1);
    EXPECT_EQ(std::string(primary.begin(), primary.begin() + 8), "EFI PART");
    auto backup = readSector(disk->path, GiB / sectorSize - 1);
    EXPECT_EQ(std::string(backup.begin(), backup.begin() + 8), "EFI PART");
}

TEST(Gpt, CorruptEntriesDetected)
{
    TempDir dir;
    ASSERT_TRUE(dir.isValid());

    auto disk = allocateDiskImage(dir.path() / "disk.img", GiB);
    ASSERT_TRUE(disk);
    ASSERT_TRUE(buildPartitionTable(*disk));

    // a byte inside the name of the first entry
    flipByte(disk->path, 2 * sectorSize + 60);
    auto read = readPartitionTable(disk->path);
    EXPECT_FALSE(read);
}

TEST(Gpt, CorruptHeaderDetected)
{
    TempDir dir;
    ASSERT_TRUE(dir.isValid());

    auto disk = allocateDiskImage(dir.path() / "disk.img", GiB);
    ASSERT_TRUE(disk);
    ASSERT_TRUE(buildPartitionTable(*disk));

    // disk GUID of the backup header
    flipByte(disk->path, (GiB / sectorSize - 1) * sectorSize + 60);
    EXPECT_FALSE(readPartitionTable(disk->path));
}

TEST(Gpt, BlankDiskIsNotPartitioned)
{
    TempDir dir;
    ASSERT_TRUE(dir.isValid());

    auto disk = allocateDiskImage(dir.path() / "disk.img", 64 * MiB);
    ASSERT_TRUE(disk);
    EXPECT_FALSE(readPartitionTable(disk->path));
}

TEST(Gpt, BuildOnTooSmallDisk)
{
    TempDir dir;
    ASSERT_TRUE(dir.isValid());

    auto disk = allocateDiskImage(dir.path() / "disk.img", 64 * MiB);
    ASSERT_TRUE(disk);
    auto ret = buildPartitionTable(*disk);
    ASSERT_FALSE(ret);
    EXPECT_TRUE(ret.error().is(ErrorCode::PartitionTableWriteFailure));
}
