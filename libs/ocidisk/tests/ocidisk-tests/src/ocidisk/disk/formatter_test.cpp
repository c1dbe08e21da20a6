// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include <gtest/gtest.h>

#include "ocidisk/disk/formatter.h"
#include "ocidisk/mocks/command_mock.h"

#include <cctype>

using namespace ocidisk::disk;
using ocidisk::utils::error::ErrorCode;
using ocidisk::utils::error::Result;

TEST(Formatter, GeneratedIds)
{
    auto ids = generateFilesystemIds();
    ASSERT_EQ(ids.espVolumeId.size(), 8);
    for (auto c : ids.espVolumeId) {
        EXPECT_TRUE(std::isxdigit(static_cast<unsigned char>(c)) != 0 && std::islower(c) == 0)
          << ids.espVolumeId;
    }
    EXPECT_EQ(ids.espUuid().size(), 9);
    EXPECT_EQ(ids.espUuid()[4], '-');
    EXPECT_EQ(ids.espUuid().substr(0, 4), ids.espVolumeId.substr(0, 4));

    ASSERT_EQ(ids.rootUuid.size(), 36);
    for (auto c : ids.rootUuid) {
        EXPECT_EQ(std::isupper(static_cast<unsigned char>(c)), 0) << ids.rootUuid;
    }

    EXPECT_NE(generateFilesystemIds().rootUuid, ids.rootUuid);
}

TEST(Formatter, RunsMkfsWithIds)
{
    FilesystemIds ids{ "1A2B3C4D", "5b1a9d2e-3c4f-4a6b-8d7e-9f0a1b2c3d4e" };
    auto calls = std::make_shared<std::vector<RecordedCall>>();
    auto factory = recordingFactory(calls, [](const RecordedCall &) -> Result<std::string> {
        return std::string{};
    });

    auto ret = formatFilesystems("/dev/loop7p1", "/dev/loop7p2", ids, factory);
    ASSERT_TRUE(ret) << ret.error().message();

    ASSERT_EQ(calls->size(), 2);
    EXPECT_EQ((*calls)[0],
              (RecordedCall{ "mkfs.vfat", "-F", "32", "-n", "EFI", "-i", "1A2B3C4D", "/dev/loop7p1" }));
    EXPECT_EQ((*calls)[1],
              (RecordedCall{ "mkfs.ext4", "-F", "-q", "-L", "rootfs", "-U",
                             "5b1a9d2e-3c4f-4a6b-8d7e-9f0a1b2c3d4e", "/dev/loop7p2" }));
    EXPECT_EQ(ids.espUuid(), "1A2B-3C4D");
}

TEST(Formatter, FailureIsFormatFailure)
{
    auto calls = std::make_shared<std::vector<RecordedCall>>();
    auto factory = recordingFactory(calls, [](const RecordedCall &call) -> Result<std::string> {
        OCIDISK_TRACE("fake mkfs");
        if (call[0] == "mkfs.ext4") {
            return OCIDISK_ERR("mkfs.ext4: device busy");
        }
        return std::string{};
    });

    auto ret = formatFilesystems("/dev/loop7p1", "/dev/loop7p2", generateFilesystemIds(), factory);
    ASSERT_FALSE(ret);
    EXPECT_TRUE(ret.error().is(ErrorCode::FormatFailure)) << ret.error().message();
    EXPECT_EQ(calls->size(), 2);
}

TEST(Formatter, StopsAfterEspFailure)
{
    auto calls = std::make_shared<std::vector<RecordedCall>>();
    auto factory = recordingFactory(calls, [](const RecordedCall &) -> Result<std::string> {
        OCIDISK_TRACE("fake mkfs");
        return OCIDISK_ERR("not found", ErrorCode::Failed);
    });

    auto ret = formatFilesystems("/dev/loop7p1", "/dev/loop7p2", generateFilesystemIds(), factory);
    ASSERT_FALSE(ret);
    EXPECT_TRUE(ret.error().is(ErrorCode::FormatFailure));
    EXPECT_EQ(calls->size(), 1);
}
