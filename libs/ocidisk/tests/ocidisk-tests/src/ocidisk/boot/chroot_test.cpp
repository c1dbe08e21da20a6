// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include <gtest/gtest.h>

#include "common/tempdir.h"
#include "ocidisk/boot/chroot.h"
#include "ocidisk/utils/file.h"

#include <type_traits>

#include <sys/stat.h>

using namespace ocidisk::boot;

class ChrootSessionTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(tmp.isValid());
        root = tmp.path() / "root";
        std::filesystem::create_directories(root / "etc");
        std::filesystem::create_directories(root / "run/systemd/resolve");
        ASSERT_TRUE(ocidisk::utils::writeFile(root / "run/systemd/resolve/stub-resolv.conf",
                                              "nameserver 127.0.0.53\n"));
        std::filesystem::create_symlink("../run/systemd/resolve/stub-resolv.conf",
                                        root / "etc/resolv.conf");

        hostResolv = tmp.path() / "host-resolv.conf";
        ASSERT_TRUE(ocidisk::utils::writeFile(hostResolv, "nameserver 192.0.2.1\n"));

        options.mountApiFilesystems = false;
        options.hostResolvConf = hostResolv;
    }

    TempDir tmp;
    std::filesystem::path root;
    std::filesystem::path hostResolv;
    ChrootOptions options;
};

TEST_F(ChrootSessionTest, InstallsAndRestoresFiles)
{
    auto session = ChrootSession::open(root, options);
    ASSERT_TRUE(session) << session.error().message();
    EXPECT_EQ((*session)->root(), root);

    EXPECT_FALSE(std::filesystem::is_symlink(root / "etc/resolv.conf"));
    EXPECT_EQ(*ocidisk::utils::readFile(root / "etc/resolv.conf"), "nameserver 192.0.2.1\n");

    auto policy = root / "usr/sbin/policy-rc.d";
    EXPECT_EQ(*ocidisk::utils::readFile(policy), "#!/bin/sh\nexit 101\n");
    struct stat st{};
    ASSERT_EQ(::stat(policy.c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 07777, 0755);

    ASSERT_TRUE((*session)->releaseMounts());
    auto ret = (*session)->restoreFiles();
    ASSERT_TRUE(ret) << ret.error().message();

    EXPECT_TRUE(std::filesystem::is_symlink(root / "etc/resolv.conf"));
    EXPECT_EQ(*ocidisk::utils::readFile(root / "etc/resolv.conf"), "nameserver 127.0.0.53\n");
    EXPECT_FALSE(std::filesystem::exists(policy));
    EXPECT_FALSE(std::filesystem::exists(root / "etc/resolv.conf.ocidisk-orig"));

    // a second restore has nothing left to do
    EXPECT_TRUE((*session)->restoreFiles());
}

TEST_F(ChrootSessionTest, DestructorRestores)
{
    ASSERT_TRUE(ocidisk::utils::ensureDirectory(root / "usr/sbin"));
    ASSERT_TRUE(ocidisk::utils::writeFile(root / "usr/sbin/policy-rc.d", "#!/bin/sh\nexit 0\n"));

    {
        auto session = ChrootSession::open(root, options);
        ASSERT_TRUE(session) << session.error().message();
        EXPECT_EQ(*ocidisk::utils::readFile(root / "usr/sbin/policy-rc.d"),
                  "#!/bin/sh\nexit 101\n");
    }

    EXPECT_EQ(*ocidisk::utils::readFile(root / "usr/sbin/policy-rc.d"), "#!/bin/sh\nexit 0\n");
    EXPECT_TRUE(std::filesystem::is_symlink(root / "etc/resolv.conf"));
}

TEST_F(ChrootSessionTest, MissingHostResolvConf)
{
    options.hostResolvConf = tmp.path() / "missing";
    auto session = ChrootSession::open(root, options);
    ASSERT_TRUE(session) << session.error().message();

    // left alone
    EXPECT_TRUE(std::filesystem::is_symlink(root / "etc/resolv.conf"));
    EXPECT_TRUE(std::filesystem::exists(root / "usr/sbin/policy-rc.d"));
}

TEST_F(ChrootSessionTest, OnlyOpenCreatesSessions)
{
    static_assert(!std::is_constructible_v<ChrootSession, std::filesystem::path>);
    static_assert(!std::is_default_constructible_v<ChrootSession>);
    static_assert(!std::is_move_constructible_v<ChrootSession>);

    auto session = ChrootSession::open(root, options);
    ASSERT_TRUE(session) << session.error().message();
    ASSERT_NE(*session, nullptr);
    EXPECT_EQ((*session)->root(), root);
}
