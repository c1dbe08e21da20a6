// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include <gtest/gtest.h>

#include "common/tar_builder.h"
#include "common/tempdir.h"
#include "ocidisk/image/layer_merger.h"
#include "ocidisk/image/materializer.h"
#include "ocidisk/utils/file.h"

#include <filesystem>
#include <functional>

#include <sys/stat.h>

using namespace ocidisk::image;

class MaterializerTest : public ::testing::Test
{
protected:
    void SetUp() override { ASSERT_TRUE(tmp.isValid()); }

    LayerArchive layer(const std::string &name, const std::function<void(TarBuilder &)> &fill)
    {
        auto path = tmp.path() / name;
        {
            TarBuilder builder(path);
            fill(builder);
        }
        return LayerArchive(path, "sha256:" + name);
    }

    TempDir tmp;
};

TEST_F(MaterializerTest, MergedTreeOnDisk)
{
    std::vector<LayerArchive> archives;
    archives.push_back(layer("base.tar", [](TarBuilder &b) {
        b.dir("etc")
          .file("etc/hostname", "base\n")
          .file("etc/motd", "hello\n")
          .file("etc/shadow", "root:*:1::::::\n", 0600)
          .dir("var/cache/apt")
          .file("var/cache/apt/pkgcache.bin", "cache")
          .file("usr/bin/gzip", "gzip", 0755)
          .hardlink("usr/bin/gunzip", "usr/bin/gzip")
          .symlink("bin", "usr/bin")
          .fifo("run/initctl");
    }));
    archives.push_back(layer("app.tar", [](TarBuilder &b) {
        b.file("etc/hostname", "app\n")
          .whiteout("etc/.wh.motd")
          .whiteout("var/cache/apt/.wh..wh..opq")
          .dir("etc", 0750);
    }));

    auto layers = readLayers(archives, false);
    ASSERT_TRUE(layers) << layers.error().message();
    auto tree = mergeLayers(*layers);
    ASSERT_TRUE(tree) << tree.error().message();

    auto dest = tmp.path() / "rootfs";
    MaterializeOptions options;
    options.preserveOwnership = false;
    auto ret = materialize(*tree, archives, dest, options);
    ASSERT_TRUE(ret) << ret.error().message();

    EXPECT_EQ(*ocidisk::utils::readFile(dest / "etc/hostname"), "app\n");
    EXPECT_FALSE(std::filesystem::exists(dest / "etc/motd"));
    EXPECT_TRUE(std::filesystem::is_directory(dest / "var/cache/apt"));
    EXPECT_FALSE(std::filesystem::exists(dest / "var/cache/apt/pkgcache.bin"));
    EXPECT_TRUE(std::filesystem::is_symlink(dest / "bin"));
    EXPECT_EQ(std::filesystem::read_symlink(dest / "bin"), "usr/bin");
    EXPECT_TRUE(std::filesystem::is_fifo(dest / "run/initctl"));

    struct stat gzip{};
    struct stat gunzip{};
    ASSERT_EQ(::stat((dest / "usr/bin/gzip").c_str(), &gzip), 0);
    ASSERT_EQ(::stat((dest / "usr/bin/gunzip").c_str(), &gunzip), 0);
    EXPECT_EQ(gzip.st_ino, gunzip.st_ino);
    EXPECT_EQ(gzip.st_mode & 07777, 0755);

    struct stat shadow{};
    ASSERT_EQ(::stat((dest / "etc/shadow").c_str(), &shadow), 0);
    EXPECT_EQ(shadow.st_mode & 07777, 0600);
    EXPECT_EQ(shadow.st_mtime, 1700000000);

    struct stat etc{};
    ASSERT_EQ(::stat((dest / "etc").c_str(), &etc), 0);
    EXPECT_EQ(etc.st_mode & 07777, 0750);

    // directories only implied by their children
    struct stat usr{};
    ASSERT_EQ(::stat((dest / "usr").c_str(), &usr), 0);
    EXPECT_EQ(usr.st_mode & 07777, 0755);
}

TEST_F(MaterializerTest, EmptyTree)
{
    MergedTree tree;
    auto dest = tmp.path() / "empty";
    auto ret = materialize(tree, {}, dest);
    ASSERT_TRUE(ret) << ret.error().message();
    EXPECT_TRUE(std::filesystem::is_directory(dest));
    EXPECT_TRUE(std::filesystem::is_empty(dest));
}

TEST_F(MaterializerTest, HardLinkOutlivesRemovedTarget)
{
    std::vector<LayerArchive> archives;
    archives.push_back(layer("base.tar", [](TarBuilder &b) {
        b.file("usr/bin/perl", "perl 5.36", 0755).hardlink("usr/bin/perl5.36", "usr/bin/perl");
    }));
    archives.push_back(layer("slim.tar", [](TarBuilder &b) {
        b.whiteout("usr/bin/.wh.perl");
    }));

    auto layers = readLayers(archives, false);
    ASSERT_TRUE(layers) << layers.error().message();
    auto tree = mergeLayers(*layers);
    ASSERT_TRUE(tree) << tree.error().message();

    auto dest = tmp.path() / "rootfs";
    MaterializeOptions options;
    options.preserveOwnership = false;
    auto ret = materialize(*tree, archives, dest, options);
    ASSERT_TRUE(ret) << ret.error().message();

    EXPECT_FALSE(std::filesystem::exists(dest / "usr/bin/perl"));
    EXPECT_EQ(*ocidisk::utils::readFile(dest / "usr/bin/perl5.36"), "perl 5.36");

    struct stat st{};
    ASSERT_EQ(::stat((dest / "usr/bin/perl5.36").c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 07777, 0755);
}
