// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include <gtest/gtest.h>

#include "common/tar_builder.h"
#include "common/tempdir.h"
#include "ocidisk/image/layer_archive.h"
#include "ocidisk/utils/file.h"

#include <fstream>
#include <unordered_map>

using namespace ocidisk::image;
using ocidisk::utils::error::ErrorCode;

TEST(NormalizeEntryPath, Forms)
{
    EXPECT_EQ(*normalizeEntryPath("./etc/passwd"), "etc/passwd");
    EXPECT_EQ(*normalizeEntryPath("/usr//bin/"), "usr/bin");
    EXPECT_EQ(*normalizeEntryPath("./"), "");
    EXPECT_EQ(*normalizeEntryPath("a/./b"), "a/b");

    auto escape = normalizeEntryPath("etc/../../root");
    ASSERT_FALSE(escape);
    EXPECT_TRUE(escape.error().is(ErrorCode::LayerCorrupt));
}

TEST(LayerArchive, ReadEntries)
{
    TempDir dir;
    ASSERT_TRUE(dir.isValid());
    auto tar = dir.path() / "layer.tar";
    {
        TarBuilder builder(tar);
        builder.dir("./")
          .dir("etc")
          .file("etc/hostname", "base\n")
          .symlink("bin", "usr/bin")
          .hardlink("etc/hostname.bak", "etc/hostname")
          .fifo("run/initctl")
          .whiteout("etc/.wh.motd")
          .whiteout("var/cache/.wh..wh..opq")
          .whiteout(".wh..wh.plnk");
    }

    LayerArchive archive(tar, "sha256:test");
    EXPECT_EQ(archive.digest(), "sha256:test");
    auto entries = archive.readEntries();
    ASSERT_TRUE(entries) << entries.error().message();
    ASSERT_EQ(entries->size(), 7);

    const auto &e = *entries;
    EXPECT_EQ(e[0].path, "etc");
    EXPECT_EQ(e[0].kind, EntryKind::Directory);
    EXPECT_EQ(e[0].mode, 0755);

    EXPECT_EQ(e[1].path, "etc/hostname");
    EXPECT_EQ(e[1].kind, EntryKind::Regular);
    EXPECT_EQ(e[1].size, 5);
    EXPECT_EQ(e[1].mtime, 1700000000);

    EXPECT_EQ(e[2].path, "bin");
    EXPECT_EQ(e[2].kind, EntryKind::Symlink);
    EXPECT_EQ(e[2].linkTarget, "usr/bin");

    EXPECT_EQ(e[3].kind, EntryKind::HardLink);
    EXPECT_EQ(e[3].linkTarget, "etc/hostname");

    EXPECT_EQ(e[4].kind, EntryKind::Fifo);

    EXPECT_EQ(e[5].kind, EntryKind::Whiteout);
    EXPECT_EQ(e[5].path, "etc/motd");
    EXPECT_TRUE(e[5].isWhiteout());

    EXPECT_EQ(e[6].kind, EntryKind::OpaqueWhiteout);
    EXPECT_EQ(e[6].path, "var/cache");

    // record positions count the dropped root record
    EXPECT_EQ(e[0].index, 1);
    EXPECT_EQ(e[1].index, 2);
}

TEST(LayerArchive, RejectsEscapingPaths)
{
    TempDir dir;
    ASSERT_TRUE(dir.isValid());
    auto tar = dir.path() / "evil.tar";
    {
        TarBuilder builder(tar);
        builder.file("../outside", "x");
    }

    auto entries = LayerArchive(tar, "sha256:evil").readEntries();
    ASSERT_FALSE(entries);
    EXPECT_TRUE(entries.error().is(ErrorCode::LayerCorrupt)) << entries.error().message();
}

TEST(LayerArchive, RejectsEscapingHardLinks)
{
    TempDir dir;
    ASSERT_TRUE(dir.isValid());
    auto tar = dir.path() / "evil.tar";
    {
        TarBuilder builder(tar);
        builder.file("etc/passwd", "root").hardlink("etc/shadow", "../../etc/shadow");
    }

    auto entries = LayerArchive(tar, "sha256:evil").readEntries();
    ASSERT_FALSE(entries);
    EXPECT_TRUE(entries.error().is(ErrorCode::LayerCorrupt));
}

TEST(LayerArchive, GarbageIsCorrupt)
{
    TempDir dir;
    ASSERT_TRUE(dir.isValid());
    auto tar = dir.path() / "garbage.tar";
    ASSERT_TRUE(ocidisk::utils::writeFile(tar, std::string(1536, '\x7f')));

    auto entries = LayerArchive(tar, "sha256:garbage").readEntries();
    ASSERT_FALSE(entries);
    EXPECT_TRUE(entries.error().is(ErrorCode::LayerCorrupt));
}

TEST(LayerArchive, ExtractFiles)
{
    TempDir dir;
    ASSERT_TRUE(dir.isValid());
    auto tar = dir.path() / "layer.tar";
    {
        TarBuilder builder(tar);
        builder.file("a", "first").file("b", "second").file("c", "third");
    }

    LayerArchive archive(tar, "sha256:files");
    auto entries = archive.readEntries();
    ASSERT_TRUE(entries);
    ASSERT_EQ(entries->size(), 3);

    std::unordered_map<std::size_t, std::filesystem::path> targets{
        { (*entries)[0].index, dir.path() / "out-a" },
        { (*entries)[2].index, dir.path() / "out-c" },
    };
    auto ret = archive.extractFiles(targets);
    ASSERT_TRUE(ret) << ret.error().message();

    EXPECT_EQ(*ocidisk::utils::readFile(dir.path() / "out-a"), "first");
    EXPECT_EQ(*ocidisk::utils::readFile(dir.path() / "out-c"), "third");
    EXPECT_FALSE(std::filesystem::exists(dir.path() / "out-b"));
}
