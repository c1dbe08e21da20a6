// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include <gtest/gtest.h>

#include "ocidisk/image/reference.h"

using namespace ocidisk::image;
using ocidisk::utils::error::ErrorCode;

TEST(ImageReference, EngineNames)
{
    for (const auto *name : { "debian:bookworm",
                              "docker.io/library/ubuntu:24.04",
                              "registry.example.com:5000/team/base",
                              "alpine@sha256:0123abcd" }) {
        auto ref = ImageReference::parse(name);
        ASSERT_TRUE(ref) << name << ": " << ref.error().message();
        EXPECT_EQ(ref->kind, ImageReference::Kind::Engine);
        EXPECT_EQ(ref->name, name);
        EXPECT_EQ(ref->toString(), name);
    }
}

TEST(ImageReference, DockerArchive)
{
    auto ref = ImageReference::parse("docker-archive:/srv/images/debian.tar");
    ASSERT_TRUE(ref) << ref.error().message();
    EXPECT_EQ(ref->kind, ImageReference::Kind::DockerArchive);
    EXPECT_EQ(ref->archivePath, "/srv/images/debian.tar");
    EXPECT_EQ(ref->toString(), "docker-archive:/srv/images/debian.tar");
}

TEST(ImageReference, Invalid)
{
    for (const auto *name : { "", "-v", "--help", "debian bookworm", "debian;rm", "docker-archive:" }) {
        auto ref = ImageReference::parse(name);
        ASSERT_FALSE(ref) << name;
        EXPECT_TRUE(ref.error().is(ErrorCode::ImageNotFound)) << name;
    }
}
