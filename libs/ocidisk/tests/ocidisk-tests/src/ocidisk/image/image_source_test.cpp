// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include <gtest/gtest.h>

#include "common/tar_builder.h"
#include "common/tempdir.h"
#include "ocidisk/image/digest.h"
#include "ocidisk/image/image_source.h"
#include "ocidisk/mocks/command_mock.h"
#include "ocidisk/utils/file.h"

#include <nlohmann/json.hpp>

using namespace ocidisk::image;
using ocidisk::utils::error::ErrorCode;

class ImageSourceTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(tmp.isValid());
        workDir = tmp.path() / "work";
        std::filesystem::create_directories(workDir);
    }

    // Writes a `docker save` style archive with one layer per content map.
    std::filesystem::path savedImage(const std::vector<std::vector<std::string>> &layers,
                                     bool corruptDiffId = false)
    {
        std::vector<std::pair<std::string, std::string>> blobs;
        nlohmann::json diffIds = nlohmann::json::array();
        for (std::size_t i = 0; i < layers.size(); ++i) {
            auto layerPath = tmp.path() / ("layer" + std::to_string(i) + ".tar");
            {
                TarBuilder builder(layerPath);
                for (const auto &name : layers[i]) {
                    builder.file(name, name + "\n");
                }
            }
            auto digest = sha256File(layerPath);
            EXPECT_TRUE(digest);
            auto content = ocidisk::utils::readFile(layerPath);
            EXPECT_TRUE(content);
            blobs.emplace_back(*digest + "/layer.tar", *content);
            diffIds.push_back("sha256:" + (corruptDiffId ? std::string(64, '0') : *digest));
        }

        nlohmann::json manifest = nlohmann::json::array();
        nlohmann::json layerNames = nlohmann::json::array();
        for (const auto &blob : blobs) {
            layerNames.push_back(blob.first);
        }
        nlohmann::json image = nlohmann::json::object();
        image["Config"] = "config.json";
        image["RepoTags"] = nlohmann::json::array({ "test:latest" });
        image["Layers"] = layerNames;
        manifest.push_back(image);

        nlohmann::json config = nlohmann::json::object();
        config["rootfs"]["type"] = "layers";
        config["rootfs"]["diff_ids"] = diffIds;

        auto tarball = tmp.path() / "image.tar";
        TarBuilder builder(tarball);
        builder.file("manifest.json", manifest.dump()).file("config.json", config.dump());
        for (const auto &[name, content] : blobs) {
            builder.file(name, content);
        }
        return tarball;
    }

    TempDir tmp;
    std::filesystem::path workDir;
};

TEST_F(ImageSourceTest, LoadSavedImage)
{
    auto tarball = savedImage({ { "etc/os-release" }, { "usr/bin/vim" } });
    auto ref = ImageReference::parse("docker-archive:" + tarball.string());
    ASSERT_TRUE(ref);

    auto image = ArchiveImageSource().fetch(*ref, workDir);
    ASSERT_TRUE(image) << image.error().message();
    ASSERT_EQ(image->layers.size(), 2);
    ASSERT_EQ(image->diffIds.size(), 2);
    EXPECT_EQ(image->layers[0].digest(), image->diffIds[0]);
    EXPECT_EQ(image->layers[1].digest(), image->diffIds[1]);
    EXPECT_TRUE(std::filesystem::is_regular_file(image->layers[0].path()));

    auto entries = image->layers[1].readEntries();
    ASSERT_TRUE(entries);
    ASSERT_EQ(entries->size(), 1);
    EXPECT_EQ((*entries)[0].path, "usr/bin/vim");
}

TEST_F(ImageSourceTest, DigestMismatchIsCorrupt)
{
    auto tarball = savedImage({ { "etc/os-release" } }, true);
    auto ref = ImageReference::parse("docker-archive:" + tarball.string());
    ASSERT_TRUE(ref);

    auto image = loadSavedImage(*ref, tarball, workDir);
    ASSERT_FALSE(image);
    EXPECT_TRUE(image.error().is(ErrorCode::LayerCorrupt)) << image.error().message();
}

TEST_F(ImageSourceTest, MissingArchive)
{
    auto ref = ImageReference::parse("docker-archive:/nonexistent/image.tar");
    ASSERT_TRUE(ref);

    auto image = ArchiveImageSource().fetch(*ref, workDir);
    ASSERT_FALSE(image);
    EXPECT_TRUE(image.error().is(ErrorCode::ImageNotFound));
}

TEST_F(ImageSourceTest, EnginePullFailure)
{
    auto calls = std::make_shared<std::vector<RecordedCall>>();
    auto factory = recordingFactory(calls, [](const RecordedCall &call) -> ocidisk::utils::error::Result<std::string> {
        OCIDISK_TRACE("fake engine");
        return OCIDISK_ERR(call[1] + ": no such image");
    });

    auto ref = ImageReference::parse("registry.invalid/none:latest");
    ASSERT_TRUE(ref);
    EngineImageSource source("docker", factory);
    auto image = source.fetch(*ref, workDir);
    ASSERT_FALSE(image);
    EXPECT_TRUE(image.error().is(ErrorCode::ImageNotFound)) << image.error().message();

    ASSERT_EQ(calls->size(), 2);
    EXPECT_EQ((*calls)[0][0], "docker");
    EXPECT_EQ((*calls)[0][1], "image");
    EXPECT_EQ((*calls)[1], (RecordedCall{ "docker", "pull", "registry.invalid/none:latest" }));
}

TEST_F(ImageSourceTest, EngineSavesLocalImage)
{
    auto saved = savedImage({ { "etc/debian_version" } });
    auto calls = std::make_shared<std::vector<RecordedCall>>();
    auto factory = recordingFactory(
      calls,
      [saved](const RecordedCall &call) -> ocidisk::utils::error::Result<std::string> {
          OCIDISK_TRACE("fake engine");
          if (call[1] == "save") {
              std::error_code ec;
              std::filesystem::copy_file(saved, call[3], ec);
              if (ec) {
                  return OCIDISK_ERR("copy", ec);
              }
          }
          return std::string("sha256:feed\n");
      });

    auto ref = ImageReference::parse("debian:bookworm");
    ASSERT_TRUE(ref);
    auto source = makeImageSource(*ref, "podman", factory);
    auto image = source->fetch(*ref, workDir);
    ASSERT_TRUE(image) << image.error().message();
    EXPECT_EQ(image->layers.size(), 1);

    ASSERT_EQ(calls->size(), 2);
    EXPECT_EQ((*calls)[0][0], "podman");
    EXPECT_EQ((*calls)[1][1], "save");
    EXPECT_EQ((*calls)[1][2], "-o");
    EXPECT_EQ((*calls)[1][4], "debian:bookworm");
}
