// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include <gtest/gtest.h>

#include "common/tempdir.h"
#include "ocidisk/pipeline/config.h"
#include "ocidisk/utils/file.h"

using namespace ocidisk::pipeline;

class ConfigTest : public ::testing::Test
{
protected:
    void SetUp() override { ASSERT_TRUE(tmp.isValid()); }

    std::filesystem::path write(const std::string &content)
    {
        auto path = tmp.path() / "config.yaml";
        auto ret = ocidisk::utils::writeFile(path, content);
        EXPECT_TRUE(ret);
        return path;
    }

    TempDir tmp;
};

TEST_F(ConfigTest, Defaults)
{
    Config config;
    EXPECT_EQ(config.version, configVersion);
    EXPECT_EQ(config.workDir, "/var/tmp");
    EXPECT_EQ(config.engine, "docker");
    EXPECT_EQ(config.commandTimeout.count(), 3600);
    EXPECT_EQ(config.rootHeadroomMiB, 256);
    EXPECT_EQ(config.hostname, "ocidisk");
    EXPECT_TRUE(config.kernelCmdline.empty());
    EXPECT_TRUE(config.extraPackages.empty());
    EXPECT_EQ(config.passwordHash, "sha512");
    EXPECT_TRUE(config.parallelLayerReads);
    EXPECT_TRUE(validateConfig(config));
}

TEST_F(ConfigTest, LoadFile)
{
    auto path = write(R"(version: 1
workDir: /srv/ocidisk
engine: podman
commandTimeoutSeconds: 0
rootHeadroomMiB: 1024
hostname: build-01
kernelCmdline: net.ifnames=0
extraPackages:
  - openssh-server
  - vim
passwordHash: yescrypt
parallelLayerReads: false
)");

    auto config = loadConfig(path);
    ASSERT_TRUE(config) << config.error().message();
    EXPECT_EQ(config->workDir, "/srv/ocidisk");
    EXPECT_EQ(config->engine, "podman");
    EXPECT_EQ(config->commandTimeout.count(), 0);
    EXPECT_EQ(config->rootHeadroomMiB, 1024);
    EXPECT_EQ(config->hostname, "build-01");
    EXPECT_EQ(config->kernelCmdline, "net.ifnames=0");
    EXPECT_EQ(config->extraPackages, (std::vector<std::string>{ "openssh-server", "vim" }));
    EXPECT_EQ(config->passwordHash, "yescrypt");
    EXPECT_FALSE(config->parallelLayerReads);
}

TEST_F(ConfigTest, PartialFileKeepsDefaults)
{
    auto config = loadConfig(write("version: 1\nhostname: vm\n"));
    ASSERT_TRUE(config) << config.error().message();
    EXPECT_EQ(config->hostname, "vm");
    EXPECT_EQ(config->engine, "docker");
    EXPECT_EQ(config->rootHeadroomMiB, 256);
}

TEST_F(ConfigTest, VersionRequired)
{
    EXPECT_FALSE(loadConfig(write("hostname: vm\n")));
    EXPECT_FALSE(loadConfig(write("version: 2\n")));
}

TEST_F(ConfigTest, InvalidValuesRejected)
{
    EXPECT_FALSE(loadConfig(write("version: 1\nengine: lxc\n")));
    EXPECT_FALSE(loadConfig(write("version: 1\nworkDir: relative/dir\n")));
    EXPECT_FALSE(loadConfig(write("version: 1\nhostname: Not_Valid\n")));
    EXPECT_FALSE(loadConfig(write("version: 1\npasswordHash: md5\n")));
    EXPECT_FALSE(loadConfig(write("version: 1\nrootHeadroomMiB: lots\n")));
    EXPECT_FALSE(loadConfig(write("- version\n")));
}

TEST_F(ConfigTest, ExplicitPathMustExist)
{
    auto config = loadConfig(tmp.path() / "missing.yaml");
    ASSERT_FALSE(config);
}

TEST_F(ConfigTest, ValidateConfig)
{
    Config config;
    config.commandTimeout = std::chrono::seconds{ -1 };
    EXPECT_FALSE(validateConfig(config));

    config = Config{};
    config.workDir.clear();
    EXPECT_FALSE(validateConfig(config));

    config = Config{};
    config.hostname = "-edge";
    EXPECT_FALSE(validateConfig(config));

    config = Config{};
    config.version = 0;
    EXPECT_FALSE(validateConfig(config));
}

TEST_F(ConfigTest, EncodeDecode)
{
    Config config;
    config.engine = "podman";
    config.extraPackages = { "curl" };

    YAML::Node node;
    node = config;
    auto decoded = node.as<Config>();
    EXPECT_EQ(decoded.engine, "podman");
    EXPECT_EQ(decoded.extraPackages, config.extraPackages);
    EXPECT_EQ(decoded.commandTimeout, config.commandTimeout);
}
