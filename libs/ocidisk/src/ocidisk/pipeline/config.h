// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include "ocidisk/utils/error/error.h"

#include <yaml-cpp/yaml.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ocidisk::pipeline {

constexpr int configVersion = 1;
inline const std::filesystem::path defaultConfigPath{ "/etc/ocidisk/config.yaml" };

struct Config
{
    int version{ configVersion };
    // parent of the per run work directory
    std::filesystem::path workDir{ "/var/tmp" };
    std::string engine{ "docker" };
    // zero means no limit
    std::chrono::seconds commandTimeout{ 3600 };
    uint64_t rootHeadroomMiB{ 256 };
    std::string hostname{ "ocidisk" };
    std::string kernelCmdline;
    std::vector<std::string> extraPackages;
    std::string passwordHash{ "sha512" };
    bool parallelLayerReads{ true };
};

utils::error::Result<void> validateConfig(const Config &config) noexcept;

// An explicit path must exist. Without one, defaultConfigPath is read when
// present and the built in defaults are used otherwise.
utils::error::Result<Config>
loadConfig(const std::optional<std::filesystem::path> &path = std::nullopt) noexcept;

} // namespace ocidisk::pipeline

template <>
struct YAML::convert<ocidisk::pipeline::Config>
{
    static Node encode(const ocidisk::pipeline::Config &config);
    static bool decode(const Node &node, ocidisk::pipeline::Config &config);
};
