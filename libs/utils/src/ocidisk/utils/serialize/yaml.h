/*
 * SPDX-FileCopyrightText: 2023 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#pragma once

#include "ocidisk/utils/error/error.h"

#include <yaml-cpp/yaml.h>

#include <exception>
#include <filesystem>
#include <fstream>
#include <string>

// T is decoded through a YAML::convert<T> specialization.
namespace ocidisk::utils::serialize {

template <typename T, typename Source>
error::Result<T> LoadYAML(Source &content)
{
    OCIDISK_TRACE("load yaml");
    try {
        YAML::Node node = YAML::Load(content);
        return node.template as<T>();
    } catch (const std::exception &e) {
        return OCIDISK_ERR(e);
    }
}

template <typename T>
error::Result<T> LoadYAMLFile(const std::filesystem::path &filename) noexcept
{
    OCIDISK_TRACE("load yaml from file");

    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
        return OCIDISK_ERR("Failed to open file: " + filename.string());
    }

    return LoadYAML<T>(file_stream);
}

} // namespace ocidisk::utils::serialize
