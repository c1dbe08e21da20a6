/*
 * SPDX-FileCopyrightText: 2023 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#pragma once

#include "ocidisk/utils/error/error.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>

namespace ocidisk::utils::serialize {

template <typename T, typename Source>
error::Result<T> LoadJSON(const Source &content) noexcept
{
    OCIDISK_TRACE("load json");

    try {
        auto json = nlohmann::json::parse(content);
        return json.template get<T>();
    } catch (const std::exception &e) {
        return OCIDISK_ERR(e);
    }
}

template <typename T>
error::Result<T> LoadJSONFile(const std::filesystem::path &filename) noexcept
{
    OCIDISK_TRACE(fmt::format("load json from {}", filename.string()));

    std::ifstream file(filename);
    if (!file.is_open()) {
        return OCIDISK_ERR("failed to open file");
    }

    try {
        auto json = nlohmann::json::parse(file);
        return json.template get<T>();
    } catch (const std::exception &e) {
        return OCIDISK_ERR(e);
    }
}

} // namespace ocidisk::utils::serialize
