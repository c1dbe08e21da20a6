// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace ocidisk::image {

// One element of manifest.json written by `docker save` / `podman save`.
struct SavedManifest
{
    std::string config;
    std::vector<std::string> repoTags;
    std::vector<std::string> layers;
};

// The parts of the image configuration blob that are checked.
struct ImageConfig
{
    std::vector<std::string> diffIds;
};

void from_json(const nlohmann::json &json, SavedManifest &manifest);
void from_json(const nlohmann::json &json, ImageConfig &config);

} // namespace ocidisk::image
