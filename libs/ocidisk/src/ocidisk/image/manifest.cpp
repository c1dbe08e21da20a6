// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "ocidisk/image/manifest.h"

namespace ocidisk::image {

void from_json(const nlohmann::json &json, SavedManifest &manifest)
{
    manifest.config = json.at("Config").get<std::string>();
    manifest.layers = json.at("Layers").get<std::vector<std::string>>();
    if (auto it = json.find("RepoTags"); it != json.end() && it->is_array()) {
        manifest.repoTags = it->get<std::vector<std::string>>();
    }
}

void from_json(const nlohmann::json &json, ImageConfig &config)
{
    auto rootfs = json.find("rootfs");
    if (rootfs == json.end() || !rootfs->is_object()) {
        return;
    }
    if (auto ids = rootfs->find("diff_ids"); ids != rootfs->end() && ids->is_array()) {
        config.diffIds = ids->get<std::vector<std::string>>();
    }
}

} // namespace ocidisk::image
