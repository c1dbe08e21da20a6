// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include "ocidisk/utils/error/error.h"

#include <filesystem>
#include <string>
#include <string_view>

namespace ocidisk::image {

// The --image-name argument.
//
// "name[:tag][@digest]" is resolved through a container engine,
// "docker-archive:<path>" names a tarball written by `docker save`.
struct ImageReference
{
    enum class Kind : uint8_t {
        Engine,
        DockerArchive,
    };

    static constexpr std::string_view archivePrefix = "docker-archive:";

    static utils::error::Result<ImageReference> parse(std::string_view text) noexcept;

    [[nodiscard]] std::string toString() const;

    Kind kind{ Kind::Engine };
    std::string name;
    std::filesystem::path archivePath;
};

} // namespace ocidisk::image
