// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "ocidisk/image/reference.h"

#include "ocidisk/common/strings.h"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>

namespace ocidisk::image {

using utils::error::ErrorCode;

utils::error::Result<ImageReference> ImageReference::parse(std::string_view text) noexcept
{
    OCIDISK_TRACE(fmt::format("parse image reference {}", text));

    if (common::strings::starts_with(text, archivePrefix)) {
        auto path = text.substr(archivePrefix.size());
        if (path.empty()) {
            return OCIDISK_ERR("archive path is empty", ErrorCode::ImageNotFound);
        }

        ImageReference ref;
        ref.kind = Kind::DockerArchive;
        ref.name = std::string(text);
        ref.archivePath = std::filesystem::path(std::string(path));
        return ref;
    }

    if (text.empty()) {
        return OCIDISK_ERR("image name is empty", ErrorCode::ImageNotFound);
    }

    // the name ends up on an engine command line
    if (text.front() == '-') {
        return OCIDISK_ERR("image name must not start with '-'", ErrorCode::ImageNotFound);
    }

    auto valid = std::all_of(text.begin(), text.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '.' || c == '_'
          || c == '-' || c == '/' || c == ':' || c == '@';
    });
    if (!valid) {
        return OCIDISK_ERR("image name contains invalid characters", ErrorCode::ImageNotFound);
    }

    ImageReference ref;
    ref.kind = Kind::Engine;
    ref.name = std::string(text);
    return ref;
}

std::string ImageReference::toString() const
{
    return name;
}

} // namespace ocidisk::image
