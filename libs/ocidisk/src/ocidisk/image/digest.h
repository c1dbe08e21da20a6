// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include "ocidisk/utils/error/error.h"

#include <filesystem>
#include <string>

namespace ocidisk::image {

// Lower case hex sha256 of the file content.
utils::error::Result<std::string> sha256File(const std::filesystem::path &path) noexcept;

} // namespace ocidisk::image
