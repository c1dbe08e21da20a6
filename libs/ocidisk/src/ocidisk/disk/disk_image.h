// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include "ocidisk/utils/error/error.h"

#include <cstdint>
#include <filesystem>

namespace ocidisk::disk {

constexpr uint64_t MiB = 1024ULL * 1024ULL;
constexpr uint64_t GiB = 1024ULL * MiB;

struct DiskImage
{
    std::filesystem::path path;
    uint64_t sizeBytes{ 0 };
};

// Creates or truncates path and extends it to sizeBytes without writing any
// data, so the result is sparse. Anything that is not a writable regular
// file is OutputPathUnwritable.
utils::error::Result<DiskImage> allocateDiskImage(const std::filesystem::path &path,
                                                  uint64_t sizeBytes) noexcept;

} // namespace ocidisk::disk
