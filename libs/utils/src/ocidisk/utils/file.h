// SPDX-FileCopyrightText: 2024 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once
#include "ocidisk/utils/error/error.h"

#include <filesystem>
#include <string>

#include <sys/types.h>

namespace ocidisk::utils {

ocidisk::utils::error::Result<std::string> readFile(const std::filesystem::path &filepath);

ocidisk::utils::error::Result<void> writeFile(const std::filesystem::path &filepath,
                                              const std::string &content);

// Writes content to a temporary file beside filepath and renames it over filepath.
// The new file gets mode, uid and gid.
ocidisk::utils::error::Result<void> writeFileAtomic(const std::filesystem::path &filepath,
                                                    const std::string &content,
                                                    mode_t mode,
                                                    uid_t uid,
                                                    gid_t gid) noexcept;

ocidisk::utils::error::Result<void> ensureDirectory(const std::filesystem::path &dir);

} // namespace ocidisk::utils
