// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include "ocidisk/disk/mount.h"
#include "ocidisk/utils/error/error.h"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <sys/types.h>

namespace ocidisk::boot {

struct ChrootOptions
{
    // proc, /sys, /dev and /dev/pts; tests without privileges turn it off
    bool mountApiFilesystems{ true };
    std::filesystem::path hostResolvConf{ "/etc/resolv.conf" };
};

// Makes a root filesystem usable for apt and grub through chroot(8) and
// undoes every change in reverse order.
class ChrootSession
{
    // only open() can name it
    struct Key
    {
        explicit Key() = default;
    };

public:
    static utils::error::Result<std::unique_ptr<ChrootSession>>
    open(const std::filesystem::path &root, const ChrootOptions &options = {}) noexcept;

    ChrootSession(const ChrootSession &) = delete;
    ChrootSession &operator=(const ChrootSession &) = delete;
    ChrootSession(ChrootSession &&) = delete;
    ChrootSession &operator=(ChrootSession &&) = delete;
    ~ChrootSession();

    ChrootSession(Key, std::filesystem::path root) noexcept;

    // Unmounts in reverse order. Every mount is attempted, the first
    // failure is returned.
    utils::error::Result<void> releaseMounts() noexcept;

    // Puts back the original resolv.conf and policy-rc.d.
    utils::error::Result<void> restoreFiles() noexcept;

    [[nodiscard]] const std::filesystem::path &root() const noexcept { return m_root; }

private:
    struct ReplacedFile
    {
        std::filesystem::path path;
        // empty when there was nothing to keep
        std::filesystem::path backup;
        bool restored{ false };
    };

    utils::error::Result<void> mountApiFilesystems() noexcept;
    utils::error::Result<void> replaceFile(const std::filesystem::path &relative,
                                           const std::string &content,
                                           mode_t mode) noexcept;

    std::filesystem::path m_root;
    std::vector<disk::Mount> m_mounts;
    std::vector<ReplacedFile> m_files;
};

} // namespace ocidisk::boot
