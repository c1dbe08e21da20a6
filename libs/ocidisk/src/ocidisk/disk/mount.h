// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include "ocidisk/utils/error/error.h"

#include <filesystem>
#include <string>

namespace ocidisk::disk {

// A mount point owned by ocidisk, unmounted by release() or the destructor.
class Mount
{
public:
    static utils::error::Result<Mount> mount(const std::string &source,
                                             const std::filesystem::path &target,
                                             const std::string &fstype,
                                             unsigned long flags = 0,
                                             const std::string &data = {}) noexcept;

    // non recursive bind mount
    static utils::error::Result<Mount> bind(const std::filesystem::path &source,
                                            const std::filesystem::path &target) noexcept;

    ~Mount();

    Mount(const Mount &) = delete;
    Mount &operator=(const Mount &) = delete;
    Mount(Mount &&other) noexcept;
    Mount &operator=(Mount &&other) noexcept;

    // Falls back to a lazy unmount when the target is busy. Only the first
    // call does anything.
    utils::error::Result<void> release() noexcept;

    [[nodiscard]] const std::filesystem::path &target() const noexcept { return m_target; }

    [[nodiscard]] bool mounted() const noexcept { return m_mounted; }

private:
    explicit Mount(std::filesystem::path target) noexcept;

    std::filesystem::path m_target;
    bool m_mounted{ false };
};

} // namespace ocidisk::disk
