// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include "ocidisk/utils/error/error.h"

#include <atomic>
#include <filesystem>

#include <sys/types.h>
#include <unistd.h>

namespace ocidisk::utils::filelock {

// Exclusive open file description lock on a single file.
//
// The lock belongs to the descriptor opened by create(), not to the process:
// closing other descriptors of the same file keeps it, and two FileLock
// objects of one process conflict with each other like two processes do.
class FileLock
{
public:
    static utils::error::Result<FileLock> create(std::filesystem::path path,
                                                 bool create_if_missing = true) noexcept;

    ~FileLock() noexcept;

    FileLock(const FileLock &) = delete;
    FileLock &operator=(const FileLock &) = delete;
    FileLock(FileLock &&) noexcept;
    FileLock &operator=(FileLock &&) noexcept;

    // never waits, false when another holder has the lock
    utils::error::Result<bool> tryLock() noexcept;

    utils::error::Result<void> unlock() noexcept;

    [[nodiscard]] bool isLocked() const noexcept;

    [[nodiscard]] int fd() const noexcept { return fd_; }

    [[nodiscard]] const std::filesystem::path &path() const noexcept { return path_; }

private:
    FileLock(int fd, std::filesystem::path path) noexcept;

    utils::error::Result<bool> apply(short lockType) noexcept;

    void reset() noexcept;

    std::atomic_bool locked{ false };
    int fd_{ -1 };
    std::filesystem::path path_;
};

} // namespace ocidisk::utils::filelock
