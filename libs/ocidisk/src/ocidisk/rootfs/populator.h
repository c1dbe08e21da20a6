// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include "ocidisk/disk/mount.h"
#include "ocidisk/utils/error/error.h"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace ocidisk::rootfs {

// Where the ESP is mounted, relative to the root filesystem.
inline const std::filesystem::path espMountPoint{ "boot/efi" };

struct SpaceEstimate
{
    uint64_t bytes{ 0 };
    uint64_t inodes{ 0 };
};

// File sizes rounded up to 4 KiB plus 256 bytes per inode. Paths below any of
// the excluded relative paths are not counted.
utils::error::Result<SpaceEstimate>
estimateTreeSize(const std::filesystem::path &root,
                 const std::filesystem::path &excluded = {}) noexcept;

struct FreeSpace
{
    uint64_t bytes{ 0 };
    uint64_t inodes{ 0 };
    // FAT has no inode limit
    bool inodesLimited{ true };
};

// Space available to unprivileged writers of the filesystem holding path.
utils::error::Result<FreeSpace> freeSpace(const std::filesystem::path &path) noexcept;

// InsufficientSpace unless need plus headroom bytes and need inodes fit into
// available. Filling the filesystem exactly is allowed.
utils::error::Result<void> checkFreeSpace(std::string_view what,
                                          const SpaceEstimate &need,
                                          const FreeSpace &available,
                                          uint64_t headroomBytes = 0) noexcept;

struct CopyOptions
{
    bool preserveOwnership{ true };
    // Below this relative path (a FAT filesystem), ownership, modes,
    // symlinks and xattrs are applied when possible and skipped otherwise.
    std::filesystem::path bestEffortPrefix;
};

// Copies the content of src into dst, which must exist. Keeps modes,
// ownership, symlinks, hard links, xattrs and timestamps, and recreates device
// nodes and FIFOs. Directory metadata is applied after their content.
utils::error::Result<void> copyTree(const std::filesystem::path &src,
                                    const std::filesystem::path &dst,
                                    const CopyOptions &options = {}) noexcept;

// The root filesystem mounted at a directory with the ESP below it.
class MountedDisk
{
public:
    static utils::error::Result<MountedDisk> mount(const std::string &rootDevice,
                                                   const std::string &espDevice,
                                                   const std::filesystem::path &mountPoint) noexcept;

    MountedDisk(MountedDisk &&) noexcept = default;
    MountedDisk &operator=(MountedDisk &&) noexcept = default;

    [[nodiscard]] const std::filesystem::path &root() const noexcept { return m_root.target(); }

    [[nodiscard]] std::filesystem::path esp() const { return m_esp.target(); }

    utils::error::Result<void> releaseEsp() noexcept { return m_esp.release(); }

    utils::error::Result<void> releaseRoot() noexcept { return m_root.release(); }

private:
    MountedDisk(disk::Mount root, disk::Mount esp) noexcept;

    // declared first, destroyed last
    disk::Mount m_root;
    disk::Mount m_esp;
};

// Checks the free space of the mounted disk and copies rootfs onto it.
// headroomBytes stays free on the root filesystem.
utils::error::Result<void> populate(const std::filesystem::path &rootfs,
                                    MountedDisk &disk,
                                    uint64_t headroomBytes,
                                    const CopyOptions &options = {}) noexcept;

} // namespace ocidisk::rootfs
