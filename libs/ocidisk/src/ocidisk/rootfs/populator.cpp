// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "ocidisk/rootfs/populator.h"

#include "ocidisk/common/error.h"
#include "ocidisk/disk/disk_image.h"
#include "ocidisk/utils/log/log.h"

#include <fmt/format.h>
#include <gsl/gsl>

#include <algorithm>
#include <array>
#include <map>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <sys/xattr.h>
#include <unistd.h>

namespace ocidisk::rootfs {

using utils::error::ErrorCode;

namespace {

constexpr uint64_t blockSize = 4096;
constexpr uint64_t inodeOverhead = 256;
constexpr std::size_t copyBufferSize = 1024 * 1024;

ErrorCode categorize(int err) noexcept
{
    return err == ENOSPC || err == EDQUOT ? ErrorCode::InsufficientSpace : ErrorCode::Failed;
}

bool isBelow(const std::filesystem::path &relative, const std::filesystem::path &prefix)
{
    if (prefix.empty()) {
        return false;
    }
    return std::mismatch(prefix.begin(), prefix.end(), relative.begin(), relative.end()).first
      == prefix.end();
}

utils::error::Result<std::vector<std::string>> listXattrs(const std::filesystem::path &path)
{
    OCIDISK_TRACE(fmt::format("list xattrs of {}", path.string()));

    while (true) {
        auto size = ::llistxattr(path.c_str(), nullptr, 0);
        if (size < 0) {
            if (errno == ENOTSUP) {
                return std::vector<std::string>{};
            }
            return OCIDISK_ERR(common::error::errorString(errno));
        }
        if (size == 0) {
            return std::vector<std::string>{};
        }

        std::string names(static_cast<std::size_t>(size), '\0');
        size = ::llistxattr(path.c_str(), names.data(), names.size());
        if (size < 0) {
            // grew in between
            if (errno == ERANGE) {
                continue;
            }
            return OCIDISK_ERR(common::error::errorString(errno));
        }
        names.resize(static_cast<std::size_t>(size));

        std::vector<std::string> result;
        std::size_t start = 0;
        while (start < names.size()) {
            auto end = names.find('\0', start);
            if (end == std::string::npos) {
                end = names.size();
            }
            if (end > start) {
                result.emplace_back(names.substr(start, end - start));
            }
            start = end + 1;
        }
        return result;
    }
}

utils::error::Result<void> copyXattrs(const std::filesystem::path &src,
                                      const std::filesystem::path &dst) noexcept
{
    OCIDISK_TRACE(fmt::format("copy xattrs to {}", dst.string()));

    auto names = listXattrs(src);
    if (!names) {
        return OCIDISK_ERR(names);
    }

    for (const auto &name : *names) {
        auto size = ::lgetxattr(src.c_str(), name.c_str(), nullptr, 0);
        if (size < 0) {
            return OCIDISK_ERR(
              fmt::format("lgetxattr {}: {}", name, common::error::errorString(errno)));
        }
        std::string value(static_cast<std::size_t>(size), '\0');
        size = ::lgetxattr(src.c_str(), name.c_str(), value.data(), value.size());
        if (size < 0) {
            return OCIDISK_ERR(
              fmt::format("lgetxattr {}: {}", name, common::error::errorString(errno)));
        }
        value.resize(static_cast<std::size_t>(size));

        if (::lsetxattr(dst.c_str(), name.c_str(), value.data(), value.size(), 0) != 0) {
            int err = errno;
            return OCIDISK_ERR(
              fmt::format("lsetxattr {}: {}", name, common::error::errorString(err)),
              categorize(err));
        }
    }

    return OCIDISK_OK;
}

utils::error::Result<void> copyContent(const std::filesystem::path &src,
                                       const std::filesystem::path &dst) noexcept
{
    OCIDISK_TRACE(fmt::format("copy {} to {}", src.string(), dst.string()));

    int in = ::open(src.c_str(), O_RDONLY | O_CLOEXEC | O_NOFOLLOW);
    if (in < 0) {
        return OCIDISK_ERR(fmt::format("open: {}", common::error::errorString(errno)));
    }
    auto closeIn = gsl::finally([in]() {
        ::close(in);
    });

    int out = ::open(dst.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC | O_NOFOLLOW, 0600);
    if (out < 0) {
        int err = errno;
        return OCIDISK_ERR(fmt::format("create: {}", common::error::errorString(err)),
                           categorize(err));
    }
    auto closeOut = gsl::finally([out]() {
        ::close(out);
    });

    std::vector<char> buffer(copyBufferSize);
    while (true) {
        auto n = ::read(in, buffer.data(), buffer.size());
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return OCIDISK_ERR(fmt::format("read: {}", common::error::errorString(errno)));
        }
        if (n == 0) {
            break;
        }

        ssize_t written = 0;
        while (written < n) {
            auto w = ::write(out, buffer.data() + written, static_cast<std::size_t>(n - written));
            if (w < 0) {
                if (errno == EINTR) {
                    continue;
                }
                int err = errno;
                return OCIDISK_ERR(fmt::format("write: {}", common::error::errorString(err)),
                                   categorize(err));
            }
            written += w;
        }
    }

    return OCIDISK_OK;
}

struct PendingMetadata
{
    std::filesystem::path source;
    std::filesystem::path target;
    std::filesystem::path relative;
    struct stat st;
};

utils::error::Result<void> applyMetadata(const PendingMetadata &item,
                                         const CopyOptions &options) noexcept
{
    OCIDISK_TRACE(fmt::format("apply metadata to {}", item.relative.string()));

    const bool bestEffort = isBelow(item.relative, options.bestEffortPrefix);
    const bool isSymlink = S_ISLNK(item.st.st_mode);

    auto soft = [&item, bestEffort](utils::error::Result<void> ret) -> utils::error::Result<void> {
        if (ret || !bestEffort || ret.error().is(ErrorCode::InsufficientSpace)) {
            return ret;
        }
        LogD("{}: {}", item.relative.string(), ret.error());
        return OCIDISK_OK;
    };

    if (options.preserveOwnership) {
        utils::error::Result<void> ret = OCIDISK_OK;
        if (::lchown(item.target.c_str(), item.st.st_uid, item.st.st_gid) != 0) {
            ret = OCIDISK_ERR(fmt::format("lchown: {}", common::error::errorString(errno)));
        }
        if (auto checked = soft(std::move(ret)); !checked) {
            return checked;
        }

        if (auto checked = soft(copyXattrs(item.source, item.target)); !checked) {
            return checked;
        }
    }

    if (!isSymlink) {
        utils::error::Result<void> ret = OCIDISK_OK;
        if (::chmod(item.target.c_str(), item.st.st_mode & 07777) != 0) {
            ret = OCIDISK_ERR(fmt::format("chmod: {}", common::error::errorString(errno)));
        }
        if (auto checked = soft(std::move(ret)); !checked) {
            return checked;
        }
    }

    std::array<struct timespec, 2> times{ item.st.st_atim, item.st.st_mtim };
    if (::utimensat(AT_FDCWD, item.target.c_str(), times.data(), AT_SYMLINK_NOFOLLOW) != 0) {
        auto checked =
          soft(OCIDISK_ERR(fmt::format("utimensat: {}", common::error::errorString(errno))));
        if (!checked) {
            return checked;
        }
    }

    return OCIDISK_OK;
}

} // namespace

utils::error::Result<SpaceEstimate> estimateTreeSize(const std::filesystem::path &root,
                                                     const std::filesystem::path &excluded) noexcept
{
    OCIDISK_TRACE(fmt::format("estimate size of {}", root.string()));

    SpaceEstimate estimate;
    std::error_code ec;
    std::filesystem::recursive_directory_iterator it(root, ec);
    if (ec) {
        return OCIDISK_ERR("iterate", ec);
    }

    for (; it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            return OCIDISK_ERR("iterate", ec);
        }

        auto relative = it->path().lexically_relative(root);
        if (isBelow(relative, excluded)) {
            if (relative == excluded && it->is_directory(ec)) {
                it.disable_recursion_pending();
            }
            continue;
        }

        struct stat st{};
        if (::lstat(it->path().c_str(), &st) != 0) {
            return OCIDISK_ERR(
              fmt::format("lstat {}: {}", relative.string(), common::error::errorString(errno)));
        }

        estimate.inodes += 1;
        estimate.bytes += inodeOverhead;
        if (S_ISREG(st.st_mode) || S_ISLNK(st.st_mode)) {
            auto size = static_cast<uint64_t>(st.st_size);
            estimate.bytes += (size + blockSize - 1) / blockSize * blockSize;
        }
    }
    if (ec) {
        return OCIDISK_ERR("iterate", ec);
    }

    return estimate;
}

utils::error::Result<void> copyTree(const std::filesystem::path &src,
                                    const std::filesystem::path &dst,
                                    const CopyOptions &options) noexcept
{
    OCIDISK_TRACE(fmt::format("copy {} to {}", src.string(), dst.string()));

    std::vector<PendingMetadata> directories;
    std::vector<PendingMetadata> files;
    std::map<std::pair<dev_t, ino_t>, std::filesystem::path> linked;

    std::error_code ec;
    std::filesystem::recursive_directory_iterator it(src, ec);
    if (ec) {
        return OCIDISK_ERR("iterate", ec);
    }

    for (; it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            return OCIDISK_ERR("iterate", ec);
        }

        PendingMetadata item{ it->path(), {}, it->path().lexically_relative(src), {} };
        item.target = dst / item.relative;
        const bool bestEffort = isBelow(item.relative, options.bestEffortPrefix);

        if (::lstat(item.source.c_str(), &item.st) != 0) {
            return OCIDISK_ERR(fmt::format("lstat {}: {}",
                                           item.relative.string(),
                                           common::error::errorString(errno)));
        }
        const auto mode = item.st.st_mode;

        if (S_ISDIR(mode)) {
            if (::mkdir(item.target.c_str(), 0700) != 0 && errno != EEXIST) {
                int err = errno;
                return OCIDISK_ERR(fmt::format("mkdir {}: {}",
                                               item.relative.string(),
                                               common::error::errorString(err)),
                                   categorize(err));
            }
            directories.push_back(std::move(item));
            continue;
        }

        if (S_ISREG(mode)) {
            if (item.st.st_nlink > 1) {
                auto key = std::make_pair(item.st.st_dev, item.st.st_ino);
                auto found = linked.find(key);
                if (found != linked.end()) {
                    if (::link(found->second.c_str(), item.target.c_str()) == 0) {
                        continue;
                    }
                    int err = errno;
                    // FAT has no hard links, the ESP is another filesystem
                    if ((!bestEffort && err != EXDEV) || err == ENOSPC || err == EDQUOT) {
                        return OCIDISK_ERR(fmt::format("link {}: {}",
                                                       item.relative.string(),
                                                       common::error::errorString(err)),
                                           categorize(err));
                    }
                } else {
                    linked.emplace(key, item.target);
                }
            }

            auto ret = copyContent(item.source, item.target);
            if (!ret) {
                return OCIDISK_ERR(item.relative.string(), std::move(ret));
            }
            files.push_back(std::move(item));
            continue;
        }

        if (S_ISLNK(mode)) {
            std::error_code linkEc;
            auto target = std::filesystem::read_symlink(item.source, linkEc);
            if (linkEc) {
                return OCIDISK_ERR(fmt::format("readlink {}", item.relative.string()), linkEc);
            }
            if (::symlink(target.c_str(), item.target.c_str()) != 0) {
                int err = errno;
                if (bestEffort && err != ENOSPC && err != EDQUOT) {
                    LogW("symlink {} skipped: {}",
                         item.relative.string(),
                         common::error::errorString(err));
                    continue;
                }
                return OCIDISK_ERR(fmt::format("symlink {}: {}",
                                               item.relative.string(),
                                               common::error::errorString(err)),
                                   categorize(err));
            }
            files.push_back(std::move(item));
            continue;
        }

        if (S_ISCHR(mode) || S_ISBLK(mode) || S_ISFIFO(mode)) {
            if (::mknod(item.target.c_str(), mode, item.st.st_rdev) != 0) {
                int err = errno;
                if (err == EPERM && (!options.preserveOwnership || bestEffort)) {
                    LogW("skip special file {}: {}",
                         item.relative.string(),
                         common::error::errorString(err));
                    continue;
                }
                return OCIDISK_ERR(fmt::format("mknod {}: {}",
                                               item.relative.string(),
                                               common::error::errorString(err)),
                                   categorize(err));
            }
            files.push_back(std::move(item));
            continue;
        }

        LogD("skip socket {}", item.relative.string());
    }
    if (ec) {
        return OCIDISK_ERR("iterate", ec);
    }

    for (const auto &item : files) {
        auto ret = applyMetadata(item, options);
        if (!ret) {
            return OCIDISK_ERR(ret);
        }
    }

    for (auto item = directories.rbegin(); item != directories.rend(); ++item) {
        auto ret = applyMetadata(*item, options);
        if (!ret) {
            return OCIDISK_ERR(ret);
        }
    }

    return OCIDISK_OK;
}

MountedDisk::MountedDisk(disk::Mount root, disk::Mount esp) noexcept
    : m_root(std::move(root))
    , m_esp(std::move(esp))
{
}

utils::error::Result<MountedDisk> MountedDisk::mount(const std::string &rootDevice,
                                                     const std::string &espDevice,
                                                     const std::filesystem::path &mountPoint) noexcept
{
    OCIDISK_TRACE(fmt::format("mount disk at {}", mountPoint.string()));

    std::error_code ec;
    std::filesystem::create_directories(mountPoint, ec);
    if (ec) {
        return OCIDISK_ERR("create mount point", ec);
    }

    auto root = disk::Mount::mount(rootDevice, mountPoint, "ext4");
    if (!root) {
        return OCIDISK_ERR(root);
    }

    auto espDir = mountPoint / espMountPoint;
    std::filesystem::create_directories(espDir, ec);
    if (ec) {
        return OCIDISK_ERR("create ESP mount point", ec);
    }
    std::filesystem::permissions(mountPoint / "boot", std::filesystem::perms(0755), ec);
    if (!ec) {
        std::filesystem::permissions(espDir, std::filesystem::perms(0755), ec);
    }
    if (ec) {
        return OCIDISK_ERR("set mount point mode", ec);
    }

    // a failure here unmounts root again through its destructor
    auto esp = disk::Mount::mount(espDevice, espDir, "vfat");
    if (!esp) {
        return OCIDISK_ERR(esp);
    }

    return MountedDisk(std::move(*root), std::move(*esp));
}

utils::error::Result<FreeSpace> freeSpace(const std::filesystem::path &path) noexcept
{
    OCIDISK_TRACE(fmt::format("query free space of {}", path.string()));

    struct statvfs vfs{};
    if (::statvfs(path.c_str(), &vfs) != 0) {
        return OCIDISK_ERR(fmt::format("statvfs: {}", common::error::errorString(errno)));
    }

    FreeSpace available;
    available.bytes = static_cast<uint64_t>(vfs.f_bavail) * vfs.f_frsize;
    available.inodes = vfs.f_favail;
    available.inodesLimited = vfs.f_files != 0;
    return available;
}

utils::error::Result<void> checkFreeSpace(std::string_view what,
                                          const SpaceEstimate &need,
                                          const FreeSpace &available,
                                          uint64_t headroomBytes) noexcept
{
    OCIDISK_TRACE(fmt::format("check free space of {}", what));

    const auto wanted = need.bytes + headroomBytes;
    LogI("{}: {} MiB needed, {} MiB free", what, wanted / disk::MiB, available.bytes / disk::MiB);
    if (wanted > available.bytes) {
        return OCIDISK_ERR(
          fmt::format("{} needs {} bytes, {} bytes free", what, wanted, available.bytes),
          ErrorCode::InsufficientSpace);
    }
    if (available.inodesLimited && need.inodes > available.inodes) {
        return OCIDISK_ERR(
          fmt::format("{} needs {} inodes, {} free", what, need.inodes, available.inodes),
          ErrorCode::InsufficientSpace);
    }
    return OCIDISK_OK;
}

utils::error::Result<void> populate(const std::filesystem::path &rootfs,
                                    MountedDisk &disk,
                                    uint64_t headroomBytes,
                                    const CopyOptions &options) noexcept
{
    OCIDISK_TRACE(fmt::format("populate {}", disk.root().string()));

    auto rootNeed = estimateTreeSize(rootfs, espMountPoint);
    if (!rootNeed) {
        return OCIDISK_ERR(rootNeed);
    }
    auto rootFree = freeSpace(disk.root());
    if (!rootFree) {
        return OCIDISK_ERR(rootFree);
    }
    auto ret = checkFreeSpace("root filesystem", *rootNeed, *rootFree, headroomBytes);
    if (!ret) {
        return OCIDISK_ERR(ret);
    }

    std::error_code ec;
    if (std::filesystem::is_directory(rootfs / espMountPoint, ec)) {
        auto espNeed = estimateTreeSize(rootfs / espMountPoint);
        if (!espNeed) {
            return OCIDISK_ERR(espNeed);
        }
        auto espFree = freeSpace(disk.esp());
        if (!espFree) {
            return OCIDISK_ERR(espFree);
        }
        ret = checkFreeSpace("EFI system partition", *espNeed, *espFree);
        if (!ret) {
            return OCIDISK_ERR(ret);
        }
    }

    auto copyOptions = options;
    copyOptions.bestEffortPrefix = espMountPoint;
    ret = copyTree(rootfs, disk.root(), copyOptions);
    if (!ret) {
        return OCIDISK_ERR(ret);
    }

    LogI("copied {} inodes to {}", rootNeed->inodes, disk.root().string());
    return OCIDISK_OK;
}

} // namespace ocidisk::rootfs
