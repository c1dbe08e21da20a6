// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "ocidisk/image/materializer.h"

#include "ocidisk/common/error.h"
#include "ocidisk/utils/file.h"
#include "ocidisk/utils/log/log.h"

#include <fmt/format.h>

#include <array>
#include <unordered_map>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/sysmacros.h>
#include <sys/xattr.h>
#include <unistd.h>

namespace ocidisk::image {

using utils::error::ErrorCode;

namespace {

constexpr mode_t impliedDirectoryMode = 0755;

ErrorCode categorize(int err) noexcept
{
    return err == ENOSPC || err == EDQUOT ? ErrorCode::InsufficientSpace : ErrorCode::Failed;
}

utils::error::Result<void> applyMetadata(const std::filesystem::path &path,
                                         const LayerEntry &entry,
                                         const MaterializeOptions &options) noexcept
{
    OCIDISK_TRACE(fmt::format("apply metadata to {}", path.string()));

    const bool isSymlink = entry.kind == EntryKind::Symlink;

    if (options.preserveOwnership) {
        if (::lchown(path.c_str(), entry.uid, entry.gid) != 0) {
            return OCIDISK_ERR(fmt::format("lchown: {}", common::error::errorString(errno)));
        }

        for (const auto &[name, value] : entry.xattrs) {
            if (::lsetxattr(path.c_str(), name.c_str(), value.data(), value.size(), 0) == 0) {
                continue;
            }
            if (errno == ENOTSUP) {
                LogW("xattr {} of {} not supported here, dropped", name, entry.path);
                continue;
            }
            int err = errno;
            return OCIDISK_ERR(
              fmt::format("lsetxattr {}: {}", name, common::error::errorString(err)),
              categorize(err));
        }
    }

    // after chown, which clears the set-id bits
    if (!isSymlink && ::chmod(path.c_str(), entry.mode & 07777) != 0) {
        return OCIDISK_ERR(fmt::format("chmod: {}", common::error::errorString(errno)));
    }

    std::array<struct timespec, 2> times{};
    times[0].tv_sec = entry.mtime;
    times[0].tv_nsec = entry.mtimeNsec;
    times[1] = times[0];
    if (::utimensat(AT_FDCWD, path.c_str(), times.data(), AT_SYMLINK_NOFOLLOW) != 0) {
        return OCIDISK_ERR(fmt::format("utimensat: {}", common::error::errorString(errno)));
    }

    return OCIDISK_OK;
}

utils::error::Result<void> ensureParents(const std::filesystem::path &root,
                                         const std::string &relative) noexcept
{
    OCIDISK_TRACE(fmt::format("create parents of {}", relative));

    std::filesystem::path current = root;
    auto parent = std::filesystem::path(relative).parent_path();
    for (const auto &part : parent) {
        current /= part;
        if (::mkdir(current.c_str(), impliedDirectoryMode) == 0) {
            // not created by the umask
            if (::chmod(current.c_str(), impliedDirectoryMode) != 0) {
                return OCIDISK_ERR(fmt::format("chmod {}: {}",
                                               current.string(),
                                               common::error::errorString(errno)));
            }
            continue;
        }
        if (errno != EEXIST) {
            int err = errno;
            return OCIDISK_ERR(
              fmt::format("mkdir {}: {}", current.string(), common::error::errorString(err)),
              categorize(err));
        }
    }

    return OCIDISK_OK;
}

} // namespace

utils::error::Result<void> materialize(const MergedTree &tree,
                                       const std::vector<LayerArchive> &archives,
                                       const std::filesystem::path &dest,
                                       const MaterializeOptions &options) noexcept
{
    OCIDISK_TRACE(fmt::format("materialize root filesystem at {}", dest.string()));

    auto ret = utils::ensureDirectory(dest);
    if (!ret) {
        return OCIDISK_ERR(ret);
    }
    if (::chmod(dest.c_str(), impliedDirectoryMode) != 0) {
        return OCIDISK_ERR(fmt::format("chmod: {}", common::error::errorString(errno)));
    }

    std::vector<std::pair<std::filesystem::path, const LayerEntry *>> directories;
    std::vector<std::pair<std::filesystem::path, const LayerEntry *>> files;
    std::vector<std::pair<std::filesystem::path, const LayerEntry *>> hardlinks;
    std::vector<std::unordered_map<std::size_t, std::filesystem::path>> extractions(
      archives.size());

    // pass 1: everything without content, parents always come before children
    for (const auto &[relative, node] : tree.nodes()) {
        const auto &entry = node.entry;
        auto target = dest / relative;

        ret = ensureParents(dest, relative);
        if (!ret) {
            return OCIDISK_ERR(ret);
        }

        switch (entry.kind) {
        case EntryKind::Directory:
            // owner only until the content is in place
            if (::mkdir(target.c_str(), 0700) != 0 && errno != EEXIST) {
                int err = errno;
                return OCIDISK_ERR(
                  fmt::format("mkdir {}: {}", relative, common::error::errorString(err)),
                  categorize(err));
            }
            directories.emplace_back(target, &entry);
            break;
        case EntryKind::Regular:
            if (node.layer >= archives.size()) {
                return OCIDISK_ERR(fmt::format("{} comes from unknown layer {}", relative, node.layer),
                                   ErrorCode::LayerCorrupt);
            }
            extractions[node.layer].emplace(entry.index, target);
            files.emplace_back(target, &entry);
            break;
        case EntryKind::HardLink:
            hardlinks.emplace_back(target, &entry);
            break;
        case EntryKind::Symlink:
            if (::symlink(entry.linkTarget.c_str(), target.c_str()) != 0) {
                int err = errno;
                return OCIDISK_ERR(
                  fmt::format("symlink {}: {}", relative, common::error::errorString(err)),
                  categorize(err));
            }
            files.emplace_back(target, &entry);
            break;
        case EntryKind::CharDevice:
        case EntryKind::BlockDevice: {
            mode_t type = entry.kind == EntryKind::CharDevice ? S_IFCHR : S_IFBLK;
            if (::mknod(target.c_str(),
                        type | (entry.mode & 07777),
                        makedev(entry.devMajor, entry.devMinor))
                != 0) {
                if (errno == EPERM && !options.preserveOwnership) {
                    LogW("skip device node {} without privileges", relative);
                    continue;
                }
                return OCIDISK_ERR(
                  fmt::format("mknod {}: {}", relative, common::error::errorString(errno)));
            }
            files.emplace_back(target, &entry);
            break;
        }
        case EntryKind::Fifo:
            if (::mkfifo(target.c_str(), entry.mode & 07777) != 0) {
                return OCIDISK_ERR(
                  fmt::format("mkfifo {}: {}", relative, common::error::errorString(errno)));
            }
            files.emplace_back(target, &entry);
            break;
        case EntryKind::Whiteout:
        case EntryKind::OpaqueWhiteout:
            // never part of a merged tree
            break;
        }
    }

    // pass 2: file content, one sequential read per layer
    for (std::size_t i = 0; i < archives.size(); ++i) {
        if (extractions[i].empty()) {
            continue;
        }
        LogD("extract {} files from layer {}", extractions[i].size(), archives[i].digest());
        ret = archives[i].extractFiles(extractions[i]);
        if (!ret) {
            return OCIDISK_ERR(ret);
        }
    }

    for (const auto &[path, entry] : files) {
        ret = applyMetadata(path, *entry, options);
        if (!ret) {
            return OCIDISK_ERR(ret);
        }
    }

    // pass 3: hard links share the inode and metadata of their target
    for (const auto &[path, entry] : hardlinks) {
        auto target = dest / entry->linkTarget;
        if (::link(target.c_str(), path.c_str()) != 0) {
            int err = errno;
            return OCIDISK_ERR(fmt::format("link {} to {}: {}",
                                           entry->path,
                                           entry->linkTarget,
                                           common::error::errorString(err)),
                               categorize(err));
        }
    }

    // pass 4: directories, deepest first
    for (auto it = directories.rbegin(); it != directories.rend(); ++it) {
        ret = applyMetadata(it->first, *it->second, options);
        if (!ret) {
            return OCIDISK_ERR(ret);
        }
    }

    LogI("materialized {} entries at {}", tree.size(), dest);
    return OCIDISK_OK;
}

} // namespace ocidisk::image
