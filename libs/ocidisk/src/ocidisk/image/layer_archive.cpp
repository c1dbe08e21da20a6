// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "ocidisk/image/layer_archive.h"

#include "ocidisk/common/error.h"
#include "ocidisk/common/strings.h"
#include "ocidisk/utils/log/log.h"

#include <archive.h>
#include <archive_entry.h>
#include <fmt/format.h>
#include <gsl/gsl>

#include <array>
#include <memory>

#include <fcntl.h>
#include <unistd.h>

namespace ocidisk::image {

using utils::error::ErrorCode;

namespace {

using ArchivePtr = std::unique_ptr<struct archive, decltype(&archive_read_free)>;

constexpr std::size_t readBlockSize = 64 * 1024;

ArchivePtr newReader()
{
    ArchivePtr reader{ archive_read_new(), &archive_read_free };
    if (reader) {
        archive_read_support_filter_all(reader.get());
        archive_read_support_format_tar(reader.get());
        archive_read_support_format_gnutar(reader.get());
    }
    return reader;
}

std::string archiveError(struct archive *a)
{
    const char *msg = archive_error_string(a);
    return msg != nullptr ? msg : "unknown archive error";
}

std::string joinPath(std::string_view parent, std::string_view name)
{
    if (parent.empty()) {
        return std::string(name);
    }
    return fmt::format("{}/{}", parent, name);
}

} // namespace

std::string_view entryKindName(EntryKind kind) noexcept
{
    switch (kind) {
    case EntryKind::Regular:
        return "regular";
    case EntryKind::Directory:
        return "directory";
    case EntryKind::Symlink:
        return "symlink";
    case EntryKind::HardLink:
        return "hardlink";
    case EntryKind::CharDevice:
        return "char device";
    case EntryKind::BlockDevice:
        return "block device";
    case EntryKind::Fifo:
        return "fifo";
    case EntryKind::Whiteout:
        return "whiteout";
    case EntryKind::OpaqueWhiteout:
        return "opaque whiteout";
    }
    return "unknown";
}

utils::error::Result<std::string> normalizeEntryPath(std::string_view raw) noexcept
{
    OCIDISK_TRACE(fmt::format("normalize entry path {}", raw));

    std::vector<std::string> parts;
    for (auto &part : common::strings::split(raw, '/', common::strings::splitOption::SkipEmpty)) {
        if (part == ".") {
            continue;
        }
        if (part == "..") {
            return OCIDISK_ERR("path escapes the root", ErrorCode::LayerCorrupt);
        }
        parts.push_back(std::move(part));
    }

    return common::strings::join(parts, '/');
}

LayerArchive::LayerArchive(std::filesystem::path path, std::string digest)
    : m_path(std::move(path))
    , m_digest(std::move(digest))
{
}

utils::error::Result<std::vector<LayerEntry>> LayerArchive::readEntries() const noexcept
{
    OCIDISK_TRACE(fmt::format("read layer {}", m_path.string()));

    auto reader = newReader();
    if (!reader) {
        return OCIDISK_ERR("archive_read_new failed");
    }

    if (archive_read_open_filename(reader.get(), m_path.c_str(), readBlockSize) != ARCHIVE_OK) {
        return OCIDISK_ERR(archiveError(reader.get()), ErrorCode::LayerCorrupt);
    }

    std::vector<LayerEntry> entries;
    struct archive_entry *ae = nullptr;
    std::size_t index = 0;
    while (true) {
        auto ret = archive_read_next_header(reader.get(), &ae);
        if (ret == ARCHIVE_EOF) {
            break;
        }
        if (ret == ARCHIVE_WARN) {
            LogW("{}: {}", m_path, archiveError(reader.get()));
        } else if (ret != ARCHIVE_OK) {
            return OCIDISK_ERR(fmt::format("record {}: {}", index, archiveError(reader.get())),
                               ErrorCode::LayerCorrupt);
        }

        auto recordIndex = index++;
        const char *rawPath = archive_entry_pathname(ae);
        if (rawPath == nullptr) {
            return OCIDISK_ERR(fmt::format("record {} has no path", recordIndex),
                               ErrorCode::LayerCorrupt);
        }

        auto path = normalizeEntryPath(rawPath);
        if (!path) {
            return OCIDISK_ERR(fmt::format("record {} ({})", recordIndex, rawPath),
                               std::move(path));
        }
        if (path->empty()) {
            // the root directory itself
            continue;
        }

        LayerEntry entry;
        entry.index = recordIndex;
        entry.mode = archive_entry_perm(ae);
        entry.uid = static_cast<uid_t>(archive_entry_uid(ae));
        entry.gid = static_cast<gid_t>(archive_entry_gid(ae));
        entry.mtime = archive_entry_mtime(ae);
        entry.mtimeNsec = archive_entry_mtime_nsec(ae);

        auto slash = path->rfind('/');
        std::string parent = slash == std::string::npos ? "" : path->substr(0, slash);
        std::string base = slash == std::string::npos ? *path : path->substr(slash + 1);

        if (base == opaqueWhiteout) {
            entry.kind = EntryKind::OpaqueWhiteout;
            entry.path = parent;
            entries.push_back(std::move(entry));
            continue;
        }

        if (common::strings::starts_with(base, whiteoutPrefix)) {
            auto victim = base.substr(whiteoutPrefix.size());
            if (common::strings::starts_with(victim, whiteoutPrefix)) {
                // other aufs metadata such as .wh..wh.plnk
                continue;
            }
            if (victim.empty() || victim == "." || victim == "..") {
                return OCIDISK_ERR(fmt::format("invalid whiteout {}", *path),
                                   ErrorCode::LayerCorrupt);
            }
            entry.kind = EntryKind::Whiteout;
            entry.path = joinPath(parent, victim);
            entries.push_back(std::move(entry));
            continue;
        }

        entry.path = std::move(*path);

        if (const char *hardlink = archive_entry_hardlink(ae); hardlink != nullptr) {
            auto target = normalizeEntryPath(hardlink);
            if (!target || target->empty()) {
                return OCIDISK_ERR(fmt::format("invalid hard link target {}", hardlink),
                                   ErrorCode::LayerCorrupt);
            }
            entry.kind = EntryKind::HardLink;
            entry.linkTarget = std::move(*target);
            entries.push_back(std::move(entry));
            continue;
        }

        switch (archive_entry_filetype(ae)) {
        case AE_IFREG:
            entry.kind = EntryKind::Regular;
            entry.size = static_cast<uint64_t>(archive_entry_size(ae));
            break;
        case AE_IFDIR:
            entry.kind = EntryKind::Directory;
            break;
        case AE_IFLNK: {
            entry.kind = EntryKind::Symlink;
            const char *target = archive_entry_symlink(ae);
            if (target == nullptr) {
                return OCIDISK_ERR(fmt::format("symlink {} has no target", entry.path),
                                   ErrorCode::LayerCorrupt);
            }
            entry.linkTarget = target;
            break;
        }
        case AE_IFCHR:
            entry.kind = EntryKind::CharDevice;
            break;
        case AE_IFBLK:
            entry.kind = EntryKind::BlockDevice;
            break;
        case AE_IFIFO:
            entry.kind = EntryKind::Fifo;
            break;
        case AE_IFSOCK:
            LogD("skip socket {} in {}", entry.path, m_path);
            continue;
        default:
            return OCIDISK_ERR(fmt::format("record {} has unknown type", entry.path),
                               ErrorCode::LayerCorrupt);
        }

        if (entry.kind == EntryKind::CharDevice || entry.kind == EntryKind::BlockDevice) {
            entry.devMajor = static_cast<uint32_t>(archive_entry_rdevmajor(ae));
            entry.devMinor = static_cast<uint32_t>(archive_entry_rdevminor(ae));
        }

        archive_entry_xattr_reset(ae);
        const char *name = nullptr;
        const void *value = nullptr;
        size_t size = 0;
        while (archive_entry_xattr_next(ae, &name, &value, &size) == ARCHIVE_OK) {
            entry.xattrs.emplace_back(name, std::string(static_cast<const char *>(value), size));
        }

        entries.push_back(std::move(entry));
    }

    return entries;
}

utils::error::Result<void> LayerArchive::extractFiles(
  const std::unordered_map<std::size_t, std::filesystem::path> &targets) const noexcept
{
    OCIDISK_TRACE(fmt::format("extract files from layer {}", m_path.string()));

    if (targets.empty()) {
        return OCIDISK_OK;
    }

    auto reader = newReader();
    if (!reader) {
        return OCIDISK_ERR("archive_read_new failed");
    }

    if (archive_read_open_filename(reader.get(), m_path.c_str(), readBlockSize) != ARCHIVE_OK) {
        return OCIDISK_ERR(archiveError(reader.get()), ErrorCode::LayerCorrupt);
    }

    std::vector<char> buffer(readBlockSize);
    struct archive_entry *ae = nullptr;
    std::size_t index = 0;
    std::size_t remaining = targets.size();
    while (remaining > 0) {
        auto ret = archive_read_next_header(reader.get(), &ae);
        if (ret == ARCHIVE_EOF) {
            return OCIDISK_ERR(fmt::format("{} records missing at end of archive", remaining),
                               ErrorCode::LayerCorrupt);
        }
        if (ret != ARCHIVE_OK && ret != ARCHIVE_WARN) {
            return OCIDISK_ERR(fmt::format("record {}: {}", index, archiveError(reader.get())),
                               ErrorCode::LayerCorrupt);
        }

        auto it = targets.find(index++);
        if (it == targets.end()) {
            continue;
        }
        --remaining;

        const auto &target = it->second;
        int fd = ::open(target.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC | O_NOFOLLOW, 0600);
        if (fd < 0) {
            int err = errno;
            return OCIDISK_ERR(
              fmt::format("create {}: {}", target.string(), common::error::errorString(err)),
              err == ENOSPC || err == EDQUOT ? ErrorCode::InsufficientSpace : ErrorCode::Failed);
        }
        auto closer = gsl::finally([fd]() {
            ::close(fd);
        });

        while (true) {
            auto n = archive_read_data(reader.get(), buffer.data(), buffer.size());
            if (n == 0) {
                break;
            }
            if (n < 0) {
                return OCIDISK_ERR(fmt::format("read data of {}: {}",
                                               target.string(),
                                               archiveError(reader.get())),
                                   ErrorCode::LayerCorrupt);
            }

            std::size_t written = 0;
            while (written < static_cast<std::size_t>(n)) {
                auto w = ::write(fd, buffer.data() + written, static_cast<std::size_t>(n) - written);
                if (w < 0) {
                    int err = errno;
                    if (err == EINTR) {
                        continue;
                    }
                    return OCIDISK_ERR(
                      fmt::format("write {}: {}", target.string(), common::error::errorString(err)),
                      err == ENOSPC || err == EDQUOT ? ErrorCode::InsufficientSpace
                                                     : ErrorCode::Failed);
                }
                written += static_cast<std::size_t>(w);
            }
        }
    }

    return OCIDISK_OK;
}

} // namespace ocidisk::image
