// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <sys/types.h>

namespace ocidisk::image {

enum class EntryKind : uint8_t {
    Regular,
    Directory,
    Symlink,
    HardLink,
    CharDevice,
    BlockDevice,
    Fifo,
    Whiteout,
    OpaqueWhiteout,
};

std::string_view entryKindName(EntryKind kind) noexcept;

// One decoded record of a layer tarball.
//
// path is relative to the root without leading "./" or "/". For Whiteout it
// is the path being deleted, for OpaqueWhiteout the directory being emptied.
// linkTarget holds the symlink target as recorded, or the normalized path of
// the hard link target.
struct LayerEntry
{
    std::string path;
    EntryKind kind{ EntryKind::Regular };
    mode_t mode{ 0 };
    uid_t uid{ 0 };
    gid_t gid{ 0 };
    uint64_t size{ 0 };
    int64_t mtime{ 0 };
    long mtimeNsec{ 0 };
    std::string linkTarget;
    uint32_t devMajor{ 0 };
    uint32_t devMinor{ 0 };
    std::vector<std::pair<std::string, std::string>> xattrs;
    // position of the record in the archive stream
    std::size_t index{ 0 };

    [[nodiscard]] bool isDirectory() const noexcept { return kind == EntryKind::Directory; }

    [[nodiscard]] bool isWhiteout() const noexcept
    {
        return kind == EntryKind::Whiteout || kind == EntryKind::OpaqueWhiteout;
    }
};

} // namespace ocidisk::image
