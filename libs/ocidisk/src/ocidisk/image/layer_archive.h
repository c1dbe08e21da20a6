// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include "ocidisk/image/layer_entry.h"
#include "ocidisk/utils/error/error.h"

#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace ocidisk::image {

constexpr std::string_view whiteoutPrefix = ".wh.";
constexpr std::string_view opaqueWhiteout = ".wh..wh..opq";

// Strips leading "./" and "/" and collapses "." components.
// A ".." component is rejected with LayerCorrupt.
utils::error::Result<std::string> normalizeEntryPath(std::string_view raw) noexcept;

// A layer tarball, plain or compressed with anything libarchive can read.
class LayerArchive
{
public:
    LayerArchive(std::filesystem::path path, std::string digest);

    [[nodiscard]] const std::filesystem::path &path() const noexcept { return m_path; }

    [[nodiscard]] const std::string &digest() const noexcept { return m_digest; }

    // Decodes every record. Whiteout markers are turned into Whiteout and
    // OpaqueWhiteout entries, the root directory record and sockets are dropped.
    utils::error::Result<std::vector<LayerEntry>> readEntries() const noexcept;

    // Streams the content of the selected regular file records, keyed by
    // LayerEntry::index, into new files. Targets must not exist yet.
    utils::error::Result<void>
    extractFiles(const std::unordered_map<std::size_t, std::filesystem::path> &targets) const noexcept;

private:
    std::filesystem::path m_path;
    std::string m_digest;
};

} // namespace ocidisk::image
