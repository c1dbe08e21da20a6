// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include "ocidisk/image/layer_archive.h"
#include "ocidisk/image/layer_merger.h"
#include "ocidisk/utils/error/error.h"

#include <filesystem>
#include <vector>

namespace ocidisk::image {

struct MaterializeOptions
{
    // apply uid, gid and xattrs; device nodes need it too
    bool preserveOwnership{ true };
};

// Writes tree below dest, which must be empty or missing. Regular file
// content is read back from the owning layer in archives. Directory modes and
// times are applied after their content.
utils::error::Result<void> materialize(const MergedTree &tree,
                                       const std::vector<LayerArchive> &archives,
                                       const std::filesystem::path &dest,
                                       const MaterializeOptions &options = {}) noexcept;

} // namespace ocidisk::image
