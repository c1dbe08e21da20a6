// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include "ocidisk/image/layer_archive.h"
#include "ocidisk/image/layer_entry.h"
#include "ocidisk/utils/error/error.h"

#include <map>
#include <set>
#include <string>
#include <vector>

namespace ocidisk::image {

struct TreeNode
{
    LayerEntry entry;
    // index of the layer that supplies the content
    std::size_t layer{ 0 };
};

// The root filesystem described by a stack of layers, without any disk I/O.
//
// Keys are normalized paths. Every ancestor of a key is either a directory
// node or absent (implied directory), never a file, symlink or device.
// A HardLink node always names an existing node that is not a hard link or a
// directory. When that node is deleted or replaced, the first remaining link
// takes over its entry and layer, so the links keep the content they had.
class MergedTree
{
public:
    using Nodes = std::map<std::string, TreeNode>;

    [[nodiscard]] const Nodes &nodes() const noexcept { return m_nodes; }

    [[nodiscard]] const TreeNode *find(const std::string &path) const noexcept;

    [[nodiscard]] bool contains(const std::string &path) const noexcept
    {
        return find(path) != nullptr;
    }

    [[nodiscard]] std::size_t size() const noexcept { return m_nodes.size(); }

    // removes path and everything beneath it
    void erase(const std::string &path);

    // removes everything beneath path but keeps path itself
    void eraseChildren(const std::string &path);

    // Adds or replaces a node following the overlay rules. A hard link is
    // resolved against the tree as it is now, a missing target or a directory
    // target is LayerCorrupt.
    utils::error::Result<void> add(std::size_t layer, const LayerEntry &entry);

private:
    void removeRange(Nodes::iterator first, Nodes::iterator last);
    void unlink(const std::string &target, const std::string &link);
    void promoteLink(const std::string &target);
    utils::error::Result<void> addHardLink(std::size_t layer, const LayerEntry &entry);

    Nodes m_nodes;
    // target path -> hard links naming it
    std::map<std::string, std::set<std::string>> m_links;
};

// Folds one layer onto tree. Deletions of the layer are applied first and only
// see lower layers, additions follow in archive order.
utils::error::Result<MergedTree>
applyLayer(MergedTree tree, std::size_t layer, const std::vector<LayerEntry> &entries) noexcept;

// applyLayer over all layers, lowest first.
utils::error::Result<MergedTree>
mergeLayers(const std::vector<std::vector<LayerEntry>> &layers) noexcept;

// Decodes all layers, optionally one task per layer. The result keeps the
// order of archives.
utils::error::Result<std::vector<std::vector<LayerEntry>>>
readLayers(const std::vector<LayerArchive> &archives, bool parallel) noexcept;

} // namespace ocidisk::image
