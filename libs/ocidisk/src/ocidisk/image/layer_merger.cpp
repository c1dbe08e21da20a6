// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "ocidisk/image/layer_merger.h"

#include "ocidisk/utils/log/log.h"

#include <fmt/format.h>

#include <future>
#include <iterator>

namespace ocidisk::image {

using utils::error::ErrorCode;

namespace {

// Smallest key greater than every "<path>/..." key.
std::string childrenEnd(const std::string &path)
{
    return path + static_cast<char>('/' + 1);
}

} // namespace

const TreeNode *MergedTree::find(const std::string &path) const noexcept
{
    auto it = m_nodes.find(path);
    return it == m_nodes.end() ? nullptr : &it->second;
}

void MergedTree::eraseChildren(const std::string &path)
{
    if (path.empty()) {
        removeRange(m_nodes.begin(), m_nodes.end());
        return;
    }

    removeRange(m_nodes.lower_bound(path + "/"), m_nodes.lower_bound(childrenEnd(path)));
}

void MergedTree::erase(const std::string &path)
{
    eraseChildren(path);
    auto it = m_nodes.find(path);
    if (it != m_nodes.end()) {
        removeRange(it, std::next(it));
    }
}

void MergedTree::removeRange(Nodes::iterator first, Nodes::iterator last)
{
    // links inside the range go with it, targets inside hand over to the
    // links that stay
    std::vector<std::string> targets;
    for (auto it = first; it != last; ++it) {
        const auto &entry = it->second.entry;
        if (entry.kind == EntryKind::HardLink) {
            unlink(entry.linkTarget, it->first);
        } else if (m_links.count(it->first) != 0) {
            targets.push_back(it->first);
        }
    }

    for (const auto &target : targets) {
        promoteLink(target);
    }

    m_nodes.erase(first, last);
}

void MergedTree::unlink(const std::string &target, const std::string &link)
{
    auto it = m_links.find(target);
    if (it == m_links.end()) {
        return;
    }
    it->second.erase(link);
    if (it->second.empty()) {
        m_links.erase(it);
    }
}

void MergedTree::promoteLink(const std::string &target)
{
    auto it = m_links.find(target);
    if (it == m_links.end()) {
        return;
    }
    auto links = std::move(it->second);
    m_links.erase(it);

    const auto &source = m_nodes.at(target);
    auto heirPath = *links.begin();
    links.erase(links.begin());

    auto &heir = m_nodes.at(heirPath);
    heir.entry = source.entry;
    heir.entry.path = heirPath;
    heir.layer = source.layer;
    LogD("{} takes over the content of {}", heirPath, target);

    for (const auto &link : links) {
        m_nodes.at(link).entry.linkTarget = heirPath;
    }
    if (!links.empty()) {
        m_links.emplace(heirPath, std::move(links));
    }
}

utils::error::Result<void> MergedTree::addHardLink(std::size_t layer, const LayerEntry &entry)
{
    OCIDISK_TRACE(fmt::format("link {} to {}", entry.path, entry.linkTarget));

    auto it = m_nodes.find(entry.linkTarget);
    if (it == m_nodes.end()) {
        return OCIDISK_ERR(fmt::format("hard link {} points to missing {}",
                                       entry.path,
                                       entry.linkTarget),
                           ErrorCode::LayerCorrupt);
    }
    if (it->second.entry.isDirectory()) {
        return OCIDISK_ERR(fmt::format("hard link {} points to directory {}",
                                       entry.path,
                                       entry.linkTarget),
                           ErrorCode::LayerCorrupt);
    }

    // links always name a node with content, so one hop is enough
    auto target = it->first;
    if (it->second.entry.kind == EntryKind::HardLink) {
        target = it->second.entry.linkTarget;
    }

    auto node = TreeNode{ entry, layer };
    node.entry.linkTarget = target;
    m_nodes.emplace(entry.path, std::move(node));
    m_links[target].insert(entry.path);
    return OCIDISK_OK;
}

utils::error::Result<void> MergedTree::add(std::size_t layer, const LayerEntry &entry)
{
    // a file, link or device on the way down is replaced by an implied directory
    for (auto pos = entry.path.find('/'); pos != std::string::npos;
         pos = entry.path.find('/', pos + 1)) {
        auto ancestor = entry.path.substr(0, pos);
        auto it = m_nodes.find(ancestor);
        if (it != m_nodes.end() && !it->second.entry.isDirectory()) {
            removeRange(it, std::next(it));
        }
    }

    auto it = m_nodes.find(entry.path);
    if (entry.isDirectory() && it != m_nodes.end() && it->second.entry.isDirectory()) {
        it->second.entry = entry;
        it->second.layer = layer;
        return OCIDISK_OK;
    }

    erase(entry.path);
    if (entry.kind == EntryKind::HardLink) {
        return addHardLink(layer, entry);
    }

    m_nodes.emplace(entry.path, TreeNode{ entry, layer });
    return OCIDISK_OK;
}

utils::error::Result<MergedTree>
applyLayer(MergedTree tree, std::size_t layer, const std::vector<LayerEntry> &entries) noexcept
{
    OCIDISK_TRACE(fmt::format("apply layer {}", layer));

    for (const auto &entry : entries) {
        if (entry.kind == EntryKind::Whiteout) {
            tree.erase(entry.path);
        } else if (entry.kind == EntryKind::OpaqueWhiteout) {
            tree.eraseChildren(entry.path);
        }
    }

    for (const auto &entry : entries) {
        if (entry.isWhiteout()) {
            continue;
        }
        auto ret = tree.add(layer, entry);
        if (!ret) {
            return OCIDISK_ERR(ret);
        }
    }

    return tree;
}

utils::error::Result<MergedTree>
mergeLayers(const std::vector<std::vector<LayerEntry>> &layers) noexcept
{
    OCIDISK_TRACE("merge layers");

    MergedTree tree;
    for (std::size_t i = 0; i < layers.size(); ++i) {
        auto next = applyLayer(std::move(tree), i, layers[i]);
        if (!next) {
            return OCIDISK_ERR(next);
        }
        tree = std::move(*next);
        LogD("after layer {}: {} nodes", i, tree.size());
    }

    return tree;
}

utils::error::Result<std::vector<std::vector<LayerEntry>>>
readLayers(const std::vector<LayerArchive> &archives, bool parallel) noexcept
{
    OCIDISK_TRACE("read layers");

    std::vector<std::vector<LayerEntry>> decoded;
    decoded.reserve(archives.size());

    if (!parallel || archives.size() < 2) {
        for (const auto &archive : archives) {
            auto entries = archive.readEntries();
            if (!entries) {
                return OCIDISK_ERR(fmt::format("layer {}", archive.digest()), std::move(entries));
            }
            decoded.push_back(std::move(*entries));
        }
        return decoded;
    }

    std::vector<std::future<utils::error::Result<std::vector<LayerEntry>>>> tasks;
    tasks.reserve(archives.size());
    try {
        for (const auto &archive : archives) {
            tasks.push_back(std::async(std::launch::async, [&archive]() {
                return archive.readEntries();
            }));
        }
    } catch (const std::system_error &e) {
        // could not start a thread, the started tasks are joined by their futures
        return OCIDISK_ERR("start layer decoding", e);
    }

    // collect all results first so no task outlives the archives
    std::vector<utils::error::Result<std::vector<LayerEntry>>> results;
    results.reserve(tasks.size());
    for (auto &task : tasks) {
        results.push_back(task.get());
    }

    for (std::size_t i = 0; i < results.size(); ++i) {
        if (!results[i]) {
            return OCIDISK_ERR(fmt::format("layer {}", archives[i].digest()),
                               std::move(results[i]));
        }
        decoded.push_back(std::move(*results[i]));
    }

    return decoded;
}

} // namespace ocidisk::image
