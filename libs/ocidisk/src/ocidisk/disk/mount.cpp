// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "ocidisk/disk/mount.h"

#include "ocidisk/common/error.h"
#include "ocidisk/utils/log/log.h"

#include <fmt/format.h>

#include <sys/mount.h>

namespace ocidisk::disk {

using utils::error::ErrorCode;

Mount::Mount(std::filesystem::path target) noexcept
    : m_target(std::move(target))
    , m_mounted(true)
{
}

Mount::Mount(Mount &&other) noexcept
    : m_target(std::move(other.m_target))
    , m_mounted(other.m_mounted)
{
    other.m_mounted = false;
}

Mount &Mount::operator=(Mount &&other) noexcept
{
    if (this == &other) {
        return *this;
    }

    if (m_mounted) {
        auto ret = release();
        if (!ret) {
            LogW("{}", ret.error());
        }
    }

    m_target = std::move(other.m_target);
    m_mounted = other.m_mounted;
    other.m_mounted = false;
    return *this;
}

Mount::~Mount()
{
    if (!m_mounted) {
        return;
    }

    auto ret = release();
    if (!ret) {
        LogW("{}", ret.error());
    }
}

utils::error::Result<Mount> Mount::mount(const std::string &source,
                                         const std::filesystem::path &target,
                                         const std::string &fstype,
                                         unsigned long flags,
                                         const std::string &data) noexcept
{
    OCIDISK_TRACE(fmt::format("mount {} on {}", source, target.string()));

    auto ret = ::mount(source.c_str(),
                       target.c_str(),
                       fstype.empty() ? nullptr : fstype.c_str(),
                       flags,
                       data.empty() ? nullptr : data.c_str());
    if (ret != 0) {
        return OCIDISK_ERR(common::error::errorString(errno), ErrorCode::MountFailure);
    }

    LogD("mounted {} on {} ({})", source, target.string(), fstype.empty() ? "bind" : fstype);
    return Mount(target);
}

utils::error::Result<Mount> Mount::bind(const std::filesystem::path &source,
                                        const std::filesystem::path &target) noexcept
{
    OCIDISK_TRACE(fmt::format("bind {} on {}", source.string(), target.string()));

    auto ret = mount(source.string(), target, {}, MS_BIND);
    if (!ret) {
        return OCIDISK_ERR(ret);
    }
    return ret;
}

utils::error::Result<void> Mount::release() noexcept
{
    OCIDISK_TRACE(fmt::format("unmount {}", m_target.string()));

    if (!m_mounted) {
        return OCIDISK_OK;
    }
    // a failed unmount is reported once and not retried
    m_mounted = false;

    if (::umount2(m_target.c_str(), 0) != 0) {
        if (errno != EBUSY) {
            return OCIDISK_ERR(common::error::errorString(errno), ErrorCode::MountFailure);
        }

        LogW("{} is busy, detaching it lazily", m_target.string());
        if (::umount2(m_target.c_str(), MNT_DETACH) != 0) {
            return OCIDISK_ERR(common::error::errorString(errno), ErrorCode::MountFailure);
        }
    }

    LogD("unmounted {}", m_target.string());
    return OCIDISK_OK;
}

} // namespace ocidisk::disk
