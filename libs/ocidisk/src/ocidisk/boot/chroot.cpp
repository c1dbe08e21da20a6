// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "ocidisk/boot/chroot.h"

#include "ocidisk/common/error.h"
#include "ocidisk/utils/file.h"
#include "ocidisk/utils/log/log.h"

#include <fmt/format.h>

#include <optional>

#include <sys/mount.h>
#include <sys/stat.h>

namespace ocidisk::boot {

namespace {

constexpr auto backupSuffix = ".ocidisk-orig";
constexpr auto denyServiceStarts = "#!/bin/sh\nexit 101\n";

} // namespace

ChrootSession::ChrootSession(Key, std::filesystem::path root) noexcept
    : m_root(std::move(root))
{
}

ChrootSession::~ChrootSession()
{
    auto ret = releaseMounts();
    if (!ret) {
        LogW("{}", ret.error());
    }

    ret = restoreFiles();
    if (!ret) {
        LogW("{}", ret.error());
    }
}

utils::error::Result<std::unique_ptr<ChrootSession>>
ChrootSession::open(const std::filesystem::path &root, const ChrootOptions &options) noexcept
{
    OCIDISK_TRACE(fmt::format("prepare chroot at {}", root.string()));

    auto session = std::make_unique<ChrootSession>(Key{}, root);

    if (options.mountApiFilesystems) {
        auto ret = session->mountApiFilesystems();
        if (!ret) {
            return OCIDISK_ERR(ret);
        }
    }

    std::error_code ec;
    if (std::filesystem::exists(options.hostResolvConf, ec)) {
        auto content = utils::readFile(options.hostResolvConf);
        if (!content) {
            return OCIDISK_ERR(content);
        }
        auto ret = session->replaceFile("etc/resolv.conf", *content, 0644);
        if (!ret) {
            return OCIDISK_ERR(ret);
        }
    } else {
        LogW("{} not found, name resolution inside the chroot may fail",
             options.hostResolvConf.string());
    }

    auto ret = session->replaceFile("usr/sbin/policy-rc.d", denyServiceStarts, 0755);
    if (!ret) {
        return OCIDISK_ERR(ret);
    }

    LogI("chroot ready at {}", root.string());
    return session;
}

utils::error::Result<void> ChrootSession::mountApiFilesystems() noexcept
{
    OCIDISK_TRACE(fmt::format("mount API filesystems below {}", m_root.string()));

    auto ensure = [this](const std::filesystem::path &relative) -> utils::error::Result<void> {
        OCIDISK_TRACE(fmt::format("create {}", relative.string()));
        auto ret = utils::ensureDirectory(m_root / relative);
        if (!ret) {
            return OCIDISK_ERR(ret);
        }
        return OCIDISK_OK;
    };

    auto ret = ensure("proc");
    if (!ret) {
        return OCIDISK_ERR(ret);
    }
    auto proc =
      disk::Mount::mount("proc", m_root / "proc", "proc", MS_NOSUID | MS_NODEV | MS_NOEXEC);
    if (!proc) {
        return OCIDISK_ERR(proc);
    }
    m_mounts.push_back(std::move(*proc));

    for (const auto *source : { "/sys", "/dev", "/dev/pts" }) {
        auto relative = std::filesystem::path(source).relative_path();
        ret = ensure(relative);
        if (!ret) {
            return OCIDISK_ERR(ret);
        }

        auto bound = disk::Mount::bind(source, m_root / relative);
        if (!bound) {
            return OCIDISK_ERR(bound);
        }
        m_mounts.push_back(std::move(*bound));
    }

    return OCIDISK_OK;
}

utils::error::Result<void> ChrootSession::replaceFile(const std::filesystem::path &relative,
                                                      const std::string &content,
                                                      mode_t mode) noexcept
{
    OCIDISK_TRACE(fmt::format("install temporary {}", relative.string()));

    ReplacedFile file{ m_root / relative, {}, false };

    auto ret = utils::ensureDirectory(file.path.parent_path());
    if (!ret) {
        return OCIDISK_ERR(ret);
    }

    struct stat st{};
    if (::lstat(file.path.c_str(), &st) == 0) {
        auto backup = file.path;
        backup += backupSuffix;
        if (::rename(file.path.c_str(), backup.c_str()) != 0) {
            return OCIDISK_ERR(fmt::format("rename: {}", common::error::errorString(errno)));
        }
        file.backup = std::move(backup);
    } else if (errno != ENOENT) {
        return OCIDISK_ERR(fmt::format("lstat: {}", common::error::errorString(errno)));
    }
    m_files.push_back(file);

    ret = utils::writeFile(file.path, content);
    if (!ret) {
        return OCIDISK_ERR(ret);
    }
    if (::chmod(file.path.c_str(), mode) != 0) {
        return OCIDISK_ERR(fmt::format("chmod: {}", common::error::errorString(errno)));
    }

    return OCIDISK_OK;
}

utils::error::Result<void> ChrootSession::releaseMounts() noexcept
{
    OCIDISK_TRACE(fmt::format("unmount API filesystems below {}", m_root.string()));

    std::optional<utils::error::Error> first;
    for (auto mount = m_mounts.rbegin(); mount != m_mounts.rend(); ++mount) {
        auto ret = mount->release();
        if (ret) {
            continue;
        }
        if (first) {
            LogW("{}", ret.error());
            continue;
        }
        first.emplace(std::move(ret.error()));
    }
    m_mounts.clear();

    if (first) {
        return OCIDISK_ERR(std::move(*first));
    }
    return OCIDISK_OK;
}

utils::error::Result<void> ChrootSession::restoreFiles() noexcept
{
    OCIDISK_TRACE(fmt::format("restore files below {}", m_root.string()));

    std::optional<utils::error::Error> first;
    auto fail = [&first](const std::string &message) {
        OCIDISK_TRACE("restore file");
        auto err = OCIDISK_ERR(message);
        if (first) {
            LogW("{}", err.value());
            return;
        }
        first.emplace(std::move(err.value()));
    };

    for (auto file = m_files.rbegin(); file != m_files.rend(); ++file) {
        if (file->restored) {
            continue;
        }
        file->restored = true;

        std::error_code ec;
        std::filesystem::remove(file->path, ec);
        if (ec) {
            fail(fmt::format("remove {}: {}", file->path.string(), ec.message()));
            continue;
        }

        if (file->backup.empty()) {
            continue;
        }
        if (::rename(file->backup.c_str(), file->path.c_str()) != 0) {
            fail(fmt::format("restore {}: {}",
                             file->path.string(),
                             common::error::errorString(errno)));
        }
    }

    if (first) {
        return OCIDISK_ERR(std::move(*first));
    }
    return OCIDISK_OK;
}

} // namespace ocidisk::boot
