// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "ocidisk/utils/filelock.h"

#include "ocidisk/common/error.h"
#include "ocidisk/utils/log/log.h"

#include <fmt/format.h>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace ocidisk::utils::filelock {

namespace {
constexpr mode_t default_file_mode = 0644;
}

utils::error::Result<FileLock> FileLock::create(std::filesystem::path path,
                                                bool create_if_missing) noexcept
{
    OCIDISK_TRACE("create file lock");

    std::error_code ec;
    auto abs_path = std::filesystem::absolute(path, ec);
    if (ec) {
        return OCIDISK_ERR(fmt::format("canonicalize path {} error: {}", path, ec.message()));
    }

    int flags = O_RDWR | O_CLOEXEC | O_NOFOLLOW;
    if (create_if_missing) {
        flags |= O_CREAT;
    }

    auto fd = ::open(abs_path.c_str(), flags, default_file_mode);
    if (fd < 0) {
        return OCIDISK_ERR(
          fmt::format("open {} failed: {}", abs_path, common::error::errorString(errno)));
    }

    return FileLock(fd, std::move(abs_path));
}

FileLock::~FileLock() noexcept
{
    reset();
}

void FileLock::reset() noexcept
{
    if (isLocked()) {
        auto ret = unlock();
        if (!ret) {
            LogW("unlock file failed: {}", ret.error());
        }
    }

    if (fd_ >= 0 && ::close(fd_) < 0) {
        LogW("close file failed: {}", common::error::errorString(errno));
    }

    fd_ = -1;
}

FileLock::FileLock(int fd, std::filesystem::path path) noexcept
    : fd_(fd)
    , path_(std::move(path))
{
}

FileLock::FileLock(FileLock &&other) noexcept
    : fd_(other.fd_)
    , path_(std::move(other.path_))
{
    locked.store(other.locked.load(std::memory_order_relaxed), std::memory_order_relaxed);
    other.locked.store(false, std::memory_order_relaxed);
    other.fd_ = -1;
}

FileLock &FileLock::operator=(FileLock &&other) noexcept
{
    if (this == &other) {
        return *this;
    }

    reset();

    fd_ = other.fd_;
    path_ = std::move(other.path_);

    locked.store(other.locked.load(std::memory_order_relaxed), std::memory_order_relaxed);
    other.locked.store(false, std::memory_order_relaxed);
    other.fd_ = -1;

    return *this;
}

utils::error::Result<bool> FileLock::apply(short lockType) noexcept
{
    OCIDISK_TRACE("apply file lock");

    // l_pid must be zero for open file description locks
    struct flock fl{};
    fl.l_type = lockType;
    fl.l_whence = SEEK_SET;
    fl.l_start = 0;
    fl.l_len = 0;
    fl.l_pid = 0;

    while (true) {
        if (::fcntl(fd_, F_OFD_SETLK, &fl) == 0) {
            return true;
        }

        if (errno == EINTR) {
            continue;
        }

        if (errno == EACCES || errno == EAGAIN) {
            return false;
        }

        return OCIDISK_ERR(
          fmt::format("fcntl on {} failed: {}", path_, common::error::errorString(errno)));
    }
}

utils::error::Result<bool> FileLock::tryLock() noexcept
{
    OCIDISK_TRACE("try lock file");

    if (isLocked()) {
        return true;
    }

    auto ret = apply(F_WRLCK);
    if (!ret) {
        return OCIDISK_ERR(ret);
    }

    if (*ret) {
        locked.store(true, std::memory_order_relaxed);
    }
    return *ret;
}

utils::error::Result<void> FileLock::unlock() noexcept
{
    OCIDISK_TRACE("unlock file");

    if (!isLocked()) {
        return OCIDISK_OK;
    }

    auto ret = apply(F_UNLCK);
    if (!ret) {
        return OCIDISK_ERR(ret);
    }

    locked.store(false, std::memory_order_relaxed);
    return OCIDISK_OK;
}

bool FileLock::isLocked() const noexcept
{
    return locked.load(std::memory_order_relaxed);
}

} // namespace ocidisk::utils::filelock
