// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "ocidisk/disk/disk_image.h"

#include "ocidisk/common/error.h"
#include "ocidisk/utils/log/log.h"

#include <fmt/format.h>
#include <gsl/gsl>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace ocidisk::disk {

using utils::error::ErrorCode;

utils::error::Result<DiskImage> allocateDiskImage(const std::filesystem::path &path,
                                                  uint64_t sizeBytes) noexcept
{
    OCIDISK_TRACE(fmt::format("allocate {} bytes at {}", sizeBytes, path.string()));

    if (sizeBytes == 0) {
        return OCIDISK_ERR("disk size must be positive", ErrorCode::OutputPathUnwritable);
    }

    struct stat st{};
    if (::lstat(path.c_str(), &st) == 0 && !S_ISREG(st.st_mode)) {
        return OCIDISK_ERR("output exists and is not a regular file",
                           ErrorCode::OutputPathUnwritable);
    }

    int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC | O_NOFOLLOW, 0644);
    if (fd < 0) {
        return OCIDISK_ERR(fmt::format("open: {}", common::error::errorString(errno)),
                           ErrorCode::OutputPathUnwritable);
    }
    auto closer = gsl::finally([fd]() {
        ::close(fd);
    });

    // drop whatever an earlier run left, then grow without allocating blocks
    if (::ftruncate(fd, 0) != 0) {
        return OCIDISK_ERR(fmt::format("truncate: {}", common::error::errorString(errno)),
                           ErrorCode::OutputPathUnwritable);
    }

    if (::ftruncate(fd, static_cast<off_t>(sizeBytes)) != 0) {
        return OCIDISK_ERR(fmt::format("extend: {}", common::error::errorString(errno)),
                           ErrorCode::OutputPathUnwritable);
    }

    LogI("allocated sparse image {} of {} bytes", path, sizeBytes);
    return DiskImage{ path, sizeBytes };
}

} // namespace ocidisk::disk
