// SPDX-FileCopyrightText: 2024 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "ocidisk/utils/file.h"

#include "ocidisk/common/error.h"
#include "ocidisk/utils/log/log.h"

#include <fmt/format.h>
#include <gsl/gsl>

#include <fstream>
#include <sstream>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace ocidisk::utils {

ocidisk::utils::error::Result<std::string> readFile(const std::filesystem::path &filepath)
{
    OCIDISK_TRACE(fmt::format("read file {}", filepath));

    std::error_code ec;
    auto exists = std::filesystem::exists(filepath, ec);
    if (ec) {
        return OCIDISK_ERR("check file", ec);
    }
    if (!exists) {
        return OCIDISK_ERR("file not found");
    }

    std::ifstream in{ filepath, std::ios::binary };
    if (!in.is_open()) {
        return OCIDISK_ERR(fmt::format("open file: {}", common::error::errorString(errno)));
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return OCIDISK_ERR(fmt::format("read file: {}", common::error::errorString(errno)));
    }
    return buffer.str();
}

ocidisk::utils::error::Result<void> writeFile(const std::filesystem::path &filepath,
                                              const std::string &content)
{
    OCIDISK_TRACE(fmt::format("write file {}", filepath));

    // never write through a symlink left in an image
    std::error_code ec;
    if (std::filesystem::is_symlink(std::filesystem::symlink_status(filepath, ec))) {
        std::filesystem::remove(filepath, ec);
        if (ec) {
            return OCIDISK_ERR("remove symlink", ec);
        }
    }

    std::ofstream out{ filepath, std::ios::binary | std::ios::trunc };
    if (!out.is_open()) {
        return OCIDISK_ERR(fmt::format("open file: {}", common::error::errorString(errno)));
    }
    out << content;
    out.flush();
    if (out.fail()) {
        return OCIDISK_ERR(fmt::format("write file: {}", common::error::errorString(errno)));
    }
    return OCIDISK_OK;
}

ocidisk::utils::error::Result<void> writeFileAtomic(const std::filesystem::path &filepath,
                                                    const std::string &content,
                                                    mode_t mode,
                                                    uid_t uid,
                                                    gid_t gid) noexcept
{
    OCIDISK_TRACE(fmt::format("replace file {}", filepath));

    auto tmpPath = filepath;
    tmpPath += ".ocidisk.tmp";

    int fd = ::open(tmpPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC | O_NOFOLLOW, mode);
    if (fd < 0) {
        return OCIDISK_ERR(
          fmt::format("open {}: {}", tmpPath, common::error::errorString(errno)));
    }

    bool committed = false;
    auto cleanup = gsl::finally([&fd, &committed, &tmpPath]() {
        if (fd >= 0) {
            ::close(fd);
        }
        if (!committed) {
            ::unlink(tmpPath.c_str());
        }
    });

    std::size_t written = 0;
    while (written < content.size()) {
        auto n = ::write(fd, content.data() + written, content.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return OCIDISK_ERR(
              fmt::format("write {}: {}", tmpPath, common::error::errorString(errno)));
        }
        written += static_cast<std::size_t>(n);
    }

    // the umask may have narrowed the mode given to open
    if (::fchmod(fd, mode) != 0 || ::fchown(fd, uid, gid) != 0) {
        return OCIDISK_ERR(
          fmt::format("set attributes of {}: {}", tmpPath, common::error::errorString(errno)));
    }

    if (::fsync(fd) != 0) {
        return OCIDISK_ERR(fmt::format("fsync {}: {}", tmpPath, common::error::errorString(errno)));
    }

    if (::close(fd) != 0) {
        fd = -1;
        return OCIDISK_ERR(fmt::format("close {}: {}", tmpPath, common::error::errorString(errno)));
    }
    fd = -1;

    if (::rename(tmpPath.c_str(), filepath.c_str()) != 0) {
        return OCIDISK_ERR(fmt::format("rename {} to {}: {}",
                                       tmpPath,
                                       filepath,
                                       common::error::errorString(errno)));
    }
    committed = true;

    return OCIDISK_OK;
}

ocidisk::utils::error::Result<void> ensureDirectory(const std::filesystem::path &dir)
{
    OCIDISK_TRACE(fmt::format("ensure directory {}", dir));

    std::error_code ec;
    auto status = std::filesystem::symlink_status(dir, ec);
    if (!ec) {
        if (std::filesystem::is_directory(status)) {
            return OCIDISK_OK;
        }

        std::filesystem::remove(dir, ec);
        if (ec) {
            return OCIDISK_ERR("failed to remove non-directory", ec);
        }
    }

    if (!std::filesystem::create_directories(dir, ec) && ec) {
        return OCIDISK_ERR("failed to create directory", ec);
    }

    return OCIDISK_OK;
}

} // namespace ocidisk::utils
