// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "ocidisk/image/digest.h"

#include "ocidisk/common/error.h"
#include "ocidisk/common/strings.h"

#include <fmt/format.h>
#include <gsl/gsl>
#include <openssl/evp.h>

#include <array>
#include <memory>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

namespace ocidisk::image {

utils::error::Result<std::string> sha256File(const std::filesystem::path &path) noexcept
{
    OCIDISK_TRACE(fmt::format("sha256 of {}", path.string()));

    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return OCIDISK_ERR(fmt::format("open: {}", common::error::errorString(errno)));
    }
    auto closer = gsl::finally([fd]() {
        ::close(fd);
    });

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx{ EVP_MD_CTX_new(),
                                                                 &EVP_MD_CTX_free };
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        return OCIDISK_ERR("EVP_DigestInit_ex failed");
    }

    std::vector<char> buffer(1024 * 1024);
    while (true) {
        auto n = ::read(fd, buffer.data(), buffer.size());
        if (n == 0) {
            break;
        }
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return OCIDISK_ERR(fmt::format("read: {}", common::error::errorString(errno)));
        }
        if (EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<std::size_t>(n)) != 1) {
            return OCIDISK_ERR("EVP_DigestUpdate failed");
        }
    }

    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int size = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &size) != 1) {
        return OCIDISK_ERR("EVP_DigestFinal_ex failed");
    }

    return common::strings::toHex(digest.data(), size);
}

} // namespace ocidisk::image
