// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "ocidisk/account/shadow.h"

#include "ocidisk/common/error.h"
#include "ocidisk/common/strings.h"
#include "ocidisk/utils/file.h"
#include "ocidisk/utils/log/log.h"

#include <crypt.h>
#include <fmt/format.h>
#include <gsl/gsl>

#include <cstdlib>
#include <cstring>
#include <vector>

#include <sys/stat.h>

namespace ocidisk::account {

using utils::error::ErrorCode;

namespace {

constexpr long secondsPerDay = 86400;

const char *schemePrefix(HashScheme scheme) noexcept
{
    switch (scheme) {
    case HashScheme::Yescrypt:
        return "$y$";
    case HashScheme::Sha512:
        break;
    }
    return "$6$";
}

// crypt_ra output buffer, wiped before it is freed
struct CryptData
{
    void *data{ nullptr };
    int size{ 0 };

    CryptData() = default;
    CryptData(const CryptData &) = delete;
    CryptData &operator=(const CryptData &) = delete;

    ~CryptData()
    {
        if (data != nullptr) {
            ::explicit_bzero(data, static_cast<std::size_t>(size));
            std::free(data);
        }
    }
};

utils::error::Result<std::string> cryptString(const Secret &password, const char *setting) noexcept
{
    OCIDISK_TRACE("hash password");

    CryptData buffer;
    errno = 0;
    const char *hashed = ::crypt_ra(password.reveal().c_str(), setting, &buffer.data, &buffer.size);
    // failure tokens start with '*'
    if (hashed == nullptr || hashed[0] == '*') {
        int err = errno;
        return OCIDISK_ERR(fmt::format("crypt_ra: {}",
                                       err != 0 ? common::error::errorString(err)
                                                : std::string("invalid setting")));
    }
    return std::string(hashed);
}

} // namespace

void wipeString(std::string &value) noexcept
{
    if (!value.empty()) {
        ::explicit_bzero(value.data(), value.size());
    }
    value.clear();
}

Secret::Secret(std::string &plaintext)
    : m_value(plaintext)
{
    wipeString(plaintext);
}

Secret::Secret(Secret &&other)
    : m_value(other.m_value)
{
    other.wipe();
}

Secret &Secret::operator=(Secret &&other)
{
    if (this != &other) {
        wipe();
        m_value = other.m_value;
        other.wipe();
    }
    return *this;
}

Secret::~Secret()
{
    wipe();
}

void Secret::wipe() noexcept
{
    wipeString(m_value);
}

utils::error::Result<HashScheme> parseHashScheme(std::string_view name) noexcept
{
    OCIDISK_TRACE(fmt::format("parse password hash scheme {}", name));

    if (name == "sha512") {
        return HashScheme::Sha512;
    }
    if (name == "yescrypt") {
        return HashScheme::Yescrypt;
    }
    return OCIDISK_ERR("unknown password hash scheme, expected sha512 or yescrypt");
}

utils::error::Result<std::string> hashPassword(const Secret &password, HashScheme scheme) noexcept
{
    OCIDISK_TRACE("hash root password");

    if (password.empty()) {
        return OCIDISK_ERR("password is empty", ErrorCode::PasswordSetFailure);
    }

    errno = 0;
    // default cost, salt from the system random source
    char *setting = ::crypt_gensalt_ra(schemePrefix(scheme), 0, nullptr, 0);
    if (setting == nullptr) {
        return OCIDISK_ERR(fmt::format("crypt_gensalt_ra: {}", common::error::errorString(errno)),
                           ErrorCode::PasswordSetFailure);
    }
    auto freeSetting = gsl::finally([setting]() {
        std::free(setting);
    });

    auto hashed = cryptString(password, setting);
    if (!hashed) {
        return OCIDISK_ERR("crypt", std::move(hashed), ErrorCode::PasswordSetFailure);
    }
    return hashed;
}

bool verifyPassword(const Secret &password, const std::string &hash) noexcept
{
    auto hashed = cryptString(password, hash.c_str());
    return hashed && *hashed == hash;
}

utils::error::Result<std::string> rewriteShadow(const std::string &content,
                                                const std::string &user,
                                                const std::string &hash,
                                                long lastChangeDays) noexcept
{
    OCIDISK_TRACE(fmt::format("set password of {} in shadow", user));

    std::string out;
    out.reserve(content.size() + hash.size());
    bool found = false;

    std::size_t start = 0;
    while (start < content.size()) {
        auto end = content.find('\n', start);
        auto hasNewline = end != std::string::npos;
        if (!hasNewline) {
            end = content.size();
        }
        std::string_view line(content.data() + start, end - start);
        start = end + 1;

        auto colon = line.find(':');
        if (found || colon == std::string_view::npos || line.substr(0, colon) != user) {
            out.append(line);
        } else {
            auto fields = common::strings::split(line, ':');
            // name, hash and last change at least
            while (fields.size() < 3) {
                fields.emplace_back();
            }
            fields[1] = hash;
            fields[2] = std::to_string(lastChangeDays);
            out += common::strings::join(fields, ':');
            found = true;
        }

        if (hasNewline) {
            out += '\n';
        }
    }

    if (!found) {
        return OCIDISK_ERR(fmt::format("no entry for {}", user), ErrorCode::PasswordSetFailure);
    }
    return out;
}

utils::error::Result<void> setRootPassword(const std::filesystem::path &root,
                                           const Secret &password,
                                           HashScheme scheme,
                                           std::time_t now) noexcept
{
    OCIDISK_TRACE("set root password");

    const auto shadow = root / "etc/shadow";

    struct stat st{};
    if (::stat(shadow.c_str(), &st) != 0) {
        return OCIDISK_ERR(fmt::format("{}: {}", shadow.string(), common::error::errorString(errno)),
                           ErrorCode::PasswordSetFailure);
    }

    auto content = utils::readFile(shadow);
    if (!content) {
        return OCIDISK_ERR("read shadow", std::move(content), ErrorCode::PasswordSetFailure);
    }

    auto hash = hashPassword(password, scheme);
    if (!hash) {
        return OCIDISK_ERR(hash);
    }

    auto updated = rewriteShadow(*content, "root", *hash, static_cast<long>(now / secondsPerDay));
    if (!updated) {
        return OCIDISK_ERR(updated);
    }

    auto ret = utils::writeFileAtomic(shadow, *updated, st.st_mode & 07777, st.st_uid, st.st_gid);
    if (!ret) {
        return OCIDISK_ERR("write shadow", std::move(ret), ErrorCode::PasswordSetFailure);
    }

    LogI("root password set ({} scheme)", scheme == HashScheme::Yescrypt ? "yescrypt" : "sha512");
    return OCIDISK_OK;
}

} // namespace ocidisk::account
