// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include "ocidisk/utils/error/error.h"

#include <ctime>
#include <filesystem>
#include <string>
#include <string_view>

namespace ocidisk::account {

// Plaintext that is wiped from memory when it goes away. Never log reveal().
class Secret
{
public:
    Secret() = default;
    // Takes a copy and wipes plaintext.
    explicit Secret(std::string &plaintext);
    Secret(const Secret &) = delete;
    Secret &operator=(const Secret &) = delete;
    Secret(Secret &&other);
    Secret &operator=(Secret &&other);
    ~Secret();

    [[nodiscard]] const std::string &reveal() const noexcept { return m_value; }

    [[nodiscard]] bool empty() const noexcept { return m_value.empty(); }

private:
    void wipe() noexcept;

    std::string m_value;
};

void wipeString(std::string &value) noexcept;

enum class HashScheme {
    Sha512,
    Yescrypt,
};

utils::error::Result<HashScheme> parseHashScheme(std::string_view name) noexcept;

// crypt(5) string with a fresh salt, $6$ or $y$.
utils::error::Result<std::string> hashPassword(const Secret &password, HashScheme scheme) noexcept;

// true when password matches the crypt(5) string
bool verifyPassword(const Secret &password, const std::string &hash) noexcept;

// Replaces field 2 (hash) and 3 (last change, days since epoch) of user's line.
utils::error::Result<std::string> rewriteShadow(const std::string &content,
                                                const std::string &user,
                                                const std::string &hash,
                                                long lastChangeDays) noexcept;

// Sets the root password in <root>/etc/shadow, keeping mode and ownership.
utils::error::Result<void> setRootPassword(const std::filesystem::path &root,
                                           const Secret &password,
                                           HashScheme scheme,
                                           std::time_t now = std::time(nullptr)) noexcept;

} // namespace ocidisk::account
