/*
 * SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace ocidisk::common::strings {

enum class splitOption : uint8_t {
    None = 0,
    TrimWhitespace = 1U << 0U,
    SkipEmpty = 1U << 1U,
};

inline splitOption operator|(splitOption a, splitOption b)
{
    return static_cast<splitOption>(std::underlying_type_t<splitOption>(a)
                                    | std::underlying_type_t<splitOption>(b));
}

inline splitOption operator&(splitOption a, splitOption b)
{
    return static_cast<splitOption>(std::underlying_type_t<splitOption>(a)
                                    & std::underlying_type_t<splitOption>(b));
}

bool stringEqual(std::string_view str1, std::string_view str2, bool caseSensitive = false) noexcept;

std::string trim(std::string_view str, std::string_view chars = " \t\r\n") noexcept;

std::vector<std::string> split(std::string_view str,
                               char delimiter,
                               splitOption option = splitOption::None) noexcept;

std::string join(const std::vector<std::string> &strs, char delimiter = ' ') noexcept;

bool starts_with(std::string_view str, std::string_view prefix) noexcept;

bool ends_with(std::string_view str, std::string_view suffix) noexcept;

bool contains(std::string_view str, std::string_view needle) noexcept;

// Lower case hex encoding, two characters per byte.
std::string toHex(const unsigned char *data, std::size_t size) noexcept;

} // namespace ocidisk::common::strings
