/*
 * SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#include "ocidisk/common/strings.h"

#include <algorithm>
#include <cctype>

namespace ocidisk::common::strings {

bool stringEqual(std::string_view str1, std::string_view str2, bool caseSensitive) noexcept
{
    if (caseSensitive) {
        return str1 == str2;
    }

    return std::equal(str1.begin(), str1.end(), str2.begin(), str2.end(), [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a))
          == std::tolower(static_cast<unsigned char>(b));
    });
}

std::string trim(std::string_view str, std::string_view chars) noexcept
{
    auto first = str.find_first_not_of(chars);
    if (first == std::string_view::npos) {
        return {};
    }

    auto last = str.find_last_not_of(chars);
    return std::string(str.substr(first, last - first + 1));
}

std::vector<std::string> split(std::string_view str, char delimiter, splitOption option) noexcept
{
    std::vector<std::string> result;
    const bool trimWhitespace = (option & splitOption::TrimWhitespace) != splitOption::None;
    const bool skipEmpty = (option & splitOption::SkipEmpty) != splitOption::None;

    auto push = [&](std::string_view piece) {
        std::string token = trimWhitespace ? trim(piece) : std::string(piece);
        if (skipEmpty && token.empty()) {
            return;
        }
        result.push_back(std::move(token));
    };

    std::size_t start = 0;
    std::size_t end = 0;
    while ((end = str.find(delimiter, start)) != std::string_view::npos) {
        push(str.substr(start, end - start));
        start = end + 1;
    }
    push(str.substr(start));

    return result;
}

std::string join(const std::vector<std::string> &strs, char delimiter) noexcept
{
    std::string result;
    for (const auto &s : strs) {
        if (&s != &strs.front()) {
            result.push_back(delimiter);
        }
        result.append(s);
    }
    return result;
}

bool starts_with(std::string_view str, std::string_view prefix) noexcept
{
    return str.size() >= prefix.size() && str.substr(0, prefix.size()) == prefix;
}

bool ends_with(std::string_view str, std::string_view suffix) noexcept
{
    return str.size() >= suffix.size() && str.substr(str.size() - suffix.size()) == suffix;
}

bool contains(std::string_view str, std::string_view needle) noexcept
{
    return str.find(needle) != std::string_view::npos;
}

std::string toHex(const unsigned char *data, std::size_t size) noexcept
{
    static constexpr char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(size * 2);
    for (std::size_t i = 0; i < size; ++i) {
        out.push_back(digits[data[i] >> 4U]);
        out.push_back(digits[data[i] & 0x0FU]);
    }
    return out;
}

} // namespace ocidisk::common::strings
