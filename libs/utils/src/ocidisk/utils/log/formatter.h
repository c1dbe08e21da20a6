/*
 * SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */
#pragma once

#include "ocidisk/utils/error/error.h"

#include <fmt/format.h>
#include <fmt/std.h>

#include <string_view>

template <>
struct fmt::formatter<ocidisk::utils::error::Error> : fmt::formatter<std::string_view>
{
    auto format(const ocidisk::utils::error::Error &error, fmt::format_context &ctx) const
      -> fmt::format_context::iterator;
};
