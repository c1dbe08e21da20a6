// SPDX-FileCopyrightText: 2026 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include <string>

namespace ocidisk::common::error {

std::string errorString(int err);

} // namespace ocidisk::common::error
