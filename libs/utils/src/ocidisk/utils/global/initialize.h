/*
 * SPDX-FileCopyrightText: 2023 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#pragma once

#include "ocidisk/utils/log/log.h"

#include <atomic>
#include <string_view>

namespace ocidisk::utils::global {

void applicationInitialize();
void initOcidiskLogSystem();

log::LogLevel parseLogLevel(std::string_view level) noexcept;
log::LogBackend parseLogBackend(std::string_view backends) noexcept;

// Process wide cancellation, raised by SIGINT, SIGTERM, SIGQUIT and SIGHUP.
// Long running commands poll it and abort the current stage.
class GlobalTaskControl
{
public:
    static void cancel() noexcept;
    static bool canceled() noexcept;
    static void reset() noexcept;

private:
    static std::atomic<bool> cancelFlag;
};

} // namespace ocidisk::utils::global
