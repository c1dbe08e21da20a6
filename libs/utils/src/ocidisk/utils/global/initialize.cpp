/*
 * SPDX-FileCopyrightText: 2023 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#include "ocidisk/utils/global/initialize.h"

#include "ocidisk/common/strings.h"

#include <csignal>
#include <cstdlib>
#include <initializer_list>

#include <unistd.h>

namespace ocidisk::utils::global {

using ocidisk::utils::log::LogBackend;
using ocidisk::utils::log::LogLevel;

std::atomic<bool> GlobalTaskControl::cancelFlag{ false };

namespace {

// No SA_RESTART: blocking syscalls return EINTR so waiters notice the flag.
void catchUnixSignals(std::initializer_list<int> quitSignals)
{
    auto handler = [](int /*sig*/) -> void {
        GlobalTaskControl::cancel();
    };

    sigset_t blocking_mask;
    sigemptyset(&blocking_mask);
    for (auto sig : quitSignals) {
        sigaddset(&blocking_mask, sig);
    }

    struct sigaction sa{};

    sa.sa_handler = handler;
    sa.sa_mask = blocking_mask;
    sa.sa_flags = 0;

    for (auto sig : quitSignals) {
        sigaction(sig, &sa, nullptr);
    }
}

} // namespace

LogLevel parseLogLevel(std::string_view level) noexcept
{
    if (common::strings::stringEqual(level, "debug")) {
        return LogLevel::Debug;
    }

    if (common::strings::stringEqual(level, "warning")) {
        return LogLevel::Warning;
    }

    if (common::strings::stringEqual(level, "error")) {
        return LogLevel::Error;
    }

    if (common::strings::stringEqual(level, "fatal")) {
        return LogLevel::Fatal;
    }

    return LogLevel::Info;
}

LogBackend parseLogBackend(std::string_view backends) noexcept
{
    LogBackend logBackend = LogBackend::None;

    for (const auto &backend :
         common::strings::split(backends, ',', common::strings::splitOption::TrimWhitespace)) {
        if (common::strings::stringEqual(backend, "console")) {
            logBackend = logBackend | LogBackend::Console;
        } else if (common::strings::stringEqual(backend, "journal")) {
            logBackend = logBackend | LogBackend::Journal;
        }
    }

    return logBackend;
}

void initOcidiskLogSystem()
{
    LogLevel logLevel = LogLevel::Info;
    LogBackend logBackend = LogBackend::Console;

    const char *logLevelEnv = std::getenv("OCIDISK_LOG_LEVEL");
    if (logLevelEnv != nullptr) {
        logLevel = parseLogLevel(logLevelEnv);
    }

    const char *logBackendEnv = std::getenv("OCIDISK_LOG_BACKEND");
    if (logBackendEnv != nullptr) {
        logBackend = parseLogBackend(logBackendEnv);
    } else if (isatty(STDERR_FILENO) == 0) {
        // started from a unit or a pipeline, keep a copy in the journal
        logBackend = logBackend | LogBackend::Journal;
    }

    log::setLogLevel(logLevel);
    log::setLogBackend(logBackend);
}

void applicationInitialize()
{
    initOcidiskLogSystem();
    catchUnixSignals({ SIGTERM, SIGQUIT, SIGINT, SIGHUP });
}

void GlobalTaskControl::cancel() noexcept
{
    cancelFlag.store(true);
}

bool GlobalTaskControl::canceled() noexcept
{
    return cancelFlag.load();
}

void GlobalTaskControl::reset() noexcept
{
    cancelFlag.store(false);
}

} // namespace ocidisk::utils::global
