/*
 * SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#include "log.h"

#include <systemd/sd-journal.h>

#include <cstdio>

#include <syslog.h>

namespace ocidisk::utils::log {

namespace {

int journalPriority(LogLevel level) noexcept
{
    switch (level) {
    case LogLevel::Fatal:
        return LOG_CRIT;
    case LogLevel::Error:
        return LOG_ERR;
    case LogLevel::Warning:
        return LOG_WARNING;
    case LogLevel::Info:
        return LOG_INFO;
    case LogLevel::Debug:
        return LOG_DEBUG;
    }
    return LOG_INFO;
}

} // namespace

Logger g_logger;

std::string_view logLevelName(LogLevel level) noexcept
{
    switch (level) {
    case LogLevel::Fatal:
        return "fatal";
    case LogLevel::Error:
        return "error";
    case LogLevel::Warning:
        return "warning";
    case LogLevel::Info:
        return "info";
    case LogLevel::Debug:
        return "debug";
    }
    return "info";
}

void setLogLevel(LogLevel level) noexcept
{
    g_logger.setLogLevel(level);
}

void setLogBackend(LogBackend backend) noexcept
{
    g_logger.setLogBackend(backend);
}

void setLogScope(std::string scope)
{
    g_logger.setScope(std::move(scope));
}

Logger::Logger()
    : logLevel(LogLevel::Info)
    , logBackend(LogBackend::Console)
{
}

void Logger::setLogLevel(LogLevel level) noexcept
{
    logLevel = level;
}

void Logger::setLogBackend(LogBackend backend) noexcept
{
    logBackend = backend;
}

void Logger::setScope(std::string scope)
{
    std::lock_guard<std::mutex> guard(mutex);
    currentScope = std::move(scope);
}

std::string Logger::scope() const
{
    std::lock_guard<std::mutex> guard(mutex);
    return currentScope;
}

void Logger::write(const LoggerContext &context, LogLevel level, const std::string &message)
{
    std::lock_guard<std::mutex> guard(mutex);

    if ((logBackend & LogBackend::Console) != LogBackend::None) {
        std::string prefix;
        if (level <= LogLevel::Warning) {
            prefix = fmt::format("{}: ", logLevelName(level));
        }
        if (!currentScope.empty()) {
            prefix = fmt::format("[{}] {}", currentScope, prefix);
        }
        fmt::print(stderr, "{}{}\n", prefix, message);
    }

    if ((logBackend & LogBackend::Journal) != LogBackend::None) {
        auto file = fmt::format("CODE_FILE={}", context.file);
        auto line = fmt::format("CODE_LINE={}", context.line);
        sd_journal_send_with_location(file.c_str(),
                                      line.c_str(),
                                      context.function,
                                      "MESSAGE=%s",
                                      message.c_str(),
                                      "PRIORITY=%i",
                                      journalPriority(level),
                                      "OCIDISK_SCOPE=%s",
                                      currentScope.c_str(),
                                      "SYSLOG_IDENTIFIER=ocidisk",
                                      nullptr);
    }
}

} // namespace ocidisk::utils::log
