/*
 * SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#pragma once

#include "ocidisk/utils/log/formatter.h"

#include <fmt/format.h>

#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <type_traits>

/*
journal records carry the pipeline stage in OCIDISK_SCOPE:
journalctl SYSLOG_IDENTIFIER=ocidisk --no-pager -o json
*/

#define LOGNS ocidisk::utils::log
#define LOGLV LOGNS::LogLevel
#define LOGCTX LOGNS::Logger::LoggerContext(__FILE__, __LINE__, __PRETTY_FUNCTION__)

#define LogD(...) LOGNS::g_logger.log(LOGCTX, LOGLV::Debug, __VA_ARGS__)
#define LogI(...) LOGNS::g_logger.log(LOGCTX, LOGLV::Info, __VA_ARGS__)
#define LogW(...) LOGNS::g_logger.log(LOGCTX, LOGLV::Warning, __VA_ARGS__)
#define LogE(...) LOGNS::g_logger.log(LOGCTX, LOGLV::Error, __VA_ARGS__)
#define LogF(...) LOGNS::g_logger.log(LOGCTX, LOGLV::Fatal, __VA_ARGS__)

namespace ocidisk::utils::log {

enum class LogBackend : uint8_t {
    None = 0,
    Console = 1U << 0U,
    Journal = 1U << 1U,
};

inline LogBackend operator|(LogBackend a, LogBackend b)
{
    return static_cast<LogBackend>(std::underlying_type_t<LogBackend>(a)
                                   | std::underlying_type_t<LogBackend>(b));
}

inline LogBackend operator&(LogBackend a, LogBackend b)
{
    return static_cast<LogBackend>(std::underlying_type_t<LogBackend>(a)
                                   & std::underlying_type_t<LogBackend>(b));
}

enum class LogLevel : uint8_t {
    Fatal,
    Error,
    Warning,
    Info,
    Debug,
};

std::string_view logLevelName(LogLevel level) noexcept;

// Layer reads log from worker threads, so writes and the scope are guarded.
class Logger
{
public:
    struct LoggerContext
    {
        LoggerContext(const char *file, int line, const char *function)
            : file(file)
            , line(line)
            , function(function)
        {
        }

        const char *file;
        int line;
        const char *function;
    };

    Logger();

    void setLogLevel(LogLevel level) noexcept;
    void setLogBackend(LogBackend backend) noexcept;

    // Console lines are prefixed with the scope, an empty scope drops it.
    void setScope(std::string scope);
    [[nodiscard]] std::string scope() const;

    [[nodiscard]] LogLevel level() const noexcept { return logLevel; }

    [[nodiscard]] LogBackend backend() const noexcept { return logBackend; }

    template <typename... Args>
    void log(const LoggerContext &context,
             LogLevel level,
             fmt::format_string<Args...> fmt,
             Args &&...args)
    {
        if (logLevel < level || logBackend == LogBackend::None) {
            return;
        }

        std::string message;
        try {
            message = fmt::format(fmt, std::forward<Args>(args)...);
        } catch (const fmt::format_error &e) {
            message = fmt::format("[format error: {}]", e.what());
        }

        write(context, level, message);
    }

private:
    void write(const LoggerContext &context, LogLevel level, const std::string &message);

    LogLevel logLevel;
    LogBackend logBackend;
    mutable std::mutex mutex;
    std::string currentScope;
};

void setLogLevel(LogLevel level) noexcept;
void setLogBackend(LogBackend backend) noexcept;
void setLogScope(std::string scope);

extern Logger g_logger;

} // namespace ocidisk::utils::log
