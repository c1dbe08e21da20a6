/*
 * SPDX-FileCopyrightText: 2023 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#pragma once

#include "ocidisk/utils/error/details/error_impl.h"

#include <tl/expected.hpp>

#include <exception>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace ocidisk::utils::error {

// The values of the categories double as the process exit status.
enum class ErrorCode : int {
    Failed = -1, // generic failure
    Success = 0,

    /* image */
    ImageNotFound = 10,
    LayerCorrupt = 11,

    /* disk */
    OutputPathUnwritable = 20,
    PartitionTableWriteFailure = 21,
    ResourceBusy = 22,
    LoopAttachFailure = 23,

    /* filesystem */
    FormatFailure = 30,
    MountFailure = 31,
    InsufficientSpace = 32,

    /* boot */
    BootloaderInstallFailure = 40,
    PasswordSetFailure = 41,

    /* teardown */
    CleanupWarning = 50,
};

std::string_view categoryName(int code) noexcept;

inline std::string_view categoryName(ErrorCode code) noexcept
{
    return categoryName(static_cast<int>(code));
}

class Error
{
public:
    Error() = default;

    Error(const Error &) = delete;
    Error(Error &&) = default;
    Error &operator=(const Error &) = delete;
    Error &operator=(Error &&) = default;

    [[nodiscard]] auto code() const { return pImpl->code(); };

    [[nodiscard]] auto message() const { return pImpl->message(); }

    [[nodiscard]] bool is(ErrorCode code) const { return pImpl->code() == static_cast<int>(code); }

    static auto Err(const char *file,
                    int line,
                    const std::string &trace_msg,
                    const std::string &msg,
                    ErrorCode code) -> Error
    {
        return Error(std::make_unique<details::ErrorImpl>(file,
                                                          line,
                                                          static_cast<int>(code),
                                                          trace_msg,
                                                          msg,
                                                          nullptr));
    }

    static auto Err(const char *file,
                    int line,
                    const std::string &trace_msg,
                    const std::string &msg,
                    int code = -1) -> Error
    {
        return Error(
          std::make_unique<details::ErrorImpl>(file, line, code, trace_msg, msg, nullptr));
    }

    static auto Err(const char *file,
                    int line,
                    const std::string &trace_msg,
                    const std::string &msg,
                    const std::error_code &ec) -> Error
    {
        return Error(std::make_unique<details::ErrorImpl>(file,
                                                          line,
                                                          static_cast<int>(ErrorCode::Failed),
                                                          trace_msg,
                                                          msg + ": " + ec.message(),
                                                          nullptr));
    }

    static auto
    Err(const char *file, int line, const std::string &trace_msg, const std::exception &e)
      -> Error
    {
        return Error(
          std::make_unique<details::ErrorImpl>(file, line, -1, trace_msg, e.what(), nullptr));
    }

    static auto Err(const char *file,
                    int line,
                    const std::string &trace_msg,
                    const std::string &msg,
                    const std::exception &e,
                    ErrorCode code = ErrorCode::Failed) -> Error
    {
        return Error(std::make_unique<details::ErrorImpl>(file,
                                                          line,
                                                          static_cast<int>(code),
                                                          trace_msg,
                                                          msg + ": " + e.what(),
                                                          nullptr));
    }

    template <typename Value>
    static auto Err(const char *file,
                    int line,
                    const std::string &trace_msg,
                    const std::string &msg,
                    tl::expected<Value, Error> &&cause) -> Error
    {
        return Err(file, line, trace_msg, msg, std::move(cause.error()));
    }

    template <typename Value>
    static auto Err(const char *file,
                    int line,
                    const std::string &trace_msg,
                    tl::expected<Value, Error> &&cause) -> Error
    {
        return Err(file, line, trace_msg, std::move(cause.error()));
    }

    // Wraps a cause and files the result under another category.
    template <typename Value>
    static auto Err(const char *file,
                    int line,
                    const std::string &trace_msg,
                    const std::string &msg,
                    tl::expected<Value, Error> &&cause,
                    ErrorCode code) -> Error
    {
        return Err(file, line, trace_msg, msg, std::move(cause.error()), code);
    }

    static auto Err(const char *file,
                    int line,
                    const std::string &trace_msg,
                    const std::string &msg,
                    Error &&cause) -> Error
    {
        return Error(std::make_unique<details::ErrorImpl>(file,
                                                          line,
                                                          cause.code(),
                                                          trace_msg,
                                                          msg,
                                                          std::move(cause.pImpl)));
    }

    static auto Err(const char *file,
                    int line,
                    const std::string &trace_msg,
                    const std::string &msg,
                    Error &&cause,
                    ErrorCode code) -> Error
    {
        return Error(std::make_unique<details::ErrorImpl>(file,
                                                          line,
                                                          static_cast<int>(code),
                                                          trace_msg,
                                                          msg,
                                                          std::move(cause.pImpl)));
    }

    static auto Err(const char *file, int line, const std::string &trace_msg, Error &&cause)
      -> Error
    {
        return Error(std::make_unique<details::ErrorImpl>(file,
                                                          line,
                                                          cause.code(),
                                                          trace_msg,
                                                          std::nullopt,
                                                          std::move(cause.pImpl)));
    }

private:
    explicit Error(std::unique_ptr<details::ErrorImpl> pImpl)
        : pImpl(std::move(pImpl))
    {
    }

    std::unique_ptr<details::ErrorImpl> pImpl;
};

template <typename Value>
using Result = tl::expected<Value, Error>;

// Maps an error code to a process exit status in [1, 255].
int exitStatus(int code) noexcept;

} // namespace ocidisk::utils::error

// Use this macro to define trace message at the begining of function
#define OCIDISK_TRACE(message) const std::string ocidisk_trace_message{ message };

// Use this macro to create new error or wrap an existing error
// OCIDISK_ERR(message, code = -1)
// OCIDISK_ERR(message, /* ErrorCode */)
// OCIDISK_ERR(message, /* std::error_code */)
// OCIDISK_ERR(/* const std::exception & */)
// OCIDISK_ERR(message, /* const std::exception & */, /* ErrorCode */)
// OCIDISK_ERR(message, /* Result<Value>&& or Error&& */)
// OCIDISK_ERR(/* Result<Value>&& or Error&& */)
// OCIDISK_ERR(message, /* Result<Value>&& or Error&& */, /* ErrorCode */)

#define OCIDISK_ERR_GETMACRO(_1, _2, _3, NAME, ...) /*NOLINT*/ NAME
#define OCIDISK_ERR(...) /*NOLINT*/                                                     \
    OCIDISK_ERR_GETMACRO(__VA_ARGS__, OCIDISK_ERR_3, OCIDISK_ERR_2, OCIDISK_ERR_1, ...) \
    (__VA_ARGS__)

// std::move is used for Result<Value>
#define OCIDISK_ERR_1(_1) /*NOLINT*/                                  \
    tl::unexpected(::ocidisk::utils::error::Error::Err(__FILE__,      \
                                                       __LINE__,      \
                                                       ocidisk_trace_message, \
                                                       std::move((_1)) /*NOLINT*/))

// std::move is used for Result<Value>
#define OCIDISK_ERR_2(_1, _2) /*NOLINT*/                              \
    tl::unexpected(::ocidisk::utils::error::Error::Err(__FILE__,      \
                                                       __LINE__,      \
                                                       ocidisk_trace_message, \
                                                       (_1),          \
                                                       std::move((_2)) /*NOLINT*/))

#define OCIDISK_ERR_3(_1, _2, _3) /*NOLINT*/                          \
    tl::unexpected(::ocidisk::utils::error::Error::Err(__FILE__,      \
                                                       __LINE__,      \
                                                       ocidisk_trace_message, \
                                                       (_1),          \
                                                       std::move((_2)) /*NOLINT*/, \
                                                       (_3)))

#define OCIDISK_OK \
    {              \
    }

#define OCIDISK_ERRV(...) /*NOLINT*/ OCIDISK_ERR(__VA_ARGS__).value()
