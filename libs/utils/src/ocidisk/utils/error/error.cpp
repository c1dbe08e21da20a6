/*
 * SPDX-FileCopyrightText: 2023 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#include "ocidisk/utils/error/error.h"

namespace ocidisk::utils::error {

std::string_view categoryName(int code) noexcept
{
    switch (static_cast<ErrorCode>(code)) {
    case ErrorCode::Success:
        return "Success";
    case ErrorCode::ImageNotFound:
        return "ImageNotFound";
    case ErrorCode::LayerCorrupt:
        return "LayerCorrupt";
    case ErrorCode::OutputPathUnwritable:
        return "OutputPathUnwritable";
    case ErrorCode::PartitionTableWriteFailure:
        return "PartitionTableWriteFailure";
    case ErrorCode::ResourceBusy:
        return "ResourceBusy";
    case ErrorCode::LoopAttachFailure:
        return "LoopAttachFailure";
    case ErrorCode::FormatFailure:
        return "FormatFailure";
    case ErrorCode::MountFailure:
        return "MountFailure";
    case ErrorCode::InsufficientSpace:
        return "InsufficientSpace";
    case ErrorCode::BootloaderInstallFailure:
        return "BootloaderInstallFailure";
    case ErrorCode::PasswordSetFailure:
        return "PasswordSetFailure";
    case ErrorCode::CleanupWarning:
        return "CleanupWarning";
    case ErrorCode::Failed:
        break;
    }
    return "Failed";
}

int exitStatus(int code) noexcept
{
    if (code >= 1 && code <= 255) {
        return code;
    }
    return 1;
}

} // namespace ocidisk::utils::error
