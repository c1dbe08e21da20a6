// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include "ocidisk/utils/cmd.h"
#include "ocidisk/utils/error/error.h"

#include <string>

namespace ocidisk::disk {

struct FilesystemIds
{
    // FAT volume serial, 8 upper case hex digits
    std::string espVolumeId;
    // ext4 filesystem UUID, lower case canonical form
    std::string rootUuid;

    // The serial as blkid and fstab spell it, XXXX-XXXX.
    [[nodiscard]] std::string espUuid() const;
};

FilesystemIds generateFilesystemIds() noexcept;

// FAT32 on espDevice and ext4 on rootDevice, labelled EFI and rootfs.
utils::error::Result<void> formatFilesystems(const std::string &espDevice,
                                             const std::string &rootDevice,
                                             const FilesystemIds &ids,
                                             const utils::CmdFactory &cmdFactory) noexcept;

} // namespace ocidisk::disk
