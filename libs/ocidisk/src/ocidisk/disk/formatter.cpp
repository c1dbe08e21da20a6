// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "ocidisk/disk/formatter.h"

#include "ocidisk/common/strings.h"
#include "ocidisk/utils/log/log.h"

#include <fmt/format.h>
#include <uuid/uuid.h>

#include <array>
#include <cctype>

namespace ocidisk::disk {

using utils::error::ErrorCode;

std::string FilesystemIds::espUuid() const
{
    return fmt::format("{}-{}", espVolumeId.substr(0, 4), espVolumeId.substr(4));
}

FilesystemIds generateFilesystemIds() noexcept
{
    FilesystemIds ids;

    uuid_t serial;
    uuid_generate_random(serial);
    ids.espVolumeId = common::strings::toHex(serial, 4);
    for (auto &c : ids.espVolumeId) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }

    uuid_t root;
    uuid_generate_random(root);
    std::array<char, 37> text{};
    uuid_unparse_lower(root, text.data());
    ids.rootUuid = text.data();

    return ids;
}

utils::error::Result<void> formatFilesystems(const std::string &espDevice,
                                             const std::string &rootDevice,
                                             const FilesystemIds &ids,
                                             const utils::CmdFactory &cmdFactory) noexcept
{
    OCIDISK_TRACE(fmt::format("format {} and {}", espDevice, rootDevice));

    auto ret = cmdFactory("mkfs.vfat")->exec(
      { "-F", "32", "-n", "EFI", "-i", ids.espVolumeId, espDevice });
    if (!ret) {
        return OCIDISK_ERR("mkfs.vfat", std::move(ret), ErrorCode::FormatFailure);
    }
    LogI("formatted {} as vfat, volume id {}", espDevice, ids.espUuid());

    ret = cmdFactory("mkfs.ext4")->exec(
      { "-F", "-q", "-L", "rootfs", "-U", ids.rootUuid, rootDevice });
    if (!ret) {
        return OCIDISK_ERR("mkfs.ext4", std::move(ret), ErrorCode::FormatFailure);
    }
    LogI("formatted {} as ext4, uuid {}", rootDevice, ids.rootUuid);

    return OCIDISK_OK;
}

} // namespace ocidisk::disk
