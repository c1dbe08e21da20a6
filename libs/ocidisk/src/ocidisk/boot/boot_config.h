// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include "ocidisk/boot/flavor.h"
#include "ocidisk/utils/error/error.h"

#include <filesystem>
#include <string>
#include <string_view>

namespace ocidisk::boot {

struct KernelImage
{
    std::string version;
    // relative to the root filesystem, e.g. boot/vmlinuz-6.1.0-18-amd64
    std::filesystem::path kernel;
    std::filesystem::path initramfs;
};

struct BootConfig
{
    std::string rootUuid;
    // XXXX-XXXX
    std::string espUuid;
    // appended to the flavor default
    std::string extraCmdline;
    std::string machineId;
    std::string hostname;
    // mapped to (hd0) while grub-install runs
    std::string loopDevice;
    KernelImage kernel;
};

// 32 lower case hex digits.
std::string generateMachineId() noexcept;

// RFC 1123 host name: labels of [a-z0-9-], not starting or ending with '-'.
utils::error::Result<void> validateHostname(std::string_view hostname) noexcept;

std::string kernelCmdline(const FlavorTraits &traits, const BootConfig &config);

std::string renderGrubDefaults(const FlavorTraits &traits, const BootConfig &config);

std::string renderDeviceMap(const BootConfig &config);

std::string renderFstab(const BootConfig &config);

std::string renderHosts(const BootConfig &config);

// Newest boot/vmlinuz-* below root that has a matching initramfs.
utils::error::Result<KernelImage> findKernel(const std::filesystem::path &root,
                                             const FlavorTraits &traits) noexcept;

} // namespace ocidisk::boot
