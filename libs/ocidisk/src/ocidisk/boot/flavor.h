// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include "ocidisk/utils/error/error.h"

#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace ocidisk::boot {

struct Debian
{
    static constexpr std::string_view name{ "debian" };
    static constexpr std::string_view kernelPackage{ "linux-image-amd64" };
    static constexpr std::string_view kernelCmdline{ "console=tty0 console=ttyS0,115200" };
};

struct Ubuntu
{
    static constexpr std::string_view name{ "ubuntu" };
    static constexpr std::string_view kernelPackage{ "linux-image-generic" };
    static constexpr std::string_view kernelCmdline{
        "console=tty0 console=ttyS0,115200 quiet splash"
    };
};

using Flavor = std::variant<Debian, Ubuntu>;

// Everything the bootloader stage needs to know about a distribution.
struct FlavorTraits
{
    std::string name;
    std::string kernelPackage;
    // kernel first, then the bootloader and initramfs tooling
    std::vector<std::string> packages;
    std::string bootloaderId;
    std::string kernelCmdline;
    std::string kernelPrefix{ "vmlinuz-" };
    std::string initramfsPrefix{ "initrd.img-" };
    // extra /etc/default/grub assignments
    std::vector<std::pair<std::string, std::string>> grubDefaults;
};

utils::error::Result<Flavor> parseFlavor(std::string_view name) noexcept;

std::string flavorName(const Flavor &flavor);

FlavorTraits flavorTraits(const Flavor &flavor);

} // namespace ocidisk::boot
