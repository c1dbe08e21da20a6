// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "ocidisk/boot/flavor.h"

#include <fmt/format.h>

#include <type_traits>

namespace ocidisk::boot {

namespace {

const std::vector<std::string> &bootPackages()
{
    static const std::vector<std::string> packages{
        "systemd-sysv",
        "grub2-common",
        "grub-efi-amd64-bin",
        "initramfs-tools",
    };
    return packages;
}

template <typename T>
FlavorTraits makeTraits()
{
    FlavorTraits traits;
    traits.name = std::string{ T::name };
    traits.kernelPackage = std::string{ T::kernelPackage };
    traits.packages.push_back(traits.kernelPackage);
    traits.packages.insert(traits.packages.end(), bootPackages().begin(), bootPackages().end());
    traits.bootloaderId = traits.name;
    traits.kernelCmdline = std::string{ T::kernelCmdline };
    return traits;
}

} // namespace

utils::error::Result<Flavor> parseFlavor(std::string_view name) noexcept
{
    OCIDISK_TRACE(fmt::format("parse flavor {}", name));

    if (name == Debian::name) {
        return Debian{};
    }
    if (name == Ubuntu::name) {
        return Ubuntu{};
    }
    return OCIDISK_ERR(fmt::format("unknown flavor, expected {} or {}", Debian::name, Ubuntu::name));
}

std::string flavorName(const Flavor &flavor)
{
    return std::visit(
      [](const auto &value) {
          return std::string{ std::decay_t<decltype(value)>::name };
      },
      flavor);
}

FlavorTraits flavorTraits(const Flavor &flavor)
{
    return std::visit(
      [](const auto &value) {
          using T = std::decay_t<decltype(value)>;
          auto traits = makeTraits<T>();
          if constexpr (std::is_same_v<T, Ubuntu>) {
              // recordfail would otherwise keep an unattended boot in the menu
              traits.grubDefaults.emplace_back("GRUB_TIMEOUT_STYLE", "menu");
              traits.grubDefaults.emplace_back("GRUB_RECORDFAIL_TIMEOUT", "5");
          }
          return traits;
      },
      flavor);
}

} // namespace ocidisk::boot
