// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "ocidisk/boot/boot_config.h"

#include "ocidisk/common/strings.h"
#include "ocidisk/utils/log/log.h"

#include <fmt/format.h>
#include <uuid/uuid.h>

#include <cctype>
#include <cstring>
#include <optional>

namespace ocidisk::boot {

namespace {

constexpr std::size_t maxHostnameLength = 253;
constexpr std::size_t maxLabelLength = 63;

} // namespace

std::string generateMachineId() noexcept
{
    uuid_t id;
    uuid_generate_random(id);
    return common::strings::toHex(id, sizeof(id));
}

utils::error::Result<void> validateHostname(std::string_view hostname) noexcept
{
    OCIDISK_TRACE(fmt::format("validate host name {}", hostname));

    if (hostname.empty() || hostname.size() > maxHostnameLength) {
        return OCIDISK_ERR("host name must have 1 to 253 characters");
    }

    for (const auto &label : common::strings::split(hostname, '.')) {
        if (label.empty() || label.size() > maxLabelLength) {
            return OCIDISK_ERR("host name labels must have 1 to 63 characters");
        }
        if (label.front() == '-' || label.back() == '-') {
            return OCIDISK_ERR("host name labels must not start or end with '-'");
        }
        for (auto c : label) {
            auto uc = static_cast<unsigned char>(c);
            if (!std::islower(uc) && !std::isdigit(uc) && c != '-') {
                return OCIDISK_ERR(fmt::format("invalid character '{}' in host name", c));
            }
        }
    }

    return OCIDISK_OK;
}

std::string kernelCmdline(const FlavorTraits &traits, const BootConfig &config)
{
    auto extra = common::strings::trim(config.extraCmdline);
    if (extra.empty()) {
        return traits.kernelCmdline;
    }
    return fmt::format("{} {}", traits.kernelCmdline, extra);
}

std::string renderGrubDefaults(const FlavorTraits &traits, const BootConfig &config)
{
    std::string out = "# generated by ocidisk\n";
    out += "GRUB_DEFAULT=0\n";
    out += "GRUB_TIMEOUT=5\n";
    out += fmt::format("GRUB_DISTRIBUTOR=\"{}\"\n", traits.name);
    out += fmt::format("GRUB_DEVICE=\"UUID={}\"\n", config.rootUuid);
    out += "GRUB_TERMINAL=\"serial console\"\n";
    out += "GRUB_SERIAL_COMMAND=\"serial --speed=115200\"\n";
    out += fmt::format("GRUB_CMDLINE_LINUX_DEFAULT=\"{}\"\n", kernelCmdline(traits, config));
    out += "GRUB_CMDLINE_LINUX=\"\"\n";
    out += "GRUB_DISABLE_OS_PROBER=true\n";
    for (const auto &[key, value] : traits.grubDefaults) {
        out += fmt::format("{}={}\n", key, value);
    }
    return out;
}

std::string renderDeviceMap(const BootConfig &config)
{
    return fmt::format("(hd0) {}\n", config.loopDevice);
}

std::string renderFstab(const BootConfig &config)
{
    std::string out = "# <file system> <mount point> <type> <options> <dump> <pass>\n";
    out += fmt::format("UUID={} / ext4 defaults,errors=remount-ro 0 1\n", config.rootUuid);
    out += fmt::format("UUID={} /boot/efi vfat umask=0077 0 2\n", config.espUuid);
    return out;
}

std::string renderHosts(const BootConfig &config)
{
    std::string out = "127.0.0.1\tlocalhost\n";
    out += fmt::format("127.0.1.1\t{}\n", config.hostname);
    out += "::1\t\tlocalhost ip6-localhost ip6-loopback\n";
    out += "ff02::1\t\tip6-allnodes\n";
    out += "ff02::2\t\tip6-allrouters\n";
    return out;
}

utils::error::Result<KernelImage> findKernel(const std::filesystem::path &root,
                                             const FlavorTraits &traits) noexcept
{
    OCIDISK_TRACE(fmt::format("find kernel below {}", root.string()));

    const auto boot = root / "boot";
    std::error_code ec;
    std::filesystem::directory_iterator it(boot, ec);
    if (ec) {
        return OCIDISK_ERR("list boot directory", ec);
    }

    std::optional<KernelImage> newest;
    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (ec) {
            return OCIDISK_ERR("list boot directory", ec);
        }

        auto name = it->path().filename().string();
        if (!common::strings::starts_with(name, traits.kernelPrefix)) {
            continue;
        }
        auto version = name.substr(traits.kernelPrefix.size());
        if (version.empty()) {
            continue;
        }

        auto initramfs = traits.initramfsPrefix + version;
        if (!std::filesystem::exists(boot / initramfs, ec)) {
            LogD("kernel {} has no {}", name, initramfs);
            continue;
        }

        if (newest && ::strverscmp(newest->version.c_str(), version.c_str()) >= 0) {
            continue;
        }
        newest = KernelImage{ version,
                              std::filesystem::path("boot") / name,
                              std::filesystem::path("boot") / initramfs };
    }
    if (ec) {
        return OCIDISK_ERR("list boot directory", ec);
    }

    if (!newest) {
        return OCIDISK_ERR(fmt::format("no {}* with a matching {}* in /boot",
                                       traits.kernelPrefix,
                                       traits.initramfsPrefix));
    }
    return *newest;
}

} // namespace ocidisk::boot
