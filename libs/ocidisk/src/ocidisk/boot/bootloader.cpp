// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "ocidisk/boot/bootloader.h"

#include "ocidisk/common/error.h"
#include "ocidisk/common/strings.h"
#include "ocidisk/utils/file.h"
#include "ocidisk/utils/log/log.h"

#include <fmt/format.h>

#include <sys/stat.h>

namespace ocidisk::boot {

using utils::error::ErrorCode;

namespace {

const std::filesystem::path grubDefaults{ "etc/default/grub" };
const std::filesystem::path deviceMap{ "boot/grub/device.map" };
const std::filesystem::path removableLoader{ "boot/efi/EFI/BOOT/BOOTX64.EFI" };

} // namespace

std::string_view bootStateName(BootState state) noexcept
{
    switch (state) {
    case BootState::Unconfigured:
        return "Unconfigured";
    case BootState::ChrootReady:
        return "ChrootReady";
    case BootState::BootloaderInstalled:
        return "BootloaderInstalled";
    case BootState::Configured:
        return "Configured";
    }
    return "Unknown";
}

BootloaderAdapter::BootloaderAdapter(std::filesystem::path root,
                                     Flavor flavor,
                                     utils::CmdFactory cmdFactory)
    : m_root(std::move(root))
    , m_flavor(flavor)
    , m_traits(flavorTraits(flavor))
    , m_cmdFactory(std::move(cmdFactory))
{
}

utils::error::Result<std::unique_ptr<ChrootSession>> BootloaderAdapter::openChroot() noexcept
{
    return ChrootSession::open(m_root);
}

utils::error::Result<void> BootloaderAdapter::expectState(BootState expected) const noexcept
{
    OCIDISK_TRACE("check boot state");

    if (m_state != expected) {
        return OCIDISK_ERR(fmt::format("step needs state {}, current state is {}", expected, m_state));
    }
    return OCIDISK_OK;
}

utils::error::Result<void> BootloaderAdapter::prepareChroot() noexcept
{
    OCIDISK_TRACE(fmt::format("prepare {} chroot", m_traits.name));

    auto ret = expectState(BootState::Unconfigured);
    if (!ret) {
        return OCIDISK_ERR(ret);
    }

    auto session = openChroot();
    if (!session) {
        return OCIDISK_ERR("chroot", std::move(session), ErrorCode::BootloaderInstallFailure);
    }

    m_session = std::move(*session);
    m_state = BootState::ChrootReady;
    return OCIDISK_OK;
}

utils::error::Result<void> BootloaderAdapter::runInChroot(const std::vector<std::string> &args) noexcept
{
    OCIDISK_TRACE(fmt::format("run {} in chroot", common::strings::join(args)));

    std::vector<std::string> chrootArgs{ m_root.string() };
    chrootArgs.insert(chrootArgs.end(), args.begin(), args.end());

    auto cmd = m_cmdFactory("chroot");
    cmd->setEnv("DEBIAN_FRONTEND", "noninteractive");
    cmd->setEnv("LC_ALL", "C");
    LogI("chroot: {}", common::strings::join(args));
    auto ret = cmd->exec(chrootArgs);
    if (!ret) {
        return OCIDISK_ERR(ret);
    }

    LogD("{}", *ret);
    return OCIDISK_OK;
}

utils::error::Result<void> BootloaderAdapter::writeRootFile(const std::filesystem::path &relative,
                                                            const std::string &content) noexcept
{
    OCIDISK_TRACE(fmt::format("write /{}", relative.string()));

    auto path = m_root / relative;
    auto ret = utils::ensureDirectory(path.parent_path());
    if (!ret) {
        return OCIDISK_ERR(ret);
    }

    ret = utils::writeFile(path, content);
    if (!ret) {
        return OCIDISK_ERR(ret);
    }
    if (::chmod(path.c_str(), 0644) != 0) {
        return OCIDISK_ERR(fmt::format("chmod: {}", common::error::errorString(errno)));
    }
    return OCIDISK_OK;
}

utils::error::Result<void> BootloaderAdapter::verifyBootFiles(BootConfig &config) noexcept
{
    OCIDISK_TRACE("verify boot files");

    auto kernel = findKernel(m_root, m_traits);
    if (!kernel) {
        return OCIDISK_ERR(kernel);
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(m_root / removableLoader, ec)) {
        return OCIDISK_ERR(fmt::format("/{} is missing", removableLoader.string()));
    }

    LogI("kernel {} with /{}", kernel->kernel.string(), kernel->initramfs.string());
    config.kernel = std::move(*kernel);
    return OCIDISK_OK;
}

utils::error::Result<void>
BootloaderAdapter::installBootloader(BootConfig &config,
                                     const std::vector<std::string> &extraPackages) noexcept
{
    OCIDISK_TRACE(fmt::format("install {} bootloader", m_traits.name));

    auto ret = expectState(BootState::ChrootReady);
    if (!ret) {
        return OCIDISK_ERR(ret);
    }

    auto fail = [this](const std::string &step, utils::error::Result<void> &&cause) {
        OCIDISK_TRACE(fmt::format("install {} bootloader", m_traits.name));
        return OCIDISK_ERR(step, std::move(cause), ErrorCode::BootloaderInstallFailure);
    };

    ret = runInChroot({ "apt-get", "update" });
    if (!ret) {
        return fail("apt-get update", std::move(ret));
    }

    std::vector<std::string> install{ "apt-get",
                                      "install",
                                      "-y",
                                      "--no-install-recommends",
                                      "-o",
                                      "Dpkg::Options::=--force-confold" };
    install.insert(install.end(), m_traits.packages.begin(), m_traits.packages.end());
    install.insert(install.end(), extraPackages.begin(), extraPackages.end());
    ret = runInChroot(install);
    if (!ret) {
        return fail("apt-get install", std::move(ret));
    }

    ret = writeRootFile(grubDefaults, renderGrubDefaults(m_traits, config));
    if (!ret) {
        return fail("grub defaults", std::move(ret));
    }

    // grub-install cannot probe a loop device by itself
    ret = writeRootFile(deviceMap, renderDeviceMap(config));
    if (!ret) {
        return fail("device map", std::move(ret));
    }
    auto removeDeviceMap = [this]() {
        std::error_code ec;
        std::filesystem::remove(m_root / deviceMap, ec);
        if (ec) {
            LogW("failed to remove /{}: {}", deviceMap.string(), ec.message());
        }
    };

    ret = runInChroot({ "grub-install",
                        "--target=x86_64-efi",
                        "--efi-directory=/boot/efi",
                        fmt::format("--bootloader-id={}", m_traits.bootloaderId),
                        "--removable",
                        "--no-nvram",
                        "--no-floppy" });
    if (!ret) {
        removeDeviceMap();
        return fail("grub-install", std::move(ret));
    }

    ret = runInChroot({ "grub-mkconfig", "-o", "/boot/grub/grub.cfg" });
    removeDeviceMap();
    if (!ret) {
        return fail("grub-mkconfig", std::move(ret));
    }

    ret = runInChroot({ "update-initramfs", "-u", "-k", "all" });
    if (!ret) {
        return fail("update-initramfs", std::move(ret));
    }

    ret = verifyBootFiles(config);
    if (!ret) {
        return fail("verify", std::move(ret));
    }

    m_state = BootState::BootloaderInstalled;
    return OCIDISK_OK;
}

utils::error::Result<void> BootloaderAdapter::configureSystem(const BootConfig &config) noexcept
{
    OCIDISK_TRACE("configure system files");

    auto ret = expectState(BootState::BootloaderInstalled);
    if (!ret) {
        return OCIDISK_ERR(ret);
    }

    const std::vector<std::pair<std::filesystem::path, std::string>> files{
        { "etc/fstab", renderFstab(config) },
        { "etc/machine-id", config.machineId + "\n" },
        { "etc/hostname", config.hostname + "\n" },
        { "etc/hosts", renderHosts(config) },
    };
    for (const auto &[relative, content] : files) {
        ret = writeRootFile(relative, content);
        if (!ret) {
            return OCIDISK_ERR(relative.string(), std::move(ret), ErrorCode::BootloaderInstallFailure);
        }
    }

    m_state = BootState::Configured;
    LogI("system configured, root UUID={}", config.rootUuid);
    return OCIDISK_OK;
}

} // namespace ocidisk::boot
