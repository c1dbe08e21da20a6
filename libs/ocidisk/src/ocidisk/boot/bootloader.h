// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include "ocidisk/boot/boot_config.h"
#include "ocidisk/boot/chroot.h"
#include "ocidisk/boot/flavor.h"
#include "ocidisk/utils/cmd.h"
#include "ocidisk/utils/error/error.h"

#include <fmt/format.h>

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace ocidisk::boot {

enum class BootState {
    Unconfigured,
    ChrootReady,
    BootloaderInstalled,
    Configured,
};

std::string_view bootStateName(BootState state) noexcept;

// Turns a populated root filesystem into a bootable system. The steps must
// run in order: prepareChroot, installBootloader, configureSystem.
class BootloaderAdapter
{
public:
    BootloaderAdapter(std::filesystem::path root, Flavor flavor, utils::CmdFactory cmdFactory);
    BootloaderAdapter(const BootloaderAdapter &) = delete;
    BootloaderAdapter &operator=(const BootloaderAdapter &) = delete;
    virtual ~BootloaderAdapter() = default;

    utils::error::Result<void> prepareChroot() noexcept;

    // Installs kernel and GRUB, generates grub.cfg and the initramfs. The
    // detected kernel is stored in config.
    utils::error::Result<void> installBootloader(BootConfig &config,
                                                 const std::vector<std::string> &extraPackages) noexcept;

    // fstab, machine-id, hostname and hosts.
    utils::error::Result<void> configureSystem(const BootConfig &config) noexcept;

    [[nodiscard]] BootState state() const noexcept { return m_state; }

    // nullptr before prepareChroot
    [[nodiscard]] ChrootSession *session() const noexcept { return m_session.get(); }

    [[nodiscard]] const FlavorTraits &traits() const noexcept { return m_traits; }

protected:
    virtual utils::error::Result<std::unique_ptr<ChrootSession>> openChroot() noexcept;

    [[nodiscard]] const std::filesystem::path &root() const noexcept { return m_root; }

private:
    utils::error::Result<void> expectState(BootState expected) const noexcept;
    utils::error::Result<void> runInChroot(const std::vector<std::string> &args) noexcept;
    utils::error::Result<void> writeRootFile(const std::filesystem::path &relative,
                                             const std::string &content) noexcept;
    utils::error::Result<void> verifyBootFiles(BootConfig &config) noexcept;

    std::filesystem::path m_root;
    Flavor m_flavor;
    FlavorTraits m_traits;
    utils::CmdFactory m_cmdFactory;
    std::unique_ptr<ChrootSession> m_session;
    BootState m_state{ BootState::Unconfigured };
};

} // namespace ocidisk::boot

template <>
struct fmt::formatter<ocidisk::boot::BootState> : fmt::formatter<std::string_view>
{
    template <typename FormatContext>
    auto format(ocidisk::boot::BootState state, FormatContext &ctx) const
    {
        return fmt::formatter<std::string_view>::format(ocidisk::boot::bootStateName(state), ctx);
    }
};
