// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include "ocidisk/utils/cmd.h"
#include "ocidisk/utils/error/error.h"

#include <chrono>
#include <filesystem>
#include <string>

namespace ocidisk::disk {

// A loop device bound to a backing file with partition scanning enabled.
// Detached exactly once, by release() or by the destructor.
class LoopDevice
{
public:
    static utils::error::Result<LoopDevice>
    attach(const std::filesystem::path &backingFile,
           utils::CmdFactory cmdFactory,
           std::chrono::milliseconds partitionWait = std::chrono::seconds{ 10 }) noexcept;

    ~LoopDevice();

    LoopDevice(const LoopDevice &) = delete;
    LoopDevice &operator=(const LoopDevice &) = delete;
    LoopDevice(LoopDevice &&other) noexcept;
    LoopDevice &operator=(LoopDevice &&other) noexcept;

    utils::error::Result<void> release() noexcept;

    [[nodiscard]] const std::string &device() const noexcept { return m_device; }

    // /dev/loopNpM
    [[nodiscard]] std::string partition(unsigned int number) const;

    [[nodiscard]] bool attached() const noexcept { return m_attached; }

private:
    LoopDevice(std::string device, utils::CmdFactory cmdFactory) noexcept;

    std::string m_device;
    utils::CmdFactory m_cmdFactory;
    bool m_attached{ false };
};

} // namespace ocidisk::disk
