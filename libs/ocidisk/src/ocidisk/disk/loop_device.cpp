// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "ocidisk/disk/loop_device.h"

#include "ocidisk/common/strings.h"
#include "ocidisk/utils/global/initialize.h"
#include "ocidisk/utils/log/log.h"

#include <fmt/format.h>

#include <thread>

namespace ocidisk::disk {

using utils::error::ErrorCode;

namespace {

constexpr auto pollInterval = std::chrono::milliseconds{ 100 };

bool isBlockDevice(const std::string &path) noexcept
{
    std::error_code ec;
    return std::filesystem::is_block_file(path, ec);
}

} // namespace

LoopDevice::LoopDevice(std::string device, utils::CmdFactory cmdFactory) noexcept
    : m_device(std::move(device))
    , m_cmdFactory(std::move(cmdFactory))
    , m_attached(true)
{
}

LoopDevice::LoopDevice(LoopDevice &&other) noexcept
    : m_device(std::move(other.m_device))
    , m_cmdFactory(std::move(other.m_cmdFactory))
    , m_attached(other.m_attached)
{
    other.m_attached = false;
}

LoopDevice &LoopDevice::operator=(LoopDevice &&other) noexcept
{
    if (this == &other) {
        return *this;
    }

    if (m_attached) {
        auto ret = release();
        if (!ret) {
            LogW("failed to detach {}: {}", m_device, ret.error());
        }
    }

    m_device = std::move(other.m_device);
    m_cmdFactory = std::move(other.m_cmdFactory);
    m_attached = other.m_attached;
    other.m_attached = false;
    return *this;
}

LoopDevice::~LoopDevice()
{
    if (!m_attached) {
        return;
    }

    auto ret = release();
    if (!ret) {
        LogW("failed to detach {}: {}", m_device, ret.error());
    }
}

utils::error::Result<LoopDevice> LoopDevice::attach(const std::filesystem::path &backingFile,
                                                    utils::CmdFactory cmdFactory,
                                                    std::chrono::milliseconds partitionWait) noexcept
{
    OCIDISK_TRACE(fmt::format("attach {} to a loop device", backingFile.string()));

    auto output =
      cmdFactory("losetup")->exec({ "--find", "--show", "--partscan", backingFile.string() });
    if (!output) {
        return OCIDISK_ERR("losetup", std::move(output), ErrorCode::LoopAttachFailure);
    }

    auto device = common::strings::trim(*output);
    if (!common::strings::starts_with(device, "/dev/")) {
        return OCIDISK_ERR(fmt::format("unexpected losetup output: {}", *output),
                           ErrorCode::LoopAttachFailure);
    }

    LoopDevice loop(device, std::move(cmdFactory));
    LogI("attached {} to {}", backingFile.string(), loop.device());

    // udev creates the partition nodes asynchronously
    auto deadline = std::chrono::steady_clock::now() + partitionWait;
    while (true) {
        if (isBlockDevice(loop.partition(1)) && isBlockDevice(loop.partition(2))) {
            return loop;
        }

        if (utils::global::GlobalTaskControl::canceled()) {
            return OCIDISK_ERR("canceled while waiting for partitions",
                               ErrorCode::LoopAttachFailure);
        }

        if (std::chrono::steady_clock::now() >= deadline) {
            break;
        }
        std::this_thread::sleep_for(pollInterval);
    }

    // loop goes out of scope and is detached
    return OCIDISK_ERR(fmt::format("partition nodes of {} did not appear", loop.device()),
                       ErrorCode::LoopAttachFailure);
}

utils::error::Result<void> LoopDevice::release() noexcept
{
    OCIDISK_TRACE(fmt::format("detach {}", m_device));

    if (!m_attached) {
        return OCIDISK_OK;
    }
    // a failed detach is not retried, the device may have been taken over
    m_attached = false;

    // runs during cleanup, also after the operation was canceled
    auto cmd = m_cmdFactory("losetup");
    cmd->ignoreCancel();
    auto ret = cmd->exec({ "--detach", m_device });
    if (!ret) {
        return OCIDISK_ERR(ret);
    }

    LogD("detached {}", m_device);
    return OCIDISK_OK;
}

std::string LoopDevice::partition(unsigned int number) const
{
    return fmt::format("{}p{}", m_device, number);
}

} // namespace ocidisk::disk
