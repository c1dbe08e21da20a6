/*
 * SPDX-FileCopyrightText: 2023 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#pragma once

#include "ocidisk/utils/error/error.h"

#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace ocidisk::utils {

// Executes a command from the standard system PATH
// blocking until the child process exits, and the stdout of the child process is returned.
// The child runs in its own process group; on timeout or cancellation the whole
// group is killed and an error is returned. Commands marked with ignoreCancel()
// still run once the operation is canceled, only the timeout stops them.
class Cmd
{
public:
    explicit Cmd(std::string command) noexcept;
    virtual ~Cmd();

    virtual bool exists() noexcept;
    virtual utils::error::Result<std::string>
    exec(const std::vector<std::string> &args = {}) noexcept;
    virtual Cmd &setEnv(const std::string &name, const std::string &value) noexcept;
    // teardown commands must run even after the operation was canceled
    virtual Cmd &ignoreCancel(bool ignore = true) noexcept;
    // zero means no limit
    virtual Cmd &setTimeout(std::chrono::seconds timeout) noexcept;

    [[nodiscard]] const std::string &command() const noexcept { return m_command; }

private:
    std::filesystem::path getCommandPath();

    std::string m_command;
    std::map<std::string, std::string> m_envs;
    std::chrono::seconds m_timeout{ 0 };
    bool m_ignoreCancel{ false };
};

// Creates the command objects a component runs, so tests can hand out mocks.
using CmdFactory = std::function<std::shared_ptr<Cmd>(const std::string &command)>;

// Real commands with the given timeout, zero means no limit.
CmdFactory defaultCmdFactory(std::chrono::seconds timeout = std::chrono::seconds{ 0 });

} // namespace ocidisk::utils
