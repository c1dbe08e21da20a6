/*
 * SPDX-FileCopyrightText: 2023 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#include "cmd.h"

#include "ocidisk/common/error.h"
#include "ocidisk/common/strings.h"
#include "ocidisk/utils/global/initialize.h"
#include "ocidisk/utils/log/log.h"

#include <fmt/ranges.h>
#include <gsl/gsl>
#include <sys/epoll.h>

#include <algorithm>
#include <array>
#include <cstdlib>
#include <filesystem>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace ocidisk::utils {

namespace {

constexpr std::size_t maxDiagnosticSize = 4096;

void closeFd(int &fd) noexcept
{
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

bool setNonBlock(int fd) noexcept
{
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags != -1) {
        return fcntl(fd, F_SETFL, flags | O_NONBLOCK) != -1;
    }
    return false;
}

std::string tail(const std::string &text)
{
    auto trimmed = common::strings::trim(text);
    if (trimmed.size() <= maxDiagnosticSize) {
        return trimmed;
    }
    return "..." + trimmed.substr(trimmed.size() - maxDiagnosticSize);
}

} // namespace

Cmd::Cmd(std::string command) noexcept
    : m_command(std::move(command))
{
}

Cmd::~Cmd() = default;

bool Cmd::exists() noexcept
{
    return !getCommandPath().empty();
}

std::filesystem::path Cmd::getCommandPath()
{
    std::error_code ec;
    std::filesystem::path path{ m_command };
    if (path.is_absolute()) {
        if (std::filesystem::exists(path, ec)) {
            return path;
        }
        return {};
    }

    std::vector<std::string> pathDirs;
    const char *pathEnv = std::getenv("PATH");
    if (pathEnv != nullptr && pathEnv[0] != '\0') {
        pathDirs = common::strings::split(pathEnv, ':', common::strings::splitOption::SkipEmpty);
    }
    // tools like losetup and mkfs live in sbin, which sudo does not always keep in PATH
    for (const auto *dir : { "/usr/local/sbin", "/usr/local/bin", "/usr/sbin", "/usr/bin", "/sbin", "/bin" }) {
        pathDirs.emplace_back(dir);
    }

    for (const auto &pathDir : pathDirs) {
        std::filesystem::path fullPath = std::filesystem::path{ pathDir } / m_command;
        if (std::filesystem::exists(fullPath, ec)
            && std::filesystem::is_regular_file(fullPath, ec)) {
            return fullPath;
        }
    }

    return {};
}

utils::error::Result<std::string> Cmd::exec(const std::vector<std::string> &args) noexcept
{
    OCIDISK_TRACE(fmt::format("exec cmd: {} args: {}", m_command, fmt::join(args, " ")));

    auto canceled = [this]() {
        return !m_ignoreCancel && global::GlobalTaskControl::canceled();
    };
    if (canceled()) {
        return OCIDISK_ERR(fmt::format("{} not started: operation canceled", m_command));
    }

    auto commandPath = getCommandPath();
    if (commandPath.empty()) {
        return OCIDISK_ERR(fmt::format("command not found: {}", m_command));
    }

    std::array<int, 2> stdoutPipe{ -1, -1 };
    std::array<int, 2> stderrPipe{ -1, -1 };
    std::array<int, 2> stdinPipe{ -1, -1 };
    auto pipesCloser = gsl::finally([&stdoutPipe, &stderrPipe, &stdinPipe]() {
        for (auto *p : { &stdoutPipe, &stderrPipe, &stdinPipe }) {
            closeFd((*p)[0]);
            closeFd((*p)[1]);
        }
    });
    for (auto *p : { &stdoutPipe, &stderrPipe, &stdinPipe }) {
        if (pipe2(p->data(), O_CLOEXEC) == -1) {
            return OCIDISK_ERR(fmt::format("pipe error: {}", common::error::errorString(errno)));
        }
    }

    // Pre-allocate environment variables before fork to avoid memory allocation issues
    std::vector<std::string> envStrings;
    for (char **env = environ; *env != nullptr; ++env) {
        envStrings.emplace_back(*env);
    }

    auto matches = [](const std::string &env, const std::string &name) {
        return env.size() > name.size() && env.compare(0, name.size(), name) == 0
          && env[name.size()] == '=';
    };
    for (const auto &[name, value] : m_envs) {
        auto it = std::find_if(envStrings.begin(), envStrings.end(), [&](const std::string &env) {
            return matches(env, name);
        });
        if (value.empty()) {
            // empty value unsets the variable
            envStrings.erase(std::remove_if(envStrings.begin(),
                                            envStrings.end(),
                                            [&](const std::string &env) {
                                                return matches(env, name);
                                            }),
                             envStrings.end());
        } else if (it != envStrings.end()) {
            *it = name + "=" + value;
        } else {
            envStrings.push_back(name + "=" + value);
        }
    }

    std::vector<char *> envp;
    envp.reserve(envStrings.size() + 1);
    for (auto &env : envStrings) {
        envp.push_back(env.data());
    }
    envp.push_back(nullptr);

    auto filename = commandPath.filename().string();
    std::vector<std::string> argvStrings{ filename };
    argvStrings.insert(argvStrings.end(), args.begin(), args.end());
    std::vector<char *> argv;
    argv.reserve(argvStrings.size() + 1);
    for (auto &arg : argvStrings) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    LogD("execute {} with args [{}]", commandPath, fmt::join(args, ", "));

    pid_t pid = fork();
    if (pid == -1) {
        return OCIDISK_ERR(fmt::format("fork error: {}", common::error::errorString(errno)));
    }

    // child process
    if (pid == 0) {
        setpgid(0, 0);

        // restore the default dispositions installed by applicationInitialize
        for (int sig : { SIGTERM, SIGQUIT, SIGINT, SIGHUP }) {
            signal(sig, SIG_DFL);
        }

        if (dup2(stdoutPipe[1], STDOUT_FILENO) == -1 || dup2(stderrPipe[1], STDERR_FILENO) == -1
            || dup2(stdinPipe[0], STDIN_FILENO) == -1) {
            _exit(127);
        }

        execve(commandPath.c_str(), argv.data(), envp.data());

        const char msg[] = "execve failed\n";
        auto ignored = write(STDERR_FILENO, msg, sizeof(msg) - 1);
        (void)ignored;
        _exit(127);
    }

    // parent process
    setpgid(pid, pid);
    closeFd(stdoutPipe[1]);
    closeFd(stderrPipe[1]);
    closeFd(stdinPipe[0]);

    bool childReaped = false;
    auto killChild = gsl::finally([&childReaped, pid]() {
        if (childReaped) {
            return;
        }
        ::kill(-pid, SIGKILL);
        int status = 0;
        while (waitpid(pid, &status, 0) == -1 && errno == EINTR) { }
    });

    if (!setNonBlock(stdoutPipe[0]) || !setNonBlock(stderrPipe[0])) {
        return OCIDISK_ERR(
          fmt::format("set non block error: {}", common::error::errorString(errno)));
    }

    int epfd = epoll_create1(O_CLOEXEC);
    if (epfd == -1) {
        return OCIDISK_ERR(
          fmt::format("epoll_create error: {}", common::error::errorString(errno)));
    }
    auto epfdCloser = gsl::finally([&epfd]() {
        closeFd(epfd);
    });

    struct epoll_event ev{};
    int activeFds = 0;

    for (int fd : { stdoutPipe[0], stderrPipe[0] }) {
        ev.events = EPOLLIN;
        ev.data.fd = fd;
        if (epoll_ctl(epfd, EPOLL_CTL_ADD, fd, &ev) == -1) {
            return OCIDISK_ERR(
              fmt::format("epoll_ctl error: {}", common::error::errorString(errno)));
        }
        activeFds++;
    }

    // the child reads EOF from stdin
    closeFd(stdinPipe[1]);

    const bool bounded = m_timeout.count() > 0;
    const auto deadline = std::chrono::steady_clock::now() + m_timeout;

    std::string output;
    std::string errput;
    std::vector<char> buffer(4096);
    constexpr int MAX_EVENTS = 2;
    std::array<struct epoll_event, MAX_EVENTS> events{};

    while (activeFds > 0) {
        if (canceled()) {
            return OCIDISK_ERR(fmt::format("{} interrupted: operation canceled", m_command));
        }

        // wake up regularly so cancellation is noticed even without output
        int waitMs = 500;
        if (bounded) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
              deadline - std::chrono::steady_clock::now());
            if (left.count() <= 0) {
                return OCIDISK_ERR(
                  fmt::format("{} timed out after {}s", m_command, m_timeout.count()));
            }
            waitMs = static_cast<int>(std::min<long long>(waitMs, left.count()));
        }

        int nfds = epoll_wait(epfd, events.data(), MAX_EVENTS, waitMs);
        if (nfds == -1) {
            if (errno == EINTR) {
                continue;
            }
            return OCIDISK_ERR(
              fmt::format("epoll_wait error: {}", common::error::errorString(errno)));
        }

        for (int i = 0; i < nfds; ++i) {
            int fd = events[i].data.fd;
            if (fd == stdoutPipe[0] || fd == stderrPipe[0]) {
                auto &sink = fd == stdoutPipe[0] ? output : errput;
                while (true) {
                    ssize_t n = read(fd, buffer.data(), buffer.size());
                    if (n > 0) {
                        sink.append(buffer.data(), static_cast<size_t>(n));
                        continue;
                    }

                    if (n == -1 && errno == EINTR) {
                        continue;
                    }

                    if ((n == -1 && errno != EAGAIN && errno != EWOULDBLOCK) || n == 0) {
                        // error or EOF, stop monitoring this FD
                        epoll_ctl(epfd, EPOLL_CTL_DEL, fd, nullptr);
                        activeFds--;
                    }
                    break;
                }
            }
        }
    }

    // the pipes are closed, the child is exiting or has detached its output
    int status = 0;
    while (true) {
        auto ret = waitpid(pid, &status, WNOHANG);
        if (ret == pid) {
            childReaped = true;
            break;
        }
        if (ret == -1 && errno != EINTR) {
            childReaped = true;
            return OCIDISK_ERR(
              fmt::format("waitpid error: {}", common::error::errorString(errno)));
        }
        if (canceled()) {
            return OCIDISK_ERR(fmt::format("{} interrupted: operation canceled", m_command));
        }
        if (bounded && std::chrono::steady_clock::now() >= deadline) {
            return OCIDISK_ERR(
              fmt::format("{} timed out after {}s", m_command, m_timeout.count()));
        }
        usleep(10 * 1000);
    }

    if (!errput.empty()) {
        LogD("{} stderr: {}", m_command, tail(errput));
    }

    if (WIFEXITED(status)) {
        int exitCode = WEXITSTATUS(status);
        if (exitCode == 0) {
            return output;
        }
        return OCIDISK_ERR(fmt::format("{} failed with exit code {}: {}",
                                       m_command,
                                       exitCode,
                                       tail(errput.empty() ? output : errput)));
    }

    if (WIFSIGNALED(status)) {
        return OCIDISK_ERR(fmt::format("{} killed by signal: {}", m_command, WTERMSIG(status)));
    }

    return OCIDISK_ERR(fmt::format("{} exited abnormally", m_command));
}

Cmd &Cmd::setEnv(const std::string &name, const std::string &value) noexcept
{
    // Store the environment variable (empty value means unset)
    m_envs[name] = value;
    return *this;
}

Cmd &Cmd::ignoreCancel(bool ignore) noexcept
{
    m_ignoreCancel = ignore;
    return *this;
}

Cmd &Cmd::setTimeout(std::chrono::seconds timeout) noexcept
{
    m_timeout = timeout;
    return *this;
}

CmdFactory defaultCmdFactory(std::chrono::seconds timeout)
{
    return [timeout](const std::string &command) {
        auto cmd = std::make_shared<Cmd>(command);
        cmd->setTimeout(timeout);
        return cmd;
    };
}

} // namespace ocidisk::utils
