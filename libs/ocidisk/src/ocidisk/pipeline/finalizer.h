// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include "ocidisk/utils/error/error.h"

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace ocidisk::pipeline {

// Teardown order. Steps of one phase run newest first.
enum class CleanupPhase {
    ChrootUnbind,
    RestoreChrootFiles,
    UnmountEsp,
    UnmountRoot,
    DetachLoop,
    RemoveOutput,
    ReleaseLock,
    RemoveWorkDir,
};

std::string_view cleanupPhaseName(CleanupPhase phase) noexcept;

// Collects the undo steps of a run and executes all of them once, whatever
// happened before. A failing step becomes a CleanupWarning.
class Finalizer
{
public:
    using Step = std::function<utils::error::Result<void>()>;

    Finalizer() = default;
    Finalizer(const Finalizer &) = delete;
    Finalizer &operator=(const Finalizer &) = delete;
    ~Finalizer();

    void add(CleanupPhase phase, std::string description, Step step);

    // Returns the warnings of the failed steps.
    std::vector<utils::error::Error> run() noexcept;

    [[nodiscard]] std::size_t pending() const noexcept { return m_steps.size(); }

private:
    struct Entry
    {
        CleanupPhase phase;
        std::size_t sequence;
        std::string description;
        Step step;
    };

    std::vector<Entry> m_steps;
    std::size_t m_sequence{ 0 };
};

} // namespace ocidisk::pipeline
