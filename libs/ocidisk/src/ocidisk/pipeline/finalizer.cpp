// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "ocidisk/pipeline/finalizer.h"

#include "ocidisk/utils/log/log.h"

#include <fmt/format.h>

#include <algorithm>

namespace ocidisk::pipeline {

using utils::error::ErrorCode;

std::string_view cleanupPhaseName(CleanupPhase phase) noexcept
{
    switch (phase) {
    case CleanupPhase::ChrootUnbind:
        return "unbind chroot mounts";
    case CleanupPhase::RestoreChrootFiles:
        return "restore chroot files";
    case CleanupPhase::UnmountEsp:
        return "unmount ESP";
    case CleanupPhase::UnmountRoot:
        return "unmount root";
    case CleanupPhase::DetachLoop:
        return "detach loop device";
    case CleanupPhase::RemoveOutput:
        return "remove output";
    case CleanupPhase::ReleaseLock:
        return "release lock";
    case CleanupPhase::RemoveWorkDir:
        return "remove work directory";
    }
    return "unknown";
}

Finalizer::~Finalizer()
{
    if (m_steps.empty()) {
        return;
    }

    // run() logs every warning
    run();
}

void Finalizer::add(CleanupPhase phase, std::string description, Step step)
{
    m_steps.push_back(Entry{ phase, m_sequence++, std::move(description), std::move(step) });
}

std::vector<utils::error::Error> Finalizer::run() noexcept
{
    OCIDISK_TRACE("run cleanup");

    auto steps = std::move(m_steps);
    m_steps.clear();

    std::sort(steps.begin(), steps.end(), [](const Entry &a, const Entry &b) {
        if (a.phase != b.phase) {
            return a.phase < b.phase;
        }
        return a.sequence > b.sequence;
    });

    std::vector<utils::error::Error> warnings;
    for (auto &entry : steps) {
        LogD("cleanup: {} ({})", entry.description, cleanupPhaseName(entry.phase));
        auto ret = entry.step();
        if (ret) {
            continue;
        }

        auto warning = OCIDISK_ERR(entry.description, std::move(ret), ErrorCode::CleanupWarning);
        LogW("{}", warning.value());
        warnings.push_back(std::move(warning.value()));
    }

    return warnings;
}

} // namespace ocidisk::pipeline
