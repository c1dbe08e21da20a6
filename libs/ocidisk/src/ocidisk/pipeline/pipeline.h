// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include "ocidisk/account/shadow.h"
#include "ocidisk/boot/flavor.h"
#include "ocidisk/image/image_source.h"
#include "ocidisk/pipeline/config.h"
#include "ocidisk/utils/cmd.h"
#include "ocidisk/utils/error/error.h"

#include <fmt/format.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ocidisk::pipeline {

enum class Stage {
    Lock,
    ImageExtractor,
    LayerMerger,
    DiskAllocator,
    PartitionBuilder,
    LoopDeviceManager,
    FilesystemFormatter,
    RootPopulator,
    BootloaderAdapter,
    AccountConfigurator,
    Finalizer,
};

std::string_view stageName(Stage stage) noexcept;

struct CreateOptions
{
    std::string imageName;
    std::filesystem::path outputFile;
    uint64_t diskSizeBytes{ 0 };
    account::Secret rootPassword;
    boot::Flavor flavor;
    // installed after config.extraPackages
    std::vector<std::string> extraPackages;
    Config config;
};

struct PipelineReport
{
    std::optional<Stage> failedStage;
    std::optional<utils::error::Error> error;
    // CleanupWarning errors of the teardown
    std::vector<utils::error::Error> warnings;

    [[nodiscard]] bool ok() const noexcept { return !error.has_value(); }
};

// Runs all stages in order, stops at the first failure and always tears down
// what was set up, in reverse order.
class Pipeline
{
public:
    // imageSource replaces the one derived from the image name when set
    Pipeline(CreateOptions options,
             utils::CmdFactory cmdFactory,
             std::unique_ptr<image::ImageSource> imageSource = nullptr);
    Pipeline(const Pipeline &) = delete;
    Pipeline &operator=(const Pipeline &) = delete;
    ~Pipeline();

    PipelineReport run() noexcept;

private:
    struct RunState;

    utils::error::Result<void> runStages(RunState &state) noexcept;
    utils::error::Result<void> acquireOutput(RunState &state) noexcept;
    utils::error::Result<void> prepareRootFilesystem(RunState &state) noexcept;
    utils::error::Result<void> prepareDisk(RunState &state) noexcept;
    utils::error::Result<void> configureRoot(RunState &state) noexcept;

    CreateOptions m_options;
    utils::CmdFactory m_cmdFactory;
    std::unique_ptr<image::ImageSource> m_imageSource;
};

} // namespace ocidisk::pipeline

template <>
struct fmt::formatter<ocidisk::pipeline::Stage> : fmt::formatter<std::string_view>
{
    template <typename FormatContext>
    auto format(ocidisk::pipeline::Stage stage, FormatContext &ctx) const
    {
        return fmt::formatter<std::string_view>::format(ocidisk::pipeline::stageName(stage), ctx);
    }
};
