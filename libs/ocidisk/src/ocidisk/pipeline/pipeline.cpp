// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "ocidisk/pipeline/pipeline.h"

#include "ocidisk/boot/boot_config.h"
#include "ocidisk/boot/bootloader.h"
#include "ocidisk/common/error.h"
#include "ocidisk/disk/disk_image.h"
#include "ocidisk/disk/formatter.h"
#include "ocidisk/disk/gpt.h"
#include "ocidisk/disk/loop_device.h"
#include "ocidisk/image/layer_merger.h"
#include "ocidisk/image/materializer.h"
#include "ocidisk/pipeline/finalizer.h"
#include "ocidisk/rootfs/populator.h"
#include "ocidisk/utils/filelock.h"
#include "ocidisk/utils/global/initialize.h"
#include "ocidisk/utils/log/log.h"

#include <ftw.h>
#include <sys/stat.h>
#include <unistd.h>

namespace ocidisk::pipeline {

using utils::error::ErrorCode;

namespace {

constexpr int maxOpenDescriptors = 64;

int removeEntry(const char *path, const struct stat * /*st*/, int type, struct FTW * /*ftw*/)
{
    auto ret = type == FTW_DP ? ::rmdir(path) : ::unlink(path);
    return ret == 0 || errno == ENOENT ? 0 : -1;
}

// Like remove_all but never descends into another filesystem, so a mount
// left behind by a failed unmount is not emptied.
utils::error::Result<void> removeTree(const std::filesystem::path &path) noexcept
{
    OCIDISK_TRACE(fmt::format("remove {}", path.string()));

    if (::nftw(path.c_str(), removeEntry, maxOpenDescriptors, FTW_DEPTH | FTW_MOUNT | FTW_PHYS)
        != 0) {
        return OCIDISK_ERR(common::error::errorString(errno));
    }
    return OCIDISK_OK;
}

void enterStage(Stage &current, Stage next)
{
    current = next;
    utils::log::setLogScope(std::string{ stageName(next) });
    LogI("stage: {}", next);
}

} // namespace

struct Pipeline::RunState
{
    Stage stage{ Stage::Lock };
    bool failed{ false };
    // the output file may only be removed when this run made it what it is
    bool outputOwned{ false };
    std::filesystem::path workDir;

    std::optional<utils::filelock::FileLock> lock;
    std::optional<image::ContainerImage> image;
    std::optional<disk::DiskImage> disk;
    std::optional<disk::LoopDevice> loop;
    disk::FilesystemIds ids;
    std::optional<rootfs::MountedDisk> mounted;
    std::unique_ptr<boot::BootloaderAdapter> bootloader;

    // declared last, runs before the resources above are destroyed
    Finalizer finalizer;
};

std::string_view stageName(Stage stage) noexcept
{
    switch (stage) {
    case Stage::Lock:
        return "lock";
    case Stage::ImageExtractor:
        return "image extractor";
    case Stage::LayerMerger:
        return "layer merger";
    case Stage::DiskAllocator:
        return "disk allocator";
    case Stage::PartitionBuilder:
        return "partition builder";
    case Stage::LoopDeviceManager:
        return "loop device manager";
    case Stage::FilesystemFormatter:
        return "filesystem formatter";
    case Stage::RootPopulator:
        return "root populator";
    case Stage::BootloaderAdapter:
        return "bootloader adapter";
    case Stage::AccountConfigurator:
        return "account configurator";
    case Stage::Finalizer:
        return "finalizer";
    }
    return "unknown";
}

Pipeline::Pipeline(CreateOptions options,
                   utils::CmdFactory cmdFactory,
                   std::unique_ptr<image::ImageSource> imageSource)
    : m_options(std::move(options))
    , m_cmdFactory(std::move(cmdFactory))
    , m_imageSource(std::move(imageSource))
{
}

Pipeline::~Pipeline() = default;

PipelineReport Pipeline::run() noexcept
{
    PipelineReport report;
    RunState state;

    auto ret = runStages(state);
    if (!ret) {
        state.failed = true;
        report.failedStage = state.stage;
        LogE("{} failed: {}", state.stage, ret.error());
        report.error.emplace(std::move(ret.error()));
    }

    enterStage(state.stage, Stage::Finalizer);
    report.warnings = state.finalizer.run();
    utils::log::setLogScope({});

    if (report.ok()) {
        LogI("{} is ready", m_options.outputFile.string());
    }
    return report;
}

utils::error::Result<void> Pipeline::runStages(RunState &state) noexcept
{
    OCIDISK_TRACE("create disk image");

    auto check = [&state](Stage next) -> utils::error::Result<void> {
        OCIDISK_TRACE(fmt::format("start {}", next));
        if (utils::global::GlobalTaskControl::canceled()) {
            return OCIDISK_ERR("interrupted");
        }
        enterStage(state.stage, next);
        return OCIDISK_OK;
    };

    auto ret = check(Stage::Lock);
    if (!ret) {
        return OCIDISK_ERR(ret);
    }
    ret = acquireOutput(state);
    if (!ret) {
        return OCIDISK_ERR(ret);
    }

    ret = check(Stage::ImageExtractor);
    if (!ret) {
        return OCIDISK_ERR(ret);
    }
    ret = prepareRootFilesystem(state);
    if (!ret) {
        return OCIDISK_ERR(ret);
    }

    ret = check(Stage::DiskAllocator);
    if (!ret) {
        return OCIDISK_ERR(ret);
    }
    ret = prepareDisk(state);
    if (!ret) {
        return OCIDISK_ERR(ret);
    }

    ret = check(Stage::RootPopulator);
    if (!ret) {
        return OCIDISK_ERR(ret);
    }
    ret = configureRoot(state);
    if (!ret) {
        return OCIDISK_ERR(ret);
    }

    return OCIDISK_OK;
}

utils::error::Result<void> Pipeline::acquireOutput(RunState &state) noexcept
{
    const auto &output = m_options.outputFile;
    OCIDISK_TRACE(fmt::format("lock {}", output.string()));

    std::error_code ec;
    auto parent = output.has_parent_path() ? output.parent_path() : std::filesystem::path(".");
    if (!std::filesystem::is_directory(parent, ec)) {
        return OCIDISK_ERR(fmt::format("{} is not a directory", parent.string()),
                           ErrorCode::OutputPathUnwritable);
    }

    struct stat st{};
    bool existed = true;
    if (::lstat(output.c_str(), &st) != 0) {
        if (errno != ENOENT) {
            return OCIDISK_ERR(common::error::errorString(errno), ErrorCode::OutputPathUnwritable);
        }
        existed = false;
    } else if (!S_ISREG(st.st_mode)) {
        return OCIDISK_ERR(fmt::format("{} exists and is not a regular file", output.string()),
                           ErrorCode::OutputPathUnwritable);
    }

    auto lock = utils::filelock::FileLock::create(output);
    if (!lock) {
        return OCIDISK_ERR("open output", std::move(lock), ErrorCode::OutputPathUnwritable);
    }

    auto locked = lock->tryLock();
    if (!locked) {
        return OCIDISK_ERR("lock output", std::move(locked), ErrorCode::OutputPathUnwritable);
    }
    if (!*locked) {
        return OCIDISK_ERR(fmt::format("{} is in use by another ocidisk", output.string()),
                           ErrorCode::ResourceBusy);
    }

    state.lock.emplace(std::move(*lock));
    state.outputOwned = !existed;
    state.finalizer.add(CleanupPhase::ReleaseLock, "release output lock", [&state]() {
        return state.lock->unlock();
    });
    state.finalizer.add(CleanupPhase::RemoveOutput,
                        "remove incomplete output",
                        [&state, output]() -> utils::error::Result<void> {
                            OCIDISK_TRACE(fmt::format("remove {}", output.string()));
                            if (!state.failed || !state.outputOwned) {
                                return OCIDISK_OK;
                            }
                            if (::unlink(output.c_str()) != 0 && errno != ENOENT) {
                                return OCIDISK_ERR(common::error::errorString(errno));
                            }
                            LogI("removed incomplete {}", output.string());
                            return OCIDISK_OK;
                        });

    auto pattern = (m_options.config.workDir / "ocidisk-XXXXXX").string();
    if (::mkdtemp(pattern.data()) == nullptr) {
        return OCIDISK_ERR(fmt::format("create work directory below {}: {}",
                                       m_options.config.workDir.string(),
                                       common::error::errorString(errno)));
    }
    state.workDir = pattern;
    state.finalizer.add(CleanupPhase::RemoveWorkDir, "remove work directory", [&state]() {
        return removeTree(state.workDir);
    });

    LogI("locked {}, working in {}", output.string(), state.workDir.string());
    return OCIDISK_OK;
}

utils::error::Result<void> Pipeline::prepareRootFilesystem(RunState &state) noexcept
{
    OCIDISK_TRACE(fmt::format("prepare root filesystem of {}", m_options.imageName));

    auto ref = image::ImageReference::parse(m_options.imageName);
    if (!ref) {
        return OCIDISK_ERR(ref);
    }

    auto source = std::move(m_imageSource);
    if (!source) {
        source = image::makeImageSource(*ref, m_options.config.engine, m_cmdFactory);
    }

    auto fetched = source->fetch(*ref, state.workDir);
    if (!fetched) {
        return OCIDISK_ERR(fetched);
    }
    state.image.emplace(std::move(*fetched));

    enterStage(state.stage, Stage::LayerMerger);

    auto layers = image::readLayers(state.image->layers, m_options.config.parallelLayerReads);
    if (!layers) {
        return OCIDISK_ERR(layers);
    }

    auto tree = image::mergeLayers(*layers);
    if (!tree) {
        return OCIDISK_ERR(tree);
    }
    LogI("merged tree has {} entries", tree->size());

    auto ret = image::materialize(*tree, state.image->layers, state.workDir / "rootfs");
    if (!ret) {
        return OCIDISK_ERR(ret);
    }

    return OCIDISK_OK;
}

utils::error::Result<void> Pipeline::prepareDisk(RunState &state) noexcept
{
    OCIDISK_TRACE(fmt::format("prepare {}", m_options.outputFile.string()));

    // from here on the content of an existing output is lost anyway
    state.outputOwned = true;
    auto allocated = disk::allocateDiskImage(m_options.outputFile, m_options.diskSizeBytes);
    if (!allocated) {
        return OCIDISK_ERR(allocated);
    }
    state.disk = *allocated;

    enterStage(state.stage, Stage::PartitionBuilder);
    auto layout = disk::buildPartitionTable(*state.disk);
    if (!layout) {
        return OCIDISK_ERR(layout);
    }

    enterStage(state.stage, Stage::LoopDeviceManager);
    auto loop = disk::LoopDevice::attach(state.disk->path, m_cmdFactory);
    if (!loop) {
        return OCIDISK_ERR(loop);
    }
    state.loop.emplace(std::move(*loop));
    state.finalizer.add(CleanupPhase::DetachLoop, "detach loop device", [&state]() {
        return state.loop->release();
    });

    enterStage(state.stage, Stage::FilesystemFormatter);
    state.ids = disk::generateFilesystemIds();
    auto ret = disk::formatFilesystems(state.loop->partition(1),
                                       state.loop->partition(2),
                                       state.ids,
                                       m_cmdFactory);
    if (!ret) {
        return OCIDISK_ERR(ret);
    }

    return OCIDISK_OK;
}

utils::error::Result<void> Pipeline::configureRoot(RunState &state) noexcept
{
    OCIDISK_TRACE("configure root filesystem");

    const auto &config = m_options.config;

    auto mounted =
      rootfs::MountedDisk::mount(state.loop->partition(2), state.loop->partition(1), state.workDir / "mnt");
    if (!mounted) {
        return OCIDISK_ERR(mounted);
    }
    state.mounted.emplace(std::move(*mounted));
    state.finalizer.add(CleanupPhase::UnmountRoot, "unmount root filesystem", [&state]() {
        return state.mounted->releaseRoot();
    });
    state.finalizer.add(CleanupPhase::UnmountEsp, "unmount EFI system partition", [&state]() {
        return state.mounted->releaseEsp();
    });

    auto ret = rootfs::populate(state.workDir / "rootfs",
                                *state.mounted,
                                config.rootHeadroomMiB * disk::MiB);
    if (!ret) {
        return OCIDISK_ERR(ret);
    }

    enterStage(state.stage, Stage::BootloaderAdapter);
    state.bootloader = std::make_unique<boot::BootloaderAdapter>(state.mounted->root(),
                                                                 m_options.flavor,
                                                                 m_cmdFactory);
    ret = state.bootloader->prepareChroot();
    if (!ret) {
        return OCIDISK_ERR(ret);
    }
    state.finalizer.add(CleanupPhase::ChrootUnbind, "unbind chroot mounts", [&state]() {
        return state.bootloader->session()->releaseMounts();
    });
    state.finalizer.add(CleanupPhase::RestoreChrootFiles, "restore chroot files", [&state]() {
        return state.bootloader->session()->restoreFiles();
    });

    boot::BootConfig bootConfig;
    bootConfig.rootUuid = state.ids.rootUuid;
    bootConfig.espUuid = state.ids.espUuid();
    bootConfig.extraCmdline = config.kernelCmdline;
    bootConfig.machineId = boot::generateMachineId();
    bootConfig.hostname = config.hostname;
    bootConfig.loopDevice = state.loop->device();

    auto packages = config.extraPackages;
    packages.insert(packages.end(), m_options.extraPackages.begin(), m_options.extraPackages.end());

    ret = state.bootloader->installBootloader(bootConfig, packages);
    if (!ret) {
        return OCIDISK_ERR(ret);
    }
    ret = state.bootloader->configureSystem(bootConfig);
    if (!ret) {
        return OCIDISK_ERR(ret);
    }

    enterStage(state.stage, Stage::AccountConfigurator);
    auto scheme = account::parseHashScheme(config.passwordHash);
    if (!scheme) {
        return OCIDISK_ERR("password hash", std::move(scheme), ErrorCode::PasswordSetFailure);
    }
    ret = account::setRootPassword(state.mounted->root(), m_options.rootPassword, *scheme);
    if (!ret) {
        return OCIDISK_ERR(ret);
    }

    return OCIDISK_OK;
}

} // namespace ocidisk::pipeline
