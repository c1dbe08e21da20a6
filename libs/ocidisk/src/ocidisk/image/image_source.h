// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include "ocidisk/image/layer_archive.h"
#include "ocidisk/image/reference.h"
#include "ocidisk/utils/cmd.h"
#include "ocidisk/utils/error/error.h"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace ocidisk::image {

struct ContainerImage
{
    ImageReference reference;
    // lowest layer first
    std::vector<LayerArchive> layers;
    std::vector<std::string> diffIds;
};

// Produces the layer archives of an image below a work directory.
class ImageSource
{
public:
    ImageSource() = default;
    ImageSource(const ImageSource &) = delete;
    ImageSource &operator=(const ImageSource &) = delete;
    virtual ~ImageSource() = default;

    virtual utils::error::Result<ContainerImage> fetch(const ImageReference &ref,
                                                       const std::filesystem::path &workDir) = 0;
};

// Asks docker or podman for the image, pulling it when it is not present,
// and reads the archive written by `<engine> save`.
class EngineImageSource : public ImageSource
{
public:
    EngineImageSource(std::string engine, utils::CmdFactory cmdFactory);

    utils::error::Result<ContainerImage> fetch(const ImageReference &ref,
                                               const std::filesystem::path &workDir) override;

private:
    std::string m_engine;
    utils::CmdFactory m_cmdFactory;
};

// Reads a docker-archive tarball directly.
class ArchiveImageSource : public ImageSource
{
public:
    utils::error::Result<ContainerImage> fetch(const ImageReference &ref,
                                               const std::filesystem::path &workDir) override;
};

// Unpacks a saved image below workDir/image, parses manifest.json and checks
// every layer digest against its blob name or the config's diff_ids.
utils::error::Result<ContainerImage> loadSavedImage(const ImageReference &ref,
                                                    const std::filesystem::path &tarball,
                                                    const std::filesystem::path &workDir) noexcept;

std::unique_ptr<ImageSource> makeImageSource(const ImageReference &ref,
                                             const std::string &engine,
                                             utils::CmdFactory cmdFactory);

} // namespace ocidisk::image
