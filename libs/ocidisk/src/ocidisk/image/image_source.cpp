// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "ocidisk/image/image_source.h"

#include "ocidisk/common/error.h"
#include "ocidisk/common/strings.h"
#include "ocidisk/image/digest.h"
#include "ocidisk/image/manifest.h"
#include "ocidisk/utils/file.h"
#include "ocidisk/utils/log/log.h"
#include "ocidisk/utils/serialize/json.h"

#include <archive.h>
#include <archive_entry.h>
#include <fmt/format.h>
#include <gsl/gsl>

#include <fcntl.h>
#include <unistd.h>

namespace ocidisk::image {

using utils::error::ErrorCode;

namespace {

constexpr std::string_view blobPrefix = "blobs/sha256/";

std::string archiveError(struct archive *a)
{
    const char *msg = archive_error_string(a);
    return msg != nullptr ? msg : "unknown archive error";
}

bool isWithin(const std::filesystem::path &root, const std::filesystem::path &path)
{
    std::error_code ec;
    auto canonicalRoot = std::filesystem::weakly_canonical(root, ec);
    if (ec) {
        return false;
    }
    auto canonicalPath = std::filesystem::weakly_canonical(path, ec);
    if (ec) {
        return false;
    }

    auto rel = canonicalPath.lexically_relative(canonicalRoot);
    return !rel.empty() && *rel.begin() != "..";
}

// Directories, regular files and symlinks only; `docker save` links
// duplicated layers to their first copy.
utils::error::Result<void> unpackSavedImage(const std::filesystem::path &tarball,
                                            const std::filesystem::path &dest) noexcept
{
    OCIDISK_TRACE(fmt::format("unpack {}", tarball.string()));

    std::unique_ptr<struct archive, decltype(&archive_read_free)> reader{ archive_read_new(),
                                                                          &archive_read_free };
    if (!reader) {
        return OCIDISK_ERR("archive_read_new failed");
    }
    archive_read_support_filter_all(reader.get());
    archive_read_support_format_tar(reader.get());
    archive_read_support_format_gnutar(reader.get());

    if (archive_read_open_filename(reader.get(), tarball.c_str(), 64 * 1024) != ARCHIVE_OK) {
        return OCIDISK_ERR(archiveError(reader.get()), ErrorCode::LayerCorrupt);
    }

    auto ret = utils::ensureDirectory(dest);
    if (!ret) {
        return OCIDISK_ERR(ret);
    }

    std::vector<char> buffer(64 * 1024);
    struct archive_entry *ae = nullptr;
    while (true) {
        auto r = archive_read_next_header(reader.get(), &ae);
        if (r == ARCHIVE_EOF) {
            break;
        }
        if (r != ARCHIVE_OK && r != ARCHIVE_WARN) {
            return OCIDISK_ERR(archiveError(reader.get()), ErrorCode::LayerCorrupt);
        }

        const char *rawName = archive_entry_pathname(ae);
        if (rawName == nullptr) {
            return OCIDISK_ERR("record without path", ErrorCode::LayerCorrupt);
        }
        auto name = normalizeEntryPath(rawName);
        if (!name) {
            return OCIDISK_ERR(std::move(name));
        }
        if (name->empty()) {
            continue;
        }

        auto target = dest / *name;
        ret = utils::ensureDirectory(target.parent_path());
        if (!ret) {
            return OCIDISK_ERR(ret);
        }

        switch (archive_entry_filetype(ae)) {
        case AE_IFDIR:
            ret = utils::ensureDirectory(target);
            if (!ret) {
                return OCIDISK_ERR(ret);
            }
            break;
        case AE_IFLNK: {
            const char *linkTarget = archive_entry_symlink(ae);
            if (linkTarget == nullptr) {
                return OCIDISK_ERR(fmt::format("symlink {} has no target", *name),
                                   ErrorCode::LayerCorrupt);
            }
            std::error_code ec;
            std::filesystem::create_symlink(linkTarget, target, ec);
            if (ec) {
                return OCIDISK_ERR(fmt::format("symlink {}", *name), ec);
            }
            break;
        }
        case AE_IFREG: {
            int fd = ::open(target.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC | O_NOFOLLOW, 0600);
            if (fd < 0) {
                return OCIDISK_ERR(
                  fmt::format("create {}: {}", *name, common::error::errorString(errno)));
            }
            auto closer = gsl::finally([fd]() {
                ::close(fd);
            });

            while (true) {
                auto n = archive_read_data(reader.get(), buffer.data(), buffer.size());
                if (n == 0) {
                    break;
                }
                if (n < 0) {
                    return OCIDISK_ERR(fmt::format("read {}: {}",
                                                   *name,
                                                   archiveError(reader.get())),
                                       ErrorCode::LayerCorrupt);
                }
                std::size_t written = 0;
                while (written < static_cast<std::size_t>(n)) {
                    auto w = ::write(fd, buffer.data() + written, static_cast<std::size_t>(n) - written);
                    if (w < 0 && errno == EINTR) {
                        continue;
                    }
                    if (w < 0) {
                        int err = errno;
                        return OCIDISK_ERR(
                          fmt::format("write {}: {}", *name, common::error::errorString(err)),
                          err == ENOSPC || err == EDQUOT ? ErrorCode::InsufficientSpace
                                                         : ErrorCode::Failed);
                    }
                    written += static_cast<std::size_t>(w);
                }
            }
            break;
        }
        default:
            LogD("skip {} in saved image", *name);
            break;
        }
    }

    return OCIDISK_OK;
}

} // namespace

utils::error::Result<ContainerImage> loadSavedImage(const ImageReference &ref,
                                                    const std::filesystem::path &tarball,
                                                    const std::filesystem::path &workDir) noexcept
{
    OCIDISK_TRACE(fmt::format("load saved image {}", tarball.string()));

    std::error_code ec;
    if (!std::filesystem::is_regular_file(tarball, ec) || ::access(tarball.c_str(), R_OK) != 0) {
        return OCIDISK_ERR(fmt::format("{} is not a readable file", tarball.string()),
                           ErrorCode::ImageNotFound);
    }

    auto imageDir = workDir / "image";
    auto ret = unpackSavedImage(tarball, imageDir);
    if (!ret) {
        return OCIDISK_ERR(ret);
    }

    auto manifests =
      utils::serialize::LoadJSONFile<std::vector<SavedManifest>>(imageDir / "manifest.json");
    if (!manifests) {
        return OCIDISK_ERR("invalid manifest.json", std::move(manifests), ErrorCode::LayerCorrupt);
    }
    if (manifests->empty()) {
        return OCIDISK_ERR("manifest.json lists no image", ErrorCode::LayerCorrupt);
    }
    if (manifests->size() > 1) {
        LogW("{} images in archive, using the first one", manifests->size());
    }
    const auto &manifest = manifests->front();

    auto configPath = imageDir / manifest.config;
    if (!isWithin(imageDir, configPath)) {
        return OCIDISK_ERR(fmt::format("config {} outside of the archive", manifest.config),
                           ErrorCode::LayerCorrupt);
    }
    auto config = utils::serialize::LoadJSONFile<ImageConfig>(configPath);
    if (!config) {
        return OCIDISK_ERR("invalid image config", std::move(config), ErrorCode::LayerCorrupt);
    }

    const bool checkDiffIds = config->diffIds.size() == manifest.layers.size();
    if (!checkDiffIds && !config->diffIds.empty()) {
        LogW("config lists {} diff_ids for {} layers, diff_ids ignored",
             config->diffIds.size(),
             manifest.layers.size());
    }

    ContainerImage image;
    image.reference = ref;
    image.diffIds = config->diffIds;

    for (std::size_t i = 0; i < manifest.layers.size(); ++i) {
        const auto &name = manifest.layers[i];
        auto path = imageDir / name;
        if (!isWithin(imageDir, path) || !std::filesystem::is_regular_file(path, ec)) {
            return OCIDISK_ERR(fmt::format("layer {} is missing", name), ErrorCode::LayerCorrupt);
        }

        auto digest = sha256File(path);
        if (!digest) {
            return OCIDISK_ERR(fmt::format("layer {}", name), std::move(digest), ErrorCode::LayerCorrupt);
        }

        std::string expected;
        if (common::strings::starts_with(name, blobPrefix)) {
            expected = name.substr(blobPrefix.size());
        } else if (checkDiffIds) {
            expected = config->diffIds[i];
            if (common::strings::starts_with(expected, "sha256:")) {
                expected = expected.substr(7);
            }
        }

        if (!expected.empty() && expected != *digest) {
            return OCIDISK_ERR(
              fmt::format("layer {} digest mismatch: expected {}, got {}", name, expected, *digest),
              ErrorCode::LayerCorrupt);
        }

        auto resolved = std::filesystem::canonical(path, ec);
        if (ec) {
            return OCIDISK_ERR(fmt::format("resolve layer {}", name), ec);
        }

        LogD("layer {}: {} sha256:{}", i, name, *digest);
        image.layers.emplace_back(resolved, "sha256:" + *digest);
    }

    LogI("image {} has {} layers", ref.toString(), image.layers.size());
    return image;
}

EngineImageSource::EngineImageSource(std::string engine, utils::CmdFactory cmdFactory)
    : m_engine(std::move(engine))
    , m_cmdFactory(std::move(cmdFactory))
{
}

utils::error::Result<ContainerImage> EngineImageSource::fetch(const ImageReference &ref,
                                                              const std::filesystem::path &workDir)
{
    OCIDISK_TRACE(fmt::format("fetch {} with {}", ref.toString(), m_engine));

    auto inspect = m_cmdFactory(m_engine)->exec({ "image", "inspect", "--format", "{{.Id}}", ref.name });
    if (!inspect) {
        LogI("{} is not present locally, pulling", ref.name);
        auto pull = m_cmdFactory(m_engine)->exec({ "pull", ref.name });
        if (!pull) {
            return OCIDISK_ERR(fmt::format("{} could not be pulled", ref.name),
                               std::move(pull),
                               ErrorCode::ImageNotFound);
        }
    } else {
        LogD("{} is {}", ref.name, common::strings::trim(*inspect));
    }

    auto tarball = workDir / "image.tar";
    auto save = m_cmdFactory(m_engine)->exec({ "save", "-o", tarball.string(), ref.name });
    if (!save) {
        return OCIDISK_ERR(fmt::format("{} could not be exported", ref.name),
                           std::move(save),
                           ErrorCode::ImageNotFound);
    }

    return loadSavedImage(ref, tarball, workDir);
}

utils::error::Result<ContainerImage> ArchiveImageSource::fetch(const ImageReference &ref,
                                                               const std::filesystem::path &workDir)
{
    OCIDISK_TRACE(fmt::format("fetch {}", ref.toString()));

    if (ref.kind != ImageReference::Kind::DockerArchive) {
        return OCIDISK_ERR("not a docker-archive reference", ErrorCode::ImageNotFound);
    }

    return loadSavedImage(ref, ref.archivePath, workDir);
}

std::unique_ptr<ImageSource> makeImageSource(const ImageReference &ref,
                                             const std::string &engine,
                                             utils::CmdFactory cmdFactory)
{
    if (ref.kind == ImageReference::Kind::DockerArchive) {
        return std::make_unique<ArchiveImageSource>();
    }
    return std::make_unique<EngineImageSource>(engine, std::move(cmdFactory));
}

} // namespace ocidisk::image
