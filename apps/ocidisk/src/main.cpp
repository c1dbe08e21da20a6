// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "configure.h"
#include "ocidisk/account/shadow.h"
#include "ocidisk/boot/flavor.h"
#include "ocidisk/common/strings.h"
#include "ocidisk/disk/disk_image.h"
#include "ocidisk/disk/gpt.h"
#include "ocidisk/pipeline/config.h"
#include "ocidisk/pipeline/pipeline.h"
#include "ocidisk/utils/cmd.h"
#include "ocidisk/utils/error/error.h"
#include "ocidisk/utils/global/initialize.h"
#include "ocidisk/utils/log/log.h"

#include <CLI/CLI.hpp>
#include <fmt/format.h>

#include <cstring>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <unistd.h>

namespace {

using ocidisk::utils::error::Error;
using ocidisk::utils::error::ErrorCode;

constexpr auto passwordOption = "--root-passwd";

struct CreateCommandOptions
{
    std::string imageName;
    std::string outputFile;
    uint64_t diskSizeGiB{ 0 };
    std::string rootPassword;
    std::string flavor;
    std::vector<std::string> extraPackages;
    std::string configFile;
    std::string workDir;
};

std::string validateNonEmptyString(const std::string &parameter)
{
    if (parameter.empty()) {
        return "must not be empty";
    }
    return {};
}

int reportFailure(std::string_view stage, const Error &error)
{
    fmt::print(stderr,
               "ocidisk: {} failed [{}]: {}\n",
               stage,
               ocidisk::utils::error::categoryName(error.code()),
               error.message());
    return ocidisk::utils::error::exitStatus(error.code());
}

// Hides the password from /proc/<pid>/cmdline once it has been parsed.
void scrubPassword(int argc, char **argv)
{
    const auto optionLength = std::strlen(passwordOption);
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], passwordOption) == 0 && i + 1 < argc) {
            ::explicit_bzero(argv[i + 1], std::strlen(argv[i + 1]));
            ++i;
            continue;
        }
        if (std::strncmp(argv[i], passwordOption, optionLength) == 0
            && argv[i][optionLength] == '=') {
            auto *value = argv[i] + optionLength + 1;
            ::explicit_bzero(value, std::strlen(value));
        }
    }
}

int handleCreate(CreateCommandOptions &options)
{
    LogD("create {} from {}", options.outputFile, options.imageName);

    if (::geteuid() != 0) {
        ocidisk::account::wipeString(options.rootPassword);
        fmt::print(stderr, "ocidisk: create failed [Failed]: must be run as root\n");
        return ocidisk::utils::error::exitStatus(static_cast<int>(ErrorCode::Failed));
    }

    ocidisk::pipeline::CreateOptions createOptions;
    // taken first so every early return wipes it
    createOptions.rootPassword = ocidisk::account::Secret(options.rootPassword);

    std::optional<std::filesystem::path> configFile;
    if (!options.configFile.empty()) {
        configFile = options.configFile;
    }
    auto config = ocidisk::pipeline::loadConfig(configFile);
    if (!config) {
        return reportFailure("configuration", config.error());
    }
    if (!options.workDir.empty()) {
        config->workDir = std::filesystem::absolute(options.workDir);
    }
    auto valid = ocidisk::pipeline::validateConfig(*config);
    if (!valid) {
        return reportFailure("configuration", valid.error());
    }

    auto flavor = ocidisk::boot::parseFlavor(options.flavor);
    if (!flavor) {
        return reportFailure("configuration", flavor.error());
    }

    createOptions.imageName = options.imageName;
    createOptions.outputFile = std::filesystem::absolute(options.outputFile);
    createOptions.diskSizeBytes = options.diskSizeGiB * ocidisk::disk::GiB;
    createOptions.flavor = *flavor;
    createOptions.extraPackages = options.extraPackages;
    createOptions.config = std::move(*config);

    if (createOptions.diskSizeBytes < ocidisk::disk::minimumDiskBytes()) {
        fmt::print(stderr,
                   "ocidisk: configuration failed [PartitionTableWriteFailure]: disk size "
                   "must be at least {} bytes\n",
                   ocidisk::disk::minimumDiskBytes());
        return ocidisk::utils::error::exitStatus(
          static_cast<int>(ErrorCode::PartitionTableWriteFailure));
    }

    auto cmdFactory = ocidisk::utils::defaultCmdFactory(createOptions.config.commandTimeout);
    ocidisk::pipeline::Pipeline pipeline(std::move(createOptions), std::move(cmdFactory));
    auto report = pipeline.run();

    int status = 0;
    if (!report.ok()) {
        status = reportFailure(ocidisk::pipeline::stageName(*report.failedStage), *report.error);
    }
    for (const auto &warning : report.warnings) {
        fmt::print(stderr,
                   "ocidisk: warning [{}]: {}\n",
                   ocidisk::utils::error::categoryName(warning.code()),
                   warning.message());
    }

    return status;
}

} // namespace

int main(int argc, char **argv)
{
    ocidisk::utils::global::applicationInitialize();

    CLI::App commandParser{ "ocidisk turns a container image into a UEFI bootable raw disk image" };
    commandParser.get_help_ptr()->description("Print this help message and exit");
    commandParser.require_subcommand(0, 1);

    CLI::Validator validatorString{ validateNonEmptyString, "" };

    bool versionFlag = false;
    commandParser.add_flag("--version", versionFlag, "Show version");

    CreateCommandOptions createOpts;
    auto *create = commandParser.add_subcommand("create", "Create a bootable disk image");
    create->add_option("--image-name",
                       createOpts.imageName,
                       "Container image, name[:tag][@digest] or docker-archive:<path>")
      ->required()
      ->check(validatorString);
    create->add_option("--output-file", createOpts.outputFile, "Raw disk image to write")
      ->required()
      ->check(validatorString);
    create->add_option("--disk-size", createOpts.diskSizeGiB, "Disk size in GiB")
      ->required()
      ->check(CLI::PositiveNumber);
    create->add_option(passwordOption, createOpts.rootPassword, "Password of the root account")
      ->required()
      ->check(validatorString);
    create->add_option("--flavor", createOpts.flavor, "Distribution flavor")
      ->required()
      ->check(CLI::IsMember({ "debian", "ubuntu" }));
    create
      ->add_option("--extra-packages",
                   createOpts.extraPackages,
                   "Additional packages to install, comma separated")
      ->delimiter(',');
    create->add_option("--config", createOpts.configFile, "Configuration file")
      ->check(CLI::ExistingFile);
    create->add_option("--work-dir", createOpts.workDir, "Directory for temporary files")
      ->check(CLI::ExistingDirectory);

    try {
        commandParser.parse(argc, argv);
    } catch (const CLI::ParseError &e) {
        scrubPassword(argc, argv);
        return commandParser.exit(e);
    }
    scrubPassword(argc, argv);

    if (versionFlag) {
        fmt::print("ocidisk {}\n", OCIDISK_VERSION);
        return 0;
    }

    if (create->parsed()) {
        return handleCreate(createOpts);
    }

    fmt::print("{}", commandParser.help());
    return 0;
}
