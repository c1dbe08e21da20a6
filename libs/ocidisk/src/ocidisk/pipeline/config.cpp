// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "ocidisk/pipeline/config.h"

#include "ocidisk/account/shadow.h"
#include "ocidisk/boot/boot_config.h"
#include "ocidisk/utils/log/log.h"
#include "ocidisk/utils/serialize/yaml.h"

#include <fmt/format.h>

namespace ocidisk::pipeline {

utils::error::Result<void> validateConfig(const Config &config) noexcept
{
    OCIDISK_TRACE("validate configuration");

    if (config.version != configVersion) {
        return OCIDISK_ERR(fmt::format("unsupported configuration version {}", config.version));
    }

    if (config.engine != "docker" && config.engine != "podman") {
        return OCIDISK_ERR(fmt::format("unknown engine {}, expected docker or podman", config.engine));
    }

    if (config.workDir.empty() || !config.workDir.is_absolute()) {
        return OCIDISK_ERR("workDir must be an absolute path");
    }

    if (config.commandTimeout.count() < 0) {
        return OCIDISK_ERR("commandTimeoutSeconds must not be negative");
    }

    auto hostname = boot::validateHostname(config.hostname);
    if (!hostname) {
        return OCIDISK_ERR("hostname", std::move(hostname));
    }

    auto scheme = account::parseHashScheme(config.passwordHash);
    if (!scheme) {
        return OCIDISK_ERR("passwordHash", std::move(scheme));
    }

    return OCIDISK_OK;
}

utils::error::Result<Config> loadConfig(const std::optional<std::filesystem::path> &path) noexcept
{
    OCIDISK_TRACE("load configuration");

    auto file = path.value_or(defaultConfigPath);
    std::error_code ec;
    if (!path && !std::filesystem::exists(file, ec)) {
        LogD("{} not found, using defaults", file.string());
        Config config;
        return config;
    }

    auto config = utils::serialize::LoadYAMLFile<Config>(file);
    if (!config) {
        return OCIDISK_ERR(fmt::format("load {}", file.string()), std::move(config));
    }

    auto ret = validateConfig(*config);
    if (!ret) {
        return OCIDISK_ERR(fmt::format("invalid {}", file.string()), std::move(ret));
    }

    LogD("configuration loaded from {}", file.string());
    return config;
}

} // namespace ocidisk::pipeline

namespace YAML {

Node convert<ocidisk::pipeline::Config>::encode(const ocidisk::pipeline::Config &config)
{
    Node node;
    node["version"] = config.version;
    node["workDir"] = config.workDir.string();
    node["engine"] = config.engine;
    node["commandTimeoutSeconds"] = static_cast<int64_t>(config.commandTimeout.count());
    node["rootHeadroomMiB"] = config.rootHeadroomMiB;
    node["hostname"] = config.hostname;
    node["kernelCmdline"] = config.kernelCmdline;
    node["extraPackages"] = config.extraPackages;
    node["passwordHash"] = config.passwordHash;
    node["parallelLayerReads"] = config.parallelLayerReads;
    return node;
}

bool convert<ocidisk::pipeline::Config>::decode(const Node &node, ocidisk::pipeline::Config &config)
{
    // an empty document keeps the defaults
    if (node.IsNull()) {
        return true;
    }
    if (!node.IsMap()) {
        return false;
    }

    if (!node["version"]) {
        throw RepresentationException(node.Mark(), "missing version");
    }
    config.version = node["version"].as<int>();
    if (config.version != ocidisk::pipeline::configVersion) {
        throw RepresentationException(node["version"].Mark(),
                                      fmt::format("unsupported version {}", config.version));
    }

    if (node["workDir"]) {
        config.workDir = node["workDir"].as<std::string>();
    }
    if (node["engine"]) {
        config.engine = node["engine"].as<std::string>();
    }
    if (node["commandTimeoutSeconds"]) {
        config.commandTimeout = std::chrono::seconds{ node["commandTimeoutSeconds"].as<int64_t>() };
    }
    if (node["rootHeadroomMiB"]) {
        config.rootHeadroomMiB = node["rootHeadroomMiB"].as<uint64_t>();
    }
    if (node["hostname"]) {
        config.hostname = node["hostname"].as<std::string>();
    }
    if (node["kernelCmdline"]) {
        config.kernelCmdline = node["kernelCmdline"].as<std::string>();
    }
    if (node["extraPackages"]) {
        config.extraPackages = node["extraPackages"].as<std::vector<std::string>>();
    }
    if (node["passwordHash"]) {
        config.passwordHash = node["passwordHash"].as<std::string>();
    }
    if (node["parallelLayerReads"]) {
        config.parallelLayerReads = node["parallelLayerReads"].as<bool>();
    }

    return true;
}

} // namespace YAML
