// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include "ocidisk/disk/disk_image.h"
#include "ocidisk/utils/error/error.h"

#include <array>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace ocidisk::disk {

constexpr uint64_t sectorSize = 512;
// partitions start and end on 1 MiB boundaries
constexpr uint64_t alignmentSectors = MiB / sectorSize;
constexpr uint64_t firstUsableLba = alignmentSectors;
constexpr uint32_t partitionEntryCount = 128;
constexpr uint32_t partitionEntrySize = 128;
constexpr uint64_t entryArraySectors = partitionEntryCount * partitionEntrySize / sectorSize;
constexpr uint64_t espSizeBytes = 256 * MiB;

// A GUID in the mixed-endian byte order GPT stores on disk.
class Guid
{
public:
    Guid() = default;

    // Parses the canonical text form, e.g. C12A7328-F81F-11D2-BA4B-00A0C93EC93B.
    static utils::error::Result<Guid> fromString(std::string_view text) noexcept;
    static Guid fromBytes(const uint8_t *bytes) noexcept;
    static Guid random() noexcept;

    [[nodiscard]] std::string toString() const;

    [[nodiscard]] bool isNull() const noexcept;

    [[nodiscard]] const std::array<uint8_t, 16> &bytes() const noexcept { return m_bytes; }

    bool operator==(const Guid &other) const noexcept { return m_bytes == other.m_bytes; }

    bool operator!=(const Guid &other) const noexcept { return m_bytes != other.m_bytes; }

private:
    std::array<uint8_t, 16> m_bytes{};
};

const Guid &espPartitionType() noexcept;
const Guid &linuxFilesystemPartitionType() noexcept;

constexpr uint64_t requiredPartitionAttribute = 1ULL << 0U;

struct GptPartition
{
    Guid type;
    Guid unique;
    uint64_t firstLba{ 0 };
    uint64_t lastLba{ 0 };
    uint64_t attributes{ 0 };
    std::string name;

    [[nodiscard]] uint64_t sizeBytes() const noexcept
    {
        return (lastLba - firstLba + 1) * sectorSize;
    }
};

struct PartitionLayout
{
    uint64_t totalSectors{ 0 };
    Guid diskGuid;
    uint64_t firstUsableLba{ 0 };
    uint64_t lastUsableLba{ 0 };
    // 1 is the ESP, 2 the root filesystem
    std::vector<GptPartition> partitions;
};

// Smallest disk that holds both GPT copies, the ESP and one sector of root.
uint64_t minimumDiskBytes() noexcept;

// Computes the ESP + root layout for a disk, fresh GUIDs included.
utils::error::Result<PartitionLayout> planPartitions(uint64_t diskBytes) noexcept;

// Writes protective MBR, primary and backup GPT.
utils::error::Result<void> writePartitionTable(const std::filesystem::path &path,
                                               const PartitionLayout &layout) noexcept;

// planPartitions + writePartitionTable + readPartitionTable as a check.
utils::error::Result<PartitionLayout> buildPartitionTable(const DiskImage &disk) noexcept;

// Reads and validates MBR, both headers and the entry array checksums.
utils::error::Result<PartitionLayout> readPartitionTable(const std::filesystem::path &path) noexcept;

} // namespace ocidisk::disk
