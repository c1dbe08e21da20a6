// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "ocidisk/disk/gpt.h"

#include "ocidisk/common/error.h"
#include "ocidisk/utils/log/log.h"

#include <endian.h>
#include <fmt/format.h>
#include <gsl/gsl>
#include <uuid/uuid.h>
#include <zlib.h>

#include <algorithm>
#include <cstring>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace ocidisk::disk {

using utils::error::ErrorCode;

namespace {

constexpr std::array<uint8_t, 8> gptSignature{ 'E', 'F', 'I', ' ', 'P', 'A', 'R', 'T' };
constexpr uint32_t gptRevision = 0x00010000;
constexpr uint8_t protectiveMbrType = 0xEE;
// header, entries and the protective MBR
constexpr uint64_t primarySectors = 2 + entryArraySectors;
constexpr uint64_t backupSectors = 1 + entryArraySectors;

struct __attribute__((packed)) MbrPartition
{
    uint8_t status;
    uint8_t chsFirst[3];
    uint8_t type;
    uint8_t chsLast[3];
    uint32_t firstLba;
    uint32_t sectors;
};

static_assert(sizeof(MbrPartition) == 16);

struct __attribute__((packed)) MasterBootRecord
{
    uint8_t bootstrap[446];
    MbrPartition partitions[4];
    uint8_t signature[2];
};

static_assert(sizeof(MasterBootRecord) == sectorSize);

struct __attribute__((packed)) GptHeader
{
    uint8_t signature[8];
    uint32_t revision;
    uint32_t headerSize;
    uint32_t headerCrc32;
    uint32_t reserved;
    uint64_t currentLba;
    uint64_t backupLba;
    uint64_t firstUsableLba;
    uint64_t lastUsableLba;
    uint8_t diskGuid[16];
    uint64_t entriesLba;
    uint32_t entryCount;
    uint32_t entrySize;
    uint32_t entriesCrc32;
};

static_assert(sizeof(GptHeader) == 92);

struct __attribute__((packed)) GptEntry
{
    uint8_t typeGuid[16];
    uint8_t uniqueGuid[16];
    uint64_t firstLba;
    uint64_t lastLba;
    uint64_t attributes;
    uint16_t name[36]; // UTF-16LE
};

constexpr std::size_t nameLength = 36;

static_assert(sizeof(GptEntry) == partitionEntrySize);

// RFC 4122 order to the GPT order and back, the swap is its own inverse
void swapMixedEndian(uint8_t *bytes) noexcept
{
    std::reverse(bytes, bytes + 4);
    std::reverse(bytes + 4, bytes + 6);
    std::reverse(bytes + 6, bytes + 8);
}

uint32_t checksum(const void *data, std::size_t size) noexcept
{
    return static_cast<uint32_t>(
      crc32(0L, static_cast<const Bytef *>(data), static_cast<uInt>(size)));
}

uint32_t headerChecksum(GptHeader header) noexcept
{
    header.headerCrc32 = 0;
    return checksum(&header, sizeof(GptHeader));
}

GptHeader makeHeader(const PartitionLayout &layout,
                     uint64_t current,
                     uint64_t backup,
                     uint64_t entriesLba,
                     uint32_t entriesCrc) noexcept
{
    GptHeader header{};
    std::copy(gptSignature.begin(), gptSignature.end(), header.signature);
    header.revision = htole32(gptRevision);
    header.headerSize = htole32(sizeof(GptHeader));
    header.currentLba = htole64(current);
    header.backupLba = htole64(backup);
    header.firstUsableLba = htole64(layout.firstUsableLba);
    header.lastUsableLba = htole64(layout.lastUsableLba);
    std::copy(layout.diskGuid.bytes().begin(), layout.diskGuid.bytes().end(), header.diskGuid);
    header.entriesLba = htole64(entriesLba);
    header.entryCount = htole32(partitionEntryCount);
    header.entrySize = htole32(partitionEntrySize);
    header.entriesCrc32 = htole32(entriesCrc);
    header.headerCrc32 = htole32(headerChecksum(header));
    return header;
}

uint64_t alignDown(uint64_t lba) noexcept
{
    return lba / alignmentSectors * alignmentSectors;
}

utils::error::Result<void>
writeAll(int fd, const std::vector<uint8_t> &buffer, uint64_t offset) noexcept
{
    OCIDISK_TRACE(fmt::format("write {} bytes at {}", buffer.size(), offset));

    std::size_t written = 0;
    while (written < buffer.size()) {
        auto n = ::pwrite(fd,
                          buffer.data() + written,
                          buffer.size() - written,
                          static_cast<off_t>(offset + written));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return OCIDISK_ERR(common::error::errorString(errno));
        }
        written += static_cast<std::size_t>(n);
    }
    return OCIDISK_OK;
}

utils::error::Result<std::vector<uint8_t>>
readAll(int fd, std::size_t size, uint64_t offset) noexcept
{
    OCIDISK_TRACE(fmt::format("read {} bytes at {}", size, offset));

    std::vector<uint8_t> buffer(size);
    std::size_t done = 0;
    while (done < size) {
        auto n = ::pread(fd, buffer.data() + done, size - done, static_cast<off_t>(offset + done));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return OCIDISK_ERR(common::error::errorString(errno));
        }
        if (n == 0) {
            return OCIDISK_ERR("unexpected end of file");
        }
        done += static_cast<std::size_t>(n);
    }
    return buffer;
}

utils::error::Result<GptHeader> parseHeader(const uint8_t *sector, uint64_t expectedLba) noexcept
{
    OCIDISK_TRACE(fmt::format("parse GPT header at LBA {}", expectedLba));

    GptHeader header{};
    std::memcpy(&header, sector, sizeof(GptHeader));
    if (!std::equal(gptSignature.begin(), gptSignature.end(), header.signature)) {
        return OCIDISK_ERR("bad signature");
    }
    if (le32toh(header.headerSize) != sizeof(GptHeader)) {
        return OCIDISK_ERR(fmt::format("unexpected header size {}", le32toh(header.headerSize)));
    }
    if (headerChecksum(header) != le32toh(header.headerCrc32)) {
        return OCIDISK_ERR("header checksum mismatch");
    }
    if (le64toh(header.currentLba) != expectedLba) {
        return OCIDISK_ERR(fmt::format("header claims LBA {}", le64toh(header.currentLba)));
    }
    if (le32toh(header.entryCount) != partitionEntryCount
        || le32toh(header.entrySize) != partitionEntrySize) {
        return OCIDISK_ERR("unsupported partition entry array");
    }
    return header;
}

} // namespace

utils::error::Result<Guid> Guid::fromString(std::string_view text) noexcept
{
    OCIDISK_TRACE(fmt::format("parse GUID {}", text));

    std::string copy(text);
    uuid_t uu;
    if (uuid_parse(copy.c_str(), uu) != 0) {
        return OCIDISK_ERR("malformed GUID");
    }

    Guid guid;
    std::copy(std::begin(uu), std::end(uu), guid.m_bytes.begin());
    swapMixedEndian(guid.m_bytes.data());
    return guid;
}

Guid Guid::fromBytes(const uint8_t *bytes) noexcept
{
    Guid guid;
    std::copy(bytes, bytes + 16, guid.m_bytes.begin());
    return guid;
}

Guid Guid::random() noexcept
{
    uuid_t uu;
    uuid_generate_random(uu);

    // keep the version and variant bits where toString() expects them
    Guid guid;
    std::copy(std::begin(uu), std::end(uu), guid.m_bytes.begin());
    swapMixedEndian(guid.m_bytes.data());
    return guid;
}

std::string Guid::toString() const
{
    auto bytes = m_bytes;
    swapMixedEndian(bytes.data());

    uuid_t uu;
    std::copy(bytes.begin(), bytes.end(), std::begin(uu));
    std::array<char, 37> out{};
    uuid_unparse_upper(uu, out.data());
    return out.data();
}

bool Guid::isNull() const noexcept
{
    return std::all_of(m_bytes.begin(), m_bytes.end(), [](uint8_t b) {
        return b == 0;
    });
}

const Guid &espPartitionType() noexcept
{
    static const Guid guid = *Guid::fromString("C12A7328-F81F-11D2-BA4B-00A0C93EC93B");
    return guid;
}

const Guid &linuxFilesystemPartitionType() noexcept
{
    static const Guid guid = *Guid::fromString("0FC63DAF-8483-4772-8E79-3D69D8477DE4");
    return guid;
}

uint64_t minimumDiskBytes() noexcept
{
    const uint64_t rootStart = firstUsableLba + espSizeBytes / sectorSize;
    return (rootStart + 1 + backupSectors) * sectorSize;
}

utils::error::Result<PartitionLayout> planPartitions(uint64_t diskBytes) noexcept
{
    OCIDISK_TRACE(fmt::format("plan partitions for {} bytes", diskBytes));

    if (diskBytes < minimumDiskBytes()) {
        return OCIDISK_ERR(fmt::format("disk of {} bytes is smaller than the minimum of {} bytes",
                                       diskBytes,
                                       minimumDiskBytes()),
                           ErrorCode::PartitionTableWriteFailure);
    }

    PartitionLayout layout;
    layout.totalSectors = diskBytes / sectorSize;
    layout.diskGuid = Guid::random();
    layout.firstUsableLba = firstUsableLba;
    layout.lastUsableLba = layout.totalSectors - backupSectors - 1;

    GptPartition esp;
    esp.type = espPartitionType();
    esp.unique = Guid::random();
    esp.firstLba = firstUsableLba;
    esp.lastLba = esp.firstLba + espSizeBytes / sectorSize - 1;
    esp.attributes = requiredPartitionAttribute;
    esp.name = "EFI System Partition";

    GptPartition root;
    root.type = linuxFilesystemPartitionType();
    root.unique = Guid::random();
    root.firstLba = esp.lastLba + 1;
    // keep the end aligned unless that leaves nothing
    auto alignedEnd = alignDown(layout.lastUsableLba + 1);
    root.lastLba = alignedEnd > root.firstLba ? alignedEnd - 1 : layout.lastUsableLba;
    root.name = "Linux filesystem";

    layout.partitions = { esp, root };
    return layout;
}

utils::error::Result<void> writePartitionTable(const std::filesystem::path &path,
                                               const PartitionLayout &layout) noexcept
{
    OCIDISK_TRACE(fmt::format("write partition table to {}", path.string()));

    if (layout.partitions.size() > partitionEntryCount) {
        return OCIDISK_ERR("too many partitions", ErrorCode::PartitionTableWriteFailure);
    }

    int fd = ::open(path.c_str(), O_RDWR | O_CLOEXEC);
    if (fd < 0) {
        return OCIDISK_ERR(fmt::format("open: {}", common::error::errorString(errno)),
                           ErrorCode::PartitionTableWriteFailure);
    }
    auto closer = gsl::finally([fd]() {
        ::close(fd);
    });

    std::vector<uint8_t> entries(entryArraySectors * sectorSize, 0);
    for (std::size_t i = 0; i < layout.partitions.size(); ++i) {
        const auto &part = layout.partitions[i];
        GptEntry entry{};
        std::copy(part.type.bytes().begin(), part.type.bytes().end(), entry.typeGuid);
        std::copy(part.unique.bytes().begin(), part.unique.bytes().end(), entry.uniqueGuid);
        entry.firstLba = htole64(part.firstLba);
        entry.lastLba = htole64(part.lastLba);
        entry.attributes = htole64(part.attributes);
        std::array<uint16_t, nameLength> name{};
        for (std::size_t c = 0; c < part.name.size() && c < nameLength; ++c) {
            name[c] = htole16(static_cast<uint16_t>(static_cast<unsigned char>(part.name[c])));
        }
        std::memcpy(entry.name, name.data(), sizeof(entry.name));
        std::memcpy(entries.data() + i * sizeof(GptEntry), &entry, sizeof(GptEntry));
    }
    const auto entriesCrc = checksum(entries.data(), entries.size());

    const uint64_t lastLba = layout.totalSectors - 1;
    const uint64_t backupEntriesLba = lastLba - entryArraySectors;

    std::vector<uint8_t> primary(primarySectors * sectorSize, 0);
    MasterBootRecord mbr{};
    mbr.partitions[0].type = protectiveMbrType;
    mbr.partitions[0].chsFirst[1] = 0x02;
    mbr.partitions[0].chsLast[0] = 0xFF;
    mbr.partitions[0].chsLast[1] = 0xFF;
    mbr.partitions[0].chsLast[2] = 0xFF;
    mbr.partitions[0].firstLba = htole32(1);
    mbr.partitions[0].sectors =
      htole32(static_cast<uint32_t>(std::min<uint64_t>(lastLba, 0xFFFFFFFFULL)));
    mbr.signature[0] = 0x55;
    mbr.signature[1] = 0xAA;
    std::memcpy(primary.data(), &mbr, sizeof(mbr));

    auto header = makeHeader(layout, 1, lastLba, 2, entriesCrc);
    std::memcpy(primary.data() + sectorSize, &header, sizeof(header));
    std::memcpy(primary.data() + 2 * sectorSize, entries.data(), entries.size());

    std::vector<uint8_t> backup(backupSectors * sectorSize, 0);
    std::memcpy(backup.data(), entries.data(), entries.size());
    auto backupHeader = makeHeader(layout, lastLba, 1, backupEntriesLba, entriesCrc);
    std::memcpy(backup.data() + entries.size(), &backupHeader, sizeof(backupHeader));

    auto ret = writeAll(fd, primary, 0);
    if (!ret) {
        return OCIDISK_ERR("primary table", std::move(ret), ErrorCode::PartitionTableWriteFailure);
    }

    ret = writeAll(fd, backup, backupEntriesLba * sectorSize);
    if (!ret) {
        return OCIDISK_ERR("backup table", std::move(ret), ErrorCode::PartitionTableWriteFailure);
    }

    if (::fsync(fd) != 0) {
        return OCIDISK_ERR(fmt::format("fsync: {}", common::error::errorString(errno)),
                           ErrorCode::PartitionTableWriteFailure);
    }

    return OCIDISK_OK;
}

utils::error::Result<PartitionLayout> buildPartitionTable(const DiskImage &disk) noexcept
{
    OCIDISK_TRACE("build partition table");

    auto layout = planPartitions(disk.sizeBytes);
    if (!layout) {
        return OCIDISK_ERR(layout);
    }

    auto ret = writePartitionTable(disk.path, *layout);
    if (!ret) {
        return OCIDISK_ERR(ret);
    }

    auto check = readPartitionTable(disk.path);
    if (!check) {
        return OCIDISK_ERR("verify written table", std::move(check),
                           ErrorCode::PartitionTableWriteFailure);
    }

    for (const auto &part : layout->partitions) {
        LogI("partition {} \"{}\": LBA {}-{} ({} MiB)",
             part.type.toString(),
             part.name,
             part.firstLba,
             part.lastLba,
             part.sizeBytes() / MiB);
    }

    return layout;
}

utils::error::Result<PartitionLayout> readPartitionTable(const std::filesystem::path &path) noexcept
{
    OCIDISK_TRACE(fmt::format("read partition table of {}", path.string()));

    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return OCIDISK_ERR(fmt::format("open: {}", common::error::errorString(errno)));
    }
    auto closer = gsl::finally([fd]() {
        ::close(fd);
    });

    struct stat st{};
    if (::fstat(fd, &st) != 0) {
        return OCIDISK_ERR(fmt::format("fstat: {}", common::error::errorString(errno)));
    }
    const uint64_t totalSectors = static_cast<uint64_t>(st.st_size) / sectorSize;
    if (totalSectors < primarySectors + backupSectors) {
        return OCIDISK_ERR("file too small for a GPT");
    }

    auto primary = readAll(fd, primarySectors * sectorSize, 0);
    if (!primary) {
        return OCIDISK_ERR(primary);
    }

    MasterBootRecord mbr{};
    std::memcpy(&mbr, primary->data(), sizeof(mbr));
    if (mbr.signature[0] != 0x55 || mbr.signature[1] != 0xAA
        || mbr.partitions[0].type != protectiveMbrType) {
        return OCIDISK_ERR("missing protective MBR");
    }

    auto header = parseHeader(primary->data() + sectorSize, 1);
    if (!header) {
        return OCIDISK_ERR("primary header", std::move(header));
    }

    if (le64toh(header->entriesLba) != 2) {
        return OCIDISK_ERR("primary entries are not at LBA 2");
    }
    const auto *entries = primary->data() + 2 * sectorSize;
    const std::size_t entriesSize = entryArraySectors * sectorSize;
    if (checksum(entries, entriesSize) != le32toh(header->entriesCrc32)) {
        return OCIDISK_ERR("partition entries checksum mismatch");
    }

    const uint64_t backupLba = le64toh(header->backupLba);
    if (backupLba >= totalSectors || backupLba < entryArraySectors) {
        return OCIDISK_ERR(fmt::format("backup header LBA {} out of range", backupLba));
    }
    auto backup = readAll(fd, backupSectors * sectorSize, (backupLba - entryArraySectors) * sectorSize);
    if (!backup) {
        return OCIDISK_ERR(backup);
    }
    auto backupHeader = parseHeader(backup->data() + entriesSize, backupLba);
    if (!backupHeader) {
        return OCIDISK_ERR("backup header", std::move(backupHeader));
    }
    if (checksum(backup->data(), entriesSize) != le32toh(backupHeader->entriesCrc32)
        || backupHeader->entriesCrc32 != header->entriesCrc32) {
        return OCIDISK_ERR("backup entries differ from primary entries");
    }

    PartitionLayout layout;
    layout.totalSectors = totalSectors;
    layout.diskGuid = Guid::fromBytes(header->diskGuid);
    layout.firstUsableLba = le64toh(header->firstUsableLba);
    layout.lastUsableLba = le64toh(header->lastUsableLba);

    for (uint32_t i = 0; i < partitionEntryCount; ++i) {
        GptEntry entry{};
        std::memcpy(&entry, entries + i * sizeof(GptEntry), sizeof(GptEntry));
        auto type = Guid::fromBytes(entry.typeGuid);
        if (type.isNull()) {
            continue;
        }

        GptPartition part;
        part.type = type;
        part.unique = Guid::fromBytes(entry.uniqueGuid);
        part.firstLba = le64toh(entry.firstLba);
        part.lastLba = le64toh(entry.lastLba);
        part.attributes = le64toh(entry.attributes);
        std::array<uint16_t, nameLength> name{};
        std::memcpy(name.data(), entry.name, sizeof(entry.name));
        for (auto c : name) {
            c = le16toh(c);
            if (c == 0) {
                break;
            }
            part.name.push_back(c < 0x80 ? static_cast<char>(c) : '?');
        }
        layout.partitions.push_back(std::move(part));
    }

    return layout;
}

} // namespace ocidisk::disk
