/**
 * @file ZiPatchChunk.hpp
 * @brief Chunk records of the ZiPatch container format
 *
 * A patch file is a 12-byte signature followed by chunks:
 *
 *   u32be  payload length
 *   char4  type tag (FHDR, APLY, ADIR, DELD, SQPK, EOF_, ...)
 *   ...    payload (length bytes)
 *   u32be  CRC32 of tag + payload
 *
 * SQPK chunks carry a nested command byte selecting one of the
 * packed-file operations below.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <QByteArray>

#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace ffxiv::patch {

class BinaryReader;

/**
 * Platform identifiers used in SqPack file names
 */
enum class SqpkPlatform : uint16_t {
    Win32 = 0,
    Ps3 = 1,
    Ps4 = 2
};

/**
 * Lower-case platform name as used in file names (win32, ps3, ps4)
 */
std::string platformName(SqpkPlatform platform);

/**
 * Addresses a SqPack .dat or .index file
 */
struct SqpackFileTarget {
    uint16_t mainId = 0;
    uint16_t subId = 0;
    uint32_t fileId = 0;

    /**
     * "ffxiv" for the base game, "ex{n}" for expansion n (taken from subId >> 8)
     */
    std::string expansionFolder() const;

    /**
     * e.g. "sqpack/ex1/020100.win32.dat0"
     */
    std::string datPath(SqpkPlatform platform) const;

    /**
     * e.g. "sqpack/ffxiv/0a0000.win32.index" or ".index2" when fileId > 0
     */
    std::string indexPath(SqpkPlatform platform) const;
};

// --- Top-level chunks -------------------------------------------------------

struct FileHeaderChunk {
    uint8_t version = 0;
    std::string patchType;      // "DIFF" or "HIST"
    uint32_t entryFiles = 0;

    // Only present in version 3 headers
    uint32_t addDirectories = 0;
    uint32_t deleteDirectories = 0;
    uint64_t deleteDataSize = 0;
    uint32_t minorVersion = 0;
    uint32_t repositoryName = 0;
    uint32_t commands = 0;
    uint32_t sqpkAddCommands = 0;
    uint32_t sqpkDeleteCommands = 0;
    uint32_t sqpkExpandCommands = 0;
    uint32_t sqpkHeaderCommands = 0;
    uint32_t sqpkFileCommands = 0;
};

enum class ApplyOptionKind : uint32_t {
    IgnoreMissing = 1,
    IgnoreOldMismatch = 2
};

struct ApplyOptionChunk {
    ApplyOptionKind option = ApplyOptionKind::IgnoreMissing;
    bool value = false;
};

struct AddDirectoryChunk {
    std::string dirName;
};

struct DeleteDirectoryChunk {
    std::string dirName;
};

struct EndOfFileChunk {
};

/**
 * Unknown or unsupported chunk type; skipped on apply
 */
struct OpaqueChunk {
};

// --- SQPK commands ----------------------------------------------------------

/**
 * 'A': write a data block into a .dat file, then zero the following blocks
 */
struct SqpkAddData {
    SqpackFileTarget target;
    int64_t blockOffset = 0;        // bytes
    int64_t blockNumber = 0;        // bytes
    int64_t blockDeleteNumber = 0;  // bytes
    QByteArray blockData;
};

/**
 * 'D': replace a range of a .dat file with an empty block
 */
struct SqpkDeleteData {
    SqpackFileTarget target;
    int64_t blockOffset = 0;        // bytes
    uint32_t blockNumber = 0;       // 128-byte units
};

/**
 * 'E': same layout as delete, used to grow a .dat file with an empty block
 */
struct SqpkExpandData {
    SqpackFileTarget target;
    int64_t blockOffset = 0;
    uint32_t blockNumber = 0;
};

enum class SqpkHeaderFileKind : char {
    Dat = 'D',
    Index = 'I'
};

enum class SqpkHeaderKind : char {
    Version = 'V',
    Index = 'I',
    Data = 'D'
};

/**
 * 'H': overwrite a 1024-byte SqPack header
 */
struct SqpkHeader {
    static constexpr int HEADER_SIZE = 1024;

    SqpkHeaderFileKind fileKind = SqpkHeaderFileKind::Dat;
    SqpkHeaderKind headerKind = SqpkHeaderKind::Version;
    SqpackFileTarget target;
    QByteArray headerData;

    /**
     * Offset to write at: 0 for the version header, 1024 otherwise
     */
    int64_t writeOffset() const {
        return headerKind == SqpkHeaderKind::Version ? 0 : HEADER_SIZE;
    }
};

enum class SqpkFileOperationKind : char {
    AddFile = 'A',
    RemoveAll = 'R',
    DeleteFile = 'D',
    MakeDirTree = 'M'
};

/**
 * One decompressed block of an add-file operation
 */
struct SqpkFileBlock {
    bool wasCompressed = false;
    QByteArray data;
};

/**
 * 'F': loose file operation
 */
struct SqpkFileOperation {
    SqpkFileOperationKind operation = SqpkFileOperationKind::AddFile;
    int64_t fileOffset = 0;
    uint64_t fileSize = 0;
    uint16_t expansionId = 0;
    std::string path;
    std::vector<SqpkFileBlock> blocks;
};

enum class SqpkIndexCommand : char {
    Add = 'A',
    Delete = 'D'
};

/**
 * 'I': index entry update
 */
struct SqpkIndex {
    SqpkIndexCommand command = SqpkIndexCommand::Add;
    bool isSynonym = false;
    SqpackFileTarget target;
    uint64_t fileHash = 0;
    uint32_t blockOffset = 0;
    uint32_t blockNumber = 0;
};

/**
 * 'X': informational install size
 */
struct SqpkPatchInfo {
    uint8_t status = 0;
    uint8_t version = 0;
    uint64_t installSize = 0;
};

/**
 * 'T': selects the platform for subsequent SqPack paths
 */
struct SqpkTargetInfo {
    SqpkPlatform platform = SqpkPlatform::Win32;
    int16_t region = 0;
    bool isDebug = false;
    uint16_t version = 0;
    uint64_t deletedDataSize = 0;
    uint64_t seekCount = 0;
};

using ChunkPayload = std::variant<
    FileHeaderChunk,
    ApplyOptionChunk,
    AddDirectoryChunk,
    DeleteDirectoryChunk,
    EndOfFileChunk,
    SqpkAddData,
    SqpkDeleteData,
    SqpkExpandData,
    SqpkHeader,
    SqpkFileOperation,
    SqpkIndex,
    SqpkPatchInfo,
    SqpkTargetInfo,
    OpaqueChunk
>;

/**
 * A decoded chunk with its framing information
 */
struct ZiPatchChunk {
    std::string type;       // 4-char tag as found in the file
    qint64 offset = 0;      // file offset of the length field
    uint32_t size = 0;      // declared payload length
    ChunkPayload payload;

    /**
     * Tag plus SQPK command, e.g. "ADIR" or "SQPK:A"
     */
    std::string typeName() const;

    /**
     * Short human-readable description for logs
     */
    std::string describe() const;

    bool isEndOfFile() const { return std::holds_alternative<EndOfFileChunk>(payload); }
    bool isOpaque() const { return std::holds_alternative<OpaqueChunk>(payload); }
};

/**
 * Decodes a payload of a given type from a reader bounded to that payload
 */
using ChunkDecoder = ChunkPayload (*)(BinaryReader& reader);

/**
 * Registration table: chunk tag -> decoder
 */
const std::map<std::string, ChunkDecoder>& chunkDecoders();

/**
 * Registration table: SQPK command byte -> decoder
 */
const std::map<char, ChunkDecoder>& sqpkDecoders();

/**
 * Decode a payload, producing OpaqueChunk for tags not in the table
 */
ChunkPayload decodeChunkPayload(const std::string& type, BinaryReader& reader);

} // namespace ffxiv::patch
