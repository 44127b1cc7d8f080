/**
 * @file ZiPatchChunk.cpp
 * @brief Chunk payload decoders and the tag registration tables
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "ZiPatchChunk.hpp"
#include "BinaryReader.hpp"

#include "core/Errors.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <zlib.h>

#include <algorithm>

namespace ffxiv::patch {

namespace {
    // Compressed size value marking a stored (uncompressed) block
    constexpr int32_t UNCOMPRESSED_BLOCK_MARKER = 32000;
    constexpr int BLOCK_ALIGNMENT_MASK = ~0x7F;

    SqpackFileTarget readTarget(BinaryReader& reader) {
        SqpackFileTarget target;
        target.mainId = reader.readUInt16BE();
        target.subId = reader.readUInt16BE();
        target.fileId = reader.readUInt32BE();
        return target;
    }

    QByteArray inflateRaw(const QByteArray& compressed, int32_t decompressedSize, qint64 offset) {
        if (decompressedSize < 0) {
            throw ChunkDecodeError("Negative decompressed block size", offset);
        }

        QByteArray output(decompressedSize, Qt::Uninitialized);

        z_stream stream{};
        stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(compressed.constData()));
        stream.avail_in = static_cast<uInt>(compressed.size());
        stream.next_out = reinterpret_cast<Bytef*>(output.data());
        stream.avail_out = static_cast<uInt>(output.size());

        if (inflateInit2(&stream, -MAX_WBITS) != Z_OK) {
            throw ChunkDecodeError("inflateInit2 failed", offset);
        }

        int result = inflate(&stream, Z_FINISH);
        auto produced = static_cast<qsizetype>(stream.total_out);
        inflateEnd(&stream);

        if (result != Z_STREAM_END || produced != decompressedSize) {
            throw ChunkDecodeError(
                fmt::format("Failed to inflate block (zlib result {}, {} of {} bytes)",
                            result, produced, decompressedSize),
                offset);
        }
        return output;
    }

    SqpkFileBlock readFileBlock(BinaryReader& reader) {
        qint64 blockStart = reader.fileOffset();

        int32_t headerSize = reader.readInt32LE();
        reader.skip(4);  // pad
        int32_t compressedSize = reader.readInt32LE();
        int32_t decompressedSize = reader.readInt32LE();

        if (headerSize < 16) {
            throw ChunkDecodeError(fmt::format("Bad compressed block header size {}", headerSize), blockStart);
        }
        reader.skip(headerSize - 16);

        SqpkFileBlock block;
        block.wasCompressed = compressedSize != UNCOMPRESSED_BLOCK_MARKER;

        int32_t storedSize = block.wasCompressed ? compressedSize : decompressedSize;
        if (storedSize < 0) {
            throw ChunkDecodeError("Negative block size", blockStart);
        }
        int32_t paddedLength = (storedSize + headerSize + 127) & BLOCK_ALIGNMENT_MASK;

        QByteArray stored = reader.readBytes(storedSize);
        block.data = block.wasCompressed
            ? inflateRaw(stored, decompressedSize, blockStart)
            : stored;

        // The last block of a chunk may omit its alignment padding
        qsizetype padding = std::min<qsizetype>(paddedLength - headerSize - storedSize, reader.remaining());
        reader.skip(padding);
        return block;
    }

    // --- Top-level decoders ---

    ChunkPayload decodeFileHeader(BinaryReader& reader) {
        FileHeaderChunk header;
        reader.skip(2);
        header.version = reader.readUInt8();
        reader.skip(1);
        header.patchType = reader.readFixedString(4);
        header.entryFiles = reader.readUInt32BE();

        if (header.version == 3) {
            header.addDirectories = reader.readUInt32BE();
            header.deleteDirectories = reader.readUInt32BE();
            uint64_t low = reader.readUInt32BE();
            uint64_t high = reader.readUInt32BE();
            header.deleteDataSize = low | (high << 32);
            header.minorVersion = reader.readUInt32BE();
            header.repositoryName = reader.readUInt32BE();
            header.commands = reader.readUInt32BE();
            header.sqpkAddCommands = reader.readUInt32BE();
            header.sqpkDeleteCommands = reader.readUInt32BE();
            header.sqpkExpandCommands = reader.readUInt32BE();
            header.sqpkHeaderCommands = reader.readUInt32BE();
            header.sqpkFileCommands = reader.readUInt32BE();
        }
        return header;
    }

    ChunkPayload decodeApplyOption(BinaryReader& reader) {
        ApplyOptionChunk option;
        option.option = static_cast<ApplyOptionKind>(reader.readUInt32BE());
        reader.skip(4);
        option.value = reader.readUInt32BE() != 0;
        return option;
    }

    ChunkPayload decodeAddDirectory(BinaryReader& reader) {
        AddDirectoryChunk chunk;
        uint32_t length = reader.readUInt32BE();
        chunk.dirName = reader.readFixedString(static_cast<qsizetype>(length));
        return chunk;
    }

    ChunkPayload decodeDeleteDirectory(BinaryReader& reader) {
        DeleteDirectoryChunk chunk;
        uint32_t length = reader.readUInt32BE();
        chunk.dirName = reader.readFixedString(static_cast<qsizetype>(length));
        return chunk;
    }

    ChunkPayload decodeEndOfFile(BinaryReader&) {
        return EndOfFileChunk{};
    }

    ChunkPayload decodeSqpk(BinaryReader& reader) {
        reader.skip(4);  // inner size, duplicates the chunk length
        char command = reader.readChar();

        const auto& table = sqpkDecoders();
        auto it = table.find(command);
        if (it == table.end()) {
            spdlog::debug("Unknown SQPK command '{}' at offset {}", command, reader.fileOffset());
            return OpaqueChunk{};
        }
        return it->second(reader);
    }

    // --- SQPK decoders ---

    ChunkPayload decodeSqpkAddData(BinaryReader& reader) {
        SqpkAddData op;
        reader.skip(3);
        op.target = readTarget(reader);
        op.blockOffset = static_cast<int64_t>(reader.readUInt32BE()) << 7;
        op.blockNumber = static_cast<int64_t>(reader.readUInt32BE()) << 7;
        op.blockDeleteNumber = static_cast<int64_t>(reader.readUInt32BE()) << 7;
        op.blockData = reader.readBytes(static_cast<qsizetype>(op.blockNumber));
        return op;
    }

    ChunkPayload decodeSqpkDeleteData(BinaryReader& reader) {
        SqpkDeleteData op;
        reader.skip(3);
        op.target = readTarget(reader);
        op.blockOffset = static_cast<int64_t>(reader.readUInt32BE()) << 7;
        op.blockNumber = reader.readUInt32BE();
        reader.skip(4);
        return op;
    }

    ChunkPayload decodeSqpkExpandData(BinaryReader& reader) {
        SqpkExpandData op;
        reader.skip(3);
        op.target = readTarget(reader);
        op.blockOffset = static_cast<int64_t>(reader.readUInt32BE()) << 7;
        op.blockNumber = reader.readUInt32BE();
        reader.skip(4);
        return op;
    }

    ChunkPayload decodeSqpkHeader(BinaryReader& reader) {
        SqpkHeader op;
        op.fileKind = static_cast<SqpkHeaderFileKind>(reader.readChar());
        op.headerKind = static_cast<SqpkHeaderKind>(reader.readChar());
        reader.skip(1);
        op.target = readTarget(reader);
        op.headerData = reader.readBytes(SqpkHeader::HEADER_SIZE);
        return op;
    }

    ChunkPayload decodeSqpkFile(BinaryReader& reader) {
        SqpkFileOperation op;
        op.operation = static_cast<SqpkFileOperationKind>(reader.readChar());
        reader.skip(2);
        op.fileOffset = reader.readInt64BE();
        op.fileSize = reader.readUInt64BE();
        uint32_t pathLength = reader.readUInt32BE();
        op.expansionId = reader.readUInt16BE();
        reader.skip(2);
        op.path = reader.readFixedString(static_cast<qsizetype>(pathLength));

        if (op.operation == SqpkFileOperationKind::AddFile) {
            while (!reader.atEnd()) {
                op.blocks.push_back(readFileBlock(reader));
            }
        }
        return op;
    }

    ChunkPayload decodeSqpkIndex(BinaryReader& reader) {
        SqpkIndex op;
        op.command = static_cast<SqpkIndexCommand>(reader.readChar());
        op.isSynonym = reader.readBoolean();
        reader.skip(1);
        op.target = readTarget(reader);
        op.fileHash = reader.readUInt64BE();
        op.blockOffset = reader.readUInt32BE();
        op.blockNumber = reader.readUInt32BE();
        return op;
    }

    ChunkPayload decodeSqpkPatchInfo(BinaryReader& reader) {
        SqpkPatchInfo op;
        op.status = reader.readUInt8();
        op.version = reader.readUInt8();
        reader.skip(1);
        op.installSize = reader.readUInt64BE();
        return op;
    }

    ChunkPayload decodeSqpkTargetInfo(BinaryReader& reader) {
        SqpkTargetInfo op;
        reader.skip(3);
        op.platform = static_cast<SqpkPlatform>(reader.readUInt16BE());
        op.region = static_cast<int16_t>(reader.readUInt16BE());
        op.isDebug = reader.readUInt16BE() != 0;
        op.version = reader.readUInt16BE();
        op.deletedDataSize = reader.readUInt64LE();
        op.seekCount = reader.readUInt64LE();
        return op;
    }

    struct SqpkCommandVisitor {
        char operator()(const SqpkAddData&) const { return 'A'; }
        char operator()(const SqpkDeleteData&) const { return 'D'; }
        char operator()(const SqpkExpandData&) const { return 'E'; }
        char operator()(const SqpkHeader&) const { return 'H'; }
        char operator()(const SqpkFileOperation&) const { return 'F'; }
        char operator()(const SqpkIndex&) const { return 'I'; }
        char operator()(const SqpkPatchInfo&) const { return 'X'; }
        char operator()(const SqpkTargetInfo&) const { return 'T'; }

        template <typename T>
        char operator()(const T&) const { return '\0'; }
    };
}

std::string platformName(SqpkPlatform platform) {
    switch (platform) {
        case SqpkPlatform::Win32: return "win32";
        case SqpkPlatform::Ps3: return "ps3";
        case SqpkPlatform::Ps4: return "ps4";
    }
    return fmt::format("unknown{}", static_cast<uint16_t>(platform));
}

std::string SqpackFileTarget::expansionFolder() const {
    int expansion = subId >> 8;
    return expansion == 0 ? "ffxiv" : fmt::format("ex{}", expansion);
}

std::string SqpackFileTarget::datPath(SqpkPlatform platform) const {
    return fmt::format("sqpack/{}/{:02x}{:04x}.{}.dat{}",
                       expansionFolder(), mainId, subId, platformName(platform), fileId);
}

std::string SqpackFileTarget::indexPath(SqpkPlatform platform) const {
    std::string path = fmt::format("sqpack/{}/{:02x}{:04x}.{}.index",
                                   expansionFolder(), mainId, subId, platformName(platform));
    if (fileId != 0) {
        path += std::to_string(fileId);
    }
    return path;
}

std::string ZiPatchChunk::typeName() const {
    char command = std::visit(SqpkCommandVisitor{}, payload);
    if (command != '\0') {
        return type + ":" + command;
    }
    return type;
}

std::string ZiPatchChunk::describe() const {
    struct Describer {
        std::string operator()(const FileHeaderChunk& c) const {
            return fmt::format("version={} type={} entries={}", c.version, c.patchType, c.entryFiles);
        }
        std::string operator()(const ApplyOptionChunk& c) const {
            return fmt::format("option={} value={}", static_cast<uint32_t>(c.option), c.value);
        }
        std::string operator()(const AddDirectoryChunk& c) const { return c.dirName; }
        std::string operator()(const DeleteDirectoryChunk& c) const { return c.dirName; }
        std::string operator()(const EndOfFileChunk&) const { return {}; }
        std::string operator()(const OpaqueChunk&) const { return "(skipped)"; }
        std::string operator()(const SqpkAddData& c) const {
            return fmt::format("{} offset={} size={} delete={}", c.target.datPath(SqpkPlatform::Win32),
                               c.blockOffset, c.blockNumber, c.blockDeleteNumber);
        }
        std::string operator()(const SqpkDeleteData& c) const {
            return fmt::format("{} offset={} blocks={}", c.target.datPath(SqpkPlatform::Win32),
                               c.blockOffset, c.blockNumber);
        }
        std::string operator()(const SqpkExpandData& c) const {
            return fmt::format("{} offset={} blocks={}", c.target.datPath(SqpkPlatform::Win32),
                               c.blockOffset, c.blockNumber);
        }
        std::string operator()(const SqpkHeader& c) const {
            auto path = c.fileKind == SqpkHeaderFileKind::Dat
                ? c.target.datPath(SqpkPlatform::Win32)
                : c.target.indexPath(SqpkPlatform::Win32);
            return fmt::format("{} kind={}", path, static_cast<char>(c.headerKind));
        }
        std::string operator()(const SqpkFileOperation& c) const {
            return fmt::format("{} {} offset={} blocks={}", static_cast<char>(c.operation), c.path,
                               c.fileOffset, c.blocks.size());
        }
        std::string operator()(const SqpkIndex& c) const {
            return fmt::format("{} {} hash={:016x}", static_cast<char>(c.command),
                               c.target.indexPath(SqpkPlatform::Win32), c.fileHash);
        }
        std::string operator()(const SqpkPatchInfo& c) const {
            return fmt::format("installSize={}", c.installSize);
        }
        std::string operator()(const SqpkTargetInfo& c) const {
            return fmt::format("platform={} region={} debug={}", platformName(c.platform), c.region, c.isDebug);
        }
    };
    return std::visit(Describer{}, payload);
}

const std::map<std::string, ChunkDecoder>& chunkDecoders() {
    static const std::map<std::string, ChunkDecoder> table = {
        {"FHDR", &decodeFileHeader},
        {"APLY", &decodeApplyOption},
        {"ADIR", &decodeAddDirectory},
        {"DELD", &decodeDeleteDirectory},
        {"SQPK", &decodeSqpk},
        {"EOF_", &decodeEndOfFile},
    };
    return table;
}

const std::map<char, ChunkDecoder>& sqpkDecoders() {
    static const std::map<char, ChunkDecoder> table = {
        {'A', &decodeSqpkAddData},
        {'D', &decodeSqpkDeleteData},
        {'E', &decodeSqpkExpandData},
        {'H', &decodeSqpkHeader},
        {'F', &decodeSqpkFile},
        {'I', &decodeSqpkIndex},
        {'X', &decodeSqpkPatchInfo},
        {'T', &decodeSqpkTargetInfo},
    };
    return table;
}

ChunkPayload decodeChunkPayload(const std::string& type, BinaryReader& reader) {
    const auto& table = chunkDecoders();
    auto it = table.find(type);
    if (it == table.end()) {
        return OpaqueChunk{};
    }
    return it->second(reader);
}

} // namespace ffxiv::patch
