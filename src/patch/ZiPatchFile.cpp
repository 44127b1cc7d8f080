/**
 * @file ZiPatchFile.cpp
 * @brief Implementation of the ZiPatch chunk reader
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "ZiPatchFile.hpp"
#include "BinaryReader.hpp"

#include "core/Errors.hpp"

#include <QFile>

#include <spdlog/spdlog.h>
#include <zlib.h>

namespace ffxiv::patch {

namespace {
    constexpr qint64 CHUNK_HEADER_SIZE = 8;
    constexpr qint64 CHUNK_FOOTER_SIZE = 4;

    uint32_t readBigEndian32(const char* p) {
        return (static_cast<uint32_t>(static_cast<uint8_t>(p[0])) << 24) |
               (static_cast<uint32_t>(static_cast<uint8_t>(p[1])) << 16) |
               (static_cast<uint32_t>(static_cast<uint8_t>(p[2])) << 8) |
               static_cast<uint32_t>(static_cast<uint8_t>(p[3]));
    }
}

const char ZiPatchFile::SIGNATURE[ZiPatchFile::SIGNATURE_SIZE] = {
    '\x91', 'Z', 'I', 'P', 'A', 'T', 'C', 'H', '\r', '\n', '\x1a', '\n'
};

ZiPatchFile ZiPatchFile::open(const std::filesystem::path& path, Options options) {
    auto file = std::make_unique<QFile>(QString::fromStdString(path.string()));
    if (!file->open(QIODevice::ReadOnly)) {
        throw FileStoreError("Failed to open patch file " + path.string() + ": "
                             + file->errorString().toStdString());
    }
    spdlog::debug("Opened patch file {} ({} bytes)", path.string(), file->size());
    return ZiPatchFile(std::move(file), options);
}

ZiPatchFile ZiPatchFile::open(const std::filesystem::path& path) {
    return open(path, Options{});
}

ZiPatchFile::ZiPatchFile(std::unique_ptr<QIODevice> device, Options options)
    : m_device(std::move(device))
    , m_options(options)
{
    QByteArray signature = readExactly(SIGNATURE_SIZE, "signature");
    if (signature != QByteArray(SIGNATURE, SIGNATURE_SIZE)) {
        throw ChunkDecodeError("Not a ZiPatch file: bad signature", 0);
    }
    m_position = SIGNATURE_SIZE;
}

ZiPatchFile::~ZiPatchFile() = default;
ZiPatchFile::ZiPatchFile(ZiPatchFile&&) noexcept = default;
ZiPatchFile& ZiPatchFile::operator=(ZiPatchFile&&) noexcept = default;

qint64 ZiPatchFile::size() const {
    return m_device->isSequential() ? -1 : m_device->size();
}

QByteArray ZiPatchFile::readExactly(qint64 count, const char* what) {
    QByteArray data = m_device->read(count);
    if (data.size() != count) {
        throw ChunkDecodeError(
            "Truncated " + std::string(what) + ": expected " + std::to_string(count)
                + " bytes, got " + std::to_string(data.size()),
            m_position);
    }
    return data;
}

std::optional<ZiPatchChunk> ZiPatchFile::next() {
    if (m_finished) {
        return std::nullopt;
    }

    if (m_device->atEnd()) {
        spdlog::debug("Patch stream ended at offset {} without EOF_ chunk", m_position);
        m_finished = true;
        return std::nullopt;
    }

    const qint64 chunkOffset = m_position;
    QByteArray header = readExactly(CHUNK_HEADER_SIZE, "chunk header");
    const uint32_t payloadSize = readBigEndian32(header.constData());
    const std::string type(header.constData() + 4, 4);

    if (!m_device->isSequential()) {
        qint64 remaining = m_device->size() - (chunkOffset + CHUNK_HEADER_SIZE);
        if (static_cast<qint64>(payloadSize) + CHUNK_FOOTER_SIZE > remaining) {
            throw ChunkDecodeError(
                "Chunk " + type + " declares " + std::to_string(payloadSize)
                    + " bytes but only " + std::to_string(remaining) + " remain",
                chunkOffset);
        }
    }

    QByteArray payload = readExactly(payloadSize, "chunk payload");
    QByteArray footer = readExactly(CHUNK_FOOTER_SIZE, "chunk footer");
    m_position = chunkOffset + CHUNK_HEADER_SIZE + payloadSize + CHUNK_FOOTER_SIZE;

    if (m_options.verifyChecksums) {
        uLong crc = crc32(0L, Z_NULL, 0);
        crc = crc32(crc, reinterpret_cast<const Bytef*>(header.constData() + 4), 4);
        crc = crc32(crc, reinterpret_cast<const Bytef*>(payload.constData()),
                    static_cast<uInt>(payload.size()));
        uint32_t expected = readBigEndian32(footer.constData());
        if (static_cast<uint32_t>(crc) != expected) {
            throw ChunkDecodeError("CRC mismatch in chunk " + type, chunkOffset);
        }
    }

    BinaryReader reader(payload, chunkOffset + CHUNK_HEADER_SIZE);

    ZiPatchChunk chunk;
    chunk.type = type;
    chunk.offset = chunkOffset;
    chunk.size = payloadSize;
    chunk.payload = decodeChunkPayload(type, reader);

    if (chunk.isOpaque()) {
        spdlog::debug("Skipping unknown chunk {} at offset {} ({} bytes)", type, chunkOffset, payloadSize);
    } else if (!reader.atEnd()) {
        spdlog::trace("Chunk {} left {} trailing bytes unread", chunk.typeName(), reader.remaining());
    }

    if (chunk.isEndOfFile()) {
        m_finished = true;
    }
    return chunk;
}

} // namespace ffxiv::patch
