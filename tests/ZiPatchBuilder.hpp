/**
 * FFXIV Updater - Synthetic ZiPatch builder for tests
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include "patch/ZiPatchChunk.hpp"
#include "patch/ZiPatchFile.hpp"

#include <QByteArray>
#include <QFile>

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>

#include <zlib.h>

namespace ffxiv::test {

/**
 * Encodes patch files chunk by chunk, with footers computed by zlib
 */
class ZiPatchBuilder {
public:
    ZiPatchBuilder() {
        m_data.append(patch::ZiPatchFile::SIGNATURE, patch::ZiPatchFile::SIGNATURE_SIZE);
    }

    // --- Raw framing ---

    ZiPatchBuilder& chunk(const std::string& tag, const QByteArray& payload) {
        QByteArray tagged = QByteArray::fromStdString(tag) + payload;
        uLong crc = crc32(0L, Z_NULL, 0);
        crc = crc32(crc, reinterpret_cast<const Bytef*>(tagged.constData()),
                    static_cast<uInt>(tagged.size()));
        return chunkWithCrc(tag, payload, static_cast<uint32_t>(crc));
    }

    ZiPatchBuilder& chunkWithCrc(const std::string& tag, const QByteArray& payload, uint32_t crc) {
        appendU32BE(m_data, static_cast<uint32_t>(payload.size()));
        m_data.append(QByteArray::fromStdString(tag));
        m_data.append(payload);
        appendU32BE(m_data, crc);
        return *this;
    }

    // --- Top-level chunks ---

    ZiPatchBuilder& fileHeader(const std::string& patchType = "DIFF", uint32_t entryFiles = 0) {
        QByteArray payload;
        payload.append(2, '\0');
        payload.append(static_cast<char>(2));     // version
        payload.append('\0');
        payload.append(QByteArray::fromStdString(patchType).leftJustified(4, '\0', true));
        appendU32BE(payload, entryFiles);
        return chunk("FHDR", payload);
    }

    ZiPatchBuilder& applyOption(patch::ApplyOptionKind option, bool value) {
        QByteArray payload;
        appendU32BE(payload, static_cast<uint32_t>(option));
        appendU32BE(payload, 4);
        appendU32BE(payload, value ? 1 : 0);
        return chunk("APLY", payload);
    }

    ZiPatchBuilder& addDirectory(const std::string& name) {
        return chunk("ADIR", lengthPrefixed(name));
    }

    ZiPatchBuilder& deleteDirectory(const std::string& name) {
        return chunk("DELD", lengthPrefixed(name));
    }

    ZiPatchBuilder& endOfFile() {
        return chunk("EOF_", QByteArray());
    }

    // --- SQPK commands ---

    ZiPatchBuilder& sqpk(char command, const QByteArray& body) {
        QByteArray payload;
        appendU32BE(payload, static_cast<uint32_t>(body.size() + 5));
        payload.append(command);
        payload.append(body);
        return chunk("SQPK", payload);
    }

    /**
     * data.size() must be a multiple of 128; offsets are in bytes
     */
    ZiPatchBuilder& addData(const patch::SqpackFileTarget& target, uint32_t blockOffset,
                            const QByteArray& data, uint32_t deleteBytes) {
        if (data.size() % 128 != 0) {
            throw std::invalid_argument("block data must be 128-byte aligned");
        }
        QByteArray body(3, '\0');
        appendTarget(body, target);
        appendU32BE(body, blockOffset >> 7);
        appendU32BE(body, static_cast<uint32_t>(data.size()) >> 7);
        appendU32BE(body, deleteBytes >> 7);
        body.append(data);
        return sqpk('A', body);
    }

    ZiPatchBuilder& deleteData(const patch::SqpackFileTarget& target, uint32_t blockOffset,
                               uint32_t blockCount) {
        return emptyBlockCommand('D', target, blockOffset, blockCount);
    }

    ZiPatchBuilder& expandData(const patch::SqpackFileTarget& target, uint32_t blockOffset,
                               uint32_t blockCount) {
        return emptyBlockCommand('E', target, blockOffset, blockCount);
    }

    ZiPatchBuilder& header(patch::SqpkHeaderFileKind fileKind, patch::SqpkHeaderKind headerKind,
                           const patch::SqpackFileTarget& target, char fill) {
        QByteArray body;
        body.append(static_cast<char>(fileKind));
        body.append(static_cast<char>(headerKind));
        body.append('\0');
        appendTarget(body, target);
        body.append(QByteArray(patch::SqpkHeader::HEADER_SIZE, fill));
        return sqpk('H', body);
    }

    /**
     * Add-file with one block per entry; compressed blocks use raw deflate
     */
    ZiPatchBuilder& addFile(const std::string& path, int64_t offset,
                            const std::vector<QByteArray>& blocks, bool compress = false) {
        QByteArray body = fileOperationHeader(patch::SqpkFileOperationKind::AddFile, path, offset, 0);
        for (const auto& block : blocks) {
            body.append(encodeFileBlock(block, compress));
        }
        return sqpk('F', body);
    }

    ZiPatchBuilder& deleteFile(const std::string& path) {
        return sqpk('F', fileOperationHeader(patch::SqpkFileOperationKind::DeleteFile, path, 0, 0));
    }

    ZiPatchBuilder& removeAll(uint16_t expansionId) {
        return sqpk('F', fileOperationHeader(patch::SqpkFileOperationKind::RemoveAll, "", 0, expansionId));
    }

    ZiPatchBuilder& makeDirTree(const std::string& path) {
        return sqpk('F', fileOperationHeader(patch::SqpkFileOperationKind::MakeDirTree, path, 0, 0));
    }

    ZiPatchBuilder& index(const patch::SqpackFileTarget& target, uint64_t fileHash) {
        QByteArray body;
        body.append('A');
        body.append('\0');
        body.append('\0');
        appendTarget(body, target);
        appendU64BE(body, fileHash);
        appendU32BE(body, 0);
        appendU32BE(body, 0);
        return sqpk('I', body);
    }

    ZiPatchBuilder& targetInfo(patch::SqpkPlatform platform) {
        QByteArray body(3, '\0');
        appendU16BE(body, static_cast<uint16_t>(platform));
        appendU16BE(body, 0xFFFF);
        appendU16BE(body, 0);
        appendU16BE(body, 1);
        body.append(16, '\0');
        return sqpk('T', body);
    }

    // --- Output ---

    const QByteArray& data() const { return m_data; }

    void writeTo(const std::filesystem::path& path) const {
        QFile file(QString::fromStdString(path.string()));
        if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)
            || file.write(m_data) != m_data.size()) {
            throw std::runtime_error("cannot write " + path.string());
        }
    }

    static patch::SqpackFileTarget target(uint16_t mainId, uint16_t subId, uint32_t fileId = 0) {
        patch::SqpackFileTarget t;
        t.mainId = mainId;
        t.subId = subId;
        t.fileId = fileId;
        return t;
    }

    static void appendU16BE(QByteArray& out, uint16_t value) {
        out.append(static_cast<char>((value >> 8) & 0xFF));
        out.append(static_cast<char>(value & 0xFF));
    }

    static void appendU32BE(QByteArray& out, uint32_t value) {
        for (int shift = 24; shift >= 0; shift -= 8) {
            out.append(static_cast<char>((value >> shift) & 0xFF));
        }
    }

    static void appendU64BE(QByteArray& out, uint64_t value) {
        for (int shift = 56; shift >= 0; shift -= 8) {
            out.append(static_cast<char>((value >> shift) & 0xFF));
        }
    }

    static void appendI32LE(QByteArray& out, int32_t value) {
        auto u = static_cast<uint32_t>(value);
        for (int shift = 0; shift < 32; shift += 8) {
            out.append(static_cast<char>((u >> shift) & 0xFF));
        }
    }

private:
    static QByteArray lengthPrefixed(const std::string& text) {
        QByteArray payload;
        appendU32BE(payload, static_cast<uint32_t>(text.size()));
        payload.append(QByteArray::fromStdString(text));
        return payload;
    }

    static void appendTarget(QByteArray& out, const patch::SqpackFileTarget& target) {
        appendU16BE(out, target.mainId);
        appendU16BE(out, target.subId);
        appendU32BE(out, target.fileId);
    }

    ZiPatchBuilder& emptyBlockCommand(char command, const patch::SqpackFileTarget& target,
                                      uint32_t blockOffset, uint32_t blockCount) {
        QByteArray body(3, '\0');
        appendTarget(body, target);
        appendU32BE(body, blockOffset >> 7);
        appendU32BE(body, blockCount);
        appendU32BE(body, 0);
        return sqpk(command, body);
    }

    static QByteArray fileOperationHeader(patch::SqpkFileOperationKind operation, const std::string& path,
                                          int64_t offset, uint16_t expansionId) {
        QByteArray body;
        body.append(static_cast<char>(operation));
        body.append(2, '\0');
        appendU64BE(body, static_cast<uint64_t>(offset));
        appendU64BE(body, 0);
        QByteArray name = QByteArray::fromStdString(path);
        name.append('\0');
        appendU32BE(body, static_cast<uint32_t>(name.size()));
        appendU16BE(body, expansionId);
        body.append(2, '\0');
        body.append(name);
        return body;
    }

    static QByteArray deflateRaw(const QByteArray& input) {
        z_stream stream{};
        if (deflateInit2(&stream, Z_BEST_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
            throw std::runtime_error("deflateInit2 failed");
        }
        QByteArray output(static_cast<qsizetype>(deflateBound(&stream, static_cast<uLong>(input.size()))),
                          Qt::Uninitialized);
        stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.constData()));
        stream.avail_in = static_cast<uInt>(input.size());
        stream.next_out = reinterpret_cast<Bytef*>(output.data());
        stream.avail_out = static_cast<uInt>(output.size());
        int result = deflate(&stream, Z_FINISH);
        output.resize(static_cast<qsizetype>(stream.total_out));
        deflateEnd(&stream);
        if (result != Z_STREAM_END) {
            throw std::runtime_error("deflate failed");
        }
        return output;
    }

    static QByteArray encodeFileBlock(const QByteArray& data, bool compress) {
        constexpr int32_t headerSize = 16;
        QByteArray stored = compress ? deflateRaw(data) : data;

        QByteArray block;
        appendI32LE(block, headerSize);
        appendI32LE(block, 0);
        appendI32LE(block, compress ? static_cast<int32_t>(stored.size()) : 32000);
        appendI32LE(block, static_cast<int32_t>(data.size()));
        block.append(stored);

        qsizetype padded = (block.size() + 127) & ~qsizetype(127);
        block.append(QByteArray(padded - block.size(), '\0'));
        return block;
    }

    QByteArray m_data;
};

} // namespace ffxiv::test
