/**
 * @file BinaryReader.hpp
 * @brief Bounded binary reader for ZiPatch chunk payloads
 *
 * ZiPatch stores most integers big-endian; the compressed block headers
 * inside SQPK file operations and the target info sizes are little-endian.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <QByteArray>

#include <cstdint>
#include <string>

namespace ffxiv::patch {

/**
 * @class BinaryReader
 * @brief Reads integers and strings from a fixed byte buffer
 *
 * Every read is bounds-checked. Reading past the end of the buffer throws
 * ChunkDecodeError, reporting the absolute file offset of the failed read.
 */
class BinaryReader {
public:
    /**
     * @param data Buffer to read from (copied by implicit sharing)
     * @param baseOffset File offset of data[0], used in error messages
     */
    explicit BinaryReader(const QByteArray& data, qint64 baseOffset = 0);

    uint8_t readUInt8();
    char readChar();
    bool readBoolean();

    uint16_t readUInt16BE();
    uint32_t readUInt32BE();
    uint64_t readUInt64BE();
    int64_t readInt64BE();

    uint16_t readUInt16LE();
    uint32_t readUInt32LE();
    int32_t readInt32LE();
    uint64_t readUInt64LE();

    /**
     * @brief Read a raw byte block
     */
    QByteArray readBytes(qsizetype count);

    /**
     * @brief Read a fixed-length string, dropping trailing NUL padding
     */
    std::string readFixedString(qsizetype length);

    /**
     * @brief Skip a number of bytes
     */
    void skip(qsizetype count);

    qsizetype position() const { return m_pos; }
    qsizetype remaining() const { return m_data.size() - m_pos; }
    bool atEnd() const { return m_pos >= m_data.size(); }

    /**
     * @brief Absolute file offset of the next byte
     */
    qint64 fileOffset() const { return m_baseOffset + m_pos; }

private:
    const char* take(qsizetype count);

    QByteArray m_data;
    qint64 m_baseOffset;
    qsizetype m_pos = 0;
};

} // namespace ffxiv::patch
