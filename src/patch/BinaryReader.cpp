/**
 * @file BinaryReader.cpp
 * @brief Implementation of the bounded binary reader
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "BinaryReader.hpp"

#include "core/Errors.hpp"

namespace ffxiv::patch {

BinaryReader::BinaryReader(const QByteArray& data, qint64 baseOffset)
    : m_data(data)
    , m_baseOffset(baseOffset)
{
}

const char* BinaryReader::take(qsizetype count) {
    if (count < 0 || count > remaining()) {
        throw ChunkDecodeError(
            "Read of " + std::to_string(count) + " bytes past end of chunk payload ("
                + std::to_string(remaining()) + " remaining)",
            fileOffset());
    }
    const char* ptr = m_data.constData() + m_pos;
    m_pos += count;
    return ptr;
}

uint8_t BinaryReader::readUInt8() {
    return static_cast<uint8_t>(*take(1));
}

char BinaryReader::readChar() {
    return *take(1);
}

bool BinaryReader::readBoolean() {
    return readUInt8() != 0;
}

uint16_t BinaryReader::readUInt16BE() {
    const char* p = take(2);
    return static_cast<uint16_t>(
        (static_cast<uint16_t>(static_cast<uint8_t>(p[0])) << 8) |
        static_cast<uint16_t>(static_cast<uint8_t>(p[1])));
}

uint32_t BinaryReader::readUInt32BE() {
    const char* p = take(4);
    return (static_cast<uint32_t>(static_cast<uint8_t>(p[0])) << 24) |
           (static_cast<uint32_t>(static_cast<uint8_t>(p[1])) << 16) |
           (static_cast<uint32_t>(static_cast<uint8_t>(p[2])) << 8) |
           static_cast<uint32_t>(static_cast<uint8_t>(p[3]));
}

uint64_t BinaryReader::readUInt64BE() {
    uint64_t high = readUInt32BE();
    uint64_t low = readUInt32BE();
    return (high << 32) | low;
}

int64_t BinaryReader::readInt64BE() {
    return static_cast<int64_t>(readUInt64BE());
}

uint16_t BinaryReader::readUInt16LE() {
    const char* p = take(2);
    return static_cast<uint16_t>(
        static_cast<uint16_t>(static_cast<uint8_t>(p[0])) |
        (static_cast<uint16_t>(static_cast<uint8_t>(p[1])) << 8));
}

uint32_t BinaryReader::readUInt32LE() {
    const char* p = take(4);
    return static_cast<uint32_t>(static_cast<uint8_t>(p[0])) |
           (static_cast<uint32_t>(static_cast<uint8_t>(p[1])) << 8) |
           (static_cast<uint32_t>(static_cast<uint8_t>(p[2])) << 16) |
           (static_cast<uint32_t>(static_cast<uint8_t>(p[3])) << 24);
}

int32_t BinaryReader::readInt32LE() {
    return static_cast<int32_t>(readUInt32LE());
}

uint64_t BinaryReader::readUInt64LE() {
    uint64_t low = readUInt32LE();
    uint64_t high = readUInt32LE();
    return (high << 32) | low;
}

QByteArray BinaryReader::readBytes(qsizetype count) {
    const char* p = take(count);
    return QByteArray(p, count);
}

std::string BinaryReader::readFixedString(qsizetype length) {
    const char* p = take(length);
    std::string result(p, static_cast<size_t>(length));
    auto end = result.find('\0');
    if (end != std::string::npos) {
        result.resize(end);
    }
    return result;
}

void BinaryReader::skip(qsizetype count) {
    take(count);
}

} // namespace ffxiv::patch
