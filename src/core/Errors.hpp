/**
 * FFXIV Updater - Error Types
 *
 * Exceptions raised by the patch engine and the update coordinator.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <stdexcept>
#include <string>

namespace ffxiv {

/**
 * Base class for all updater errors
 */
class UpdaterError : public std::runtime_error {
public:
    explicit UpdaterError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * Transport failure, timeout or non-success HTTP status
 */
class NetworkError : public UpdaterError {
public:
    explicit NetworkError(const std::string& message, int statusCode = 0)
        : UpdaterError(message), m_statusCode(statusCode) {}

    int statusCode() const { return m_statusCode; }

private:
    int m_statusCode;
};

/**
 * Downloaded byte count differs from the declared patch size
 */
class SizeMismatchError : public UpdaterError {
public:
    SizeMismatchError(const std::string& fileName, long long expected, long long actual)
        : UpdaterError("Size mismatch for " + fileName + ": expected " +
                       std::to_string(expected) + " bytes, got " + std::to_string(actual))
        , m_expected(expected)
        , m_actual(actual) {}

    long long expected() const { return m_expected; }
    long long actual() const { return m_actual; }

private:
    long long m_expected;
    long long m_actual;
};

/**
 * Downloaded content does not match the declared block hashes
 */
class HashMismatchError : public UpdaterError {
public:
    HashMismatchError(const std::string& fileName, int blockIndex)
        : UpdaterError("Hash mismatch for " + fileName + " at block " + std::to_string(blockIndex))
        , m_blockIndex(blockIndex) {}

    int blockIndex() const { return m_blockIndex; }

private:
    int m_blockIndex;
};

/**
 * Malformed chunk header, bad signature, checksum failure or truncated stream
 */
class ChunkDecodeError : public UpdaterError {
public:
    ChunkDecodeError(const std::string& message, long long offset)
        : UpdaterError(message + " (at offset " + std::to_string(offset) + ")")
        , m_offset(offset) {}

    long long offset() const { return m_offset; }

private:
    long long m_offset;
};

/**
 * A chunk's filesystem effect failed
 */
class ChunkApplyError : public UpdaterError {
public:
    ChunkApplyError(const std::string& chunkType, const std::string& targetPath,
                    const std::string& reason)
        : UpdaterError("Failed to apply " + chunkType + " to '" + targetPath + "': " + reason)
        , m_chunkType(chunkType)
        , m_targetPath(targetPath) {}

    const std::string& chunkType() const { return m_chunkType; }
    const std::string& targetPath() const { return m_targetPath; }

private:
    std::string m_chunkType;
    std::string m_targetPath;
};

/**
 * Manifest line could not be parsed. Recovered locally by dropping the line.
 */
class ProtocolError : public UpdaterError {
public:
    explicit ProtocolError(const std::string& message)
        : UpdaterError(message) {}
};

/**
 * Version string is not of the form YYYY.MM.DD.XXXX.YYYY
 */
class VersionFormatError : public UpdaterError {
public:
    explicit VersionFormatError(const std::string& version)
        : UpdaterError("Invalid version string: '" + version + "'") {}
};

/**
 * Pack-file handle could not be opened, read or written
 */
class FileStoreError : public UpdaterError {
public:
    explicit FileStoreError(const std::string& message)
        : UpdaterError(message) {}
};

} // namespace ffxiv
