/**
 * @file SqexFileStore.hpp
 * @brief Session-scoped cache of open pack-file handles
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <QByteArray>
#include <QFile>

#include <filesystem>
#include <map>
#include <memory>

namespace ffxiv::patch {

/**
 * @class SqexFile
 * @brief Seekable read/write handle on one pack file
 *
 * All operations throw FileStoreError on I/O failure.
 */
class SqexFile {
public:
    /// SqPack data blocks are aligned to this many bytes
    static constexpr qint64 BLOCK_SIZE = 128;

    explicit SqexFile(const std::filesystem::path& path);
    ~SqexFile();

    SqexFile(const SqexFile&) = delete;
    SqexFile& operator=(const SqexFile&) = delete;

    const std::filesystem::path& path() const { return m_path; }

    void writeAt(qint64 offset, const QByteArray& data);

    /**
     * Zero-fill length bytes starting at offset, in 64 KiB pages
     */
    void wipe(qint64 offset, qint64 length);

    /**
     * Write the header of an empty SqPack block spanning blockCount
     * 128-byte units: 128, 0, 0, blockCount - 1, 0 as little-endian u32
     */
    void writeEmptyBlockAt(qint64 offset, uint32_t blockCount);

    void truncate(qint64 size);
    qint64 size() const;
    void flush();
    void close();

    bool isOpen() const { return m_file.isOpen(); }

private:
    void seekTo(qint64 offset);

    std::filesystem::path m_path;
    QFile m_file;
};

/**
 * @class SqexFileStore
 * @brief Maps canonical paths to a single shared handle each
 *
 * The store owns every handle it hands out. Destroying the store flushes
 * and closes them, so an install session releases its files on every
 * exit path.
 */
class SqexFileStore {
public:
    SqexFileStore() = default;
    ~SqexFileStore();

    SqexFileStore(const SqexFileStore&) = delete;
    SqexFileStore& operator=(const SqexFileStore&) = delete;

    /**
     * Get the handle for a path, opening (and creating) it on first use
     *
     * Parent directories are created as needed. Existing content is kept.
     */
    std::shared_ptr<SqexFile> acquire(const std::filesystem::path& path);

    /**
     * Flush and close one handle if it is open
     *
     * @return true if a handle was released
     */
    bool release(const std::filesystem::path& path);

    /**
     * Release every handle below a directory
     */
    void releaseUnder(const std::filesystem::path& directory);

    void flushAll();
    void closeAll();

    size_t openCount() const { return m_files.size(); }
    bool isOpen(const std::filesystem::path& path) const;

private:
    static std::filesystem::path canonicalKey(const std::filesystem::path& path);

    std::map<std::filesystem::path, std::shared_ptr<SqexFile>> m_files;
};

} // namespace ffxiv::patch
