/**
 * @file SqexFileStore.cpp
 * @brief Implementation of pack-file handles and the handle store
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "SqexFileStore.hpp"

#include "core/Errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace ffxiv::patch {

namespace {
    constexpr qint64 WIPE_PAGE_SIZE = 64 * 1024;

    void appendUInt32LE(QByteArray& out, uint32_t value) {
        out.append(static_cast<char>(value & 0xFF));
        out.append(static_cast<char>((value >> 8) & 0xFF));
        out.append(static_cast<char>((value >> 16) & 0xFF));
        out.append(static_cast<char>((value >> 24) & 0xFF));
    }

    QString toQString(const std::filesystem::path& path) {
        return QString::fromStdString(path.string());
    }
}

// --- SqexFile ---------------------------------------------------------------

SqexFile::SqexFile(const std::filesystem::path& path)
    : m_path(path)
    , m_file(toQString(path))
{
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            throw FileStoreError("Failed to create directory " + path.parent_path().string()
                                 + ": " + ec.message());
        }
    }

    if (!m_file.open(QIODevice::ReadWrite)) {
        throw FileStoreError("Failed to open " + path.string() + ": "
                             + m_file.errorString().toStdString());
    }
    spdlog::debug("Opened pack file {} ({} bytes)", path.string(), m_file.size());
}

SqexFile::~SqexFile() {
    if (m_file.isOpen()) {
        m_file.flush();
        m_file.close();
    }
}

void SqexFile::seekTo(qint64 offset) {
    if (offset < 0) {
        throw FileStoreError("Negative offset " + std::to_string(offset) + " in " + m_path.string());
    }
    if (!m_file.seek(offset)) {
        throw FileStoreError("Failed to seek to " + std::to_string(offset) + " in "
                             + m_path.string() + ": " + m_file.errorString().toStdString());
    }
}

void SqexFile::writeAt(qint64 offset, const QByteArray& data) {
    seekTo(offset);
    if (data.isEmpty()) {
        return;
    }
    qint64 written = m_file.write(data);
    if (written != data.size()) {
        throw FileStoreError("Short write to " + m_path.string() + " at offset "
                             + std::to_string(offset) + ": "
                             + m_file.errorString().toStdString());
    }
}

void SqexFile::wipe(qint64 offset, qint64 length) {
    if (length <= 0) {
        return;
    }
    seekTo(offset);

    const QByteArray page(static_cast<qsizetype>(std::min(length, WIPE_PAGE_SIZE)), '\0');
    qint64 remaining = length;
    while (remaining > 0) {
        qint64 count = std::min(remaining, static_cast<qint64>(page.size()));
        if (m_file.write(page.constData(), count) != count) {
            throw FileStoreError("Failed to zero-fill " + m_path.string() + ": "
                                 + m_file.errorString().toStdString());
        }
        remaining -= count;
    }
}

void SqexFile::writeEmptyBlockAt(qint64 offset, uint32_t blockCount) {
    if (blockCount == 0) {
        throw FileStoreError("Empty block of zero length requested in " + m_path.string());
    }

    wipe(offset, static_cast<qint64>(blockCount) * BLOCK_SIZE);

    QByteArray header;
    header.reserve(20);
    appendUInt32LE(header, static_cast<uint32_t>(BLOCK_SIZE));
    appendUInt32LE(header, 0);
    appendUInt32LE(header, 0);
    appendUInt32LE(header, blockCount - 1);
    appendUInt32LE(header, 0);
    writeAt(offset, header);
}

void SqexFile::truncate(qint64 size) {
    if (!m_file.resize(size)) {
        throw FileStoreError("Failed to resize " + m_path.string() + " to "
                             + std::to_string(size) + ": " + m_file.errorString().toStdString());
    }
}

qint64 SqexFile::size() const {
    return m_file.size();
}

void SqexFile::flush() {
    if (m_file.isOpen() && !m_file.flush()) {
        throw FileStoreError("Failed to flush " + m_path.string() + ": "
                             + m_file.errorString().toStdString());
    }
}

void SqexFile::close() {
    if (m_file.isOpen()) {
        flush();
        m_file.close();
    }
}

// --- SqexFileStore ----------------------------------------------------------

SqexFileStore::~SqexFileStore() {
    for (auto& [path, file] : m_files) {
        try {
            file->close();
        } catch (const FileStoreError& e) {
            spdlog::error("Error closing {}: {}", path.string(), e.what());
        }
    }
}

std::filesystem::path SqexFileStore::canonicalKey(const std::filesystem::path& path) {
    std::error_code ec;
    auto absolute = std::filesystem::absolute(path, ec);
    if (ec) {
        absolute = path;
    }
    return absolute.lexically_normal();
}

std::shared_ptr<SqexFile> SqexFileStore::acquire(const std::filesystem::path& path) {
    auto key = canonicalKey(path);
    auto it = m_files.find(key);
    if (it != m_files.end()) {
        return it->second;
    }

    auto file = std::make_shared<SqexFile>(key);
    m_files.emplace(key, file);
    return file;
}

bool SqexFileStore::release(const std::filesystem::path& path) {
    auto it = m_files.find(canonicalKey(path));
    if (it == m_files.end()) {
        return false;
    }
    it->second->close();
    m_files.erase(it);
    return true;
}

void SqexFileStore::releaseUnder(const std::filesystem::path& directory) {
    auto prefix = canonicalKey(directory);
    for (auto it = m_files.begin(); it != m_files.end();) {
        auto relative = it->first.lexically_relative(prefix);
        bool inside = !relative.empty() && *relative.begin() != "..";
        if (inside) {
            it->second->close();
            it = m_files.erase(it);
        } else {
            ++it;
        }
    }
}

void SqexFileStore::flushAll() {
    for (auto& [path, file] : m_files) {
        file->flush();
    }
}

void SqexFileStore::closeAll() {
    for (auto& [path, file] : m_files) {
        file->close();
    }
    m_files.clear();
}

bool SqexFileStore::isOpen(const std::filesystem::path& path) const {
    return m_files.count(canonicalKey(path)) > 0;
}

} // namespace ffxiv::patch
