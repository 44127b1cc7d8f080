/**
 * @file ZiPatchFile.hpp
 * @brief Forward-only chunk reader for ZiPatch files
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include "ZiPatchChunk.hpp"

#include <QIODevice>

#include <filesystem>
#include <memory>
#include <optional>

namespace ffxiv::patch {

/**
 * @class ZiPatchFile
 * @brief Decodes a patch file into a lazy sequence of chunks
 *
 * The reader never seeks backwards: each call to next() consumes exactly
 * one chunk (header, declared payload and CRC footer) regardless of how
 * much of the payload the decoder used. The sequence ends after the EOF_
 * chunk or at a clean end of input. Any framing error throws
 * ChunkDecodeError and the rest of the file must not be trusted.
 */
class ZiPatchFile {
public:
    static constexpr int SIGNATURE_SIZE = 12;
    static const char SIGNATURE[SIGNATURE_SIZE];

    struct Options {
        bool verifyChecksums = true;
    };

    /**
     * Open a patch file from disk
     *
     * @throws FileStoreError if the file cannot be opened
     * @throws ChunkDecodeError if the signature is wrong
     */
    static ZiPatchFile open(const std::filesystem::path& path, Options options);
    static ZiPatchFile open(const std::filesystem::path& path);

    /**
     * Read from an already-open device, positioned at the signature
     */
    explicit ZiPatchFile(std::unique_ptr<QIODevice> device, Options options = Options{});
    ~ZiPatchFile();

    ZiPatchFile(ZiPatchFile&&) noexcept;
    ZiPatchFile& operator=(ZiPatchFile&&) noexcept;
    ZiPatchFile(const ZiPatchFile&) = delete;
    ZiPatchFile& operator=(const ZiPatchFile&) = delete;

    /**
     * Decode the next chunk
     *
     * @return The chunk, or nullopt once the sequence has ended
     */
    std::optional<ZiPatchChunk> next();

    /**
     * File offset of the next chunk header
     */
    qint64 position() const { return m_position; }

    /**
     * Total size of the underlying device, or -1 if sequential
     */
    qint64 size() const;

    bool finished() const { return m_finished; }

private:
    QByteArray readExactly(qint64 count, const char* what);

    std::unique_ptr<QIODevice> m_device;
    Options m_options;
    qint64 m_position = 0;
    bool m_finished = false;
};

} // namespace ffxiv::patch
