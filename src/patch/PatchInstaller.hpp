/**
 * @file PatchInstaller.hpp
 * @brief Install session state and the single-patch installer
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include "SqexFileStore.hpp"
#include "ZiPatchChunk.hpp"

#include "core/Cancellation.hpp"

#include <filesystem>
#include <functional>
#include <string>

namespace ffxiv::patch {

class ZiPatchFile;

/**
 * Flags set by APLY chunks for the remainder of a patch
 */
struct ApplyOptions {
    bool ignoreMissing = false;
    bool ignoreOldMismatch = false;
};

/**
 * @class InstallSession
 * @brief Mutable state shared by the chunks of one patch file
 *
 * Owns the file handle store, so every pack file opened while applying a
 * patch is flushed and closed when the session goes out of scope.
 */
class InstallSession {
public:
    explicit InstallSession(std::filesystem::path gamePath,
                            SqpkPlatform platform = SqpkPlatform::Win32);

    InstallSession(const InstallSession&) = delete;
    InstallSession& operator=(const InstallSession&) = delete;

    const std::filesystem::path& gamePath() const { return m_gamePath; }

    SqpkPlatform platform() const { return m_platform; }
    void setPlatform(SqpkPlatform platform) { m_platform = platform; }

    ApplyOptions& options() { return m_options; }
    const ApplyOptions& options() const { return m_options; }

    SqexFileStore& store() { return m_store; }

    /**
     * Resolve a path taken from a chunk against the game directory
     *
     * Backslashes are treated as separators and one leading separator is
     * dropped. Drive letters, root paths and paths that climb out of the
     * game directory are rejected.
     *
     * @throws ChunkApplyError naming chunkType and the offending path
     */
    std::filesystem::path resolve(const std::string& relativePath,
                                  const std::string& chunkType) const;

    int chunksApplied() const { return m_chunksApplied; }
    void countChunk() { ++m_chunksApplied; }

private:
    std::filesystem::path m_gamePath;
    SqpkPlatform m_platform;
    ApplyOptions m_options;
    SqexFileStore m_store;
    int m_chunksApplied = 0;
};

/**
 * @class PatchInstaller
 * @brief Applies one ZiPatch file to a game directory
 *
 * Chunks are applied strictly in file order. A decode or apply error stops
 * the patch where it is; nothing is rolled back.
 */
class PatchInstaller {
public:
    struct Options {
        bool verifyChecksums = true;
        SqpkPlatform platform = SqpkPlatform::Win32;
    };

    /// Called after each chunk with (bytes consumed, patch file size)
    using ProgressCallback = std::function<void(qint64, qint64)>;

    explicit PatchInstaller(std::filesystem::path gamePath);
    PatchInstaller(std::filesystem::path gamePath, Options options);

    void setProgressCallback(ProgressCallback callback) { m_progressCallback = std::move(callback); }

    /**
     * Apply every chunk of a patch file
     *
     * @return true if the patch reached its end, false if cancelled
     * @throws ChunkDecodeError, ChunkApplyError, FileStoreError
     */
    bool install(const std::filesystem::path& patchFile, const CancellationToken& cancel);

    /**
     * Apply chunks from an already-opened patch
     */
    bool install(ZiPatchFile& patch, const CancellationToken& cancel);

    /**
     * Number of chunks applied by the most recent install()
     */
    int lastChunkCount() const { return m_lastChunkCount; }

private:
    std::filesystem::path m_gamePath;
    Options m_options;
    ProgressCallback m_progressCallback;
    int m_lastChunkCount = 0;
};

} // namespace ffxiv::patch
