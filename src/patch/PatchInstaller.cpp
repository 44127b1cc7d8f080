/**
 * @file PatchInstaller.cpp
 * @brief Implementation of the install session and the patch installer
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "PatchInstaller.hpp"
#include "ChunkApplier.hpp"
#include "ZiPatchFile.hpp"

#include "core/Errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace ffxiv::patch {

InstallSession::InstallSession(std::filesystem::path gamePath, SqpkPlatform platform)
    : m_gamePath(std::move(gamePath))
    , m_platform(platform)
{
}

std::filesystem::path InstallSession::resolve(const std::string& relativePath,
                                              const std::string& chunkType) const {
    std::string normalized = relativePath;
    std::replace(normalized.begin(), normalized.end(), '\\', '/');

    // Directory chunks name their target relative to the game directory with
    // a leading separator, e.g. "\sqpack\ex1".
    if (!normalized.empty() && normalized.front() == '/') {
        normalized.erase(0, 1);
    }

    bool hasDrive = normalized.size() > 1 && normalized[1] == ':';
    std::filesystem::path relative(normalized);
    if (hasDrive || relative.has_root_directory() || relative.is_absolute()) {
        throw ChunkApplyError(chunkType, relativePath, "absolute paths are not allowed");
    }

    relative = relative.lexically_normal();
    for (const auto& part : relative) {
        if (part == "..") {
            throw ChunkApplyError(chunkType, relativePath, "path escapes the game directory");
        }
    }

    return (m_gamePath / relative).lexically_normal();
}

PatchInstaller::PatchInstaller(std::filesystem::path gamePath)
    : PatchInstaller(std::move(gamePath), Options{})
{
}

PatchInstaller::PatchInstaller(std::filesystem::path gamePath, Options options)
    : m_gamePath(std::move(gamePath))
    , m_options(options)
{
}

bool PatchInstaller::install(const std::filesystem::path& patchFile, const CancellationToken& cancel) {
    ZiPatchFile::Options readerOptions;
    readerOptions.verifyChecksums = m_options.verifyChecksums;

    auto patch = ZiPatchFile::open(patchFile, readerOptions);
    spdlog::info("Installing {} into {}", patchFile.filename().string(), m_gamePath.string());
    return install(patch, cancel);
}

bool PatchInstaller::install(ZiPatchFile& patch, const CancellationToken& cancel) {
    InstallSession session(m_gamePath, m_options.platform);
    m_lastChunkCount = 0;

    while (true) {
        if (cancel.isCancelled()) {
            spdlog::info("Install cancelled after {} chunks", session.chunksApplied());
            return false;
        }

        auto chunk = patch.next();
        if (!chunk) {
            break;
        }

        spdlog::trace("{} @{} {}", chunk->typeName(), chunk->offset, chunk->describe());
        applyChunk(*chunk, session);
        m_lastChunkCount = session.chunksApplied();

        if (m_progressCallback) {
            m_progressCallback(patch.position(), patch.size());
        }
    }

    session.store().flushAll();
    spdlog::debug("Applied {} chunks", session.chunksApplied());
    return true;
}

} // namespace ffxiv::patch
