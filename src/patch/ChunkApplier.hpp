/**
 * @file ChunkApplier.hpp
 * @brief Filesystem effects of decoded patch chunks
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include "ZiPatchChunk.hpp"

#include <filesystem>

namespace ffxiv::patch {

class InstallSession;

/**
 * Apply one chunk to the session's game directory
 *
 * Pack-file operations go through the session's handle store. Any I/O
 * failure is reported as ChunkApplyError carrying the chunk type and the
 * path that was being modified.
 *
 * @throws ChunkApplyError
 */
void applyChunk(const ZiPatchChunk& chunk, InstallSession& session);

/**
 * Whether a loose file survives a remove-all operation
 *
 * Variable files (*.var) and the opening movies 00000.bk2 to 00003.bk2
 * are kept.
 */
bool isKeptOnRemoveAll(const std::filesystem::path& file);

} // namespace ffxiv::patch
