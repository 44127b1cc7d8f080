/**
 * @file ChunkApplier.cpp
 * @brief Per-chunk executors dispatched over the chunk payload variant
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "ChunkApplier.hpp"
#include "PatchInstaller.hpp"

#include "core/Errors.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <array>

namespace ffxiv::patch {

namespace {

    constexpr std::array<const char*, 4> KEPT_MOVIES = {
        "00000.bk2", "00001.bk2", "00002.bk2", "00003.bk2"
    };

    std::string expansionFolder(uint16_t expansionId) {
        return expansionId == 0 ? "ffxiv" : fmt::format("ex{}", expansionId);
    }

    /**
     * Visitor applying one payload. m_target is updated before any I/O so
     * a failure can be reported against the file being modified.
     */
    class ChunkExecutor {
    public:
        ChunkExecutor(const ZiPatchChunk& chunk, InstallSession& session)
            : m_chunk(chunk), m_session(session) {}

        const std::string& target() const { return m_target; }

        void operator()(const FileHeaderChunk& header) {
            spdlog::info("Patch header: {} v{}, {} entry files",
                         header.patchType, header.version, header.entryFiles);
        }

        void operator()(const ApplyOptionChunk& option) {
            switch (option.option) {
                case ApplyOptionKind::IgnoreMissing:
                    m_session.options().ignoreMissing = option.value;
                    break;
                case ApplyOptionKind::IgnoreOldMismatch:
                    m_session.options().ignoreOldMismatch = option.value;
                    break;
                default:
                    spdlog::debug("Unknown apply option {}", static_cast<uint32_t>(option.option));
                    break;
            }
        }

        void operator()(const AddDirectoryChunk& chunk) {
            auto dir = resolve(chunk.dirName);
            std::filesystem::create_directories(dir);
        }

        void operator()(const DeleteDirectoryChunk& chunk) {
            if (chunk.dirName.find_first_not_of("/\\") == std::string::npos) {
                fail("refusing to delete the game directory");
            }
            auto dir = resolve(chunk.dirName);

            if (!std::filesystem::exists(dir)) {
                spdlog::debug("Directory {} already absent", dir.string());
                return;
            }
            if (!std::filesystem::is_directory(dir)) {
                fail("not a directory");
            }
            if (!std::filesystem::is_empty(dir)) {
                fail("directory not empty");
            }
            m_session.store().releaseUnder(dir);
            std::filesystem::remove(dir);
        }

        void operator()(const EndOfFileChunk&) {
            m_session.store().flushAll();
        }

        void operator()(const OpaqueChunk&) {
        }

        void operator()(const SqpkAddData& op) {
            auto file = acquire(op.target.datPath(m_session.platform()));
            file->writeAt(op.blockOffset, op.blockData);
            file->wipe(op.blockOffset + op.blockData.size(), op.blockDeleteNumber);
        }

        void operator()(const SqpkDeleteData& op) {
            auto file = acquire(op.target.datPath(m_session.platform()));
            file->writeEmptyBlockAt(op.blockOffset, op.blockNumber);
        }

        void operator()(const SqpkExpandData& op) {
            auto file = acquire(op.target.datPath(m_session.platform()));
            file->writeEmptyBlockAt(op.blockOffset, op.blockNumber);
        }

        void operator()(const SqpkHeader& op) {
            auto path = op.fileKind == SqpkHeaderFileKind::Dat
                ? op.target.datPath(m_session.platform())
                : op.target.indexPath(m_session.platform());
            auto file = acquire(path);
            file->writeAt(op.writeOffset(), op.headerData);
        }

        void operator()(const SqpkFileOperation& op) {
            switch (op.operation) {
                case SqpkFileOperationKind::AddFile:
                    addFile(op);
                    break;
                case SqpkFileOperationKind::DeleteFile:
                    deleteFile(op);
                    break;
                case SqpkFileOperationKind::RemoveAll:
                    removeAll(op.expansionId);
                    break;
                case SqpkFileOperationKind::MakeDirTree:
                    std::filesystem::create_directories(resolve(op.path));
                    break;
                default:
                    m_target = op.path;
                    fail(fmt::format("unknown file operation '{}'", static_cast<char>(op.operation)));
            }
        }

        void operator()(const SqpkIndex& op) {
            // Index entries are rebuilt by the client; only the file has to exist
            acquire(op.target.indexPath(m_session.platform()));
            spdlog::trace("Index {} for hash {:016x}",
                          op.command == SqpkIndexCommand::Add ? "add" : "delete", op.fileHash);
        }

        void operator()(const SqpkPatchInfo& info) {
            spdlog::debug("Patch install size: {} bytes", info.installSize);
        }

        void operator()(const SqpkTargetInfo& info) {
            if (info.platform != m_session.platform()) {
                spdlog::info("Switching target platform to {}", platformName(info.platform));
            }
            m_session.setPlatform(info.platform);
        }

    private:
        [[noreturn]] void fail(const std::string& reason) const {
            throw ChunkApplyError(m_chunk.typeName(), m_target, reason);
        }

        std::filesystem::path resolve(const std::string& relative) {
            m_target = relative;
            return m_session.resolve(relative, m_chunk.typeName());
        }

        std::shared_ptr<SqexFile> acquire(const std::string& relative) {
            return m_session.store().acquire(resolve(relative));
        }

        void addFile(const SqpkFileOperation& op) {
            auto file = acquire(op.path);
            if (op.fileOffset == 0) {
                file->truncate(0);
            }

            qint64 position = op.fileOffset;
            for (const auto& block : op.blocks) {
                file->writeAt(position, block.data);
                position += block.data.size();
            }
        }

        void deleteFile(const SqpkFileOperation& op) {
            auto path = resolve(op.path);
            m_session.store().release(path);

            if (!std::filesystem::exists(path)) {
                if (m_session.options().ignoreMissing) {
                    spdlog::debug("File {} already absent", path.string());
                    return;
                }
                fail("file does not exist");
            }
            std::filesystem::remove(path);
        }

        void removeAll(uint16_t expansionId) {
            auto folder = expansionFolder(expansionId);
            for (const char* root : {"sqpack", "movie"}) {
                auto dir = resolve(std::string(root) + "/" + folder);
                if (!std::filesystem::is_directory(dir)) {
                    continue;
                }

                int removed = 0;
                for (const auto& entry : std::filesystem::directory_iterator(dir)) {
                    if (!entry.is_regular_file() || isKeptOnRemoveAll(entry.path())) {
                        continue;
                    }
                    m_target = entry.path().string();
                    m_session.store().release(entry.path());
                    std::filesystem::remove(entry.path());
                    ++removed;
                }
                spdlog::info("Removed {} files from {}", removed, dir.string());
            }
        }

        const ZiPatchChunk& m_chunk;
        InstallSession& m_session;
        std::string m_target;
    };

} // namespace

bool isKeptOnRemoveAll(const std::filesystem::path& file) {
    if (file.extension() == ".var") {
        return true;
    }
    auto name = file.filename().string();
    for (const char* movie : KEPT_MOVIES) {
        if (name == movie) {
            return true;
        }
    }
    return false;
}

void applyChunk(const ZiPatchChunk& chunk, InstallSession& session) {
    ChunkExecutor executor(chunk, session);
    try {
        std::visit(executor, chunk.payload);
    } catch (const FileStoreError& e) {
        throw ChunkApplyError(chunk.typeName(), executor.target(), e.what());
    } catch (const std::filesystem::filesystem_error& e) {
        throw ChunkApplyError(chunk.typeName(), executor.target(), e.code().message());
    }
    session.countChunk();
}

} // namespace ffxiv::patch
