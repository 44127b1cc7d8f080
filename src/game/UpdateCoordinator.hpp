/**
 * FFXIV Updater - Update Coordinator
 *
 * Checks the server for pending patches, downloads them with retry and
 * installs them in order, recording each repository's version as its
 * patches complete.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <exception>
#include <filesystem>
#include <functional>
#include <memory>

#include <QFuture>
#include <QString>

#include "PatchPlanner.hpp"
#include "core/Cancellation.hpp"
#include "network/VersionCheckClient.hpp"

namespace ffxiv {

class HttpClient;
struct ProgramConfig;

enum class UpdateState {
    Idle,
    CheckingVersion,
    Downloading,
    Installing,
    Completed,
    Failed,
    Cancelled
};

const char* updateStateName(UpdateState state);

enum class UpdateOutcome {
    Completed,
    Cancelled,
    Failed
};

/**
 * Result of checkForUpdates()
 */
struct UpdateCheckResult {
    bool needsUpdate = false;
    UpdatePlan plan;
    QString errorMessage;       // Empty on success

    bool succeeded() const { return errorMessage.isEmpty(); }
};

enum class UpdatePhase {
    Downloading,
    Installing
};

/**
 * Detailed progress for one step of an update run
 */
struct UpdateProgress {
    UpdatePhase phase = UpdatePhase::Downloading;
    int currentFile = 0;            // 1-based
    int totalFiles = 0;
    QString currentFileName;
    qint64 totalBytes = 0;
    qint64 processedBytes = 0;
    qint64 bytesPerSecond = 0;
    int remainingSeconds = -1;      // -1 while unknown

    QString formattedSpeed() const;         // "1.5 MB/s"
    QString formattedRemaining() const;     // "m:ss" or "h:mm:ss"
};

/**
 * Tunables for a coordinator, normally taken from ProgramConfig
 */
struct UpdateSettings {
    std::filesystem::path patchDirectory;
    int maxDownloadAttempts = 3;
    int retryDelayMs = 2000;
    int speedUpdateIntervalMs = 500;
    bool verifyPatchHashes = true;
    bool verifyChunkChecksums = true;
    bool keepPatchFiles = true;

    static UpdateSettings fromConfig(const ProgramConfig& config,
                                     const std::filesystem::path& patchDirectory);
};

/**
 * Drives a full check / download / install run
 *
 * One run at a time: applyUpdate() refuses to start while another run is
 * downloading or installing. Callbacks are invoked on the thread running
 * the operation.
 */
class UpdateCoordinator {
public:
    using StatusCallback = std::function<void(const QString&)>;
    using ProgressCallback = std::function<void(double)>;
    using DetailedProgressCallback = std::function<void(const UpdateProgress&)>;

    UpdateCoordinator(HttpClient& http,
                      VersionCheckClient::Settings versionSettings,
                      UpdateSettings settings);
    ~UpdateCoordinator();

    UpdateCoordinator(const UpdateCoordinator&) = delete;
    UpdateCoordinator& operator=(const UpdateCoordinator&) = delete;

    void setStatusCallback(StatusCallback callback);
    void setProgressCallback(ProgressCallback callback);
    void setDetailedProgressCallback(DetailedProgressCallback callback);

    /**
     * Read local versions, ask the server and build the plan
     *
     * @param gameRoot Installation root (contains game/)
     */
    UpdateCheckResult checkForUpdates(const std::filesystem::path& gameRoot);

    /**
     * Download and install every patch in the plan
     */
    UpdateOutcome applyUpdate(const std::filesystem::path& gameRoot,
                              const UpdatePlan& plan,
                              const CancellationToken& cancel);

    QFuture<UpdateCheckResult> checkForUpdatesAsync(const std::filesystem::path& gameRoot);
    QFuture<UpdateOutcome> applyUpdateAsync(const std::filesystem::path& gameRoot,
                                            const UpdatePlan& plan,
                                            const CancellationToken& cancel);

    UpdateState state() const;
    QString errorMessage() const;

    /**
     * The error that ended the last failed run, if any
     */
    std::exception_ptr lastError() const;

    /**
     * {patchDirectory}/ex{n}/{fileName}
     */
    std::filesystem::path patchFilePath(const PatchInfo& patch) const;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace ffxiv
