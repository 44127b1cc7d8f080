/**
 * FFXIV Updater - Update Coordinator Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "UpdateCoordinator.hpp"
#include "GameVersion.hpp"

#include "core/Errors.hpp"
#include "core/config/ConfigManager.hpp"
#include "network/HttpClient.hpp"
#include "patch/PatchInstaller.hpp"

#include <algorithm>
#include <atomic>
#include <mutex>

#include <QCryptographicHash>
#include <QElapsedTimer>
#include <QFile>
#include <QThread>
#include <QtConcurrent/QtConcurrent>

#include <spdlog/spdlog.h>

namespace ffxiv {

namespace {
    constexpr int RETRY_WAIT_SLICE_MS = 50;

    /**
     * Unwinds a run when the cancellation token fires
     */
    struct OperationCancelled {};

    void throwIfCancelled(const CancellationToken& cancel) {
        if (cancel.isCancelled()) {
            throw OperationCancelled{};
        }
    }

    bool isActive(UpdateState state) {
        return state == UpdateState::CheckingVersion
            || state == UpdateState::Downloading
            || state == UpdateState::Installing;
    }

    std::filesystem::path toPath(const QString& path) {
        return std::filesystem::path(path.toStdString());
    }
}

const char* updateStateName(UpdateState state) {
    switch (state) {
        case UpdateState::Idle: return "Idle";
        case UpdateState::CheckingVersion: return "CheckingVersion";
        case UpdateState::Downloading: return "Downloading";
        case UpdateState::Installing: return "Installing";
        case UpdateState::Completed: return "Completed";
        case UpdateState::Failed: return "Failed";
        case UpdateState::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

QString UpdateProgress::formattedSpeed() const {
    return formatBytes(bytesPerSecond) + "/s";
}

QString UpdateProgress::formattedRemaining() const {
    if (remainingSeconds < 0) {
        return QStringLiteral("--:--");
    }
    int hours = remainingSeconds / 3600;
    int minutes = (remainingSeconds % 3600) / 60;
    int seconds = remainingSeconds % 60;
    if (hours > 0) {
        return QStringLiteral("%1:%2:%3").arg(hours)
            .arg(minutes, 2, 10, QLatin1Char('0'))
            .arg(seconds, 2, 10, QLatin1Char('0'));
    }
    return QStringLiteral("%1:%2").arg(minutes).arg(seconds, 2, 10, QLatin1Char('0'));
}

UpdateSettings UpdateSettings::fromConfig(const ProgramConfig& config,
                                          const std::filesystem::path& patchDirectory) {
    UpdateSettings settings;
    settings.patchDirectory = patchDirectory;
    settings.maxDownloadAttempts = std::max(1, config.maxDownloadAttempts);
    settings.retryDelayMs = std::max(0, config.retryDelayMs);
    settings.speedUpdateIntervalMs = std::max(0, config.speedUpdateIntervalMs);
    settings.verifyPatchHashes = config.verifyPatchHashes;
    settings.verifyChunkChecksums = config.verifyChunkChecksums;
    settings.keepPatchFiles = config.keepPatchFiles;
    return settings;
}

class UpdateCoordinator::Impl {
public:
    Impl(HttpClient& http, VersionCheckClient::Settings versionSettings, UpdateSettings settings)
        : m_http(http)
        , m_versionSettings(std::move(versionSettings))
        , m_settings(std::move(settings))
    {
    }

    // --- Check ---

    UpdateCheckResult checkForUpdates(const std::filesystem::path& gameRoot) {
        UpdateCheckResult result;

        UpdateState current = m_state.load();
        do {
            if (isActive(current)) {
                spdlog::warn("Refusing to check for updates while {} is running", updateStateName(current));
                result.errorMessage = "An update is already in progress";
                return result;
            }
        } while (!m_state.compare_exchange_weak(current, UpdateState::CheckingVersion));

        setError(QString(), nullptr);
        reportStatus("Reading local game version...");

        result.plan.localVersions = GameVersion::readLocalVersions(gameRoot);
        if (!result.plan.localVersions.count(GameVersion::BASE_REPOSITORY)) {
            auto path = GameVersion::versionFilePath(gameRoot, GameVersion::BASE_REPOSITORY);
            result.errorMessage = QString("Game version file not found: %1")
                .arg(QString::fromStdString(path.string()));
            spdlog::error("{}", result.errorMessage.toStdString());
            fail(result.errorMessage, nullptr);
            return result;
        }

        for (const auto& [repository, version] : result.plan.localVersions) {
            spdlog::info("Local {} = {}", GameVersion::repositoryName(repository).toStdString(),
                         version.toStdString());
        }

        try {
            reportStatus("Checking server version...");
            VersionCheckClient client(m_http, m_versionSettings);
            auto response = client.checkVersion(result.plan.localVersions);

            if (!response) {
                result.needsUpdate = false;
                reportStatus("Game is up to date");
            } else {
                auto descriptors = client.parseManifest(response->manifest);
                auto local = result.plan.localVersions;
                result.plan = PatchPlanner::buildPlan(descriptors, local, response->latestVersion);
                result.needsUpdate = !result.plan.isEmpty();

                if (result.needsUpdate) {
                    reportStatus(QString("%1 patches required (%2)")
                        .arg(result.plan.patchCount())
                        .arg(result.plan.formattedTotalSize()));
                } else {
                    reportStatus("Game is up to date");
                }
            }

            m_state = UpdateState::Idle;
        } catch (const UpdaterError& e) {
            result.needsUpdate = false;
            result.errorMessage = QString::fromStdString(e.what());
            spdlog::error("Update check failed: {}", e.what());
            fail(result.errorMessage, std::current_exception());
        }

        return result;
    }

    // --- Apply ---

    UpdateOutcome applyUpdate(const std::filesystem::path& gameRoot,
                              const UpdatePlan& plan,
                              const CancellationToken& cancel) {
        UpdateState current = m_state.load();
        do {
            if (isActive(current)) {
                spdlog::warn("Refusing to start an update while {} is running", updateStateName(current));
                return UpdateOutcome::Failed;
            }
        } while (!m_state.compare_exchange_weak(current, UpdateState::Downloading));

        setError(QString(), nullptr);

        try {
            reportStatus("Starting download...");
            downloadPatches(plan.patches, cancel);

            m_state = UpdateState::Installing;
            reportStatus("Starting install...");
            installPatches(gameRoot, plan.patches, cancel);

            m_state = UpdateState::Completed;
            reportStatus("Update complete");
            reportProgress(100.0);
            return UpdateOutcome::Completed;
        } catch (const OperationCancelled&) {
            m_state = UpdateState::Cancelled;
            spdlog::info("Update cancelled");
            reportStatus("Update cancelled");
            return UpdateOutcome::Cancelled;
        } catch (const std::exception& e) {
            spdlog::error("Update failed: {}", e.what());
            fail(QString::fromStdString(e.what()), std::current_exception());
            reportStatus(QString("Update failed: %1").arg(m_errorMessage));
            return UpdateOutcome::Failed;
        }
    }

    std::filesystem::path patchFilePath(const PatchInfo& patch) const {
        return m_settings.patchDirectory / toPath(patch.repositoryName()) / toPath(patch.fileName());
    }

    // --- State ---

    UpdateState state() const { return m_state.load(); }

    QString errorMessage() const {
        std::lock_guard<std::mutex> lock(m_errorMutex);
        return m_errorMessage;
    }

    std::exception_ptr lastError() const {
        std::lock_guard<std::mutex> lock(m_errorMutex);
        return m_lastError;
    }

    StatusCallback statusCallback;
    ProgressCallback progressCallback;
    DetailedProgressCallback detailedProgressCallback;

private:
    void downloadPatches(const std::vector<PatchInfo>& patches, const CancellationToken& cancel) {
        std::error_code ec;
        std::filesystem::create_directories(m_settings.patchDirectory, ec);
        if (ec) {
            throw FileStoreError("Failed to create patch directory " + m_settings.patchDirectory.string()
                                 + ": " + ec.message());
        }

        m_totalBytes = 0;
        for (const auto& patch : patches) {
            m_totalBytes += patch.size;
        }
        m_completedBytes = 0;
        m_transferredBytes = 0;
        m_lastSpeedUpdateMs = 0;
        m_stopwatch.start();

        const int total = static_cast<int>(patches.size());
        for (int i = 0; i < total; ++i) {
            throwIfCancelled(cancel);

            const PatchInfo& patch = patches[i];
            auto destination = patchFilePath(patch);

            reportStatus(QString("Downloading (%1/%2): %3").arg(i + 1).arg(total).arg(patch.fileName()));
            m_progress = UpdateProgress{};
            m_progress.phase = UpdatePhase::Downloading;
            m_progress.currentFile = i + 1;
            m_progress.totalFiles = total;
            m_progress.currentFileName = patch.fileName();
            m_progress.totalBytes = m_totalBytes;
            m_progress.processedBytes = m_completedBytes;
            reportDetailedProgress(m_progress);

            if (std::filesystem::exists(destination, ec)
                && static_cast<qint64>(std::filesystem::file_size(destination, ec)) == patch.size && !ec) {
                spdlog::info("{} already downloaded", patch.fileName().toStdString());
                reportStatus(QString("Already downloaded: %1").arg(patch.fileName()));
                m_completedBytes += patch.size;
                reportProgress(percentOf(m_completedBytes, m_totalBytes));
                continue;
            }

            std::filesystem::create_directories(destination.parent_path(), ec);
            if (ec) {
                throw FileStoreError("Failed to create " + destination.parent_path().string() + ": " + ec.message());
            }

            downloadWithRetry(patch, destination, cancel);

            qint64 actual = static_cast<qint64>(std::filesystem::file_size(destination, ec));
            if (ec) {
                actual = -1;
            }
            if (actual != patch.size) {
                std::filesystem::remove(destination, ec);
                throw SizeMismatchError(patch.fileName().toStdString(), patch.size, actual);
            }

            verifyHashes(patch, destination, cancel);
            m_completedBytes += patch.size;
        }

        spdlog::info("Downloaded {} in {} s", formatBytes(m_transferredBytes).toStdString(),
                     m_stopwatch.elapsed() / 1000);
    }

    void downloadWithRetry(const PatchInfo& patch,
                           const std::filesystem::path& destination,
                           const CancellationToken& cancel) {
        const int attempts = std::max(1, m_settings.maxDownloadAttempts);
        std::string lastError;

        for (int attempt = 1; attempt <= attempts; ++attempt) {
            throwIfCancelled(cancel);

            qint64 attemptBytes = 0;
            auto onProgress = [this, &attemptBytes](qint64 received, qint64) {
                m_transferredBytes += received - attemptBytes;
                attemptBytes = received;
                onDownloadProgress(received);
            };

            DownloadResult result = m_http.download(patch.url, destination, onProgress, cancel);

            switch (result.status) {
                case DownloadStatus::Success:
                    return;
                case DownloadStatus::Cancelled:
                    throw OperationCancelled{};
                case DownloadStatus::FatalError:
                    throw NetworkError("Download of " + patch.fileName().toStdString() + " failed: "
                                       + result.errorMessage, result.httpStatus);
                case DownloadStatus::RetryableError:
                    break;
            }

            lastError = result.errorMessage;
            spdlog::warn("Download of {} failed (attempt {}/{}): {}", patch.fileName().toStdString(),
                         attempt, attempts, lastError);
            reportStatus(QString("Download error (attempt %1/%2): %3")
                .arg(attempt).arg(attempts).arg(QString::fromStdString(lastError)));

            if (attempt < attempts) {
                waitBeforeRetry(m_settings.retryDelayMs * attempt, cancel);
            }
        }

        throw NetworkError("Download of " + patch.fileName().toStdString() + " failed after "
                           + std::to_string(attempts) + " attempts: " + lastError);
    }

    void waitBeforeRetry(int delayMs, const CancellationToken& cancel) {
        QElapsedTimer waited;
        waited.start();
        while (waited.elapsed() < delayMs) {
            throwIfCancelled(cancel);
            qint64 remaining = delayMs - waited.elapsed();
            QThread::msleep(static_cast<unsigned long>(std::min<qint64>(remaining, RETRY_WAIT_SLICE_MS)));
        }
        throwIfCancelled(cancel);
    }

    void onDownloadProgress(qint64 receivedThisFile) {
        qint64 done = m_completedBytes + receivedThisFile;
        reportProgress(percentOf(done, m_totalBytes));

        qint64 elapsedMs = m_stopwatch.elapsed();
        if (elapsedMs - m_lastSpeedUpdateMs < m_settings.speedUpdateIntervalMs) {
            return;
        }
        m_lastSpeedUpdateMs = elapsedMs;

        m_progress.processedBytes = done;
        if (elapsedMs > 0) {
            double bytesPerSecond = static_cast<double>(m_transferredBytes) * 1000.0 / elapsedMs;
            m_progress.bytesPerSecond = static_cast<qint64>(bytesPerSecond);
            m_progress.remainingSeconds = bytesPerSecond > 0
                ? static_cast<int>(std::max<qint64>(0, m_totalBytes - done) / bytesPerSecond)
                : -1;
        }
        reportDetailedProgress(m_progress);
    }

    /**
     * Check SHA-1 block hashes from the manifest
     *
     * Descriptors without usable hash data are accepted with a warning.
     */
    void verifyHashes(const PatchInfo& patch, const std::filesystem::path& file,
                      const CancellationToken& cancel) {
        if (!m_settings.verifyPatchHashes || patch.hashes.isEmpty()) {
            return;
        }
        if (patch.hashType.compare("sha1", Qt::CaseInsensitive) != 0) {
            spdlog::warn("Unsupported hash type '{}' for {}, skipping verification",
                         patch.hashType.toStdString(), patch.fileName().toStdString());
            return;
        }
        if (patch.hashBlockSize <= 0) {
            spdlog::warn("No hash block size for {}, skipping verification", patch.fileName().toStdString());
            return;
        }
        qint64 expectedBlocks = (patch.size + patch.hashBlockSize - 1) / patch.hashBlockSize;
        if (expectedBlocks != patch.hashes.size()) {
            spdlog::warn("{} lists {} hashes for {} blocks, skipping verification",
                         patch.fileName().toStdString(), patch.hashes.size(), expectedBlocks);
            return;
        }

        reportStatus(QString("Verifying %1...").arg(patch.fileName()));

        QFile input(QString::fromStdString(file.string()));
        if (!input.open(QIODevice::ReadOnly)) {
            throw FileStoreError("Failed to open " + file.string() + " for verification: "
                                 + input.errorString().toStdString());
        }

        for (int block = 0; block < patch.hashes.size(); ++block) {
            throwIfCancelled(cancel);

            QByteArray data = input.read(patch.hashBlockSize);
            QByteArray digest = QCryptographicHash::hash(data, QCryptographicHash::Sha1).toHex();
            if (QString::fromLatin1(digest).compare(patch.hashes[block].trimmed(), Qt::CaseInsensitive) != 0) {
                input.close();
                std::error_code ec;
                std::filesystem::remove(file, ec);
                throw HashMismatchError(patch.fileName().toStdString(), block);
            }
        }

        spdlog::debug("Verified {} hash blocks of {}", patch.hashes.size(), patch.fileName().toStdString());
    }

    void installPatches(const std::filesystem::path& gameRoot,
                        const std::vector<PatchInfo>& patches,
                        const CancellationToken& cancel) {
        const int total = static_cast<int>(patches.size());

        patch::PatchInstaller::Options options;
        options.verifyChecksums = m_settings.verifyChunkChecksums;

        for (int i = 0; i < total; ++i) {
            throwIfCancelled(cancel);

            const PatchInfo& patch = patches[i];
            auto patchFile = patchFilePath(patch);

            reportStatus(QString("Installing (%1/%2): %3").arg(i + 1).arg(total).arg(patch.fileName()));
            reportProgress(percentOf(i, total));

            if (!std::filesystem::exists(patchFile)) {
                throw UpdaterError("Patch file not found: " + patchFile.string());
            }

            UpdateProgress progress;
            progress.phase = UpdatePhase::Installing;
            progress.currentFile = i + 1;
            progress.totalFiles = total;
            progress.currentFileName = patch.fileName();

            patch::PatchInstaller installer(gameRoot / "game", options);
            installer.setProgressCallback([&](qint64 position, qint64 size) {
                double fraction = size > 0 ? static_cast<double>(position) / size : 0.0;
                reportProgress((i + std::min(fraction, 1.0)) * 100.0 / total);
                progress.totalBytes = size;
                progress.processedBytes = position;
                reportDetailedProgress(progress);
            });

            try {
                if (!installer.install(patchFile, cancel)) {
                    throw OperationCancelled{};
                }
            } catch (const UpdaterError& e) {
                spdlog::error("Failed to install {}: {}", patch.fileName().toStdString(), e.what());
                throw;
            }

            GameVersion::writeVersion(gameRoot, patch.repository, patch.version);

            if (!m_settings.keepPatchFiles) {
                std::error_code ec;
                if (!std::filesystem::remove(patchFile, ec) || ec) {
                    spdlog::warn("Could not delete {}: {}", patchFile.string(), ec.message());
                }
            }
        }
    }

    static double percentOf(qint64 done, qint64 total) {
        if (total <= 0) {
            return 100.0;
        }
        return static_cast<double>(done) * 100.0 / static_cast<double>(total);
    }

    void fail(const QString& message, std::exception_ptr error) {
        setError(message, std::move(error));
        m_state = UpdateState::Failed;
    }

    void setError(const QString& message, std::exception_ptr error) {
        std::lock_guard<std::mutex> lock(m_errorMutex);
        m_errorMessage = message;
        m_lastError = std::move(error);
    }

    void reportStatus(const QString& status) {
        spdlog::debug("Status: {}", status.toStdString());
        if (statusCallback) {
            statusCallback(status);
        }
    }

    void reportProgress(double percent) {
        if (progressCallback) {
            progressCallback(std::clamp(percent, 0.0, 100.0));
        }
    }

    void reportDetailedProgress(const UpdateProgress& progress) {
        if (detailedProgressCallback) {
            detailedProgressCallback(progress);
        }
    }

    HttpClient& m_http;
    VersionCheckClient::Settings m_versionSettings;
    UpdateSettings m_settings;

    std::atomic<UpdateState> m_state{UpdateState::Idle};
    mutable std::mutex m_errorMutex;
    QString m_errorMessage;
    std::exception_ptr m_lastError;

    // Download accounting for the current run
    QElapsedTimer m_stopwatch;
    qint64 m_totalBytes = 0;
    qint64 m_completedBytes = 0;
    qint64 m_transferredBytes = 0;
    qint64 m_lastSpeedUpdateMs = 0;
    UpdateProgress m_progress;
};

UpdateCoordinator::UpdateCoordinator(HttpClient& http,
                                     VersionCheckClient::Settings versionSettings,
                                     UpdateSettings settings)
    : m_impl(std::make_unique<Impl>(http, std::move(versionSettings), std::move(settings)))
{
}

UpdateCoordinator::~UpdateCoordinator() = default;

void UpdateCoordinator::setStatusCallback(StatusCallback callback) {
    m_impl->statusCallback = std::move(callback);
}

void UpdateCoordinator::setProgressCallback(ProgressCallback callback) {
    m_impl->progressCallback = std::move(callback);
}

void UpdateCoordinator::setDetailedProgressCallback(DetailedProgressCallback callback) {
    m_impl->detailedProgressCallback = std::move(callback);
}

UpdateCheckResult UpdateCoordinator::checkForUpdates(const std::filesystem::path& gameRoot) {
    return m_impl->checkForUpdates(gameRoot);
}

UpdateOutcome UpdateCoordinator::applyUpdate(const std::filesystem::path& gameRoot,
                                             const UpdatePlan& plan,
                                             const CancellationToken& cancel) {
    return m_impl->applyUpdate(gameRoot, plan, cancel);
}

QFuture<UpdateCheckResult> UpdateCoordinator::checkForUpdatesAsync(const std::filesystem::path& gameRoot) {
    return QtConcurrent::run([this, gameRoot]() {
        return m_impl->checkForUpdates(gameRoot);
    });
}

QFuture<UpdateOutcome> UpdateCoordinator::applyUpdateAsync(const std::filesystem::path& gameRoot,
                                                           const UpdatePlan& plan,
                                                           const CancellationToken& cancel) {
    return QtConcurrent::run([this, gameRoot, plan, cancel]() {
        return m_impl->applyUpdate(gameRoot, plan, cancel);
    });
}

UpdateState UpdateCoordinator::state() const {
    return m_impl->state();
}

QString UpdateCoordinator::errorMessage() const {
    return m_impl->errorMessage();
}

std::exception_ptr UpdateCoordinator::lastError() const {
    return m_impl->lastError();
}

std::filesystem::path UpdateCoordinator::patchFilePath(const PatchInfo& patch) const {
    return m_impl->patchFilePath(patch);
}

} // namespace ffxiv
