/**
 * FFXIV Updater - HTTP Transport
 *
 * Abstract HTTP transport used by the version check and the patch
 * downloader, with a Qt Network implementation.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include <QByteArray>
#include <QString>

#include "core/Cancellation.hpp"

namespace ffxiv {

using HttpHeaders = std::map<QByteArray, QByteArray>;

/**
 * Response of a buffered request
 */
struct HttpResponse {
    int statusCode = 0;
    QByteArray body;
    HttpHeaders headers;        // Names lower-cased

    bool isSuccess() const { return statusCode >= 200 && statusCode < 300; }

    /**
     * Case-insensitive header lookup
     */
    std::optional<QByteArray> header(const QByteArray& name) const;
};

/**
 * Outcome of a streamed download
 */
enum class DownloadStatus {
    Success,
    RetryableError,     // Transport failure, timeout, server error
    FatalError,         // Client error status or local file failure
    Cancelled
};

struct DownloadResult {
    DownloadStatus status = DownloadStatus::FatalError;
    std::string errorMessage;
    int httpStatus = 0;
    qint64 bytesReceived = 0;

    bool ok() const { return status == DownloadStatus::Success; }
};

/**
 * Called as data arrives with (bytes received so far, total or -1)
 */
using DownloadProgressCallback = std::function<void(qint64, qint64)>;

struct HttpClientSettings {
    QString userAgent = "FFXIV-Updater/1.0";
    int requestTimeoutMs = 30000;
    int downloadTimeoutMs = 60000;      // Restarted whenever data arrives
};

/**
 * Abstract HTTP transport
 *
 * Implementations must be usable from a worker thread.
 */
class HttpClient {
public:
    virtual ~HttpClient() = default;

    /**
     * POST a body and buffer the response
     *
     * Any HTTP status is returned to the caller.
     *
     * @throws NetworkError on transport failure or timeout
     */
    virtual HttpResponse post(
        const QString& url,
        const QByteArray& body,
        const HttpHeaders& headers
    ) = 0;

    /**
     * Stream a GET response to a file, replacing its content
     *
     * Cancellation is polled while the transfer is running and aborts it.
     */
    virtual DownloadResult download(
        const QString& url,
        const std::filesystem::path& destination,
        const DownloadProgressCallback& progress,
        const CancellationToken& cancel
    ) = 0;

    /**
     * Get the Qt Network implementation
     */
    static std::unique_ptr<HttpClient> create(const HttpClientSettings& settings);

protected:
    HttpClient() = default;
};

} // namespace ffxiv
