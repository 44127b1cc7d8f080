/**
 * FFXIV Updater - Qt Network HTTP Transport
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "HttpClient.hpp"

#include "core/Errors.hpp"

#include <QEventLoop>
#include <QFile>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>
#include <QUrl>

#include <spdlog/spdlog.h>

namespace ffxiv {

namespace {
    constexpr int CANCEL_POLL_INTERVAL_MS = 100;

    bool isClientError(int status) {
        return status >= 400 && status < 500 && status != 408 && status != 429;
    }
}

std::optional<QByteArray> HttpResponse::header(const QByteArray& name) const {
    auto it = headers.find(name.toLower());
    if (it != headers.end()) {
        return it->second;
    }
    return std::nullopt;
}

/**
 * One QNetworkAccessManager per call, driven by a local QEventLoop
 */
class QtHttpClient : public HttpClient {
public:
    explicit QtHttpClient(const HttpClientSettings& settings)
        : m_settings(settings) {}

    HttpResponse post(const QString& url, const QByteArray& body, const HttpHeaders& headers) override {
        spdlog::debug("POST {} ({} bytes)", url.toStdString(), body.size());

        QNetworkAccessManager manager;
        QNetworkRequest request{QUrl(url)};
        request.setHeader(QNetworkRequest::UserAgentHeader, m_settings.userAgent);
        for (const auto& [name, value] : headers) {
            request.setRawHeader(name, value);
        }

        QEventLoop loop;
        QNetworkReply* reply = manager.post(request, body);
        QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);

        QTimer timer;
        timer.setSingleShot(true);
        QObject::connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);
        timer.start(m_settings.requestTimeoutMs);

        loop.exec();

        if (!timer.isActive()) {
            spdlog::error("Request to {} timed out", url.toStdString());
            reply->abort();
            reply->deleteLater();
            throw NetworkError("Request timed out: " + url.toStdString());
        }
        timer.stop();

        HttpResponse response;
        response.statusCode = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();

        if (reply->error() != QNetworkReply::NoError && response.statusCode == 0) {
            QString errorMsg = reply->errorString();
            spdlog::error("Request to {} failed: {}", url.toStdString(), errorMsg.toStdString());
            reply->deleteLater();
            throw NetworkError(errorMsg.toStdString());
        }

        for (const auto& pair : reply->rawHeaderPairs()) {
            response.headers[pair.first.toLower()] = pair.second;
        }
        response.body = reply->readAll();
        reply->deleteLater();

        spdlog::debug("Response {} from {}, length: {}", response.statusCode, url.toStdString(),
                      response.body.size());
        return response;
    }

    DownloadResult download(
        const QString& url,
        const std::filesystem::path& destination,
        const DownloadProgressCallback& progress,
        const CancellationToken& cancel
    ) override {
        DownloadResult result;

        QFile file(QString::fromStdString(destination.string()));
        if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
            result.status = DownloadStatus::FatalError;
            result.errorMessage = "Failed to create " + destination.string() + ": "
                                  + file.errorString().toStdString();
            return result;
        }

        spdlog::info("Downloading {} -> {}", url.toStdString(), destination.string());

        QNetworkAccessManager manager;
        QNetworkRequest request{QUrl(url)};
        request.setHeader(QNetworkRequest::UserAgentHeader, m_settings.userAgent);
        request.setRawHeader("Cache-Control", "no-cache");
        request.setAttribute(QNetworkRequest::RedirectPolicyAttribute,
                             QNetworkRequest::NoLessSafeRedirectPolicy);

        QEventLoop loop;
        QNetworkReply* reply = manager.get(request);

        bool writeFailed = false;
        bool timedOut = false;
        bool cancelled = false;

        QTimer timer;
        timer.setSingleShot(true);
        QObject::connect(&timer, &QTimer::timeout, [&]() {
            timedOut = true;
            reply->abort();
        });

        QTimer cancelPoll;
        QObject::connect(&cancelPoll, &QTimer::timeout, [&]() {
            if (cancel.isCancelled()) {
                cancelled = true;
                reply->abort();
            }
        });

        auto drain = [&]() {
            QByteArray data = reply->readAll();
            if (data.isEmpty()) {
                return;
            }
            if (file.write(data) != data.size()) {
                writeFailed = true;
                reply->abort();
                return;
            }
            result.bytesReceived += data.size();
            if (progress) {
                qint64 total = reply->header(QNetworkRequest::ContentLengthHeader).toLongLong();
                progress(result.bytesReceived, total > 0 ? total : -1);
            }
        };

        QObject::connect(reply, &QNetworkReply::readyRead, [&]() {
            timer.start(m_settings.downloadTimeoutMs);
            drain();
        });
        QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);

        timer.start(m_settings.downloadTimeoutMs);
        cancelPoll.start(CANCEL_POLL_INTERVAL_MS);

        loop.exec();

        timer.stop();
        cancelPoll.stop();

        result.httpStatus = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();

        if (!cancelled && !timedOut && !writeFailed && reply->error() == QNetworkReply::NoError) {
            drain();
        }

        if (cancel.isCancelled() || cancelled) {
            result.status = DownloadStatus::Cancelled;
            result.errorMessage = "Download cancelled";
        } else if (writeFailed) {
            result.status = DownloadStatus::FatalError;
            result.errorMessage = "Failed to write " + destination.string() + ": "
                                  + file.errorString().toStdString();
        } else if (timedOut) {
            result.status = DownloadStatus::RetryableError;
            result.errorMessage = "Download stalled for " + std::to_string(m_settings.downloadTimeoutMs) + " ms";
        } else if (reply->error() != QNetworkReply::NoError) {
            result.status = isClientError(result.httpStatus)
                ? DownloadStatus::FatalError
                : DownloadStatus::RetryableError;
            result.errorMessage = reply->errorString().toStdString();
        } else if (result.httpStatus != 0 && (result.httpStatus < 200 || result.httpStatus >= 300)) {
            result.status = isClientError(result.httpStatus)
                ? DownloadStatus::FatalError
                : DownloadStatus::RetryableError;
            result.errorMessage = "HTTP status " + std::to_string(result.httpStatus);
        } else if (!file.flush()) {
            result.status = DownloadStatus::FatalError;
            result.errorMessage = "Failed to flush " + destination.string();
        } else {
            result.status = DownloadStatus::Success;
        }

        reply->deleteLater();
        file.close();

        if (!result.ok()) {
            spdlog::warn("Download of {} ended: {}", url.toStdString(), result.errorMessage);
        }
        return result;
    }

private:
    HttpClientSettings m_settings;
};

std::unique_ptr<HttpClient> HttpClient::create(const HttpClientSettings& settings) {
    return std::make_unique<QtHttpClient>(settings);
}

} // namespace ffxiv
