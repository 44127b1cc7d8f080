/**
 * FFXIV Updater - Version Check Client Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "VersionCheckClient.hpp"
#include "HttpClient.hpp"

#include "core/Errors.hpp"

#include <QRegularExpression>
#include <QStringList>

#include <spdlog/spdlog.h>

namespace ffxiv {

namespace {
    constexpr int MANIFEST_FIELD_COUNT = 9;

    qint64 parseNumber(const QString& field, const char* name) {
        bool ok = false;
        qint64 value = field.toLongLong(&ok);
        if (!ok || value < 0) {
            throw ProtocolError(std::string("bad ") + name + " field '" + field.toStdString() + "'");
        }
        return value;
    }

    bool isManifestMetadata(const QString& line) {
        return line.startsWith("--") ||
               line.startsWith("Content-") ||
               line.startsWith("X-");
    }
}

VersionCheckClient::VersionCheckClient(HttpClient& http)
    : VersionCheckClient(http, Settings{})
{
}

VersionCheckClient::VersionCheckClient(HttpClient& http, Settings settings)
    : m_http(http)
    , m_settings(std::move(settings))
{
}

QByteArray VersionCheckClient::buildRequestBody(const VersionVector& localVersions) {
    // The leading newline stands in for the boot version hash list
    QByteArray body("\n");
    for (int expansion = 1; expansion <= GameVersion::MAX_EXPANSION; ++expansion) {
        auto it = localVersions.find(expansion);
        if (it == localVersions.end()) {
            continue;
        }
        body += "ex" + QByteArray::number(expansion) + "\t" + it->second.toUtf8() + "\n";
    }
    return body;
}

QString VersionCheckClient::versionCheckUrl(const QString& baseVersion) const {
    return QStringLiteral("http://%1/http/win32/%2/%3/")
        .arg(m_settings.host, m_settings.product, baseVersion);
}

std::optional<VersionCheckResponse> VersionCheckClient::checkVersion(const VersionVector& localVersions) {
    auto base = localVersions.find(GameVersion::BASE_REPOSITORY);
    if (base == localVersions.end()) {
        throw VersionFormatError("");
    }
    if (!GameVersion::isValid(base->second)) {
        throw VersionFormatError(base->second.toStdString());
    }

    QString url = versionCheckUrl(base->second);
    spdlog::info("Checking game version at {}", url.toStdString());

    HttpHeaders headers;
    headers["X-Hash-Check"] = "enabled";
    HttpResponse response = m_http.post(url, buildRequestBody(localVersions), headers);

    std::optional<QString> latestVersion;
    if (auto header = response.header("X-Latest-Version")) {
        latestVersion = QString::fromUtf8(*header).trimmed();
        spdlog::info("Server reports latest version {}", latestVersion->toStdString());
    }

    if (response.statusCode == 204) {
        spdlog::info("Game is up to date");
        return std::nullopt;
    }
    if (!response.isSuccess()) {
        throw NetworkError("Version check failed with HTTP status " + std::to_string(response.statusCode),
                           response.statusCode);
    }

    QString body = QString::fromUtf8(response.body);
    if (!body.contains(m_settings.patchUrlScheme)) {
        spdlog::info("Version check returned no patch URLs");
        return std::nullopt;
    }

    return VersionCheckResponse{body, latestVersion};
}

std::vector<PatchInfo> VersionCheckClient::parseManifest(const QString& body) const {
    std::vector<PatchInfo> patches;

    const QStringList lines = body.split('\n');
    for (const QString& rawLine : lines) {
        QString line = rawLine.trimmed();
        if (line.isEmpty() || isManifestMetadata(line)) {
            continue;
        }

        try {
            patches.push_back(parseManifestLine(line));
        } catch (const ProtocolError& e) {
            spdlog::debug("Dropping manifest line '{}': {}", line.toStdString(), e.what());
        }
    }

    spdlog::info("Manifest lists {} patches", patches.size());
    return patches;
}

PatchInfo VersionCheckClient::parseManifestLine(const QString& line) const {
    static const QRegularExpression repositoryPattern(QStringLiteral("/ex([1-5])/"));

    const QStringList fields = line.split('\t');
    if (fields.size() < MANIFEST_FIELD_COUNT) {
        throw ProtocolError("expected " + std::to_string(MANIFEST_FIELD_COUNT) + " fields, got "
                            + std::to_string(fields.size()));
    }

    PatchInfo patch;
    patch.url = fields[8].trimmed();
    if (!patch.url.startsWith(m_settings.patchUrlScheme)) {
        throw ProtocolError("URL does not start with " + m_settings.patchUrlScheme.toStdString());
    }

    patch.size = parseNumber(fields[0], "size");
    patch.totalSize = parseNumber(fields[1], "total size");
    patch.count = static_cast<int>(parseNumber(fields[2], "count"));
    patch.parts = static_cast<int>(parseNumber(fields[3], "parts"));

    patch.version = fields[4].trimmed();
    if (!GameVersion::isValid(patch.version)) {
        throw ProtocolError("malformed version '" + patch.version.toStdString() + "'");
    }

    patch.hashType = fields[5].trimmed();
    patch.hashBlockSize = fields[6].trimmed().isEmpty() ? 0 : parseNumber(fields[6], "block size");
    patch.hashes = fields[7].split(',', Qt::SkipEmptyParts);

    auto match = repositoryPattern.match(patch.url);
    patch.repository = match.hasMatch() ? match.captured(1).toInt() : GameVersion::BASE_REPOSITORY;

    return patch;
}

} // namespace ffxiv
