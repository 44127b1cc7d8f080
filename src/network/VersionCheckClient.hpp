/**
 * FFXIV Updater - Version Check Client
 *
 * Client for the Taiwan patch-gamever service, which answers a POST of
 * the local expansion versions with either 204 (up to date) or a patch
 * manifest.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <optional>
#include <vector>

#include <QByteArray>
#include <QString>

#include "game/GameVersion.hpp"
#include "game/PatchInfo.hpp"

namespace ffxiv {

class HttpClient;

/**
 * Body and headers of a version check that reported pending patches
 */
struct VersionCheckResponse {
    QString manifest;
    std::optional<QString> latestVersion;   // X-Latest-Version header
};

class VersionCheckClient {
public:
    struct Settings {
        QString host = "patch-gamever.ffxiv.com.tw";
        QString product = "ffxivtc_release_tc_game";
        QString patchUrlScheme = "http://";
    };

    explicit VersionCheckClient(HttpClient& http);
    VersionCheckClient(HttpClient& http, Settings settings);

    /**
     * "\n" followed by "ex{n}\t{version}\n" for each installed expansion
     */
    static QByteArray buildRequestBody(const VersionVector& localVersions);

    /**
     * http://{host}/http/win32/{product}/{baseVersion}/
     */
    QString versionCheckUrl(const QString& baseVersion) const;

    /**
     * Ask the server which patches the local versions need
     *
     * @return The manifest, or nullopt if there is nothing to update
     * @throws NetworkError on transport failure or an unexpected status
     * @throws VersionFormatError if the base version is missing or malformed
     */
    std::optional<VersionCheckResponse> checkVersion(const VersionVector& localVersions);

    /**
     * Decode manifest lines, dropping any that do not parse
     */
    std::vector<PatchInfo> parseManifest(const QString& body) const;

    /**
     * Decode one manifest line
     *
     * @throws ProtocolError describing why the line was rejected
     */
    PatchInfo parseManifestLine(const QString& line) const;

    const Settings& settings() const { return m_settings; }

private:
    HttpClient& m_http;
    Settings m_settings;
};

} // namespace ffxiv
