/**
 * FFXIV Updater - Game Version
 *
 * Version strings and the per-repository version files.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <map>
#include <optional>

#include <QString>

namespace ffxiv {

/**
 * Repository id (0 = base game, 1-5 = expansions) -> version string
 */
using VersionVector = std::map<int, QString>;

/**
 * Version strings of the form YYYY.MM.DD.XXXX.YYYY
 *
 * Every field is zero-padded, so ordinal string order is chronological
 * order. All comparison in the updater goes through compare(), which
 * refuses strings that would break that property.
 */
class GameVersion {
public:
    static constexpr int BASE_REPOSITORY = 0;
    static constexpr int MAX_EXPANSION = 5;

    /// Version prefix of the split full-install archive parts
    static constexpr const char* FULL_INSTALL_PREFIX = "2012.01.01";

    /**
     * Check the exact 4-2-2-4-4 digit shape
     */
    static bool isValid(const QString& version);

    /**
     * Ordinal comparison
     *
     * @return negative, zero or positive like strcmp
     * @throws VersionFormatError if either string is malformed
     */
    static int compare(const QString& a, const QString& b);

    static bool isFullInstallPart(const QString& version);

    /**
     * "ex0" for the base game, "ex{n}" otherwise
     */
    static QString repositoryName(int repository);

    /**
     * {root}/game/ffxivgame.ver or {root}/game/sqpack/ex{n}/ex{n}.ver
     */
    static std::filesystem::path versionFilePath(const std::filesystem::path& gameRoot, int repository);

    /**
     * Read one version file, trimmed
     *
     * @return nullopt if the file does not exist or is empty
     */
    static std::optional<QString> readVersion(const std::filesystem::path& gameRoot, int repository);

    /**
     * Read every repository's version file that exists
     */
    static VersionVector readLocalVersions(const std::filesystem::path& gameRoot);

    /**
     * Persist a repository version, creating the directory if needed
     *
     * @throws VersionFormatError if the version is malformed
     * @throws FileStoreError if the file cannot be written
     */
    static void writeVersion(const std::filesystem::path& gameRoot, int repository, const QString& version);
};

} // namespace ffxiv
