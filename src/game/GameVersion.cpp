/**
 * FFXIV Updater - Game Version Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "GameVersion.hpp"

#include "core/Errors.hpp"

#include <QFile>
#include <QRegularExpression>

#include <spdlog/spdlog.h>

namespace ffxiv {

bool GameVersion::isValid(const QString& version) {
    static const QRegularExpression pattern(
        QStringLiteral("^\\d{4}\\.\\d{2}\\.\\d{2}\\.\\d{4}\\.\\d{4}$"));
    return pattern.match(version).hasMatch();
}

int GameVersion::compare(const QString& a, const QString& b) {
    if (!isValid(a)) {
        throw VersionFormatError(a.toStdString());
    }
    if (!isValid(b)) {
        throw VersionFormatError(b.toStdString());
    }
    return QString::compare(a, b, Qt::CaseSensitive);
}

bool GameVersion::isFullInstallPart(const QString& version) {
    return version.startsWith(QLatin1String(FULL_INSTALL_PREFIX));
}

QString GameVersion::repositoryName(int repository) {
    return QStringLiteral("ex%1").arg(repository);
}

std::filesystem::path GameVersion::versionFilePath(const std::filesystem::path& gameRoot, int repository) {
    if (repository == BASE_REPOSITORY) {
        return gameRoot / "game" / "ffxivgame.ver";
    }
    auto name = repositoryName(repository).toStdString();
    return gameRoot / "game" / "sqpack" / name / (name + ".ver");
}

std::optional<QString> GameVersion::readVersion(const std::filesystem::path& gameRoot, int repository) {
    auto path = versionFilePath(gameRoot, repository);
    QFile file(QString::fromStdString(path.string()));
    if (!file.exists()) {
        return std::nullopt;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        spdlog::warn("Cannot read version file {}: {}", path.string(), file.errorString().toStdString());
        return std::nullopt;
    }

    QString version = QString::fromUtf8(file.readAll()).trimmed();
    if (version.isEmpty()) {
        return std::nullopt;
    }
    if (!isValid(version)) {
        spdlog::warn("Version file {} contains malformed version '{}'", path.string(), version.toStdString());
    }
    return version;
}

VersionVector GameVersion::readLocalVersions(const std::filesystem::path& gameRoot) {
    VersionVector versions;
    for (int repository = BASE_REPOSITORY; repository <= MAX_EXPANSION; ++repository) {
        if (auto version = readVersion(gameRoot, repository)) {
            versions[repository] = *version;
        }
    }
    return versions;
}

void GameVersion::writeVersion(const std::filesystem::path& gameRoot, int repository, const QString& version) {
    if (!isValid(version)) {
        throw VersionFormatError(version.toStdString());
    }

    auto path = versionFilePath(gameRoot, repository);
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
        throw FileStoreError("Failed to create " + path.parent_path().string() + ": " + ec.message());
    }

    QFile file(QString::fromStdString(path.string()));
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        throw FileStoreError("Failed to open " + path.string() + ": " + file.errorString().toStdString());
    }
    QByteArray data = version.toUtf8();
    if (file.write(data) != data.size() || !file.flush()) {
        throw FileStoreError("Failed to write " + path.string() + ": " + file.errorString().toStdString());
    }

    spdlog::info("{} is now at version {}", repositoryName(repository).toStdString(), version.toStdString());
}

} // namespace ffxiv
