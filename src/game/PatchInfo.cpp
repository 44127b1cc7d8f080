/**
 * FFXIV Updater - Patch Descriptor Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "PatchInfo.hpp"
#include "GameVersion.hpp"

#include <QUrl>

#include <array>

namespace ffxiv {

QString PatchInfo::fileName() const {
    QString path = QUrl(url).path();
    return path.mid(path.lastIndexOf('/') + 1);
}

QString PatchInfo::repositoryName() const {
    return GameVersion::repositoryName(repository);
}

QString PatchInfo::localPath() const {
    return repositoryName() + "/" + fileName();
}

QString PatchInfo::formattedSize() const {
    return formatBytes(size);
}

QString PatchInfo::toString() const {
    return QStringLiteral("%1/%2 (%3)").arg(repositoryName(), version, formattedSize());
}

QString formatBytes(qint64 bytes) {
    static const std::array<const char*, 5> units = {"B", "KB", "MB", "GB", "TB"};

    double size = static_cast<double>(bytes);
    size_t order = 0;
    while (size >= 1024.0 && order < units.size() - 1) {
        size /= 1024.0;
        ++order;
    }

    QString number = QString::number(size, 'f', 2);
    while (number.contains('.') && (number.endsWith('0') || number.endsWith('.'))) {
        number.chop(1);
    }
    return number + " " + units[order];
}

} // namespace ffxiv
