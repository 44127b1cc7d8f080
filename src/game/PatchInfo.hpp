/**
 * FFXIV Updater - Patch Descriptor
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <QString>
#include <QStringList>

namespace ffxiv {

/**
 * Metadata for one downloadable patch, decoded from a manifest line:
 *
 *   {size}\t{totalSize}\t{count}\t{parts}\t{version}\t{hashType}\t{blockSize}\t{hashes}\t{url}
 */
struct PatchInfo {
    qint64 size = 0;                // Patch file size in bytes
    qint64 totalSize = 0;           // Cumulative size
    int count = 0;
    int parts = 0;
    QString version;                // e.g. "2025.05.29.0000.0000"
    int repository = 0;             // 0 = base game, 1-5 = expansions
    QString hashType;               // "sha1" when block hashes are present
    qint64 hashBlockSize = 0;
    QStringList hashes;
    QString url;

    /**
     * Last path segment of the URL, e.g. "D2025.05.29.0000.0000.patch"
     */
    QString fileName() const;

    QString repositoryName() const;

    /**
     * Storage path relative to the patch directory: "ex{n}/{fileName}"
     */
    QString localPath() const;

    QString formattedSize() const;

    /**
     * "ex1/2025.05.29.0000.0000 (349.85 MB)"
     */
    QString toString() const;
};

/**
 * Human-readable size with B/KB/MB/GB/TB units and up to two decimals
 */
QString formatBytes(qint64 bytes);

} // namespace ffxiv
