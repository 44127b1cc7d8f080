/**
 * FFXIV Updater - Patch Planner
 *
 * Decides which manifest patches a local installation needs.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <optional>
#include <vector>

#include "GameVersion.hpp"
#include "PatchInfo.hpp"

namespace ffxiv {

/**
 * The ordered set of patches to apply, with the inputs it was built from
 */
struct UpdatePlan {
    std::vector<PatchInfo> patches;             // Grouped by repository, ascending version
    VersionVector localVersions;
    VersionVector latestVersions;               // Highest manifest version per repository
    std::optional<QString> serverLatestVersion; // X-Latest-Version header, if sent

    qint64 totalSize() const;
    int patchCount() const { return static_cast<int>(patches.size()); }
    bool isEmpty() const { return patches.empty(); }
    QString formattedTotalSize() const { return formatBytes(totalSize()); }
};

class PatchPlanner {
public:
    /**
     * Filter and order descriptors against the local versions
     *
     * - Base game missing locally: every base descriptor (fresh install)
     * - Expansion missing locally: skipped (not owned)
     * - Otherwise: full-install parts are dropped, and anything newer
     *   than the local version is kept
     *
     * @throws VersionFormatError if a compared version is malformed
     */
    static std::vector<PatchInfo> plan(const std::vector<PatchInfo>& descriptors,
                                       const VersionVector& localVersions);

    /**
     * Highest version per repository
     */
    static VersionVector latestVersions(const std::vector<PatchInfo>& descriptors);

    static UpdatePlan buildPlan(const std::vector<PatchInfo>& descriptors,
                                const VersionVector& localVersions,
                                std::optional<QString> serverLatestVersion = std::nullopt);
};

} // namespace ffxiv
