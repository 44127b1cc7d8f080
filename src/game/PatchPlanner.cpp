/**
 * FFXIV Updater - Patch Planner Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "PatchPlanner.hpp"

#include <algorithm>
#include <map>
#include <numeric>

#include <spdlog/spdlog.h>

namespace ffxiv {

qint64 UpdatePlan::totalSize() const {
    return std::accumulate(patches.begin(), patches.end(), qint64(0),
        [](qint64 sum, const PatchInfo& patch) { return sum + patch.size; });
}

std::vector<PatchInfo> PatchPlanner::plan(const std::vector<PatchInfo>& descriptors,
                                          const VersionVector& localVersions) {
    // std::map keeps repositories ascending; vectors keep manifest order
    std::map<int, std::vector<PatchInfo>> byRepository;
    for (const auto& patch : descriptors) {
        byRepository[patch.repository].push_back(patch);
    }

    std::vector<PatchInfo> required;
    for (auto& [repository, patches] : byRepository) {
        auto local = localVersions.find(repository);
        std::vector<PatchInfo> selected;

        if (local == localVersions.end()) {
            if (repository != GameVersion::BASE_REPOSITORY) {
                spdlog::debug("Skipping {}: not installed", GameVersion::repositoryName(repository).toStdString());
                continue;
            }
            spdlog::info("Base game version missing, planning full install ({} patches)", patches.size());
            selected = patches;
        } else {
            for (const auto& patch : patches) {
                if (GameVersion::isFullInstallPart(patch.version)) {
                    continue;
                }
                if (GameVersion::compare(patch.version, local->second) > 0) {
                    selected.push_back(patch);
                }
            }
        }

        std::stable_sort(selected.begin(), selected.end(),
            [](const PatchInfo& a, const PatchInfo& b) {
                return QString::compare(a.version, b.version, Qt::CaseSensitive) < 0;
            });

        required.insert(required.end(), selected.begin(), selected.end());
    }

    return required;
}

VersionVector PatchPlanner::latestVersions(const std::vector<PatchInfo>& descriptors) {
    VersionVector latest;
    for (const auto& patch : descriptors) {
        auto it = latest.find(patch.repository);
        if (it == latest.end() || QString::compare(patch.version, it->second, Qt::CaseSensitive) > 0) {
            latest[patch.repository] = patch.version;
        }
    }
    return latest;
}

UpdatePlan PatchPlanner::buildPlan(const std::vector<PatchInfo>& descriptors,
                                   const VersionVector& localVersions,
                                   std::optional<QString> serverLatestVersion) {
    UpdatePlan plan;
    plan.patches = PatchPlanner::plan(descriptors, localVersions);
    plan.localVersions = localVersions;
    plan.latestVersions = latestVersions(descriptors);
    plan.serverLatestVersion = std::move(serverLatestVersion);
    return plan;
}

} // namespace ffxiv
