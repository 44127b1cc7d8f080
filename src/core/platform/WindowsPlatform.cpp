/**
 * FFXIV Updater - Platform Implementation (Windows)
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#ifdef PLATFORM_WINDOWS

#include "Platform.hpp"

#include <spdlog/spdlog.h>

#include <ShlObj.h>
#include <windows.h>

namespace ffxiv {

namespace {

std::filesystem::path getKnownFolderPath(REFKNOWNFOLDERID folderId) {
    PWSTR path = nullptr;
    if (SUCCEEDED(SHGetKnownFolderPath(folderId, 0, nullptr, &path))) {
        std::filesystem::path result(path);
        CoTaskMemFree(path);
        return result;
    }
    return {};
}

/**
 * Root paths ("C:\") of every fixed drive
 */
std::vector<std::filesystem::path> getFixedDrives() {
    std::vector<std::filesystem::path> drives;
    DWORD mask = GetLogicalDrives();
    for (int i = 0; i < 26; ++i) {
        if (!(mask & (1u << i))) {
            continue;
        }
        wchar_t root[] = {static_cast<wchar_t>(L'A' + i), L':', L'\\', L'\0'};
        if (GetDriveTypeW(root) == DRIVE_FIXED) {
            drives.emplace_back(root);
        }
    }
    return drives;
}

}  // namespace

std::filesystem::path Platform::getConfigPath() {
    auto appData = getKnownFolderPath(FOLDERID_RoamingAppData);
    if (!appData.empty()) {
        return appData / "ffxiv-updater";
    }
    return std::filesystem::path("ffxiv-updater");
}

std::filesystem::path Platform::getDataPath() {
    auto localAppData = getKnownFolderPath(FOLDERID_LocalAppData);
    if (!localAppData.empty()) {
        return localAppData / "ffxiv-updater";
    }
    return std::filesystem::path("ffxiv-updater");
}

std::filesystem::path Platform::getCachePath() {
    return getDataPath() / "cache";
}

std::vector<std::filesystem::path> Platform::detectGameInstallations() {
    std::vector<std::filesystem::path> installations;

    for (const auto& drive : getFixedDrives()) {
        for (const auto& relative : installRelativePaths()) {
            auto candidate = drive / relative;
            if (isValidGameInstall(candidate)) {
                spdlog::info("Found game installation: {}", candidate.string());
                installations.push_back(candidate);
            }
        }
    }

    return installations;
}

} // namespace ffxiv

#endif // PLATFORM_WINDOWS
