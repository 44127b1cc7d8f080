/**
 * FFXIV Updater - Platform Abstraction
 *
 * Cross-platform utilities for file paths and install detection.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <vector>

namespace ffxiv {

/**
 * Platform abstraction layer
 *
 * Provides platform-specific implementations for:
 * - Configuration paths
 * - Data directories
 * - Game installation detection
 */
class Platform {
public:
    /**
     * Get the configuration directory path
     *
     * Linux:   ~/.config/ffxiv-updater/
     * Windows: %APPDATA%\ffxiv-updater\
     */
    static std::filesystem::path getConfigPath();

    /**
     * Get the data directory path (downloaded patches)
     *
     * Linux:   ~/.local/share/ffxiv-updater/
     * Windows: %LOCALAPPDATA%\ffxiv-updater\
     */
    static std::filesystem::path getDataPath();

    /**
     * Get the cache directory path
     *
     * Linux:   ~/.cache/ffxiv-updater/
     * Windows: %LOCALAPPDATA%\ffxiv-updater\cache\
     */
    static std::filesystem::path getCachePath();

    /**
     * Detect existing game installations
     *
     * Searches the USERJOY GAMES install folders on fixed drives (Windows)
     * or inside Wine prefixes (Linux).
     */
    static std::vector<std::filesystem::path> detectGameInstallations();

    /**
     * A valid installation root contains game/ffxiv_dx11.exe
     */
    static bool isValidGameInstall(const std::filesystem::path& path);

    /**
     * Install folder names relative to a drive root
     */
    static const std::vector<std::filesystem::path>& installRelativePaths();

    static constexpr bool isLinux() {
#ifdef PLATFORM_LINUX
        return true;
#else
        return false;
#endif
    }

    static constexpr bool isWindows() {
#ifdef PLATFORM_WINDOWS
        return true;
#else
        return false;
#endif
    }
};

} // namespace ffxiv
