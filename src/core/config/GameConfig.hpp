/**
 * FFXIV Updater - Game Configuration
 *
 * Installation path and the patch server endpoints for the game.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <string>

namespace ffxiv {

/**
 * Per-installation configuration, stored in game.json
 */
struct GameConfig {
    // Installation root (contains game/ and boot/)
    std::filesystem::path gameDirectory;

    // Version check service
    std::string versionCheckHost = "patch-gamever.ffxiv.com.tw";
    std::string product = "ffxivtc_release_tc_game";

    // Manifest URLs must start with this
    std::string patchUrlScheme = "http://";

    // Utility methods
    std::filesystem::path getGamePath() const;              // {root}/game, target of patch installs
    std::filesystem::path getClientExecutable() const;      // {root}/game/ffxiv_dx11.exe
    bool hasValidInstallation() const;

    // Serialization
    static GameConfig fromJson(const std::string& json);
    std::string toJson() const;
};

} // namespace ffxiv
