/**
 * FFXIV Updater - Configuration Manager
 *
 * Manages the program and game configuration files.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "GameConfig.hpp"

namespace ffxiv {

/**
 * Program-wide settings
 */
struct ProgramConfig {
    std::string logVerbosity = "info";                 // trace, debug, info, warning, error
    std::filesystem::path patchDirectory;              // Empty: {data}/patches

    // Download behavior
    int maxDownloadAttempts = 3;
    int retryDelayMs = 2000;                           // Multiplied by the attempt number
    int speedUpdateIntervalMs = 500;
    int downloadTimeoutMs = 60000;                     // Stall timeout while streaming
    int requestTimeoutMs = 30000;
    std::string userAgent = "FFXIV-Updater/1.0";

    // Integrity
    bool verifyPatchHashes = true;
    bool verifyChunkChecksums = true;

    bool keepPatchFiles = true;

    static ProgramConfig fromJson(const nlohmann::json& j);
    nlohmann::json toJson() const;
};

/**
 * Central configuration manager
 *
 * Handles loading, saving, and providing access to all configuration data.
 */
class ConfigManager {
public:
    static ConfigManager& instance();

    // Lifecycle
    bool initialize(const std::filesystem::path& configDirectory);
    bool save();

    // State queries
    bool isFirstRun() const { return m_isFirstRun; }
    const std::filesystem::path& configDirectory() const { return m_configDirectory; }

    // Program config
    const ProgramConfig& programConfig() const { return m_programConfig; }
    void setProgramConfig(const ProgramConfig& config);

    // Game config
    const GameConfig& gameConfig() const { return m_gameConfig; }
    void setGameConfig(const GameConfig& config);

    /**
     * Configured patch directory, or the platform default
     */
    std::filesystem::path patchDirectory() const;

private:
    ConfigManager() = default;
    ~ConfigManager() = default;
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    bool loadProgramConfig();
    bool saveProgramConfig();
    bool loadGameConfig();
    bool saveGameConfig();

    std::filesystem::path m_configDirectory;
    bool m_isFirstRun = true;

    ProgramConfig m_programConfig;
    GameConfig m_gameConfig;
};

} // namespace ffxiv
