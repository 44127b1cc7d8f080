/**
 * FFXIV Updater - Configuration Manager Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "ConfigManager.hpp"

#include "core/platform/Platform.hpp"

#include <fstream>

#include <spdlog/spdlog.h>

namespace ffxiv {

namespace {
    constexpr const char* PROGRAM_CONFIG_FILE = "config.json";
    constexpr const char* GAME_CONFIG_FILE = "game.json";

    template <typename T>
    void readKey(const nlohmann::json& j, const char* key, T& target) {
        if (j.contains(key)) {
            target = j[key].get<T>();
        }
    }
}

ProgramConfig ProgramConfig::fromJson(const nlohmann::json& j) {
    ProgramConfig config;

    readKey(j, "logVerbosity", config.logVerbosity);
    if (j.contains("patchDirectory")) {
        config.patchDirectory = j["patchDirectory"].get<std::string>();
    }
    readKey(j, "maxDownloadAttempts", config.maxDownloadAttempts);
    readKey(j, "retryDelayMs", config.retryDelayMs);
    readKey(j, "speedUpdateIntervalMs", config.speedUpdateIntervalMs);
    readKey(j, "downloadTimeoutMs", config.downloadTimeoutMs);
    readKey(j, "requestTimeoutMs", config.requestTimeoutMs);
    readKey(j, "userAgent", config.userAgent);
    readKey(j, "verifyPatchHashes", config.verifyPatchHashes);
    readKey(j, "verifyChunkChecksums", config.verifyChunkChecksums);
    readKey(j, "keepPatchFiles", config.keepPatchFiles);

    if (config.maxDownloadAttempts < 1) {
        spdlog::warn("maxDownloadAttempts must be at least 1, got {}", config.maxDownloadAttempts);
        config.maxDownloadAttempts = 1;
    }

    return config;
}

nlohmann::json ProgramConfig::toJson() const {
    nlohmann::json j;
    j["logVerbosity"] = logVerbosity;
    j["patchDirectory"] = patchDirectory.string();
    j["maxDownloadAttempts"] = maxDownloadAttempts;
    j["retryDelayMs"] = retryDelayMs;
    j["speedUpdateIntervalMs"] = speedUpdateIntervalMs;
    j["downloadTimeoutMs"] = downloadTimeoutMs;
    j["requestTimeoutMs"] = requestTimeoutMs;
    j["userAgent"] = userAgent;
    j["verifyPatchHashes"] = verifyPatchHashes;
    j["verifyChunkChecksums"] = verifyChunkChecksums;
    j["keepPatchFiles"] = keepPatchFiles;
    return j;
}

ConfigManager& ConfigManager::instance() {
    static ConfigManager instance;
    return instance;
}

bool ConfigManager::initialize(const std::filesystem::path& configDirectory) {
    m_configDirectory = configDirectory;
    m_programConfig = ProgramConfig{};
    m_gameConfig = GameConfig{};

    // Create directories if they don't exist
    try {
        std::filesystem::create_directories(m_configDirectory);
    } catch (const std::exception& e) {
        spdlog::error("Failed to create config directory: {}", e.what());
        return false;
    }

    // Check if this is first run
    m_isFirstRun = !std::filesystem::exists(m_configDirectory / PROGRAM_CONFIG_FILE);

    if (!m_isFirstRun) {
        if (!loadProgramConfig()) {
            spdlog::warn("Failed to load program config, using defaults");
        }
    }
    if (std::filesystem::exists(m_configDirectory / GAME_CONFIG_FILE)) {
        if (!loadGameConfig()) {
            spdlog::warn("Failed to load game config, using defaults");
        }
    }

    spdlog::info("ConfigManager initialized at: {}", m_configDirectory.string());
    return true;
}

bool ConfigManager::save() {
    return saveProgramConfig() && saveGameConfig();
}

void ConfigManager::setProgramConfig(const ProgramConfig& config) {
    m_programConfig = config;
    saveProgramConfig();
}

void ConfigManager::setGameConfig(const GameConfig& config) {
    m_gameConfig = config;
    saveGameConfig();
}

std::filesystem::path ConfigManager::patchDirectory() const {
    if (!m_programConfig.patchDirectory.empty()) {
        return m_programConfig.patchDirectory;
    }
    return Platform::getDataPath() / "patches";
}

bool ConfigManager::loadProgramConfig() {
    auto configPath = m_configDirectory / PROGRAM_CONFIG_FILE;

    try {
        std::ifstream file(configPath);
        if (!file.is_open()) {
            return false;
        }

        nlohmann::json j = nlohmann::json::parse(file);
        m_programConfig = ProgramConfig::fromJson(j);
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to load program config: {}", e.what());
        m_programConfig = ProgramConfig{};
        return false;
    }
}

bool ConfigManager::saveProgramConfig() {
    auto configPath = m_configDirectory / PROGRAM_CONFIG_FILE;

    try {
        std::ofstream file(configPath);
        if (!file.is_open()) {
            spdlog::error("Failed to open {} for writing", configPath.string());
            return false;
        }
        file << m_programConfig.toJson().dump(2);
        m_isFirstRun = false;
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to save program config: {}", e.what());
        return false;
    }
}

bool ConfigManager::loadGameConfig() {
    auto configPath = m_configDirectory / GAME_CONFIG_FILE;

    std::ifstream file(configPath);
    if (!file.is_open()) {
        return false;
    }
    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());

    m_gameConfig = GameConfig::fromJson(content);
    spdlog::debug("Loaded game config ({})", m_gameConfig.gameDirectory.string());
    return true;
}

bool ConfigManager::saveGameConfig() {
    auto configPath = m_configDirectory / GAME_CONFIG_FILE;

    std::ofstream file(configPath);
    if (!file.is_open()) {
        spdlog::error("Failed to open {} for writing", configPath.string());
        return false;
    }
    file << m_gameConfig.toJson();

    spdlog::debug("Saved game config -> {}", configPath.string());
    return true;
}

} // namespace ffxiv
