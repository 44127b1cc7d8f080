/**
 * FFXIV Updater - Game Config Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "GameConfig.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace ffxiv {

std::filesystem::path GameConfig::getGamePath() const {
    return gameDirectory / "game";
}

std::filesystem::path GameConfig::getClientExecutable() const {
    return getGamePath() / "ffxiv_dx11.exe";
}

bool GameConfig::hasValidInstallation() const {
    std::error_code ec;
    return !gameDirectory.empty() && std::filesystem::exists(getClientExecutable(), ec);
}

GameConfig GameConfig::fromJson(const std::string& json) {
    GameConfig config;

    try {
        auto j = nlohmann::json::parse(json);

        if (j.contains("gameDirectory")) {
            config.gameDirectory = j["gameDirectory"].get<std::string>();
        }
        if (j.contains("versionCheckHost")) {
            config.versionCheckHost = j["versionCheckHost"].get<std::string>();
        }
        if (j.contains("product")) {
            config.product = j["product"].get<std::string>();
        }
        if (j.contains("patchUrlScheme")) {
            config.patchUrlScheme = j["patchUrlScheme"].get<std::string>();
        }
    } catch (const std::exception& e) {
        spdlog::warn("Failed to parse game config, using defaults: {}", e.what());
        return GameConfig{};
    }

    return config;
}

std::string GameConfig::toJson() const {
    nlohmann::json j;

    j["gameDirectory"] = gameDirectory.string();
    j["versionCheckHost"] = versionCheckHost;
    j["product"] = product;
    j["patchUrlScheme"] = patchUrlScheme;

    return j.dump(2);
}

} // namespace ffxiv
