/**
 * FFXIV Updater - Platform Implementation (Linux)
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#ifdef PLATFORM_LINUX

#include "Platform.hpp"

#include <cstdlib>

#include <spdlog/spdlog.h>

namespace ffxiv {

namespace {
    constexpr const char* APP_DIR = "ffxiv-updater";

    std::filesystem::path xdgPath(const char* variable, const char* homeFallback) {
        const char* value = std::getenv(variable);
        if (value && value[0] != '\0') {
            return std::filesystem::path(value) / APP_DIR;
        }

        const char* home = std::getenv("HOME");
        if (home) {
            return std::filesystem::path(home) / homeFallback / APP_DIR;
        }

        return std::filesystem::path(homeFallback) / APP_DIR;
    }

    /**
     * Wine prefixes under the home directory: ~/.wine plus any directory
     * with "wine" in its name, and the Lutris/Bottles style ~/Games tree
     */
    std::vector<std::filesystem::path> findWinePrefixes(const std::filesystem::path& home) {
        std::vector<std::filesystem::path> prefixes = {
            home / ".wine",
            home / ".wine32",
            home / ".wine64",
        };

        try {
            for (const auto& entry : std::filesystem::directory_iterator(home)) {
                if (!entry.is_directory()) {
                    continue;
                }
                std::string name = entry.path().filename().string();
                if (name.find("wine") != std::string::npos || name.find("Wine") != std::string::npos) {
                    prefixes.push_back(entry.path());
                }
            }

            for (const char* gamesDir : {"Games", "games"}) {
                auto root = home / gamesDir;
                if (!std::filesystem::is_directory(root)) {
                    continue;
                }
                for (const auto& entry : std::filesystem::directory_iterator(root)) {
                    if (entry.is_directory()) {
                        prefixes.push_back(entry.path());
                    }
                }
            }
        } catch (const std::filesystem::filesystem_error& e) {
            spdlog::debug("Error listing {}: {}", home.string(), e.what());
        }

        return prefixes;
    }
}

std::filesystem::path Platform::getConfigPath() {
    return xdgPath("XDG_CONFIG_HOME", ".config");
}

std::filesystem::path Platform::getDataPath() {
    return xdgPath("XDG_DATA_HOME", ".local/share");
}

std::filesystem::path Platform::getCachePath() {
    return xdgPath("XDG_CACHE_HOME", ".cache");
}

std::vector<std::filesystem::path> Platform::detectGameInstallations() {
    std::vector<std::filesystem::path> installations;

    const char* home = std::getenv("HOME");
    if (!home) {
        spdlog::warn("HOME environment variable not set");
        return installations;
    }

    spdlog::info("Searching for game installations...");

    for (const auto& prefix : findWinePrefixes(home)) {
        auto driveC = prefix / "drive_c";
        std::error_code ec;
        if (!std::filesystem::is_directory(driveC, ec)) {
            continue;
        }
        for (const auto& relative : installRelativePaths()) {
            auto candidate = driveC / relative;
            if (isValidGameInstall(candidate)) {
                spdlog::info("Found game in Wine prefix: {}", candidate.string());
                installations.push_back(candidate);
            }
        }
    }

    spdlog::info("Found {} game installation(s)", installations.size());
    return installations;
}

} // namespace ffxiv

#endif // PLATFORM_LINUX
