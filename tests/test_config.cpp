/**
 * FFXIV Updater - Configuration Tests
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

#include "core/config/ConfigManager.hpp"
#include "core/platform/Platform.hpp"

using namespace ffxiv;

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Create temp directory for tests
        testDir = std::filesystem::temp_directory_path() / "ffxiv-updater-test-config";
        std::filesystem::remove_all(testDir);
        std::filesystem::create_directories(testDir);
    }

    void TearDown() override {
        // Clean up test directory
        std::filesystem::remove_all(testDir);
    }

    void writeFile(const std::string& name, const std::string& content) {
        std::ofstream out(testDir / name);
        out << content;
    }

    std::filesystem::path testDir;
};

TEST_F(ConfigManagerTest, InitializesWithDefaults) {
    auto& manager = ConfigManager::instance();
    ASSERT_TRUE(manager.initialize(testDir));

    EXPECT_TRUE(manager.isFirstRun());
    EXPECT_EQ(manager.configDirectory(), testDir);

    const auto& program = manager.programConfig();
    EXPECT_EQ(program.maxDownloadAttempts, 3);
    EXPECT_EQ(program.retryDelayMs, 2000);
    EXPECT_EQ(program.speedUpdateIntervalMs, 500);
    EXPECT_TRUE(program.verifyPatchHashes);
    EXPECT_TRUE(program.verifyChunkChecksums);
    EXPECT_TRUE(program.keepPatchFiles);

    const auto& game = manager.gameConfig();
    EXPECT_TRUE(game.gameDirectory.empty());
    EXPECT_EQ(game.versionCheckHost, "patch-gamever.ffxiv.com.tw");
    EXPECT_EQ(game.product, "ffxivtc_release_tc_game");
    EXPECT_EQ(game.patchUrlScheme, "http://");
}

TEST_F(ConfigManagerTest, SavesAndLoadsConfig) {
    auto& manager = ConfigManager::instance();
    ASSERT_TRUE(manager.initialize(testDir));

    ProgramConfig program;
    program.logVerbosity = "debug";
    program.patchDirectory = testDir / "downloads";
    program.maxDownloadAttempts = 5;
    program.keepPatchFiles = false;
    manager.setProgramConfig(program);

    GameConfig game;
    game.gameDirectory = "/games/FINAL FANTASY XIV TC";
    game.versionCheckHost = "localhost:8080";
    manager.setGameConfig(game);

    ASSERT_TRUE(manager.initialize(testDir));

    EXPECT_FALSE(manager.isFirstRun());
    EXPECT_EQ(manager.programConfig().logVerbosity, "debug");
    EXPECT_EQ(manager.programConfig().maxDownloadAttempts, 5);
    EXPECT_FALSE(manager.programConfig().keepPatchFiles);
    EXPECT_EQ(manager.patchDirectory(), testDir / "downloads");
    EXPECT_EQ(manager.gameConfig().gameDirectory, std::filesystem::path("/games/FINAL FANTASY XIV TC"));
    EXPECT_EQ(manager.gameConfig().versionCheckHost, "localhost:8080");
    EXPECT_EQ(manager.gameConfig().product, "ffxivtc_release_tc_game");
}

TEST_F(ConfigManagerTest, MissingKeysKeepDefaults) {
    auto config = ProgramConfig::fromJson(nlohmann::json::parse(R"({"retryDelayMs": 10})"));

    EXPECT_EQ(config.retryDelayMs, 10);
    EXPECT_EQ(config.maxDownloadAttempts, 3);
    EXPECT_EQ(config.userAgent, "FFXIV-Updater/1.0");
    EXPECT_TRUE(config.patchDirectory.empty());
}

TEST_F(ConfigManagerTest, ClampsDownloadAttempts) {
    auto config = ProgramConfig::fromJson(nlohmann::json::parse(R"({"maxDownloadAttempts": 0})"));
    EXPECT_EQ(config.maxDownloadAttempts, 1);
}

TEST_F(ConfigManagerTest, ProgramConfigRoundTrip) {
    ProgramConfig original;
    original.downloadTimeoutMs = 1234;
    original.verifyChunkChecksums = false;
    original.userAgent = "test-agent";

    auto restored = ProgramConfig::fromJson(original.toJson());

    EXPECT_EQ(restored.downloadTimeoutMs, 1234);
    EXPECT_FALSE(restored.verifyChunkChecksums);
    EXPECT_EQ(restored.userAgent, "test-agent");
}

TEST_F(ConfigManagerTest, CorruptFilesFallBackToDefaults) {
    writeFile("config.json", "{ not json");
    writeFile("game.json", "[1, 2");

    auto& manager = ConfigManager::instance();
    ASSERT_TRUE(manager.initialize(testDir));

    EXPECT_EQ(manager.programConfig().maxDownloadAttempts, 3);
    EXPECT_EQ(manager.gameConfig().versionCheckHost, "patch-gamever.ffxiv.com.tw");
}

TEST_F(ConfigManagerTest, DefaultPatchDirectoryUnderDataPath) {
    auto& manager = ConfigManager::instance();
    ASSERT_TRUE(manager.initialize(testDir));
    EXPECT_EQ(manager.patchDirectory(), Platform::getDataPath() / "patches");
}

TEST_F(ConfigManagerTest, GameConfigPaths) {
    GameConfig config;
    EXPECT_FALSE(config.hasValidInstallation());

    config.gameDirectory = testDir;
    EXPECT_EQ(config.getGamePath(), testDir / "game");
    EXPECT_EQ(config.getClientExecutable(), testDir / "game" / "ffxiv_dx11.exe");
    EXPECT_FALSE(config.hasValidInstallation());
    EXPECT_FALSE(Platform::isValidGameInstall(testDir));

    std::filesystem::create_directories(testDir / "game");
    std::ofstream(testDir / "game" / "ffxiv_dx11.exe") << "MZ";
    EXPECT_TRUE(config.hasValidInstallation());
    EXPECT_TRUE(Platform::isValidGameInstall(testDir));
}
