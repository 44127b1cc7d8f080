/**
 * FFXIV Updater - Command line patch updater for FINAL FANTASY XIV (Taiwan)
 *
 * Copyright (C) 2024
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <QCoreApplication>
#include <QCommandLineParser>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <csignal>
#include <iostream>
#include <string>

#include "core/Errors.hpp"
#include "core/config/ConfigManager.hpp"
#include "core/platform/Platform.hpp"
#include "game/GameVersion.hpp"
#include "game/UpdateCoordinator.hpp"
#include "network/HttpClient.hpp"
#include "patch/ChunkLister.hpp"
#include "patch/PatchInstaller.hpp"
#include "patch/ZiPatchFile.hpp"

namespace {

ffxiv::CancellationToken g_cancel;

void handleInterrupt(int) {
    g_cancel.cancel();
}

void setupLogging(const std::filesystem::path& configPath, spdlog::level::level_enum consoleLevel) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(consoleLevel);

    auto logPath = configPath / "logs" / "updater.log";

    std::vector<spdlog::sink_ptr> sinks{console_sink};

    std::error_code ec;
    std::filesystem::create_directories(logPath.parent_path(), ec);
    if (!ec) {
        try {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logPath.string(), 1024 * 1024 * 5, 3);
            file_sink->set_level(spdlog::level::debug);
            sinks.push_back(file_sink);
        } catch (const spdlog::spdlog_ex& e) {
            std::cerr << "Log file unavailable: " << e.what() << "\n";
        }
    }

    auto logger = std::make_shared<spdlog::logger>("ffxiv", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::debug);

    spdlog::set_default_logger(logger);
}

/**
 * --game-path, then game.json, then the first detected installation
 */
std::filesystem::path resolveGameRoot(const QCommandLineParser& parser,
                                      const QCommandLineOption& gamePathOption) {
    if (parser.isSet(gamePathOption)) {
        return std::filesystem::path(parser.value(gamePathOption).toStdString());
    }

    const auto& gameConfig = ffxiv::ConfigManager::instance().gameConfig();
    if (!gameConfig.gameDirectory.empty()) {
        return gameConfig.gameDirectory;
    }

    auto detected = ffxiv::Platform::detectGameInstallations();
    if (!detected.empty()) {
        spdlog::info("Using detected installation: {}", detected.front().string());
        auto config = gameConfig;
        config.gameDirectory = detected.front();
        ffxiv::ConfigManager::instance().setGameConfig(config);
        return detected.front();
    }

    return {};
}

ffxiv::VersionCheckClient::Settings versionSettings() {
    const auto& gameConfig = ffxiv::ConfigManager::instance().gameConfig();
    ffxiv::VersionCheckClient::Settings settings;
    settings.host = QString::fromStdString(gameConfig.versionCheckHost);
    settings.product = QString::fromStdString(gameConfig.product);
    settings.patchUrlScheme = QString::fromStdString(gameConfig.patchUrlScheme);
    return settings;
}

std::unique_ptr<ffxiv::HttpClient> createHttpClient() {
    const auto& config = ffxiv::ConfigManager::instance().programConfig();
    ffxiv::HttpClientSettings settings;
    settings.userAgent = QString::fromStdString(config.userAgent);
    settings.requestTimeoutMs = config.requestTimeoutMs;
    settings.downloadTimeoutMs = config.downloadTimeoutMs;
    return ffxiv::HttpClient::create(settings);
}

void printPlan(const ffxiv::UpdatePlan& plan) {
    std::cout << "Local versions:\n";
    for (const auto& [repository, version] : plan.localVersions) {
        std::cout << "  " << ffxiv::GameVersion::repositoryName(repository).toStdString()
                  << "\t" << version.toStdString() << "\n";
    }

    if (plan.serverLatestVersion) {
        std::cout << "Server latest: " << plan.serverLatestVersion->toStdString() << "\n";
    }

    if (plan.isEmpty()) {
        std::cout << "Game is up to date.\n";
        return;
    }

    std::cout << "\n" << plan.patchCount() << " patch(es), "
              << plan.formattedTotalSize().toStdString() << ":\n";
    for (const auto& patch : plan.patches) {
        std::cout << "  " << patch.localPath().toStdString()
                  << "  " << patch.version.toStdString()
                  << "  " << patch.formattedSize().toStdString() << "\n";
    }
}

bool confirm(const std::string& question) {
    std::cout << question << " [y/N] " << std::flush;
    std::string answer;
    if (!std::getline(std::cin, answer)) {
        return false;
    }
    return answer == "y" || answer == "Y" || answer == "yes";
}

int runCheck(ffxiv::UpdateCoordinator& coordinator, const std::filesystem::path& gameRoot) {
    auto result = coordinator.checkForUpdates(gameRoot);
    if (!result.succeeded()) {
        std::cerr << "Update check failed: " << result.errorMessage.toStdString() << "\n";
        return 1;
    }
    printPlan(result.plan);
    return 0;
}

int runUpdate(ffxiv::UpdateCoordinator& coordinator, const std::filesystem::path& gameRoot,
              bool assumeYes) {
    auto result = coordinator.checkForUpdates(gameRoot);
    if (!result.succeeded()) {
        std::cerr << "Update check failed: " << result.errorMessage.toStdString() << "\n";
        return 1;
    }

    printPlan(result.plan);
    if (!result.needsUpdate) {
        return 0;
    }

    if (!assumeYes && !confirm("Download and install these patches?")) {
        std::cout << "Aborted.\n";
        return 0;
    }

    int lastPercent = -1;
    coordinator.setStatusCallback([](const QString& status) {
        spdlog::info("{}", status.toStdString());
    });
    coordinator.setProgressCallback([&lastPercent](double percent) {
        int whole = static_cast<int>(percent);
        if (whole != lastPercent) {
            lastPercent = whole;
            std::cout << "\r" << whole << "% " << std::flush;
        }
    });
    coordinator.setDetailedProgressCallback([](const ffxiv::UpdateProgress& progress) {
        if (progress.phase == ffxiv::UpdatePhase::Downloading && progress.bytesPerSecond > 0) {
            spdlog::debug("{} ({}/{}) {} ETA {}", progress.currentFileName.toStdString(),
                          progress.currentFile, progress.totalFiles,
                          progress.formattedSpeed().toStdString(),
                          progress.formattedRemaining().toStdString());
        }
    });

    std::signal(SIGINT, handleInterrupt);
    auto outcome = coordinator.applyUpdate(gameRoot, result.plan, g_cancel);
    std::signal(SIGINT, SIG_DFL);
    std::cout << "\n";

    switch (outcome) {
        case ffxiv::UpdateOutcome::Completed:
            std::cout << "Update complete.\n";
            return 0;
        case ffxiv::UpdateOutcome::Cancelled:
            std::cout << "Update cancelled.\n";
            return 130;
        case ffxiv::UpdateOutcome::Failed:
            break;
    }

    std::cerr << "Update failed: " << coordinator.errorMessage().toStdString() << "\n";
    return 1;
}

int runInstallPatch(const std::filesystem::path& patchFile, const std::filesystem::path& gameRoot) {
    const auto& config = ffxiv::ConfigManager::instance().programConfig();

    ffxiv::patch::PatchInstaller::Options options;
    options.verifyChecksums = config.verifyChunkChecksums;

    ffxiv::patch::PatchInstaller installer(gameRoot / "game", options);
    int lastPercent = -1;
    installer.setProgressCallback([&lastPercent](qint64 position, qint64 size) {
        int percent = size > 0 ? static_cast<int>(position * 100 / size) : 100;
        if (percent != lastPercent) {
            lastPercent = percent;
            std::cout << "\r" << percent << "% " << std::flush;
        }
    });

    std::signal(SIGINT, handleInterrupt);
    bool completed = installer.install(patchFile, g_cancel);
    std::signal(SIGINT, SIG_DFL);
    std::cout << "\n";

    if (!completed) {
        std::cout << "Install cancelled after " << installer.lastChunkCount() << " chunks.\n";
        return 130;
    }

    std::cout << "Applied " << installer.lastChunkCount() << " chunks from "
              << patchFile.filename().string() << "\n";
    return 0;
}

int runDumpPatch(const std::filesystem::path& patchFile) {
    auto patch = ffxiv::patch::ZiPatchFile::open(patchFile);

    ffxiv::patch::ChunkLister lister(std::cout);
    lister.list(patch);
    lister.printSummary();
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    app.setApplicationName("FFXIV Updater");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("ffxiv-updater");

    // Parse command line arguments
    QCommandLineParser parser;
    parser.setApplicationDescription(
        "Patch updater for FINAL FANTASY XIV (Taiwan)\n\n"
        "Commands:\n"
        "  check                 Show pending patches\n"
        "  update                Download and install pending patches\n"
        "  install-patch <file>  Apply a single local patch file\n"
        "  dump-patch <file>     List the chunks of a patch file");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("command", "check, update, install-patch or dump-patch");
    parser.addPositionalArgument("file", "Patch file for install-patch / dump-patch", "[file]");

    QCommandLineOption configDirOption(
        QStringList() << "c" << "config-directory",
        "Configuration directory path",
        "path"
    );
    parser.addOption(configDirOption);

    QCommandLineOption gamePathOption(
        QStringList() << "g" << "game-path",
        "Game installation root (contains game/)",
        "path"
    );
    parser.addOption(gamePathOption);

    QCommandLineOption yesOption(
        QStringList() << "y" << "yes",
        "Do not ask for confirmation before updating"
    );
    parser.addOption(yesOption);

    QCommandLineOption verboseOption(
        QStringList() << "v" << "verbose",
        "Show debug output"
    );
    parser.addOption(verboseOption);

    parser.process(app);

    std::filesystem::path configPath;
    if (parser.isSet(configDirOption)) {
        configPath = parser.value(configDirOption).toStdString();
    } else {
        configPath = ffxiv::Platform::getConfigPath();
    }

    auto& configManager = ffxiv::ConfigManager::instance();
    bool configLoaded = configManager.initialize(configPath);

    auto consoleLevel = spdlog::level::from_str(configManager.programConfig().logVerbosity);
    if (parser.isSet(verboseOption)) {
        consoleLevel = spdlog::level::debug;
    }
    setupLogging(configPath, consoleLevel);

    if (!configLoaded) {
        spdlog::error("Failed to initialize configuration");
        return 1;
    }
    spdlog::info("Configuration loaded from: {}", configPath.string());

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        parser.showHelp(1);
    }

    const QString command = args.first();

    try {
        if (command == "dump-patch") {
            if (args.size() < 2) {
                std::cerr << "Usage: ffxiv-updater dump-patch <file>\n";
                return 1;
            }
            return runDumpPatch(args.at(1).toStdString());
        }

        if (command != "check" && command != "update" && command != "install-patch") {
            std::cerr << "Unknown command: " << command.toStdString() << "\n";
            return 1;
        }

        auto gameRoot = resolveGameRoot(parser, gamePathOption);
        if (gameRoot.empty()) {
            std::cerr << "No game installation found, pass --game-path\n";
            return 1;
        }
        spdlog::info("Game root: {}", gameRoot.string());

        if (command == "install-patch") {
            if (args.size() < 2) {
                std::cerr << "Usage: ffxiv-updater install-patch <file> --game-path <path>\n";
                return 1;
            }
            return runInstallPatch(args.at(1).toStdString(), gameRoot);
        }

        auto http = createHttpClient();
        auto settings = ffxiv::UpdateSettings::fromConfig(configManager.programConfig(),
                                                          configManager.patchDirectory());
        ffxiv::UpdateCoordinator coordinator(*http, versionSettings(), settings);

        int result = command == "check"
            ? runCheck(coordinator, gameRoot)
            : runUpdate(coordinator, gameRoot, parser.isSet(yesOption));

        if (!configManager.save()) {
            spdlog::warn("Failed to save configuration");
        }
        return result;
    } catch (const ffxiv::UpdaterError& e) {
        spdlog::error("{}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
