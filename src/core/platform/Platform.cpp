/**
 * FFXIV Updater - Platform Common Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "Platform.hpp"

// Path lookups and detection live in LinuxPlatform.cpp / WindowsPlatform.cpp

namespace ffxiv {

bool Platform::isValidGameInstall(const std::filesystem::path& path) {
    if (path.empty()) {
        return false;
    }
    std::error_code ec;
    return std::filesystem::is_regular_file(path / "game" / "ffxiv_dx11.exe", ec);
}

const std::vector<std::filesystem::path>& Platform::installRelativePaths() {
    static const std::vector<std::filesystem::path> paths = {
        std::filesystem::path("Program Files") / "USERJOY GAMES" / "FINAL FANTASY XIV TC",
        std::filesystem::path("Program Files (x86)") / "USERJOY GAMES" / "FINAL FANTASY XIV TC",
        std::filesystem::path("USERJOY GAMES") / "FINAL FANTASY XIV TC",
    };
    return paths;
}

} // namespace ffxiv
