/**
 * Dump ZiPatch chunks
 */

#include "core/Errors.hpp"
#include "patch/ChunkLister.hpp"
#include "patch/ZiPatchFile.hpp"

#include <QCoreApplication>
#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);

    if (argc < 2) {
        std::cout << "Usage: dump_patch <file.patch> [--no-crc]\n";
        std::cout << "Example: dump_patch D2025.05.29.0000.0000.patch\n";
        return 1;
    }

    std::filesystem::path patchPath = argv[1];

    ffxiv::patch::ZiPatchFile::Options options;
    options.verifyChecksums = !(argc > 2 && std::string(argv[2]) == "--no-crc");

    std::cout << "Reading patch: " << patchPath << "\n\n";

    ffxiv::patch::ChunkLister lister(std::cout);
    try {
        auto patch = ffxiv::patch::ZiPatchFile::open(patchPath, options);
        lister.list(patch);
    } catch (const ffxiv::UpdaterError& e) {
        std::cout << "\nError after " << lister.total() << " chunks: " << e.what() << "\n";
        return 1;
    }

    lister.printSummary();
    return 0;
}
