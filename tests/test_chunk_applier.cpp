/**
 * FFXIV Updater - Chunk Applier and Installer Tests
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

#include <QBuffer>

#include "ZiPatchBuilder.hpp"

#include "core/Errors.hpp"
#include "patch/ChunkApplier.hpp"
#include "patch/PatchInstaller.hpp"
#include "patch/ZiPatchFile.hpp"

using namespace ffxiv;
using namespace ffxiv::patch;
using ffxiv::test::ZiPatchBuilder;

class ChunkApplierTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir = std::filesystem::temp_directory_path() / "ffxiv-updater-test-apply";
        std::filesystem::remove_all(testDir);
        gameDir = testDir / "game";
        std::filesystem::create_directories(gameDir);
    }

    void TearDown() override {
        std::filesystem::remove_all(testDir);
    }

    bool install(const ZiPatchBuilder& builder, const CancellationToken& cancel = CancellationToken::none()) {
        auto path = testDir / "test.patch";
        builder.writeTo(path);
        PatchInstaller installer(gameDir);
        bool completed = installer.install(path, cancel);
        lastChunkCount = installer.lastChunkCount();
        return completed;
    }

    static ZiPatchChunk decodeSingle(const ZiPatchBuilder& builder) {
        auto buffer = std::make_unique<QBuffer>();
        buffer->setData(builder.data());
        buffer->open(QIODevice::ReadOnly);
        ZiPatchFile patch(std::move(buffer), ZiPatchFile::Options{});
        auto chunk = patch.next();
        if (!chunk) {
            throw std::runtime_error("no chunk");
        }
        return *chunk;
    }

    void writeFile(const std::filesystem::path& path, const QByteArray& content) {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary);
        out.write(content.constData(), content.size());
    }

    static QByteArray readFile(const std::filesystem::path& path) {
        QFile file(QString::fromStdString(path.string()));
        if (!file.open(QIODevice::ReadOnly)) {
            return QByteArray();
        }
        return file.readAll();
    }

    std::filesystem::path testDir;
    std::filesystem::path gameDir;
    int lastChunkCount = 0;
};

TEST_F(ChunkApplierTest, DirectoryLifecycleCanBeReapplied) {
    ZiPatchBuilder builder;
    builder.addDirectory("movie/ex9")
        .addDirectory("movie/ex9")
        .addFile("movie/ex9/intro.bk2", 0, {QByteArray("movie")})
        .deleteFile("movie/ex9/intro.bk2")
        .deleteDirectory("movie/ex9")
        .deleteDirectory("movie/ex9")
        .endOfFile();

    EXPECT_TRUE(install(builder));
    EXPECT_EQ(lastChunkCount, 7);
    EXPECT_FALSE(std::filesystem::exists(gameDir / "movie" / "ex9"));
    EXPECT_TRUE(std::filesystem::exists(gameDir / "movie"));

    // A second run over the same tree succeeds as well
    EXPECT_TRUE(install(builder));
}

TEST_F(ChunkApplierTest, DirectoryNamesWithLeadingSeparator) {
    for (const std::string& name : {std::string("\\movie\\ex9"), std::string("/movie/ex9")}) {
        ASSERT_TRUE(install(ZiPatchBuilder().addDirectory(name))) << name;
        EXPECT_TRUE(std::filesystem::is_directory(gameDir / "movie" / "ex9")) << name;

        ASSERT_TRUE(install(ZiPatchBuilder().deleteDirectory(name).deleteDirectory(name))) << name;
        EXPECT_FALSE(std::filesystem::exists(gameDir / "movie" / "ex9")) << name;
        EXPECT_TRUE(std::filesystem::exists(gameDir / "movie")) << name;
    }
}

TEST_F(ChunkApplierTest, DeleteDirectoryRefusesGameRoot) {
    for (const std::string& name : {std::string("\\"), std::string("/")}) {
        InstallSession session(gameDir);
        auto chunk = decodeSingle(ZiPatchBuilder().deleteDirectory(name));
        EXPECT_THROW(applyChunk(chunk, session), ChunkApplyError) << name;
    }
    EXPECT_TRUE(std::filesystem::exists(gameDir));
}

TEST_F(ChunkApplierTest, DeleteDirectoryRefusesNonEmptyDirectory) {
    writeFile(gameDir / "boot" / "keep.txt", "x");

    try {
        install(ZiPatchBuilder().deleteDirectory("boot"));
        FAIL() << "expected ChunkApplyError";
    } catch (const ChunkApplyError& e) {
        EXPECT_EQ(e.chunkType(), "DELD");
        EXPECT_EQ(e.targetPath(), "boot");
    }
    EXPECT_TRUE(std::filesystem::exists(gameDir / "boot" / "keep.txt"));
}

TEST_F(ChunkApplierTest, AddDataWritesBlockAndZeroesDeleteRange) {
    auto dat = gameDir / "sqpack" / "ffxiv" / "0a0000.win32.dat0";
    writeFile(dat, QByteArray(2048, 'f'));

    auto target = ZiPatchBuilder::target(0x0a, 0x0000, 0);
    EXPECT_TRUE(install(ZiPatchBuilder().addData(target, 256, QByteArray(128, 'D'), 256)));

    QByteArray content = readFile(dat);
    ASSERT_EQ(content.size(), 2048);
    EXPECT_EQ(content.left(256), QByteArray(256, 'f'));
    EXPECT_EQ(content.mid(256, 128), QByteArray(128, 'D'));
    EXPECT_EQ(content.mid(384, 256), QByteArray(256, '\0'));
    EXPECT_EQ(content.mid(640), QByteArray(2048 - 640, 'f'));
}

TEST_F(ChunkApplierTest, DeleteAndExpandWriteEmptyBlocks) {
    auto dat = gameDir / "sqpack" / "ex1" / "020100.win32.dat1";
    writeFile(dat, QByteArray(1024, 'f'));

    auto target = ZiPatchBuilder::target(0x02, 0x0100, 1);
    EXPECT_TRUE(install(ZiPatchBuilder()
        .deleteData(target, 128, 2)
        .expandData(target, 1024, 1)));

    QByteArray content = readFile(dat);
    ASSERT_EQ(content.size(), 1024 + 128);
    EXPECT_EQ(content.left(128), QByteArray(128, 'f'));
    EXPECT_EQ(static_cast<uint8_t>(content[128]), 128);
    EXPECT_EQ(static_cast<uint8_t>(content[128 + 12]), 1);
    EXPECT_EQ(content.mid(128 + 20, 256 - 20), QByteArray(256 - 20, '\0'));
    EXPECT_EQ(content.mid(384, 640), QByteArray(640, 'f'));
    EXPECT_EQ(static_cast<uint8_t>(content[1024]), 128);
    EXPECT_EQ(static_cast<uint8_t>(content[1024 + 12]), 0);
}

TEST_F(ChunkApplierTest, HeaderWritesAtVersionOrDataOffset) {
    auto target = ZiPatchBuilder::target(0x0c, 0x0000, 0);
    EXPECT_TRUE(install(ZiPatchBuilder()
        .header(SqpkHeaderFileKind::Dat, SqpkHeaderKind::Version, target, 'v')
        .header(SqpkHeaderFileKind::Dat, SqpkHeaderKind::Data, target, 'd')
        .header(SqpkHeaderFileKind::Index, SqpkHeaderKind::Index, target, 'i')));

    QByteArray dat = readFile(gameDir / "sqpack" / "ffxiv" / "0c0000.win32.dat0");
    ASSERT_EQ(dat.size(), 2048);
    EXPECT_EQ(dat.left(1024), QByteArray(1024, 'v'));
    EXPECT_EQ(dat.mid(1024), QByteArray(1024, 'd'));

    QByteArray index = readFile(gameDir / "sqpack" / "ffxiv" / "0c0000.win32.index");
    ASSERT_EQ(index.size(), 2048);
    EXPECT_EQ(index.left(1024), QByteArray(1024, '\0'));
    EXPECT_EQ(index.mid(1024), QByteArray(1024, 'i'));
}

TEST_F(ChunkApplierTest, AddFileTruncatesAtOffsetZero) {
    auto file = gameDir / "boot" / "ffxivboot.exe";
    writeFile(file, QByteArray(4096, 'o'));

    EXPECT_TRUE(install(ZiPatchBuilder()
        .addFile("boot\\ffxivboot.exe", 0, {QByteArray("first"), QByteArray(3000, 'c')}, true)
        .addFile("boot/ffxivboot.exe", 3005, {QByteArray("tail")})));

    QByteArray content = readFile(file);
    EXPECT_EQ(content, QByteArray("first") + QByteArray(3000, 'c') + QByteArray("tail"));
}

TEST_F(ChunkApplierTest, DeleteMissingFileHonorsIgnoreMissing) {
    try {
        install(ZiPatchBuilder().deleteFile("boot/absent.dll"));
        FAIL() << "expected ChunkApplyError";
    } catch (const ChunkApplyError& e) {
        EXPECT_EQ(e.chunkType(), "SQPK:F");
        EXPECT_EQ(e.targetPath(), "boot/absent.dll");
    }

    EXPECT_TRUE(install(ZiPatchBuilder()
        .applyOption(ApplyOptionKind::IgnoreMissing, true)
        .deleteFile("boot/absent.dll")));
}

TEST_F(ChunkApplierTest, RemoveAllKeepsVariableFilesAndIntroMovies) {
    writeFile(gameDir / "sqpack" / "ex2" / "020200.win32.dat0", "d");
    writeFile(gameDir / "sqpack" / "ex2" / "020200.win32.index", "i");
    writeFile(gameDir / "sqpack" / "ex2" / "ex2.ver", "v");
    writeFile(gameDir / "sqpack" / "ex2" / "settings.var", "s");
    writeFile(gameDir / "movie" / "ex2" / "00000.bk2", "m");
    writeFile(gameDir / "movie" / "ex2" / "00004.bk2", "m");
    writeFile(gameDir / "sqpack" / "ex1" / "020100.win32.dat0", "other");

    EXPECT_TRUE(install(ZiPatchBuilder().removeAll(2)));

    EXPECT_FALSE(std::filesystem::exists(gameDir / "sqpack" / "ex2" / "020200.win32.dat0"));
    EXPECT_FALSE(std::filesystem::exists(gameDir / "sqpack" / "ex2" / "020200.win32.index"));
    EXPECT_FALSE(std::filesystem::exists(gameDir / "sqpack" / "ex2" / "ex2.ver"));
    EXPECT_FALSE(std::filesystem::exists(gameDir / "movie" / "ex2" / "00004.bk2"));
    EXPECT_TRUE(std::filesystem::exists(gameDir / "sqpack" / "ex2" / "settings.var"));
    EXPECT_TRUE(std::filesystem::exists(gameDir / "movie" / "ex2" / "00000.bk2"));
    EXPECT_TRUE(std::filesystem::exists(gameDir / "sqpack" / "ex1" / "020100.win32.dat0"));
}

TEST_F(ChunkApplierTest, KeptOnRemoveAll) {
    EXPECT_TRUE(isKeptOnRemoveAll("movie/ffxiv/00003.bk2"));
    EXPECT_TRUE(isKeptOnRemoveAll("sqpack/ffxiv/something.var"));
    EXPECT_FALSE(isKeptOnRemoveAll("movie/ffxiv/00004.bk2"));
    EXPECT_FALSE(isKeptOnRemoveAll("sqpack/ffxiv/000000.win32.dat0"));
}

TEST_F(ChunkApplierTest, MakeDirTreeAndIndexCreateTargets) {
    auto target = ZiPatchBuilder::target(0x04, 0x0300, 0);
    EXPECT_TRUE(install(ZiPatchBuilder()
        .makeDirTree("sqpack/ex3/deep/tree")
        .index(target, 0x1122334455667788ULL)));

    EXPECT_TRUE(std::filesystem::is_directory(gameDir / "sqpack" / "ex3" / "deep" / "tree"));
    auto index = gameDir / "sqpack" / "ex3" / "040300.win32.index";
    ASSERT_TRUE(std::filesystem::exists(index));
    EXPECT_EQ(std::filesystem::file_size(index), 0u);
}

TEST_F(ChunkApplierTest, TargetInfoSwitchesPlatform) {
    auto target = ZiPatchBuilder::target(0x0a, 0x0000, 0);
    EXPECT_TRUE(install(ZiPatchBuilder()
        .targetInfo(SqpkPlatform::Ps4)
        .addData(target, 0, QByteArray(128, 'p'), 0)));

    EXPECT_TRUE(std::filesystem::exists(gameDir / "sqpack" / "ffxiv" / "0a0000.ps4.dat0"));
    EXPECT_FALSE(std::filesystem::exists(gameDir / "sqpack" / "ffxiv" / "0a0000.win32.dat0"));
}

TEST_F(ChunkApplierTest, RejectsPathsOutsideGameDirectory) {
    for (const std::string& path : {std::string("../escape"), std::string("boot/../../escape"),
                                    std::string("//etc/passwd"), std::string("/../escape"),
                                    std::string("C:\\Windows"),
                                    std::string("\\\\server\\share")}) {
        InstallSession session(gameDir);
        auto chunk = decodeSingle(ZiPatchBuilder().addDirectory(path));
        EXPECT_THROW(applyChunk(chunk, session), ChunkApplyError) << path;
    }
    EXPECT_FALSE(std::filesystem::exists(testDir / "escape"));
}

TEST_F(ChunkApplierTest, ResolveNormalizesSeparators) {
    InstallSession session(gameDir);
    EXPECT_EQ(session.resolve("sqpack\\ffxiv\\.\\000000.win32.dat0", "SQPK:A"),
              (gameDir / "sqpack" / "ffxiv" / "000000.win32.dat0").lexically_normal());
}

TEST_F(ChunkApplierTest, OpaqueChunksAreCounted) {
    InstallSession session(gameDir);
    applyChunk(decodeSingle(ZiPatchBuilder().chunk("XXXX", QByteArray("??"))), session);
    EXPECT_EQ(session.chunksApplied(), 1);
}

TEST_F(ChunkApplierTest, CancelledInstallStopsBeforeFirstChunk) {
    CancellationToken cancel;
    cancel.cancel();

    EXPECT_FALSE(install(ZiPatchBuilder().addDirectory("never"), cancel));
    EXPECT_EQ(lastChunkCount, 0);
    EXPECT_FALSE(std::filesystem::exists(gameDir / "never"));
}

TEST_F(ChunkApplierTest, ReportsProgressPerChunk) {
    auto path = testDir / "progress.patch";
    ZiPatchBuilder().addDirectory("a").addDirectory("b").endOfFile().writeTo(path);

    std::vector<qint64> positions;
    qint64 reportedSize = 0;
    PatchInstaller installer(gameDir);
    installer.setProgressCallback([&](qint64 position, qint64 size) {
        positions.push_back(position);
        reportedSize = size;
    });

    EXPECT_TRUE(installer.install(path, CancellationToken::none()));
    ASSERT_EQ(positions.size(), 3u);
    EXPECT_LT(positions[0], positions[1]);
    EXPECT_EQ(positions.back(), static_cast<qint64>(std::filesystem::file_size(path)));
    EXPECT_EQ(reportedSize, positions.back());
}
