/**
 * FFXIV Updater - Pack File Store Tests
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

#include "core/Errors.hpp"
#include "patch/SqexFileStore.hpp"

using namespace ffxiv::patch;

class SqexFileStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir = std::filesystem::temp_directory_path() / "ffxiv-updater-test-store";
        std::filesystem::remove_all(testDir);
        std::filesystem::create_directories(testDir);
    }

    void TearDown() override {
        std::filesystem::remove_all(testDir);
    }

    static QByteArray readFile(const std::filesystem::path& path) {
        QFile file(QString::fromStdString(path.string()));
        if (!file.open(QIODevice::ReadOnly)) {
            return QByteArray();
        }
        return file.readAll();
    }

    static uint32_t readU32LE(const QByteArray& data, qsizetype offset) {
        uint32_t value = 0;
        for (int i = 3; i >= 0; --i) {
            value = (value << 8) | static_cast<uint8_t>(data[offset + i]);
        }
        return value;
    }

    std::filesystem::path testDir;
};

TEST_F(SqexFileStoreTest, SamePathYieldsSameHandle) {
    SqexFileStore store;

    auto first = store.acquire(testDir / "sqpack" / "ffxiv" / "000000.win32.dat0");
    auto second = store.acquire(testDir / "sqpack" / "ffxiv" / ".." / "ffxiv" / "000000.win32.dat0");
    auto other = store.acquire(testDir / "sqpack" / "ffxiv" / "000000.win32.index");

    EXPECT_EQ(first.get(), second.get());
    EXPECT_NE(first.get(), other.get());
    EXPECT_EQ(store.openCount(), 2u);
}

TEST_F(SqexFileStoreTest, AcquireCreatesParentsWithoutTruncating) {
    auto path = testDir / "existing.dat";
    {
        std::ofstream out(path, std::ios::binary);
        out << "keep me";
    }

    SqexFileStore store;
    auto file = store.acquire(path);
    EXPECT_EQ(file->size(), 7);

    auto nested = store.acquire(testDir / "a" / "b" / "c.dat");
    EXPECT_TRUE(std::filesystem::exists(testDir / "a" / "b" / "c.dat"));
    EXPECT_EQ(nested->size(), 0);
}

TEST_F(SqexFileStoreTest, DestructionClosesEveryHandle) {
    std::shared_ptr<SqexFile> kept;
    {
        SqexFileStore store;
        kept = store.acquire(testDir / "x.dat");
        kept->writeAt(0, QByteArray("data"));
        store.acquire(testDir / "y.dat");
        EXPECT_TRUE(kept->isOpen());
    }
    EXPECT_FALSE(kept->isOpen());
    EXPECT_EQ(readFile(testDir / "x.dat"), QByteArray("data"));
}

TEST_F(SqexFileStoreTest, ReleaseDropsOneEntry) {
    SqexFileStore store;
    auto path = testDir / "gone.dat";
    auto file = store.acquire(path);
    store.acquire(testDir / "stays.dat");

    EXPECT_TRUE(store.release(path));
    EXPECT_FALSE(store.isOpen(path));
    EXPECT_FALSE(file->isOpen());
    EXPECT_FALSE(store.release(path));
    EXPECT_EQ(store.openCount(), 1u);
}

TEST_F(SqexFileStoreTest, ReleaseUnderDirectory) {
    SqexFileStore store;
    store.acquire(testDir / "movie" / "ex1" / "a.bk2");
    store.acquire(testDir / "movie" / "ex1" / "b.bk2");
    store.acquire(testDir / "sqpack" / "ex1" / "c.dat0");

    store.releaseUnder(testDir / "movie" / "ex1");

    EXPECT_EQ(store.openCount(), 1u);
    EXPECT_TRUE(store.isOpen(testDir / "sqpack" / "ex1" / "c.dat0"));
}

TEST_F(SqexFileStoreTest, WriteAtExtendsFile) {
    SqexFileStore store;
    auto path = testDir / "sparse.dat";
    auto file = store.acquire(path);

    file->writeAt(256, QByteArray("tail"));
    file->flush();

    QByteArray content = readFile(path);
    ASSERT_EQ(content.size(), 260);
    EXPECT_EQ(content.mid(256), QByteArray("tail"));
    EXPECT_EQ(content.left(256), QByteArray(256, '\0'));
}

TEST_F(SqexFileStoreTest, WipeZeroFillsAcrossPages) {
    SqexFileStore store;
    auto path = testDir / "wipe.dat";
    auto file = store.acquire(path);

    const qint64 length = 200000;
    file->writeAt(0, QByteArray(static_cast<qsizetype>(length + 10), 'z'));
    file->wipe(5, length);
    file->flush();

    QByteArray content = readFile(path);
    ASSERT_EQ(content.size(), length + 10);
    EXPECT_EQ(content.left(5), QByteArray(5, 'z'));
    EXPECT_EQ(content.mid(5, length), QByteArray(static_cast<qsizetype>(length), '\0'));
    EXPECT_EQ(content.mid(5 + length), QByteArray(5, 'z'));
}

TEST_F(SqexFileStoreTest, EmptyBlockHeaderLayout) {
    SqexFileStore store;
    auto path = testDir / "empty.dat";
    auto file = store.acquire(path);

    file->writeAt(0, QByteArray(1024, 'q'));
    file->writeEmptyBlockAt(256, 3);
    file->flush();

    QByteArray content = readFile(path);
    ASSERT_EQ(content.size(), 1024);
    EXPECT_EQ(content.left(256), QByteArray(256, 'q'));

    EXPECT_EQ(readU32LE(content, 256), 128u);
    EXPECT_EQ(readU32LE(content, 260), 0u);
    EXPECT_EQ(readU32LE(content, 264), 0u);
    EXPECT_EQ(readU32LE(content, 268), 2u);
    EXPECT_EQ(readU32LE(content, 272), 0u);
    EXPECT_EQ(content.mid(276, 3 * 128 - 20), QByteArray(3 * 128 - 20, '\0'));
    EXPECT_EQ(content.mid(256 + 3 * 128), QByteArray(1024 - 256 - 3 * 128, 'q'));
}

TEST_F(SqexFileStoreTest, ZeroBlockEmptyBlockIsRejected) {
    SqexFileStore store;
    auto file = store.acquire(testDir / "zero.dat");
    EXPECT_THROW(file->writeEmptyBlockAt(0, 0), ffxiv::FileStoreError);
}

TEST_F(SqexFileStoreTest, TruncateShrinksFile) {
    SqexFileStore store;
    auto file = store.acquire(testDir / "trunc.dat");
    file->writeAt(0, QByteArray(500, 'a'));
    file->truncate(100);
    EXPECT_EQ(file->size(), 100);
}
