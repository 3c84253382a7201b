/**
 * @file OverwriteEngineTest.cpp
 * @brief Unit tests for the zero-fill overwrite engine
 */

#include "algorithms/OverwriteEngine.hpp"

#include "fixtures/TestFixtures.hpp"
#include "util/FileDescriptor.hpp"

#include <gtest/gtest.h>

#include <fcntl.h>
#include <unistd.h>

class OverwriteEngineTest : public TempDirFixture {
protected:
    util::FileDescriptor OpenForWrite(const std::filesystem::path& path) {
        auto fd = util::FileDescriptor::open(path, O_WRONLY);
        EXPECT_TRUE(fd.has_value()) << "Failed to open " << path;
        return fd ? std::move(*fd) : util::FileDescriptor{-1};
    }
};

// Test: the 1,000,000 byte scenario leaves length unchanged and every byte zero
TEST_F(OverwriteEngineTest, OverwriteFile_MillionBytes_AllZeroSameLength) {
    auto path = MakeFile("data.bin", 1'000'000, 0x01);
    auto fd = OpenForWrite(path);

    auto result = overwrite::overwrite_file(fd.get(), 1);
    fd.reset();

    ASSERT_TRUE(result.has_value()) << result.error().message;
    auto data = ReadFile(path);
    EXPECT_EQ(data.size(), 1'000'000u);
    EXPECT_TRUE(IsAllZeros(data));
}

// Test: several passes over a file spanning more than two buffers
TEST_F(OverwriteEngineTest, OverwriteFile_ThreeRuns_LargerThanBuffer) {
    const size_t size = 2 * overwrite::BUFFER_SIZE + 12'345;
    auto path = MakeFile("big.bin", size, 0xAB);
    auto fd = OpenForWrite(path);

    auto result = overwrite::overwrite_file(fd.get(), 3);
    fd.reset();

    ASSERT_TRUE(result.has_value());
    auto data = ReadFile(path);
    EXPECT_EQ(data.size(), size);
    EXPECT_TRUE(IsAllZeros(data));
}

// Test: exact multiple of the buffer size writes no remainder
TEST_F(OverwriteEngineTest, OverwriteFile_ExactBufferMultiple_NotExtended) {
    const size_t size = 2 * overwrite::BUFFER_SIZE;
    auto path = MakeFile("exact.bin", size, 0xFF);
    auto fd = OpenForWrite(path);

    ASSERT_TRUE(overwrite::overwrite_file(fd.get(), 1).has_value());
    fd.reset();

    EXPECT_EQ(std::filesystem::file_size(path), size);
    EXPECT_TRUE(IsAllZeros(ReadFile(path)));
}

// Test: a file smaller than one buffer
TEST_F(OverwriteEngineTest, OverwriteFile_SmallFile_AllZero) {
    auto path = MakeFile("small.txt", 7, 'x');
    auto fd = OpenForWrite(path);

    ASSERT_TRUE(overwrite::overwrite_file(fd.get(), 1).has_value());
    fd.reset();

    auto data = ReadFile(path);
    EXPECT_EQ(data, std::vector<uint8_t>(7, 0));
}

// Test: overwriting an already zeroed file changes nothing
TEST_F(OverwriteEngineTest, OverwriteFile_RunTwice_SameResult) {
    auto path = MakeFile("twice.bin", 4'096, 0x5A);
    auto fd = OpenForWrite(path);

    ASSERT_TRUE(overwrite::overwrite_file(fd.get(), 1).has_value());
    auto first = ReadFile(path);
    ASSERT_TRUE(overwrite::overwrite_file(fd.get(), 1).has_value());
    fd.reset();

    EXPECT_EQ(ReadFile(path), first);
}

// Test: zero-length file succeeds without writing
TEST_F(OverwriteEngineTest, OverwriteFile_EmptyFile_NoOp) {
    auto path = MakeFile("empty", 0);
    auto fd = OpenForWrite(path);

    EXPECT_TRUE(overwrite::overwrite_file(fd.get(), 3).has_value());
    fd.reset();

    EXPECT_EQ(std::filesystem::file_size(path), 0u);
}

// Test: zero runs leaves the data untouched
TEST_F(OverwriteEngineTest, OverwriteFile_ZeroRuns_DataUntouched) {
    auto path = MakeFile("keep.bin", 128, 0x01);
    auto fd = OpenForWrite(path);

    EXPECT_TRUE(overwrite::overwrite_file(fd.get(), 0).has_value());
    fd.reset();

    EXPECT_EQ(ReadFile(path), std::vector<uint8_t>(128, 0x01));
}

// Test: a directory handle is a successful no-op
TEST_F(OverwriteEngineTest, OverwriteFile_Directory_NoOp) {
    auto dir = MakeDir("folder");
    auto fd = util::FileDescriptor::open(dir, O_RDONLY | O_DIRECTORY);
    ASSERT_TRUE(fd.has_value());

    EXPECT_TRUE(overwrite::overwrite_file(fd->get(), 1).has_value());
    EXPECT_TRUE(std::filesystem::is_directory(dir));
}

// Test: invalid descriptor reports the errno
TEST_F(OverwriteEngineTest, OverwriteFile_InvalidDescriptor_ReturnsError) {
    auto result = overwrite::overwrite_file(-1, 1);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, EBADF);
    EXPECT_EQ(result.error().kind, util::ErrorKind::IO);
}

// Test: write failure on a read-only descriptor propagates
TEST_F(OverwriteEngineTest, OverwriteFile_ReadOnlyDescriptor_ReturnsError) {
    auto path = MakeFile("ro.bin", 64, 0x01);
    auto fd = util::FileDescriptor::open(path, O_RDONLY);
    ASSERT_TRUE(fd.has_value());

    auto result = overwrite::overwrite_file(fd->get(), 1);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, EBADF);
    fd->reset();
    EXPECT_EQ(ReadFile(path), std::vector<uint8_t>(64, 0x01));
}
