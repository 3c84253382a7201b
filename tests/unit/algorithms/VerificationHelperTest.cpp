/**
 * @file VerificationHelperTest.cpp
 * @brief Unit tests for read-back verification
 */

#include "algorithms/VerificationHelper.hpp"

#include "fixtures/TestFixtures.hpp"
#include "util/FileDescriptor.hpp"

#include <gtest/gtest.h>

#include <fcntl.h>
#include <unistd.h>

class VerificationHelperTest : public TempDirFixture {
protected:
    // Spans more than one read buffer
    static constexpr size_t large_size = 1'024 * 1'024 + 100;
};

TEST_F(VerificationHelperTest, VerifyZeros_ZeroFile_ReturnsTrue) {
    auto path = MakeFile("zeros.bin", large_size, 0x00);
    auto fd = util::FileDescriptor::open(path, O_RDONLY);
    ASSERT_TRUE(fd.has_value());

    auto result = verification::verify_zeros(fd->get());

    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(*result);
}

// Test: a single non-zero byte past the first buffer is found
TEST_F(VerificationHelperTest, VerifyZeros_LastByteSet_ReturnsFalse) {
    auto path = MakeFile("tail.bin", large_size, 0x00);
    {
        std::fstream out(path, std::ios::binary | std::ios::in | std::ios::out);
        out.seekp(static_cast<std::streamoff>(large_size - 1));
        out.put('\x01');
    }
    auto fd = util::FileDescriptor::open(path, O_RDONLY);
    ASSERT_TRUE(fd.has_value());

    auto result = verification::verify_zeros(fd->get());

    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(*result);
}

TEST_F(VerificationHelperTest, VerifyZeros_EmptyFile_ReturnsTrue) {
    auto path = MakeFile("empty", 0);
    auto fd = util::FileDescriptor::open(path, O_RDONLY);
    ASSERT_TRUE(fd.has_value());

    auto result = verification::verify_zeros(fd->get());

    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(*result);
}

TEST_F(VerificationHelperTest, VerifyPattern_MatchingPattern_ReturnsTrue) {
    auto path = MakeFile("pattern.bin", 1'000, 0xAA);
    auto fd = util::FileDescriptor::open(path, O_RDONLY);
    ASSERT_TRUE(fd.has_value());

    EXPECT_TRUE(verification::verify_pattern(fd->get(), 0xAA).value());
    EXPECT_FALSE(verification::verify_pattern(fd->get(), 0x55).value());
}

// Test: verification reads from the start whatever the current offset is
TEST_F(VerificationHelperTest, VerifyZeros_OffsetAtEnd_StillChecksWholeFile) {
    auto path = MakeFile("offset.bin", 512, 0x07);
    auto fd = util::FileDescriptor::open(path, O_RDONLY);
    ASSERT_TRUE(fd.has_value());
    ASSERT_EQ(::lseek(fd->get(), 0, SEEK_END), 512);

    EXPECT_FALSE(verification::verify_zeros(fd->get()).value());
}

TEST_F(VerificationHelperTest, VerifyZeros_InvalidDescriptor_ReturnsError) {
    auto result = verification::verify_zeros(-1);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, EBADF);
}
