/**
 * @file VerificationHelper.cpp
 * @brief Implementation of read-back checks
 */

#include "algorithms/VerificationHelper.hpp"

#include "util/WriteHelpers.hpp"

#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <vector>

namespace verification {

namespace {
constexpr size_t VERIFY_BUFFER_SIZE = 1'024 * 1'024;  // 1MB buffer
}  // namespace

auto verify_zeros(int fd) -> util::Result<bool> {
    return verify_pattern(fd, 0x00);
}

auto verify_pattern(int fd, uint8_t pattern) -> util::Result<bool> {
    struct stat st{};
    if (::fstat(fd, &st) != 0) {
        return std::unexpected(util::Error::from_errno(errno, {}));
    }

    const auto size = static_cast<uint64_t>(st.st_size);
    if (S_ISDIR(st.st_mode) || size == 0) {
        return true;
    }

    if (::lseek(fd, 0, SEEK_SET) != 0) {
        return std::unexpected(util::Error::from_errno(errno, {}));
    }

    std::vector<uint8_t> buffer(VERIFY_BUFFER_SIZE);
    uint64_t verified = 0;

    while (verified < size) {
        size_t to_read = std::min(static_cast<uint64_t>(buffer.size()), size - verified);
        ssize_t bytes_read = util::read_with_retry(fd, buffer.data(), to_read);

        if (bytes_read < 0) {
            return std::unexpected(util::Error::from_errno(errno, {}));
        }
        if (bytes_read == 0) {
            // File shrank underneath us
            return false;
        }

        auto end = buffer.begin() + bytes_read;
        if (std::any_of(buffer.begin(), end, [pattern](uint8_t b) { return b != pattern; })) {
            return false;
        }

        verified += static_cast<uint64_t>(bytes_read);
    }

    return true;
}

}  // namespace verification
