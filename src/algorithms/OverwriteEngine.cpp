#include "algorithms/OverwriteEngine.hpp"

#include "util/WriteHelpers.hpp"

#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <vector>

namespace overwrite {

namespace {

auto last_error() -> util::Error {
    return util::Error::from_errno(errno, {});
}

}  // namespace

auto overwrite_file(int fd, uint64_t run_count) -> util::Result<void> {
    struct stat st{};
    if (::fstat(fd, &st) != 0) {
        return std::unexpected(last_error());
    }

    if (S_ISDIR(st.st_mode)) {
        return {};
    }

    const auto file_size = static_cast<uint64_t>(st.st_size);
    if (file_size == 0 || run_count == 0) {
        return {};
    }

    // Never larger than the file itself
    const std::vector<uint8_t> zeros(
        static_cast<size_t>(std::min(static_cast<uint64_t>(BUFFER_SIZE), file_size)), 0);

    for (uint64_t pass = 0; pass < run_count; ++pass) {
        if (::lseek(fd, 0, SEEK_SET) != 0) {
            return std::unexpected(last_error());
        }

        uint64_t offset = 0;
        while (file_size - offset >= BUFFER_SIZE) {
            if (!util::write_all(fd, zeros.data(), BUFFER_SIZE)) {
                return std::unexpected(last_error());
            }
            offset += BUFFER_SIZE;
        }

        const auto remaining = static_cast<size_t>(file_size - offset);
        if (remaining > 0 && !util::write_all(fd, zeros.data(), remaining)) {
            return std::unexpected(last_error());
        }

        if (::fsync(fd) != 0) {
            return std::unexpected(last_error());
        }
    }

    return {};
}

}  // namespace overwrite
