/**
 * @file FileDescriptor.hpp
 * @brief RAII wrapper for POSIX file descriptors
 *
 * A descriptor opened for a single entry operation is owned here and closed on every
 * exit path, including error paths, before the entry is removed.
 */

#pragma once

#include "util/Error.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <filesystem>
#include <utility>

namespace util {

/**
 * @class FileDescriptor
 * @brief RAII wrapper for POSIX file descriptors
 */
class FileDescriptor {
public:
    /**
     * @brief Construct from raw file descriptor
     * @param fd Raw file descriptor (may be invalid)
     */
    explicit FileDescriptor(int fd) noexcept : fd_(fd) {}

    ~FileDescriptor() {
        reset();
    }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    FileDescriptor(FileDescriptor&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

    FileDescriptor& operator=(FileDescriptor&& other) noexcept {
        if (this != &other) {
            reset();
            fd_ = std::exchange(other.fd_, -1);
        }
        return *this;
    }

    /**
     * @brief Open a path, wrapping failure with the path
     * @param path File to open
     * @param flags open(2) flags; O_CLOEXEC is always added
     * @return Owned descriptor or the errno of open(2)
     */
    [[nodiscard]] static auto open(const std::filesystem::path& path, int flags)
        -> Result<FileDescriptor> {
        int fd = ::open(path.c_str(), flags | O_CLOEXEC);
        if (fd < 0) {
            return std::unexpected(Error::from_errno(errno, path));
        }
        return FileDescriptor{fd};
    }

    [[nodiscard]] constexpr auto get() const noexcept -> int { return fd_; }

    [[nodiscard]] constexpr auto is_valid() const noexcept -> bool { return fd_ >= 0; }

    explicit operator bool() const noexcept { return is_valid(); }

    /**
     * @brief Close the descriptor now
     */
    void reset() noexcept {
        if (is_valid()) {
            ::close(fd_);
        }
        fd_ = -1;
    }

private:
    int fd_;
};

}  // namespace util
