#pragma once

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <unistd.h>

namespace util {

inline auto write_with_retry(int fd, const void* buffer, size_t size) -> ssize_t {
    while (true) {
        const auto result = ::write(fd, buffer, size);
        if (result < 0 && (errno == EINTR || errno == EAGAIN)) {
            continue;
        }
        return result;
    }
}

inline auto read_with_retry(int fd, void* buffer, size_t size) -> ssize_t {
    while (true) {
        const auto result = ::read(fd, buffer, size);
        if (result < 0 && errno == EINTR) {
            continue;
        }
        return result;
    }
}

// Writes exactly `size` bytes unless write(2) fails. Returns false with errno set on failure.
inline auto write_all(int fd, const void* buffer, size_t size) -> bool {
    const auto* cursor = static_cast<const uint8_t*>(buffer);
    while (size > 0) {
        const auto written = write_with_retry(fd, cursor, size);
        if (written < 0) {
            return false;
        }
        if (written == 0) {
            errno = EIO;
            return false;
        }
        cursor += written;
        size -= static_cast<size_t>(written);
    }
    return true;
}

} // namespace util
