/**
 * @file Error.hpp
 * @brief Error type carried by every fallible operation
 *
 * Fallible functions return std::expected<T, util::Error>. Filesystem failures are
 * wrapped with the path that caused them at the point of failure and then propagate
 * unchanged up to the CLI.
 */

#pragma once

#include <cerrno>
#include <cstring>
#include <expected>
#include <filesystem>
#include <format>
#include <string>
#include <utility>

namespace util {

/**
 * @enum ErrorKind
 * @brief Coarse classification used by callers that react to specific failures
 */
enum class ErrorKind {
    IO,                 ///< Filesystem or descriptor failure
    NOT_FOUND,          ///< Path or trash item does not exist
    RESTORE_COLLISION,  ///< Restore destination is already occupied
    TRASH,              ///< Trash service failure not covered above
    INVALID_ARGUMENT,   ///< Bad user input
    VERIFICATION        ///< Read-back check found non-zero data
};

/**
 * @struct Error
 * @brief Represents an error with a message, optional code and offending path
 */
struct Error {
    ErrorKind kind = ErrorKind::IO;
    std::string message;
    int code = 0;
    std::string path;

    Error() = default;
    explicit Error(std::string msg, int err_code = 0)
        : message(std::move(msg)), code(err_code) {}
    Error(ErrorKind err_kind, std::string msg, int err_code = 0, std::string err_path = {})
        : kind(err_kind), message(std::move(msg)), code(err_code), path(std::move(err_path)) {}

    /**
     * @brief Build an error from an errno value and the path that caused it
     * @param err errno value
     * @param path Offending path
     * @return Error of kind NOT_FOUND for ENOENT, IO otherwise
     */
    [[nodiscard]] static auto from_errno(int err, const std::filesystem::path& path) -> Error {
        return Error{err == ENOENT ? ErrorKind::NOT_FOUND : ErrorKind::IO, std::strerror(err),
                     err, path.string()};
    }

    /**
     * @brief Build an error from a std::error_code and the path that caused it
     */
    [[nodiscard]] static auto from_error_code(const std::error_code& ec,
                                              const std::filesystem::path& path) -> Error {
        auto kind = ec == std::errc::no_such_file_or_directory ? ErrorKind::NOT_FOUND
                                                                : ErrorKind::IO;
        return Error{kind, ec.message(), ec.value(), path.string()};
    }

    /**
     * @brief Attach a path if none was recorded yet
     */
    [[nodiscard]] auto with_path(const std::filesystem::path& p) const -> Error {
        Error copy = *this;
        if (copy.path.empty()) {
            copy.path = p.string();
        }
        return copy;
    }

    [[nodiscard]] auto what() const -> const std::string& {
        return message;
    }

    /**
     * @brief One-line description, e.g. "Permission denied caused by /tmp/a"
     */
    [[nodiscard]] auto describe() const -> std::string {
        if (path.empty()) {
            return message;
        }
        return std::format("{} caused by {}", message, path);
    }
};

/**
 * @brief Shorthand for the expected type used across the project
 */
template<typename T>
using Result = std::expected<T, Error>;

}  // namespace util
