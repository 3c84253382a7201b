/**
 * @file OverwriteEngine.hpp
 * @brief In-place zero fill of a file's existing byte range
 */

#pragma once

#include "util/Error.hpp"

#include <cstddef>
#include <cstdint>

namespace overwrite {

/// Size of the zero buffer written per write(2) call
inline constexpr size_t BUFFER_SIZE = 1'024 * 1'024;

/**
 * @brief Overwrite every byte of an open file with zeros, `run_count` times
 *
 * Each pass seeks to offset 0, writes full buffers while at least one full buffer
 * remains before the original end of file, then writes exactly the remaining bytes,
 * and finally syncs to storage. The file is never truncated or extended.
 *
 * A directory, a zero-length file and `run_count == 0` are successful no-ops.
 * Errors from fstat, lseek, write or fsync are returned as-is; a failed pass is not
 * rolled back. The file is never removed here.
 *
 * @param fd Descriptor opened for writing
 * @param run_count Number of passes
 * @return Empty on success
 */
[[nodiscard]] auto overwrite_file(int fd, uint64_t run_count) -> util::Result<void>;

}  // namespace overwrite
