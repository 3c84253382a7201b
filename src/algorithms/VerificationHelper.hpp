/**
 * @file VerificationHelper.hpp
 * @brief Read-back checks run after an overwrite
 */

#pragma once

#include "util/Error.hpp"

#include <cstdint>

namespace verification {

/**
 * @brief Verify that a file contains only zero bytes
 * @param fd File descriptor (opened for reading)
 * @return true if every byte in [0, size) is zero, false on the first mismatch
 */
[[nodiscard]] auto verify_zeros(int fd) -> util::Result<bool>;

/**
 * @brief Verify that a file contains a repeating byte value
 * @param fd File descriptor (opened for reading)
 * @param pattern Expected byte value
 * @return true if every byte matches; an empty file matches any pattern
 */
[[nodiscard]] auto verify_pattern(int fd, uint8_t pattern) -> util::Result<bool>;

}  // namespace verification
