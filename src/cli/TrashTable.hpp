/**
 * @file TrashTable.hpp
 * @brief Table rendering of the trash bin contents
 */

#pragma once

#include "models/TrashItem.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace cli {

/**
 * @brief Format unix seconds as local "YYYY-MM-DD HH:MM:SS"
 */
[[nodiscard]] auto format_unix_date(int64_t seconds) -> std::string;

/**
 * @brief Width of the controlling terminal, or `fallback` when stdout is not a terminal
 */
[[nodiscard]] auto terminal_width(size_t fallback = 120) -> size_t;

/**
 * @brief Render items as a boxed `Name | Original path | Time deleted` table
 *
 * When the widest row does not fit in `width` columns, original paths are shortened
 * from the left and prefixed with "...".
 */
[[nodiscard]] auto render_trash_table(const std::vector<TrashItem>& items, size_t width)
    -> std::string;

}  // namespace cli
