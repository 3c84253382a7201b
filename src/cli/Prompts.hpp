/**
 * @file Prompts.hpp
 * @brief Interactive questions asked during an operation
 *
 * Every prompt reads one line from `in`. End of input counts as the negative answer.
 */

#pragma once

#include "core/EntryOperation.hpp"
#include "models/TrashItem.hpp"

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cli {

/**
 * @brief Ask whether a directory root should be processed recursively
 * @return true only for an answer starting with 'y' or 'Y'
 */
[[nodiscard]] auto confirm_recursion(const std::filesystem::path& path, std::istream& in,
                                     std::ostream& out) -> bool;

/**
 * @brief Let the user pick one of several trash items sharing a name
 *
 * Lists the candidates as `N) original path | deleted at` and reads a 1-based index.
 * An invalid index is asked again; end of input or an empty answer returns std::nullopt.
 */
[[nodiscard]] auto choose_trash_item(const std::string& name,
                                     const std::vector<TrashItem>& candidates, std::istream& in,
                                     std::ostream& out) -> std::optional<TrashItem>;

/**
 * @brief Ask what to do with a search match: [y]es, [n]o or [s]top
 *
 * "s" stops the search without acting, as does end of input. Anything unrecognised is
 * treated as "n".
 */
[[nodiscard]] auto confirm_search_match(const std::filesystem::path& path,
                                        std::string_view target, bool is_directory,
                                        core::SearchAction action, std::istream& in,
                                        std::ostream& out) -> core::SearchDecision;

}  // namespace cli
