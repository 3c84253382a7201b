/**
 * @file TrashOperations.hpp
 * @brief Selecting trash items by name and the trash/purge batches
 */

#pragma once

#include "models/OperationTypes.hpp"
#include "models/TrashItem.hpp"
#include "services/ITrashService.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace core {

/**
 * @brief Picks one item among several trash items sharing a name
 *
 * Returning std::nullopt skips the name.
 */
using TrashChooser = std::function<std::optional<TrashItem>(
    const std::string& name, const std::vector<TrashItem>& candidates)>;

/**
 * @brief All items whose name equals `name`, in service order
 */
[[nodiscard]] auto items_named(const std::vector<TrashItem>& items, std::string_view name)
    -> std::vector<TrashItem>;

/**
 * @brief Resolve user-supplied names to one trash item each
 *
 * A name with no match is reported through `on_missing` and dropped. A name matching
 * several items is resolved with `choose`. An item is never selected twice, so a name
 * given twice selects two different items.
 */
[[nodiscard]] auto select_items(const std::vector<TrashItem>& items,
                                const std::vector<std::string>& names,
                                const TrashChooser& choose,
                                const std::function<void(const std::string&)>& on_missing)
    -> std::vector<TrashItem>;

/**
 * @brief Items whose name loosely matches `query` (substring or small edit distance)
 */
[[nodiscard]] auto fuzzy_filter(const std::vector<TrashItem>& items, std::string_view query)
    -> std::vector<TrashItem>;

/**
 * @brief Move every path to the trash, in order, stopping at the first failure
 */
[[nodiscard]] auto trash_paths(ITrashService& trash,
                               const std::vector<std::filesystem::path>& paths,
                               const ProgressCallback& progress) -> BatchReport;

/**
 * @brief Permanently delete every item from the trash, stopping at the first failure
 */
[[nodiscard]] auto purge_items(ITrashService& trash, const std::vector<TrashItem>& items,
                               const ProgressCallback& progress) -> BatchReport;

}  // namespace core
