/**
 * @file OperationTypes.hpp
 * @brief Data types shared by file operations and their reporting
 */

#pragma once

#include "util/Error.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

/**
 * @enum OperationKind
 * @brief Commands the tool performs
 */
enum class OperationKind {
    TRASH,    ///< Move to the trash bin
    RESTORE,  ///< Restore from the trash bin
    PURGE,    ///< Permanently remove from the trash bin
    DELETE,   ///< Permanently delete without overwriting
    SHRED,    ///< Zero-overwrite then delete
    LIST,     ///< Print the trash bin contents
    SEARCH    ///< Walk a tree and act on near-matching names
};

/**
 * @brief Verb used in progress lines and error messages ("deleting", "shredding", ...)
 */
[[nodiscard]] constexpr auto to_infinitive(OperationKind kind) -> std::string_view {
    switch (kind) {
        case OperationKind::TRASH:
            return "trashing";
        case OperationKind::RESTORE:
            return "restoring";
        case OperationKind::PURGE:
            return "purging";
        case OperationKind::DELETE:
            return "deleting";
        case OperationKind::SHRED:
            return "shredding";
        case OperationKind::LIST:
            return "listing";
        case OperationKind::SEARCH:
            return "searching";
    }
    return "processing";
}

/**
 * @brief Past tense used in success summaries ("Deleted 3 files")
 */
[[nodiscard]] constexpr auto to_past_tense(OperationKind kind) -> std::string_view {
    switch (kind) {
        case OperationKind::TRASH:
            return "Trashed";
        case OperationKind::RESTORE:
            return "Restored";
        case OperationKind::PURGE:
            return "Purged";
        case OperationKind::DELETE:
            return "Deleted";
        case OperationKind::SHRED:
            return "Shredded";
        case OperationKind::LIST:
            return "Listed";
        case OperationKind::SEARCH:
            return "Searched";
    }
    return "Processed";
}

/**
 * @struct ProgressEvent
 * @brief Emitted once per entry, before the entry is acted on
 */
struct ProgressEvent {
    OperationKind kind = OperationKind::DELETE;
    std::filesystem::path path;
    bool is_directory = false;
};

/**
 * @brief Callback type for progress reporting
 */
using ProgressCallback = std::function<void(const ProgressEvent&)>;

/**
 * @struct TraversalResult
 * @brief Outcome of walking one directory subtree
 */
struct TraversalResult {
    size_t processed_count = 0;
    bool completed = true;  ///< false when an operation asked to stop early

    auto operator==(const TraversalResult&) const -> bool = default;
};

/**
 * @struct BatchReport
 * @brief Outcome of running an operation over several root paths
 *
 * A failed batch still carries the count of entries processed before the failure.
 */
struct BatchReport {
    size_t processed_count = 0;
    bool completed = true;
    std::vector<std::filesystem::path> skipped_roots;  ///< Directories the user declined
    std::optional<util::Error> error;

    [[nodiscard]] auto ok() const -> bool { return !error.has_value(); }
};

/**
 * @brief Asked once per directory root when recursion was not pre-approved
 */
using RecursionConfirm = std::function<bool(const std::filesystem::path&)>;
