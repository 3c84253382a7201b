/**
 * @file TraversalEngine.hpp
 * @brief Post-order directory walk and multi-root batch runner
 */

#pragma once

#include "core/EntryOperation.hpp"
#include "models/OperationTypes.hpp"
#include "util/Error.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <vector>

namespace core {

/**
 * @brief Walk a directory subtree post-order, applying the operation to every entry
 *
 * Entries of a directory are visited in ascending file-name order. Subdirectories are
 * walked before the files that follow them, and a directory is acted on only after
 * all of its children. Symlinks are treated as files and never followed.
 *
 * For every entry the running count is incremented, then notify() and act() are
 * called. An act() failure or an enumeration failure aborts the walk with the
 * offending path attached. A STOP from any entry ends the walk with
 * `completed == false` and nothing further is visited.
 *
 * A root that is not a directory is left alone and reported as `{running_count, true}`.
 *
 * @param operation Operation applied to each entry
 * @param root Directory to walk
 * @param running_count Count carried in from earlier roots
 * @return Final count and completion flag, or the first error
 */
[[nodiscard]] auto traverse(EntryOperation& operation, const std::filesystem::path& root,
                            size_t running_count = 0) -> util::Result<TraversalResult>;

/**
 * @struct RecursionPolicy
 * @brief How directory roots of a batch are handled
 */
struct RecursionPolicy {
    bool recurse_without_prompt = false;  ///< -R: walk every directory root
    RecursionConfirm confirm;             ///< Asked per directory root otherwise
};

/**
 * @brief Run an operation over several roots, in order, failing fast
 *
 * File roots are acted on directly. Directory roots are walked with traverse() once
 * recursion is approved; a declined root is skipped and the batch continues. The
 * first error ends the batch: later roots are never attempted and already processed
 * entries are not restored.
 *
 * @return Report with the processed count, even when the batch failed
 */
[[nodiscard]] auto run_batch(EntryOperation& operation,
                             const std::vector<std::filesystem::path>& roots,
                             const RecursionPolicy& policy) -> BatchReport;

/**
 * @brief Resolve a directory that a walk should start from
 *
 * The path is made canonical, so a symlink naming a directory resolves to the directory
 * itself. Only the root is resolved; symlinks below it are still never followed.
 *
 * @return Canonical directory path, NOT_FOUND, or INVALID_ARGUMENT if it is not a directory
 */
[[nodiscard]] auto resolve_directory_root(const std::filesystem::path& root)
    -> util::Result<std::filesystem::path>;

/**
 * @brief Drop inputs that do not exist, reporting each one
 * @param inputs Paths as given by the user
 * @param on_missing Called once per missing path
 * @return Existing paths in input order (dangling symlinks count as existing)
 */
[[nodiscard]] auto filter_existing(const std::vector<std::filesystem::path>& inputs,
                                   const std::function<void(const std::filesystem::path&)>&
                                       on_missing) -> std::vector<std::filesystem::path>;

}  // namespace core
