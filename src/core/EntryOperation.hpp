/**
 * @file EntryOperation.hpp
 * @brief Per-entry operations applied by the traversal engine
 *
 * An EntryOperation is a closed set of alternatives (delete, shred, search-and-act).
 * For every entry the engine calls notify() and then act() on the same path.
 */

#pragma once

#include "models/OperationTypes.hpp"
#include "services/ITrashService.hpp"
#include "util/Error.hpp"
#include "util/FileDescriptor.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace core {

/**
 * @enum Flow
 * @brief What the engine should do after a successful act()
 */
enum class Flow {
    CONTINUE,  ///< Keep walking
    STOP       ///< Stop the whole batch, leaving remaining entries untouched
};

/**
 * @enum SearchAction
 * @brief Action a search applies to a confirmed match
 */
enum class SearchAction {
    TRASH,
    DELETE,
    SHRED
};

/**
 * @struct SearchDecision
 * @brief Answer to a search match confirmation
 */
struct SearchDecision {
    bool act_now = false;        ///< Apply the action to this entry
    bool keep_searching = true;  ///< false stops the walk after this entry
};

/**
 * @brief Asked for every entry whose name is close to the search target
 */
using SearchConfirm = std::function<SearchDecision(
    const std::filesystem::path& path, std::string_view target, bool is_directory,
    SearchAction action)>;

/**
 * @brief Remove a non-directory entry, or a directory that must already be empty
 * @return NOT_FOUND error if nothing exists at path
 */
[[nodiscard]] auto remove_file_or_empty_dir(const std::filesystem::path& path)
    -> util::Result<void>;

/**
 * @brief Open a regular file for overwriting without following a final symlink
 *
 * Opens with O_NOFOLLOW, so a symlink at `path` fails with ELOOP, and then requires the
 * opened descriptor to be a regular file. A file replaced between inspection and open is
 * therefore never written through.
 *
 * @param path File to open
 * @param read_back Open read-write so the data can be verified afterwards
 */
[[nodiscard]] auto open_for_overwrite(const std::filesystem::path& path, bool read_back)
    -> util::Result<util::FileDescriptor>;

/**
 * @brief Overwrite a regular file with zeros and then remove it
 *
 * Directories and symlinks are only removed; symlinks are never followed. When the
 * open, overwrite or verification fails, the entry is left in place. The descriptor is
 * closed before removal.
 *
 * @param path Entry to shred
 * @param run_count Overwrite passes (0 removes without writing)
 * @param verify Read the file back and require all zeros before removing it
 */
[[nodiscard]] auto shred_path(const std::filesystem::path& path, uint64_t run_count,
                              bool verify = false) -> util::Result<void>;

class DeleteOperation {
public:
    explicit DeleteOperation(ProgressCallback progress = nullptr);

    void notify(const std::filesystem::path& path, bool is_directory);
    [[nodiscard]] auto act(const std::filesystem::path& path) -> util::Result<Flow>;

private:
    ProgressCallback progress_;
};

class ShredOperation {
public:
    explicit ShredOperation(uint64_t run_count, bool verify = false,
                            ProgressCallback progress = nullptr);

    void notify(const std::filesystem::path& path, bool is_directory);
    [[nodiscard]] auto act(const std::filesystem::path& path) -> util::Result<Flow>;

    [[nodiscard]] auto run_count() const -> uint64_t { return run_count_; }

private:
    uint64_t run_count_;
    bool verify_;
    ProgressCallback progress_;
};

/**
 * @class SearchOperation
 * @brief Walks a tree and applies an action to entries named like the target
 *
 * notify() compares the entry's file name with the target (Levenshtein distance at
 * most MATCH_DISTANCE) and asks for confirmation on a match. act() applies the action
 * only when the latest notify() was confirmed, and stops the walk if asked to.
 * A matched directory is deleted or shredded through a nested post-order walk.
 */
class SearchOperation {
public:
    static constexpr size_t MATCH_DISTANCE = 1;

    SearchOperation(std::string target, SearchAction action, SearchConfirm confirm,
                    std::shared_ptr<ITrashService> trash = nullptr,
                    ProgressCallback progress = nullptr, uint64_t shred_runs = 1);

    void notify(const std::filesystem::path& path, bool is_directory);
    [[nodiscard]] auto act(const std::filesystem::path& path) -> util::Result<Flow>;

    /**
     * @brief Exclude the directory the search was started from
     */
    void set_root(std::filesystem::path root) { root_ = std::move(root); }

    [[nodiscard]] auto target() const -> const std::string& { return target_; }
    [[nodiscard]] auto action() const -> SearchAction { return action_; }
    [[nodiscard]] auto match_count() const -> size_t { return match_count_; }
    [[nodiscard]] auto acted_count() const -> size_t { return acted_count_; }

private:
    [[nodiscard]] auto apply_action(const std::filesystem::path& path) -> util::Result<void>;

    std::string target_;
    SearchAction action_;
    SearchConfirm confirm_;
    std::shared_ptr<ITrashService> trash_;
    ProgressCallback progress_;
    uint64_t shred_runs_;
    std::filesystem::path root_;

    bool act_on_current_ = false;
    bool keep_searching_ = true;
    size_t match_count_ = 0;
    size_t acted_count_ = 0;
};

/**
 * @class EntryOperation
 * @brief Closed variant over the per-entry operations, dispatched with std::visit
 */
class EntryOperation {
public:
    using Variant = std::variant<DeleteOperation, ShredOperation, SearchOperation>;

    EntryOperation(DeleteOperation op) : op_(std::move(op)) {}
    EntryOperation(ShredOperation op) : op_(std::move(op)) {}
    EntryOperation(SearchOperation op) : op_(std::move(op)) {}

    void notify(const std::filesystem::path& path, bool is_directory) {
        std::visit([&](auto& op) { op.notify(path, is_directory); }, op_);
    }

    [[nodiscard]] auto act(const std::filesystem::path& path) -> util::Result<Flow> {
        return std::visit([&](auto& op) { return op.act(path); }, op_);
    }

    [[nodiscard]] auto kind() const -> OperationKind;

    template<typename T>
    [[nodiscard]] auto get_if() -> T* {
        return std::get_if<T>(&op_);
    }

private:
    Variant op_;
};

}  // namespace core
