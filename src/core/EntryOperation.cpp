#include "core/EntryOperation.hpp"

#include "algorithms/OverwriteEngine.hpp"
#include "algorithms/VerificationHelper.hpp"
#include "core/TraversalEngine.hpp"
#include "util/FileDescriptor.hpp"
#include "util/Logger.hpp"
#include "util/StringDistance.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <format>
#include <utility>

namespace fs = std::filesystem;

namespace core {

namespace {

void emit(const ProgressCallback& progress, OperationKind kind, const fs::path& path,
          bool is_directory) {
    if (progress) {
        progress(ProgressEvent{.kind = kind, .path = path, .is_directory = is_directory});
    }
}

}  // namespace

auto remove_file_or_empty_dir(const fs::path& path) -> util::Result<void> {
    std::error_code ec;
    auto status = fs::symlink_status(path, ec);
    if (ec) {
        return std::unexpected(util::Error::from_error_code(ec, path));
    }
    if (!fs::exists(status)) {
        return std::unexpected(util::Error::from_errno(ENOENT, path));
    }

    int rc = fs::is_directory(status) ? ::rmdir(path.c_str()) : ::unlink(path.c_str());
    if (rc != 0) {
        return std::unexpected(util::Error::from_errno(errno, path));
    }
    return {};
}

auto open_for_overwrite(const fs::path& path, bool read_back)
    -> util::Result<util::FileDescriptor> {
    // O_NONBLOCK keeps a FIFO swapped in for the file from blocking the open
    const int access = read_back ? O_RDWR : O_WRONLY;
    auto fd = util::FileDescriptor::open(path, access | O_NOFOLLOW | O_NONBLOCK);
    if (!fd) {
        return std::unexpected(fd.error());
    }

    // The entry may have been replaced since it was inspected
    struct stat st{};
    if (::fstat(fd->get(), &st) != 0) {
        return std::unexpected(util::Error::from_errno(errno, path));
    }
    if (!S_ISREG(st.st_mode)) {
        return std::unexpected(util::Error{util::ErrorKind::IO, "Not a regular file", EINVAL,
                                           path.string()});
    }
    return fd;
}

auto shred_path(const fs::path& path, uint64_t run_count, bool verify) -> util::Result<void> {
    std::error_code ec;
    auto status = fs::symlink_status(path, ec);
    if (ec) {
        return std::unexpected(util::Error::from_error_code(ec, path));
    }

    if (fs::is_regular_file(status)) {
        auto fd = open_for_overwrite(path, verify);
        if (!fd) {
            return std::unexpected(fd.error());
        }

        if (auto written = overwrite::overwrite_file(fd->get(), run_count); !written) {
            return std::unexpected(written.error().with_path(path));
        }

        if (verify) {
            auto zeroed = verification::verify_zeros(fd->get());
            if (!zeroed) {
                return std::unexpected(zeroed.error().with_path(path));
            }
            if (!*zeroed) {
                return std::unexpected(util::Error{util::ErrorKind::VERIFICATION,
                                                   "Data did not read back as zeros", 0,
                                                   path.string()});
            }
        }

        LOG_DEBUG("Shred", std::format("Overwrote {} ({} run{})", path.string(), run_count,
                                       run_count == 1 ? "" : "s"));
        // Descriptor must be closed before the entry goes away
        fd->reset();
    }

    return remove_file_or_empty_dir(path);
}

// ---------------------------------------------------------------------------
// DeleteOperation

DeleteOperation::DeleteOperation(ProgressCallback progress) : progress_(std::move(progress)) {}

void DeleteOperation::notify(const fs::path& path, bool is_directory) {
    emit(progress_, OperationKind::DELETE, path, is_directory);
}

auto DeleteOperation::act(const fs::path& path) -> util::Result<Flow> {
    if (auto removed = remove_file_or_empty_dir(path); !removed) {
        return std::unexpected(removed.error());
    }
    LOG_DEBUG("Delete", std::format("Removed {}", path.string()));
    return Flow::CONTINUE;
}

// ---------------------------------------------------------------------------
// ShredOperation

ShredOperation::ShredOperation(uint64_t run_count, bool verify, ProgressCallback progress)
    : run_count_(run_count), verify_(verify), progress_(std::move(progress)) {}

void ShredOperation::notify(const fs::path& path, bool is_directory) {
    emit(progress_, OperationKind::SHRED, path, is_directory);
}

auto ShredOperation::act(const fs::path& path) -> util::Result<Flow> {
    if (auto shredded = shred_path(path, run_count_, verify_); !shredded) {
        return std::unexpected(shredded.error());
    }
    return Flow::CONTINUE;
}

// ---------------------------------------------------------------------------
// SearchOperation

SearchOperation::SearchOperation(std::string target, SearchAction action, SearchConfirm confirm,
                                 std::shared_ptr<ITrashService> trash,
                                 ProgressCallback progress, uint64_t shred_runs)
    : target_(std::move(target)), action_(action), confirm_(std::move(confirm)),
      trash_(std::move(trash)), progress_(std::move(progress)), shred_runs_(shred_runs) {}

void SearchOperation::notify(const fs::path& path, bool is_directory) {
    act_on_current_ = false;
    keep_searching_ = true;
    if (!root_.empty() && path == root_) {
        return;
    }

    emit(progress_, OperationKind::SEARCH, path, is_directory);

    auto name = path.filename().string();
    if (util::levenshtein(name, target_) > MATCH_DISTANCE) {
        return;
    }

    ++match_count_;
    LOG_DEBUG("Search", std::format("Match for '{}': {}", target_, path.string()));

    if (!confirm_) {
        return;
    }
    auto decision = confirm_(path, target_, is_directory, action_);
    act_on_current_ = decision.act_now;
    keep_searching_ = decision.keep_searching;
}

auto SearchOperation::act(const fs::path& path) -> util::Result<Flow> {
    if (act_on_current_) {
        act_on_current_ = false;
        if (auto applied = apply_action(path); !applied) {
            return std::unexpected(applied.error());
        }
        ++acted_count_;
    }
    return keep_searching_ ? Flow::CONTINUE : Flow::STOP;
}

auto SearchOperation::apply_action(const fs::path& path) -> util::Result<void> {
    switch (action_) {
        case SearchAction::TRASH: {
            if (!trash_) {
                return std::unexpected(util::Error{util::ErrorKind::INVALID_ARGUMENT,
                                                   "No trash service available", 0,
                                                   path.string()});
            }
            auto trashed = trash_->trash(path);
            if (!trashed) {
                return std::unexpected(trashed.error().with_path(path));
            }
            LOG_INFO("Search", std::format("Moved {} to trash", path.string()));
            return {};
        }
        case SearchAction::DELETE:
        case SearchAction::SHRED: {
            std::error_code ec;
            bool is_directory = fs::is_directory(fs::symlink_status(path, ec));
            if (ec) {
                return std::unexpected(util::Error::from_error_code(ec, path));
            }

            if (!is_directory) {
                auto done = action_ == SearchAction::DELETE ? remove_file_or_empty_dir(path)
                                                            : shred_path(path, shred_runs_);
                if (done) {
                    LOG_INFO("Search", std::format("{} {}",
                                                   action_ == SearchAction::DELETE
                                                       ? "Deleted"
                                                       : "Shredded",
                                                   path.string()));
                }
                return done;
            }

            // A matched directory is emptied with the same post-order walk as delete/shred
            EntryOperation nested = action_ == SearchAction::DELETE
                                        ? EntryOperation{DeleteOperation{progress_}}
                                        : EntryOperation{ShredOperation{shred_runs_, false,
                                                                        progress_}};
            auto walked = traverse(nested, path);
            if (!walked) {
                return std::unexpected(walked.error());
            }
            LOG_INFO("Search", std::format("Removed directory {} ({} entries)", path.string(),
                                           walked->processed_count));
            return {};
        }
    }
    return {};
}

// ---------------------------------------------------------------------------
// EntryOperation

auto EntryOperation::kind() const -> OperationKind {
    if (std::holds_alternative<DeleteOperation>(op_)) {
        return OperationKind::DELETE;
    }
    if (std::holds_alternative<ShredOperation>(op_)) {
        return OperationKind::SHRED;
    }
    return OperationKind::SEARCH;
}

}  // namespace core
