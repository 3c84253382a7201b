#include "core/TraversalEngine.hpp"

#include "util/Logger.hpp"

#include <algorithm>
#include <format>

namespace fs = std::filesystem;

namespace core {

namespace {

struct DirectoryEntry {
    fs::path path;
    bool is_directory = false;
};

auto list_directory(const fs::path& dir) -> util::Result<std::vector<DirectoryEntry>> {
    std::error_code ec;
    fs::directory_iterator it{dir, ec};
    if (ec) {
        return std::unexpected(util::Error::from_error_code(ec, dir));
    }

    std::vector<DirectoryEntry> entries;
    for (; it != fs::directory_iterator{}; it.increment(ec)) {
        if (ec) {
            return std::unexpected(util::Error::from_error_code(ec, dir));
        }
        auto status = it->symlink_status(ec);
        if (ec) {
            return std::unexpected(util::Error::from_error_code(ec, it->path()));
        }
        entries.push_back({it->path(), fs::is_directory(status)});
    }
    // increment() reports its error after leaving the loop
    if (ec) {
        return std::unexpected(util::Error::from_error_code(ec, dir));
    }

    std::sort(entries.begin(), entries.end(), [](const auto& a, const auto& b) {
        return a.path.filename() < b.path.filename();
    });
    return entries;
}

auto visit(EntryOperation& operation, const fs::path& path, bool is_directory)
    -> util::Result<Flow> {
    operation.notify(path, is_directory);
    auto flow = operation.act(path);
    if (!flow) {
        return std::unexpected(flow.error().with_path(path));
    }
    return flow;
}

// Returns whether the subtree was completed; `count` is updated in place so that a
// failing walk still leaves the number of entries reached.
auto walk(EntryOperation& operation, const fs::path& dir, size_t& count) -> util::Result<bool> {
    auto entries = list_directory(dir);
    if (!entries) {
        return std::unexpected(entries.error());
    }

    for (const auto& entry : *entries) {
        if (entry.is_directory) {
            auto completed = walk(operation, entry.path, count);
            if (!completed || !*completed) {
                return completed;
            }
            continue;
        }

        ++count;
        auto flow = visit(operation, entry.path, false);
        if (!flow) {
            return std::unexpected(flow.error());
        }
        if (*flow == Flow::STOP) {
            return false;
        }
    }

    ++count;
    auto flow = visit(operation, dir, true);
    if (!flow) {
        return std::unexpected(flow.error());
    }
    return *flow == Flow::CONTINUE;
}

auto is_directory_root(const fs::path& root) -> util::Result<bool> {
    std::error_code ec;
    auto status = fs::symlink_status(root, ec);
    if (ec) {
        return std::unexpected(util::Error::from_error_code(ec, root));
    }
    return fs::is_directory(status);
}

}  // namespace

auto traverse(EntryOperation& operation, const fs::path& root, size_t running_count)
    -> util::Result<TraversalResult> {
    auto is_dir = is_directory_root(root);
    if (!is_dir) {
        return std::unexpected(is_dir.error());
    }
    if (!*is_dir) {
        return TraversalResult{.processed_count = running_count, .completed = true};
    }

    size_t count = running_count;
    auto completed = walk(operation, root, count);
    if (!completed) {
        return std::unexpected(completed.error());
    }
    return TraversalResult{.processed_count = count, .completed = *completed};
}

auto run_batch(EntryOperation& operation, const std::vector<fs::path>& roots,
               const RecursionPolicy& policy) -> BatchReport {
    BatchReport report;

    for (const auto& root : roots) {
        auto is_dir = is_directory_root(root);
        if (!is_dir) {
            report.error = is_dir.error();
            return report;
        }

        util::Result<bool> completed = true;
        if (*is_dir) {
            bool approved = policy.recurse_without_prompt ||
                            (policy.confirm && policy.confirm(root));
            if (!approved) {
                LOG_WARNING("Traversal",
                            std::format("Skipping directory {}: recursion declined",
                                        root.string()));
                report.skipped_roots.push_back(root);
                continue;
            }
            completed = walk(operation, root, report.processed_count);
        } else {
            ++report.processed_count;
            auto flow = visit(operation, root, false);
            if (!flow) {
                completed = std::unexpected(flow.error());
            } else {
                completed = *flow == Flow::CONTINUE;
            }
        }

        if (!completed) {
            LOG_ERROR("Traversal", std::format("Batch aborted after {} entries: {}",
                                               report.processed_count,
                                               completed.error().describe()));
            report.error = completed.error();
            return report;
        }
        if (!*completed) {
            LOG_INFO("Traversal", std::format("Stopped early after {} entries",
                                              report.processed_count));
            report.completed = false;
            return report;
        }
    }

    return report;
}

auto resolve_directory_root(const fs::path& root) -> util::Result<fs::path> {
    std::error_code ec;
    auto resolved = fs::canonical(root, ec);
    if (ec) {
        return std::unexpected(util::Error::from_error_code(ec, root));
    }
    if (!fs::is_directory(fs::symlink_status(resolved, ec))) {
        return std::unexpected(util::Error{util::ErrorKind::INVALID_ARGUMENT, "Not a directory",
                                           ENOTDIR, root.string()});
    }
    if (resolved != root) {
        LOG_DEBUG("Traversal", std::format("Resolved {} to {}", root.string(), resolved.string()));
    }
    return resolved;
}

auto filter_existing(const std::vector<fs::path>& inputs,
                     const std::function<void(const fs::path&)>& on_missing)
    -> std::vector<fs::path> {
    std::vector<fs::path> existing;
    existing.reserve(inputs.size());

    for (const auto& input : inputs) {
        std::error_code ec;
        if (fs::exists(fs::symlink_status(input, ec))) {
            existing.push_back(input);
            continue;
        }
        LOG_WARNING("Traversal", std::format("No such file or directory: {}", input.string()));
        if (on_missing) {
            on_missing(input);
        }
    }
    return existing;
}

}  // namespace core
