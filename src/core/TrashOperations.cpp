#include "core/TrashOperations.hpp"

#include "util/Logger.hpp"
#include "util/StringDistance.hpp"

#include <algorithm>
#include <format>

namespace fs = std::filesystem;

namespace core {

auto items_named(const std::vector<TrashItem>& items, std::string_view name)
    -> std::vector<TrashItem> {
    std::vector<TrashItem> matches;
    std::copy_if(items.begin(), items.end(), std::back_inserter(matches),
                 [name](const TrashItem& item) { return item.name == name; });
    return matches;
}

auto select_items(const std::vector<TrashItem>& items, const std::vector<std::string>& names,
                  const TrashChooser& choose,
                  const std::function<void(const std::string&)>& on_missing)
    -> std::vector<TrashItem> {
    std::vector<TrashItem> remaining = items;
    std::vector<TrashItem> selected;

    for (const auto& name : names) {
        auto candidates = items_named(remaining, name);
        if (candidates.empty()) {
            LOG_WARNING("Trash", std::format("No item named {} in trash", name));
            if (on_missing) {
                on_missing(name);
            }
            continue;
        }

        std::optional<TrashItem> chosen = candidates.front();
        if (candidates.size() > 1) {
            chosen = choose ? choose(name, candidates) : std::nullopt;
            if (!chosen) {
                LOG_WARNING("Trash", std::format("No item chosen for {}, skipping", name));
                continue;
            }
        }

        std::erase(remaining, *chosen);
        selected.push_back(std::move(*chosen));
    }
    return selected;
}

auto fuzzy_filter(const std::vector<TrashItem>& items, std::string_view query)
    -> std::vector<TrashItem> {
    std::vector<TrashItem> matches;
    std::copy_if(items.begin(), items.end(), std::back_inserter(matches),
                 [query](const TrashItem& item) { return util::fuzzy_matches(item.name, query); });
    return matches;
}

auto trash_paths(ITrashService& trash, const std::vector<fs::path>& paths,
                 const ProgressCallback& progress) -> BatchReport {
    BatchReport report;
    for (const auto& path : paths) {
        if (progress) {
            std::error_code ec;
            progress(ProgressEvent{.kind = OperationKind::TRASH,
                                   .path = path,
                                   .is_directory = fs::is_directory(path, ec)});
        }

        auto trashed = trash.trash(path);
        if (!trashed) {
            report.error = trashed.error().with_path(path);
            LOG_ERROR("Trash", report.error->describe());
            return report;
        }
        ++report.processed_count;
        LOG_INFO("Trash", std::format("Moved {} to trash", path.string()));
    }
    return report;
}

auto purge_items(ITrashService& trash, const std::vector<TrashItem>& items,
                 const ProgressCallback& progress) -> BatchReport {
    BatchReport report;
    for (const auto& item : items) {
        if (progress) {
            progress(ProgressEvent{.kind = OperationKind::PURGE, .path = item.name});
        }

        auto purged = trash.purge(item);
        if (!purged) {
            report.error = purged.error().with_path(item.name);
            LOG_ERROR("Purge", report.error->describe());
            return report;
        }
        ++report.processed_count;
        LOG_INFO("Purge", std::format("Purged {} (from {})", item.name, item.original_path));
    }
    return report;
}

}  // namespace core
