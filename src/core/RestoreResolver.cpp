#include "core/RestoreResolver.hpp"

#include "util/Logger.hpp"

#include <algorithm>
#include <format>
#include <utility>

namespace core {

RestoreResolver::RestoreResolver(std::shared_ptr<ITrashService> trash, TrashChooser choose,
                                 ProgressCallback progress)
    : trash_(std::move(trash)), choose_(std::move(choose)), progress_(std::move(progress)) {}

auto RestoreResolver::restore(const std::vector<std::string>& names) -> RestoreReport {
    state_ = RestoreState::PENDING;
    RestoreReport report;
    std::vector<std::string> pending = names;
    const size_t max_passes = pending.size();

    while (!pending.empty() && report.passes < max_passes) {
        ++report.passes;
        state_ = RestoreState::ATTEMPTING;
        const size_t pending_before = pending.size();

        auto listing = trash_->list();
        if (!listing) {
            state_ = RestoreState::FAILED;
            LOG_ERROR("Restore", listing.error().describe());
            report.error = listing.error();
            return report;
        }

        size_t i = 0;
        while (i < pending.size()) {
            const std::string name = pending[i];
            auto candidates = items_named(*listing, name);

            if (candidates.empty()) {
                LOG_WARNING("Restore", std::format("No item named {} in trash", name));
                report.missing_names.push_back(name);
                pending.erase(pending.begin() + static_cast<std::ptrdiff_t>(i));
                continue;
            }

            std::optional<TrashItem> chosen = candidates.front();
            if (candidates.size() > 1) {
                chosen = choose_ ? choose_(name, candidates) : std::nullopt;
                if (!chosen) {
                    LOG_WARNING("Restore", std::format("No item chosen for {}, skipping", name));
                    report.skipped_names.push_back(name);
                    pending.erase(pending.begin() + static_cast<std::ptrdiff_t>(i));
                    continue;
                }
            }

            if (progress_) {
                progress_(ProgressEvent{.kind = OperationKind::RESTORE,
                                        .path = chosen->original_path});
            }

            auto restored = trash_->restore(*chosen);
            if (restored) {
                LOG_INFO("Restore", std::format("Restored {} to {}", name,
                                                chosen->original_path));
                ++report.restored_count;
                std::erase(*listing, *chosen);
                pending.erase(pending.begin() + static_cast<std::ptrdiff_t>(i));
                continue;
            }

            if (restored.error().kind != util::ErrorKind::RESTORE_COLLISION) {
                state_ = RestoreState::FAILED;
                LOG_ERROR("Restore", restored.error().describe());
                report.error = restored.error();
                return report;
            }

            auto conflicting = restored.error().path.empty() ? chosen->original_path
                                                              : restored.error().path;
            LOG_WARNING("Restore", std::format("Cannot restore {}: {} already exists", name,
                                               conflicting));
            report.conflicts.push_back({name, conflicting});
            std::erase(pending, name);
            break;
        }

        if (pending.size() == pending_before) {
            break;
        }
    }

    if (!pending.empty()) {
        LOG_WARNING("Restore", std::format("{} names left pending after {} passes",
                                           pending.size(), report.passes));
    }
    state_ = RestoreState::DONE;
    return report;
}

}  // namespace core
