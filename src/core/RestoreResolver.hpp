/**
 * @file RestoreResolver.hpp
 * @brief Restores trash items by name, resolving duplicates and collisions
 */

#pragma once

#include "core/TrashOperations.hpp"
#include "models/OperationTypes.hpp"
#include "models/TrashItem.hpp"
#include "services/ITrashService.hpp"
#include "util/Error.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace core {

/**
 * @enum RestoreState
 * @brief Lifecycle of one restore() call
 */
enum class RestoreState {
    PENDING,     ///< Names queued, no pass started
    ATTEMPTING,  ///< A pass is running
    DONE,        ///< Every name was restored, reported or dropped
    FAILED       ///< Aborted on a trash service error
};

/**
 * @struct RestoreConflict
 * @brief A name whose original location is occupied
 */
struct RestoreConflict {
    std::string name;
    std::string conflicting_path;

    auto operator==(const RestoreConflict&) const -> bool = default;
};

/**
 * @struct RestoreReport
 * @brief Outcome of a restore() call
 *
 * A failed restore still carries everything accumulated before the failure.
 */
struct RestoreReport {
    size_t restored_count = 0;
    std::vector<std::string> missing_names;  ///< No trash item carried the name
    std::vector<std::string> skipped_names;  ///< Duplicates with no item chosen
    std::vector<RestoreConflict> conflicts;
    size_t passes = 0;
    std::optional<util::Error> error;  ///< First error that is not a collision

    [[nodiscard]] auto ok() const -> bool { return !error.has_value(); }
};

/**
 * @class RestoreResolver
 * @brief Bounded state machine over the pending names
 *
 * Each pass lists the trash once and works through the pending names in order. Every
 * name leaves the pending set exactly once: restored, missing, skipped, or dropped with
 * all its repeats on a collision. A collision ends the pass so the next one sees a fresh
 * listing. Since every pass removes at least one name, the number of passes never
 * exceeds the number of names requested; a pass that removes nothing ends the restore.
 */
class RestoreResolver {
public:
    RestoreResolver(std::shared_ptr<ITrashService> trash, TrashChooser choose,
                    ProgressCallback progress = nullptr);

    /**
     * @brief Restore one trash item per requested name
     * @param names Names as given by the user; repeats restore several items
     * @return Report; `error` holds the first failure that is not a collision
     */
    [[nodiscard]] auto restore(const std::vector<std::string>& names) -> RestoreReport;

    [[nodiscard]] auto state() const -> RestoreState { return state_; }

private:
    std::shared_ptr<ITrashService> trash_;
    TrashChooser choose_;
    ProgressCallback progress_;
    RestoreState state_ = RestoreState::PENDING;
};

}  // namespace core
