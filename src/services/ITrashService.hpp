/**
 * @file ITrashService.hpp
 * @brief Interface to the system trash bin
 *
 * The trash bin is an external resource with no transactional guarantee across items:
 * every call acts on one path or one item.
 */

#pragma once

#include "models/TrashItem.hpp"
#include "util/Error.hpp"

#include <filesystem>
#include <vector>

/**
 * @class ITrashService
 * @brief Abstract interface for trash bin operations
 */
class ITrashService {
public:
    virtual ~ITrashService() = default;

    /**
     * @brief List every item currently in the trash
     * @return Items in service order
     */
    [[nodiscard]] virtual auto list() -> util::Result<std::vector<TrashItem>> = 0;

    /**
     * @brief Move a file or directory into the trash
     * @param path Existing path
     */
    [[nodiscard]] virtual auto trash(const std::filesystem::path& path) -> util::Result<void> = 0;

    /**
     * @brief Move an item back to its original path
     * @param item Item obtained from list()
     * @return Error of kind RESTORE_COLLISION, with the occupied destination as its path,
     *         when something already exists at the original path
     */
    [[nodiscard]] virtual auto restore(const TrashItem& item) -> util::Result<void> = 0;

    /**
     * @brief Permanently delete an item from the trash
     * @param item Item obtained from list()
     */
    [[nodiscard]] virtual auto purge(const TrashItem& item) -> util::Result<void> = 0;
};
