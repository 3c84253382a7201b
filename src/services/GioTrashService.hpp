/**
 * @file GioTrashService.hpp
 * @brief Trash bin access through GIO's trash:/// backend
 *
 * GIO implements the freedesktop.org trash specification, including per-mount trash
 * directories, so items trashed here show up in the desktop's file manager.
 */

#pragma once

#include "services/ITrashService.hpp"

#include <filesystem>
#include <vector>

/**
 * @class GioTrashService
 * @brief ITrashService implemented with GFile operations
 */
class GioTrashService : public ITrashService {
public:
    GioTrashService() = default;
    ~GioTrashService() override = default;

    // Prevent copying
    GioTrashService(const GioTrashService&) = delete;
    GioTrashService& operator=(const GioTrashService&) = delete;

    [[nodiscard]] auto list() -> util::Result<std::vector<TrashItem>> override;
    [[nodiscard]] auto trash(const std::filesystem::path& path) -> util::Result<void> override;
    [[nodiscard]] auto restore(const TrashItem& item) -> util::Result<void> override;
    [[nodiscard]] auto purge(const TrashItem& item) -> util::Result<void> override;
};
