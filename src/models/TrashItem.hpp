/**
 * @file TrashItem.hpp
 * @brief Data model for an entry in the system trash bin
 */

#pragma once

#include <cstdint>
#include <string>

/**
 * @struct TrashItem
 * @brief One trashed file or directory as reported by the trash service
 *
 * Items are owned by the trash service. Several items may share a name when files
 * with the same name were trashed from different places or at different times.
 */
struct TrashItem {
    std::string name;           ///< File name at the time it was trashed
    std::string original_path;  ///< Absolute path it was trashed from
    int64_t deleted_at = 0;     ///< Deletion time, seconds since the Unix epoch
    std::string id;             ///< Opaque service handle (trash:/// URI for GIO)

    auto operator==(const TrashItem&) const -> bool = default;
};
