/**
 * @file GioTrashService.cpp
 * @brief Implementation of the GIO trash service
 */

#include "services/GioTrashService.hpp"

#include "util/Logger.hpp"

#include <gio/gio.h>

#include <format>
#include <memory>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace {
    constexpr auto TRASH_URI = "trash:///";
    constexpr auto TRASH_ATTRIBUTES = G_FILE_ATTRIBUTE_STANDARD_NAME ","
                                      G_FILE_ATTRIBUTE_TRASH_ORIG_PATH ","
                                      G_FILE_ATTRIBUTE_TRASH_DELETION_DATE;

    struct GObjectDeleter {
        void operator()(gpointer object) const {
            if (object) g_object_unref(object);
        }
    };

    template<typename T>
    using GObjectPtr = std::unique_ptr<T, GObjectDeleter>;

    struct GFreeDeleter {
        void operator()(gpointer data) const { g_free(data); }
    };

    using GCharPtr = std::unique_ptr<gchar, GFreeDeleter>;

    // Takes ownership of `error`
    auto to_error(GError* error, const std::string& path,
                  util::ErrorKind fallback = util::ErrorKind::TRASH) -> util::Error {
        if (!error) {
            return util::Error{fallback, "Unknown trash error", 0, path};
        }

        auto kind = fallback;
        if (g_error_matches(error, G_IO_ERROR, G_IO_ERROR_NOT_FOUND)) {
            kind = util::ErrorKind::NOT_FOUND;
        } else if (g_error_matches(error, G_IO_ERROR, G_IO_ERROR_EXISTS)) {
            kind = util::ErrorKind::RESTORE_COLLISION;
        }

        util::Error result{kind, error->message ? error->message : "Unknown trash error",
                           error->code, path};
        g_error_free(error);
        return result;
    }

    // trash::deletion-date is local time without an offset, e.g. 2024-03-01T10:22:05
    auto parse_deletion_date(const char* text) -> int64_t {
        if (!text) return 0;

        GTimeZone* local = g_time_zone_new_local();
        GDateTime* parsed = g_date_time_new_from_iso8601(text, local);
        g_time_zone_unref(local);
        if (!parsed) return 0;

        const int64_t seconds = g_date_time_to_unix(parsed);
        g_date_time_unref(parsed);
        return seconds;
    }
}

auto GioTrashService::list() -> util::Result<std::vector<TrashItem>> {
    GObjectPtr<GFile> trash_root{g_file_new_for_uri(TRASH_URI)};
    GError* error = nullptr;

    GObjectPtr<GFileEnumerator> enumerator{g_file_enumerate_children(
        trash_root.get(), TRASH_ATTRIBUTES, G_FILE_QUERY_INFO_NOFOLLOW_SYMLINKS, nullptr,
        &error)};
    if (!enumerator) {
        return std::unexpected(to_error(error, TRASH_URI));
    }

    std::vector<TrashItem> items;
    while (true) {
        GObjectPtr<GFileInfo> info{g_file_enumerator_next_file(enumerator.get(), nullptr, &error)};
        if (!info) {
            if (error) {
                return std::unexpected(to_error(error, TRASH_URI));
            }
            break;
        }

        const char* orig_path = g_file_info_get_attribute_byte_string(
            info.get(), G_FILE_ATTRIBUTE_TRASH_ORIG_PATH);
        if (!orig_path) {
            LOG_WARNING("GioTrash", std::format("Trash entry {} has no original path, ignoring",
                                                g_file_info_get_name(info.get())));
            continue;
        }

        GObjectPtr<GFile> child{g_file_enumerator_get_child(enumerator.get(), info.get())};
        GCharPtr uri{g_file_get_uri(child.get())};

        items.push_back(TrashItem{
            .name = fs::path{orig_path}.filename().string(),
            .original_path = orig_path,
            .deleted_at = parse_deletion_date(g_file_info_get_attribute_string(
                info.get(), G_FILE_ATTRIBUTE_TRASH_DELETION_DATE)),
            .id = uri ? uri.get() : std::string{},
        });
    }

    LOG_DEBUG("GioTrash", std::format("Listed {} trash items", items.size()));
    return items;
}

auto GioTrashService::trash(const fs::path& path) -> util::Result<void> {
    GObjectPtr<GFile> file{g_file_new_for_path(path.c_str())};
    GError* error = nullptr;

    if (!g_file_trash(file.get(), nullptr, &error)) {
        return std::unexpected(to_error(error, path.string()));
    }
    return {};
}

auto GioTrashService::restore(const TrashItem& item) -> util::Result<void> {
    const fs::path destination{item.original_path};

    std::error_code ec;
    if (fs::exists(fs::symlink_status(destination, ec))) {
        return std::unexpected(util::Error{util::ErrorKind::RESTORE_COLLISION,
                                           "Destination already exists", EEXIST,
                                           destination.string()});
    }

    GObjectPtr<GFile> source{g_file_new_for_uri(item.id.c_str())};
    GObjectPtr<GFile> target{g_file_new_for_path(destination.c_str())};
    GError* error = nullptr;

    if (GObjectPtr<GFile> parent{g_file_get_parent(target.get())}) {
        if (!g_file_make_directory_with_parents(parent.get(), nullptr, &error)) {
            if (!g_error_matches(error, G_IO_ERROR, G_IO_ERROR_EXISTS)) {
                return std::unexpected(to_error(error, destination.parent_path().string()));
            }
            g_clear_error(&error);
        }
    }

    if (!g_file_move(source.get(), target.get(), G_FILE_COPY_NOFOLLOW_SYMLINKS, nullptr,
                     nullptr, nullptr, &error)) {
        return std::unexpected(to_error(error, destination.string()));
    }
    return {};
}

auto GioTrashService::purge(const TrashItem& item) -> util::Result<void> {
    GObjectPtr<GFile> file{g_file_new_for_uri(item.id.c_str())};
    GError* error = nullptr;

    if (!g_file_delete(file.get(), nullptr, &error)) {
        return std::unexpected(to_error(error, item.original_path));
    }
    return {};
}
