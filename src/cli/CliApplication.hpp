/**
 * @file CliApplication.hpp
 * @brief Command-line front end for trash, restore, delete and shred
 */

#pragma once

#include "core/EntryOperation.hpp"
#include "models/OperationTypes.hpp"
#include "services/ITrashService.hpp"
#include "util/Error.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cli {

/**
 * @struct CliOptions
 * @brief Parsed command line options
 */
struct CliOptions {
    bool show_help = false;
    bool show_version = false;
    bool recursive = false;   ///< -R: recurse into directories without asking
    bool verbose = false;     ///< -v: debug logging mirrored to stderr
    bool assume_yes = false;  ///< -y: answer recursion prompts with yes

    std::optional<OperationKind> command;
    std::vector<std::string> files;

    uint64_t runs = 1;     ///< shred -n
    bool verify = false;   ///< shred --verify
    bool purge_all = false;

    std::optional<std::string> list_query;         ///< list -s
    std::optional<core::SearchAction> search_action;  ///< search -c
    std::string search_target;
    std::string search_dir = ".";

    std::string error;  ///< Non-empty when the command line was rejected
};

/**
 * @class CliApplication
 * @brief Command-line application
 *
 * Usage: recycler [GLOBAL OPTIONS] <command> [COMMAND OPTIONS] [FILES...]
 *
 * Commands:
 * - trash, restore, purge: work with the system trash bin
 * - delete, shred: permanently remove files, shred overwrites them with zeros first
 * - list, search: print the trash bin, or find files by approximate name
 */
class CliApplication {
public:
    CliApplication();

    /**
     * @brief Construct with a specific trash service (GIO is used by default)
     */
    explicit CliApplication(std::shared_ptr<ITrashService> trash);

    ~CliApplication();

    // Non-copyable
    CliApplication(const CliApplication&) = delete;
    CliApplication& operator=(const CliApplication&) = delete;

    /**
     * @brief Run the CLI application
     * @param argc Argument count
     * @param argv Argument values
     * @return Exit code (0 = success)
     */
    auto run(int argc, char* argv[]) -> int;

    /**
     * @brief Parse command line arguments
     *
     * Global options come before the command name. getopt state is reset on entry, so
     * this may be called repeatedly.
     *
     * @param argc Argument count
     * @param argv Argument values (permuted by getopt)
     * @return Parsed options; `error` is set for an invalid command line
     */
    [[nodiscard]] static auto parse_args(int argc, char* argv[]) -> CliOptions;

    /**
     * @brief Map a command name to its operation
     */
    [[nodiscard]] static auto parse_command(std::string_view name) -> std::optional<OperationKind>;

    /**
     * @brief Map a search -c argument (t, d, s or the full word) to an action
     */
    [[nodiscard]] static auto parse_search_action(std::string_view name)
        -> std::optional<core::SearchAction>;

    /**
     * @brief Operation a search action performs, for messages and summaries
     */
    [[nodiscard]] static auto search_action_kind(core::SearchAction action) -> OperationKind;

    /**
     * @brief User-facing error line, e.g. "Error while deleting /tmp/a: Permission denied"
     */
    [[nodiscard]] static auto format_error(OperationKind kind, const util::Error& error)
        -> std::string;

    /**
     * @brief Print help message
     */
    static void print_help();

    /**
     * @brief Print version information
     */
    static void print_version();

private:
    void init_logging(const CliOptions& options);

    auto cmd_trash(const CliOptions& options) -> int;
    auto cmd_restore(const CliOptions& options) -> int;
    auto cmd_purge(const CliOptions& options) -> int;
    auto cmd_remove(const CliOptions& options) -> int;
    auto cmd_list(const CliOptions& options) -> int;
    auto cmd_search(const CliOptions& options) -> int;

    /**
     * @brief Print and log a failure, with the count reached before it
     * @return Exit code
     */
    static auto report_failure(OperationKind kind, const util::Error& error, size_t processed)
        -> int;

    std::shared_ptr<ITrashService> trash_;
};

}  // namespace cli
