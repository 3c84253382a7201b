/**
 * @file CliApplication.cpp
 * @brief CLI application implementation
 */

#include "cli/CliApplication.hpp"

#include "cli/ProgressDisplay.hpp"
#include "cli/Prompts.hpp"
#include "cli/TrashTable.hpp"
#include "config.h"
#include "core/RestoreResolver.hpp"
#include "core/TrashOperations.hpp"
#include "core/TraversalEngine.hpp"
#include "services/GioTrashService.hpp"
#include "util/Logger.hpp"

#include <glib.h>

#include <algorithm>
#include <charconv>
#include <filesystem>
#include <format>
#include <iostream>

#include <getopt.h>

namespace fs = std::filesystem;

namespace cli {

namespace {

// Application name
constexpr auto APP_NAME = PROJECT_NAME;

constexpr int OPT_VERIFY = 1000;

// Global options, parsing stops at the command name
const struct option global_options[] = {
    {     "help", no_argument, nullptr, 'h'},
    {  "version", no_argument, nullptr, 'V'},
    {"recursive", no_argument, nullptr, 'R'},
    {  "verbose", no_argument, nullptr, 'v'},
    {      "yes", no_argument, nullptr, 'y'},
    {    nullptr,           0, nullptr,   0}
};

const struct option plain_options[] = {
    {   "help", no_argument, nullptr, 'h'},
    {  nullptr,           0, nullptr,   0}
};

const struct option purge_options[] = {
    {   "help", no_argument, nullptr, 'h'},
    {    "all", no_argument, nullptr, 'a'},
    {  nullptr,           0, nullptr,   0}
};

const struct option shred_options[] = {
    {   "help",       no_argument, nullptr,        'h'},
    {   "runs", required_argument, nullptr,        'n'},
    { "verify",       no_argument, nullptr, OPT_VERIFY},
    {  nullptr,                 0, nullptr,          0}
};

const struct option list_options[] = {
    {   "help",       no_argument, nullptr, 'h'},
    { "search", required_argument, nullptr, 's'},
    {  nullptr,                 0, nullptr,   0}
};

const struct option search_options[] = {
    {   "help",       no_argument, nullptr, 'h'},
    {"command", required_argument, nullptr, 'c'},
    {  nullptr,                 0, nullptr,   0}
};

auto parse_runs(std::string_view text) -> std::optional<uint64_t> {
    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

auto to_paths(const std::vector<std::string>& files) -> std::vector<fs::path> {
    return {files.begin(), files.end()};
}

}  // namespace

CliApplication::CliApplication() = default;

CliApplication::CliApplication(std::shared_ptr<ITrashService> trash) : trash_(std::move(trash)) {}

CliApplication::~CliApplication() = default;

auto CliApplication::run(int argc, char* argv[]) -> int {
    auto options = parse_args(argc, argv);

    if (options.show_help) {
        print_help();
        return 0;
    }

    if (options.show_version) {
        print_version();
        return 0;
    }

    if (!options.error.empty()) {
        std::cerr << "Error: " << options.error << "\n"
                  << "Run with --help for usage.\n";
        return 1;
    }

    init_logging(options);

    if (!trash_) {
        trash_ = std::make_shared<GioTrashService>();
    }

    switch (*options.command) {
        case OperationKind::TRASH:
            return cmd_trash(options);
        case OperationKind::RESTORE:
            return cmd_restore(options);
        case OperationKind::PURGE:
            return cmd_purge(options);
        case OperationKind::DELETE:
        case OperationKind::SHRED:
            return cmd_remove(options);
        case OperationKind::LIST:
            return cmd_list(options);
        case OperationKind::SEARCH:
            return cmd_search(options);
    }
    return 1;
}

auto CliApplication::parse_args(int argc, char* argv[]) -> CliOptions {
    CliOptions options;

    // Full reinitialization of getopt, including the '+' scanning mode
    optind = 0;

    int opt;
    while ((opt = getopt_long(argc, argv, "+hVRvy", global_options, nullptr)) != -1) {
        switch (opt) {
            case 'h':
                options.show_help = true;
                break;
            case 'V':
                options.show_version = true;
                break;
            case 'R':
                options.recursive = true;
                break;
            case 'v':
                options.verbose = true;
                break;
            case 'y':
                options.assume_yes = true;
                break;
            default:
                options.error = "Invalid global option";
                return options;
        }
    }

    if (options.show_help || options.show_version) {
        return options;
    }

    if (optind >= argc) {
        options.error = "No command given";
        return options;
    }

    const std::string_view command_name = argv[optind];
    options.command = parse_command(command_name);
    if (!options.command) {
        options.error = std::format("Unknown command '{}'", command_name);
        return options;
    }

    // The command name becomes argv[0] of its own option scan
    const int sub_argc = argc - optind;
    char** sub_argv = argv + optind;
    optind = 0;

    const char* short_options = "h";
    const struct option* long_options = plain_options;
    switch (*options.command) {
        case OperationKind::PURGE:
            short_options = "ha";
            long_options = purge_options;
            break;
        case OperationKind::SHRED:
            short_options = "hn:";
            long_options = shred_options;
            break;
        case OperationKind::LIST:
            short_options = "hs:";
            long_options = list_options;
            break;
        case OperationKind::SEARCH:
            short_options = "hc:";
            long_options = search_options;
            break;
        default:
            break;
    }

    while ((opt = getopt_long(sub_argc, sub_argv, short_options, long_options, nullptr)) != -1) {
        switch (opt) {
            case 'h':
                options.show_help = true;
                break;
            case 'a':
                options.purge_all = true;
                break;
            case 'n': {
                auto runs = parse_runs(optarg);
                if (!runs) {
                    options.error = std::format("Invalid run count '{}'", optarg);
                    return options;
                }
                options.runs = *runs;
                break;
            }
            case OPT_VERIFY:
                options.verify = true;
                break;
            case 's':
                options.list_query = optarg;
                break;
            case 'c':
                options.search_action = parse_search_action(optarg);
                if (!options.search_action) {
                    options.error = std::format("Invalid search command '{}' (expected t, d or s)",
                                                optarg);
                    return options;
                }
                break;
            default:
                options.error = std::format("Invalid option for {}", command_name);
                return options;
        }
    }

    for (int i = optind; i < sub_argc; ++i) {
        options.files.emplace_back(sub_argv[i]);
    }

    if (options.show_help) {
        return options;
    }

    switch (*options.command) {
        case OperationKind::TRASH:
        case OperationKind::RESTORE:
        case OperationKind::DELETE:
        case OperationKind::SHRED:
            if (options.files.empty()) {
                options.error = std::format("{} requires at least one file", command_name);
            }
            break;
        case OperationKind::PURGE:
            // "*" is accepted as a synonym for --all
            if (std::ranges::find(options.files, "*") != options.files.end()) {
                options.purge_all = true;
            }
            if (!options.purge_all && options.files.empty()) {
                options.error = "purge requires at least one name, or --all";
            }
            break;
        case OperationKind::LIST:
            if (!options.files.empty()) {
                options.error = "list takes no file arguments";
            }
            break;
        case OperationKind::SEARCH:
            if (!options.search_action) {
                options.error = "search requires -c t|d|s";
            } else if (options.files.empty() || options.files.size() > 2) {
                options.error = "search requires a target and an optional directory";
            } else {
                options.search_target = options.files[0];
                if (options.files.size() == 2) {
                    options.search_dir = options.files[1];
                }
            }
            break;
    }

    return options;
}

auto CliApplication::parse_command(std::string_view name) -> std::optional<OperationKind> {
    if (name == "trash") return OperationKind::TRASH;
    if (name == "restore") return OperationKind::RESTORE;
    if (name == "purge") return OperationKind::PURGE;
    if (name == "delete") return OperationKind::DELETE;
    if (name == "shred") return OperationKind::SHRED;
    if (name == "list") return OperationKind::LIST;
    if (name == "search") return OperationKind::SEARCH;
    return std::nullopt;
}

auto CliApplication::parse_search_action(std::string_view name)
    -> std::optional<core::SearchAction> {
    if (name == "t" || name == "trash") return core::SearchAction::TRASH;
    if (name == "d" || name == "delete") return core::SearchAction::DELETE;
    if (name == "s" || name == "shred") return core::SearchAction::SHRED;
    return std::nullopt;
}

auto CliApplication::search_action_kind(core::SearchAction action) -> OperationKind {
    switch (action) {
        case core::SearchAction::TRASH:
            return OperationKind::TRASH;
        case core::SearchAction::DELETE:
            return OperationKind::DELETE;
        case core::SearchAction::SHRED:
            return OperationKind::SHRED;
    }
    return OperationKind::SEARCH;
}

auto CliApplication::format_error(OperationKind kind, const util::Error& error) -> std::string {
    if (kind == OperationKind::LIST) {
        return std::format("Error while getting trash list: {}", error.message);
    }
    return std::format("Error while {} {}: {}", to_infinitive(kind),
                       error.path.empty() ? "[no file]" : error.path, error.message);
}

void CliApplication::print_help() {
    std::cout << "Usage: " << APP_NAME << " [OPTIONS] <command> [COMMAND OPTIONS] [FILES...]\n\n"
              << "Move files to and from the trash, delete or shred them\n\n"
              << "Commands:\n"
              << "  trash FILES...                Move files to the trash bin\n"
              << "  restore NAMES...              Restore items from the trash bin by name\n"
              << "  purge [-a] NAMES...           Permanently delete items from the trash bin\n"
              << "  delete FILES...               Delete files permanently without overwriting\n"
              << "  shred [-n N] [--verify] FILES...\n"
              << "                                Overwrite files with zeros, then delete them\n"
              << "  list [-s QUERY]               List the trash bin contents\n"
              << "  search -c t|d|s TARGET [DIR]  Find files named like TARGET under DIR\n"
              << "                                (default .) and trash, delete or shred them\n\n"
              << "Options:\n"
              << "  -h, --help                    Show this help message\n"
              << "  -V, --version                 Show version information\n"
              << "  -R, --recursive               Recurse into directories without asking\n"
              << "  -v, --verbose                 Print debug log lines to stderr\n"
              << "  -y, --yes                     Answer yes to recursion prompts\n\n"
              << "Command options:\n"
              << "  -a, --all                     purge: empty the whole trash bin\n"
              << "  -n, --runs N                  shred: overwrite passes (default: 1)\n"
              << "      --verify                  shred: read back zeros before deleting\n"
              << "  -s, --search QUERY            list: fuzzy filter on item names\n"
              << "  -c, --command t|d|s           search: trash, delete or shred matches\n\n"
              << "Examples:\n"
              << "  " << APP_NAME << " trash notes.txt build/\n"
              << "  " << APP_NAME << " restore notes.txt\n"
              << "  " << APP_NAME << " -R shred -n 3 --verify secrets/\n"
              << "  " << APP_NAME << " search -c d core.dump ~/projects\n"
              << std::endl;
}

void CliApplication::print_version() {
    std::cout << APP_NAME << " version " << PROJECT_VERSION << "\n"
              << "Trash, restore, delete and shred files from the command line\n";
}

void CliApplication::init_logging(const CliOptions& options) {
    auto log_dir = fs::path(g_get_user_data_dir()) / APP_NAME / "logs";
    auto level = options.verbose ? util::LogLevel::DEBUG : util::LogLevel::INFO;
    if (!util::Logger::instance().initialize(log_dir, APP_NAME, level)) {
        std::cerr << "Warning: cannot write log file in " << log_dir.string() << "\n";
    }
    util::Logger::instance().set_console_output(options.verbose);
}

auto CliApplication::report_failure(OperationKind kind, const util::Error& error,
                                    size_t processed) -> int {
    const auto message = format_error(kind, error);
    LOG_ERROR("CLI", message);
    std::cerr << message << "\n";
    if (processed > 0) {
        std::cerr << ProgressDisplay::summary(kind, processed) << " before the error\n";
    }
    return 1;
}

auto CliApplication::cmd_trash(const CliOptions& options) -> int {
    ProgressDisplay progress(OperationKind::TRASH);

    auto existing = core::filter_existing(to_paths(options.files), [&](const fs::path& path) {
        progress.warn(std::format("No such file or directory: {}", path.string()));
    });

    auto report = core::trash_paths(*trash_, existing, [&](const ProgressEvent& event) {
        progress.update(event);
    });
    if (!report.ok()) {
        progress.clear();
        return report_failure(OperationKind::TRASH, *report.error, report.processed_count);
    }

    progress.finish(report.processed_count);
    return 0;
}

auto CliApplication::cmd_restore(const CliOptions& options) -> int {
    ProgressDisplay progress(OperationKind::RESTORE);

    core::RestoreResolver resolver(
        trash_,
        [&](const std::string& name, const std::vector<TrashItem>& candidates) {
            progress.clear();
            return choose_trash_item(name, candidates, std::cin, std::cout);
        },
        [&](const ProgressEvent& event) { progress.update(event); });

    auto report = resolver.restore(options.files);
    if (!report.ok()) {
        progress.clear();
    }

    for (const auto& name : report.missing_names) {
        progress.warn(std::format("No such file in trash: {}", name));
    }
    for (const auto& name : report.skipped_names) {
        progress.warn(std::format("Skipped {}: no item selected", name));
    }
    for (const auto& conflict : report.conflicts) {
        progress.warn(std::format("Cannot restore {}: {} already exists", conflict.name,
                                  conflict.conflicting_path));
    }

    if (!report.ok()) {
        return report_failure(OperationKind::RESTORE, *report.error, report.restored_count);
    }

    progress.finish(report.restored_count);
    return report.conflicts.empty() ? 0 : 1;
}

auto CliApplication::cmd_purge(const CliOptions& options) -> int {
    ProgressDisplay progress(OperationKind::PURGE);

    auto listing = trash_->list();
    if (!listing) {
        return report_failure(OperationKind::LIST, listing.error(), 0);
    }

    std::vector<TrashItem> items;
    if (options.purge_all) {
        items = std::move(*listing);
        LOG_INFO("CLI", std::format("Purging all {} trash items", items.size()));
    } else {
        items = core::select_items(
            *listing, options.files,
            [&](const std::string& name, const std::vector<TrashItem>& candidates) {
                progress.clear();
                return choose_trash_item(name, candidates, std::cin, std::cout);
            },
            [&](const std::string& name) {
                progress.warn(std::format("No such file in trash: {}", name));
            });
    }

    auto report = core::purge_items(*trash_, items, [&](const ProgressEvent& event) {
        progress.update(event);
    });
    if (!report.ok()) {
        progress.clear();
        return report_failure(OperationKind::PURGE, *report.error, report.processed_count);
    }

    progress.finish(report.processed_count);
    return 0;
}

auto CliApplication::cmd_remove(const CliOptions& options) -> int {
    const auto kind = *options.command;
    ProgressDisplay progress(kind);
    ProgressCallback on_progress = [&](const ProgressEvent& event) { progress.update(event); };

    core::EntryOperation operation =
        kind == OperationKind::SHRED
            ? core::EntryOperation{core::ShredOperation{options.runs, options.verify, on_progress}}
            : core::EntryOperation{core::DeleteOperation{on_progress}};

    auto existing = core::filter_existing(to_paths(options.files), [&](const fs::path& path) {
        progress.warn(std::format("No such file or directory: {}", path.string()));
    });

    core::RecursionPolicy policy{
        .recurse_without_prompt = options.recursive || options.assume_yes,
        .confirm =
            [&](const fs::path& path) {
                progress.clear();
                return confirm_recursion(path, std::cin, std::cout);
            },
    };

    if (kind == OperationKind::SHRED) {
        LOG_INFO("CLI", std::format("Shredding {} inputs with {} run(s){}", existing.size(),
                                    options.runs, options.verify ? " and verification" : ""));
    }

    auto report = core::run_batch(operation, existing, policy);
    for (const auto& skipped : report.skipped_roots) {
        progress.warn(std::format("Skipped directory {}", skipped.string()));
    }
    if (!report.ok()) {
        progress.clear();
        return report_failure(kind, *report.error, report.processed_count);
    }

    progress.finish(report.processed_count);
    return 0;
}

auto CliApplication::cmd_list(const CliOptions& options) -> int {
    auto items = trash_->list();
    if (!items) {
        return report_failure(OperationKind::LIST, items.error(), 0);
    }

    if (options.list_query) {
        *items = core::fuzzy_filter(*items, *options.list_query);
    }

    if (items->empty()) {
        if (options.list_query) {
            std::cout << "No items in trash match " << *options.list_query << "\n";
        } else {
            std::cout << "Trash is empty\n";
        }
        return 0;
    }

    std::ranges::stable_sort(*items, {}, &TrashItem::deleted_at);
    std::cout << render_trash_table(*items, terminal_width());
    return 0;
}

auto CliApplication::cmd_search(const CliOptions& options) -> int {
    const auto action = *options.search_action;
    const auto kind = search_action_kind(action);
    auto resolved = core::resolve_directory_root(options.search_dir);
    if (!resolved) {
        return report_failure(OperationKind::SEARCH, resolved.error(), 0);
    }
    const fs::path& root = *resolved;

    ProgressDisplay progress(OperationKind::SEARCH);
    core::SearchOperation search(
        options.search_target, action,
        [&](const fs::path& path, std::string_view target, bool is_directory,
            core::SearchAction requested) {
            progress.clear();
            return confirm_search_match(path, target, is_directory, requested, std::cin,
                                        std::cout);
        },
        trash_, [&](const ProgressEvent& event) { progress.update(event); });
    search.set_root(root);

    core::EntryOperation operation{std::move(search)};
    auto walked = core::traverse(operation, root);
    const auto* finished = operation.get_if<core::SearchOperation>();

    progress.clear();
    if (!walked) {
        return report_failure(kind, walked.error(), finished->acted_count());
    }

    if (finished->match_count() == 0) {
        std::cout << "No matches for " << options.search_target << " in " << options.search_dir
                  << "\n";
        return 0;
    }

    LOG_INFO("CLI", std::format("Search for {} in {}: {} matches, {} acted on",
                                options.search_target, root.string(), finished->match_count(),
                                finished->acted_count()));
    ProgressDisplay summary(kind);
    summary.finish(finished->acted_count());
    return 0;
}

}  // namespace cli
