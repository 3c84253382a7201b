/**
 * @file Prompts.cpp
 * @brief Line-based terminal prompts
 */

#include "cli/Prompts.hpp"

#include "cli/TrashTable.hpp"
#include "util/Logger.hpp"

#include <charconv>
#include <format>
#include <istream>
#include <ostream>

namespace cli {

namespace {

auto read_answer(std::istream& in) -> std::optional<std::string> {
    std::string line;
    if (!std::getline(in, line)) {
        return std::nullopt;
    }
    auto first = line.find_first_not_of(" \t");
    auto last = line.find_last_not_of(" \t\r");
    if (first == std::string::npos) {
        return std::string{};
    }
    return line.substr(first, last - first + 1);
}

auto action_verb(core::SearchAction action) -> std::string_view {
    switch (action) {
        case core::SearchAction::TRASH:
            return "Trash";
        case core::SearchAction::DELETE:
            return "Delete";
        case core::SearchAction::SHRED:
            return "Shred";
    }
    return "Process";
}

}  // namespace

auto confirm_recursion(const std::filesystem::path& path, std::istream& in, std::ostream& out)
    -> bool {
    out << path.string() << " is a directory. Perform operation recursively? [y/N] "
        << std::flush;

    auto answer = read_answer(in);
    bool approved = answer && !answer->empty() && (answer->front() == 'y' || answer->front() == 'Y');
    LOG_DEBUG("Prompt", std::format("Recursion into {} {}", path.string(),
                                    approved ? "approved" : "declined"));
    return approved;
}

auto choose_trash_item(const std::string& name, const std::vector<TrashItem>& candidates,
                       std::istream& in, std::ostream& out) -> std::optional<TrashItem> {
    if (candidates.empty()) {
        return std::nullopt;
    }

    out << "Multiple items found in trash with the name " << name << ":\n";
    for (size_t i = 0; i < candidates.size(); ++i) {
        out << std::format("  {}) {} | {}\n", i + 1, candidates[i].original_path,
                           format_unix_date(candidates[i].deleted_at));
    }

    while (true) {
        out << std::format("Select an item [1-{}]: ", candidates.size()) << std::flush;

        auto answer = read_answer(in);
        if (!answer || answer->empty()) {
            return std::nullopt;
        }

        size_t index = 0;
        auto [ptr, ec] = std::from_chars(answer->data(), answer->data() + answer->size(), index);
        if (ec == std::errc{} && ptr == answer->data() + answer->size() && index >= 1 &&
            index <= candidates.size()) {
            return candidates[index - 1];
        }
        out << "Invalid selection: " << *answer << "\n";
    }
}

auto confirm_search_match(const std::filesystem::path& path, std::string_view target,
                          bool is_directory, core::SearchAction action, std::istream& in,
                          std::ostream& out) -> core::SearchDecision {
    out << std::format("Found {} {} (searching for {}). {}? [y]es/[n]o/[s]top ",
                       is_directory ? "directory" : "file", path.string(), target,
                       action_verb(action))
        << std::flush;

    auto answer = read_answer(in);
    if (!answer || answer->empty()) {
        return {.act_now = false, .keep_searching = answer.has_value()};
    }

    switch (answer->front()) {
        case 'y':
        case 'Y':
            return {.act_now = true, .keep_searching = true};
        case 's':
        case 'S':
            return {.act_now = false, .keep_searching = false};
        default:
            return {.act_now = false, .keep_searching = true};
    }
}

}  // namespace cli
