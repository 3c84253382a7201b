/**
 * @file TrashTable.cpp
 * @brief Box-drawn trash list rendering
 */

#include "cli/TrashTable.hpp"

#include <sys/ioctl.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <ctime>
#include <string_view>

namespace cli {

namespace {

constexpr std::string_view HEADER_NAME = "Name";
constexpr std::string_view HEADER_PATH = "Original path";
constexpr std::string_view HEADER_DATE = "Time deleted";
constexpr std::string_view ELLIPSIS = "...";

// "│ " + " │ " + " │ " + " │"
constexpr size_t BORDER_WIDTH = 10;

auto repeat(std::string_view glyph, size_t count) -> std::string {
    std::string result;
    result.reserve(glyph.size() * count);
    for (size_t i = 0; i < count; ++i) {
        result += glyph;
    }
    return result;
}

auto pad(std::string_view text, size_t width) -> std::string {
    std::string cell{text};
    if (cell.size() < width) {
        cell.append(width - cell.size(), ' ');
    }
    return cell;
}

// Keeps the tail of the path, never starting inside a UTF-8 sequence
auto shorten_path(const std::string& path, size_t width) -> std::string {
    if (path.size() <= width) {
        return path;
    }
    size_t keep = width > ELLIPSIS.size() ? width - ELLIPSIS.size() : 0;
    size_t start = path.size() - keep;
    while (start < path.size() && (static_cast<unsigned char>(path[start]) & 0xC0) == 0x80) {
        ++start;
    }
    return std::string{ELLIPSIS} + path.substr(start);
}

auto separator(std::string_view left, std::string_view middle, std::string_view right,
               const std::array<size_t, 3>& widths) -> std::string {
    std::string line{left};
    for (size_t i = 0; i < widths.size(); ++i) {
        line += repeat("─", widths[i] + 2);
        line += i + 1 < widths.size() ? middle : right;
    }
    return line + "\n";
}

auto row(std::string_view name, std::string_view path, std::string_view date,
         const std::array<size_t, 3>& widths) -> std::string {
    return "│ " + pad(name, widths[0]) + " │ " + pad(path, widths[1]) + " │ " +
           pad(date, widths[2]) + " │\n";
}

}  // namespace

auto format_unix_date(int64_t seconds) -> std::string {
    auto time = static_cast<std::time_t>(seconds);
    std::tm local{};
    if (!::localtime_r(&time, &local)) {
        return "unknown";
    }

    std::array<char, 32> buffer{};
    size_t len = std::strftime(buffer.data(), buffer.size(), "%Y-%m-%d %H:%M:%S", &local);
    return std::string(buffer.data(), len);
}

auto terminal_width(size_t fallback) -> size_t {
    winsize size{};
    if (::isatty(STDOUT_FILENO) && ::ioctl(STDOUT_FILENO, TIOCGWINSZ, &size) == 0 &&
        size.ws_col > 0) {
        return size.ws_col;
    }
    return fallback;
}

auto render_trash_table(const std::vector<TrashItem>& items, size_t width) -> std::string {
    std::vector<std::string> dates;
    dates.reserve(items.size());

    std::array<size_t, 3> widths{HEADER_NAME.size(), HEADER_PATH.size(), HEADER_DATE.size()};
    for (const auto& item : items) {
        dates.push_back(format_unix_date(item.deleted_at));
        widths[0] = std::max(widths[0], item.name.size());
        widths[1] = std::max(widths[1], item.original_path.size());
        widths[2] = std::max(widths[2], dates.back().size());
    }

    size_t total = widths[0] + widths[1] + widths[2] + BORDER_WIDTH;
    if (total > width) {
        size_t over = total - width;
        widths[1] = std::max(HEADER_PATH.size(), widths[1] > over ? widths[1] - over : 0);
    }

    std::string table = separator("┌", "┬", "┐", widths);
    table += row(HEADER_NAME, HEADER_PATH, HEADER_DATE, widths);
    table += separator("├", "┼", "┤", widths);
    for (size_t i = 0; i < items.size(); ++i) {
        table += row(items[i].name, shorten_path(items[i].original_path, widths[1]), dates[i],
                     widths);
    }
    table += separator("└", "┴", "┘", widths);
    return table;
}

}  // namespace cli
