/**
 * @file ProgressDisplay.cpp
 * @brief Terminal progress display implementation
 */

#include "cli/ProgressDisplay.hpp"

#include <unistd.h>

#include <array>
#include <format>
#include <iostream>
#include <string_view>

namespace cli {

namespace {

// ANSI color codes
constexpr auto RESET = "\033[0m";
constexpr auto BOLD = "\033[1m";
constexpr auto YELLOW = "\033[33m";
constexpr auto CYAN = "\033[36m";

constexpr std::array<std::string_view, 6> SPINNER_FRAMES = {"✶", "✸", "✹", "✺", "✹", "✷"};

auto capitalized(std::string_view verb) -> std::string {
    std::string text{verb};
    if (!text.empty() && text.front() >= 'a' && text.front() <= 'z') {
        text.front() = static_cast<char>(text.front() - 'a' + 'A');
    }
    return text;
}

}  // namespace

ProgressDisplay::ProgressDisplay(OperationKind kind)
    : ProgressDisplay(kind, std::cout, std::cerr, is_terminal()) {}

ProgressDisplay::ProgressDisplay(OperationKind kind, std::ostream& out, std::ostream& err,
                                 bool interactive)
    : kind_(kind), out_(out), err_(err), interactive_(interactive), color_enabled_(interactive) {}

auto ProgressDisplay::is_terminal() -> bool {
    return isatty(STDOUT_FILENO) != 0;
}

void ProgressDisplay::set_color_enabled(bool enable) {
    color_enabled_ = enable;
}

auto ProgressDisplay::summary(OperationKind kind, size_t count) -> std::string {
    return std::format("{} {} file{}", to_past_tense(kind), count, count == 1 ? "" : "s");
}

void ProgressDisplay::update(const ProgressEvent& event) {
    const auto frame = SPINNER_FRAMES[events_seen_ % SPINNER_FRAMES.size()];
    ++events_seen_;

    if (!interactive_) {
        return;
    }

    clear_line();
    if (color_enabled_) {
        out_ << CYAN << frame << RESET << " " << BOLD << capitalized(to_infinitive(kind_))
             << RESET;
    } else {
        out_ << frame << " " << capitalized(to_infinitive(kind_));
    }
    out_ << " " << event.path.string() << (event.is_directory ? "/" : "") << std::flush;
    line_drawn_ = true;
}

void ProgressDisplay::warn(const std::string& message) {
    clear();
    if (color_enabled_) {
        err_ << YELLOW << message << RESET << "\n";
    } else {
        err_ << message << "\n";
    }
    err_.flush();
}

void ProgressDisplay::finish(size_t count) {
    clear();
    if (color_enabled_) {
        out_ << CYAN << "✓" << RESET << " " << BOLD << summary(kind_, count) << RESET << "\n";
    } else {
        out_ << "✓ " << summary(kind_, count) << "\n";
    }
    out_.flush();
}

void ProgressDisplay::clear() {
    if (line_drawn_) {
        clear_line();
        out_.flush();
        line_drawn_ = false;
    }
}

void ProgressDisplay::clear_line() {
    // Move cursor to beginning of line and clear
    out_ << "\r\033[K";
}

}  // namespace cli
