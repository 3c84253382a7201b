/**
 * @file ProgressDisplay.hpp
 * @brief Single-line terminal progress for file operations
 */

#pragma once

#include "models/OperationTypes.hpp"

#include <cstddef>
#include <iosfwd>
#include <string>

namespace cli {

/**
 * @class ProgressDisplay
 * @brief Spinner line showing the entry being processed, then a summary
 *
 * The line is redrawn in place with ANSI escape codes when stdout is a terminal.
 * Otherwise progress is not drawn and only the summary is printed.
 */
class ProgressDisplay {
public:
    explicit ProgressDisplay(OperationKind kind);

    /**
     * @brief Construct a display writing to custom streams
     * @param interactive Redraw the progress line (normally whether stdout is a terminal)
     */
    ProgressDisplay(OperationKind kind, std::ostream& out, std::ostream& err, bool interactive);

    /**
     * @brief Redraw the line for the entry about to be processed
     */
    void update(const ProgressEvent& event);

    /**
     * @brief Print a warning on its own line without losing the progress line
     */
    void warn(const std::string& message);

    /**
     * @brief Replace the progress line with "✓ <Verb> N file(s)"
     */
    void finish(size_t count);

    /**
     * @brief Erase the progress line, e.g. before printing an error or a prompt
     */
    void clear();

    void set_color_enabled(bool enable);

    [[nodiscard]] auto events_seen() const -> size_t { return events_seen_; }

    /**
     * @brief Check if stdout is a terminal
     */
    [[nodiscard]] static auto is_terminal() -> bool;

    /**
     * @brief Summary text, e.g. "Deleted 3 files"
     */
    [[nodiscard]] static auto summary(OperationKind kind, size_t count) -> std::string;

private:
    void clear_line();

    OperationKind kind_;
    std::ostream& out_;
    std::ostream& err_;
    bool interactive_;
    bool color_enabled_;
    bool line_drawn_ = false;
    size_t events_seen_ = 0;
};

}  // namespace cli
