/**
 * @file Logger.hpp
 * @brief Process-wide logger writing to a rotated file
 *
 * Log lines carry an ISO 8601 UTC timestamp, a level and a component tag:
 * `2026-10-19T14:32:45.123Z [INFO ] [Shred] Overwrote /tmp/a (1 run)`
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <string_view>

namespace util {

/**
 * @enum LogLevel
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,    ///< Per-entry detail
    INFO,     ///< Destructive steps and summaries
    WARNING,  ///< Skipped inputs, declined prompts
    ERROR     ///< Failures that end a command
};

/**
 * @struct LogRotationPolicy
 * @brief Size-based rotation settings
 */
struct LogRotationPolicy {
    size_t max_file_size_bytes = 2 * 1024 * 1024;  ///< Rotate once the active file reaches this
    int max_files = 3;                              ///< Rotated files kept besides the active one
};

/**
 * @class Logger
 * @brief Thread-safe singleton logger
 *
 * Usage:
 * @code
 * util::Logger::instance().initialize(log_dir, "recycler");
 * LOG_INFO("Trash", std::format("Moved {} to trash", path));
 * @endcode
 *
 * Logging before initialize() is allowed; lines then only reach stderr when console
 * output is enabled.
 */
class Logger {
public:
    static auto instance() -> Logger&;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    /**
     * @brief Open `{log_dir}/{app_name}.log`, creating the directory if needed
     * @return true if the file is open for appending
     */
    auto initialize(const std::filesystem::path& log_dir, const std::string& app_name,
                    LogLevel min_level = LogLevel::INFO, LogRotationPolicy policy = {}) -> bool;

    [[nodiscard]] auto is_initialized() const -> bool;

    void log(LogLevel level, std::string_view component, std::string_view message);

    void debug(std::string_view component, std::string_view message);
    void info(std::string_view component, std::string_view message);
    void warning(std::string_view component, std::string_view message);
    void error(std::string_view component, std::string_view message);

    void set_min_level(LogLevel level);
    [[nodiscard]] auto get_min_level() const -> LogLevel;

    /**
     * @brief Mirror every emitted line to stderr
     */
    void set_console_output(bool enable);

    [[nodiscard]] auto get_log_file_path() const -> std::filesystem::path;

    void shutdown();

private:
    Logger() = default;
    ~Logger();

    [[nodiscard]] static auto get_timestamp() -> std::string;
    [[nodiscard]] static auto level_to_string(LogLevel level) -> std::string_view;

    [[nodiscard]] auto rotated_path(int index) const -> std::filesystem::path;
    void rotate_if_needed(size_t incoming_bytes);
    auto open_log_file() -> bool;

    mutable std::mutex mutex_;
    std::ofstream file_;
    std::filesystem::path log_dir_;
    std::string app_name_;
    LogLevel min_level_ = LogLevel::INFO;
    LogRotationPolicy policy_;
    bool initialized_ = false;
    bool console_output_ = false;
    size_t current_file_size_ = 0;
};

#define LOG_DEBUG(component, msg) ::util::Logger::instance().debug(component, msg)
#define LOG_INFO(component, msg) ::util::Logger::instance().info(component, msg)
#define LOG_WARNING(component, msg) ::util::Logger::instance().warning(component, msg)
#define LOG_ERROR(component, msg) ::util::Logger::instance().error(component, msg)

}  // namespace util
