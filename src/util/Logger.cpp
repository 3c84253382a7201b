/**
 * @file Logger.cpp
 * @brief Logger implementation
 */

#include "util/Logger.hpp"

#include <chrono>
#include <ctime>
#include <format>
#include <iostream>

namespace util {

Logger::~Logger() {
    shutdown();
}

auto Logger::instance() -> Logger& {
    static Logger instance;
    return instance;
}

auto Logger::initialize(const std::filesystem::path& log_dir, const std::string& app_name,
                        LogLevel min_level, LogRotationPolicy policy) -> bool {
    std::lock_guard lock(mutex_);

    if (file_.is_open()) {
        file_.close();
    }

    log_dir_ = log_dir;
    app_name_ = app_name;
    min_level_ = min_level;
    policy_ = policy;
    initialized_ = false;

    std::error_code ec;
    std::filesystem::create_directories(log_dir_, ec);
    if (ec) {
        std::cerr << "Logger: cannot create " << log_dir_.string() << ": " << ec.message()
                  << '\n';
        return false;
    }

    if (!open_log_file()) {
        return false;
    }

    initialized_ = true;
    return true;
}

auto Logger::is_initialized() const -> bool {
    std::lock_guard lock(mutex_);
    return initialized_;
}

auto Logger::rotated_path(int index) const -> std::filesystem::path {
    if (index == 0) {
        return log_dir_ / (app_name_ + ".log");
    }
    return log_dir_ / std::format("{}.{}.log", app_name_, index);
}

auto Logger::open_log_file() -> bool {
    auto path = rotated_path(0);
    file_.open(path, std::ios::app);
    if (!file_.is_open()) {
        std::cerr << "Logger: cannot open " << path.string() << '\n';
        return false;
    }

    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    current_file_size_ = ec ? 0 : static_cast<size_t>(size);
    return true;
}

void Logger::log(LogLevel level, std::string_view component, std::string_view message) {
    std::lock_guard lock(mutex_);

    if (level < min_level_) {
        return;
    }

    auto line = std::format("{} [{}] [{}] {}\n", get_timestamp(), level_to_string(level),
                            component, message);

    if (initialized_) {
        rotate_if_needed(line.size());
        if (file_.is_open()) {
            file_ << line;
            file_.flush();
            current_file_size_ += line.size();
        }
    }

    if (console_output_) {
        std::cerr << line;
    }
}

void Logger::debug(std::string_view component, std::string_view message) {
    log(LogLevel::DEBUG, component, message);
}

void Logger::info(std::string_view component, std::string_view message) {
    log(LogLevel::INFO, component, message);
}

void Logger::warning(std::string_view component, std::string_view message) {
    log(LogLevel::WARNING, component, message);
}

void Logger::error(std::string_view component, std::string_view message) {
    log(LogLevel::ERROR, component, message);
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard lock(mutex_);
    min_level_ = level;
}

auto Logger::get_min_level() const -> LogLevel {
    std::lock_guard lock(mutex_);
    return min_level_;
}

void Logger::set_console_output(bool enable) {
    std::lock_guard lock(mutex_);
    console_output_ = enable;
}

auto Logger::get_log_file_path() const -> std::filesystem::path {
    std::lock_guard lock(mutex_);
    if (!initialized_) {
        return {};
    }
    return rotated_path(0);
}

void Logger::shutdown() {
    std::lock_guard lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
        file_.close();
    }
    initialized_ = false;
}

auto Logger::get_timestamp() -> std::string {
    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) %
              1000;
    auto seconds = std::chrono::system_clock::to_time_t(now);

    std::tm tm_buf{};
    gmtime_r(&seconds, &tm_buf);

    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    return std::format("{}.{:03d}Z", date, ms.count());
}

auto Logger::level_to_string(LogLevel level) -> std::string_view {
    switch (level) {
        case LogLevel::DEBUG:
            return "DEBUG";
        case LogLevel::INFO:
            return "INFO ";
        case LogLevel::WARNING:
            return "WARN ";
        case LogLevel::ERROR:
            return "ERROR";
    }
    return "?????";
}

void Logger::rotate_if_needed(size_t incoming_bytes) {
    if (current_file_size_ + incoming_bytes <= policy_.max_file_size_bytes) {
        return;
    }

    file_.close();

    std::error_code ec;
    // app.N.log is dropped, app.(N-1).log -> app.N.log, ..., app.log -> app.1.log
    std::filesystem::remove(rotated_path(policy_.max_files), ec);
    for (int i = policy_.max_files - 1; i >= 0; --i) {
        if (std::filesystem::exists(rotated_path(i), ec)) {
            std::filesystem::rename(rotated_path(i), rotated_path(i + 1), ec);
        }
    }

    open_log_file();
}

}  // namespace util
