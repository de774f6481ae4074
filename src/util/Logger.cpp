/**
 * @file Logger.cpp
 * @brief Thread-safe logging utility implementation
 */

#include "util/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace util {

auto parse_log_level(std::string_view name) -> std::optional<LogLevel> {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") {
        return LogLevel::DEBUG;
    }
    if (lower == "info") {
        return LogLevel::INFO;
    }
    if (lower == "warning" || lower == "warn") {
        return LogLevel::WARNING;
    }
    if (lower == "error") {
        return LogLevel::ERROR;
    }
    return std::nullopt;
}

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
    initialized_ = false;

    log_dir_ = log_dir;
    app_name_ = app_name;
    min_level_ = min_level;
    policy_ = policy;
    current_file_size_ = 0;

    std::error_code ec;
    std::filesystem::create_directories(log_dir_, ec);
    if (ec) {
        std::cerr << "Logger: cannot create log directory " << log_dir_ << ": " << ec.message()
                  << std::endl;
        return false;
    }

    if (!open_log_file()) {
        return false;
    }

    initialized_ = true;

    std::ostringstream line;
    line << timestamp() << "[" << level_tag(LogLevel::INFO) << "] [Logger] Logger initialized: app="
         << app_name_ << " dir=" << log_dir_.string() << " level=" << level_tag(min_level_)
         << " max_size=" << policy_.max_file_size_bytes << " max_files=" << policy_.max_files
         << "\n";
    write_line(line.str());

    return true;
}

auto Logger::is_initialized() const -> bool {
    std::lock_guard lock(mutex_);
    return initialized_;
}

auto Logger::active_path() const -> std::filesystem::path {
    return log_dir_ / (app_name_ + ".log");
}

auto Logger::rotated_path(int generation) const -> std::filesystem::path {
    return log_dir_ / (app_name_ + "." + std::to_string(generation) + ".log");
}

auto Logger::open_log_file() -> bool {
    auto path = active_path();

    file_.open(path, std::ios::app);
    if (!file_.is_open()) {
        std::cerr << "Logger: cannot open log file " << path << std::endl;
        return false;
    }

    std::error_code ec;
    current_file_size_ = std::filesystem::file_size(path, ec);
    if (ec) {
        current_file_size_ = 0;
    }
    return true;
}

void Logger::write_line(const std::string& line) {
    if (!file_.is_open()) {
        return;
    }
    if (current_file_size_ >= policy_.max_file_size_bytes) {
        rotate_logs();
    }
    file_ << line;
    file_.flush();
    current_file_size_ += line.size();
}

void Logger::log(LogLevel level, std::string_view component, std::string_view message) {
    std::lock_guard lock(mutex_);

    if (level < min_level_) {
        return;
    }
    if (!initialized_ && !console_output_) {
        return;
    }

    std::ostringstream line;
    line << timestamp() << "[" << level_tag(level) << "] [" << component << "] " << message
         << "\n";
    const auto text = line.str();

    if (initialized_) {
        write_line(text);
    }
    if (console_output_) {
        std::cerr << text;
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
    return active_path();
}

void Logger::shutdown() {
    std::lock_guard lock(mutex_);

    if (initialized_ && file_.is_open()) {
        file_ << timestamp() << "[" << level_tag(LogLevel::INFO) << "] [Logger] Logger shutting down"
              << std::endl;
        file_.close();
    }
    initialized_ = false;
}

auto Logger::timestamp() -> std::string {
    auto now = std::chrono::system_clock::now();
    auto seconds = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    gmtime_r(&seconds, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << ms.count() << "Z ";
    return oss.str();
}

auto Logger::level_tag(LogLevel level) -> std::string_view {
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

void Logger::rotate_logs() {
    file_.close();

    std::error_code ec;
    std::filesystem::remove(rotated_path(policy_.max_files), ec);

    for (int generation = policy_.max_files - 1; generation >= 1; --generation) {
        auto from = rotated_path(generation);
        if (std::filesystem::exists(from, ec)) {
            std::filesystem::rename(from, rotated_path(generation + 1), ec);
        }
    }

    std::filesystem::rename(active_path(), rotated_path(1), ec);

    if (!open_log_file()) {
        initialized_ = false;
        return;
    }
    current_file_size_ = 0;
}

}  // namespace util
