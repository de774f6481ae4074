/**
 * @file Logger.hpp
 * @brief Thread-safe logging utility with file rotation
 *
 * Writes ISO 8601 timestamped lines tagged with a level and a component.
 * Messages logged before initialize() are dropped unless console output
 * is enabled, so library code can log unconditionally.
 */

#pragma once

#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace util {

/**
 * @enum LogLevel
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,    ///< Per-chunk and per-pass detail
    INFO,     ///< Wipe lifecycle events
    WARNING,  ///< Recoverable anomalies
    ERROR     ///< Failed operations
};

/**
 * @brief Parse a level name ("debug", "info", "warning"/"warn", "error")
 * @return Level, or nullopt for an unknown name
 */
[[nodiscard]] auto parse_log_level(std::string_view name) -> std::optional<LogLevel>;

/**
 * @struct LogRotationPolicy
 * @brief Configuration for log file rotation
 */
struct LogRotationPolicy {
    size_t max_file_size_bytes = 10 * 1024 * 1024;  ///< Rotate once the active file reaches this
    int max_files = 5;                               ///< Rotated files kept beside the active one
};

/**
 * @class Logger
 * @brief Process-wide logger writing to {log_dir}/{app_name}.log
 *
 * Usage:
 * @code
 * util::Logger::instance().initialize(log_dir, "secure-wipe-cli");
 * LOG_INFO("WipeOrchestrator", "Pass 1/3 complete");
 * @endcode
 */
class Logger {
public:
    static auto instance() -> Logger&;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    /**
     * @brief Open the log file, creating the directory if needed
     * @return true if the file is ready for writing
     *
     * Rotated files are named {app_name}.1.log, {app_name}.2.log, ...
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
     * @brief Mirror every line to stderr
     */
    void set_console_output(bool enable);

    /**
     * @brief Path of the active log file, empty if not initialized
     */
    [[nodiscard]] auto get_log_file_path() const -> std::filesystem::path;

    /**
     * @brief Flush and close the log file
     */
    void shutdown();

private:
    Logger() = default;
    ~Logger();

    [[nodiscard]] static auto timestamp() -> std::string;
    [[nodiscard]] static auto level_tag(LogLevel level) -> std::string_view;

    [[nodiscard]] auto active_path() const -> std::filesystem::path;
    [[nodiscard]] auto rotated_path(int generation) const -> std::filesystem::path;

    auto open_log_file() -> bool;
    void rotate_logs();
    void write_line(const std::string& line);

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
