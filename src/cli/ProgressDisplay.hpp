/**
 * @file ProgressDisplay.hpp
 * @brief Terminal progress display for CLI wipe operations
 */

#pragma once

#include "interfaces/IProgressSink.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <string>

namespace cli {

/**
 * @class ProgressDisplay
 * @brief ANSI terminal progress bar fed by the wipe engine
 *
 * Shows pass, percentage, speed and ETA on one line. Speed is a rolling
 * average over the last few samples; the ETA accounts for remaining passes.
 */
class ProgressDisplay : public IProgressSink {
public:
    ProgressDisplay(std::string device_path, uint64_t device_size_bytes,
                    std::string standard_name, int total_passes);

    void on_progress(const WipeProgress& progress) override;

    /**
     * @brief Print the final status line
     */
    void complete(bool success, const std::string& message);

    void set_color_enabled(bool enable);

    [[nodiscard]] static auto is_terminal() -> bool;

    /**
     * @brief Human-readable size, e.g. "245.0 MB"
     */
    [[nodiscard]] static auto format_bytes(uint64_t bytes) -> std::string;

    /**
     * @brief "mm:ss" or "h:mm:ss", "--:--" if unknown
     */
    [[nodiscard]] static auto format_duration(int64_t seconds) -> std::string;

private:
    [[nodiscard]] auto generate_progress_bar(double percentage) const -> std::string;
    void print_header();
    void clear_line();

    /**
     * @brief Update the rolling speed average, returns bytes/s (0 if unknown)
     */
    auto sample_speed(const WipeProgress& progress) -> uint64_t;

    std::string device_path_;
    uint64_t device_size_bytes_;
    std::string standard_name_;
    int total_passes_;
    bool color_enabled_ = true;
    bool header_printed_ = false;

    int last_pass_ = 0;
    int last_permille_ = -1;
    uint64_t last_bytes_ = 0;
    std::chrono::steady_clock::time_point last_sample_time_;
    std::deque<uint64_t> speed_samples_;

    static constexpr int BAR_WIDTH = 30;
    static constexpr size_t MAX_SPEED_SAMPLES = 10;
    static constexpr int64_t MIN_SAMPLE_INTERVAL_MS = 100;
};

}  // namespace cli
