/**
 * @file ProgressDisplay.cpp
 * @brief Terminal progress display implementation
 */

#include "cli/ProgressDisplay.hpp"

#include <unistd.h>

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <sstream>

namespace cli {

namespace {

constexpr auto RESET = "\033[0m";
constexpr auto BOLD = "\033[1m";
constexpr auto GREEN = "\033[32m";
constexpr auto RED = "\033[31m";

auto two_digits(int64_t value) -> std::string {
    std::ostringstream oss;
    oss << std::setw(2) << std::setfill('0') << value;
    return oss.str();
}

}  // namespace

ProgressDisplay::ProgressDisplay(std::string device_path, uint64_t device_size_bytes,
                                 std::string standard_name, int total_passes)
    : device_path_(std::move(device_path)), device_size_bytes_(device_size_bytes),
      standard_name_(std::move(standard_name)), total_passes_(total_passes),
      last_sample_time_(std::chrono::steady_clock::now()) {
    color_enabled_ = is_terminal();
}

auto ProgressDisplay::is_terminal() -> bool {
    return isatty(STDOUT_FILENO) != 0;
}

void ProgressDisplay::set_color_enabled(bool enable) {
    color_enabled_ = enable;
}

void ProgressDisplay::print_header() {
    std::cout << "\n";
    if (color_enabled_) {
        std::cout << BOLD;
    }
    std::cout << "Wiping " << device_path_ << " (" << format_bytes(device_size_bytes_) << ")\n"
              << "Standard: " << standard_name_ << " (" << total_passes_ << " pass"
              << (total_passes_ != 1 ? "es" : "") << ")\n";
    if (color_enabled_) {
        std::cout << RESET;
    }
    std::cout << std::flush;
    header_printed_ = true;
}

auto ProgressDisplay::sample_speed(const WipeProgress& progress) -> uint64_t {
    auto now = std::chrono::steady_clock::now();
    auto elapsed_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(now - last_sample_time_).count();

    // A new pass restarts the byte counter
    if (progress.pass_index != last_pass_) {
        last_bytes_ = 0;
    }

    if (elapsed_ms >= MIN_SAMPLE_INTERVAL_MS && progress.bytes_written > last_bytes_) {
        const double seconds = static_cast<double>(elapsed_ms) / 1000.0;
        speed_samples_.push_back(
            static_cast<uint64_t>(static_cast<double>(progress.bytes_written - last_bytes_) /
                                  seconds));
        if (speed_samples_.size() > MAX_SPEED_SAMPLES) {
            speed_samples_.pop_front();
        }
        last_sample_time_ = now;
        last_bytes_ = progress.bytes_written;
    }

    if (speed_samples_.empty()) {
        return 0;
    }
    return std::accumulate(speed_samples_.begin(), speed_samples_.end(), uint64_t{0}) /
           speed_samples_.size();
}

void ProgressDisplay::on_progress(const WipeProgress& progress) {
    if (!header_printed_) {
        print_header();
    }

    const auto speed = sample_speed(progress);

    // Redraw only when the visible value changes
    const int permille = static_cast<int>(progress.percentage * 10.0);
    const bool pass_changed = progress.pass_index != last_pass_;
    last_pass_ = progress.pass_index;
    if (!pass_changed && permille == last_permille_) {
        return;
    }
    last_permille_ = permille;

    std::ostringstream line;
    line << "Pass " << progress.pass_index << "/" << progress.total_passes << ": "
         << generate_progress_bar(progress.percentage) << " " << std::fixed << std::setprecision(1)
         << std::setw(5) << progress.percentage << "%";

    if (speed > 0) {
        line << "  |  " << format_bytes(speed) << "/s";

        uint64_t remaining = progress.pass_size_bytes - progress.bytes_written;
        if (progress.total_passes > progress.pass_index) {
            remaining += progress.pass_size_bytes *
                         static_cast<uint64_t>(progress.total_passes - progress.pass_index);
        }
        line << "  |  ETA: " << format_duration(static_cast<int64_t>(remaining / speed));
    }

    clear_line();
    std::cout << line.str() << std::flush;
}

void ProgressDisplay::complete(bool success, const std::string& message) {
    if (header_printed_) {
        clear_line();
    }
    std::cout << "\n";

    if (color_enabled_) {
        std::cout << (success ? GREEN : RED) << BOLD;
    }
    std::cout << (success ? "[OK] " : "[FAILED] ") << message;
    if (color_enabled_) {
        std::cout << RESET;
    }
    std::cout << "\n" << std::endl;
}

auto ProgressDisplay::format_bytes(uint64_t bytes) -> std::string {
    constexpr uint64_t KB = 1024;
    constexpr uint64_t MB = KB * 1024;
    constexpr uint64_t GB = MB * 1024;
    constexpr uint64_t TB = GB * 1024;

    auto scaled = [bytes](uint64_t unit, const char* suffix) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(1)
            << static_cast<double>(bytes) / static_cast<double>(unit) << " " << suffix;
        return oss.str();
    };

    if (bytes >= TB) {
        return scaled(TB, "TB");
    } else if (bytes >= GB) {
        return scaled(GB, "GB");
    } else if (bytes >= MB) {
        return scaled(MB, "MB");
    } else if (bytes >= KB) {
        return scaled(KB, "KB");
    }
    return std::to_string(bytes) + " B";
}

auto ProgressDisplay::format_duration(int64_t seconds) -> std::string {
    if (seconds < 0) {
        return "--:--";
    }

    const int64_t hours = seconds / 3600;
    const int64_t minutes = (seconds % 3600) / 60;
    const int64_t secs = seconds % 60;

    if (hours > 0) {
        return std::to_string(hours) + ":" + two_digits(minutes) + ":" + two_digits(secs);
    }
    return two_digits(minutes) + ":" + two_digits(secs);
}

auto ProgressDisplay::generate_progress_bar(double percentage) const -> std::string {
    int filled = static_cast<int>(std::round(percentage / 100.0 * BAR_WIDTH));
    filled = std::clamp(filled, 0, BAR_WIDTH);

    std::string bar = "[";
    if (color_enabled_) {
        bar += GREEN;
    }
    for (int i = 0; i < filled; ++i) {
        bar += "█";
    }
    if (color_enabled_) {
        bar += RESET;
    }
    for (int i = filled; i < BAR_WIDTH; ++i) {
        bar += "░";
    }
    bar += "]";
    return bar;
}

void ProgressDisplay::clear_line() {
    if (is_terminal()) {
        std::cout << "\r\033[K";
    } else {
        std::cout << "\n";
    }
}

}  // namespace cli
