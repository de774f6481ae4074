/**
 * @file PatternScheduler.hpp
 * @brief Maps a wipe standard to its ordered, immutable pass list
 */

#pragma once

#include "algorithms/IWipeAlgorithm.hpp"
#include "models/WipeError.hpp"
#include "models/WipeTypes.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pattern_scheduler {

/**
 * @brief Conservative sustained write speed used for time estimates (50 MB/s)
 */
constexpr double DEFAULT_WRITE_BYTES_PER_SEC = 50'000'000.0;

/**
 * @brief Create the algorithm object describing a standard
 */
[[nodiscard]] auto create_algorithm(const WipeStandard& standard)
    -> std::unique_ptr<IWipeAlgorithm>;

/**
 * @brief Schedule the passes for a standard
 * @param standard Requested standard
 * @param pass_override Caller pass count; only SinglePass honours it
 * @param default_passes SinglePass count when no override is given
 * @return Pass list, or CONFIGURATION error for a SinglePass count below 1
 *
 * @example
 * ```cpp
 * auto passes = pattern_scheduler::schedule(Dod5220{}, 10);
 * // passes->size() == 3: 0x00, 0xFF, random
 * ```
 */
[[nodiscard]] auto schedule(const WipeStandard& standard, std::optional<int> pass_override,
                            int default_passes = 1) -> WipeResult<std::vector<PassSpec>>;

/**
 * @brief Number the given patterns 1..n as a pass list
 */
[[nodiscard]] auto build_passes(const std::vector<PassPattern>& patterns) -> std::vector<PassSpec>;

/**
 * @brief Repeat one pattern `count` times
 * @return CONFIGURATION error if count < 1
 */
[[nodiscard]] auto repeat_pattern(const PassPattern& pattern, int count)
    -> WipeResult<std::vector<PassSpec>>;

/**
 * @brief Display name of a standard, e.g. "DoD 5220.22-M"
 */
[[nodiscard]] auto standard_name(const WipeStandard& standard) -> std::string;

/**
 * @brief Estimated wall time for all passes at the given sustained speed
 */
[[nodiscard]] auto estimate_duration_seconds(uint64_t device_size, int total_passes,
                                             double bytes_per_sec = DEFAULT_WRITE_BYTES_PER_SEC)
    -> uint64_t;

}  // namespace pattern_scheduler
