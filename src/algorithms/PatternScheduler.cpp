#include "algorithms/PatternScheduler.hpp"

#include "algorithms/DoD522022MAlgorithm.hpp"
#include "algorithms/GutmannAlgorithm.hpp"
#include "algorithms/RandomFillAlgorithm.hpp"
#include "algorithms/ZeroFillAlgorithm.hpp"

#include <cmath>
#include <type_traits>

namespace pattern_scheduler {

auto create_algorithm(const WipeStandard& standard) -> std::unique_ptr<IWipeAlgorithm> {
    return std::visit(
        [](const auto& s) -> std::unique_ptr<IWipeAlgorithm> {
            using T = std::decay_t<decltype(s)>;
            if constexpr (std::is_same_v<T, SinglePass>) {
                if (s.fill == SinglePassFill::RANDOM) {
                    return std::make_unique<RandomFillAlgorithm>();
                }
                return std::make_unique<ZeroFillAlgorithm>();
            } else if constexpr (std::is_same_v<T, Dod5220>) {
                return std::make_unique<DoD522022MAlgorithm>();
            } else {
                return std::make_unique<GutmannAlgorithm>();
            }
        },
        standard);
}

auto schedule(const WipeStandard& standard, std::optional<int> pass_override, int default_passes)
    -> WipeResult<std::vector<PassSpec>> {
    return create_algorithm(standard)->schedule(pass_override, default_passes);
}

auto build_passes(const std::vector<PassPattern>& patterns) -> std::vector<PassSpec> {
    std::vector<PassSpec> passes;
    passes.reserve(patterns.size());

    const auto total = static_cast<int>(patterns.size());
    for (int i = 0; i < total; ++i) {
        passes.push_back(PassSpec{.index = i + 1, .total_passes = total, .pattern = patterns[i]});
    }
    return passes;
}

auto repeat_pattern(const PassPattern& pattern, int count) -> WipeResult<std::vector<PassSpec>> {
    if (count < 1) {
        return std::unexpected(WipeError::configuration(
            "Pass count must be at least 1 (got " + std::to_string(count) + ")"));
    }
    return build_passes(std::vector<PassPattern>(static_cast<size_t>(count), pattern));
}

auto standard_name(const WipeStandard& standard) -> std::string {
    return create_algorithm(standard)->get_name();
}

auto estimate_duration_seconds(uint64_t device_size, int total_passes, double bytes_per_sec)
    -> uint64_t {
    if (bytes_per_sec <= 0.0 || total_passes <= 0) {
        return 0;
    }
    const double total_bytes = static_cast<double>(device_size) * total_passes;
    return static_cast<uint64_t>(std::ceil(total_bytes / bytes_per_sec));
}

}  // namespace pattern_scheduler
