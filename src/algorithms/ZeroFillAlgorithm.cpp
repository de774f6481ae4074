#include "algorithms/ZeroFillAlgorithm.hpp"

#include "algorithms/PatternScheduler.hpp"

auto ZeroFillAlgorithm::schedule(std::optional<int> pass_override, int default_passes) const
    -> WipeResult<std::vector<PassSpec>> {
    return pattern_scheduler::repeat_pattern(PassPattern::fixed({0x00}),
                                             pass_override.value_or(default_passes));
}
