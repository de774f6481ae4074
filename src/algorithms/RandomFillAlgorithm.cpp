#include "algorithms/RandomFillAlgorithm.hpp"

#include "algorithms/PatternScheduler.hpp"

auto RandomFillAlgorithm::schedule(std::optional<int> pass_override, int default_passes) const
    -> WipeResult<std::vector<PassSpec>> {
    return pattern_scheduler::repeat_pattern(PassPattern::random(),
                                             pass_override.value_or(default_passes));
}
