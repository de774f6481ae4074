#include "algorithms/DoD522022MAlgorithm.hpp"

#include "algorithms/PatternScheduler.hpp"

auto DoD522022MAlgorithm::schedule(std::optional<int> /*pass_override*/,
                                   int /*default_passes*/) const
    -> WipeResult<std::vector<PassSpec>> {
    return pattern_scheduler::build_passes({
        PassPattern::fixed({0x00}),
        PassPattern::fixed({0xFF}),
        PassPattern::random(),
    });
}
