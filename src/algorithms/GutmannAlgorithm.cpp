#include "algorithms/GutmannAlgorithm.hpp"

#include "algorithms/PatternScheduler.hpp"

// Table from "Secure Deletion of Data from Magnetic and Solid-State Memory"
// (P. Gutmann, 1996). Passes 5-31 target MFM and (1,7)/(2,7) RLL encodings;
// single-byte entries repeat every byte, three-byte entries every three.
auto GutmannAlgorithm::patterns() -> std::array<PassPattern, PASS_COUNT> {
    const auto rnd = PassPattern::random();
    return {
        rnd,
        rnd,
        rnd,
        rnd,
        PassPattern::fixed({0x55}),              // 5
        PassPattern::fixed({0xAA}),              // 6
        PassPattern::fixed({0x92, 0x49, 0x24}),  // 7
        PassPattern::fixed({0x49, 0x24, 0x92}),  // 8
        PassPattern::fixed({0x24, 0x92, 0x49}),  // 9
        PassPattern::fixed({0x00}),              // 10
        PassPattern::fixed({0x11}),
        PassPattern::fixed({0x22}),
        PassPattern::fixed({0x33}),
        PassPattern::fixed({0x44}),
        PassPattern::fixed({0x55}),              // 15
        PassPattern::fixed({0x66}),
        PassPattern::fixed({0x77}),
        PassPattern::fixed({0x88}),
        PassPattern::fixed({0x99}),
        PassPattern::fixed({0xAA}),              // 20
        PassPattern::fixed({0xBB}),
        PassPattern::fixed({0xCC}),
        PassPattern::fixed({0xDD}),
        PassPattern::fixed({0xEE}),
        PassPattern::fixed({0xFF}),              // 25
        PassPattern::fixed({0x92, 0x49, 0x24}),
        PassPattern::fixed({0x49, 0x24, 0x92}),
        PassPattern::fixed({0x24, 0x92, 0x49}),
        PassPattern::fixed({0x6D, 0xB6, 0xDB}),
        PassPattern::fixed({0xB6, 0xDB, 0x6D}),  // 30
        PassPattern::fixed({0xDB, 0x6D, 0xB6}),
        rnd,
        rnd,
        rnd,
        rnd,
    };
}

auto GutmannAlgorithm::schedule(std::optional<int> /*pass_override*/,
                                int /*default_passes*/) const
    -> WipeResult<std::vector<PassSpec>> {
    const auto table = patterns();
    return pattern_scheduler::build_passes(std::vector<PassPattern>(table.begin(), table.end()));
}
