/**
 * @file DoD522022MAlgorithm.hpp
 * @brief US Department of Defense 5220.22-M wipe standard
 */

#pragma once

#include "IWipeAlgorithm.hpp"

/**
 * @class DoD522022MAlgorithm
 * @brief DoD 5220.22-M 3-pass standard: zeros, ones, random
 */
class DoD522022MAlgorithm : public IWipeAlgorithm {
public:
    static constexpr int PASS_COUNT = 3;

    [[nodiscard]] auto schedule(std::optional<int> pass_override, int default_passes) const
        -> WipeResult<std::vector<PassSpec>> override;

    std::string get_name() const override { return "DoD 5220.22-M"; }

    std::string get_description() const override {
        return "US Department of Defense 3-pass standard (zeros, ones, random)";
    }

    int get_pass_count() const override { return PASS_COUNT; }

    bool has_fixed_pass_count() const override { return true; }

    bool is_ssd_compatible() const override { return false; }
};
