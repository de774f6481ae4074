/**
 * @file RandomFillAlgorithm.hpp
 * @brief Random data fill wipe standard
 */

#pragma once

#include "IWipeAlgorithm.hpp"

/**
 * @class RandomFillAlgorithm
 * @brief N passes of fresh random data, N chosen by the caller
 *
 * A single random pass is weaker than multi-pass on some media. The CLI
 * points this out; the engine accepts a count of 1.
 */
class RandomFillAlgorithm : public IWipeAlgorithm {
public:
    [[nodiscard]] auto schedule(std::optional<int> pass_override, int default_passes) const
        -> WipeResult<std::vector<PassSpec>> override;

    std::string get_name() const override {
        return "Random Data";
    }

    std::string get_description() const override {
        return "Overwrite with random data";
    }

    int get_pass_count() const override {
        return 1;
    }

    bool has_fixed_pass_count() const override {
        return false;
    }

    bool is_ssd_compatible() const override {
        return true;
    }
};
