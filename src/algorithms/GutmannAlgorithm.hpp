/**
 * @file GutmannAlgorithm.hpp
 * @brief Peter Gutmann's 35-pass wipe standard
 */

#pragma once

#include "IWipeAlgorithm.hpp"

#include <array>

/**
 * @class GutmannAlgorithm
 * @brief Peter Gutmann's 35-pass secure deletion method
 */
class GutmannAlgorithm : public IWipeAlgorithm {
public:
    static constexpr int PASS_COUNT = 35;

    [[nodiscard]] auto schedule(std::optional<int> pass_override, int default_passes) const
        -> WipeResult<std::vector<PassSpec>> override;

    std::string get_name() const override { return "Gutmann"; }

    std::string get_description() const override {
        return "Peter Gutmann's 35-pass secure deletion";
    }

    int get_pass_count() const override { return PASS_COUNT; }

    bool has_fixed_pass_count() const override { return true; }

    bool is_ssd_compatible() const override { return false; }

    /**
     * @brief The 35 pass patterns in published order
     */
    [[nodiscard]] static auto patterns() -> std::array<PassPattern, PASS_COUNT>;
};
