/**
 * @file ZeroFillAlgorithm.hpp
 * @brief Zero fill wipe standard
 */

#pragma once

#include "IWipeAlgorithm.hpp"

/**
 * @class ZeroFillAlgorithm
 * @brief N passes of 0x00, N chosen by the caller
 */
class ZeroFillAlgorithm : public IWipeAlgorithm {
public:
    [[nodiscard]] auto schedule(std::optional<int> pass_override, int default_passes) const
        -> WipeResult<std::vector<PassSpec>> override;

    std::string get_name() const override { return "Zero Fill"; }

    std::string get_description() const override { return "Overwrite with zeros"; }

    int get_pass_count() const override { return 1; }

    bool has_fixed_pass_count() const override { return false; }

    bool is_ssd_compatible() const override { return true; }
};
