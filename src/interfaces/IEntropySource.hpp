/**
 * @file IEntropySource.hpp
 * @brief Source of random bytes for RANDOM pattern passes
 */

#pragma once

#include "models/WipeError.hpp"

#include <cstdint>
#include <span>

class IEntropySource {
public:
    virtual ~IEntropySource() = default;

    /**
     * @brief Fill the whole buffer with fresh random bytes
     * @return ENTROPY_SOURCE error if the source cannot be read
     */
    [[nodiscard]] virtual auto fill(std::span<uint8_t> buffer) -> WipeResult<void> = 0;
};
