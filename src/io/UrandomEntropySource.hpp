/**
 * @file UrandomEntropySource.hpp
 * @brief Entropy source reading the kernel random device
 */

#pragma once

#include "interfaces/IEntropySource.hpp"
#include "util/FileDescriptor.hpp"

#include <string>

class UrandomEntropySource final : public IEntropySource {
public:
    explicit UrandomEntropySource(std::string device = "/dev/urandom");

    [[nodiscard]] auto fill(std::span<uint8_t> buffer) -> WipeResult<void> override;

private:
    std::string device_;
    util::FileDescriptor fd_;  ///< Opened lazily on first fill
};
