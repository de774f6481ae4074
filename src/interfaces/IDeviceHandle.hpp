/**
 * @file IDeviceHandle.hpp
 * @brief Raw positioned access to a block device or image file
 *
 * The wipe engine only needs a validated path and a byte size. Discovery of
 * removable devices lives outside this interface.
 */

#pragma once

#include "models/WipeError.hpp"

#include <cstdint>
#include <memory>
#include <span>
#include <string>

/**
 * @class IDeviceHandle
 * @brief Exclusively owned handle on an opened device extent
 */
class IDeviceHandle {
public:
    virtual ~IDeviceHandle() = default;

    /**
     * @brief Write all of data at the given offset
     * @return IO error carrying the offset reached on failure
     */
    [[nodiscard]] virtual auto write_at(uint64_t offset, std::span<const uint8_t> data)
        -> WipeResult<void> = 0;

    /**
     * @brief Read up to buffer.size() bytes starting at offset
     * @return Number of bytes read, 0 at end of device
     */
    [[nodiscard]] virtual auto read_at(uint64_t offset, std::span<uint8_t> buffer)
        -> WipeResult<size_t> = 0;

    /**
     * @brief Flush written data to stable storage
     */
    [[nodiscard]] virtual auto sync() -> WipeResult<void> = 0;

    /**
     * @brief Size resolved when the handle was opened
     */
    [[nodiscard]] virtual auto size() const -> uint64_t = 0;

    [[nodiscard]] virtual auto path() const -> const std::string& = 0;
};

/**
 * @class IDeviceOpener
 * @brief Resolves a device path into a fresh handle for each operation
 */
class IDeviceOpener {
public:
    virtual ~IDeviceOpener() = default;

    [[nodiscard]] virtual auto open_for_write(const std::string& path)
        -> WipeResult<std::unique_ptr<IDeviceHandle>> = 0;

    [[nodiscard]] virtual auto open_for_read(const std::string& path)
        -> WipeResult<std::unique_ptr<IDeviceHandle>> = 0;
};
