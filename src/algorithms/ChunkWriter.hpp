/**
 * @file ChunkWriter.hpp
 * @brief Streams one pass's pattern across a device extent
 */

#pragma once

#include "interfaces/IDeviceHandle.hpp"
#include "interfaces/IEntropySource.hpp"
#include "models/WipeError.hpp"
#include "models/WipeTypes.hpp"

#include <cstdint>
#include <functional>

/**
 * @class ChunkWriter
 * @brief Writes [0, size) of a device sequentially with a bounded buffer
 *
 * Fixed patterns are tiled into the buffer once and reused; RANDOM passes
 * refresh the buffer from the entropy source before every chunk. The chunk
 * callback runs after each write and before the next one starts. The device
 * is synced once the whole extent has been written.
 */
class ChunkWriter {
public:
    /**
     * @brief Invoked with (bytes written so far, pass size)
     */
    using ChunkCallback = std::function<void(uint64_t, uint64_t)>;

    explicit ChunkWriter(IEntropySource& entropy);

    /**
     * @brief Write one pass
     * @param device Open handle, exclusively owned by the caller
     * @param size Bytes to write from offset 0
     * @param pattern Pattern of this pass
     * @param chunk_size Upper bound of a single write and of the buffer
     * @param on_chunk Progress callback (may be empty)
     * @return Error carrying the offset reached; no retry is attempted
     *
     * A size of 0 returns immediately without writes or callbacks.
     */
    [[nodiscard]] auto write_pattern(IDeviceHandle& device, uint64_t size,
                                     const PassPattern& pattern, size_t chunk_size,
                                     const ChunkCallback& on_chunk) -> WipeResult<void>;

private:
    IEntropySource& entropy_;
};
