#include "algorithms/ChunkWriter.hpp"

#include "util/Logger.hpp"

#include <algorithm>
#include <span>
#include <vector>

namespace {

auto validate(const PassPattern& pattern, size_t chunk_size) -> WipeResult<void> {
    if (chunk_size == 0) {
        return std::unexpected(WipeError::configuration("Chunk size must be greater than 0"));
    }
    if (pattern.kind == PatternKind::FIXED_BYTES &&
        (pattern.bytes.empty() || pattern.bytes.size() > PassPattern::MAX_FIXED_BYTES)) {
        return std::unexpected(WipeError::configuration(
            "Fixed pattern must be 1-4 bytes (got " + std::to_string(pattern.bytes.size()) + ")"));
    }
    return {};
}

/**
 * @brief Tile the pattern over chunk_size + (n - 1) bytes
 *
 * Each chunk starts at buffer[offset % n], so multi-byte patterns stay in
 * phase across chunk boundaries whatever the chunk size.
 */
auto make_tiled_buffer(const std::vector<uint8_t>& fill, size_t chunk_size)
    -> std::vector<uint8_t> {
    std::vector<uint8_t> buffer(chunk_size + fill.size() - 1);
    for (size_t i = 0; i < buffer.size(); ++i) {
        buffer[i] = fill[i % fill.size()];
    }
    return buffer;
}

}  // namespace

ChunkWriter::ChunkWriter(IEntropySource& entropy) : entropy_(entropy) {}

auto ChunkWriter::write_pattern(IDeviceHandle& device, uint64_t size, const PassPattern& pattern,
                                size_t chunk_size, const ChunkCallback& on_chunk)
    -> WipeResult<void> {
    if (auto valid = validate(pattern, chunk_size); !valid) {
        return valid;
    }

    if (size == 0) {
        return {};
    }

    const size_t buffer_size = static_cast<size_t>(std::min<uint64_t>(chunk_size, size));
    const bool random = pattern.is_random();
    const auto fill = pattern.fill_bytes();

    std::vector<uint8_t> buffer =
        random ? std::vector<uint8_t>(buffer_size) : make_tiled_buffer(fill, buffer_size);

    uint64_t written = 0;
    while (written < size) {
        const auto to_write = static_cast<size_t>(std::min<uint64_t>(buffer_size, size - written));

        std::span<const uint8_t> chunk;
        if (random) {
            std::span<uint8_t> target(buffer.data(), to_write);
            if (auto refreshed = entropy_.fill(target); !refreshed) {
                auto error = refreshed.error();
                error.offset = written;
                LOG_ERROR("ChunkWriter", "Entropy source failed at offset " +
                                             std::to_string(written) + ": " + error.message);
                return std::unexpected(error);
            }
            chunk = target;
        } else {
            const size_t phase = static_cast<size_t>(written % fill.size());
            chunk = std::span<const uint8_t>(buffer.data() + phase, to_write);
        }

        if (auto result = device.write_at(written, chunk); !result) {
            LOG_ERROR("ChunkWriter", result.error().message);
            return result;
        }

        written += to_write;

        if (on_chunk) {
            on_chunk(written, size);
        }
    }

    if (auto synced = device.sync(); !synced) {
        LOG_ERROR("ChunkWriter", synced.error().message);
        return synced;
    }

    return {};
}
