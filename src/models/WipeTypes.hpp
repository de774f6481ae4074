/**
 * @file WipeTypes.hpp
 * @brief Data types for disk wiping operations
 */

#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <variant>
#include <vector>

/**
 * @enum PatternKind
 * @brief Byte content written during a single pass
 */
enum class PatternKind {
    ZERO,        ///< All 0x00
    ONE,         ///< All 0xFF
    RANDOM,      ///< Fresh entropy for every chunk
    FIXED_BYTES  ///< Repeating sequence of 1-4 bytes
};

/**
 * @struct PassPattern
 * @brief Pattern of one pass: its kind and, for FIXED_BYTES, the repeated bytes
 */
struct PassPattern {
    PatternKind kind = PatternKind::ZERO;
    std::vector<uint8_t> bytes;

    static constexpr size_t MAX_FIXED_BYTES = 4;

    [[nodiscard]] static auto zero() -> PassPattern { return {PatternKind::ZERO, {}}; }
    [[nodiscard]] static auto one() -> PassPattern { return {PatternKind::ONE, {}}; }
    [[nodiscard]] static auto random() -> PassPattern { return {PatternKind::RANDOM, {}}; }
    [[nodiscard]] static auto fixed(std::vector<uint8_t> sequence) -> PassPattern {
        return {PatternKind::FIXED_BYTES, std::move(sequence)};
    }

    [[nodiscard]] auto is_random() const -> bool { return kind == PatternKind::RANDOM; }

    /**
     * @brief Bytes tiled across the chunk buffer (empty for RANDOM)
     */
    [[nodiscard]] auto fill_bytes() const -> std::vector<uint8_t> {
        switch (kind) {
            case PatternKind::ZERO:
                return {0x00};
            case PatternKind::ONE:
                return {0xFF};
            case PatternKind::FIXED_BYTES:
                return bytes;
            case PatternKind::RANDOM:
                break;
        }
        return {};
    }

    /**
     * @brief Human-readable pattern, e.g. "0x92 0x49 0x24" or "random"
     */
    [[nodiscard]] auto to_string() const -> std::string;

    auto operator==(const PassPattern&) const -> bool = default;
};

/**
 * @struct PassSpec
 * @brief One scheduled overwrite of the whole device extent
 */
struct PassSpec {
    int index = 0;         ///< 1-based
    int total_passes = 0;
    PassPattern pattern;

    /**
     * @brief Display label, e.g. "Pass 7/35: 0x92 0x49 0x24"
     */
    [[nodiscard]] auto label() const -> std::string;

    auto operator==(const PassSpec&) const -> bool = default;
};

/**
 * @enum SinglePassFill
 * @brief Fill used by the variable-count single-pattern standard
 */
enum class SinglePassFill {
    ZERO,
    RANDOM
};

struct SinglePass {
    SinglePassFill fill = SinglePassFill::ZERO;
};

struct Dod5220 {};

struct Gutmann {};

/**
 * @brief Named sanitization standard requested by the caller
 */
using WipeStandard = std::variant<SinglePass, Dod5220, Gutmann>;

/**
 * @struct DeviceExtent
 * @brief Addressable byte range [0, size_bytes) of a target device
 */
struct DeviceExtent {
    std::string path;
    uint64_t size_bytes = 0;

    auto operator==(const DeviceExtent&) const -> bool = default;
};

/**
 * @struct WipeProgress
 * @brief Progress information emitted after every chunk
 */
struct WipeProgress {
    int pass_index = 0;
    int total_passes = 0;
    uint64_t bytes_written = 0;    ///< Cumulative bytes written in the current pass
    uint64_t pass_size_bytes = 0;  ///< Bytes a full pass writes
    std::string label;
    double percentage = 0.0;       ///< Progress of the current pass (0-100)

    auto operator==(const WipeProgress&) const -> bool = default;
};

/**
 * @struct WipeOptions
 * @brief Defaults passed explicitly into every orchestrator entry point
 */
struct WipeOptions {
    static constexpr size_t DEFAULT_CHUNK_SIZE = 4 * 1'024 * 1'024;
    static constexpr uint64_t DEFAULT_VERIFY_PREFIX = 1'024 * 1'024;

    size_t chunk_size = DEFAULT_CHUNK_SIZE;
    int default_pass_count = 1;  ///< SinglePass count when no override is given
    uint64_t verify_prefix_bytes = DEFAULT_VERIFY_PREFIX;
    uint64_t quick_wipe_region_bytes = 1'024 * 1'024;
};

/**
 * @struct SignatureFinding
 * @brief A known on-disk signature found during verification
 */
struct SignatureFinding {
    std::string name;
    uint64_t offset = 0;

    auto operator==(const SignatureFinding&) const -> bool = default;
};

/**
 * @struct VerifyReport
 * @brief Outcome of a post-wipe signature scan
 */
struct VerifyReport {
    bool appears_wiped = true;
    uint64_t bytes_scanned = 0;
    std::vector<SignatureFinding> findings;
};

/**
 * @brief Callback type for progress reporting
 */
using ProgressCallback = std::function<void(const WipeProgress&)>;
