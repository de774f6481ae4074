/**
 * @file WipeError.hpp
 * @brief Error taxonomy for wipe and verification operations
 */

#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <string>

/**
 * @enum WipeErrorKind
 * @brief Category of a wipe failure
 */
enum class WipeErrorKind {
    CONFIGURATION,  ///< Invalid pass count or option, detected before any I/O
    DEVICE_OPEN,    ///< Path missing, permission denied or device busy
    IO,             ///< Read/write/seek/sync failure mid-operation
    ENTROPY_SOURCE  ///< Random source could not be read
};

/**
 * @struct WipeError
 * @brief Represents a failed operation with its category and context
 */
struct WipeError {
    WipeErrorKind kind = WipeErrorKind::IO;
    std::string message;
    int code = 0;                   ///< errno value, 0 if not applicable
    std::optional<uint64_t> offset; ///< Byte offset reached when the failure occurred

    WipeError() = default;
    WipeError(WipeErrorKind err_kind, std::string msg, int err_code = 0,
              std::optional<uint64_t> err_offset = std::nullopt)
        : kind(err_kind), message(std::move(msg)), code(err_code), offset(err_offset) {}

    [[nodiscard]] auto what() const -> const std::string& { return message; }

    [[nodiscard]] static auto configuration(std::string msg) -> WipeError {
        return WipeError{WipeErrorKind::CONFIGURATION, std::move(msg)};
    }

    [[nodiscard]] static auto device_open(std::string msg, int err_code) -> WipeError {
        return WipeError{WipeErrorKind::DEVICE_OPEN, std::move(msg), err_code};
    }

    [[nodiscard]] static auto io(std::string msg, int err_code,
                                 std::optional<uint64_t> at = std::nullopt) -> WipeError {
        return WipeError{WipeErrorKind::IO, std::move(msg), err_code, at};
    }

    [[nodiscard]] static auto entropy(std::string msg, int err_code = 0) -> WipeError {
        return WipeError{WipeErrorKind::ENTROPY_SOURCE, std::move(msg), err_code};
    }

    auto operator==(const WipeError&) const -> bool = default;
};

/**
 * @brief Result of a fallible wipe-engine operation
 */
template<typename T>
using WipeResult = std::expected<T, WipeError>;

/**
 * @brief Short name of an error kind for logs and CLI output
 */
[[nodiscard]] inline auto to_string(WipeErrorKind kind) -> std::string {
    switch (kind) {
        case WipeErrorKind::CONFIGURATION:
            return "configuration error";
        case WipeErrorKind::DEVICE_OPEN:
            return "device open error";
        case WipeErrorKind::IO:
            return "I/O error";
        case WipeErrorKind::ENTROPY_SOURCE:
            return "entropy source error";
    }
    return "unknown error";
}
