/**
 * @file SignatureScanner.cpp
 * @brief Implementation of the post-wipe signature scan
 */

#include "algorithms/SignatureScanner.hpp"

#include <algorithm>
#include <array>
#include <optional>
#include <string_view>

namespace verification {

namespace {

auto matches_at(std::span<const uint8_t> data, uint64_t offset, std::span<const uint8_t> signature)
    -> bool {
    if (offset > data.size() || data.size() - offset < signature.size()) {
        return false;
    }
    return std::equal(signature.begin(), signature.end(), data.begin() + offset);
}

auto as_bytes(std::string_view text) -> std::span<const uint8_t> {
    return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
}

/**
 * @brief Offset of the first occurrence of text in data
 */
auto find_text(std::span<const uint8_t> data, std::string_view text) -> std::optional<uint64_t> {
    auto needle = as_bytes(text);
    auto it = std::search(data.begin(), data.end(), needle.begin(), needle.end());
    if (it == data.end()) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(it - data.begin());
}

}  // namespace

auto find_signatures(std::span<const uint8_t> data) -> std::vector<SignatureFinding> {
    static constexpr std::array<uint8_t, 2> MBR_SIGNATURE{0x55, 0xAA};
    static constexpr std::array<uint8_t, 2> EXT_MAGIC{0x53, 0xEF};
    static constexpr std::string_view GPT_TEXT = "EFI PART";

    std::vector<SignatureFinding> findings;

    for (auto offset : {GPT_HEADER_OFFSET_512, GPT_HEADER_OFFSET_4K}) {
        if (matches_at(data, offset, as_bytes(GPT_TEXT))) {
            findings.push_back({.name = "GPT", .offset = offset});
            break;
        }
    }

    if (matches_at(data, MBR_SIGNATURE_OFFSET, MBR_SIGNATURE)) {
        findings.push_back({.name = "MBR", .offset = MBR_SIGNATURE_OFFSET});
    }

    if (matches_at(data, EXT_MAGIC_OFFSET, EXT_MAGIC)) {
        findings.push_back({.name = "ext2/3/4", .offset = EXT_MAGIC_OFFSET});
    }

    for (std::string_view text : {std::string_view{"NTFS"}, std::string_view{"FAT32"}}) {
        if (auto offset = find_text(data, text)) {
            findings.push_back({.name = std::string(text), .offset = *offset});
        }
    }

    return findings;
}

auto scan_device(IDeviceHandle& device, uint64_t prefix_bytes) -> WipeResult<VerifyReport> {
    const auto window = static_cast<size_t>(std::min(prefix_bytes, device.size()));
    std::vector<uint8_t> buffer(window);

    auto read = device.read_at(0, buffer);
    if (!read) {
        return std::unexpected(read.error());
    }
    buffer.resize(*read);

    VerifyReport report;
    report.bytes_scanned = buffer.size();
    report.findings = find_signatures(buffer);
    report.appears_wiped = report.findings.empty();
    return report;
}

}  // namespace verification
