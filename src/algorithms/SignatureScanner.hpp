/**
 * @file SignatureScanner.hpp
 * @brief Heuristic post-wipe check for partition table and filesystem signatures
 *
 * Only a bounded prefix of the device is inspected. A clean result does not
 * prove the whole device was erased: anything past the scan window goes
 * unnoticed.
 */

#pragma once

#include "interfaces/IDeviceHandle.hpp"
#include "models/WipeError.hpp"
#include "models/WipeTypes.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace verification {

constexpr uint64_t MBR_SIGNATURE_OFFSET = 510;
constexpr uint64_t EXT_MAGIC_OFFSET = 0x438;
constexpr uint64_t GPT_HEADER_OFFSET_512 = 512;    ///< LBA 1 with 512-byte sectors
constexpr uint64_t GPT_HEADER_OFFSET_4K = 4'096;   ///< LBA 1 with 4096-byte sectors

/**
 * @brief Find known signatures in a buffer read from offset 0 of a device
 * @param data Scanned prefix
 * @return First occurrence of each signature found, in check order
 *
 * Checks, at their conventional locations:
 * - GPT header text "EFI PART" at LBA 1 (512 and 4096 byte sectors)
 * - MBR boot signature 0x55 0xAA at offset 510
 * - ext2/3/4 superblock magic 0x53 0xEF at offset 0x438
 * - "NTFS" and "FAT32" anywhere in the buffer
 */
[[nodiscard]] auto find_signatures(std::span<const uint8_t> data) -> std::vector<SignatureFinding>;

/**
 * @brief Read up to prefix_bytes from the device and scan them
 * @param device Handle opened for reading
 * @param prefix_bytes Scan window; devices shorter than this are read whole
 * @return Report, or IO error if the read fails
 */
[[nodiscard]] auto scan_device(IDeviceHandle& device, uint64_t prefix_bytes)
    -> WipeResult<VerifyReport>;

}  // namespace verification
