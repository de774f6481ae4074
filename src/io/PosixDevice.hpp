/**
 * @file PosixDevice.hpp
 * @brief Device handle backed by a POSIX file descriptor
 */

#pragma once

#include "interfaces/IDeviceHandle.hpp"
#include "util/FileDescriptor.hpp"

#include <string>

/**
 * @class PosixDeviceHandle
 * @brief Positioned pwrite/pread/fsync access to a block device or image file
 */
class PosixDeviceHandle final : public IDeviceHandle {
public:
    PosixDeviceHandle(std::string path, util::FileDescriptor fd, uint64_t size);

    [[nodiscard]] auto write_at(uint64_t offset, std::span<const uint8_t> data)
        -> WipeResult<void> override;
    [[nodiscard]] auto read_at(uint64_t offset, std::span<uint8_t> buffer)
        -> WipeResult<size_t> override;
    [[nodiscard]] auto sync() -> WipeResult<void> override;

    [[nodiscard]] auto size() const -> uint64_t override { return size_; }
    [[nodiscard]] auto path() const -> const std::string& override { return path_; }

private:
    std::string path_;
    util::FileDescriptor fd_;
    uint64_t size_;
};

/**
 * @class PosixDeviceOpener
 * @brief Opens device paths and resolves their size by seeking to the end
 */
class PosixDeviceOpener final : public IDeviceOpener {
public:
    [[nodiscard]] auto open_for_write(const std::string& path)
        -> WipeResult<std::unique_ptr<IDeviceHandle>> override;
    [[nodiscard]] auto open_for_read(const std::string& path)
        -> WipeResult<std::unique_ptr<IDeviceHandle>> override;

private:
    [[nodiscard]] static auto open_device(const std::string& path, int flags)
        -> WipeResult<std::unique_ptr<IDeviceHandle>>;
};
