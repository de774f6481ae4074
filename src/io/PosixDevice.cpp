#include "io/PosixDevice.hpp"

#include "util/IoHelpers.hpp"
#include "util/Logger.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

PosixDeviceHandle::PosixDeviceHandle(std::string path, util::FileDescriptor fd, uint64_t size)
    : path_(std::move(path)), fd_(std::move(fd)), size_(size) {}

auto PosixDeviceHandle::write_at(uint64_t offset, std::span<const uint8_t> data)
    -> WipeResult<void> {
    size_t written = 0;
    if (int err = util::pwrite_all(fd_.get(), data.data(), data.size(), offset, written);
        err != 0) {
        const uint64_t reached = offset + written;
        return std::unexpected(WipeError::io("Write failed on " + path_ + " at offset " +
                                                 std::to_string(reached) + ": " +
                                                 std::strerror(err),
                                             err, reached));
    }
    return {};
}

auto PosixDeviceHandle::read_at(uint64_t offset, std::span<uint8_t> buffer) -> WipeResult<size_t> {
    size_t total = 0;
    while (total < buffer.size()) {
        auto result = util::pread_with_retry(fd_.get(), buffer.data() + total,
                                             buffer.size() - total, offset + total);
        if (result < 0) {
            const int err = errno;
            return std::unexpected(WipeError::io("Read failed on " + path_ + " at offset " +
                                                     std::to_string(offset + total) + ": " +
                                                     std::strerror(err),
                                                 err, offset + total));
        }
        if (result == 0) {
            break;
        }
        total += static_cast<size_t>(result);
    }
    return total;
}

auto PosixDeviceHandle::sync() -> WipeResult<void> {
    if (::fsync(fd_.get()) != 0) {
        const int err = errno;
        return std::unexpected(
            WipeError::io("fsync failed on " + path_ + ": " + std::strerror(err), err, size_));
    }
    return {};
}

auto PosixDeviceOpener::open_for_write(const std::string& path)
    -> WipeResult<std::unique_ptr<IDeviceHandle>> {
    return open_device(path, O_WRONLY);
}

auto PosixDeviceOpener::open_for_read(const std::string& path)
    -> WipeResult<std::unique_ptr<IDeviceHandle>> {
    return open_device(path, O_RDONLY);
}

auto PosixDeviceOpener::open_device(const std::string& path, int flags)
    -> WipeResult<std::unique_ptr<IDeviceHandle>> {
    if (path.empty()) {
        return std::unexpected(WipeError::device_open("Device path is empty", ENOENT));
    }

    auto fd = util::FileDescriptor::open(path, flags);
    if (!fd) {
        const int err = errno;
        LOG_ERROR("PosixDevice", "Failed to open " + path + ": " + std::strerror(err));
        return std::unexpected(
            WipeError::device_open("Failed to open device " + path + ": " + std::strerror(err), err));
    }

    const off_t end = ::lseek(fd.get(), 0, SEEK_END);
    if (end < 0) {
        const int err = errno;
        return std::unexpected(WipeError::io(
            "Failed to determine size of " + path + ": " + std::strerror(err), err, 0));
    }
    if (::lseek(fd.get(), 0, SEEK_SET) < 0) {
        const int err = errno;
        return std::unexpected(
            WipeError::io("Failed to seek to start of " + path + ": " + std::strerror(err), err, 0));
    }

    LOG_DEBUG("PosixDevice", "Opened " + path + " (" + std::to_string(end) + " bytes)");
    return std::make_unique<PosixDeviceHandle>(path, std::move(fd), static_cast<uint64_t>(end));
}
