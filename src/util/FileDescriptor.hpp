/**
 * @file FileDescriptor.hpp
 * @brief RAII owner of a POSIX file descriptor
 */

#pragma once

#include <fcntl.h>
#include <unistd.h>

#include <string>
#include <utility>

namespace util {

/**
 * @class FileDescriptor
 * @brief Move-only wrapper that closes its descriptor on destruction
 *
 * A device handle owns exactly one FileDescriptor for the duration of a
 * wipe or verify call; a new request always opens a fresh one.
 */
class FileDescriptor {
public:
    FileDescriptor() noexcept = default;

    explicit FileDescriptor(int fd) noexcept : fd_(fd) {}

    ~FileDescriptor() { reset(); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    FileDescriptor(FileDescriptor&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

    FileDescriptor& operator=(FileDescriptor&& other) noexcept {
        if (this != &other) {
            reset(std::exchange(other.fd_, -1));
        }
        return *this;
    }

    /**
     * @brief Open a path with close-on-exec set
     * @return Descriptor, invalid on failure with errno preserved
     */
    [[nodiscard]] static auto open(const std::string& path, int flags) -> FileDescriptor {
        return FileDescriptor(::open(path.c_str(), flags | O_CLOEXEC));
    }

    [[nodiscard]] constexpr auto get() const noexcept -> int { return fd_; }

    [[nodiscard]] constexpr auto is_valid() const noexcept -> bool { return fd_ >= 0; }

    explicit operator bool() const noexcept { return is_valid(); }

    /**
     * @brief Close the current descriptor (if any) and take ownership of fd
     */
    void reset(int fd = -1) noexcept {
        if (is_valid()) {
            ::close(fd_);
        }
        fd_ = fd;
    }

    /**
     * @brief Give up ownership without closing
     */
    [[nodiscard]] auto release() noexcept -> int { return std::exchange(fd_, -1); }

private:
    int fd_ = -1;
};

}  // namespace util
