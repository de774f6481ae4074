#pragma once

#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <cstdint>

namespace util {

/**
 * @brief pwrite() the whole buffer, continuing after short writes and EINTR
 * @param written Set to the number of bytes written before returning
 * @return 0 on success, errno on failure (EIO if the device accepted nothing)
 */
inline auto pwrite_all(int fd, const uint8_t* buffer, size_t size, uint64_t offset,
                       size_t& written) -> int {
    written = 0;
    while (written < size) {
        const auto result = ::pwrite(fd, buffer + written, size - written,
                                     static_cast<off_t>(offset + written));
        if (result < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            return errno;
        }
        if (result == 0) {
            return EIO;
        }
        written += static_cast<size_t>(result);
    }
    return 0;
}

/**
 * @brief pread() with retry on EINTR
 */
inline auto pread_with_retry(int fd, uint8_t* buffer, size_t size, uint64_t offset) -> ssize_t {
    while (true) {
        const auto result = ::pread(fd, buffer, size, static_cast<off_t>(offset));
        if (result >= 0 || errno != EINTR) {
            return result;
        }
    }
}

} // namespace util
