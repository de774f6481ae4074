#include "io/UrandomEntropySource.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

UrandomEntropySource::UrandomEntropySource(std::string device) : device_(std::move(device)) {}

auto UrandomEntropySource::fill(std::span<uint8_t> buffer) -> WipeResult<void> {
    if (!fd_) {
        fd_ = util::FileDescriptor::open(device_, O_RDONLY);
        if (!fd_) {
            const int err = errno;
            return std::unexpected(WipeError::entropy(
                "Failed to open " + device_ + ": " + std::strerror(err), err));
        }
    }

    size_t filled = 0;
    while (filled < buffer.size()) {
        auto result = ::read(fd_.get(), buffer.data() + filled, buffer.size() - filled);
        if (result < 0) {
            if (errno == EINTR) {
                continue;
            }
            const int err = errno;
            return std::unexpected(WipeError::entropy(
                "Failed to read " + device_ + ": " + std::strerror(err), err));
        }
        if (result == 0) {
            return std::unexpected(WipeError::entropy("Unexpected end of " + device_));
        }
        filled += static_cast<size_t>(result);
    }
    return {};
}
