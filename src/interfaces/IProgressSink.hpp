/**
 * @file IProgressSink.hpp
 * @brief Synchronous receiver of per-chunk wipe progress
 */

#pragma once

#include "models/WipeTypes.hpp"

#include <utility>

/**
 * @class IProgressSink
 * @brief Single-method capability invoked after every chunk write
 *
 * Called on the wiping thread before the next chunk begins. Implementations
 * that drive a UI must hand the event off without blocking.
 */
class IProgressSink {
public:
    virtual ~IProgressSink() = default;

    virtual void on_progress(const WipeProgress& progress) = 0;
};

/**
 * @class CallbackProgressSink
 * @brief Adapts a ProgressCallback to the sink interface
 */
class CallbackProgressSink final : public IProgressSink {
public:
    explicit CallbackProgressSink(ProgressCallback callback) : callback_(std::move(callback)) {}

    void on_progress(const WipeProgress& progress) override {
        if (callback_) {
            callback_(progress);
        }
    }

private:
    ProgressCallback callback_;
};

/**
 * @class NullProgressSink
 * @brief Discards all progress events
 */
class NullProgressSink final : public IProgressSink {
public:
    void on_progress(const WipeProgress& /*progress*/) override {}
};
