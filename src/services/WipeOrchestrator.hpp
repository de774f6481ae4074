#pragma once

#include "interfaces/IDeviceHandle.hpp"
#include "interfaces/IEntropySource.hpp"
#include "interfaces/IWipeOrchestrator.hpp"

#include <memory>

/**
 * @enum WipeState
 * @brief Position of the orchestrator in the pass state machine
 *
 * IDLE -> SCHEDULED -> (PASS_RUNNING -> PASS_DONE)* -> COMPLETE,
 * or FAILED from SCHEDULED or any PASS_RUNNING.
 */
enum class WipeState {
    IDLE,
    SCHEDULED,
    PASS_RUNNING,
    PASS_DONE,
    COMPLETE,
    FAILED
};

/**
 * @class WipeOrchestrator
 * @brief Runs scheduled passes strictly in order on one device handle
 *
 * Single-threaded and synchronous: progress sinks run on the calling thread
 * and a pass never starts before the previous one has been synced. There is
 * no cancellation token and no resumption; every wipe starts at pass 1.
 */
class WipeOrchestrator : public IWipeOrchestrator {
public:
    WipeOrchestrator(std::shared_ptr<IDeviceOpener> opener,
                     std::shared_ptr<IEntropySource> entropy);

    auto wipe(const std::string& device_path, const WipeStandard& standard,
              std::optional<int> pass_override, IProgressSink& sink,
              const WipeOptions& options) -> WipeResult<void> override;

    [[nodiscard]] auto verify(const std::string& device_path, const WipeOptions& options)
        -> WipeResult<bool> override;

    [[nodiscard]] auto scan(const std::string& device_path, const WipeOptions& options)
        -> WipeResult<VerifyReport> override;

    auto quick_wipe(const std::string& device_path, const WipeOptions& options)
        -> WipeResult<void> override;

    [[nodiscard]] auto get_state() const -> WipeState { return state_; }

    /**
     * @brief Index of the pass running or last run, 0 before the first pass
     */
    [[nodiscard]] auto get_current_pass() const -> int { return current_pass_; }

private:
    /**
     * @brief Record the failure and hand the error back
     */
    auto fail(WipeError error) -> WipeResult<void>;

    std::shared_ptr<IDeviceOpener> opener_;
    std::shared_ptr<IEntropySource> entropy_;
    WipeState state_ = WipeState::IDLE;
    int current_pass_ = 0;
};
