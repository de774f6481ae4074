/**
 * @file IWipeOrchestrator.hpp
 * @brief Interface for secure device wiping and post-wipe verification
 *
 * Every call irreversibly overwrites (wipe, quick_wipe) or reads (verify,
 * scan) the target device. Confirming intent with the operator is the
 * caller's responsibility.
 */

#pragma once

#include "interfaces/IProgressSink.hpp"
#include "models/WipeError.hpp"
#include "models/WipeTypes.hpp"

#include <optional>
#include <string>

class IWipeOrchestrator {
public:
    virtual ~IWipeOrchestrator() = default;

    /**
     * @brief Overwrite the whole device with every pass of a standard
     * @param device_path Validated device path
     * @param standard Requested standard
     * @param pass_override Pass count for SinglePass; ignored otherwise
     * @param sink Receives progress after every chunk, on the calling thread
     * @param options Chunk size and default pass count
     * @return Empty on success, the first error otherwise (no further passes run)
     */
    virtual auto wipe(const std::string& device_path, const WipeStandard& standard,
                      std::optional<int> pass_override, IProgressSink& sink,
                      const WipeOptions& options) -> WipeResult<void> = 0;

    /**
     * @brief true if no known signature is found in the device prefix
     */
    [[nodiscard]] virtual auto verify(const std::string& device_path, const WipeOptions& options)
        -> WipeResult<bool> = 0;

    /**
     * @brief Signature scan with the list of findings
     */
    [[nodiscard]] virtual auto scan(const std::string& device_path, const WipeOptions& options)
        -> WipeResult<VerifyReport> = 0;

    /**
     * @brief Zero only the first and last region of the device
     */
    virtual auto quick_wipe(const std::string& device_path, const WipeOptions& options)
        -> WipeResult<void> = 0;
};
