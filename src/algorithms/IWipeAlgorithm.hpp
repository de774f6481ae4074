/**
 * @file IWipeAlgorithm.hpp
 * @brief Base interface for wipe standard implementations
 */

#pragma once

#include "models/WipeError.hpp"
#include "models/WipeTypes.hpp"

#include <optional>
#include <string>
#include <vector>

/**
 * @class IWipeAlgorithm
 * @brief A named sanitization standard that schedules its overwrite passes
 *
 * Scheduling performs no I/O. The same inputs always yield the same
 * sequence of (index, total_passes, pattern kind).
 */
class IWipeAlgorithm {
public:
    virtual ~IWipeAlgorithm() = default;

    /**
     * @brief Produce the ordered pass list for one wipe invocation
     * @param pass_override Caller-supplied pass count, ignored by fixed-count standards
     * @param default_passes Count used by variable-count standards without an override
     * @return Pass list, or CONFIGURATION error for a count below 1
     */
    [[nodiscard]] virtual auto schedule(std::optional<int> pass_override,
                                        int default_passes) const
        -> WipeResult<std::vector<PassSpec>> = 0;

    /**
     * @brief Get the name of this standard
     */
    virtual std::string get_name() const = 0;

    /**
     * @brief Get a description of this standard
     */
    virtual std::string get_description() const = 0;

    /**
     * @brief Number of passes, or the default count for variable-count standards
     */
    virtual int get_pass_count() const = 0;

    /**
     * @brief Whether the pass count ignores any caller override
     */
    virtual bool has_fixed_pass_count() const = 0;

    /**
     * @brief Check if this standard is reasonable on SSDs
     */
    virtual bool is_ssd_compatible() const = 0;
};
