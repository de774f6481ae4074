/**
 * @file CliApplication.hpp
 * @brief CLI front-end for the wipe engine
 */

#pragma once

#include "interfaces/IDeviceHandle.hpp"
#include "interfaces/IWipeOrchestrator.hpp"
#include "models/WipeTypes.hpp"

#include <memory>
#include <optional>
#include <string>

namespace cli {

/**
 * @struct CliOptions
 * @brief Parsed command line options
 */
struct CliOptions {
    bool show_help = false;
    bool show_version = false;
    bool list_standards = false;
    bool wipe = false;
    bool verify_only = false;
    std::string device_path;
    std::string standard = "random";
    std::optional<int> passes;
    size_t chunk_size = WipeOptions::DEFAULT_CHUNK_SIZE;
    bool verify = false;
    bool quick = false;
    bool no_confirm = false;
    std::string log_level = "info";
    std::string log_dir;        ///< Empty: per-user data directory
    std::string parse_error;    ///< Set when an argument could not be parsed
};

/**
 * @class CliApplication
 * @brief Command-line application for device wiping
 *
 * Provides command-line interface for:
 * - Full multi-pass wipes with a named standard
 * - Quick wipes of the partition table regions
 * - Post-wipe signature verification
 */
class CliApplication {
public:
    /**
     * @brief Construct with the production POSIX engine
     */
    CliApplication();

    /**
     * @param orchestrator Engine performing wipes and verification
     * @param probe Opener used to read the device size for the wipe plan
     */
    CliApplication(std::shared_ptr<IWipeOrchestrator> orchestrator,
                   std::shared_ptr<IDeviceOpener> probe);

    ~CliApplication();

    CliApplication(const CliApplication&) = delete;
    CliApplication& operator=(const CliApplication&) = delete;

    /**
     * @brief Run the CLI application
     * @return Exit code (0 = success)
     */
    auto run(int argc, char* argv[]) -> int;

    [[nodiscard]] static auto parse_args(int argc, char* argv[]) -> CliOptions;

    /**
     * @brief Convert a standard name to a WipeStandard
     * @param name e.g. "zero", "random", "dod-5220-22-m", "gutmann"
     * @return Standard, or nullopt if unknown
     */
    [[nodiscard]] static auto parse_standard(const std::string& name)
        -> std::optional<WipeStandard>;

    static void print_help();
    static void print_version();
    static void print_standards();

private:
    [[nodiscard]] static auto init_logging(const CliOptions& options) -> bool;

    auto cmd_wipe(const CliOptions& options) -> int;
    auto cmd_quick_wipe(const CliOptions& options) -> int;
    auto cmd_verify(const CliOptions& options) -> int;

    [[nodiscard]] static auto make_wipe_options(const CliOptions& options) -> WipeOptions;

    /**
     * @brief Ask the operator to type "yes"
     */
    [[nodiscard]] static auto confirm_wipe(const std::string& device_path) -> bool;

    std::shared_ptr<IWipeOrchestrator> orchestrator_;
    std::shared_ptr<IDeviceOpener> probe_;
};

}  // namespace cli
