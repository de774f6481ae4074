/**
 * @file CliApplication.cpp
 * @brief CLI application implementation
 */

#include "cli/CliApplication.hpp"

#include "algorithms/PatternScheduler.hpp"
#include "cli/ProgressDisplay.hpp"
#include "config.h"
#include "io/PosixDevice.hpp"
#include "io/UrandomEntropySource.hpp"
#include "services/WipeOrchestrator.hpp"
#include "util/Logger.hpp"

#include <glib.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <filesystem>
#include <iostream>

#include <getopt.h>

namespace cli {

namespace {

constexpr auto APP_NAME = "secure-wipe-cli";

const struct option long_options[] = {
    {          "help",       no_argument, nullptr, 'h'},
    {       "version",       no_argument, nullptr, 'V'},
    {"list-standards",       no_argument, nullptr, 'L'},
    {          "wipe", required_argument, nullptr, 'w'},
    {   "verify-only", required_argument, nullptr, 'r'},
    {      "standard", required_argument, nullptr, 's'},
    {        "passes", required_argument, nullptr, 'p'},
    {    "chunk-size", required_argument, nullptr, 'c'},
    {        "verify",       no_argument, nullptr, 'v'},
    {         "quick",       no_argument, nullptr, 'q'},
    {           "yes",       no_argument, nullptr, 'y'},
    {     "log-level", required_argument, nullptr, 'l'},
    {       "log-dir", required_argument, nullptr, 'd'},
    {         nullptr,                 0, nullptr,   0}
};

template<typename T>
auto parse_number(const char* text, T& out) -> bool {
    const std::string_view view(text);
    auto [ptr, ec] = std::from_chars(view.data(), view.data() + view.size(), out);
    return ec == std::errc{} && ptr == view.data() + view.size();
}

auto failure_hint(const WipeError& error) -> std::string {
    std::string text = to_string(error.kind) + ": " + error.message;
    if (error.offset) {
        text += " (at byte " + std::to_string(*error.offset) + ")";
    }
    return text;
}

}  // namespace

CliApplication::CliApplication()
    : CliApplication(std::make_shared<WipeOrchestrator>(std::make_shared<PosixDeviceOpener>(),
                                                        std::make_shared<UrandomEntropySource>()),
                     std::make_shared<PosixDeviceOpener>()) {}

CliApplication::CliApplication(std::shared_ptr<IWipeOrchestrator> orchestrator,
                               std::shared_ptr<IDeviceOpener> probe)
    : orchestrator_(std::move(orchestrator)), probe_(std::move(probe)) {}

CliApplication::~CliApplication() = default;

auto CliApplication::run(int argc, char* argv[]) -> int {
    auto options = parse_args(argc, argv);

    if (!options.parse_error.empty()) {
        std::cerr << "Error: " << options.parse_error << "\n"
                  << "Run with --help for usage.\n";
        return 1;
    }

    if (options.show_help) {
        print_help();
        return 0;
    }

    if (options.show_version) {
        print_version();
        return 0;
    }

    if (options.list_standards) {
        print_standards();
        return 0;
    }

    if (!init_logging(options)) {
        std::cerr << "Warning: file logging is disabled\n";
    }

    if (options.verify_only) {
        return cmd_verify(options);
    }

    if (options.wipe) {
        return options.quick ? cmd_quick_wipe(options) : cmd_wipe(options);
    }

    print_help();
    return 1;
}

auto CliApplication::parse_args(int argc, char* argv[]) -> CliOptions {
    CliOptions options;

    // glibc: 0 forces a full rescan so repeated parses start from argv[1]
    optind = 0;
    opterr = 0;

    int opt;
    while ((opt = getopt_long(argc, argv, "hVLw:r:s:p:c:vqyl:d:", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'h':
                options.show_help = true;
                break;
            case 'V':
                options.show_version = true;
                break;
            case 'L':
                options.list_standards = true;
                break;
            case 'w':
                options.wipe = true;
                options.device_path = optarg;
                break;
            case 'r':
                options.verify_only = true;
                options.device_path = optarg;
                break;
            case 's':
                options.standard = optarg;
                break;
            case 'p': {
                int passes = 0;
                if (!parse_number(optarg, passes)) {
                    options.parse_error = std::string("Invalid pass count '") + optarg + "'";
                } else {
                    options.passes = passes;
                }
                break;
            }
            case 'c': {
                size_t chunk = 0;
                if (!parse_number(optarg, chunk) || chunk == 0) {
                    options.parse_error = std::string("Invalid chunk size '") + optarg + "'";
                } else {
                    options.chunk_size = chunk;
                }
                break;
            }
            case 'v':
                options.verify = true;
                break;
            case 'q':
                options.quick = true;
                break;
            case 'y':
                options.no_confirm = true;
                break;
            case 'l':
                options.log_level = optarg;
                if (!util::parse_log_level(options.log_level)) {
                    options.parse_error = "Unknown log level '" + options.log_level + "'";
                }
                break;
            case 'd':
                options.log_dir = optarg;
                break;
            default:
                options.show_help = true;
                break;
        }
    }

    if (options.wipe && options.verify_only) {
        options.parse_error = "--wipe and --verify-only cannot be combined";
    }

    if (options.parse_error.empty() && !parse_standard(options.standard)) {
        options.parse_error = "Unknown standard '" + options.standard + "'";
    }

    return options;
}

auto CliApplication::parse_standard(const std::string& name) -> std::optional<WipeStandard> {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "zero" || lower == "zeros" || lower == "zero-fill") {
        return SinglePass{SinglePassFill::ZERO};
    }
    if (lower == "random" || lower == "random-fill") {
        return SinglePass{SinglePassFill::RANDOM};
    }
    if (lower == "dod" || lower == "dod-5220-22-m" || lower == "dod522022m") {
        return Dod5220{};
    }
    if (lower == "gutmann") {
        return Gutmann{};
    }
    return std::nullopt;
}

void CliApplication::print_help() {
    std::cout << "Usage: " << APP_NAME << " [OPTIONS]\n\n"
              << "Securely overwrite a block device\n\n"
              << "Commands:\n"
              << "  -w, --wipe <device>         Wipe the specified device\n"
              << "  -r, --verify-only <device>  Scan the device start for leftover signatures\n"
              << "  -L, --list-standards        List available wipe standards\n\n"
              << "Options:\n"
              << "  -h, --help                  Show this help message\n"
              << "  -V, --version               Show version information\n"
              << "  -s, --standard <name>       Wipe standard (default: random)\n"
              << "  -p, --passes <n>            Pass count for zero/random (default: 1)\n"
              << "  -c, --chunk-size <bytes>    Write size per I/O call (default: 4194304)\n"
              << "  -v, --verify                Scan for signatures after wiping\n"
              << "  -q, --quick                 Only zero the first and last 1 MiB\n"
              << "  -y, --yes                   Skip confirmation prompt\n"
              << "  -l, --log-level <level>     debug, info, warning or error\n"
              << "  -d, --log-dir <dir>         Log directory\n\n"
              << "Examples:\n"
              << "  " << APP_NAME << " --wipe /dev/sdb\n"
              << "  " << APP_NAME << " --wipe /dev/sdb --standard zero --passes 2\n"
              << "  " << APP_NAME << " --wipe /dev/sdb --standard dod --verify\n"
              << "  " << APP_NAME << " --verify-only /dev/sdb\n"
              << std::endl;
}

void CliApplication::print_version() {
    std::cout << APP_NAME << " version " << PROJECT_VERSION << "\n"
              << "Part of " << PROJECT_NAME << " - secure block device wiping\n";
}

void CliApplication::print_standards() {
    struct Entry {
        const char* key;
        WipeStandard standard;
    };
    const Entry entries[] = {
        {   "zero", SinglePass{SinglePassFill::ZERO}},
        { "random", SinglePass{SinglePassFill::RANDOM}},
        {    "dod",                        Dod5220{}},
        {"gutmann",                        Gutmann{}},
    };

    for (const auto& entry : entries) {
        auto algorithm = pattern_scheduler::create_algorithm(entry.standard);
        std::string passes = algorithm->has_fixed_pass_count()
                                 ? std::to_string(algorithm->get_pass_count()) + " passes"
                                 : "--passes N";
        std::cout << "  " << entry.key << std::string(10 - std::string(entry.key).size(), ' ')
                  << algorithm->get_name() << " (" << passes << "): "
                  << algorithm->get_description() << "\n";
    }
}

auto CliApplication::init_logging(const CliOptions& options) -> bool {
    std::filesystem::path log_dir = options.log_dir;
    if (log_dir.empty()) {
        log_dir = std::filesystem::path(g_get_user_data_dir()) / PROJECT_NAME / "logs";
    }
    auto level = util::parse_log_level(options.log_level).value_or(util::LogLevel::INFO);
    return util::Logger::instance().initialize(log_dir, APP_NAME, level);
}

auto CliApplication::make_wipe_options(const CliOptions& options) -> WipeOptions {
    WipeOptions wipe_options;
    wipe_options.chunk_size = options.chunk_size;
    return wipe_options;
}

auto CliApplication::cmd_wipe(const CliOptions& options) -> int {
    const auto standard = *parse_standard(options.standard);
    const auto wipe_options = make_wipe_options(options);

    // Reject a bad pass count before anything is shown or opened
    auto passes = pattern_scheduler::schedule(standard, options.passes,
                                              wipe_options.default_pass_count);
    if (!passes) {
        LOG_ERROR("CLI", passes.error().message);
        std::cerr << "Error: " << failure_hint(passes.error()) << "\n";
        return 1;
    }

    auto device = probe_->open_for_read(options.device_path);
    if (!device) {
        LOG_ERROR("CLI", device.error().message);
        std::cerr << "Error: " << failure_hint(device.error()) << "\n";
        return 1;
    }
    const uint64_t device_size = (*device)->size();
    device->reset();

    const auto name = pattern_scheduler::standard_name(standard);
    const int total_passes = static_cast<int>(passes->size());
    const auto estimate = pattern_scheduler::estimate_duration_seconds(device_size, total_passes);

    std::string plan = "Standard: " + name + "\nPasses:   " + std::to_string(total_passes) +
                       "\nSize:     " + ProgressDisplay::format_bytes(device_size) +
                       "\nEstimate: ~" + ProgressDisplay::format_duration(
                                             static_cast<int64_t>(estimate)) +
                       " at 50 MB/s";
    if (total_passes == 1 && passes->front().pattern.is_random()) {
        plan += "\nNote:     a single random pass may leave traces on some media";
    }

    std::cout << "\n" << plan << "\n";

    if (!options.no_confirm && !confirm_wipe(options.device_path)) {
        std::cout << "Aborted.\n";
        return 1;
    }

    ProgressDisplay progress(options.device_path, device_size, name, total_passes);

    auto result =
        orchestrator_->wipe(options.device_path, standard, options.passes, progress, wipe_options);
    if (!result) {
        progress.complete(false, failure_hint(result.error()));
        std::cerr << "The device is partially overwritten. Restart the wipe from pass 1.\n";
        return 1;
    }
    progress.complete(true, "Wipe completed successfully");

    if (options.verify) {
        return cmd_verify(options);
    }
    return 0;
}

auto CliApplication::cmd_quick_wipe(const CliOptions& options) -> int {
    const auto wipe_options = make_wipe_options(options);

    std::cout << "\nQuick wipe: zero the first and last "
              << ProgressDisplay::format_bytes(wipe_options.quick_wipe_region_bytes) << "\n";

    if (!options.no_confirm && !confirm_wipe(options.device_path)) {
        std::cout << "Aborted.\n";
        return 1;
    }

    if (auto result = orchestrator_->quick_wipe(options.device_path, wipe_options); !result) {
        std::cerr << "Error: " << failure_hint(result.error()) << "\n";
        return 1;
    }
    std::cout << "Quick wipe of " << options.device_path << " completed.\n";

    if (options.verify) {
        return cmd_verify(options);
    }
    return 0;
}

auto CliApplication::cmd_verify(const CliOptions& options) -> int {
    auto report = orchestrator_->scan(options.device_path, make_wipe_options(options));
    if (!report) {
        std::cerr << "Error: " << failure_hint(report.error()) << "\n";
        return 1;
    }

    if (report->appears_wiped) {
        std::cout << "Verification passed: no partition or filesystem signatures in the first "
                  << ProgressDisplay::format_bytes(report->bytes_scanned) << ".\n"
                  << "Only the start of the device was checked.\n";
        return 0;
    }

    std::cout << "Verification failed: signatures still present:\n";
    for (const auto& finding : report->findings) {
        std::cout << "  " << finding.name << " at offset " << finding.offset << "\n";
    }
    std::cout << "The wipe may have been incomplete. Run it again from pass 1.\n";
    return 1;
}

auto CliApplication::confirm_wipe(const std::string& device_path) -> bool {
    std::cout << "\n";
    std::cout << "\033[1;31mWARNING: This will PERMANENTLY DESTROY all data on " << device_path
              << "!\033[0m\n\n";
    std::cout << "Type 'yes' to confirm: ";
    std::cout.flush();

    std::string input;
    std::getline(std::cin, input);

    return input == "yes";
}

}  // namespace cli
