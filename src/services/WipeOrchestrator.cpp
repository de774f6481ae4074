#include "services/WipeOrchestrator.hpp"

#include "algorithms/ChunkWriter.hpp"
#include "algorithms/PatternScheduler.hpp"
#include "algorithms/SignatureScanner.hpp"
#include "util/Logger.hpp"

#include <algorithm>
#include <vector>

namespace {

constexpr auto COMPONENT = "WipeOrchestrator";

auto describe(const WipeError& error) -> std::string {
    std::string text = to_string(error.kind) + ": " + error.message;
    if (error.offset) {
        text += " (offset " + std::to_string(*error.offset) + ")";
    }
    return text;
}

auto make_progress(const PassSpec& pass, uint64_t written, uint64_t total) -> WipeProgress {
    WipeProgress progress{};
    progress.pass_index = pass.index;
    progress.total_passes = pass.total_passes;
    progress.bytes_written = written;
    progress.pass_size_bytes = total;
    progress.label = pass.label();
    progress.percentage =
        total == 0 ? 100.0 : (static_cast<double>(written) / static_cast<double>(total)) * 100.0;
    return progress;
}

}  // namespace

WipeOrchestrator::WipeOrchestrator(std::shared_ptr<IDeviceOpener> opener,
                                   std::shared_ptr<IEntropySource> entropy)
    : opener_(std::move(opener)), entropy_(std::move(entropy)) {}

auto WipeOrchestrator::fail(WipeError error) -> WipeResult<void> {
    state_ = WipeState::FAILED;
    LOG_ERROR(COMPONENT, "Wipe failed during pass " + std::to_string(current_pass_) + ": " +
                             describe(error));
    return std::unexpected(std::move(error));
}

auto WipeOrchestrator::wipe(const std::string& device_path, const WipeStandard& standard,
                            std::optional<int> pass_override, IProgressSink& sink,
                            const WipeOptions& options) -> WipeResult<void> {
    state_ = WipeState::IDLE;
    current_pass_ = 0;

    if (!opener_ || !entropy_) {
        return fail(WipeError::configuration("Wipe orchestrator is missing a device opener or "
                                             "entropy source"));
    }

    // Scheduling errors surface before the device is touched
    auto algorithm = pattern_scheduler::create_algorithm(standard);
    auto passes = algorithm->schedule(pass_override, options.default_pass_count);
    if (!passes) {
        return fail(passes.error());
    }
    if (pass_override && algorithm->has_fixed_pass_count() &&
        *pass_override != algorithm->get_pass_count()) {
        LOG_WARNING(COMPONENT, algorithm->get_name() + " always runs " +
                                   std::to_string(algorithm->get_pass_count()) +
                                   " passes; ignoring requested count " +
                                   std::to_string(*pass_override));
    }
    if (options.chunk_size == 0) {
        return fail(WipeError::configuration("Chunk size must be greater than 0"));
    }
    state_ = WipeState::SCHEDULED;

    auto device = opener_->open_for_write(device_path);
    if (!device) {
        return fail(device.error());
    }
    const DeviceExtent extent{.path = device_path, .size_bytes = (*device)->size()};

    LOG_INFO(COMPONENT, "Starting " + algorithm->get_name() + " wipe of " + extent.path + " (" +
                            std::to_string(extent.size_bytes) + " bytes, " +
                            std::to_string(passes->size()) + " passes, chunk " +
                            std::to_string(options.chunk_size) + " bytes)");

    ChunkWriter writer(*entropy_);

    for (const auto& pass : *passes) {
        current_pass_ = pass.index;
        state_ = WipeState::PASS_RUNNING;
        LOG_INFO(COMPONENT, pass.label() + " started");

        auto on_chunk = [&sink, &pass](uint64_t written, uint64_t total) {
            sink.on_progress(make_progress(pass, written, total));
        };

        if (auto result = writer.write_pattern(**device, extent.size_bytes, pass.pattern,
                                               options.chunk_size, on_chunk);
            !result) {
            return fail(result.error());
        }

        state_ = WipeState::PASS_DONE;
        LOG_INFO(COMPONENT, pass.label() + " complete");
    }

    state_ = WipeState::COMPLETE;
    LOG_INFO(COMPONENT, "Wipe of " + extent.path + " completed successfully");
    return {};
}

auto WipeOrchestrator::scan(const std::string& device_path, const WipeOptions& options)
    -> WipeResult<VerifyReport> {
    if (!opener_) {
        return std::unexpected(WipeError::configuration("Wipe orchestrator has no device opener"));
    }

    auto device = opener_->open_for_read(device_path);
    if (!device) {
        LOG_ERROR(COMPONENT, "Verification could not open " + device_path + ": " +
                                 describe(device.error()));
        return std::unexpected(device.error());
    }

    auto report = verification::scan_device(**device, options.verify_prefix_bytes);
    if (!report) {
        LOG_ERROR(COMPONENT, "Verification of " + device_path + " failed: " +
                                 describe(report.error()));
        return report;
    }

    if (report->appears_wiped) {
        LOG_INFO(COMPONENT, "Verification of " + device_path + ": no signatures in first " +
                                std::to_string(report->bytes_scanned) + " bytes");
    } else {
        for (const auto& finding : report->findings) {
            LOG_WARNING(COMPONENT, "Verification of " + device_path + ": found " + finding.name +
                                       " signature at offset " + std::to_string(finding.offset));
        }
    }
    return report;
}

auto WipeOrchestrator::verify(const std::string& device_path, const WipeOptions& options)
    -> WipeResult<bool> {
    auto report = scan(device_path, options);
    if (!report) {
        return std::unexpected(report.error());
    }
    return report->appears_wiped;
}

auto WipeOrchestrator::quick_wipe(const std::string& device_path, const WipeOptions& options)
    -> WipeResult<void> {
    if (!opener_) {
        return std::unexpected(WipeError::configuration("Wipe orchestrator has no device opener"));
    }
    if (options.quick_wipe_region_bytes == 0) {
        return std::unexpected(
            WipeError::configuration("Quick wipe region must be greater than 0"));
    }

    auto device = opener_->open_for_write(device_path);
    if (!device) {
        LOG_ERROR(COMPONENT, "Quick wipe could not open " + device_path + ": " +
                                 describe(device.error()));
        return std::unexpected(device.error());
    }

    const uint64_t size = (*device)->size();
    const auto region = static_cast<size_t>(std::min(options.quick_wipe_region_bytes, size));
    const std::vector<uint8_t> zeros(region, 0x00);

    LOG_INFO(COMPONENT, "Quick wipe of " + device_path + ": zeroing first and last " +
                            std::to_string(region) + " bytes");

    if (auto head = (*device)->write_at(0, zeros); !head) {
        LOG_ERROR(COMPONENT, "Quick wipe failed: " + describe(head.error()));
        return head;
    }

    if (size > options.quick_wipe_region_bytes) {
        if (auto tail = (*device)->write_at(size - region, zeros); !tail) {
            LOG_ERROR(COMPONENT, "Quick wipe failed: " + describe(tail.error()));
            return tail;
        }
    }

    if (auto synced = (*device)->sync(); !synced) {
        LOG_ERROR(COMPONENT, "Quick wipe failed: " + describe(synced.error()));
        return synced;
    }

    LOG_INFO(COMPONENT, "Quick wipe of " + device_path + " completed");
    return {};
}
