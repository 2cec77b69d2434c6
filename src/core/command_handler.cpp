#include "mediaferry/core/command_handler.hpp"
#include "mediaferry/core/config.hpp"
#include "mediaferry/core/logger.hpp"
#include "mediaferry/core/utils.hpp"
#include "mediaferry/remote/filesystem_remote_client.hpp"
#include "mediaferry/storage/history_store.hpp"
#include "mediaferry/storage/resume_gate.hpp"
#include "mediaferry/storage/storage_config.hpp"
#include "mediaferry/transfer/manifest.hpp"
#include "mediaferry/transfer/performance_profile.hpp"
#include "mediaferry/transfer/session_context.hpp"
#include "mediaferry/transfer/transfer_scheduler.hpp"
#include <atomic>
#include <charconv>
#include <csignal>
#include <iomanip>
#include <iostream>

namespace mediaferry::core {

namespace {

std::atomic<bool> interrupted{false};

void handle_interrupt(int) {
    interrupted = true;
}

std::string describe_size(int64_t size) {
    return size >= 0 ? utils::StringUtils::format_bytes(static_cast<uint64_t>(size)) : "unknown size";
}

}

// FetchCommandHandler Implementation
CommandResult FetchCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 3) {
        return CommandResult::usage("Usage: " + get_usage());
    }
    
    auto& config = Config::instance();
    auto profile = transfer::PerformanceProfile::from_config(config);
    auto valid = profile.validate();
    if (!valid) {
        return CommandResult::error("Invalid profile: " + valid.message);
    }
    
    auto storage_config = storage::StorageConfig::from_config(config);
    if (!storage_config.validate()) {
        return CommandResult::error("Invalid storage settings");
    }
    
    std::vector<transfer::TransferDescriptor> descriptors;
    auto loaded = transfer::Manifest::load(args[1], descriptors);
    if (!loaded) {
        return CommandResult::error(loaded.message);
    }
    
    std::filesystem::path source_root = utils::FileUtils::expand_home(args[2]);
    if (!utils::FileUtils::is_directory(source_root)) {
        return CommandResult::error("Source root is not a directory: " + source_root.string());
    }
    
    std::shared_ptr<storage::HistoryStore> history;
    if (storage_config.history_enabled) {
        history = std::make_shared<storage::HistoryStore>(storage_config.history_database);
        if (!history->initialize()) {
            LOG_WARN("History disabled: cannot open {}", storage_config.history_database.string());
            history.reset();
        }
    }
    
    auto client = std::make_shared<remote::FilesystemRemoteClient>(source_root);
    auto session = std::make_shared<transfer::SessionContext>(
        "local", client, static_cast<uint32_t>(config.get_int("session.max_concurrency",
                                                               transfer::SessionContext::DEFAULT_MAX_CONCURRENCY)));
    
    std::cout << "Fetching " << descriptors.size() << " items with " << profile.describe() << "\n";
    
    transfer::TransferScheduler scheduler(storage_config, history);
    transfer::BatchHandle handle;
    
    auto submitted = scheduler.submit(session, descriptors, profile, handle,
        [](const transfer::ProgressEvent& event) {
            std::cout << "  [" << std::setw(11) << std::left << transfer::to_string(event.status) << "] "
                      << event.descriptor_id << " "
                      << utils::StringUtils::format_bytes(event.bytes_transferred) << " / "
                      << describe_size(event.expected_size);
            if (event.error) {
                std::cout << " (" << event.error->message << ")";
            }
            std::cout << "\n";
        });
    if (!submitted) {
        return CommandResult::error("Cannot start batch: " + submitted.message);
    }
    
    interrupted = false;
    auto previous = std::signal(SIGINT, handle_interrupt);
    
    transfer::BatchSummary summary;
    bool cancel_sent = false;
    while (!scheduler.wait(handle, std::chrono::milliseconds(250), summary)) {
        if (interrupted && !cancel_sent) {
            std::cout << "Cancelling; partial files are kept for the next run\n";
            auto cancelled = scheduler.cancel(handle);
            if (!cancelled) {
                LOG_ERROR("Cancel failed: {}", cancelled.message);
            }
            cancel_sent = true;
        }
    }
    
    std::signal(SIGINT, previous == SIG_ERR ? SIG_DFL : previous);
    
    std::vector<transfer::TransferState> states;
    auto drained = scheduler.drain(handle, states);
    if (!drained) {
        LOG_WARN("Cannot drain batch {}: {}", handle, drained.message);
    }
    
    std::cout << "\nBatch " << handle << " finished in "
              << utils::StringUtils::format_duration(summary.elapsed) << "\n";
    std::cout << "  Completed: " << summary.completed << "\n";
    std::cout << "  Skipped:   " << summary.skipped << "\n";
    std::cout << "  Failed:    " << summary.failed << "\n";
    std::cout << "  Cancelled: " << summary.cancelled << "\n";
    std::cout << "  Received:  " << utils::StringUtils::format_bytes(summary.bytes_transferred)
              << " (" << utils::StringUtils::format_rate(summary.bytes_transferred, summary.elapsed) << ")\n";
    
    for (const auto& state : states) {
        if (state.status == transfer::TransferStatus::FAILED && state.last_error) {
            std::cout << "  ✗ " << state.descriptor_id << ": " << state.last_error->message << "\n";
        }
    }
    
    if (summary.failed > 0) {
        return CommandResult::error(std::to_string(summary.failed) + " items failed", 2);
    }
    return CommandResult::ok();
}

// PlanCommandHandler Implementation
CommandResult PlanCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::usage("Usage: " + get_usage());
    }
    
    std::vector<transfer::TransferDescriptor> descriptors;
    auto loaded = transfer::Manifest::load(args[1], descriptors);
    if (!loaded) {
        return CommandResult::error(loaded.message);
    }
    
    auto storage_config = storage::StorageConfig::from_config(Config::instance());
    storage_config.check_free_space = false;
    storage::ResumeGate gate(storage_config);
    
    for (const auto& descriptor : descriptors) {
        // Assume ranged fetch; the fetch itself restarts kinds that lack it
        auto decision = gate.evaluate(descriptor, true);
        
        std::cout << std::setw(8) << std::left << storage::to_string(decision.verdict)
                  << std::setw(12) << descriptor.id
                  << descriptor.destination_path.string();
        if (decision.verdict == storage::GateVerdict::RESUME) {
            std::cout << " from " << utils::StringUtils::format_bytes(decision.start_offset);
        }
        std::cout << " (" << decision.reason << ")\n";
    }
    
    return CommandResult::ok();
}

// PresetsCommandHandler Implementation
CommandResult PresetsCommandHandler::execute(const std::vector<std::string>&) {
    auto active = transfer::PerformanceProfile::from_config(Config::instance());
    
    std::cout << "Performance presets:\n";
    for (const auto& preset : transfer::PerformanceProfile::presets()) {
        std::cout << "  " << (preset.preset == active.preset ? "* " : "  ") << preset.describe() << "\n";
    }
    
    if (active.preset == transfer::ProfilePreset::CUSTOM) {
        std::cout << "  * " << active.describe() << "\n";
    }
    
    return CommandResult::ok();
}

// HistoryCommandHandler Implementation
CommandResult HistoryCommandHandler::execute(const std::vector<std::string>& args) {
    size_t limit = 20;
    if (args.size() > 1) {
        const auto& text = args[1];
        auto result = std::from_chars(text.data(), text.data() + text.size(), limit);
        if (result.ec != std::errc() || result.ptr != text.data() + text.size() || limit == 0) {
            return CommandResult::usage("Invalid limit: " + text);
        }
    }
    
    auto storage_config = storage::StorageConfig::from_config(Config::instance());
    if (!utils::FileUtils::exists(storage_config.history_database)) {
        std::cout << "No transfer history at " << storage_config.history_database.string() << "\n";
        return CommandResult::ok();
    }
    
    storage::HistoryStore history(storage_config.history_database);
    if (!history.initialize()) {
        return CommandResult::error("Cannot open " + storage_config.history_database.string());
    }
    
    auto records = history.list_recent(limit);
    std::cout << "Last " << records.size() << " of " << history.count() << " recorded transfers:\n";
    
    for (const auto& record : records) {
        std::cout << "  " << utils::TimeUtils::format_timestamp(record.finished_at) << "  "
                  << std::setw(10) << std::left << transfer::to_string(record.status)
                  << record.channel_ref << "/" << record.item_id << "  "
                  << utils::StringUtils::format_bytes(record.bytes_transferred) << "  "
                  << record.destination_path;
        if (!record.error.empty()) {
            std::cout << "  (" << record.error << ")";
        }
        std::cout << "\n";
    }
    
    return CommandResult::ok();
}

}
