#include "mediaferry/storage/resume_gate.hpp"
#include "mediaferry/core/logger.hpp"
#include "mediaferry/core/utils.hpp"

namespace mediaferry::storage {

using transfer::TransferError;
using transfer::TransferResult;

namespace {

GateDecision make_decision(GateVerdict verdict, uint64_t offset, std::string reason) {
    GateDecision decision;
    decision.verdict = verdict;
    decision.start_offset = offset;
    decision.reason = std::move(reason);
    return decision;
}

GateDecision reject(std::string message) {
    GateDecision decision;
    decision.verdict = GateVerdict::REJECT;
    decision.reason = message;
    decision.error = TransferResult(TransferError::DESTINATION_WRITE, std::move(message));
    return decision;
}

}

const char* to_string(GateVerdict verdict) {
    switch (verdict) {
        case GateVerdict::SKIP: return "skip";
        case GateVerdict::RESUME: return "resume";
        case GateVerdict::FRESH: return "fresh";
        case GateVerdict::REJECT: return "reject";
    }
    return "unknown";
}

ResumeGate::ResumeGate(const StorageConfig& config)
    : config_(config)
{
}

std::filesystem::path ResumeGate::partial_path(const transfer::TransferDescriptor& descriptor) const {
    return config_.partial_path(descriptor.destination_path);
}

GateDecision ResumeGate::evaluate(const transfer::TransferDescriptor& descriptor, bool ranged_supported) const {
    const auto& destination = descriptor.destination_path;
    if (destination.empty() || !destination.has_filename()) {
        return reject("Descriptor " + std::to_string(descriptor.id) + " has no destination file name");
    }
    
    auto parent = destination.parent_path();
    if (!parent.empty() && !core::utils::FileUtils::create_directories(parent)) {
        return reject("Cannot create destination directory " + parent.string());
    }
    
    std::error_code ec;
    auto destination_status = std::filesystem::status(destination, ec);
    
    if (std::filesystem::is_directory(destination_status)) {
        return reject("Destination " + destination.string() + " is a directory");
    }
    
    if (std::filesystem::is_regular_file(destination_status)) {
        if (!descriptor.has_known_size()) {
            return make_decision(GateVerdict::SKIP, 0, "exists, size unknown");
        }
        
        auto size = std::filesystem::file_size(destination, ec);
        if (!ec && size >= static_cast<uint64_t>(descriptor.expected_size)) {
            return make_decision(GateVerdict::SKIP, 0, "exists with " + std::to_string(size) + " bytes");
        }
        // Short final file: not one of ours, replaced on commit
    }
    
    auto partial = partial_path(descriptor);
    if (std::filesystem::is_regular_file(partial, ec)) {
        return check_space(descriptor, decide_partial(descriptor, partial, ranged_supported));
    }
    
    return check_space(descriptor, make_decision(GateVerdict::FRESH, 0, "no local copy"));
}

GateDecision ResumeGate::decide_partial(const transfer::TransferDescriptor& descriptor,
                                        const std::filesystem::path& partial,
                                        bool ranged_supported) const {
    std::error_code ec;
    auto size = std::filesystem::file_size(partial, ec);
    if (ec) {
        return reject("Cannot stat " + partial.string() + ": " + ec.message());
    }
    
    auto discard = [&](const std::string& reason) {
        std::error_code remove_ec;
        std::filesystem::remove(partial, remove_ec);
        if (remove_ec) {
            return reject("Cannot discard " + partial.string() + ": " + remove_ec.message());
        }
        return make_decision(GateVerdict::FRESH, 0, reason);
    };
    
    if (!descriptor.has_known_size()) {
        return discard("size unknown, partial discarded");
    }
    
    auto expected = static_cast<uint64_t>(descriptor.expected_size);
    
    if (size == 0) {
        return make_decision(GateVerdict::FRESH, 0, "empty partial");
    }
    
    if (size < expected) {
        if (!ranged_supported) {
            return discard("ranged fetch unsupported for " + std::string(transfer::to_string(descriptor.media_kind)));
        }
        return make_decision(GateVerdict::RESUME, size, "partial with " + std::to_string(size) + " bytes");
    }
    
    if (size == expected) {
        // Complete bytes that never got renamed
        std::filesystem::rename(partial, descriptor.destination_path, ec);
        if (ec) {
            return reject("Cannot finalize " + partial.string() + ": " + ec.message());
        }
        return make_decision(GateVerdict::SKIP, 0, "finalized complete partial");
    }
    
    return discard("partial larger than expected size");
}

GateDecision ResumeGate::check_space(const transfer::TransferDescriptor& descriptor, GateDecision decision) const {
    if (decision.verdict != GateVerdict::FRESH && decision.verdict != GateVerdict::RESUME) {
        return decision;
    }
    if (!descriptor.has_known_size()) {
        return decision;
    }
    
    auto expected = static_cast<uint64_t>(descriptor.expected_size);
    auto remaining = expected > decision.start_offset ? expected - decision.start_offset : 0;
    auto directory = descriptor.destination_path.parent_path();
    if (directory.empty()) {
        directory = ".";
    }
    
    if (!config_.has_sufficient_space(directory, remaining)) {
        return reject("Insufficient space in " + directory.string() + " for " +
                      core::utils::StringUtils::format_bytes(remaining));
    }
    
    return decision;
}

} // namespace mediaferry::storage
