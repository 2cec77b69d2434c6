#pragma once

#include "storage_config.hpp"
#include "../transfer/transfer_types.hpp"
#include <cstdint>
#include <filesystem>
#include <string>

namespace mediaferry::storage {

enum class GateVerdict {
    SKIP,    // destination already holds the item
    RESUME,  // continue from the partial file's length
    FRESH,   // fetch from offset 0
    REJECT   // destination unusable; fail the descriptor
};

const char* to_string(GateVerdict verdict);

struct GateDecision {
    GateVerdict verdict = GateVerdict::FRESH;
    uint64_t start_offset = 0;
    std::string reason;
    transfer::TransferResult error;
};

// Decides per descriptor whether to skip, resume or restart by looking only
// at the filesystem. The partial file is the one durable resume anchor.
class ResumeGate {
public:
    explicit ResumeGate(const StorageConfig& config);
    
    // Creates the destination directory as a side effect. Never touches a
    // destination file whose size already satisfies the descriptor.
    GateDecision evaluate(const transfer::TransferDescriptor& descriptor, bool ranged_supported) const;
    
    std::filesystem::path partial_path(const transfer::TransferDescriptor& descriptor) const;
    
private:
    StorageConfig config_;
    
    GateDecision decide_partial(const transfer::TransferDescriptor& descriptor,
                                const std::filesystem::path& partial,
                                bool ranged_supported) const;
    GateDecision check_space(const transfer::TransferDescriptor& descriptor, GateDecision decision) const;
};

} // namespace mediaferry::storage
