#pragma once

#include <string>

namespace mediaferry::transfer {

enum class TransferError {
    SUCCESS = 0,
    RATE_LIMITED,
    TRANSIENT_NETWORK,
    DESTINATION_WRITE,
    SIZE_MISMATCH,
    CANCELLED,
    REMOTE_FAILURE,
    INVALID_DESCRIPTOR,
    INVALID_PROFILE,
    INVALID_STATE,
    NOT_FOUND
};

struct TransferResult {
    TransferError error;
    std::string message;
    
    TransferResult(TransferError err = TransferError::SUCCESS, std::string msg = "")
        : error(err), message(std::move(msg)) {}
    
    bool success() const { return error == TransferError::SUCCESS; }
    operator bool() const { return success(); }
};

const char* to_string(TransferError error);

} // namespace mediaferry::transfer
