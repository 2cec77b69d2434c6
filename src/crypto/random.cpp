#include "mediaferry/crypto/random.hpp"
#include "mediaferry/core/logger.hpp"
#include "mediaferry/core/utils.hpp"
#include <sodium.h>
#include <stdexcept>
#include <vector>

namespace mediaferry::crypto {

std::atomic<bool> SecureRandom::initialized_{false};

bool SecureRandom::initialize() {
    if (initialized_.load()) {
        return true;
    }
    
    // sodium_init may run more than once
    if (sodium_init() < 0) {
        LOG_ERROR("Failed to initialize libsodium");
        return false;
    }
    
    if (!initialized_.exchange(true)) {
        LOG_DEBUG("libsodium initialized");
    }
    return true;
}

void SecureRandom::generate_bytes(std::span<std::uint8_t> output) {
    if (!initialize()) {
        throw std::runtime_error("libsodium unavailable");
    }
    randombytes_buf(output.data(), output.size());
}

std::string SecureRandom::generate_hex(size_t bytes) {
    std::vector<std::uint8_t> buffer(bytes);
    generate_bytes(std::span(buffer));
    return core::utils::StringUtils::to_hex(buffer.data(), buffer.size());
}

}
