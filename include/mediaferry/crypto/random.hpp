#pragma once

#include <atomic>
#include <cstdint>
#include <span>
#include <string>

namespace mediaferry::crypto {

class SecureRandom {
public:
    static bool initialize();
    
    static void generate_bytes(std::span<std::uint8_t> output);
    
    // Lowercase hex of `bytes` random bytes
    static std::string generate_hex(size_t bytes);
    
private:
    static std::atomic<bool> initialized_;
};

}
