#pragma once

#include "../transfer/transfer_error.hpp"
#include <array>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string>

namespace mediaferry::crypto {

constexpr size_t DIGEST_SIZE = 32;

using Digest = std::array<std::uint8_t, DIGEST_SIZE>;

// Streaming BLAKE2b-256 over completed downloads
class FileDigest {
public:
    FileDigest();
    ~FileDigest();
    
    FileDigest(const FileDigest&) = delete;
    FileDigest& operator=(const FileDigest&) = delete;
    
    transfer::TransferResult update(std::span<const std::uint8_t> data);
    transfer::TransferResult finalize(Digest& output);
    
    static Digest hash(std::span<const std::uint8_t> data);
    static transfer::TransferResult hash_file(const std::filesystem::path& path, std::string& hex_out);
    static std::string to_hex(const Digest& digest);
    
private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    bool finalized_;
};

}
