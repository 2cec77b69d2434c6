#include "mediaferry/crypto/file_digest.hpp"
#include "mediaferry/crypto/random.hpp"
#include "mediaferry/core/utils.hpp"
#include <sodium.h>
#include <fstream>
#include <stdexcept>
#include <vector>

namespace mediaferry::crypto {

using transfer::TransferError;
using transfer::TransferResult;

struct FileDigest::Impl {
    crypto_generichash_state state;
};

FileDigest::FileDigest()
    : impl_(std::make_unique<Impl>())
    , finalized_(false)
{
    if (!SecureRandom::initialize()) {
        throw std::runtime_error("libsodium unavailable");
    }
    crypto_generichash_init(&impl_->state, nullptr, 0, DIGEST_SIZE);
}

FileDigest::~FileDigest() = default;

TransferResult FileDigest::update(std::span<const std::uint8_t> data) {
    if (finalized_) {
        return TransferResult(TransferError::INVALID_STATE, "Digest already finalized");
    }
    
    if (crypto_generichash_update(&impl_->state, data.data(), data.size()) != 0) {
        return TransferResult(TransferError::INVALID_STATE, "Failed to update digest");
    }
    
    return TransferResult();
}

TransferResult FileDigest::finalize(Digest& output) {
    if (finalized_) {
        return TransferResult(TransferError::INVALID_STATE, "Digest already finalized");
    }
    
    if (crypto_generichash_final(&impl_->state, output.data(), output.size()) != 0) {
        return TransferResult(TransferError::INVALID_STATE, "Failed to finalize digest");
    }
    
    finalized_ = true;
    return TransferResult();
}

Digest FileDigest::hash(std::span<const std::uint8_t> data) {
    FileDigest digest;
    Digest output{};
    
    auto result = digest.update(data);
    if (result) {
        result = digest.finalize(output);
    }
    if (!result) {
        throw std::runtime_error("Digest failed: " + result.message);
    }
    return output;
}

TransferResult FileDigest::hash_file(const std::filesystem::path& path, std::string& hex_out) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return TransferResult(TransferError::NOT_FOUND, "Cannot open " + path.string());
    }
    
    FileDigest digest;
    std::vector<std::uint8_t> buffer(64 * 1024);
    
    while (file) {
        file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        auto bytes_read = file.gcount();
        if (bytes_read > 0) {
            auto result = digest.update(std::span<const std::uint8_t>(buffer.data(), static_cast<size_t>(bytes_read)));
            if (!result) {
                return result;
            }
        }
    }
    
    if (file.bad()) {
        return TransferResult(TransferError::DESTINATION_WRITE, "Read error on " + path.string());
    }
    
    Digest output{};
    auto result = digest.finalize(output);
    if (!result) {
        return result;
    }
    
    hex_out = to_hex(output);
    return TransferResult();
}

std::string FileDigest::to_hex(const Digest& digest) {
    return core::utils::StringUtils::to_hex(digest.data(), digest.size());
}

}
