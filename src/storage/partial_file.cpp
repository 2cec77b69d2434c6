#include "mediaferry/storage/partial_file.hpp"
#include "mediaferry/core/logger.hpp"

namespace mediaferry::storage {

using transfer::TransferError;
using transfer::TransferResult;

PartialFileWriter::PartialFileWriter(const std::filesystem::path& final_path,
                                     const std::filesystem::path& partial_path,
                                     size_t buffer_size)
    : final_path_(final_path)
    , partial_path_(partial_path)
    , buffer_size_(buffer_size == 0 ? 1 : buffer_size)
    , offset_(0)
    , flush_count_(0)
{
    buffer_.reserve(buffer_size_);
}

PartialFileWriter::~PartialFileWriter() {
    if (file_.is_open()) {
        auto result = park();
        if (!result) {
            LOG_ERROR("Failed to park {}: {}", partial_path_.string(), result.message);
        }
    }
}

TransferResult PartialFileWriter::open(uint64_t start_offset) {
    if (file_.is_open()) {
        file_.close();
    }
    buffer_.clear();
    
    std::error_code ec;
    auto parent = partial_path_.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return TransferResult(TransferError::DESTINATION_WRITE,
                                  "Cannot create " + parent.string() + ": " + ec.message());
        }
    }
    
    bool exists = std::filesystem::exists(partial_path_, ec);
    uint64_t existing = exists ? std::filesystem::file_size(partial_path_, ec) : 0;
    if (ec) {
        return TransferResult(TransferError::DESTINATION_WRITE,
                              "Cannot stat " + partial_path_.string() + ": " + ec.message());
    }
    
    if (start_offset > existing) {
        return TransferResult(TransferError::INVALID_STATE,
                              "Resume offset " + std::to_string(start_offset) +
                              " beyond partial size " + std::to_string(existing));
    }
    
    if (start_offset == 0) {
        file_.open(partial_path_, std::ios::binary | std::ios::trunc);
    } else {
        if (existing > start_offset) {
            std::filesystem::resize_file(partial_path_, start_offset, ec);
            if (ec) {
                return TransferResult(TransferError::DESTINATION_WRITE,
                                      "Cannot truncate " + partial_path_.string() + ": " + ec.message());
            }
        }
        file_.open(partial_path_, std::ios::binary | std::ios::app);
    }
    
    if (!file_.is_open()) {
        return TransferResult(TransferError::DESTINATION_WRITE, "Cannot open " + partial_path_.string());
    }
    
    offset_ = start_offset;
    return TransferResult();
}

TransferResult PartialFileWriter::append(const uint8_t* data, size_t size) {
    if (!file_.is_open()) {
        return TransferResult(TransferError::INVALID_STATE, "Partial file is not open");
    }
    
    buffer_.insert(buffer_.end(), data, data + size);
    offset_ += size;
    
    if (buffer_.size() >= buffer_size_) {
        return flush();
    }
    
    return TransferResult();
}

TransferResult PartialFileWriter::flush() {
    if (!file_.is_open()) {
        return TransferResult(TransferError::INVALID_STATE, "Partial file is not open");
    }
    
    if (!buffer_.empty()) {
        file_.write(reinterpret_cast<const char*>(buffer_.data()),
                    static_cast<std::streamsize>(buffer_.size()));
        buffer_.clear();
        flush_count_++;
    }
    file_.flush();
    
    if (!file_.good()) {
        return TransferResult(TransferError::DESTINATION_WRITE, "Write failed on " + partial_path_.string());
    }
    
    return TransferResult();
}

TransferResult PartialFileWriter::restart() {
    return open(0);
}

TransferResult PartialFileWriter::commit() {
    auto result = flush();
    if (!result) {
        return result;
    }
    
    file_.close();
    if (file_.fail()) {
        return TransferResult(TransferError::DESTINATION_WRITE, "Close failed on " + partial_path_.string());
    }
    
    std::error_code ec;
    std::filesystem::rename(partial_path_, final_path_, ec);
    if (ec) {
        return TransferResult(TransferError::DESTINATION_WRITE,
                              "Cannot move " + partial_path_.string() + " to " +
                              final_path_.string() + ": " + ec.message());
    }
    
    LOG_DEBUG("Committed {} ({} bytes)", final_path_.string(), offset_);
    return TransferResult();
}

TransferResult PartialFileWriter::park() {
    if (!file_.is_open()) {
        return TransferResult();
    }
    
    auto result = flush();
    file_.close();
    return result;
}

TransferResult PartialFileWriter::discard() {
    if (file_.is_open()) {
        file_.close();
    }
    buffer_.clear();
    offset_ = 0;
    
    std::error_code ec;
    std::filesystem::remove(partial_path_, ec);
    if (ec) {
        return TransferResult(TransferError::DESTINATION_WRITE,
                              "Cannot remove " + partial_path_.string() + ": " + ec.message());
    }
    return TransferResult();
}

} // namespace mediaferry::storage
