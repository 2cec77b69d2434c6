#pragma once

#include "../transfer/transfer_error.hpp"
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <vector>

namespace mediaferry::storage {

// Buffered writer for an in-progress download. Bytes go to the partial
// path; commit() renames it onto the final path so the final name only
// ever holds a complete file.
class PartialFileWriter {
public:
    PartialFileWriter(const std::filesystem::path& final_path,
                      const std::filesystem::path& partial_path,
                      size_t buffer_size);
    ~PartialFileWriter();
    
    PartialFileWriter(const PartialFileWriter&) = delete;
    PartialFileWriter& operator=(const PartialFileWriter&) = delete;
    
    // Cuts the partial file to start_offset and positions at its end. The
    // partial file must already hold at least start_offset bytes.
    transfer::TransferResult open(uint64_t start_offset);
    
    transfer::TransferResult append(const uint8_t* data, size_t size);
    transfer::TransferResult append(const std::vector<uint8_t>& data) { return append(data.data(), data.size()); }
    
    transfer::TransferResult flush();
    
    // Drops everything written so far and starts again at offset 0
    transfer::TransferResult restart();
    
    transfer::TransferResult commit();
    
    // Flushes and closes without renaming; the partial file stays for resume
    transfer::TransferResult park();
    
    // Closes and deletes the partial file
    transfer::TransferResult discard();
    
    uint64_t offset() const { return offset_; }
    uint64_t bytes_on_disk() const { return offset_ - buffer_.size(); }
    size_t buffered() const { return buffer_.size(); }
    uint64_t flush_count() const { return flush_count_; }
    bool is_open() const { return file_.is_open(); }
    
    const std::filesystem::path& partial_path() const { return partial_path_; }
    const std::filesystem::path& final_path() const { return final_path_; }
    
private:
    std::filesystem::path final_path_;
    std::filesystem::path partial_path_;
    size_t buffer_size_;
    std::vector<uint8_t> buffer_;
    std::ofstream file_;
    uint64_t offset_;
    uint64_t flush_count_;
};

} // namespace mediaferry::storage
