#include "mediaferry/remote/filesystem_remote_client.hpp"
#include "mediaferry/core/logger.hpp"
#include <fstream>

namespace mediaferry::remote {

namespace {

class FileStream : public RemoteStream {
public:
    FileStream(const std::filesystem::path& path, uint64_t offset, int64_t size)
        : file_(path, std::ios::binary)
        , size_(size)
    {
        file_.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    }
    
    bool is_open() const { return file_.is_open() && file_.good(); }
    
    RemoteResult read(size_t max_bytes, std::vector<uint8_t>& out) override {
        out.resize(max_bytes);
        file_.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(max_bytes));
        auto bytes_read = file_.gcount();
        out.resize(static_cast<size_t>(bytes_read));
        
        if (bytes_read > 0) {
            return RemoteResult::ok();
        }
        if (file_.eof()) {
            return RemoteResult::end_of_data();
        }
        return RemoteResult::transient("read failed");
    }
    
    int64_t reported_size() const override { return size_; }
    
private:
    std::ifstream file_;
    int64_t size_;
};

}

const char* to_string(RemoteStatus status) {
    switch (status) {
        case RemoteStatus::OK: return "ok";
        case RemoteStatus::END_OF_DATA: return "end_of_data";
        case RemoteStatus::RATE_LIMITED: return "rate_limited";
        case RemoteStatus::TRANSIENT_FAILURE: return "transient_failure";
        case RemoteStatus::PERMANENT_FAILURE: return "permanent_failure";
    }
    return "unknown";
}

FilesystemRemoteClient::FilesystemRemoteClient(const std::filesystem::path& root)
    : root_(root)
    , streams_opened_(0)
{
}

RemoteResult FilesystemRemoteClient::open_ranged_stream(const std::string& channel_ref,
                                                        int64_t item_id,
                                                        uint64_t start_offset,
                                                        std::unique_ptr<RemoteStream>& stream) {
    auto path = item_path(channel_ref, item_id);
    
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return RemoteResult::permanent("item " + std::to_string(item_id) + " not found in " + channel_ref);
    }
    
    if (start_offset > size) {
        return RemoteResult::permanent("offset " + std::to_string(start_offset) + " beyond item size");
    }
    
    auto file_stream = std::make_unique<FileStream>(path, start_offset, static_cast<int64_t>(size));
    if (!file_stream->is_open()) {
        return RemoteResult::transient("cannot open " + path.string());
    }
    
    {
        std::lock_guard<std::mutex> lock(mutex_);
        streams_opened_++;
    }
    
    LOG_TRACE("Opened {} at offset {}", path.string(), start_offset);
    stream = std::move(file_stream);
    return RemoteResult::ok();
}

bool FilesystemRemoteClient::supports_ranged_fetch(transfer::MediaKind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return unranged_kinds_.find(kind) == unranged_kinds_.end();
}

void FilesystemRemoteClient::set_ranged_fetch(transfer::MediaKind kind, bool supported) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (supported) {
        unranged_kinds_.erase(kind);
    } else {
        unranged_kinds_.insert(kind);
    }
}

std::filesystem::path FilesystemRemoteClient::item_path(const std::string& channel_ref, int64_t item_id) const {
    return root_ / channel_ref / std::to_string(item_id);
}

uint64_t FilesystemRemoteClient::streams_opened() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return streams_opened_;
}

} // namespace mediaferry::remote
