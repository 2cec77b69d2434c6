#pragma once

#include "remote_client.hpp"
#include <filesystem>
#include <mutex>
#include <set>

namespace mediaferry::remote {

// Serves items from <root>/<channel_ref>/<item_id>. Used as the reference
// collaborator by the command line tool and the integration tests.
class FilesystemRemoteClient : public RemoteClient {
public:
    explicit FilesystemRemoteClient(const std::filesystem::path& root);
    
    RemoteResult open_ranged_stream(const std::string& channel_ref,
                                    int64_t item_id,
                                    uint64_t start_offset,
                                    std::unique_ptr<RemoteStream>& stream) override;
    
    bool supports_ranged_fetch(transfer::MediaKind kind) const override;
    
    void set_ranged_fetch(transfer::MediaKind kind, bool supported);
    
    std::filesystem::path item_path(const std::string& channel_ref, int64_t item_id) const;
    
    uint64_t streams_opened() const;
    
private:
    std::filesystem::path root_;
    std::set<transfer::MediaKind> unranged_kinds_;
    uint64_t streams_opened_;
    mutable std::mutex mutex_;
};

} // namespace mediaferry::remote
