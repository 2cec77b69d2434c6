#pragma once

#include "mediaferry/remote/remote_client.hpp"
#include <gmock/gmock.h>

namespace mediaferry::test {

class MockRemoteClient : public remote::RemoteClient {
public:
    MOCK_METHOD(remote::RemoteResult, open_ranged_stream,
                (const std::string& channel_ref, int64_t item_id, uint64_t start_offset,
                 std::unique_ptr<remote::RemoteStream>& stream),
                (override));
    MOCK_METHOD(bool, supports_ranged_fetch, (transfer::MediaKind kind), (const, override));
};

} // namespace mediaferry::test
