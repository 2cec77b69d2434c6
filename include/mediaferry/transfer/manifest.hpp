#pragma once

#include "transfer_types.hpp"
#include <filesystem>
#include <istream>
#include <vector>

namespace mediaferry::transfer {

// Line-oriented batch description:
//
//   # item_id  kind   channel_ref  destination          [expected_size]
//   2436       audio  lofi_beats   music/               4194304
//   2437       photo  lofi_beats   covers/2437.jpg
//
// A destination ending in '/' or naming an existing directory receives the
// kind's default file name. Relative destinations resolve against the
// manifest's directory.
class Manifest {
public:
    static TransferResult parse(std::istream& input,
                                const std::filesystem::path& base_directory,
                                std::vector<TransferDescriptor>& descriptors);
    
    static TransferResult load(const std::filesystem::path& path,
                               std::vector<TransferDescriptor>& descriptors);
};

} // namespace mediaferry::transfer
