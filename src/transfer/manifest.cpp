#include "mediaferry/transfer/manifest.hpp"
#include "mediaferry/core/utils.hpp"
#include <charconv>
#include <fstream>

namespace mediaferry::transfer {

namespace {

template<typename T>
bool parse_number(const std::string& text, T& value) {
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    return result.ec == std::errc() && result.ptr == text.data() + text.size();
}

}

TransferResult Manifest::parse(std::istream& input,
                               const std::filesystem::path& base_directory,
                               std::vector<TransferDescriptor>& descriptors) {
    using core::utils::StringUtils;
    
    std::vector<TransferDescriptor> parsed;
    std::string line;
    size_t line_number = 0;
    
    while (std::getline(input, line)) {
        line_number++;
        
        auto comment = line.find('#');
        if (comment != std::string::npos) {
            line.erase(comment);
        }
        
        auto fields = StringUtils::split_whitespace(line);
        if (fields.empty()) {
            continue;
        }
        
        auto error = [line_number](const std::string& message) {
            return TransferResult(TransferError::INVALID_DESCRIPTOR,
                                  "line " + std::to_string(line_number) + ": " + message);
        };
        
        if (fields.size() < 4 || fields.size() > 5) {
            return error("expected 'item_id kind channel_ref destination [expected_size]'");
        }
        
        TransferDescriptor descriptor;
        
        if (!parse_number(fields[0], descriptor.id) || descriptor.id < 0) {
            return error("invalid item id '" + fields[0] + "'");
        }
        
        auto kind = parse_media_kind(fields[1]);
        if (!kind) {
            return error("unknown media kind '" + fields[1] + "'");
        }
        descriptor.media_kind = *kind;
        descriptor.channel_ref = fields[2];
        
        if (fields.size() == 5) {
            if (!parse_number(fields[4], descriptor.expected_size) || descriptor.expected_size < UNKNOWN_SIZE) {
                return error("invalid expected size '" + fields[4] + "'");
            }
        }
        
        std::filesystem::path destination = core::utils::FileUtils::expand_home(fields[3]);
        if (destination.is_relative()) {
            destination = base_directory / destination;
        }
        
        if (StringUtils::ends_with(fields[3], "/") || core::utils::FileUtils::is_directory(destination)) {
            destination /= default_file_name(descriptor.media_kind, descriptor.id);
        }
        descriptor.destination_path = destination.lexically_normal();
        
        parsed.push_back(std::move(descriptor));
    }
    
    descriptors = std::move(parsed);
    return TransferResult();
}

TransferResult Manifest::load(const std::filesystem::path& path, std::vector<TransferDescriptor>& descriptors) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return TransferResult(TransferError::NOT_FOUND, "Cannot open manifest " + path.string());
    }
    
    auto base = path.parent_path();
    if (base.empty()) {
        base = ".";
    }
    
    auto result = parse(file, base, descriptors);
    if (!result) {
        result.message = path.string() + ": " + result.message;
    }
    return result;
}

} // namespace mediaferry::transfer
