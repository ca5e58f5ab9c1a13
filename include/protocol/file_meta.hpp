#pragma once

#include <string>
#include <cstdint>
#include <chrono>
#include <nlohmann/json.hpp>

namespace protocol {

// One regular file as observed by a catalog query.
struct FileRecord {
    std::string id;          // hyphenated 128-bit path identifier
    std::string name;
    std::string path;
    uint64_t size = 0;
    std::string size_human;
    std::chrono::system_clock::time_point modified;
    std::string mime_type;
};

// RFC 3339, UTC, 'Z' suffix, 0/3/6/9 fractional digits as needed.
std::string format_timestamp(std::chrono::system_clock::time_point tp);

void to_json(nlohmann::json& j, const FileRecord& record);

} // namespace protocol
