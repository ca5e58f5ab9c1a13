#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>
#include "protocol/file_meta.hpp"

namespace catalog {

// The path does not exist, or is not a regular file, at call time.
class NotFound : public std::runtime_error {
public:
    explicit NotFound(const std::string& what) : std::runtime_error(what) {}
};

// An existing directory could not be enumerated.
class CatalogError : public std::runtime_error {
public:
    explicit CatalogError(const std::string& what) : std::runtime_error(what) {}
};

using FileId = std::array<uint8_t, 16>;

// SipHash-1-3, zero key, over the path bytes plus a 0xFF terminator.
uint64_t hash_path(const std::string& path);

// High 8 bytes carry the big-endian path hash, low 8 bytes are zero.
// Only 64 bits are effective; the layout is wire-visible and must not change.
FileId file_id(const std::string& path);

// Lower-case 8-4-4-4-12 rendering.
std::string format_id(const FileId& id);

// Binary units: "100 B", "1 KiB", "1.50 KiB".
std::string format_size(uint64_t bytes);

// Extension-based lookup; application/octet-stream when unknown.
std::string mime_type_for(const std::filesystem::path& path);

// Stats a single file. Throws NotFound if it is missing or not a regular file.
protocol::FileRecord describe(const std::filesystem::path& path);

// Direct regular-file children of `directory`, sorted by name. A missing
// directory yields an empty listing; entries that vanish mid-scan are dropped.
std::vector<protocol::FileRecord> list(const std::filesystem::path& directory);

} // namespace catalog
