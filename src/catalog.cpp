#include "catalog.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <system_error>
#include <unordered_map>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace catalog {

namespace {

inline uint64_t rotl(uint64_t x, int b) {
    return (x << b) | (x >> (64 - b));
}

struct SipState {
    uint64_t v0 = 0x736f6d6570736575ULL;
    uint64_t v1 = 0x646f72616e646f6dULL;
    uint64_t v2 = 0x6c7967656e657261ULL;
    uint64_t v3 = 0x7465646279746573ULL;

    void round() {
        v0 += v1; v1 = rotl(v1, 13); v1 ^= v0; v0 = rotl(v0, 32);
        v2 += v3; v3 = rotl(v3, 16); v3 ^= v2;
        v0 += v3; v3 = rotl(v3, 21); v3 ^= v0;
        v2 += v1; v1 = rotl(v1, 17); v1 ^= v2; v2 = rotl(v2, 32);
    }

    void compress(uint64_t m) {
        v3 ^= m;
        round();
        v0 ^= m;
    }
};

const std::unordered_map<std::string, std::string>& mime_table() {
    static const std::unordered_map<std::string, std::string> table = {
        {"txt", "text/plain"}, {"text", "text/plain"}, {"log", "text/plain"},
        {"md", "text/markdown"}, {"csv", "text/csv"}, {"tsv", "text/tab-separated-values"},
        {"html", "text/html"}, {"htm", "text/html"}, {"css", "text/css"},
        {"js", "application/javascript"}, {"mjs", "application/javascript"},
        {"json", "application/json"}, {"xml", "text/xml"},
        {"yaml", "text/x-yaml"}, {"yml", "text/x-yaml"},
        {"ics", "text/calendar"}, {"vcf", "text/vcard"},
        {"png", "image/png"}, {"jpg", "image/jpeg"}, {"jpeg", "image/jpeg"},
        {"gif", "image/gif"}, {"bmp", "image/bmp"}, {"webp", "image/webp"},
        {"svg", "image/svg+xml"}, {"ico", "image/x-icon"}, {"tif", "image/tiff"},
        {"tiff", "image/tiff"}, {"heic", "image/heic"}, {"avif", "image/avif"},
        {"mp3", "audio/mpeg"}, {"wav", "audio/wav"}, {"ogg", "audio/ogg"},
        {"flac", "audio/flac"}, {"m4a", "audio/m4a"}, {"aac", "audio/aac"},
        {"opus", "audio/opus"},
        {"mp4", "video/mp4"}, {"m4v", "video/mp4"}, {"webm", "video/webm"},
        {"mkv", "video/x-matroska"}, {"mov", "video/quicktime"}, {"avi", "video/x-msvideo"},
        {"pdf", "application/pdf"}, {"zip", "application/zip"},
        {"gz", "application/gzip"}, {"tar", "application/x-tar"},
        {"7z", "application/x-7z-compressed"}, {"rar", "application/vnd.rar"},
        {"bz2", "application/x-bzip2"}, {"xz", "application/x-xz"},
        {"doc", "application/msword"},
        {"docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
        {"xls", "application/vnd.ms-excel"},
        {"xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
        {"ppt", "application/vnd.ms-powerpoint"},
        {"pptx", "application/vnd.openxmlformats-officedocument.presentationml.presentation"},
        {"odt", "application/vnd.oasis.opendocument.text"},
        {"epub", "application/epub+zip"}, {"apk", "application/vnd.android.package-archive"},
        {"wasm", "application/wasm"},
        {"woff", "font/woff"}, {"woff2", "font/woff2"}, {"ttf", "font/ttf"}, {"otf", "font/otf"},
    };
    return table;
}

} // namespace

uint64_t hash_path(const std::string& path) {
    // str hashing appends a 0xFF terminator to the byte stream
    std::string data = path;
    data.push_back(static_cast<char>(0xFF));

    SipState s;
    const auto* bytes = reinterpret_cast<const uint8_t*>(data.data());
    const size_t len = data.size();
    const size_t tail = len & 7;

    for (size_t i = 0; i + 8 <= len; i += 8) {
        uint64_t m = 0;
        for (int b = 0; b < 8; ++b) {
            m |= static_cast<uint64_t>(bytes[i + b]) << (8 * b);
        }
        s.compress(m);
    }

    uint64_t last = static_cast<uint64_t>(len & 0xff) << 56;
    for (size_t b = 0; b < tail; ++b) {
        last |= static_cast<uint64_t>(bytes[len - tail + b]) << (8 * b);
    }
    s.compress(last);

    s.v2 ^= 0xff;
    s.round();
    s.round();
    s.round();
    return s.v0 ^ s.v1 ^ s.v2 ^ s.v3;
}

FileId file_id(const std::string& path) {
    uint64_t hash = hash_path(path);
    FileId id{};
    for (int i = 0; i < 8; ++i) {
        id[i] = static_cast<uint8_t>(hash >> (56 - 8 * i));
    }
    return id;
}

std::string format_id(const FileId& id) {
    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(36);
    for (size_t i = 0; i < id.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) out.push_back('-');
        out.push_back(hex[id[i] >> 4]);
        out.push_back(hex[id[i] & 0x0f]);
    }
    return out;
}

std::string format_size(uint64_t bytes) {
    if (bytes < 1024) {
        return std::to_string(bytes) + " B";
    }

    const char* units[] = {"KiB", "MiB", "GiB", "TiB", "PiB", "EiB"};
    double size = static_cast<double>(bytes) / 1024.0;
    int i = 0;
    while (size >= 1024.0 && i < 5) {
        size /= 1024.0;
        i++;
    }

    char buf[32];
    if (size == static_cast<double>(static_cast<uint64_t>(size))) {
        snprintf(buf, sizeof(buf), "%.0f %s", size, units[i]);
    } else {
        snprintf(buf, sizeof(buf), "%.2f %s", size, units[i]);
    }
    return std::string(buf);
}

std::string mime_type_for(const fs::path& path) {
    std::string ext = path.extension().string();
    if (ext.size() < 2) {
        return "application/octet-stream";
    }
    ext.erase(0, 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    const auto& table = mime_table();
    auto it = table.find(ext);
    if (it != table.end()) return it->second;
    return "application/octet-stream";
}

protocol::FileRecord describe(const fs::path& path) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) {
        throw NotFound("cannot stat " + path.string() + ": " + std::strerror(errno));
    }
    if (!S_ISREG(st.st_mode)) {
        throw NotFound("not a regular file: " + path.string());
    }

    protocol::FileRecord record;
    const std::string path_str = path.string();
    record.id = format_id(file_id(path_str));
    record.name = path.filename().string();
    if (record.name.empty()) record.name = "unknown";
    record.path = path_str;
    record.size = static_cast<uint64_t>(st.st_size);
    record.size_human = format_size(record.size);
    record.modified = std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::seconds(st.st_mtim.tv_sec) +
            std::chrono::nanoseconds(st.st_mtim.tv_nsec)));
    record.mime_type = mime_type_for(path);
    return record;
}

std::vector<protocol::FileRecord> list(const fs::path& directory) {
    std::vector<protocol::FileRecord> files;

    std::error_code ec;
    if (!fs::exists(directory, ec)) {
        return files;
    }

    fs::directory_iterator it(directory, ec);
    if (ec) {
        throw CatalogError("cannot read directory " + directory.string() + ": " + ec.message());
    }

    for (fs::directory_iterator end; it != end;) {
        std::error_code status_ec;
        bool regular = it->is_regular_file(status_ec) && !it->is_symlink(status_ec);

        if (regular) {
            try {
                files.push_back(describe(it->path()));
            } catch (const NotFound&) {
                // removed between enumeration and stat
            }
        }

        it.increment(ec);
        if (ec) {
            throw CatalogError("cannot read directory " + directory.string() + ": " + ec.message());
        }
    }

    std::sort(files.begin(), files.end(),
              [](const protocol::FileRecord& a, const protocol::FileRecord& b) {
                  return a.name < b.name;
              });
    return files;
}

} // namespace catalog
