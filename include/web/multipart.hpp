#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace web {

class MultipartError : public std::runtime_error {
public:
    explicit MultipartError(const std::string& what) : std::runtime_error(what) {}
};

struct MultipartPart {
    std::string field_name;
    std::optional<std::string> file_name;   // reduced to its final path segment
    std::string content_type;
    std::string data;
};

// Boundary parameter of a multipart/form-data Content-Type.
// Throws MultipartError if the type is not multipart/form-data or lacks one.
std::string extract_boundary(const std::string& content_type);

// Splits a multipart/form-data body. Throws MultipartError on malformed input.
std::vector<MultipartPart> parse_multipart(const std::string& body, const std::string& boundary);

// Strips directory components ("a/b\\c.txt" -> "c.txt"); "." and ".." become empty.
std::string sanitize_file_name(const std::string& raw);

} // namespace web
