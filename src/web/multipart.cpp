#include "web/multipart.hpp"
#include <algorithm>
#include <cctype>

namespace web {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

// Value of `param` in a header such as: form-data; name="file"; filename="a.txt"
std::optional<std::string> header_param(const std::string& header, const std::string& param) {
    size_t pos = 0;
    while (pos < header.size()) {
        size_t semi = header.find(';', pos);
        if (semi == std::string::npos) semi = header.size();

        // quoted values may contain ';'
        size_t eq = header.find('=', pos);
        if (eq != std::string::npos && eq < semi) {
            std::string key = lower(trim(header.substr(pos, eq - pos)));
            size_t value_start = eq + 1;
            while (value_start < header.size() && header[value_start] == ' ') ++value_start;

            std::string value;
            size_t next;
            if (value_start < header.size() && header[value_start] == '"') {
                size_t i = value_start + 1;
                while (i < header.size() && header[i] != '"') {
                    if (header[i] == '\\' && i + 1 < header.size()) ++i;
                    value.push_back(header[i]);
                    ++i;
                }
                next = header.find(';', i);
            } else {
                value = trim(header.substr(value_start, semi - value_start));
                next = semi;
            }

            if (key == param) return value;
            if (next == std::string::npos) break;
            pos = next + 1;
        } else {
            pos = semi + 1;
        }
    }
    return std::nullopt;
}

} // namespace

std::string extract_boundary(const std::string& content_type) {
    std::string media = lower(trim(content_type.substr(0, content_type.find(';'))));
    if (media != "multipart/form-data") {
        throw MultipartError("expected multipart/form-data, got '" + media + "'");
    }
    auto boundary = header_param(content_type, "boundary");
    if (!boundary || boundary->empty() || boundary->size() > 70) {
        throw MultipartError("missing or invalid multipart boundary");
    }
    return *boundary;
}

std::string sanitize_file_name(const std::string& raw) {
    size_t slash = raw.find_last_of("/\\");
    std::string name = (slash == std::string::npos) ? raw : raw.substr(slash + 1);
    if (name == "." || name == "..") return "";
    return name;
}

std::vector<MultipartPart> parse_multipart(const std::string& body, const std::string& boundary) {
    const std::string delimiter = "--" + boundary;
    std::vector<MultipartPart> parts;

    size_t pos = body.find(delimiter);
    if (pos == std::string::npos) {
        throw MultipartError("multipart boundary not found in body");
    }

    while (true) {
        pos += delimiter.size();
        if (body.compare(pos, 2, "--") == 0) {
            return parts;   // closing delimiter
        }
        if (body.compare(pos, 2, "\r\n") != 0) {
            throw MultipartError("malformed multipart delimiter line");
        }
        pos += 2;

        size_t headers_end = body.find("\r\n\r\n", pos);
        if (headers_end == std::string::npos) {
            throw MultipartError("unterminated part headers");
        }

        MultipartPart part;
        bool has_disposition = false;
        size_t line_start = pos;
        while (line_start < headers_end) {
            size_t line_end = body.find("\r\n", line_start);
            if (line_end == std::string::npos || line_end > headers_end) line_end = headers_end;
            std::string line = body.substr(line_start, line_end - line_start);
            line_start = line_end + 2;

            size_t colon = line.find(':');
            if (colon == std::string::npos) {
                throw MultipartError("malformed part header: " + line);
            }
            std::string name = lower(trim(line.substr(0, colon)));
            std::string value = trim(line.substr(colon + 1));

            if (name == "content-disposition") {
                has_disposition = true;
                part.field_name = header_param(value, "name").value_or("");
                if (auto file_name = header_param(value, "filename")) {
                    part.file_name = sanitize_file_name(*file_name);
                }
            } else if (name == "content-type") {
                part.content_type = value;
            }
        }
        if (!has_disposition) {
            throw MultipartError("part without Content-Disposition");
        }

        size_t data_start = headers_end + 4;
        size_t next = body.find("\r\n" + delimiter, data_start);
        if (next == std::string::npos) {
            throw MultipartError("missing closing multipart boundary");
        }
        part.data = body.substr(data_start, next - data_start);
        parts.push_back(std::move(part));

        pos = next + 2;
    }
}

} // namespace web
