#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <variant>
#include <vector>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>
#include "protocol/device_info.hpp"

namespace web {

namespace http = boost::beast::http;

using Request = http::request<http::string_body>;
using StringResponse = http::response<http::string_body>;
using FileResponse = http::response<http::file_body>;
using Response = std::variant<StringResponse, FileResponse>;

// Runs one bounded peer browse. May throw discovery::DiscoveryError.
using BrowseFn = std::function<std::vector<protocol::DeviceDescriptor>()>;

// Request handlers for the JSON API and the static fallback. Holds only
// read-only state, so one instance serves all connections concurrently.
class Api {
public:
    Api(std::filesystem::path directory,
        protocol::DeviceDescriptor device,
        BrowseFn browse,
        std::filesystem::path assets_dir = "assets");

    // Never throws for request-level problems; they become error responses.
    Response handle(const Request& request) const;

private:
    Response route(const Request& request, const std::string& path) const;

    StringResponse health(const Request& request) const;
    StringResponse device_info(const Request& request) const;
    StringResponse list_files(const Request& request) const;
    StringResponse upload_file(const Request& request) const;
    Response download_file(const Request& request, const std::string& id) const;
    StringResponse discover_devices(const Request& request) const;
    Response serve_static(const Request& request, const std::string& path) const;

    std::filesystem::path directory_;
    protocol::DeviceDescriptor device_;
    BrowseFn browse_;
    std::filesystem::path assets_dir_;
};

StringResponse json_response(const Request& request, http::status status, const nlohmann::json& body);
StringResponse error_response(const Request& request, http::status status, const std::string& message);

// Adds the permissive CORS headers.
void apply_cors(Response& response);

// Percent-decoding for path segments. Returns false on a malformed escape.
bool url_decode(const std::string& in, std::string& out);

} // namespace web
