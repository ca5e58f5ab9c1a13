#include "web/api.hpp"
#include "web/multipart.hpp"
#include "web/static_files.hpp"
#include "catalog.hpp"
#include "discovery.hpp"
#include "transfer.hpp"
#include "logger.hpp"
#include "version.hpp"
#include <algorithm>
#include <chrono>

namespace fs = std::filesystem;

namespace web {

namespace {

// Quotes for a Content-Disposition filename parameter; drops control characters.
std::string quoted_file_name(const std::string& name) {
    std::string out = "\"";
    for (char c : name) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc < 0x20 || uc == 0x7f) continue;
        if (c == '"' || c == '\\') out.push_back('\\');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

// A HEAD reply carries the GET status and headers, including the
// Content-Length of the payload it would have sent, but no body.
Response without_body(Response response) {
    return std::visit([](auto& res) -> Response {
        const auto size = res.payload_size();
        StringResponse head(res.base());
        if (size) head.content_length(*size);
        return head;
    }, response);
}

StringResponse method_not_allowed(const Request& request) {
    return error_response(request, http::status::method_not_allowed, "Method not allowed");
}

} // namespace

StringResponse json_response(const Request& request, http::status status, const nlohmann::json& body) {
    StringResponse response{status, request.version()};
    response.set(http::field::server, LANSHARE_SERVICE_NAME);
    response.set(http::field::content_type, "application/json");
    response.keep_alive(request.keep_alive());
    response.body() = body.dump();
    response.prepare_payload();
    return response;
}

StringResponse error_response(const Request& request, http::status status, const std::string& message) {
    return json_response(request, status, nlohmann::json{{"error", message}});
}

void apply_cors(Response& response) {
    std::visit([](auto& res) {
        res.set(http::field::access_control_allow_origin, "*");
        res.set(http::field::access_control_allow_methods, "*");
        res.set(http::field::access_control_allow_headers, "*");
    }, response);
}

bool url_decode(const std::string& in, std::string& out) {
    out.clear();
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        if (in[i] == '%') {
            if (i + 2 >= in.size()) return false;
            auto hex = [](char c) -> int {
                if (c >= '0' && c <= '9') return c - '0';
                if (c >= 'a' && c <= 'f') return c - 'a' + 10;
                if (c >= 'A' && c <= 'F') return c - 'A' + 10;
                return -1;
            };
            int hi = hex(in[i + 1]);
            int lo = hex(in[i + 2]);
            if (hi < 0 || lo < 0) return false;
            out.push_back(static_cast<char>((hi << 4) | lo));
            i += 2;
        } else {
            out.push_back(in[i]);
        }
    }
    return true;
}

Api::Api(fs::path directory, protocol::DeviceDescriptor device, BrowseFn browse, fs::path assets_dir)
    : directory_(std::move(directory)),
      device_(std::move(device)),
      browse_(std::move(browse)),
      assets_dir_(std::move(assets_dir)) {}

Response Api::handle(const Request& request) const {
    std::string target(request.target());
    std::string path = target.substr(0, target.find('?'));

    Response response = [&]() -> Response {
        try {
            return route(request, path);
        } catch (const std::exception& e) {
            Logger::error("Unhandled error for " + path + ": " + e.what());
            return error_response(request, http::status::internal_server_error, "Internal server error");
        }
    }();

    if (request.method() == http::verb::head) {
        response = without_body(std::move(response));
    }
    apply_cors(response);
    return response;
}

Response Api::route(const Request& request, const std::string& path) const {
    const auto method = request.method();

    if (method == http::verb::options) {
        StringResponse response{http::status::no_content, request.version()};
        response.set(http::field::access_control_max_age, "86400");
        response.keep_alive(request.keep_alive());
        response.prepare_payload();
        return response;
    }

    if (path != "/api" && path.compare(0, 5, "/api/") != 0) {
        return serve_static(request, path);
    }

    const std::string endpoint = path.substr(4);

    if (endpoint == "/health") {
        if (method != http::verb::get) return method_not_allowed(request);
        return health(request);
    }
    if (endpoint == "/device") {
        if (method != http::verb::get) return method_not_allowed(request);
        return device_info(request);
    }
    if (endpoint == "/files") {
        if (method == http::verb::get) return list_files(request);
        if (method == http::verb::post) return upload_file(request);
        return method_not_allowed(request);
    }
    if (endpoint.compare(0, 7, "/files/") == 0 && endpoint.size() > 7 &&
        endpoint.find('/', 7) == std::string::npos) {
        if (method != http::verb::get) return method_not_allowed(request);
        return download_file(request, endpoint.substr(7));
    }
    if (endpoint == "/discover") {
        if (method != http::verb::get) return method_not_allowed(request);
        return discover_devices(request);
    }

    return error_response(request, http::status::not_found, "API endpoint not found");
}

StringResponse Api::health(const Request& request) const {
    return json_response(request, http::status::ok, nlohmann::json{
        {"status", "healthy"},
        {"timestamp", protocol::format_timestamp(std::chrono::system_clock::now())},
        {"version", LANSHARE_VERSION},
        {"service", LANSHARE_SERVICE_NAME}
    });
}

StringResponse Api::device_info(const Request& request) const {
    return json_response(request, http::status::ok, nlohmann::json(device_));
}

StringResponse Api::list_files(const Request& request) const {
    try {
        nlohmann::json files = nlohmann::json::array();
        for (const auto& record : catalog::list(directory_)) {
            files.push_back(nlohmann::json(record));
        }
        return json_response(request, http::status::ok, files);
    } catch (const catalog::CatalogError& e) {
        Logger::error(std::string("Failed to list directory: ") + e.what());
        return error_response(request, http::status::internal_server_error, "Failed to list directory");
    }
}

StringResponse Api::upload_file(const Request& request) const {
    Logger::info("Upload request received");

    std::vector<MultipartPart> parts;
    try {
        std::string boundary = extract_boundary(std::string(request[http::field::content_type]));
        parts = parse_multipart(request.body(), boundary);
    } catch (const MultipartError& e) {
        Logger::error(std::string("Failed to read multipart body: ") + e.what());
        return error_response(request, http::status::bad_request, "Invalid multipart body");
    }

    auto part = std::find_if(parts.begin(), parts.end(),
                             [](const MultipartPart& p) { return p.file_name.has_value(); });
    if (part == parts.end()) {
        Logger::error("No file found in multipart request");
        return error_response(request, http::status::bad_request, "No file provided");
    }
    if (part->file_name->empty()) {
        Logger::error("Empty filename provided");
        return error_response(request, http::status::bad_request, "File name is empty");
    }

    const std::string& file_name = *part->file_name;
    const fs::path file_path = directory_ / file_name;
    Logger::info("Processing file upload: " + file_name + " (" + std::to_string(part->data.size()) + " bytes)");

    try {
        transfer::write_file(file_path, part->data);
    } catch (const transfer::TransferError& e) {
        Logger::error(std::string("Upload ") + transfer::stage_name(e.stage()) + " failed: " + e.what());
        return error_response(request, http::status::internal_server_error, "Failed to store file");
    }

    try {
        protocol::FileRecord record = catalog::describe(file_path);
        Logger::info("File uploaded successfully: " + file_name + " (" + std::to_string(record.size) + " bytes)");
        return json_response(request, http::status::ok, nlohmann::json(record));
    } catch (const catalog::NotFound& e) {
        Logger::error(std::string("Failed to describe uploaded file: ") + e.what());
        return error_response(request, http::status::internal_server_error, "Failed to describe stored file");
    }
}

Response Api::download_file(const Request& request, const std::string& id) const {
    std::vector<protocol::FileRecord> files;
    try {
        files = catalog::list(directory_);
    } catch (const catalog::CatalogError& e) {
        Logger::error(std::string("Failed to list directory: ") + e.what());
        return error_response(request, http::status::internal_server_error, "Failed to list directory");
    }

    auto file = std::find_if(files.begin(), files.end(),
                             [&](const protocol::FileRecord& f) { return f.id == id; });
    if (file == files.end()) {
        Logger::warn("File not found: " + id);
        return error_response(request, http::status::not_found, "File not found");
    }

    boost::beast::error_code ec;
    http::file_body::value_type body;
    body.open(file->path.c_str(), boost::beast::file_mode::scan, ec);
    if (ec) {
        Logger::error("Failed to read file " + file->path + ": " + ec.message());
        return error_response(request, http::status::internal_server_error, "Failed to read file");
    }

    FileResponse response{http::status::ok, request.version()};
    response.set(http::field::server, LANSHARE_SERVICE_NAME);
    response.set(http::field::content_type, file->mime_type);
    response.set(http::field::content_disposition, "attachment; filename=" + quoted_file_name(file->name));
    response.keep_alive(request.keep_alive());
    response.body() = std::move(body);
    response.prepare_payload();

    Logger::info("File downloaded: " + file->name);
    return response;
}

StringResponse Api::discover_devices(const Request& request) const {
    try {
        nlohmann::json devices = nlohmann::json::array();
        for (const auto& device : browse_()) {
            devices.push_back(nlohmann::json(device));
        }
        return json_response(request, http::status::ok, devices);
    } catch (const discovery::DiscoveryError& e) {
        Logger::error(std::string("Failed to discover devices: ") + e.what());
        return error_response(request, http::status::internal_server_error, "Failed to discover devices");
    }
}

Response Api::serve_static(const Request& request, const std::string& path) const {
    const auto method = request.method();
    if (method != http::verb::get && method != http::verb::head) {
        return method_not_allowed(request);
    }

    if (path.compare(0, 8, "/assets/") == 0) {
        std::string relative;
        if (!url_decode(path.substr(8), relative) || relative.empty()) {
            return error_response(request, http::status::not_found, "Asset not found");
        }

        fs::path asset = fs::path(relative).lexically_normal();
        if (asset.is_absolute() || asset.empty() || *asset.begin() == "..") {
            return error_response(request, http::status::not_found, "Asset not found");
        }

        const fs::path full = assets_dir_ / asset;
        std::error_code status_ec;
        if (!fs::is_regular_file(full, status_ec)) {
            return error_response(request, http::status::not_found, "Asset not found");
        }

        boost::beast::error_code ec;
        http::file_body::value_type body;
        body.open(full.c_str(), boost::beast::file_mode::scan, ec);
        if (ec) {
            return error_response(request, http::status::not_found, "Asset not found");
        }

        FileResponse response{http::status::ok, request.version()};
        response.set(http::field::server, LANSHARE_SERVICE_NAME);
        response.set(http::field::content_type, catalog::mime_type_for(full));
        response.keep_alive(request.keep_alive());
        response.body() = std::move(body);
        response.prepare_payload();
        return response;
    }

    StringResponse response{http::status::ok, request.version()};
    response.set(http::field::server, LANSHARE_SERVICE_NAME);
    response.set(http::field::content_type, "text/html; charset=utf-8");
    response.keep_alive(request.keep_alive());
    response.body() = index_html();
    response.prepare_payload();
    return response;
}

} // namespace web
