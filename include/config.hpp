#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace config {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

constexpr const char* CONFIG_FILE = "lanshare.json";
constexpr const char* EXAMPLE_FILE = "lanshare.example.json";

struct ServerConfig {
    uint16_t port = 8080;
    std::string host = "0.0.0.0";
    uint64_t max_file_size = 1024ULL * 1024 * 1024;
    uint32_t drain_timeout_ms = 1000;
};

struct FilesConfig {
    std::optional<std::filesystem::path> directory;
    std::filesystem::path assets_dir = "assets";
};

struct DiscoveryConfig {
    bool enabled = true;
};

struct UiConfig {
    bool qr_code = true;
    bool open_browser = false;
};

struct AppConfig {
    ServerConfig server;
    FilesConfig files;
    DiscoveryConfig discovery;
    UiConfig ui;

    // Defaults, then lanshare.json in `search_dir` (if present), then the
    // environment (PORT, HOST, UPLOAD_DIR, MAX_FILE_SIZE, LANSHARE_NO_MDNS).
    static AppConfig load(const std::filesystem::path& search_dir = ".");

    // Defaults, then lanshare.json only. Throws ConfigError.
    static AppConfig load_file(const std::filesystem::path& search_dir = ".");

    // Like load(), but never throws: an unreadable file falls back to the
    // defaults and bad environment values leave the file settings in place.
    static AppConfig load_or_defaults(const std::filesystem::path& search_dir = ".");

    // Missing sections and keys keep their defaults. Throws ConfigError.
    static AppConfig from_json_text(const std::string& text);

    // Environment overrides on top of `base`. Throws ConfigError on bad values.
    static AppConfig apply_environment(AppConfig base);

    // Writes the defaults as pretty-printed JSON.
    static void save_example(const std::filesystem::path& path = EXAMPLE_FILE);
};

void to_json(nlohmann::json& j, const AppConfig& cfg);
void from_json(const nlohmann::json& j, AppConfig& cfg);

} // namespace config
