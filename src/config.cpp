#include "config.hpp"
#include "logger.hpp"
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

namespace fs = std::filesystem;

namespace config {

namespace {

template <typename T>
void read_if_present(const nlohmann::json& section, const char* key, T& target) {
    auto it = section.find(key);
    if (it != section.end() && !it->is_null()) {
        target = it->get<T>();
    }
}

uint64_t parse_unsigned(const std::string& name, const std::string& value, uint64_t max) {
    try {
        size_t used = 0;
        unsigned long long parsed = std::stoull(value, &used);
        if (used != value.size() || value[0] == '-' || parsed > max) {
            throw ConfigError(name + " is out of range: " + value);
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw ConfigError(name + " is not a number: " + value);
    }
}

bool is_truthy(const std::string& value) {
    return value == "1" || value == "true" || value == "yes" || value == "on";
}

} // namespace

void to_json(nlohmann::json& j, const AppConfig& cfg) {
    nlohmann::json files = {{"assets_dir", cfg.files.assets_dir.string()}};
    files["directory"] = cfg.files.directory ? nlohmann::json(cfg.files.directory->string())
                                             : nlohmann::json(nullptr);
    j = nlohmann::json{
        {"server", {
            {"port", cfg.server.port},
            {"host", cfg.server.host},
            {"max_file_size", cfg.server.max_file_size},
            {"drain_timeout_ms", cfg.server.drain_timeout_ms}
        }},
        {"files", files},
        {"discovery", {{"enabled", cfg.discovery.enabled}}},
        {"ui", {
            {"qr_code", cfg.ui.qr_code},
            {"open_browser", cfg.ui.open_browser}
        }}
    };
}

void from_json(const nlohmann::json& j, AppConfig& cfg) {
    if (!j.is_object()) {
        throw ConfigError("configuration root must be a JSON object");
    }

    if (auto it = j.find("server"); it != j.end()) {
        uint64_t port = cfg.server.port;
        read_if_present(*it, "port", port);
        if (port > std::numeric_limits<uint16_t>::max()) {
            throw ConfigError("server.port is out of range: " + std::to_string(port));
        }
        cfg.server.port = static_cast<uint16_t>(port);
        read_if_present(*it, "host", cfg.server.host);
        read_if_present(*it, "max_file_size", cfg.server.max_file_size);
        read_if_present(*it, "drain_timeout_ms", cfg.server.drain_timeout_ms);
    }
    if (auto it = j.find("files"); it != j.end()) {
        auto dir = it->find("directory");
        if (dir != it->end() && !dir->is_null()) {
            cfg.files.directory = fs::path(dir->get<std::string>());
        }
        std::string assets = cfg.files.assets_dir.string();
        read_if_present(*it, "assets_dir", assets);
        cfg.files.assets_dir = assets;
    }
    if (auto it = j.find("discovery"); it != j.end()) {
        read_if_present(*it, "enabled", cfg.discovery.enabled);
    }
    if (auto it = j.find("ui"); it != j.end()) {
        read_if_present(*it, "qr_code", cfg.ui.qr_code);
        read_if_present(*it, "open_browser", cfg.ui.open_browser);
    }
}

AppConfig AppConfig::from_json_text(const std::string& text) {
    try {
        AppConfig cfg;
        from_json(nlohmann::json::parse(text), cfg);
        return cfg;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("invalid configuration: ") + e.what());
    }
}

AppConfig AppConfig::apply_environment(AppConfig base) {
    if (const char* port = std::getenv("PORT")) {
        base.server.port = static_cast<uint16_t>(
            parse_unsigned("PORT", port, std::numeric_limits<uint16_t>::max()));
    }
    if (const char* host = std::getenv("HOST")) {
        base.server.host = host;
    }
    if (const char* dir = std::getenv("UPLOAD_DIR")) {
        base.files.directory = fs::path(dir);
    }
    if (const char* size = std::getenv("MAX_FILE_SIZE")) {
        base.server.max_file_size = parse_unsigned("MAX_FILE_SIZE", size,
                                                   std::numeric_limits<uint64_t>::max());
    }
    if (const char* no_mdns = std::getenv("LANSHARE_NO_MDNS")) {
        if (is_truthy(no_mdns)) base.discovery.enabled = false;
    }
    return base;
}

AppConfig AppConfig::load_file(const fs::path& search_dir) {
    AppConfig cfg;

    const fs::path file = search_dir / CONFIG_FILE;
    std::ifstream in(file);
    if (in.is_open()) {
        std::stringstream ss;
        ss << in.rdbuf();
        cfg = from_json_text(ss.str());
        Logger::info("Loaded configuration from " + file.string());
    }
    return cfg;
}

AppConfig AppConfig::load(const fs::path& search_dir) {
    return apply_environment(load_file(search_dir));
}

AppConfig AppConfig::load_or_defaults(const fs::path& search_dir) {
    AppConfig cfg;
    try {
        cfg = load_file(search_dir);
    } catch (const ConfigError& e) {
        Logger::warn(std::string("Ignoring configuration file: ") + e.what());
    }

    try {
        return apply_environment(cfg);
    } catch (const ConfigError& e) {
        Logger::warn(std::string("Ignoring environment overrides: ") + e.what());
        return cfg;
    }
}

void AppConfig::save_example(const fs::path& path) {
    std::ofstream out(path);
    if (!out.is_open()) {
        throw ConfigError("cannot write " + path.string());
    }
    out << nlohmann::json(AppConfig{}).dump(2) << "\n";
    if (!out) {
        throw ConfigError("cannot write " + path.string());
    }
}

} // namespace config
