#include <getopt.h>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include "app.hpp"
#include "config.hpp"
#include "logger.hpp"
#include "net_utils.hpp"
#include "version.hpp"
#include "web/http_server.hpp"

namespace fs = std::filesystem;

namespace {

struct CliOptions {
    std::optional<uint16_t> port;
    std::optional<fs::path> directory;
    bool no_mdns = false;
    bool no_qr = false;
    bool open = false;
    bool generate_config = false;
    bool show_help = false;
    bool show_version = false;
};

void print_help(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "\n"
              << "Share a directory with devices on the local network.\n"
              << "\n"
              << "Options:\n"
              << "  -p, --port N          Port to listen on (default 8080)\n"
              << "  -d, --directory DIR   Directory to share (default: current directory)\n"
              << "      --no-mdns         Do not advertise or browse via mDNS\n"
              << "      --no-qr           Do not print the startup banner\n"
              << "  -o, --open            Open the web interface in the default browser\n"
              << "      --generate-config Write " << config::EXAMPLE_FILE << " and exit\n"
              << "  -h, --help            Show this help\n"
              << "  -V, --version         Show version\n"
              << "\n"
              << "Environment: PORT, HOST, UPLOAD_DIR, MAX_FILE_SIZE, LANSHARE_NO_MDNS, LANSHARE_LOG\n";
}

bool parse_port(const char* text, uint16_t& port) {
    try {
        size_t used = 0;
        unsigned long value = std::stoul(text, &used);
        if (used != std::string(text).size() || value == 0 || value > 65535) return false;
        port = static_cast<uint16_t>(value);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parse_args(int argc, char* argv[], CliOptions& options) {
    enum { OPT_NO_MDNS = 1000, OPT_NO_QR, OPT_GENERATE_CONFIG };

    static struct option long_options[] = {
        {"port", required_argument, nullptr, 'p'},
        {"directory", required_argument, nullptr, 'd'},
        {"no-mdns", no_argument, nullptr, OPT_NO_MDNS},
        {"no-qr", no_argument, nullptr, OPT_NO_QR},
        {"open", no_argument, nullptr, 'o'},
        {"generate-config", no_argument, nullptr, OPT_GENERATE_CONFIG},
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 'V'},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    int option_index = 0;
    while ((opt = getopt_long(argc, argv, "p:d:ohV", long_options, &option_index)) != -1) {
        switch (opt) {
            case 'p': {
                uint16_t port = 0;
                if (!parse_port(optarg, port)) {
                    std::cerr << "Invalid port: " << optarg << "\n";
                    return false;
                }
                options.port = port;
                break;
            }
            case 'd':
                options.directory = fs::path(optarg);
                break;
            case OPT_NO_MDNS:
                options.no_mdns = true;
                break;
            case OPT_NO_QR:
                options.no_qr = true;
                break;
            case 'o':
                options.open = true;
                break;
            case OPT_GENERATE_CONFIG:
                options.generate_config = true;
                break;
            case 'h':
                options.show_help = true;
                return true;
            case 'V':
                options.show_version = true;
                return true;
            default:
                return false;
        }
    }

    if (optind < argc) {
        std::cerr << "Unexpected argument: " << argv[optind] << "\n";
        return false;
    }
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    Logger::init_from_env();

    CliOptions cli;
    if (!parse_args(argc, argv, cli)) {
        print_help(argv[0]);
        return 2;
    }
    if (cli.show_help) {
        print_help(argv[0]);
        return 0;
    }
    if (cli.show_version) {
        std::cout << LANSHARE_SERVICE_NAME << " " << LANSHARE_VERSION << "\n";
        return 0;
    }
    if (cli.generate_config) {
        try {
            config::AppConfig::save_example(config::EXAMPLE_FILE);
            std::cout << "Wrote " << config::EXAMPLE_FILE << "\n";
            return 0;
        } catch (const config::ConfigError& e) {
            Logger::error(e.what());
            return 1;
        }
    }

    config::AppConfig cfg = config::AppConfig::load_or_defaults(".");

    if (cli.port) cfg.server.port = *cli.port;
    if (cli.directory) cfg.files.directory = *cli.directory;
    if (cli.no_mdns) cfg.discovery.enabled = false;
    if (cli.no_qr) cfg.ui.qr_code = false;
    if (cli.open) cfg.ui.open_browser = true;

    std::error_code ec;
    fs::path directory = cfg.files.directory ? fs::absolute(*cfg.files.directory, ec)
                                             : fs::current_path(ec);
    if (ec) {
        Logger::error("Cannot resolve the shared directory: " + ec.message());
        return 1;
    }
    if (!fs::is_directory(directory, ec)) {
        Logger::warn("Shared directory does not exist yet: " + directory.string());
    }

    uint16_t port = net::get_available_port_or_default(cfg.server.port);
    if (port != cfg.server.port) {
        Logger::info("Port " + std::to_string(cfg.server.port) + " is in use, using " +
                     std::to_string(port));
    }

    try {
        app::App application(app::AppOptions::from_config(cfg, directory, port));
        return application.run();
    } catch (const web::BindError& e) {
        Logger::error(std::string("Failed to start web server: ") + e.what());
        return 1;
    }
}
