#include "app.hpp"
#include "device.hpp"
#include "discovery.hpp"
#include "logger.hpp"
#include "ui/browser.hpp"
#include "web/api.hpp"
#include "web/http_server.hpp"
#include <csignal>
#include <memory>
#include <stdexcept>
#include <thread>

namespace app {

namespace {

// Extra settle time for the goodbye packets after the advertiser is withdrawn.
constexpr std::chrono::milliseconds MDNS_SETTLE{500};

} // namespace

AppOptions AppOptions::from_config(const config::AppConfig& cfg,
                                   const std::filesystem::path& directory,
                                   uint16_t port) {
    AppOptions options;
    options.port = port;
    options.host = cfg.server.host;
    options.directory = directory;
    options.assets_dir = cfg.files.assets_dir;
    options.enable_mdns = cfg.discovery.enabled;
    options.show_banner = cfg.ui.qr_code;
    options.open_browser = cfg.ui.open_browser;
    options.max_file_size = cfg.server.max_file_size;
    options.drain_timeout = std::chrono::milliseconds(cfg.server.drain_timeout_ms);
    return options;
}

App::App(AppOptions options)
    : options_(std::move(options)),
      device_(device::make_local_descriptor(options_.port)) {}

App::~App() = default;

int App::run() {
    LifecycleState expected = LifecycleState::Idle;
    if (!state_.compare_exchange_strong(expected, LifecycleState::Starting)) {
        throw std::logic_error("App::run() called more than once");
    }

    Logger::info("Serving files from: " + options_.directory.string());
    Logger::info("Web interface available at: " + device_.url());

    if (options_.show_banner) {
        ui::print_banner(device_, options_.directory);
    }

    std::unique_ptr<discovery::Advertiser> advertiser;
    if (options_.enable_mdns) {
        auto candidate = std::make_unique<discovery::Advertiser>(device_);
        try {
            candidate->publish();
            Logger::info("mDNS service registered successfully");
            advertiser = std::move(candidate);
        } catch (const discovery::DiscoveryError& e) {
            Logger::error(std::string("Failed to register mDNS service: ") + e.what());
        }
    } else {
        Logger::info("mDNS discovery disabled");
    }

    if (options_.open_browser) {
        ui::open_in_browser(device_.url());
    }

    auto api = std::make_shared<const web::Api>(
        options_.directory, device_,
        [] { return discovery::Browser().browse(discovery::BROWSE_TIMEOUT); },
        options_.assets_dir);

    std::unique_ptr<web::HttpServer> server;
    try {
        server = std::make_unique<web::HttpServer>(options_.host, options_.port, api,
                                                   options_.max_file_size);
    } catch (const web::BindError&) {
        if (advertiser) advertiser->withdraw();
        state_ = LifecycleState::Stopped;
        throw;
    }

    state_ = LifecycleState::Running;
    wait_for_shutdown(*server);
    state_ = LifecycleState::ShuttingDown;

    Logger::info("Cleaning up services...");
    server.reset();
    if (advertiser) {
        Logger::info("Unregistering mDNS service...");
        advertiser->withdraw();
        std::this_thread::sleep_for(MDNS_SETTLE);
    }

    Logger::info("Shutdown complete");
    state_ = LifecycleState::Stopped;
    return trigger_ == ShutdownTrigger::ServerFailed ? 1 : 0;
}

void App::request_shutdown() {
    boost::asio::post(control_, [this] {
        ShutdownTrigger none = ShutdownTrigger::None;
        if (trigger_.compare_exchange_strong(none, ShutdownTrigger::Requested)) {
            Logger::info("Shutdown requested");
        }
        if (signals_) {
            boost::system::error_code ec;
            signals_->cancel(ec);
        }
    });
}

// Races the serve loop against SIGINT/SIGTERM on the control io_context.
// The first to complete decides the trigger; the server is then stopped and
// its thread joined in every case.
void App::wait_for_shutdown(web::HttpServer& server) {
    signals_.emplace(control_, SIGINT, SIGTERM);
    signals_->async_wait([this](const boost::system::error_code& ec, int signal_number) {
        if (ec) return;
        ShutdownTrigger none = ShutdownTrigger::None;
        if (trigger_.compare_exchange_strong(none, ShutdownTrigger::Signal)) {
            Logger::info("Received signal " + std::to_string(signal_number) +
                         ", shutting down gracefully...");
        }
    });

    std::thread serve_thread([this, &server] {
        bool failed = false;
        try {
            server.run();
        } catch (const std::exception& e) {
            Logger::error(std::string("Server error: ") + e.what());
            failed = true;
        }
        boost::asio::post(control_, [this, failed] {
            ShutdownTrigger none = ShutdownTrigger::None;
            trigger_.compare_exchange_strong(
                none, failed ? ShutdownTrigger::ServerFailed : ShutdownTrigger::ServerExited);
            if (signals_) {
                boost::system::error_code ec;
                signals_->cancel(ec);
            }
        });
    });

    // Returns once the signal wait has completed or been cancelled. A
    // request_shutdown() posted before this point is handled here too.
    control_.run();

    server.stop(options_.drain_timeout);
    serve_thread.join();

    signals_.reset();
    control_.restart();
    control_.poll();
}

} // namespace app
