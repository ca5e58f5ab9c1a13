#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <boost/asio.hpp>
#include "config.hpp"
#include "protocol/device_info.hpp"

namespace web { class HttpServer; }

namespace app {

enum class LifecycleState {
    Idle,
    Starting,
    Running,
    ShuttingDown,
    Stopped
};

enum class ShutdownTrigger {
    None,
    Signal,
    Requested,
    ServerExited,
    ServerFailed
};

struct AppOptions {
    uint16_t port = 8080;
    std::string host = "0.0.0.0";
    std::filesystem::path directory;
    std::filesystem::path assets_dir = "assets";
    bool enable_mdns = true;
    bool show_banner = true;
    bool open_browser = false;
    uint64_t max_file_size = 1024ULL * 1024 * 1024;
    std::chrono::milliseconds drain_timeout{1000};

    static AppOptions from_config(const config::AppConfig& cfg,
                                  const std::filesystem::path& directory,
                                  uint16_t port);
};

// Startup and shutdown sequencing for one process.
//
// run() publishes the mDNS advertisement (optional), opens the browser
// (optional), starts the HTTP server, then races the serve loop against
// SIGINT/SIGTERM. Whichever finishes first stops the other; afterwards the
// advertisement is withdrawn. run() may only be called once.
class App {
public:
    explicit App(AppOptions options);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    // Exit code: 0 after a signal or request, 1 if the serve loop failed.
    // Throws web::BindError when the listen address cannot be bound.
    int run();

    // Thread-safe; behaves like an interrupt signal.
    void request_shutdown();

    LifecycleState state() const { return state_.load(); }
    ShutdownTrigger trigger() const { return trigger_.load(); }
    const protocol::DeviceDescriptor& device() const { return device_; }

private:
    void wait_for_shutdown(web::HttpServer& server);

    AppOptions options_;
    protocol::DeviceDescriptor device_;
    std::atomic<LifecycleState> state_{LifecycleState::Idle};
    std::atomic<ShutdownTrigger> trigger_{ShutdownTrigger::None};

    boost::asio::io_context control_;
    std::optional<boost::asio::signal_set> signals_;
};

} // namespace app
