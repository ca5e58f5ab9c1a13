#include <gtest/gtest.h>
#include "app.hpp"
#include "net_utils.hpp"
#include "web/http_server.hpp"
#include "test_support.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <future>
#include <thread>

using boost::asio::ip::tcp;
namespace http = boost::beast::http;

namespace {

app::AppOptions headless_options(const std::filesystem::path& directory, uint16_t port) {
    app::AppOptions options;
    options.port = port;
    options.host = "127.0.0.1";
    options.directory = directory;
    options.enable_mdns = false;
    options.show_banner = false;
    options.open_browser = false;
    options.drain_timeout = std::chrono::milliseconds(200);
    return options;
}

uint16_t free_port() {
    auto port = net::find_available_port(20000, 29999);
    return port ? *port : 0;
}

bool wait_for_state(const app::App& application, app::LifecycleState state) {
    for (int i = 0; i < 300; ++i) {
        if (application.state() == state) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return false;
}

unsigned get_status(uint16_t port, const std::string& target) {
    boost::asio::io_context io_context;
    tcp::socket socket(io_context);
    socket.connect(tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), port));

    http::request<http::empty_body> request{http::verb::get, target, 11};
    request.set(http::field::host, "127.0.0.1");
    request.keep_alive(false);
    http::write(socket, request);

    boost::beast::flat_buffer buffer;
    http::response<http::string_body> response;
    http::read(socket, buffer, response);
    return response.result_int();
}

} // namespace

TEST(AppTest, OptionsFollowConfiguration)
{
    config::AppConfig cfg;
    cfg.server.host = "127.0.0.1";
    cfg.server.max_file_size = 4096;
    cfg.server.drain_timeout_ms = 300;
    cfg.discovery.enabled = false;
    cfg.ui.qr_code = false;
    cfg.ui.open_browser = true;

    auto options = app::AppOptions::from_config(cfg, "/srv/share", 8123);
    EXPECT_EQ(options.port, 8123);
    EXPECT_EQ(options.host, "127.0.0.1");
    EXPECT_EQ(options.directory, std::filesystem::path("/srv/share"));
    EXPECT_EQ(options.max_file_size, 4096u);
    EXPECT_EQ(options.drain_timeout, std::chrono::milliseconds(300));
    EXPECT_FALSE(options.enable_mdns);
    EXPECT_FALSE(options.show_banner);
    EXPECT_TRUE(options.open_browser);
}

TEST(AppTest, ServesWithDiscoveryDisabledUntilShutdown)
{
    TempDir dir("app_serve");
    dir.write("shared.txt", "content");
    const uint16_t port = free_port();
    ASSERT_NE(port, 0);

    app::App application(headless_options(dir.path(), port));
    EXPECT_EQ(application.state(), app::LifecycleState::Idle);
    EXPECT_EQ(application.device().port, port);

    auto exit_code = std::async(std::launch::async, [&] { return application.run(); });
    ASSERT_TRUE(wait_for_state(application, app::LifecycleState::Running));

    EXPECT_EQ(get_status(port, "/api/health"), 200u);
    EXPECT_EQ(get_status(port, "/api/files"), 200u);

    application.request_shutdown();
    EXPECT_EQ(exit_code.get(), 0);
    EXPECT_EQ(application.state(), app::LifecycleState::Stopped);
    EXPECT_EQ(application.trigger(), app::ShutdownTrigger::Requested);
}

TEST(AppTest, ShutdownRequestedBeforeRunStillCompletes)
{
    TempDir dir("app_early_stop");
    const uint16_t port = free_port();
    ASSERT_NE(port, 0);

    app::App application(headless_options(dir.path(), port));
    application.request_shutdown();
    EXPECT_EQ(application.run(), 0);
    EXPECT_EQ(application.state(), app::LifecycleState::Stopped);
}

TEST(AppTest, RunOnlyOnce)
{
    TempDir dir("app_once");
    const uint16_t port = free_port();
    ASSERT_NE(port, 0);

    app::App application(headless_options(dir.path(), port));
    application.request_shutdown();
    application.run();
    EXPECT_THROW(application.run(), std::logic_error);
}

TEST(AppTest, BindFailureIsFatal)
{
    TempDir dir("app_bind");
    boost::asio::io_context io_context;
    tcp::acceptor blocker(io_context, tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0));
    const uint16_t port = blocker.local_endpoint().port();

    app::App application(headless_options(dir.path(), port));
    EXPECT_THROW(application.run(), web::BindError);
    EXPECT_EQ(application.state(), app::LifecycleState::Stopped);
}
