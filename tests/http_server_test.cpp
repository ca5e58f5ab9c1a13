#include <gtest/gtest.h>
#include "web/http_server.hpp"
#include "test_support.hpp"

#include <boost/beast/core.hpp>
#include <thread>
#include <vector>

using namespace web;
using boost::asio::ip::tcp;
namespace beast = boost::beast;

namespace {

protocol::DeviceDescriptor loopback_device() {
    protocol::DeviceDescriptor device;
    device.id = "5d0c8a34-2222-4333-8444-555566667777";
    device.name = "loopback";
    device.ip = "127.0.0.1";
    device.os = "linux";
    return device;
}

std::string multipart_body(const std::string& boundary, const std::string& file_name, const std::string& data) {
    return "--" + boundary + "\r\n"
           "Content-Disposition: form-data; name=\"file\"; filename=\"" + file_name + "\"\r\n"
           "Content-Type: application/octet-stream\r\n"
           "\r\n" + data + "\r\n"
           "--" + boundary + "--\r\n";
}

} // namespace

class HttpServerTest : public ::testing::Test {
protected:
    HttpServerTest() : dir_("http_server") {}

    void start(uint64_t body_limit = 1024 * 1024) {
        auto api = std::make_shared<const Api>(
            dir_.path(), loopback_device(),
            [] { return std::vector<protocol::DeviceDescriptor>{}; });
        server_ = std::make_unique<HttpServer>("127.0.0.1", 0, api, body_limit);
        thread_ = std::thread([this] { server_->run(); });
    }

    void TearDown() override {
        if (server_) server_->stop(std::chrono::milliseconds(500));
        if (thread_.joinable()) thread_.join();
        server_.reset();
    }

    void connect(tcp::socket& socket) {
        socket.connect(tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), server_->port()));
    }

    http::response<http::string_body> exchange(tcp::socket& socket, Request request) {
        request.set(http::field::host, "127.0.0.1");
        request.prepare_payload();
        http::write(socket, request);

        beast::flat_buffer buffer;
        http::response<http::string_body> response;
        http::read(socket, buffer, response);
        return response;
    }

    http::response<http::string_body> send(Request request) {
        boost::asio::io_context io_context;
        tcp::socket socket(io_context);
        connect(socket);
        request.keep_alive(false);
        return exchange(socket, std::move(request));
    }

    bool wait_for_connections(size_t count) {
        for (int i = 0; i < 200; ++i) {
            if (server_->active_connections() == count) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return false;
    }

    TempDir dir_;
    std::unique_ptr<HttpServer> server_;
    std::thread thread_;
};

TEST_F(HttpServerTest, BindsEphemeralPort)
{
    start();
    EXPECT_NE(server_->port(), 0);
}

TEST_F(HttpServerTest, AnswersHealthOverSocket)
{
    start();
    auto response = send(Request{http::verb::get, "/api/health", 11});
    EXPECT_EQ(response.result(), http::status::ok);
    EXPECT_NE(response.body().find("healthy"), std::string::npos);
    EXPECT_EQ(std::string(response[http::field::access_control_allow_origin]), "*");
}

TEST_F(HttpServerTest, UploadedBytesDownloadUnchanged)
{
    start();

    std::string payload;
    for (int i = 0; i < 4096; ++i) payload.push_back(static_cast<char>(i % 256));

    Request upload{http::verb::post, "/api/files", 11};
    upload.set(http::field::content_type, "multipart/form-data; boundary=XbX");
    upload.body() = multipart_body("XbX", "blob.bin", payload);
    auto stored = send(std::move(upload));
    ASSERT_EQ(stored.result(), http::status::ok) << stored.body();

    const std::string id = nlohmann::json::parse(stored.body())["id"];
    auto downloaded = send(Request{http::verb::get, "/api/files/" + id, 11});
    ASSERT_EQ(downloaded.result(), http::status::ok);
    EXPECT_EQ(downloaded.body(), payload);
    EXPECT_EQ(std::string(downloaded[http::field::content_disposition]), "attachment; filename=\"blob.bin\"");
}

TEST_F(HttpServerTest, KeepAliveServesSeveralRequests)
{
    start();
    dir_.write("one.txt", "1");

    boost::asio::io_context io_context;
    tcp::socket socket(io_context);
    connect(socket);

    auto first = exchange(socket, Request{http::verb::get, "/api/files", 11});
    EXPECT_EQ(first.result(), http::status::ok);
    EXPECT_TRUE(first.keep_alive());

    auto second = exchange(socket, Request{http::verb::get, "/api/device", 11});
    EXPECT_EQ(second.result(), http::status::ok);
    EXPECT_EQ(nlohmann::json::parse(second.body())["name"], "loopback");
}

TEST_F(HttpServerTest, HeadKeepsConnectionFramed)
{
    start();

    boost::asio::io_context io_context;
    tcp::socket socket(io_context);
    connect(socket);
    beast::flat_buffer buffer;

    Request head{http::verb::head, "/", 11};
    head.set(http::field::host, "127.0.0.1");
    http::write(socket, head);

    http::response_parser<http::empty_body> parser;
    parser.skip(true);
    http::read(socket, buffer, parser);
    auto& head_response = parser.get();
    EXPECT_EQ(head_response.result(), http::status::ok);
    EXPECT_NE(std::string(head_response[http::field::content_length]), "0");
    EXPECT_TRUE(head_response.keep_alive());

    Request health{http::verb::get, "/api/health", 11};
    health.set(http::field::host, "127.0.0.1");
    http::write(socket, health);

    http::response<http::string_body> response;
    http::read(socket, buffer, response);
    EXPECT_EQ(response.result(), http::status::ok);
    EXPECT_NE(response.body().find("healthy"), std::string::npos);
}

TEST_F(HttpServerTest, RejectsBodyOverLimit)
{
    start(256);

    Request upload{http::verb::post, "/api/files", 11};
    upload.set(http::field::content_type, "multipart/form-data; boundary=XbX");
    upload.body() = multipart_body("XbX", "big.bin", std::string(1024, 'x'));
    auto response = send(std::move(upload));

    EXPECT_EQ(response.result(), http::status::payload_too_large);
    EXPECT_FALSE(std::filesystem::exists(dir_.path() / "big.bin"));
}

TEST_F(HttpServerTest, StopClosesIdleConnections)
{
    start();

    boost::asio::io_context io_context;
    tcp::socket socket(io_context);
    connect(socket);
    ASSERT_TRUE(wait_for_connections(1));

    server_->stop(std::chrono::milliseconds(100));
    thread_.join();
    EXPECT_EQ(server_->active_connections(), 0u);

    // stopping again is harmless
    server_->stop(std::chrono::milliseconds(0));
}

TEST_F(HttpServerTest, StopDuringBusyConnections)
{
    start();
    const uint16_t port = server_->port();

    std::vector<std::thread> clients;
    for (int i = 0; i < 8; ++i) {
        clients.emplace_back([port] {
            boost::asio::io_context io_context;
            tcp::socket socket(io_context);
            beast::error_code ec;
            socket.connect(tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), port), ec);
            if (ec) return;

            beast::flat_buffer buffer;
            for (int n = 0; n < 500; ++n) {
                Request request{http::verb::get, "/api/health", 11};
                request.set(http::field::host, "127.0.0.1");
                http::write(socket, request, ec);
                if (ec) return;
                http::response<http::string_body> response;
                http::read(socket, buffer, response, ec);
                if (ec) return;
            }
        });
    }

    for (int i = 0; i < 200 && server_->active_connections() == 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    server_->stop(std::chrono::milliseconds(0));
    thread_.join();
    EXPECT_EQ(server_->active_connections(), 0u);

    for (auto& client : clients) client.join();
}

TEST_F(HttpServerTest, SecondBindOnSamePortFails)
{
    start();
    auto api = std::make_shared<const Api>(
        dir_.path(), loopback_device(),
        [] { return std::vector<protocol::DeviceDescriptor>{}; });
    EXPECT_THROW(HttpServer("127.0.0.1", server_->port(), api, 1024), BindError);
}

TEST(HttpServerBindTest, InvalidHostIsBindError)
{
    auto api = std::make_shared<const Api>(
        std::filesystem::temp_directory_path(), loopback_device(),
        [] { return std::vector<protocol::DeviceDescriptor>{}; });
    EXPECT_THROW(HttpServer("not-an-address", 0, api, 1024), BindError);
}
