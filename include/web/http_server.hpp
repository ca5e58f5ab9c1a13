#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <boost/asio.hpp>
#include "web/api.hpp"

namespace web {

// The listen address could not be bound. Fatal at startup.
class BindError : public std::runtime_error {
public:
    explicit BindError(const std::string& what) : std::runtime_error(what) {}
};

class SessionRegistry;

// HTTP/1.1 listener. Connections are accepted on the server's own io_context
// and each one is served synchronously on a dedicated thread.
class HttpServer {
public:
    // Binds and listens immediately; throws BindError. Port 0 picks a free port.
    HttpServer(const std::string& host, uint16_t port,
               std::shared_ptr<const Api> api, uint64_t body_limit);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    uint16_t port() const { return port_; }

    // Accept loop. Returns once stop() has been called; propagates failures
    // of the loop itself.
    void run();

    // Thread-safe. Stops accepting, waits up to `drain_timeout` for requests in
    // flight, then shuts down whatever connections remain.
    void stop(std::chrono::milliseconds drain_timeout);

    size_t active_connections() const;

private:
    void start_accept();

    boost::asio::io_context io_context_;
    boost::asio::ip::tcp::acceptor acceptor_;
    uint16_t port_ = 0;
    std::shared_ptr<const Api> api_;
    uint64_t body_limit_;
    std::shared_ptr<SessionRegistry> sessions_;
    std::atomic<bool> stopping_{false};
};

} // namespace web
