#include "web/http_server.hpp"
#include "logger.hpp"
#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>
#include <boost/beast/core.hpp>

using boost::asio::ip::tcp;
namespace beast = boost::beast;

namespace web {

// Live connections, so that stop() can wait for them and, past the drain
// timeout, shut them down.
class SessionRegistry {
public:
    uint64_t add(std::shared_ptr<tcp::socket> socket) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closing_) {
            boost::system::error_code ec;
            socket->shutdown(tcp::socket::shutdown_both, ec);
        }
        uint64_t id = next_id_++;
        sockets_.emplace(id, std::move(socket));
        return id;
    }

    // Unregisters, closes and destroys the session's socket under the lock, so
    // shutdown_all() never touches a socket that is being closed and the
    // idle signal only fires once no socket of the io_context is alive.
    void release(uint64_t id, std::shared_ptr<tcp::socket>& socket) {
        std::lock_guard<std::mutex> lock(mutex_);
        sockets_.erase(id);
        boost::system::error_code ec;
        socket->shutdown(tcp::socket::shutdown_send, ec);
        socket->close(ec);
        socket.reset();
        if (sockets_.empty()) idle_.notify_all();
    }

    bool wait_idle(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return idle_.wait_for(lock, timeout, [this] { return sockets_.empty(); });
    }

    void wait_idle() {
        std::unique_lock<std::mutex> lock(mutex_);
        idle_.wait(lock, [this] { return sockets_.empty(); });
    }

    // Also applies to sessions added afterwards by an accept already in flight.
    void shutdown_all() {
        std::lock_guard<std::mutex> lock(mutex_);
        closing_ = true;
        for (auto& entry : sockets_) {
            boost::system::error_code ec;
            entry.second->shutdown(tcp::socket::shutdown_both, ec);
        }
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sockets_.size();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable idle_;
    std::map<uint64_t, std::shared_ptr<tcp::socket>> sockets_;
    uint64_t next_id_ = 1;
    bool closing_ = false;
};

namespace {

bool keeps_alive(const Response& response) {
    return std::visit([](const auto& res) { return res.keep_alive(); }, response);
}

unsigned status_code(const Response& response) {
    return std::visit([](const auto& res) { return res.result_int(); }, response);
}

void do_session(std::shared_ptr<tcp::socket> socket,
                std::shared_ptr<const Api> api,
                uint64_t body_limit,
                std::shared_ptr<SessionRegistry> registry,
                uint64_t id) {
    beast::flat_buffer buffer;
    beast::error_code ec;

    try {
        for (;;) {
            http::request_parser<http::string_body> parser;
            parser.body_limit(body_limit);

            http::read(*socket, buffer, parser, ec);
            if (ec == http::error::end_of_stream) break;
            if (ec == http::error::body_limit) {
                Request rejected;
                rejected.version(11);
                rejected.keep_alive(false);
                Response response = error_response(rejected, http::status::payload_too_large,
                                                   "Request body exceeds the upload size limit");
                apply_cors(response);
                std::visit([&](auto& res) { http::write(*socket, res, ec); }, response);
                Logger::warn("Rejected request body larger than " + std::to_string(body_limit) + " bytes");
                break;
            }
            if (ec) {
                Logger::debug("Connection read error: " + ec.message());
                break;
            }

            Request request = parser.release();
            Response response = api->handle(request);
            Logger::debug(std::string(request.method_string()) + " " +
                          std::string(request.target()) + " -> " +
                          std::to_string(status_code(response)));

            bool keep_alive = keeps_alive(response);
            std::visit([&](auto& res) { http::write(*socket, res, ec); }, response);
            if (ec) {
                Logger::debug("Connection write error: " + ec.message());
                break;
            }
            if (!keep_alive) break;
        }
    } catch (const std::exception& e) {
        Logger::error(std::string("Session error: ") + e.what());
    }

    registry->release(id, socket);
}

} // namespace

HttpServer::HttpServer(const std::string& host, uint16_t port,
                       std::shared_ptr<const Api> api, uint64_t body_limit)
    : acceptor_(io_context_),
      api_(std::move(api)),
      body_limit_(body_limit),
      sessions_(std::make_shared<SessionRegistry>()) {
    boost::system::error_code ec;
    auto address = boost::asio::ip::make_address(host, ec);
    if (ec) {
        throw BindError("invalid listen address '" + host + "'");
    }

    tcp::endpoint endpoint(address, port);
    const std::string where = host + ":" + std::to_string(port);

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) throw BindError("cannot open socket for " + where + ": " + ec.message());

    acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
    if (ec) throw BindError("cannot set SO_REUSEADDR on " + where + ": " + ec.message());

    acceptor_.bind(endpoint, ec);
    if (ec) throw BindError("cannot bind " + where + ": " + ec.message());

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) throw BindError("cannot listen on " + where + ": " + ec.message());

    port_ = acceptor_.local_endpoint().port();
}

HttpServer::~HttpServer() {
    stop(std::chrono::milliseconds(0));
    // session threads touch sockets owned by io_context_
    sessions_->wait_idle();
}

void HttpServer::run() {
    if (stopping_) return;

    Logger::info("Starting web server on " + acceptor_.local_endpoint().address().to_string() +
                 ":" + std::to_string(port_));
    start_accept();
    io_context_.run();

    boost::system::error_code ec;
    acceptor_.close(ec);
}

void HttpServer::stop(std::chrono::milliseconds drain_timeout) {
    if (stopping_.exchange(true)) {
        sessions_->wait_idle(drain_timeout);
        return;
    }

    io_context_.stop();

    if (!sessions_->wait_idle(drain_timeout)) {
        Logger::warn("Closing " + std::to_string(sessions_->size()) + " connection(s) still in flight");
        sessions_->shutdown_all();
        sessions_->wait_idle(std::chrono::seconds(5));
    }
}

size_t HttpServer::active_connections() const {
    return sessions_->size();
}

void HttpServer::start_accept() {
    acceptor_.async_accept([this](const boost::system::error_code& ec, tcp::socket socket) {
        if (ec == boost::asio::error::operation_aborted || stopping_) return;
        if (ec) {
            Logger::warn("Accept failed: " + ec.message());
            if (acceptor_.is_open()) start_accept();
            return;
        }

        auto shared = std::make_shared<tcp::socket>(std::move(socket));
        uint64_t id = sessions_->add(shared);
        std::thread(do_session, std::move(shared), api_, body_limit_, sessions_, id).detach();

        start_accept();
    });
}

} // namespace web
