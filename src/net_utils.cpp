#include "net_utils.hpp"
#include "logger.hpp"
#include <boost/asio.hpp>

using boost::asio::ip::tcp;

namespace net {

bool is_port_available(uint16_t port) {
    if (port == 0) return false;

    boost::asio::io_context io_context;
    tcp::acceptor acceptor(io_context);
    boost::system::error_code ec;

    acceptor.open(tcp::v4(), ec);
    if (ec) return false;
    acceptor.bind(tcp::endpoint(boost::asio::ip::address_v4::loopback(), port), ec);
    return !ec;
}

std::optional<uint16_t> find_available_port(uint16_t start_port, uint16_t end_port) {
    if (start_port > end_port) return std::nullopt;

    for (uint32_t port = start_port; port <= end_port; ++port) {
        if (is_port_available(static_cast<uint16_t>(port))) {
            return static_cast<uint16_t>(port);
        }
    }
    return std::nullopt;
}

uint16_t get_available_port_or_default(uint16_t preferred_port) {
    if (is_port_available(preferred_port)) {
        return preferred_port;
    }

    Logger::warn("Port " + std::to_string(preferred_port) + " is not available, searching for alternative...");

    if (auto port = find_available_port(8000, 8999)) {
        Logger::warn("Using alternative port: " + std::to_string(*port));
        return *port;
    }

    if (auto port = find_available_port(9000, 9999)) {
        Logger::warn("Using fallback port: " + std::to_string(*port));
        return *port;
    }

    Logger::warn("No available ports found, returning preferred port " + std::to_string(preferred_port));
    return preferred_port;
}

} // namespace net
