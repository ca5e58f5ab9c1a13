#include "device.hpp"
#include "security.hpp"
#include "logger.hpp"
#include <unistd.h>
#include <climits>

namespace device {

std::string get_local_ip(boost::asio::io_context& io_context) {
    try {
        // connect() on UDP sends nothing; it only selects the outgoing interface
        boost::asio::ip::udp::socket socket(io_context);
        socket.connect(boost::asio::ip::udp::endpoint(boost::asio::ip::make_address("8.8.8.8"), 53));
        auto address = socket.local_endpoint().address();
        if (address.is_unspecified()) {
            return "127.0.0.1";
        }
        return address.to_string();
    } catch (const std::exception& e) {
        Logger::debug(std::string("No routable local address: ") + e.what());
        return "127.0.0.1";
    }
}

std::string get_host_name() {
    char buf[HOST_NAME_MAX + 1] = {0};
    if (gethostname(buf, sizeof(buf) - 1) != 0 || buf[0] == '\0') {
        return "unknown";
    }
    return std::string(buf);
}

std::string get_os() {
#if defined(__linux__)
    return "linux";
#elif defined(__APPLE__)
    return "macos";
#elif defined(_WIN32)
    return "windows";
#elif defined(__FreeBSD__)
    return "freebsd";
#elif defined(__OpenBSD__)
    return "openbsd";
#elif defined(__NetBSD__)
    return "netbsd";
#else
    return "unknown";
#endif
}

protocol::DeviceDescriptor make_local_descriptor(uint16_t port) {
    boost::asio::io_context io_context;

    protocol::DeviceDescriptor descriptor;
    descriptor.id = security::generate_uuid_v4();
    descriptor.name = get_host_name();
    descriptor.ip = get_local_ip(io_context);
    descriptor.port = port;
    descriptor.os = get_os();
    return descriptor;
}

} // namespace device
