#pragma once

#include <string>
#include <cstdint>
#include <boost/asio.hpp>
#include "protocol/device_info.hpp"

namespace device {

// Address of the interface that routes towards the internet, or 127.0.0.1.
std::string get_local_ip(boost::asio::io_context& io_context);

// Host name, or "unknown".
std::string get_host_name();

// Platform identifier: linux, macos, windows, freebsd, openbsd, netbsd, unknown.
std::string get_os();

// Builds the descriptor for this process. Call once at startup; the id is
// freshly random on every call.
protocol::DeviceDescriptor make_local_descriptor(uint16_t port);

} // namespace device
