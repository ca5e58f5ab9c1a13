#pragma once

#include <cstdint>
#include <optional>

namespace net {

// True if 127.0.0.1:port can be bound right now. Port 0 is never available.
bool is_port_available(uint16_t port);

// First bindable port in [start_port, end_port].
std::optional<uint16_t> find_available_port(uint16_t start_port, uint16_t end_port);

// preferred_port if free, else the first free port in 8000-8999, then
// 9000-9999. Falls back to preferred_port so the later bind reports the error.
uint16_t get_available_port_or_default(uint16_t preferred_port);

} // namespace net
