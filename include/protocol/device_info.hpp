#pragma once

#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace protocol {

// Describes this instance, or a peer found by a browse.
struct DeviceDescriptor {
    std::string id;
    std::string name;
    std::string ip;
    uint16_t port = 0;
    std::string os;

    std::string url() const {
        return "http://" + ip + ":" + std::to_string(port);
    }
};

inline bool operator==(const DeviceDescriptor& a, const DeviceDescriptor& b) {
    return a.id == b.id && a.name == b.name && a.ip == b.ip
        && a.port == b.port && a.os == b.os;
}

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(DeviceDescriptor, id, name, ip, port, os)

} // namespace protocol
