#include "security.hpp"
#include "logger.hpp"
#include <sodium.h>
#include <random>
#include <sstream>
#include <iomanip>

namespace security {

std::array<uint8_t, 16> random_bytes_16() {
    std::array<uint8_t, 16> bytes{};
    if (sodium_init() < 0) {
        Logger::warn("libsodium initialization failed, falling back to std::random_device");
        std::random_device rd;
        for (auto& b : bytes) {
            b = static_cast<uint8_t>(rd() & 0xff);
        }
        return bytes;
    }
    randombytes_buf(bytes.data(), bytes.size());
    return bytes;
}

std::string generate_uuid_v4() {
    auto bytes = random_bytes_16();
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0f) | 0x40); // version 4
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3f) | 0x80); // RFC 4122 variant

    std::ostringstream oss;
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) oss << '-';
        oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(bytes[i]);
    }
    return oss.str();
}

} // namespace security
