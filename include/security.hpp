#pragma once

#include <string>
#include <cstdint>
#include <array>

namespace security {

// Fill a 16-byte buffer from libsodium's CSPRNG.
std::array<uint8_t, 16> random_bytes_16();

// Random RFC 4122 version 4 UUID, lower-case hyphenated.
std::string generate_uuid_v4();

} // namespace security
