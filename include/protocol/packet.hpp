#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace protocol {

enum class RecordType : uint16_t {
    A = 1,
    PTR = 12,
    TXT = 16,
    AAAA = 28,
    SRV = 33,
    ANY = 255
};

constexpr uint16_t CLASS_IN = 1;
// Top bit of the class field: cache-flush in records, unicast-response in questions.
constexpr uint16_t CLASS_FLAG = 0x8000;
constexpr uint16_t FLAG_RESPONSE = 0x8000;
constexpr uint16_t FLAG_AUTHORITATIVE = 0x0400;

class DnsFormatError : public std::runtime_error {
public:
    explicit DnsFormatError(const std::string& what) : std::runtime_error(what) {}
};

struct DnsQuestion {
    std::string name;       // dotted, with trailing '.'
    uint16_t type = 0;
    uint16_t klass = CLASS_IN;
};

struct DnsRecord {
    std::string name;
    uint16_t type = 0;
    uint16_t klass = CLASS_IN;
    uint32_t ttl = 0;

    // Decoded rdata, populated according to `type`.
    std::string target;                 // PTR, SRV
    uint16_t priority = 0;              // SRV
    uint16_t weight = 0;                // SRV
    uint16_t port = 0;                  // SRV
    std::vector<std::string> txt;       // TXT
    std::string address;                // A, AAAA (textual)
    std::vector<uint8_t> raw;           // anything else
};

struct DnsMessage {
    uint16_t id = 0;
    uint16_t flags = 0;
    std::vector<DnsQuestion> questions;
    std::vector<DnsRecord> answers;
    std::vector<DnsRecord> authorities;
    std::vector<DnsRecord> additionals;

    bool is_response() const { return (flags & FLAG_RESPONSE) != 0; }
};

// Names are written uncompressed.
std::vector<uint8_t> serialize_message(const DnsMessage& message);

// Follows compression pointers. Throws DnsFormatError on malformed input.
DnsMessage deserialize_message(const uint8_t* data, size_t size);

inline DnsMessage deserialize_message(const std::vector<uint8_t>& buffer) {
    return deserialize_message(buffer.data(), buffer.size());
}

// Case-insensitive DNS name comparison, tolerant of a missing trailing dot.
bool names_equal(const std::string& a, const std::string& b);

} // namespace protocol
