#include "protocol/packet.hpp"
#include <arpa/inet.h>
#include <algorithm>
#include <cctype>
#include <cstring>

namespace protocol {

namespace {

void put_u16(std::vector<uint8_t>& out, uint16_t value) {
    uint16_t be = htons(value);
    uint8_t buf[2];
    std::memcpy(buf, &be, 2);
    out.insert(out.end(), buf, buf + 2);
}

void put_u32(std::vector<uint8_t>& out, uint32_t value) {
    uint32_t be = htonl(value);
    uint8_t buf[4];
    std::memcpy(buf, &be, 4);
    out.insert(out.end(), buf, buf + 4);
}

void put_name(std::vector<uint8_t>& out, const std::string& name) {
    size_t start = 0;
    while (start < name.size()) {
        size_t dot = name.find('.', start);
        if (dot == std::string::npos) dot = name.size();
        size_t len = dot - start;
        if (len == 0) {
            throw DnsFormatError("empty label in name: " + name);
        }
        if (len > 63) {
            throw DnsFormatError("label too long in name: " + name);
        }
        out.push_back(static_cast<uint8_t>(len));
        out.insert(out.end(), name.begin() + start, name.begin() + dot);
        start = dot + 1;
    }
    out.push_back(0);
}

void put_rdata(std::vector<uint8_t>& out, const DnsRecord& record) {
    std::vector<uint8_t> rdata;
    switch (static_cast<RecordType>(record.type)) {
        case RecordType::A: {
            uint8_t addr[4];
            if (inet_pton(AF_INET, record.address.c_str(), addr) != 1) {
                throw DnsFormatError("invalid IPv4 address: " + record.address);
            }
            rdata.assign(addr, addr + 4);
            break;
        }
        case RecordType::AAAA: {
            uint8_t addr[16];
            if (inet_pton(AF_INET6, record.address.c_str(), addr) != 1) {
                throw DnsFormatError("invalid IPv6 address: " + record.address);
            }
            rdata.assign(addr, addr + 16);
            break;
        }
        case RecordType::PTR:
            put_name(rdata, record.target);
            break;
        case RecordType::SRV:
            put_u16(rdata, record.priority);
            put_u16(rdata, record.weight);
            put_u16(rdata, record.port);
            put_name(rdata, record.target);
            break;
        case RecordType::TXT:
            for (const auto& entry : record.txt) {
                if (entry.size() > 255) {
                    throw DnsFormatError("TXT entry longer than 255 bytes");
                }
                rdata.push_back(static_cast<uint8_t>(entry.size()));
                rdata.insert(rdata.end(), entry.begin(), entry.end());
            }
            // RFC 6763: an empty TXT record holds a single zero byte
            if (record.txt.empty()) rdata.push_back(0);
            break;
        default:
            rdata = record.raw;
            break;
    }

    put_u16(out, static_cast<uint16_t>(rdata.size()));
    out.insert(out.end(), rdata.begin(), rdata.end());
}

void put_record(std::vector<uint8_t>& out, const DnsRecord& record) {
    put_name(out, record.name);
    put_u16(out, record.type);
    put_u16(out, record.klass);
    put_u32(out, record.ttl);
    put_rdata(out, record);
}

class Reader {
public:
    Reader(const uint8_t* data, size_t size) : data_(data), size_(size) {}

    size_t offset() const { return offset_; }
    void seek(size_t offset) { offset_ = offset; }

    uint8_t u8() {
        need(1);
        return data_[offset_++];
    }

    uint16_t u16() {
        need(2);
        uint16_t be;
        std::memcpy(&be, data_ + offset_, 2);
        offset_ += 2;
        return ntohs(be);
    }

    uint32_t u32() {
        need(4);
        uint32_t be;
        std::memcpy(&be, data_ + offset_, 4);
        offset_ += 4;
        return ntohl(be);
    }

    void bytes(uint8_t* out, size_t n) {
        if (n == 0) return;
        need(n);
        std::memcpy(out, data_ + offset_, n);
        offset_ += n;
    }

    std::string name() {
        std::string result;
        size_t pos = offset_;
        size_t resume = 0;
        bool jumped = false;
        int jumps = 0;

        while (true) {
            if (pos >= size_) throw DnsFormatError("name runs past end of packet");
            uint8_t len = data_[pos];

            if ((len & 0xC0) == 0xC0) {
                if (pos + 1 >= size_) throw DnsFormatError("truncated compression pointer");
                size_t target = static_cast<size_t>(((len & 0x3F) << 8) | data_[pos + 1]);
                if (++jumps > 32) throw DnsFormatError("compression pointer loop");
                if (!jumped) {
                    resume = pos + 2;
                    jumped = true;
                }
                pos = target;
                continue;
            }
            if ((len & 0xC0) != 0) {
                throw DnsFormatError("unsupported label type");
            }
            if (len == 0) {
                pos += 1;
                break;
            }
            if (pos + 1 + len > size_) throw DnsFormatError("label runs past end of packet");
            result.append(reinterpret_cast<const char*>(data_ + pos + 1), len);
            result.push_back('.');
            if (result.size() > 255) throw DnsFormatError("name too long");
            pos += 1 + len;
        }

        offset_ = jumped ? resume : pos;
        if (result.empty()) result = ".";
        return result;
    }

private:
    void need(size_t n) const {
        if (offset_ + n > size_) {
            throw DnsFormatError("unexpected end of packet");
        }
    }

    const uint8_t* data_;
    size_t size_;
    size_t offset_ = 0;
};

DnsRecord read_record(Reader& reader) {
    DnsRecord record;
    record.name = reader.name();
    record.type = reader.u16();
    record.klass = reader.u16();
    record.ttl = reader.u32();
    uint16_t rdlength = reader.u16();
    size_t rdata_start = reader.offset();
    size_t rdata_end = rdata_start + rdlength;

    switch (static_cast<RecordType>(record.type)) {
        case RecordType::A: {
            if (rdlength != 4) throw DnsFormatError("A record with bad length");
            uint8_t addr[4];
            reader.bytes(addr, 4);
            char text[INET_ADDRSTRLEN];
            inet_ntop(AF_INET, addr, text, sizeof(text));
            record.address = text;
            break;
        }
        case RecordType::AAAA: {
            if (rdlength != 16) throw DnsFormatError("AAAA record with bad length");
            uint8_t addr[16];
            reader.bytes(addr, 16);
            char text[INET6_ADDRSTRLEN];
            inet_ntop(AF_INET6, addr, text, sizeof(text));
            record.address = text;
            break;
        }
        case RecordType::PTR:
            record.target = reader.name();
            break;
        case RecordType::SRV:
            record.priority = reader.u16();
            record.weight = reader.u16();
            record.port = reader.u16();
            record.target = reader.name();
            break;
        case RecordType::TXT:
            while (reader.offset() < rdata_end) {
                uint8_t len = reader.u8();
                if (reader.offset() + len > rdata_end) {
                    throw DnsFormatError("TXT entry runs past rdata");
                }
                std::string entry(len, '\0');
                reader.bytes(reinterpret_cast<uint8_t*>(&entry[0]), len);
                if (!entry.empty()) record.txt.push_back(std::move(entry));
            }
            break;
        default:
            record.raw.resize(rdlength);
            reader.bytes(record.raw.data(), rdlength);
            break;
    }

    if (reader.offset() > rdata_end) {
        throw DnsFormatError("rdata overruns its declared length");
    }
    reader.seek(rdata_end);
    return record;
}

} // namespace

std::vector<uint8_t> serialize_message(const DnsMessage& message) {
    std::vector<uint8_t> out;
    out.reserve(512);

    put_u16(out, message.id);
    put_u16(out, message.flags);
    put_u16(out, static_cast<uint16_t>(message.questions.size()));
    put_u16(out, static_cast<uint16_t>(message.answers.size()));
    put_u16(out, static_cast<uint16_t>(message.authorities.size()));
    put_u16(out, static_cast<uint16_t>(message.additionals.size()));

    for (const auto& question : message.questions) {
        put_name(out, question.name);
        put_u16(out, question.type);
        put_u16(out, question.klass);
    }
    for (const auto& record : message.answers) put_record(out, record);
    for (const auto& record : message.authorities) put_record(out, record);
    for (const auto& record : message.additionals) put_record(out, record);

    return out;
}

DnsMessage deserialize_message(const uint8_t* data, size_t size) {
    if (size < 12) {
        throw DnsFormatError("packet shorter than DNS header");
    }

    Reader reader(data, size);
    DnsMessage message;
    message.id = reader.u16();
    message.flags = reader.u16();
    uint16_t qdcount = reader.u16();
    uint16_t ancount = reader.u16();
    uint16_t nscount = reader.u16();
    uint16_t arcount = reader.u16();

    for (uint16_t i = 0; i < qdcount; ++i) {
        DnsQuestion question;
        question.name = reader.name();
        question.type = reader.u16();
        question.klass = reader.u16();
        message.questions.push_back(std::move(question));
    }
    for (uint16_t i = 0; i < ancount; ++i) message.answers.push_back(read_record(reader));
    for (uint16_t i = 0; i < nscount; ++i) message.authorities.push_back(read_record(reader));
    for (uint16_t i = 0; i < arcount; ++i) message.additionals.push_back(read_record(reader));

    return message;
}

bool names_equal(const std::string& a, const std::string& b) {
    auto trimmed = [](const std::string& s) {
        return (!s.empty() && s.back() == '.') ? s.size() - 1 : s.size();
    };
    size_t la = trimmed(a);
    size_t lb = trimmed(b);
    if (la != lb) return false;
    for (size_t i = 0; i < la; ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace protocol
