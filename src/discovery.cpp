#include "discovery.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <functional>

using boost::asio::ip::udp;

namespace discovery {

namespace {

udp::endpoint group_endpoint() {
    return udp::endpoint(boost::asio::ip::make_address_v4(MDNS_GROUP), MDNS_PORT);
}

protocol::DnsRecord make_record(const std::string& name, protocol::RecordType type,
                                uint32_t ttl, bool cache_flush) {
    protocol::DnsRecord record;
    record.name = name;
    record.type = static_cast<uint16_t>(type);
    record.klass = cache_flush ? (protocol::CLASS_IN | protocol::CLASS_FLAG) : protocol::CLASS_IN;
    record.ttl = ttl;
    return record;
}

bool wants(uint16_t asked, protocol::RecordType type) {
    return asked == static_cast<uint16_t>(type) ||
           asked == static_cast<uint16_t>(protocol::RecordType::ANY);
}

} // namespace

// ─── Records ────────────────────────────────────────────────────────────────

ServiceRecord make_service_record(const protocol::DeviceDescriptor& device) {
    boost::system::error_code ec;
    boost::asio::ip::make_address_v4(device.ip, ec);
    if (ec) {
        throw DiscoveryError("cannot advertise non-IPv4 address '" + device.ip + "'");
    }

    const std::string label = "lanshare-" + device.id;

    ServiceRecord service;
    service.instance_name = label + "." + SERVICE_TYPE;
    service.host_name = label + ".local.";
    service.ip = device.ip;
    service.port = device.port;

    // each TXT string is length-prefixed with a single byte; cut on a UTF-8
    // character boundary
    std::string name_entry = "name=" + device.name;
    if (name_entry.size() > 255) {
        size_t cut = 255;
        while (cut > 0 && (static_cast<unsigned char>(name_entry[cut]) & 0xC0) == 0x80) --cut;
        name_entry.resize(cut);
    }
    service.txt = {"id=" + device.id, name_entry, "os=" + device.os};
    return service;
}

protocol::DnsMessage build_response(const ServiceRecord& service, uint32_t ttl) {
    protocol::DnsMessage message;
    message.flags = protocol::FLAG_RESPONSE | protocol::FLAG_AUTHORITATIVE;

    auto ptr = make_record(SERVICE_TYPE, protocol::RecordType::PTR, ttl, false);
    ptr.target = service.instance_name;
    message.answers.push_back(ptr);

    auto srv = make_record(service.instance_name, protocol::RecordType::SRV, ttl, true);
    srv.port = service.port;
    srv.target = service.host_name;
    message.additionals.push_back(srv);

    auto txt = make_record(service.instance_name, protocol::RecordType::TXT, ttl, true);
    txt.txt = service.txt;
    message.additionals.push_back(txt);

    auto a = make_record(service.host_name, protocol::RecordType::A, ttl, true);
    a.address = service.ip;
    message.additionals.push_back(a);

    return message;
}

protocol::DnsMessage build_browse_query() {
    protocol::DnsMessage message;
    protocol::DnsQuestion question;
    question.name = SERVICE_TYPE;
    question.type = static_cast<uint16_t>(protocol::RecordType::PTR);
    question.klass = protocol::CLASS_IN;
    message.questions.push_back(question);
    return message;
}

bool answers_query(const protocol::DnsMessage& query, const ServiceRecord& service) {
    if (query.is_response()) return false;

    for (const auto& question : query.questions) {
        if (protocol::names_equal(question.name, SERVICE_TYPE) &&
            wants(question.type, protocol::RecordType::PTR)) {
            return true;
        }
        if (protocol::names_equal(question.name, service.instance_name) &&
            (wants(question.type, protocol::RecordType::SRV) ||
             wants(question.type, protocol::RecordType::TXT))) {
            return true;
        }
        if (protocol::names_equal(question.name, service.host_name) &&
            wants(question.type, protocol::RecordType::A)) {
            return true;
        }
    }
    return false;
}

std::optional<std::string> txt_value(const std::vector<std::string>& txt, const std::string& key) {
    const std::string prefix = key + "=";
    std::optional<std::string> value;
    for (const auto& entry : txt) {
        if (entry.compare(0, prefix.size(), prefix) == 0) {
            value = entry.substr(prefix.size());
        }
    }
    return value;
}

// ─── PeerCollector ──────────────────────────────────────────────────────────

std::string PeerCollector::key(const std::string& name) {
    std::string k = name;
    if (!k.empty() && k.back() == '.') k.pop_back();
    std::transform(k.begin(), k.end(), k.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return k;
}

void PeerCollector::add(const protocol::DnsMessage& message) {
    for (const auto& record : message.answers) add_record(record);
    for (const auto& record : message.authorities) add_record(record);
    for (const auto& record : message.additionals) add_record(record);
}

void PeerCollector::add_record(const protocol::DnsRecord& record) {
    switch (static_cast<protocol::RecordType>(record.type)) {
        case protocol::RecordType::PTR:
            if (!protocol::names_equal(record.name, SERVICE_TYPE)) return;
            if (record.ttl == 0) {
                instances_.erase(key(record.target));
            } else {
                instances_[key(record.target)] = record.target;
            }
            break;
        case protocol::RecordType::SRV: {
            auto& instance = details_[key(record.name)];
            instance.host = record.target;
            instance.port = record.port;
            instance.has_srv = true;
            break;
        }
        case protocol::RecordType::TXT:
            details_[key(record.name)].txt = record.txt;
            break;
        case protocol::RecordType::A: {
            auto& list = v4_addresses_[key(record.name)];
            if (std::find(list.begin(), list.end(), record.address) == list.end()) {
                list.push_back(record.address);
            }
            break;
        }
        case protocol::RecordType::AAAA: {
            auto& list = v6_addresses_[key(record.name)];
            if (std::find(list.begin(), list.end(), record.address) == list.end()) {
                list.push_back(record.address);
            }
            break;
        }
        default:
            break;
    }
}

std::vector<protocol::DeviceDescriptor> PeerCollector::resolve() const {
    std::vector<protocol::DeviceDescriptor> devices;

    for (const auto& entry : instances_) {
        auto it = details_.find(entry.first);
        if (it == details_.end()) continue;
        const Instance& instance = it->second;
        if (!instance.has_srv || !instance.host || !instance.txt) continue;

        auto id = txt_value(*instance.txt, "id");
        auto name = txt_value(*instance.txt, "name");
        auto os = txt_value(*instance.txt, "os");
        if (!id || !name || !os) continue;

        const std::string host = key(*instance.host);
        std::string ip;
        auto v4 = v4_addresses_.find(host);
        if (v4 != v4_addresses_.end() && !v4->second.empty()) {
            ip = v4->second.front();
        } else {
            auto v6 = v6_addresses_.find(host);
            if (v6 != v6_addresses_.end() && !v6->second.empty()) {
                ip = v6->second.front();
            }
        }
        if (ip.empty()) continue;

        protocol::DeviceDescriptor device;
        device.id = *id;
        device.name = *name;
        device.ip = ip;
        device.port = instance.port;
        device.os = *os;
        devices.push_back(std::move(device));
    }
    return devices;
}

// ─── Advertiser ─────────────────────────────────────────────────────────────

Advertiser::Advertiser(protocol::DeviceDescriptor device)
    : device_(std::move(device)),
      socket_(io_context_),
      announce_timer_(io_context_) {}

Advertiser::~Advertiser() {
    withdraw();
}

void Advertiser::publish() {
    AdvertState expected = AdvertState::Unregistered;
    if (!state_.compare_exchange_strong(expected, AdvertState::Registering)) {
        throw std::logic_error("mDNS advertisement is already active");
    }

    try {
        service_ = make_service_record(device_);

        socket_.open(udp::v4());
        socket_.set_option(udp::socket::reuse_address(true));
        socket_.bind(udp::endpoint(boost::asio::ip::address_v4::any(), MDNS_PORT));
        socket_.set_option(boost::asio::ip::multicast::join_group(
            boost::asio::ip::make_address_v4(MDNS_GROUP)));
        socket_.set_option(boost::asio::ip::multicast::enable_loopback(true));
        socket_.set_option(boost::asio::ip::multicast::hops(255));
    } catch (const DiscoveryError&) {
        state_ = AdvertState::Unregistered;
        throw;
    } catch (const boost::system::system_error& e) {
        boost::system::error_code ignored;
        socket_.close(ignored);
        state_ = AdvertState::Unregistered;
        throw DiscoveryError(std::string("cannot open mDNS socket: ") + e.what());
    }

    goodbye_sent_ = false;
    io_context_.restart();
    start_receive();
    boost::asio::post(io_context_, [this]() { schedule_announcement(2); });

    thread_ = std::thread([this]() {
        try {
            io_context_.run();
        } catch (const std::exception& e) {
            Logger::error(std::string("mDNS responder stopped: ") + e.what());
        }
    });

    state_ = AdvertState::Registered;
    Logger::info("Registered mDNS service: " + service_.instance_name);
}

void Advertiser::withdraw() {
    AdvertState expected = AdvertState::Registered;
    if (!state_.compare_exchange_strong(expected, AdvertState::Unregistering)) {
        return;
    }

    boost::asio::post(io_context_, [this]() {
        goodbye_sent_ = send_response(build_response(service_, 0), group_endpoint());
        announce_timer_.cancel();
        boost::system::error_code ignored;
        socket_.close(ignored);
    });

    if (thread_.joinable()) {
        thread_.join();
    }

    boost::system::error_code ignored;
    socket_.close(ignored);

    if (goodbye_sent_) {
        Logger::info("Unregistered mDNS service: " + service_.instance_name);
    } else {
        Logger::debug("mDNS goodbye for " + service_.instance_name +
                      " was not sent (likely harmless during shutdown)");
    }

    // let the withdrawal packet leave before the caller tears down further
    std::this_thread::sleep_for(UNREGISTER_GRACE);
    state_ = AdvertState::Unregistered;
}

void Advertiser::start_receive() {
    socket_.async_receive_from(
        boost::asio::buffer(recv_buf_), sender_,
        [this](const boost::system::error_code& ec, std::size_t length) {
            if (ec == boost::asio::error::operation_aborted) return;
            if (ec) {
                Logger::debug("mDNS receive error: " + ec.message());
            } else {
                handle_packet(length);
            }
            if (socket_.is_open()) start_receive();
        });
}

void Advertiser::handle_packet(size_t length) {
    protocol::DnsMessage query;
    try {
        query = protocol::deserialize_message(recv_buf_.data(), length);
    } catch (const protocol::DnsFormatError& e) {
        Logger::debug(std::string("Ignoring malformed mDNS packet: ") + e.what());
        return;
    }

    if (!answers_query(query, service_)) return;

    protocol::DnsMessage response = build_response(service_, RECORD_TTL);

    if (sender_.port() != MDNS_PORT) {
        // legacy unicast: echo id and questions back to the querier
        response.id = query.id;
        response.questions = query.questions;
        send_response(response, sender_);
        return;
    }

    bool unicast = std::any_of(query.questions.begin(), query.questions.end(),
                               [](const protocol::DnsQuestion& q) {
                                   return (q.klass & protocol::CLASS_FLAG) != 0;
                               });
    send_response(response, unicast ? sender_ : group_endpoint());
}

void Advertiser::schedule_announcement(int remaining) {
    if (remaining <= 0 || !socket_.is_open()) return;

    send_response(build_response(service_, RECORD_TTL), group_endpoint());

    announce_timer_.expires_after(std::chrono::seconds(1));
    announce_timer_.async_wait([this, remaining](const boost::system::error_code& ec) {
        if (!ec) schedule_announcement(remaining - 1);
    });
}

bool Advertiser::send_response(const protocol::DnsMessage& message, const udp::endpoint& destination) {
    try {
        auto bytes = protocol::serialize_message(message);
        boost::system::error_code ec;
        socket_.send_to(boost::asio::buffer(bytes), destination, 0, ec);
        if (ec) {
            Logger::debug("mDNS send to " + destination.address().to_string() + " failed: " + ec.message());
            return false;
        }
        return true;
    } catch (const protocol::DnsFormatError& e) {
        Logger::warn(std::string("Cannot encode mDNS response: ") + e.what());
        return false;
    }
}

// ─── Browser ────────────────────────────────────────────────────────────────

std::vector<protocol::DeviceDescriptor> Browser::browse(std::chrono::milliseconds timeout) {
    boost::asio::io_context io_context;
    udp::socket socket(io_context);
    const udp::endpoint group = group_endpoint();

    try {
        socket.open(udp::v4());
        socket.set_option(udp::socket::reuse_address(true));

        boost::system::error_code ec;
        socket.bind(udp::endpoint(boost::asio::ip::address_v4::any(), MDNS_PORT), ec);
        if (!ec) {
            socket.set_option(boost::asio::ip::multicast::join_group(group.address()), ec);
        }
        if (ec) {
            // answers to a query sent from a non-5353 port come back by unicast
            Logger::debug("mDNS port unavailable (" + ec.message() + "), using a one-shot query socket");
            socket.close();
            socket.open(udp::v4());
            socket.bind(udp::endpoint(boost::asio::ip::address_v4::any(), 0));
        }
        socket.set_option(boost::asio::ip::multicast::enable_loopback(true));
    } catch (const boost::system::system_error& e) {
        throw DiscoveryError(std::string("cannot start mDNS browse: ") + e.what());
    }

    const auto query = protocol::serialize_message(build_browse_query());
    boost::system::error_code send_ec;
    socket.send_to(boost::asio::buffer(query), group, 0, send_ec);
    if (send_ec) {
        throw DiscoveryError("cannot send mDNS query: " + send_ec.message());
    }

    PeerCollector collector;
    std::array<uint8_t, 9000> buf{};
    udp::endpoint sender;

    std::function<void()> receive = [&]() {
        socket.async_receive_from(
            boost::asio::buffer(buf), sender,
            [&](const boost::system::error_code& ec, std::size_t length) {
                if (ec == boost::asio::error::operation_aborted) return;
                if (!ec) {
                    try {
                        auto message = protocol::deserialize_message(buf.data(), length);
                        if (message.is_response()) collector.add(message);
                    } catch (const protocol::DnsFormatError& e) {
                        Logger::debug(std::string("Ignoring malformed mDNS packet: ") + e.what());
                    }
                }
                if (socket.is_open()) receive();
            });
    };
    receive();

    boost::asio::steady_timer requery(io_context, timeout / 2);
    requery.async_wait([&](const boost::system::error_code& ec) {
        if (ec) return;
        boost::system::error_code resend_ec;
        socket.send_to(boost::asio::buffer(query), group, 0, resend_ec);
        if (resend_ec) Logger::debug("mDNS re-query failed: " + resend_ec.message());
    });

    boost::asio::steady_timer deadline(io_context, timeout);
    deadline.async_wait([&](const boost::system::error_code&) {
        requery.cancel();
        boost::system::error_code ignored;
        socket.close(ignored);
    });

    io_context.run();
    return collector.resolve();
}

} // namespace discovery
