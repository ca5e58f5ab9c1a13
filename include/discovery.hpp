#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <boost/asio.hpp>
#include "protocol/device_info.hpp"
#include "protocol/packet.hpp"

namespace discovery {

constexpr const char* SERVICE_TYPE = "_lanshare._tcp.local.";
constexpr const char* MDNS_GROUP = "224.0.0.251";
constexpr unsigned short MDNS_PORT = 5353;
constexpr uint32_t RECORD_TTL = 120;

constexpr std::chrono::milliseconds BROWSE_TIMEOUT{2000};
constexpr std::chrono::milliseconds UNREGISTER_GRACE{100};

class DiscoveryError : public std::runtime_error {
public:
    explicit DiscoveryError(const std::string& what) : std::runtime_error(what) {}
};

// The DNS-SD names and records published for one descriptor.
struct ServiceRecord {
    std::string instance_name;    // lanshare-<id>._lanshare._tcp.local.
    std::string host_name;        // lanshare-<id>.local.
    std::string ip;
    uint16_t port = 0;
    std::vector<std::string> txt; // id=, name=, os=
};

// Throws DiscoveryError if the descriptor ip is not an IPv4 address.
ServiceRecord make_service_record(const protocol::DeviceDescriptor& device);

// Response carrying PTR (answer) plus SRV, TXT and A (additionals).
// A zero ttl produces the goodbye packet.
protocol::DnsMessage build_response(const ServiceRecord& service, uint32_t ttl);

protocol::DnsMessage build_browse_query();

// True if any question asks for something `service` owns.
bool answers_query(const protocol::DnsMessage& query, const ServiceRecord& service);

// Value of `key=` among TXT strings; the last occurrence wins.
std::optional<std::string> txt_value(const std::vector<std::string>& txt, const std::string& key);

// Accumulates records from the responses seen during one browse and turns
// them into descriptors.
class PeerCollector {
public:
    void add(const protocol::DnsMessage& message);

    // Instances without id/name/os, a port, or an address are left out.
    std::vector<protocol::DeviceDescriptor> resolve() const;

private:
    struct Instance {
        std::optional<std::string> host;
        uint16_t port = 0;
        bool has_srv = false;
        std::optional<std::vector<std::string>> txt;
    };

    void add_record(const protocol::DnsRecord& record);
    static std::string key(const std::string& name);

    std::map<std::string, std::string> instances_;  // lower-cased key -> instance name
    std::map<std::string, Instance> details_;
    std::map<std::string, std::vector<std::string>> v4_addresses_;
    std::map<std::string, std::vector<std::string>> v6_addresses_;
};

enum class AdvertState {
    Unregistered,
    Registering,
    Registered,
    Unregistering
};

// Publishes one descriptor and answers mDNS queries for it until withdrawn.
class Advertiser {
public:
    explicit Advertiser(protocol::DeviceDescriptor device);
    ~Advertiser();

    Advertiser(const Advertiser&) = delete;
    Advertiser& operator=(const Advertiser&) = delete;

    // Throws DiscoveryError on failure (state returns to Unregistered) and
    // std::logic_error when not Unregistered.
    void publish();

    // Sends goodbye, stops the responder and waits UNREGISTER_GRACE.
    // Never throws; a no-op unless Registered.
    void withdraw();

    AdvertState state() const { return state_.load(); }
    const ServiceRecord& service() const { return service_; }

private:
    void start_receive();
    void handle_packet(size_t length);
    void schedule_announcement(int remaining);
    bool send_response(const protocol::DnsMessage& message,
                       const boost::asio::ip::udp::endpoint& destination);

    protocol::DeviceDescriptor device_;
    ServiceRecord service_;
    std::atomic<AdvertState> state_{AdvertState::Unregistered};

    boost::asio::io_context io_context_;
    boost::asio::ip::udp::socket socket_;
    boost::asio::steady_timer announce_timer_;
    boost::asio::ip::udp::endpoint sender_;
    std::array<uint8_t, 9000> recv_buf_{};
    std::thread thread_;
    std::atomic<bool> goodbye_sent_{false};
};

// One bounded browse per call; nothing is cached between calls.
class Browser {
public:
    // Throws DiscoveryError if the socket cannot be opened.
    std::vector<protocol::DeviceDescriptor> browse(std::chrono::milliseconds timeout = BROWSE_TIMEOUT);
};

} // namespace discovery
