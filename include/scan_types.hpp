// ===================== File: include/scan_types.hpp =====================
#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "ip_address.hpp"

namespace netprobe {

// ---- port scan ----

enum class PortScanProtocol { Tcp, Quic, Udp };
enum class PortPreset { Common, WellKnown, Top1000, Full, Custom };
enum class PortState { Open, Closed, Filtered };

const char* to_string(PortScanProtocol p);
const char* to_string(PortPreset p);
const char* to_string(PortState s);
std::optional<PortScanProtocol> parse_port_scan_protocol(const std::string& s);
std::optional<PortPreset> parse_port_preset(const std::string& s);

struct PortScanSetting {
    std::string target;
    PortPreset preset = PortPreset::Common;
    std::vector<std::uint16_t> user_ports;
    PortScanProtocol protocol = PortScanProtocol::Tcp;
    std::chrono::milliseconds timeout{1000};
    bool ordered = false;
    std::size_t concurrency = 0; // 0 -> engine default
};

struct PortScanSample {
    IpAddress ip;
    std::uint16_t port = 0;
    PortState state = PortState::Filtered;
    std::optional<double> rtt_ms;
    std::optional<std::string> message;
    std::optional<std::string> service_name;
    std::uint32_t done = 0;
    std::uint32_t total = 0;
};

struct PortScanReport {
    IpAddress ip;
    std::optional<std::string> hostname;
    PortScanProtocol protocol = PortScanProtocol::Tcp;
    std::vector<PortScanSample> open; // sorted by port
    std::uint32_t attempted = 0;
    std::uint32_t open_count = 0;
    std::uint32_t closed_count = 0;
    std::uint32_t filtered_count = 0;
};

// ---- host scan ----

enum class HostState { Alive, Unreachable };
enum class HostScanProtocol { Icmp, Tcp };

const char* to_string(HostState s);
const char* to_string(HostScanProtocol p);
std::optional<HostScanProtocol> parse_host_scan_protocol(const std::string& s);

struct HostScanSetting {
    // Literal addresses, host names or CIDR blocks.
    std::vector<std::string> targets;
    int hop_limit = 64;
    std::chrono::milliseconds timeout{1000};
    std::uint32_t count = 1;
    std::optional<std::string> payload;
    bool ordered = false;
    std::optional<std::size_t> concurrency;
    HostScanProtocol protocol = HostScanProtocol::Icmp;
    std::uint16_t port = 80; // TCP only
};

struct HostScanProgress {
    IpAddress ip;
    HostState state = HostState::Unreachable;
    std::optional<double> rtt_ms;
    std::optional<std::string> message;
    std::uint32_t done = 0;
    std::uint32_t total = 0;
};

struct AliveHost {
    IpAddress ip;
    double rtt_ms = 0.0;
};

struct HostScanReport {
    std::vector<AliveHost> alive;
    std::vector<IpAddress> unreachable;
    std::uint32_t total = 0; // hosts scanned; alive + unreachable
};

// ---- neighbor scan ----

struct NeighborHost {
    IpAddress ip;
    std::optional<std::string> mac;
    std::optional<std::string> vendor;
    std::optional<double> rtt_ms;
    std::vector<std::string> tags; // "Self", "Gateway", "DNS"
};

struct NeighborScanReport {
    std::string iface;
    std::string subnet; // CIDR that was scanned
    std::vector<NeighborHost> neighbors;
    std::uint32_t total = 0;
};

} // namespace netprobe
