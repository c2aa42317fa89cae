#include "probe_types.hpp"
#include "scan_types.hpp"

#include <algorithm>
#include <cctype>

namespace netprobe {

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

const char* to_string(Protocol p) {
    switch (p) {
        case Protocol::Icmp: return "ICMP";
        case Protocol::Tcp:  return "TCP";
        case Protocol::Udp:  return "UDP";
        case Protocol::Quic: return "QUIC";
        case Protocol::Http: return "HTTP";
    }
    return "?";
}

std::optional<Protocol> parse_protocol(const std::string& s) {
    const std::string l = lower(s);
    if (l == "icmp") return Protocol::Icmp;
    if (l == "tcp")  return Protocol::Tcp;
    if (l == "udp")  return Protocol::Udp;
    if (l == "quic") return Protocol::Quic;
    if (l == "http" || l == "https") return Protocol::Http;
    return std::nullopt;
}

std::optional<std::uint16_t> default_port(Protocol p) {
    switch (p) {
        case Protocol::Icmp: return std::nullopt;
        case Protocol::Tcp:  return 80;
        case Protocol::Udp:  return kUdpProbeBasePort;
        case Protocol::Quic: return 443;
        case Protocol::Http: return 80;
    }
    return std::nullopt;
}

std::string ProbeTarget::display() const {
    std::string out;
    const std::string ip_s = ip.to_string();
    if (hostname && *hostname != ip_s) out = *hostname + " (" + ip_s + ")";
    else out = ip_s;
    if (port) {
        if (ip.is_v6() && !hostname) out = "[" + out + "]";
        out += ":" + std::to_string(*port);
    }
    return out;
}

const char* to_string(SampleStatus s) {
    switch (s) {
        case SampleStatus::Done:    return "done";
        case SampleStatus::Error:   return "error";
        case SampleStatus::Timeout: return "timeout";
    }
    return "?";
}

double ProbeStat::loss_rate() const {
    if (transmitted == 0) return 0.0;
    return 1.0 - static_cast<double>(received) / static_cast<double>(transmitted);
}

const char* to_string(TraceProtocol p) {
    return p == TraceProtocol::Icmp ? "ICMP" : "UDP";
}

std::optional<TraceProtocol> parse_trace_protocol(const std::string& s) {
    const std::string l = lower(s);
    if (l == "icmp") return TraceProtocol::Icmp;
    if (l == "udp")  return TraceProtocol::Udp;
    return std::nullopt;
}

// ---- scan enums ----

const char* to_string(PortScanProtocol p) {
    switch (p) {
        case PortScanProtocol::Tcp:  return "TCP";
        case PortScanProtocol::Quic: return "QUIC";
        case PortScanProtocol::Udp:  return "UDP";
    }
    return "?";
}

const char* to_string(PortPreset p) {
    switch (p) {
        case PortPreset::Common:    return "common";
        case PortPreset::WellKnown: return "wellknown";
        case PortPreset::Top1000:   return "top1000";
        case PortPreset::Full:      return "full";
        case PortPreset::Custom:    return "custom";
    }
    return "?";
}

const char* to_string(PortState s) {
    switch (s) {
        case PortState::Open:     return "open";
        case PortState::Closed:   return "closed";
        case PortState::Filtered: return "filtered";
    }
    return "?";
}

std::optional<PortScanProtocol> parse_port_scan_protocol(const std::string& s) {
    const std::string l = lower(s);
    if (l == "tcp")  return PortScanProtocol::Tcp;
    if (l == "quic") return PortScanProtocol::Quic;
    if (l == "udp")  return PortScanProtocol::Udp;
    return std::nullopt;
}

std::optional<PortPreset> parse_port_preset(const std::string& s) {
    const std::string l = lower(s);
    if (l == "common") return PortPreset::Common;
    if (l == "wellknown" || l == "well-known") return PortPreset::WellKnown;
    if (l == "top1000") return PortPreset::Top1000;
    if (l == "full") return PortPreset::Full;
    if (l == "custom") return PortPreset::Custom;
    return std::nullopt;
}

const char* to_string(HostState s) {
    return s == HostState::Alive ? "alive" : "unreachable";
}

const char* to_string(HostScanProtocol p) {
    return p == HostScanProtocol::Icmp ? "ICMP" : "TCP";
}

std::optional<HostScanProtocol> parse_host_scan_protocol(const std::string& s) {
    const std::string l = lower(s);
    if (l == "icmp") return HostScanProtocol::Icmp;
    if (l == "tcp")  return HostScanProtocol::Tcp;
    return std::nullopt;
}

} // namespace netprobe
