// ===================== File: include/probe_types.hpp =====================
#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "ip_address.hpp"

namespace netprobe {

enum class Protocol { Icmp, Tcp, Udp, Quic, Http };

const char* to_string(Protocol p);
std::optional<Protocol> parse_protocol(const std::string& s);
// Port used when a ping setting names none (ICMP has no port).
std::optional<std::uint16_t> default_port(Protocol p);

constexpr std::uint16_t kUdpProbeBasePort = 33435;

struct ProbeTarget {
    IpAddress ip;
    std::optional<std::string> hostname;
    std::optional<std::uint16_t> port;

    // "hostname (ip):port" with the optional parts left out.
    std::string display() const;
};

enum class SampleStatus { Done, Error, Timeout };
const char* to_string(SampleStatus s);

struct ProbeSample {
    std::uint32_t seq = 0;
    ProbeTarget target;
    std::optional<double> rtt_ms;
    SampleStatus status = SampleStatus::Timeout;
    std::string message;
    Protocol protocol = Protocol::Icmp;

    bool ok() const { return status == SampleStatus::Done; }
};

struct ProbeStat {
    ProbeTarget target;
    Protocol protocol = Protocol::Icmp;
    std::uint32_t transmitted = 0;
    std::uint32_t received = 0;
    std::optional<double> min_ms;
    std::optional<double> avg_ms;
    std::optional<double> max_ms;
    double rtt_total_ms = 0.0;
    std::vector<ProbeSample> samples;

    // Fraction of transmitted probes without a reply, 0.0 when nothing was sent.
    double loss_rate() const;
};

struct PingSetting {
    Protocol protocol = Protocol::Icmp;
    std::string target;
    std::optional<std::uint16_t> port;
    std::uint32_t count = 4;
    std::chrono::milliseconds timeout{1000};
    std::chrono::milliseconds interval{1000};
    int hop_limit = 64;
    std::string payload = "np:ping";
};

struct PingProgress {
    ProbeSample sample;
    std::uint32_t transmitted = 0;
    std::uint32_t received = 0;
    double percent = 0.0; // completed / count * 100
};

// ---- traceroute ----

enum class TraceProtocol { Icmp, Udp };
const char* to_string(TraceProtocol p);
std::optional<TraceProtocol> parse_trace_protocol(const std::string& s);

struct TraceSetting {
    std::string target;
    TraceProtocol protocol = TraceProtocol::Icmp;
    int max_hops = 30;
    int tries_per_hop = 3;
    std::chrono::milliseconds timeout{1000};
};

struct TraceHop {
    int hop = 0;
    std::optional<IpAddress> ip;
    std::optional<std::string> hostname;
    std::optional<double> rtt_ms;
    bool reached = false;
    std::optional<std::string> note;
};

struct TraceDone {
    IpAddress destination;
    std::optional<std::string> hostname;
    TraceProtocol protocol = TraceProtocol::Icmp;
    bool reached = false;
    int max_hops = 0;
    std::vector<TraceHop> hops;
};

} // namespace netprobe
