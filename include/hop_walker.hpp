// ===================== File: include/hop_walker.hpp =====================
#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "cancel_token.hpp"
#include "probe_types.hpp"

namespace netprobe {

class DiagLogger;
class IcmpSocket;

enum class HopReplyKind {
    TimeExceeded,       // router on the path
    DestinationReached, // echo reply / port unreachable from the target
    Unreachable,        // other destination-unreachable codes
    Timeout,
    Error,              // local send failure
    Aborted             // cancelled while waiting
};

struct HopReply {
    HopReplyKind kind = HopReplyKind::Timeout;
    std::optional<IpAddress> from;
    std::optional<double> rtt_ms;
    std::string message;
};

// Sends one TTL-limited probe toward `dst`.
class HopProber {
public:
    virtual ~HopProber() = default;
    virtual HopReply probe(const IpAddress& dst, int ttl, int attempt,
                           std::chrono::milliseconds timeout, const CancelToken& cancel) = 0;
};

// ICMP echo with TTL over the shared raw socket. Holds one echo identifier
// for the whole walk; probes are numbered 1, 2, ... in send order.
class IcmpHopProber : public HopProber {
public:
    explicit IcmpHopProber(std::shared_ptr<IcmpSocket> socket, std::string payload = "np:trace");
    ~IcmpHopProber() override;
    HopReply probe(const IpAddress& dst, int ttl, int attempt,
                   std::chrono::milliseconds timeout, const CancelToken& cancel) override;

private:
    std::shared_ptr<IcmpSocket> socket_;
    std::string payload_;
    std::uint16_t ident_;
    std::uint16_t seq_ = 0;
};

// UDP datagram to a high port; ICMP errors are read from the socket error
// queue (IP_RECVERR), so no raw socket is needed.
class UdpHopProber : public HopProber {
public:
    explicit UdpHopProber(std::uint16_t base_port = 33434, int tries_per_hop = 3);
    HopReply probe(const IpAddress& dst, int ttl, int attempt,
                   std::chrono::milliseconds timeout, const CancelToken& cancel) override;

private:
    std::uint16_t base_port_;
    int tries_per_hop_;
};

// max_hops 0 -> 30, tries 0 -> 1, timeout 0 -> 1000 ms
TraceSetting sanitize(TraceSetting s);

// Traceroute state machine: Probing(1) -> Probing(h+1) ... -> Reached |
// Exhausted, or Cancelled from any state. Each finished hop is reported
// exactly once, with contiguous indices starting at 1.
class HopWalker {
public:
    enum class State { Probing, Reached, Exhausted, Cancelled };

    using HopCallback = std::function<void(const TraceHop&)>;

    HopWalker(HopProber& prober, const IpAddress& destination, const TraceSetting& setting,
              DiagLogger* diag = nullptr);

    // Probes the current hop and transitions. No-op once terminal.
    State step(const CancelToken& cancel);

    // Steps until a terminal state, calling `on_hop` for each finished hop.
    State run(const CancelToken& cancel, const HopCallback& on_hop);

    State state() const { return state_; }
    int current_hop() const { return hop_; }
    const std::vector<TraceHop>& hops() const { return hops_; }
    bool reached() const { return state_ == State::Reached; }

private:
    HopProber& prober_;
    IpAddress dst_;
    TraceSetting setting_;
    DiagLogger* diag_;
    State state_ = State::Probing;
    int hop_ = 1;
    std::vector<TraceHop> hops_;
};

const char* to_string(HopWalker::State s);

} // namespace netprobe
