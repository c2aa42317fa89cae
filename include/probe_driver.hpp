// ===================== File: include/probe_driver.hpp =====================
#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "cancel_token.hpp"
#include "probe_types.hpp"

namespace netprobe {

class IcmpSocket;

struct ProbeRequest {
    ProbeTarget target; // port set for TCP/UDP/QUIC/HTTP
    std::uint32_t seq = 0;
    std::chrono::milliseconds timeout{1000};
    int hop_limit = 64;
    std::string payload;
};

// Result of one probe. Drivers never throw for network conditions.
struct ProbeOutcome {
    SampleStatus status = SampleStatus::Timeout;
    std::optional<double> rtt_ms;
    std::string message;
    int sys_error = 0;      // errno behind an Error, if any
    bool refused = false;   // TCP RST or ICMP port unreachable
    bool responded = false; // peer spoke the protocol without completing it
    bool aborted = false;   // cancelled while in flight

    static ProbeOutcome done(double rtt_ms, std::string message = {});
    static ProbeOutcome error(std::string message, int sys_error = 0);
    static ProbeOutcome timeout(std::chrono::milliseconds after);
    static ProbeOutcome cancelled();
};

class ProbeDriver {
public:
    virtual ~ProbeDriver() = default;
    virtual Protocol protocol() const = 0;
    virtual ProbeOutcome probe(const ProbeRequest& req, const CancelToken& cancel) = 0;
};

// Echo request / reply over the shared raw socket. The request carries the
// driver's own echo identifier and the low 16 bits of ProbeRequest::seq.
class IcmpDriver : public ProbeDriver {
public:
    explicit IcmpDriver(std::shared_ptr<IcmpSocket> socket);
    ~IcmpDriver() override;
    Protocol protocol() const override { return Protocol::Icmp; }
    ProbeOutcome probe(const ProbeRequest& req, const CancelToken& cancel) override;

    std::uint16_t ident() const { return ident_; }

private:
    std::shared_ptr<IcmpSocket> socket_;
    std::uint16_t ident_;
};

// Connection handshake. Refusal is an Error with `refused` set.
class TcpDriver : public ProbeDriver {
public:
    Protocol protocol() const override { return Protocol::Tcp; }
    ProbeOutcome probe(const ProbeRequest& req, const CancelToken& cancel) override;
};

// Datagram to target:port. A reply or an ICMP port unreachable is Done
// (the latter with `refused`); silence is Timeout.
class UdpDriver : public ProbeDriver {
public:
    Protocol protocol() const override { return Protocol::Udp; }
    ProbeOutcome probe(const ProbeRequest& req, const CancelToken& cancel) override;
};

// QUIC v1 Initial with a TLS 1.3 ClientHello. Done when the server answers
// with an authenticated Initial carrying handshake data. Retry, version
// negotiation and CONNECTION_CLOSE are Errors with `responded` set.
class QuicDriver : public ProbeDriver {
public:
    Protocol protocol() const override { return Protocol::Quic; }
    ProbeOutcome probe(const ProbeRequest& req, const CancelToken& cancel) override;
};

// GET / over HTTP or HTTPS; rtt is time to the first response byte.
class HttpDriver : public ProbeDriver {
public:
    Protocol protocol() const override { return Protocol::Http; }
    ProbeOutcome probe(const ProbeRequest& req, const CancelToken& cancel) override;
};

// ICMP needs the process-wide raw socket; throws PermissionError when it is
// missing.
std::unique_ptr<ProbeDriver> make_driver(Protocol protocol, const std::shared_ptr<IcmpSocket>& icmp);

ProbeSample to_sample(const ProbeRequest& req, const ProbeOutcome& outcome, Protocol protocol);

} // namespace netprobe
