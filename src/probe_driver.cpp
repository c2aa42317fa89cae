#include "probe_driver.hpp"

#include "errors.hpp"

namespace netprobe {

ProbeOutcome ProbeOutcome::done(double rtt_ms, std::string message) {
    ProbeOutcome o;
    o.status = SampleStatus::Done;
    o.rtt_ms = rtt_ms;
    o.message = std::move(message);
    return o;
}

ProbeOutcome ProbeOutcome::error(std::string message, int sys_error) {
    ProbeOutcome o;
    o.status = SampleStatus::Error;
    o.message = std::move(message);
    o.sys_error = sys_error;
    return o;
}

ProbeOutcome ProbeOutcome::timeout(std::chrono::milliseconds after) {
    ProbeOutcome o;
    o.status = SampleStatus::Timeout;
    o.message = "timeout (>" + std::to_string(after.count()) + " ms)";
    return o;
}

ProbeOutcome ProbeOutcome::cancelled() {
    ProbeOutcome o;
    o.status = SampleStatus::Error;
    o.message = "cancelled";
    o.aborted = true;
    return o;
}

std::unique_ptr<ProbeDriver> make_driver(Protocol protocol, const std::shared_ptr<IcmpSocket>& icmp) {
    switch (protocol) {
        case Protocol::Icmp:
            if (!icmp) throw PermissionError("ICMP probes need a raw socket (run as root or grant CAP_NET_RAW)");
            return std::make_unique<IcmpDriver>(icmp);
        case Protocol::Tcp:  return std::make_unique<TcpDriver>();
        case Protocol::Udp:  return std::make_unique<UdpDriver>();
        case Protocol::Quic: return std::make_unique<QuicDriver>();
        case Protocol::Http: return std::make_unique<HttpDriver>();
    }
    throw ProbeError("unsupported protocol");
}

ProbeSample to_sample(const ProbeRequest& req, const ProbeOutcome& outcome, Protocol protocol) {
    ProbeSample s;
    s.seq = req.seq;
    s.target = req.target;
    s.protocol = protocol;
    s.status = outcome.status;
    s.message = outcome.message;
    if (outcome.status == SampleStatus::Done) s.rtt_ms = outcome.rtt_ms;
    return s;
}

} // namespace netprobe
