#include "probe_driver.hpp"

#include <cerrno>
#include <cstring>

#include "tcp_socket.hpp"

namespace netprobe {

ProbeOutcome TcpDriver::probe(const ProbeRequest& req, const CancelToken& cancel) {
    const std::uint16_t port = req.target.port.value_or(80);
    const auto t0 = net::Clock::now();
    const auto deadline = t0 + req.timeout;

    TcpSocket sock;
    ConnectResult cr = sock.connectTo(req.target.ip, port, deadline, &cancel, req.hop_limit);
    const double rtt = net::elapsed_ms(t0);

    switch (cr.wait) {
        case net::WaitResult::Cancelled:
            return ProbeOutcome::cancelled();
        case net::WaitResult::Timeout:
            return ProbeOutcome::timeout(req.timeout);
        case net::WaitResult::Failed:
            return ProbeOutcome::error(std::string("socket error: ") + std::strerror(cr.error), cr.error);
        case net::WaitResult::Ready:
            break;
    }

    if (cr.error == 0) return ProbeOutcome::done(rtt, "connected");

    auto o = ProbeOutcome::error(std::string("connect error: ") + std::strerror(cr.error), cr.error);
    if (cr.error == ECONNREFUSED || cr.error == ECONNRESET) {
        o.refused = true;
        o.rtt_ms = rtt;
        o.message = "connection refused";
    } else if (cr.error == ETIMEDOUT) {
        o = ProbeOutcome::timeout(req.timeout);
        o.sys_error = ETIMEDOUT;
    }
    return o;
}

} // namespace netprobe
