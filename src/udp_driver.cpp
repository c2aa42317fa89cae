#include "probe_driver.hpp"

#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>

#include "socket_wait.hpp"

namespace netprobe {

ProbeOutcome UdpDriver::probe(const ProbeRequest& req, const CancelToken& cancel) {
    const std::uint16_t port = req.target.port.value_or(kUdpProbeBasePort);
    const IpAddress& ip = req.target.ip;

    net::UniqueFd fd(::socket(ip.family(), SOCK_DGRAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0));
    if (!fd) return ProbeOutcome::error(std::string("socket: ") + std::strerror(errno), errno);

    if (req.hop_limit > 0) {
        int ttl = req.hop_limit;
        int rc = ip.is_v4() ? ::setsockopt(fd.get(), IPPROTO_IP, IP_TTL, &ttl, sizeof(ttl))
                            : ::setsockopt(fd.get(), IPPROTO_IPV6, IPV6_UNICAST_HOPS, &ttl, sizeof(ttl));
        if (rc != 0) return ProbeOutcome::error(std::string("setsockopt TTL: ") + std::strerror(errno), errno);
    }

    // connected, so ICMP errors come back as errno on recv()
    sockaddr_storage ss{};
    socklen_t len = ip.to_sockaddr(port, ss);
    if (::connect(fd.get(), reinterpret_cast<const sockaddr*>(&ss), len) != 0)
        return ProbeOutcome::error(std::string("connect: ") + std::strerror(errno), errno);

    const std::string payload = req.payload.empty() ? std::string("np:udp-probe") : req.payload;
    const auto t0 = net::Clock::now();
    if (::send(fd.get(), payload.data(), payload.size(), 0) < 0) {
        int e = errno;
        if (e == ECONNREFUSED) {
            auto o = ProbeOutcome::done(net::elapsed_ms(t0), "port unreachable");
            o.refused = true;
            return o;
        }
        return ProbeOutcome::error(std::string("send error: ") + std::strerror(e), e);
    }

    const auto deadline = t0 + req.timeout;
    for (;;) {
        auto wr = net::wait_fd(fd.get(), POLLIN, deadline, &cancel);
        if (wr == net::WaitResult::Cancelled) return ProbeOutcome::cancelled();
        if (wr == net::WaitResult::Timeout) return ProbeOutcome::timeout(req.timeout);
        if (wr == net::WaitResult::Failed) return ProbeOutcome::error("poll failed", errno);

        char buf[1500];
        ssize_t n = ::recv(fd.get(), buf, sizeof(buf), 0);
        const double rtt = net::elapsed_ms(t0);
        if (n >= 0) return ProbeOutcome::done(rtt, "reply " + std::to_string(n) + " bytes");

        int e = errno;
        if (e == EAGAIN || e == EWOULDBLOCK || e == EINTR) continue;
        if (e == ECONNREFUSED) {
            auto o = ProbeOutcome::done(rtt, "port unreachable");
            o.refused = true;
            return o;
        }
        auto o = ProbeOutcome::error(std::string("recv error: ") + std::strerror(e), e);
        o.rtt_ms = rtt;
        return o;
    }
}

} // namespace netprobe
