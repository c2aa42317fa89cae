#include "hop_walker.hpp"

#include <cerrno>
#include <cstring>
#include <linux/errqueue.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>

#include "icmp_socket.hpp"
#include "net_compat.hpp"
#include "socket_wait.hpp"

namespace netprobe {

IcmpHopProber::IcmpHopProber(std::shared_ptr<IcmpSocket> socket, std::string payload)
    : socket_(std::move(socket)), payload_(std::move(payload)), ident_(socket_->lease_ident()) {}

IcmpHopProber::~IcmpHopProber() { socket_->release_ident(ident_); }

HopReply IcmpHopProber::probe(const IpAddress& dst, int ttl, int, std::chrono::milliseconds timeout,
                              const CancelToken& cancel) {
    HopReply out;
    if (++seq_ == 0) ++seq_;
    auto res = socket_->echo(dst, ident_, seq_, ttl, payload_, timeout, &cancel);
    switch (res.status) {
        case IcmpSocket::EchoStatus::Cancelled:
            out.kind = HopReplyKind::Aborted;
            return out;
        case IcmpSocket::EchoStatus::Timeout:
            out.kind = HopReplyKind::Timeout;
            return out;
        case IcmpSocket::EchoStatus::SendFailed:
            out.kind = HopReplyKind::Error;
            out.message = res.error;
            return out;
        case IcmpSocket::EchoStatus::Replied:
            break;
    }
    const auto& r = *res.reply;
    out.from = r.from;
    out.rtt_ms = r.rtt_ms;
    switch (r.kind) {
        case IcmpSocket::ReplyKind::EchoReply:
            out.kind = HopReplyKind::DestinationReached;
            break;
        case IcmpSocket::ReplyKind::TimeExceeded:
            out.kind = HopReplyKind::TimeExceeded;
            break;
        case IcmpSocket::ReplyKind::Unreachable:
            out.kind = HopReplyKind::Unreachable;
            out.message = "unreachable (code " + std::to_string(r.code) + ")";
            break;
    }
    return out;
}

UdpHopProber::UdpHopProber(std::uint16_t base_port, int tries_per_hop)
    : base_port_(base_port), tries_per_hop_(tries_per_hop > 0 ? tries_per_hop : 1) {}

// Reads one extended error from the queue and classifies it.
static bool read_error_queue(int fd, bool v6, HopReply& out) {
    char data[512];
    char control[512];
    iovec iov{data, sizeof(data)};
    sockaddr_storage name{};
    msghdr msg{};
    msg.msg_name = &name;
    msg.msg_namelen = sizeof(name);
    msg.msg_iov = &iov;
    msg.msg_iovlen = 1;
    msg.msg_control = control;
    msg.msg_controllen = sizeof(control);

    if (::recvmsg(fd, &msg, MSG_ERRQUEUE | MSG_DONTWAIT) < 0) return false;

    for (cmsghdr* c = CMSG_FIRSTHDR(&msg); c; c = CMSG_NXTHDR(&msg, c)) {
        const bool is_v4 = c->cmsg_level == SOL_IP && c->cmsg_type == IP_RECVERR;
        const bool is_v6 = c->cmsg_level == SOL_IPV6 && c->cmsg_type == IPV6_RECVERR;
        if (!is_v4 && !is_v6) continue;

        auto* ee = reinterpret_cast<sock_extended_err*>(CMSG_DATA(c));
        if (ee->ee_origin != SO_EE_ORIGIN_ICMP && ee->ee_origin != SO_EE_ORIGIN_ICMP6) {
            out.kind = HopReplyKind::Error;
            out.message = std::string("local error: ") + std::strerror(static_cast<int>(ee->ee_errno));
            return true;
        }
        out.from = IpAddress::from_sockaddr(SO_EE_OFFENDER(ee));

        const std::uint8_t type = ee->ee_type;
        const std::uint8_t code = ee->ee_code;
        if (!v6) {
            if (type == net::kIcmpTimeExceeded) out.kind = HopReplyKind::TimeExceeded;
            else if (type == net::kIcmpDestUnreach && code == net::kIcmpCodePortUnreach)
                out.kind = HopReplyKind::DestinationReached;
            else out.kind = HopReplyKind::Unreachable;
        } else {
            if (type == net::kIcmp6TimeExceeded) out.kind = HopReplyKind::TimeExceeded;
            else if (type == net::kIcmp6DestUnreach && code == net::kIcmp6CodePortUnreach)
                out.kind = HopReplyKind::DestinationReached;
            else out.kind = HopReplyKind::Unreachable;
        }
        if (out.kind == HopReplyKind::Unreachable)
            out.message = "unreachable (type " + std::to_string(type) + " code " + std::to_string(code) + ")";
        return true;
    }
    return false;
}

HopReply UdpHopProber::probe(const IpAddress& dst, int ttl, int attempt, std::chrono::milliseconds timeout,
                             const CancelToken& cancel) {
    HopReply out;
    const bool v6 = dst.is_v6();

    net::UniqueFd fd(::socket(dst.family(), SOCK_DGRAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0));
    if (!fd) {
        out.kind = HopReplyKind::Error;
        out.message = std::string("socket: ") + std::strerror(errno);
        return out;
    }

    int on = 1;
    int rc = v6 ? ::setsockopt(fd.get(), IPPROTO_IPV6, IPV6_RECVERR, &on, sizeof(on))
                : ::setsockopt(fd.get(), IPPROTO_IP, IP_RECVERR, &on, sizeof(on));
    if (rc == 0)
        rc = v6 ? ::setsockopt(fd.get(), IPPROTO_IPV6, IPV6_UNICAST_HOPS, &ttl, sizeof(ttl))
                : ::setsockopt(fd.get(), IPPROTO_IP, IP_TTL, &ttl, sizeof(ttl));
    if (rc != 0) {
        out.kind = HopReplyKind::Error;
        out.message = std::string("setsockopt: ") + std::strerror(errno);
        return out;
    }

    // classic traceroute port walk: one port per probe
    const std::uint32_t seq = static_cast<std::uint32_t>((ttl - 1) * tries_per_hop_ + attempt + 1);
    const std::uint16_t port = static_cast<std::uint16_t>(base_port_ + seq % (65536u - base_port_));

    sockaddr_storage ss{};
    socklen_t len = dst.to_sockaddr(port, ss);
    if (::connect(fd.get(), reinterpret_cast<const sockaddr*>(&ss), len) != 0) {
        out.kind = HopReplyKind::Error;
        out.message = std::string("connect: ") + std::strerror(errno);
        return out;
    }

    static const char payload[] = "np:trace-udp";
    const auto t0 = net::Clock::now();
    if (::send(fd.get(), payload, sizeof(payload) - 1, 0) < 0) {
        out.kind = HopReplyKind::Error;
        out.message = std::string("send error: ") + std::strerror(errno);
        return out;
    }

    const auto deadline = t0 + timeout;
    for (;;) {
        short revents = 0;
        auto wr = net::wait_fd(fd.get(), POLLIN, deadline, &cancel, &revents);
        if (wr == net::WaitResult::Cancelled) {
            out.kind = HopReplyKind::Aborted;
            return out;
        }
        if (wr == net::WaitResult::Timeout) {
            out.kind = HopReplyKind::Timeout;
            return out;
        }
        if (wr == net::WaitResult::Failed) {
            out.kind = HopReplyKind::Error;
            out.message = "poll failed";
            return out;
        }

        if (revents & POLLERR) {
            if (read_error_queue(fd.get(), v6, out)) {
                out.rtt_ms = net::elapsed_ms(t0);
                return out;
            }
            continue;
        }

        // the destination answered the datagram itself
        char buf[512];
        if (::recv(fd.get(), buf, sizeof(buf), MSG_DONTWAIT) >= 0) {
            out.kind = HopReplyKind::DestinationReached;
            out.from = dst;
            out.rtt_ms = net::elapsed_ms(t0);
            return out;
        }
    }
}

} // namespace netprobe
