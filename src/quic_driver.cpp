#include "probe_driver.hpp"

#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <openssl/rand.h>
#include <poll.h>
#include <sys/socket.h>

#include "errors.hpp"
#include "quic_initial.hpp"
#include "socket_wait.hpp"

namespace netprobe {

static quic::Bytes random_cid(std::size_t n) {
    quic::Bytes cid(n);
    if (RAND_bytes(cid.data(), static_cast<int>(n)) != 1) throw ProtocolError("RAND_bytes failed");
    return cid;
}

ProbeOutcome QuicDriver::probe(const ProbeRequest& req, const CancelToken& cancel) {
    const std::uint16_t port = req.target.port.value_or(443);
    const IpAddress& ip = req.target.ip;
    const std::string sni = req.target.hostname ? *req.target.hostname : std::string{};

    quic::Bytes dcid, datagram;
    quic::InitialKeys server_keys;
    try {
        dcid = random_cid(8);
        const quic::Bytes scid = random_cid(8);
        const quic::InitialKeys client_keys = quic::derive_initial_keys(dcid, false);
        server_keys = quic::derive_initial_keys(dcid, true);
        const quic::Bytes hello = quic::build_client_hello(sni, scid);
        datagram = quic::seal_initial(dcid, scid, quic::crypto_frame(hello), client_keys, 0, true);
    } catch (const ProtocolError& e) {
        return ProbeOutcome::error(std::string("QUIC setup: ") + e.what());
    }

    net::UniqueFd fd(::socket(ip.family(), SOCK_DGRAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0));
    if (!fd) return ProbeOutcome::error(std::string("socket: ") + std::strerror(errno), errno);

    sockaddr_storage ss{};
    socklen_t len = ip.to_sockaddr(port, ss);
    if (::connect(fd.get(), reinterpret_cast<const sockaddr*>(&ss), len) != 0)
        return ProbeOutcome::error(std::string("connect: ") + std::strerror(errno), errno);

    const auto t0 = net::Clock::now();
    if (::send(fd.get(), datagram.data(), datagram.size(), 0) < 0)
        return ProbeOutcome::error(std::string("send error: ") + std::strerror(errno), errno);

    const auto deadline = t0 + req.timeout;
    std::uint8_t buf[2048];
    for (;;) {
        auto wr = net::wait_fd(fd.get(), POLLIN, deadline, &cancel);
        if (wr == net::WaitResult::Cancelled) return ProbeOutcome::cancelled();
        if (wr == net::WaitResult::Timeout) return ProbeOutcome::timeout(req.timeout);
        if (wr == net::WaitResult::Failed) return ProbeOutcome::error("poll failed", errno);

        ssize_t n = ::recv(fd.get(), buf, sizeof(buf), 0);
        const double rtt = net::elapsed_ms(t0);
        if (n < 0) {
            int e = errno;
            if (e == EAGAIN || e == EWOULDBLOCK || e == EINTR) continue;
            auto o = ProbeOutcome::error(e == ECONNREFUSED ? std::string("port unreachable")
                                                           : std::string("recv error: ") + std::strerror(e),
                                         e);
            o.refused = e == ECONNREFUSED;
            return o;
        }

        std::optional<quic::OpenedPacket> pkt;
        try {
            pkt = quic::open_packet(buf, static_cast<std::size_t>(n), server_keys);
        } catch (const ProtocolError& e) {
            return ProbeOutcome::error(std::string("QUIC decode: ") + e.what());
        }
        if (!pkt) continue; // not for us / failed authentication

        ProbeOutcome o;
        switch (pkt->kind) {
            case quic::PacketKind::VersionNegotiation:
                o = ProbeOutcome::error("version negotiation (QUIC v1 not offered)");
                o.responded = true;
                o.rtt_ms = rtt;
                return o;
            case quic::PacketKind::Retry:
                o = ProbeOutcome::error("server requested retry");
                o.responded = true;
                o.rtt_ms = rtt;
                return o;
            case quic::PacketKind::Initial: {
                const auto fs = quic::summarize_frames(pkt->frames);
                if (fs.connection_close) {
                    o = ProbeOutcome::error("connection close (code " + std::to_string(fs.close_code) +
                                            (fs.close_reason.empty() ? std::string{} : ": " + fs.close_reason) + ")");
                    o.responded = true;
                    o.rtt_ms = rtt;
                    return o;
                }
                if (fs.crypto) return ProbeOutcome::done(rtt, "handshake");
                continue; // bare ACK, keep waiting
            }
            default:
                continue;
        }
    }
}

} // namespace netprobe
