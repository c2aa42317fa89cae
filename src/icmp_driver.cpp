#include "icmp_socket.hpp"
#include "probe_driver.hpp"

namespace netprobe {

IcmpDriver::IcmpDriver(std::shared_ptr<IcmpSocket> socket)
    : socket_(std::move(socket)), ident_(socket_->lease_ident()) {}

IcmpDriver::~IcmpDriver() { socket_->release_ident(ident_); }

ProbeOutcome IcmpDriver::probe(const ProbeRequest& req, const CancelToken& cancel) {
    const auto seq = static_cast<std::uint16_t>(req.seq);
    auto res = socket_->echo(req.target.ip, ident_, seq, req.hop_limit, req.payload, req.timeout, &cancel);
    switch (res.status) {
        case IcmpSocket::EchoStatus::Cancelled:
            return ProbeOutcome::cancelled();
        case IcmpSocket::EchoStatus::Timeout:
            return ProbeOutcome::timeout(req.timeout);
        case IcmpSocket::EchoStatus::SendFailed:
            return ProbeOutcome::error("send error: " + res.error);
        case IcmpSocket::EchoStatus::Replied:
            break;
    }

    const auto& r = *res.reply;
    switch (r.kind) {
        case IcmpSocket::ReplyKind::EchoReply:
            return ProbeOutcome::done(r.rtt_ms);
        case IcmpSocket::ReplyKind::TimeExceeded: {
            auto o = ProbeOutcome::error("time exceeded from " + r.from.to_string());
            o.rtt_ms = r.rtt_ms;
            return o;
        }
        case IcmpSocket::ReplyKind::Unreachable: {
            auto o = ProbeOutcome::error("destination unreachable (code " + std::to_string(r.code) +
                                         ") from " + r.from.to_string());
            o.rtt_ms = r.rtt_ms;
            return o;
        }
    }
    return ProbeOutcome::error("unexpected ICMP reply");
}

} // namespace netprobe
