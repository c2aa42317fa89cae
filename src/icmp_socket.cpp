//// ===================== File: src/icmp_socket.cpp =====================
#include "icmp_socket.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include "errors.hpp"
#include "utils_net.hpp"

namespace netprobe
{
    using Clock = std::chrono::steady_clock;

    std::shared_ptr<IcmpSocket> IcmpSocket::open(uint16_t first_ident)
    {
        int fd4 = ::socket(AF_INET, SOCK_RAW | SOCK_CLOEXEC, IPPROTO_ICMP);
        if (fd4 < 0)
        {
            int e = errno;
            if (e == EPERM || e == EACCES)
                throw PermissionError(std::string("raw ICMP socket: ") + std::strerror(e) +
                                      " (needs root or CAP_NET_RAW)");
            throw ProbeError(std::string("raw ICMP socket: ") + std::strerror(e));
        }
        int fd6 = ::socket(AF_INET6, SOCK_RAW | SOCK_CLOEXEC, IPPROTO_ICMPV6);

        int rcvbuf = 1 << 20;
        ::setsockopt(fd4, SOL_SOCKET, SO_RCVBUF, &rcvbuf, sizeof(rcvbuf));
        if (fd6 >= 0)
            ::setsockopt(fd6, SOL_SOCKET, SO_RCVBUF, &rcvbuf, sizeof(rcvbuf));

        if (first_ident == 0)
            first_ident = static_cast<uint16_t>(::getpid() & 0xFFFF);
        return std::shared_ptr<IcmpSocket>(new IcmpSocket(fd4, fd6, first_ident));
    }

    IcmpSocket::IcmpSocket(int fd4, int fd6, uint16_t ident)
        : fd4_(fd4), fd6_(fd6), next_ident_(ident)
    {
        receiver_ = std::thread([this] { receive_loop(); });
    }

    IcmpSocket::~IcmpSocket()
    {
        stop_.store(true);
        if (receiver_.joinable())
            receiver_.join();
        if (fd4_ != -1)
            ::close(fd4_);
        if (fd6_ != -1)
            ::close(fd6_);
    }

    uint16_t IcmpSocket::lease_ident()
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (leased_.size() >= 0xFFFF)
            throw ProbeError("no free ICMP identifier");
        for (;;)
        {
            uint16_t id = next_ident_++;
            if (id == 0 || leased_.count(id))
                continue;
            leased_.insert(id);
            return id;
        }
    }

    void IcmpSocket::release_ident(uint16_t ident)
    {
        std::lock_guard<std::mutex> lk(mu_);
        leased_.erase(ident);
    }

    IcmpSocket::EchoResult IcmpSocket::echo(const IpAddress &dst, uint16_t ident, uint16_t seq, int ttl,
                                            const std::string &payload, std::chrono::milliseconds timeout,
                                            const CancelToken *cancel)
    {
        EchoResult res;
        if (dst.is_v6() && fd6_ < 0)
        {
            res.status = EchoStatus::SendFailed;
            res.error = "IPv6 ICMP socket unavailable";
            return res;
        }

        const uint32_t k = key(ident, seq);
        {
            std::lock_guard<std::mutex> lk(mu_);
            Pending p;
            p.dst = dst;
            p.sent_at = Clock::now();
            if (!pending_.emplace(k, std::move(p)).second)
            {
                res.status = EchoStatus::SendFailed;
                res.error = "echo " + std::to_string(ident) + "/" + std::to_string(seq) + " already in flight";
                return res;
            }
        }

        const auto pkt = dst.is_v4() ? net::build_icmp_echo(ident, seq, payload)
                                     : net::build_icmp6_echo(ident, seq, payload);
        sockaddr_storage ss{};
        socklen_t sslen = dst.to_sockaddr(0, ss);

        {
            // TTL is per socket, so set + send must not interleave.
            std::lock_guard<std::mutex> slk(send_mu_);
            int rc;
            if (dst.is_v4())
                rc = ::setsockopt(fd4_, IPPROTO_IP, IP_TTL, &ttl, sizeof(ttl));
            else
                rc = ::setsockopt(fd6_, IPPROTO_IPV6, IPV6_UNICAST_HOPS, &ttl, sizeof(ttl));

            int err = rc != 0 ? errno : 0;
            ssize_t n = -1;
            if (rc == 0)
            {
                {
                    std::lock_guard<std::mutex> lk(mu_);
                    pending_[k].sent_at = Clock::now();
                }
                n = ::sendto(dst.is_v4() ? fd4_ : fd6_, pkt.data(), pkt.size(), 0,
                             reinterpret_cast<const sockaddr *>(&ss), sslen);
                if (n < 0)
                    err = errno;
            }
            if (rc != 0 || n != static_cast<ssize_t>(pkt.size()))
            {
                res.status = EchoStatus::SendFailed;
                res.error = std::string(rc != 0 ? "setsockopt TTL: " : "sendto: ") +
                            (err ? std::strerror(err) : "short write");
                std::lock_guard<std::mutex> lk(mu_);
                pending_.erase(k);
                return res;
            }
        }

        const auto deadline = Clock::now() + timeout;
        std::unique_lock<std::mutex> lk(mu_);
        for (;;)
        {
            auto it = pending_.find(k);
            if (it != pending_.end() && it->second.reply)
            {
                res.status = EchoStatus::Replied;
                res.reply = it->second.reply;
                pending_.erase(it);
                return res;
            }
            if (cancel && cancel->cancelled())
            {
                res.status = EchoStatus::Cancelled;
                pending_.erase(k);
                return res;
            }
            auto now = Clock::now();
            if (now >= deadline)
            {
                res.status = EchoStatus::Timeout;
                pending_.erase(k);
                return res;
            }
            cv_.wait_until(lk, std::min(deadline, now + std::chrono::milliseconds(50)));
        }
    }

    void IcmpSocket::receive_loop()
    {
        std::array<uint8_t, 2048> buf{};
        while (!stop_.load())
        {
            pollfd fds[2];
            int nfds = 0;
            fds[nfds].fd = fd4_;
            fds[nfds].events = POLLIN;
            fds[nfds].revents = 0;
            ++nfds;
            if (fd6_ >= 0)
            {
                fds[nfds].fd = fd6_;
                fds[nfds].events = POLLIN;
                fds[nfds].revents = 0;
                ++nfds;
            }

            int rc = ::poll(fds, nfds, 100);
            if (rc <= 0)
                continue;

            for (int i = 0; i < nfds; ++i)
            {
                if (!(fds[i].revents & POLLIN))
                    continue;
                sockaddr_storage from{};
                socklen_t flen = sizeof(from);
                ssize_t n = ::recvfrom(fds[i].fd, buf.data(), buf.size(), MSG_DONTWAIT,
                                       reinterpret_cast<sockaddr *>(&from), &flen);
                if (n <= 0)
                    continue;
                auto src = IpAddress::from_sockaddr(reinterpret_cast<const sockaddr *>(&from));
                if (!src)
                    continue;
                dispatch(fds[i].fd == fd6_, buf.data(), static_cast<size_t>(n), *src);
            }
        }
    }

    void IcmpSocket::dispatch(bool v6, const uint8_t *buf, size_t len, const IpAddress &from)
    {
        auto msg = v6 ? net::parse_icmp_v6(buf, len) : net::parse_icmp_v4(buf, len);
        if (!msg)
            return;

        Reply r{};
        r.from = from;
        r.code = msg->code;
        const uint8_t echo_reply = v6 ? net::kIcmp6EchoReply : net::kIcmpEchoReply;
        const uint8_t time_exceeded = v6 ? net::kIcmp6TimeExceeded : net::kIcmpTimeExceeded;
        if (msg->type == echo_reply)
            r.kind = ReplyKind::EchoReply;
        else if (msg->type == time_exceeded)
            r.kind = ReplyKind::TimeExceeded;
        else
            r.kind = ReplyKind::Unreachable;

        {
            std::lock_guard<std::mutex> lk(mu_);
            auto it = pending_.find(key(msg->ident, msg->seq));
            if (it == pending_.end() || it->second.reply)
                return;
            // echo replies must come from the host we pinged
            if (r.kind == ReplyKind::EchoReply && from != it->second.dst)
                return;
            r.rtt_ms = std::chrono::duration<double, std::milli>(Clock::now() - it->second.sent_at).count();
            it->second.reply = r;
        }
        cv_.notify_all();
    }

} // namespace netprobe
