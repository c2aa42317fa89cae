//// ===================== File: include/icmp_socket.hpp =====================
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>

#include "cancel_token.hpp"
#include "ip_address.hpp"

namespace netprobe
{
    // Raw ICMP/ICMPv6 socket pair shared by every ICMP probe in the process.
    // Each user (a ping run, a trace) leases its own echo identifier; one
    // receive thread routes replies to the waiting probe by (identifier,
    // sequence) as seen on the wire.
    class IcmpSocket
    {
    public:
        enum class ReplyKind
        {
            EchoReply,
            TimeExceeded,
            Unreachable
        };

        struct Reply
        {
            ReplyKind kind;
            IpAddress from; // who answered (router for errors)
            uint8_t code;
            double rtt_ms;
        };

        enum class EchoStatus
        {
            Replied,
            Timeout,
            Cancelled,
            SendFailed
        };

        struct EchoResult
        {
            EchoStatus status = EchoStatus::Timeout;
            std::optional<Reply> reply;
            std::string error;
        };

        // Opens the sockets and starts the receive thread. IPv4 is required;
        // IPv6 is used when available. Identifiers are leased upward from
        // `first_ident` (the pid when 0). Throws PermissionError without
        // CAP_NET_RAW.
        static std::shared_ptr<IcmpSocket> open(uint16_t first_ident = 0);

        ~IcmpSocket();
        IcmpSocket(const IcmpSocket &) = delete;
        IcmpSocket &operator=(const IcmpSocket &) = delete;

        // An identifier no other live lease holds. Throws ProbeError when all
        // 65535 are taken.
        uint16_t lease_ident();
        void release_ident(uint16_t ident);

        // Sends one echo request carrying `ident` and `seq` with the given
        // TTL / hop limit and waits for the matching reply, error, deadline
        // or cancellation. A (ident, seq) pair already in flight is a
        // SendFailed.
        EchoResult echo(const IpAddress &dst, uint16_t ident, uint16_t seq, int ttl,
                        const std::string &payload, std::chrono::milliseconds timeout,
                        const CancelToken *cancel);

        bool has_ipv6() const { return fd6_ >= 0; }

    private:
        IcmpSocket(int fd4, int fd6, uint16_t ident);

        struct Pending
        {
            IpAddress dst;
            std::chrono::steady_clock::time_point sent_at;
            std::optional<Reply> reply;
        };

        static uint32_t key(uint16_t ident, uint16_t seq) { return (uint32_t(ident) << 16) | seq; }

        void receive_loop();
        void dispatch(bool v6, const uint8_t *buf, size_t len, const IpAddress &from);

        int fd4_ = -1;
        int fd6_ = -1;
        std::mutex send_mu_;
        std::mutex mu_;
        std::condition_variable cv_;
        std::unordered_map<uint32_t, Pending> pending_;
        std::unordered_set<uint16_t> leased_;
        uint16_t next_ident_;

        std::atomic<bool> stop_{false};
        std::thread receiver_;
    };
} // namespace netprobe
