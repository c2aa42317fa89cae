// ===================== include/tcp_socket.hpp =====================
#pragma once
#include <cstdint>
#include <string>
#include "ip_address.hpp"
#include "socket_wait.hpp"

namespace netprobe
{
    struct ConnectResult
    {
        net::WaitResult wait; // Ready means the handshake finished (either way)
        int error;            // 0 on success, else errno / SO_ERROR
    };

    // Non-blocking TCP client socket; every call is bounded by a deadline and
    // watches an optional cancel token.
    class TcpSocket
    {
        int sockfd_;

    public:
        TcpSocket();
        ~TcpSocket();
        TcpSocket(const TcpSocket &) = delete;
        TcpSocket &operator=(const TcpSocket &) = delete;

        void closeSocket();

        // ttl > 0 sets IP_TTL / IPV6_UNICAST_HOPS before connecting.
        ConnectResult connectTo(const IpAddress &ip, uint16_t port, net::Clock::time_point deadline,
                                const CancelToken *cancel, int ttl = 0);
        bool sendAll(const std::string &data, net::Clock::time_point deadline,
                     const CancelToken *cancel) const;
        // Returns what one read produced; empty on EOF, timeout or error.
        std::string recvSome(net::Clock::time_point deadline, const CancelToken *cancel,
                             net::WaitResult *wr = nullptr) const;
        int fd() const { return sockfd_; }
    };
} // namespace netprobe
