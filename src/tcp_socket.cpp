// ===================== src/tcp_socket.cpp =====================
#include "tcp_socket.hpp"
#include <cerrno>
#include <netinet/in.h>
#include <poll.h>
#include <unistd.h>
#include <sys/socket.h>
#include <sys/types.h>

namespace netprobe
{
    TcpSocket::TcpSocket() : sockfd_(-1) {}
    TcpSocket::~TcpSocket() { closeSocket(); }

    void TcpSocket::closeSocket()
    {
        if (sockfd_ != -1)
        {
            ::close(sockfd_);
            sockfd_ = -1;
        }
    }

    ConnectResult TcpSocket::connectTo(const IpAddress &ip, uint16_t port, net::Clock::time_point deadline,
                                       const CancelToken *cancel, int ttl)
    {
        closeSocket();
        sockfd_ = ::socket(ip.family(), SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
        if (sockfd_ == -1)
            return {net::WaitResult::Failed, errno};

        if (ttl > 0)
        {
            int rc = ip.is_v4() ? ::setsockopt(sockfd_, IPPROTO_IP, IP_TTL, &ttl, sizeof(ttl))
                                : ::setsockopt(sockfd_, IPPROTO_IPV6, IPV6_UNICAST_HOPS, &ttl, sizeof(ttl));
            if (rc != 0)
                return {net::WaitResult::Failed, errno};
        }

        sockaddr_storage ss{};
        socklen_t len = ip.to_sockaddr(port, ss);
        if (::connect(sockfd_, reinterpret_cast<const sockaddr *>(&ss), len) == 0)
            return {net::WaitResult::Ready, 0};
        if (errno != EINPROGRESS)
            return {net::WaitResult::Ready, errno};

        auto wr = net::wait_fd(sockfd_, POLLOUT, deadline, cancel);
        if (wr != net::WaitResult::Ready)
            return {wr, wr == net::WaitResult::Timeout ? ETIMEDOUT : 0};

        int err = 0;
        socklen_t elen = sizeof(err);
        if (::getsockopt(sockfd_, SOL_SOCKET, SO_ERROR, &err, &elen) != 0)
            err = errno;
        return {net::WaitResult::Ready, err};
    }

    bool TcpSocket::sendAll(const std::string &data, net::Clock::time_point deadline,
                            const CancelToken *cancel) const
    {
        if (sockfd_ == -1)
        {
            return false;
        }
        size_t off = 0;
        while (off < data.size())
        {
            ssize_t n = ::send(sockfd_, data.data() + off, data.size() - off, MSG_NOSIGNAL);
            if (n > 0)
            {
                off += static_cast<size_t>(n);
                continue;
            }
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK))
            {
                if (net::wait_fd(sockfd_, POLLOUT, deadline, cancel) != net::WaitResult::Ready)
                    return false;
                continue;
            }
            return false;
        }
        return true;
    }

    std::string TcpSocket::recvSome(net::Clock::time_point deadline, const CancelToken *cancel,
                                    net::WaitResult *wr) const
    {
        std::string response;
        char buf[4096];
        while (true)
        {
            ssize_t bytes = ::recv(sockfd_, buf, sizeof(buf), 0);
            if (bytes > 0)
            {
                response.append(buf, static_cast<size_t>(bytes));
                if (wr)
                    *wr = net::WaitResult::Ready;
                break;
            }
            if (bytes < 0 && (errno == EAGAIN || errno == EWOULDBLOCK))
            {
                auto w = net::wait_fd(sockfd_, POLLIN, deadline, cancel);
                if (w != net::WaitResult::Ready)
                {
                    if (wr)
                        *wr = w;
                    break;
                }
                continue;
            }
            if (wr)
                *wr = bytes == 0 ? net::WaitResult::Ready : net::WaitResult::Failed;
            break;
        }
        return response;
    }
} // namespace netprobe
