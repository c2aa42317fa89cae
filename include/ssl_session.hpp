// ===================== include/ssl_session.hpp =====================
#pragma once
#include <string>
#include <openssl/ssl.h>
#include "socket_wait.hpp"

namespace netprobe
{
    // TLS client over an already connected non-blocking socket. Certificates
    // are not verified: the session only measures reachability.
    class SslSession
    {
        SSL_CTX *ctx_;
        SSL *ssl_;
        int fd_;

    public:
        SslSession();
        ~SslSession();
        SslSession(const SslSession &) = delete;
        SslSession &operator=(const SslSession &) = delete;

        bool handshake(int sockfd, const std::string &hostname, net::Clock::time_point deadline,
                       const CancelToken *cancel);
        bool sendAll(const std::string &data, net::Clock::time_point deadline,
                     const CancelToken *cancel) const;
        std::string recvSome(net::Clock::time_point deadline, const CancelToken *cancel,
                             net::WaitResult *wr = nullptr) const;

        // Last OpenSSL error as text, empty if none.
        static std::string lastError();
    };
} // namespace netprobe
