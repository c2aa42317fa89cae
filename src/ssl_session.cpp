// ===================== src/ssl_session.cpp =====================
#include "ssl_session.hpp"
#include <openssl/err.h>
#include <poll.h>
#include <stdexcept>

#include "ip_address.hpp"

namespace netprobe
{
    SslSession::SslSession() : ctx_(nullptr), ssl_(nullptr), fd_(-1)
    {
        // OpenSSL 1.1+ initializes itself on first use.
        const SSL_METHOD *method = TLS_client_method();
        ctx_ = SSL_CTX_new(method);
        if (!ctx_)
            throw std::runtime_error("Failed to create SSL_CTX: " + lastError());
        SSL_CTX_set_verify(ctx_, SSL_VERIFY_NONE, nullptr);
        static const unsigned char alpn[] = {8, 'h', 't', 't', 'p', '/', '1', '.', '1'};
        SSL_CTX_set_alpn_protos(ctx_, alpn, sizeof(alpn));
    }

    SslSession::~SslSession()
    {
        if (ssl_)
        {
            SSL_shutdown(ssl_);
            SSL_free(ssl_);
            ssl_ = nullptr;
        }
        if (ctx_)
        {
            SSL_CTX_free(ctx_);
            ctx_ = nullptr;
        }
    }

    std::string SslSession::lastError()
    {
        unsigned long e = ERR_get_error();
        if (e == 0)
            return std::string{};
        char buf[256];
        ERR_error_string_n(e, buf, sizeof(buf));
        ERR_clear_error();
        return buf;
    }

    // Maps SSL_ERROR_WANT_* to a poll wait. False when the operation failed.
    static bool wait_for_ssl(SSL *ssl, int rc, int fd, net::Clock::time_point deadline,
                             const CancelToken *cancel)
    {
        int err = SSL_get_error(ssl, rc);
        short events;
        if (err == SSL_ERROR_WANT_READ)
            events = POLLIN;
        else if (err == SSL_ERROR_WANT_WRITE)
            events = POLLOUT;
        else
            return false;
        return net::wait_fd(fd, events, deadline, cancel) == net::WaitResult::Ready;
    }

    bool SslSession::handshake(int sockfd, const std::string &hostname, net::Clock::time_point deadline,
                               const CancelToken *cancel)
    {
        ssl_ = SSL_new(ctx_);
        if (!ssl_)
            return false;
        fd_ = sockfd;
        SSL_set_fd(ssl_, sockfd);
        // SNI is for names only
        if (!hostname.empty() && !IpAddress::parse(hostname))
            SSL_set_tlsext_host_name(ssl_, hostname.c_str());
        while (true)
        {
            int rc = SSL_connect(ssl_);
            if (rc == 1)
                return true;
            if (!wait_for_ssl(ssl_, rc, fd_, deadline, cancel))
                return false;
        }
    }

    bool SslSession::sendAll(const std::string &data, net::Clock::time_point deadline,
                             const CancelToken *cancel) const
    {
        if (!ssl_)
            return false;
        size_t off = 0;
        while (off < data.size())
        {
            int n = SSL_write(ssl_, data.data() + off, static_cast<int>(data.size() - off));
            if (n > 0)
            {
                off += static_cast<size_t>(n);
                continue;
            }
            if (!wait_for_ssl(ssl_, n, fd_, deadline, cancel))
                return false;
        }
        return true;
    }

    std::string SslSession::recvSome(net::Clock::time_point deadline, const CancelToken *cancel,
                                     net::WaitResult *wr) const
    {
        std::string response;
        if (!ssl_)
        {
            if (wr)
                *wr = net::WaitResult::Failed;
            return response;
        }
        char buf[4096];
        while (true)
        {
            int bytes = SSL_read(ssl_, buf, sizeof(buf));
            if (bytes > 0)
            {
                response.append(buf, static_cast<size_t>(bytes));
                if (wr)
                    *wr = net::WaitResult::Ready;
                break;
            }
            int err = SSL_get_error(ssl_, bytes);
            if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
            {
                auto w = net::wait_fd(fd_, err == SSL_ERROR_WANT_READ ? POLLIN : POLLOUT, deadline, cancel);
                if (w != net::WaitResult::Ready)
                {
                    if (wr)
                        *wr = w;
                    break;
                }
                continue;
            }
            if (wr)
                *wr = err == SSL_ERROR_ZERO_RETURN ? net::WaitResult::Ready : net::WaitResult::Failed;
            break;
        }
        return response;
    }
} // namespace netprobe
