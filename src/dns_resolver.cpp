// ===================== src/dns_resolver.cpp =====================
#include "dns_resolver.hpp"
#include "errors.hpp"
#include <cstring>

namespace netprobe
{
    IpAddress ResolvedAddress::ip() const
    {
        auto ip = IpAddress::from_sockaddr(reinterpret_cast<const sockaddr *>(&addr));
        return ip ? *ip : IpAddress{};
    }

    std::vector<ResolvedAddress> DNSResolver::resolve(const std::string &host, int port)
    {
        std::vector<ResolvedAddress> results;

        addrinfo hints{};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;
        addrinfo *res = nullptr;

        const std::string portStr = std::to_string(port);
        int status = getaddrinfo(host.c_str(), portStr.c_str(), &hints, &res);
        if (status != 0)
        {
            throw ResolutionError::name_not_found(host, gai_strerror(status));
        }

        for (auto *p = res; p != nullptr; p = p->ai_next)
        {
            if (p->ai_family != AF_INET && p->ai_family != AF_INET6)
                continue;
            ResolvedAddress ra{};
            ra.family = p->ai_family;
            ra.socktype = p->ai_socktype;
            ra.protocol = p->ai_protocol;
            ra.addrlen = static_cast<socklen_t>(p->ai_addrlen);
            std::memcpy(&ra.addr, p->ai_addr, p->ai_addrlen);
            results.push_back(ra);
        }
        freeaddrinfo(res);
        if (results.empty())
        {
            throw ResolutionError::name_not_found(host, "no IPv4/IPv6 address");
        }
        return results;
    }

    std::optional<std::string> DNSResolver::reverse(const IpAddress &ip)
    {
        sockaddr_storage ss{};
        socklen_t len = ip.to_sockaddr(0, ss);
        if (len == 0)
            return std::nullopt;

        char host[NI_MAXHOST] = {};
        int rc = getnameinfo(reinterpret_cast<const sockaddr *>(&ss), len, host, sizeof(host),
                             nullptr, 0, NI_NAMEREQD);
        if (rc != 0)
            return std::nullopt;
        return std::string(host);
    }
} // namespace netprobe
