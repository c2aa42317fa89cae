// ===================== include/dns_resolver.hpp =====================
#pragma once
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>
#include <sys/socket.h>
#include <netdb.h>

#include "ip_address.hpp"

namespace netprobe
{
    struct ResolvedAddress
    {
        int family;
        int socktype;
        int protocol;
        sockaddr_storage addr;
        socklen_t addrlen;

        IpAddress ip() const;
    };

    class DNSResolver
    {
    public:
        // Throws ResolutionError(NameNotFound) when getaddrinfo fails.
        static std::vector<ResolvedAddress> resolve(const std::string &host, int port = 0);

        // Best-effort PTR lookup. Returns nullopt when no name is registered.
        static std::optional<std::string> reverse(const IpAddress &ip);
    };
} // namespace netprobe
