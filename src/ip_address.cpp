#include "ip_address.hpp"

#include <arpa/inet.h>
#include <cstring>
#include <netinet/in.h>

namespace netprobe {

std::optional<IpAddress> IpAddress::parse(const std::string& text) {
    IpAddress ip;
    in_addr a4{};
    if (inet_pton(AF_INET, text.c_str(), &a4) == 1) {
        ip.family_ = AF_INET;
        std::memcpy(ip.bytes_.data(), &a4, 4);
        return ip;
    }
    in6_addr a6{};
    if (inet_pton(AF_INET6, text.c_str(), &a6) == 1) {
        ip.family_ = AF_INET6;
        std::memcpy(ip.bytes_.data(), &a6, 16);
        return ip;
    }
    return std::nullopt;
}

std::optional<IpAddress> IpAddress::from_sockaddr(const sockaddr* sa) {
    if (!sa) return std::nullopt;
    IpAddress ip;
    if (sa->sa_family == AF_INET) {
        auto* sin = reinterpret_cast<const sockaddr_in*>(sa);
        ip.family_ = AF_INET;
        std::memcpy(ip.bytes_.data(), &sin->sin_addr, 4);
        return ip;
    }
    if (sa->sa_family == AF_INET6) {
        auto* sin6 = reinterpret_cast<const sockaddr_in6*>(sa);
        ip.family_ = AF_INET6;
        std::memcpy(ip.bytes_.data(), &sin6->sin6_addr, 16);
        return ip;
    }
    return std::nullopt;
}

IpAddress IpAddress::v4(std::uint32_t host_order) {
    IpAddress ip;
    ip.family_ = AF_INET;
    ip.bytes_[0] = static_cast<std::uint8_t>(host_order >> 24);
    ip.bytes_[1] = static_cast<std::uint8_t>(host_order >> 16);
    ip.bytes_[2] = static_cast<std::uint8_t>(host_order >> 8);
    ip.bytes_[3] = static_cast<std::uint8_t>(host_order);
    return ip;
}

IpAddress IpAddress::v6(const std::array<std::uint8_t, 16>& bytes) {
    IpAddress ip;
    ip.family_ = AF_INET6;
    ip.bytes_ = bytes;
    return ip;
}

std::uint32_t IpAddress::v4_host_order() const {
    return (std::uint32_t(bytes_[0]) << 24) | (std::uint32_t(bytes_[1]) << 16) |
           (std::uint32_t(bytes_[2]) << 8) | std::uint32_t(bytes_[3]);
}

std::string IpAddress::to_string() const {
    char buf[INET6_ADDRSTRLEN] = {};
    if (family_ == AF_INET) {
        if (inet_ntop(AF_INET, bytes_.data(), buf, sizeof(buf))) return buf;
    } else if (family_ == AF_INET6) {
        if (inet_ntop(AF_INET6, bytes_.data(), buf, sizeof(buf))) return buf;
    }
    return std::string{};
}

socklen_t IpAddress::to_sockaddr(std::uint16_t port, sockaddr_storage& out) const {
    std::memset(&out, 0, sizeof(out));
    if (family_ == AF_INET) {
        auto* sin = reinterpret_cast<sockaddr_in*>(&out);
        sin->sin_family = AF_INET;
        sin->sin_port = htons(port);
        std::memcpy(&sin->sin_addr, bytes_.data(), 4);
        return sizeof(sockaddr_in);
    }
    if (family_ == AF_INET6) {
        auto* sin6 = reinterpret_cast<sockaddr_in6*>(&out);
        sin6->sin6_family = AF_INET6;
        sin6->sin6_port = htons(port);
        std::memcpy(&sin6->sin6_addr, bytes_.data(), 16);
        return sizeof(sockaddr_in6);
    }
    return 0;
}

bool IpAddress::operator<(const IpAddress& o) const {
    if (family_ != o.family_) return family_ < o.family_;
    return bytes_ < o.bytes_;
}

std::size_t IpAddressHash::operator()(const IpAddress& ip) const {
    // FNV-1a over family + bytes
    std::size_t h = 1469598103934665603ull;
    auto mix = [&h](std::uint8_t b) {
        h ^= b;
        h *= 1099511628211ull;
    };
    mix(static_cast<std::uint8_t>(ip.family()));
    for (auto b : ip.bytes()) mix(b);
    return h;
}

} // namespace netprobe
