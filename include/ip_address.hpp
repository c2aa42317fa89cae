#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <sys/socket.h>

namespace netprobe {

// IPv4 or IPv6 literal address, value type.
class IpAddress {
public:
    IpAddress() = default;

    static std::optional<IpAddress> parse(const std::string& text);
    static std::optional<IpAddress> from_sockaddr(const sockaddr* sa);
    static IpAddress v4(std::uint32_t host_order);
    static IpAddress v6(const std::array<std::uint8_t, 16>& bytes);

    int family() const { return family_; }
    bool is_v4() const { return family_ == AF_INET; }
    bool is_v6() const { return family_ == AF_INET6; }
    bool empty() const { return family_ == AF_UNSPEC; }

    std::uint32_t v4_host_order() const;
    const std::array<std::uint8_t, 16>& bytes() const { return bytes_; }

    std::string to_string() const;
    // Fills `out` for connect()/sendto(); returns the address length.
    socklen_t to_sockaddr(std::uint16_t port, sockaddr_storage& out) const;

    bool operator==(const IpAddress& o) const { return family_ == o.family_ && bytes_ == o.bytes_; }
    bool operator!=(const IpAddress& o) const { return !(*this == o); }
    bool operator<(const IpAddress& o) const;

private:
    int family_ = AF_UNSPEC;
    std::array<std::uint8_t, 16> bytes_{}; // v4 uses the first 4 bytes
};

struct IpAddressHash {
    std::size_t operator()(const IpAddress& ip) const;
};

} // namespace netprobe
