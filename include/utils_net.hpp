#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "net_compat.hpp"

namespace netprobe::net {

// Internet checksum over an arbitrary buffer
uint16_t csum16(const void* data, std::size_t len);

// ICMP echo request. The v4 form carries its checksum; for v6 the kernel
// fills it in (raw ICMPv6 sockets checksum at offset 2).
std::vector<uint8_t> build_icmp_echo(uint16_t ident, uint16_t seq, const std::string& payload);
std::vector<uint8_t> build_icmp6_echo(uint16_t ident, uint16_t seq, const std::string& payload);

// What an incoming ICMP message says about one of our echo requests. For
// error messages (time exceeded, unreachable) ident/seq come from the echo
// header quoted inside the error.
struct IcmpMessage {
    uint8_t type = 0;
    uint8_t code = 0;
    uint16_t ident = 0;
    uint16_t seq = 0;
    bool quoted = false;
};

// `buf` starts at the IPv4 header (raw IPv4 sockets deliver it).
std::optional<IcmpMessage> parse_icmp_v4(const uint8_t* buf, std::size_t len);
// `buf` starts at the ICMPv6 header.
std::optional<IcmpMessage> parse_icmp_v6(const uint8_t* buf, std::size_t len);

} // namespace netprobe::net
