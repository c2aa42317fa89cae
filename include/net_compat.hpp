#pragma once
/**
 * net_compat.hpp
 * ICMP / ICMPv6 constants and byte-level IPv4 header accessors used by the
 * raw-socket code. Reading header fields from the byte buffer instead of
 * through struct iphdr / struct ip keeps the parsing identical on Linux and
 * macOS/BSD, whose header structs use different field names.
 */

#include <cstddef>
#include <cstdint>
#include <netinet/in.h>

namespace netprobe::net {

// ICMPv4 (RFC 792)
constexpr std::uint8_t kIcmpEchoReply      = 0;
constexpr std::uint8_t kIcmpDestUnreach    = 3;
constexpr std::uint8_t kIcmpEchoRequest    = 8;
constexpr std::uint8_t kIcmpTimeExceeded   = 11;
constexpr std::uint8_t kIcmpCodePortUnreach = 3;

// ICMPv6 (RFC 4443)
constexpr std::uint8_t kIcmp6DestUnreach   = 1;
constexpr std::uint8_t kIcmp6TimeExceeded  = 3;
constexpr std::uint8_t kIcmp6EchoRequest   = 128;
constexpr std::uint8_t kIcmp6EchoReply     = 129;
constexpr std::uint8_t kIcmp6CodePortUnreach = 4;

constexpr std::size_t kIcmpHeaderLen = 8;
constexpr std::size_t kIpv6HeaderLen = 40;

// IPv4 header, raw bytes
inline std::size_t ipv4_header_len(const std::uint8_t* ip) { return static_cast<std::size_t>(ip[0] & 0x0F) * 4; }
inline std::uint8_t ipv4_version(const std::uint8_t* ip) { return ip[0] >> 4; }
inline std::uint8_t ipv4_protocol(const std::uint8_t* ip) { return ip[9]; }
inline const std::uint8_t* ipv4_saddr(const std::uint8_t* ip) { return ip + 12; }

// IPv6 header, raw bytes
inline std::uint8_t ipv6_next_header(const std::uint8_t* ip6) { return ip6[6]; }

inline std::uint16_t read_be16(const std::uint8_t* p) {
    return static_cast<std::uint16_t>((p[0] << 8) | p[1]);
}

inline void write_be16(std::uint8_t* p, std::uint16_t v) {
    p[0] = static_cast<std::uint8_t>(v >> 8);
    p[1] = static_cast<std::uint8_t>(v);
}

} // namespace netprobe::net
