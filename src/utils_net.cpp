#include "utils_net.hpp"
#include <cstring>

namespace netprobe::net {

uint16_t csum16(const void* data, std::size_t len) {
    const uint16_t* p = static_cast<const uint16_t*>(data);
    uint32_t sum = 0;
    while (len > 1) { sum += *p++; len -= 2; }
    if (len) sum += *reinterpret_cast<const uint8_t*>(p);
    while (sum >> 16) sum = (sum & 0xFFFF) + (sum >> 16);
    return static_cast<uint16_t>(~sum);
}

static std::vector<uint8_t> echo_packet(uint8_t type, uint16_t ident, uint16_t seq, const std::string& payload) {
    std::vector<uint8_t> pkt(kIcmpHeaderLen + payload.size(), 0);
    pkt[0] = type;
    pkt[1] = 0;
    write_be16(pkt.data() + 4, ident);
    write_be16(pkt.data() + 6, seq);
    if (!payload.empty()) std::memcpy(pkt.data() + kIcmpHeaderLen, payload.data(), payload.size());
    return pkt;
}

std::vector<uint8_t> build_icmp_echo(uint16_t ident, uint16_t seq, const std::string& payload) {
    auto pkt = echo_packet(kIcmpEchoRequest, ident, seq, payload);
    uint16_t c = csum16(pkt.data(), pkt.size());
    std::memcpy(pkt.data() + 2, &c, sizeof(c));
    return pkt;
}

std::vector<uint8_t> build_icmp6_echo(uint16_t ident, uint16_t seq, const std::string& payload) {
    return echo_packet(kIcmp6EchoRequest, ident, seq, payload);
}

std::optional<IcmpMessage> parse_icmp_v4(const uint8_t* buf, std::size_t len) {
    if (len < 20 || ipv4_version(buf) != 4) return std::nullopt;
    std::size_t off = ipv4_header_len(buf);
    if (off < 20 || off + kIcmpHeaderLen > len) return std::nullopt;
    if (ipv4_protocol(buf) != IPPROTO_ICMP) return std::nullopt;

    const uint8_t* icmp = buf + off;
    IcmpMessage m;
    m.type = icmp[0];
    m.code = icmp[1];

    if (m.type == kIcmpEchoReply) {
        m.ident = read_be16(icmp + 4);
        m.seq = read_be16(icmp + 6);
        return m;
    }
    if (m.type != kIcmpTimeExceeded && m.type != kIcmpDestUnreach) return std::nullopt;

    // quoted datagram: inner IPv4 header + first 8 bytes of our echo
    std::size_t inner = off + kIcmpHeaderLen;
    if (inner + 20 > len) return std::nullopt;
    const uint8_t* ip_inner = buf + inner;
    if (ipv4_protocol(ip_inner) != IPPROTO_ICMP) return std::nullopt;
    std::size_t echo_off = inner + ipv4_header_len(ip_inner);
    if (echo_off + kIcmpHeaderLen > len) return std::nullopt;
    const uint8_t* echo = buf + echo_off;
    if (echo[0] != kIcmpEchoRequest) return std::nullopt;

    m.ident = read_be16(echo + 4);
    m.seq = read_be16(echo + 6);
    m.quoted = true;
    return m;
}

std::optional<IcmpMessage> parse_icmp_v6(const uint8_t* buf, std::size_t len) {
    if (len < kIcmpHeaderLen) return std::nullopt;
    IcmpMessage m;
    m.type = buf[0];
    m.code = buf[1];

    if (m.type == kIcmp6EchoReply) {
        m.ident = read_be16(buf + 4);
        m.seq = read_be16(buf + 6);
        return m;
    }
    if (m.type != kIcmp6TimeExceeded && m.type != kIcmp6DestUnreach) return std::nullopt;

    std::size_t inner = kIcmpHeaderLen;
    if (inner + kIpv6HeaderLen + kIcmpHeaderLen > len) return std::nullopt;
    if (ipv6_next_header(buf + inner) != IPPROTO_ICMPV6) return std::nullopt;
    const uint8_t* echo = buf + inner + kIpv6HeaderLen;
    if (echo[0] != kIcmp6EchoRequest) return std::nullopt;

    m.ident = read_be16(echo + 4);
    m.seq = read_be16(echo + 6);
    m.quoted = true;
    return m;
}

} // namespace netprobe::net
