#include <algorithm>
#include <array>
#include <string>

#include "quic_initial.hpp"

using namespace netprobe::quic;

static Bytes from_hex(const std::string& hex) {
    Bytes out;
    for (std::size_t i = 0; i + 1 < hex.size(); i += 2)
        out.push_back(static_cast<std::uint8_t>(std::stoul(hex.substr(i, 2), nullptr, 16)));
    return out;
}

template <std::size_t N>
static bool equals(const std::array<std::uint8_t, N>& a, const std::string& hex) {
    Bytes b = from_hex(hex);
    return b.size() == N && std::equal(a.begin(), a.end(), b.begin());
}

int main() {
    // RFC 9001 appendix A.1
    const Bytes dcid = from_hex("8394c8f03e515708");
    InitialKeys client = derive_initial_keys(dcid, false);
    if (!equals(client.key, "1f369613dd76d5467730efcbe3b1a22d")) return 1;
    if (!equals(client.iv, "fa044b2f42a3fd3b46fb255c")) return 2;
    if (!equals(client.hp, "9f50449e04a0e810283a1e9933adedd2")) return 3;
    InitialKeys server = derive_initial_keys(dcid, true);
    if (!equals(server.key, "cf3a5331653c364c88f0f379b6067e37")) return 4;
    if (!equals(server.iv, "0ac1493ca1905853b0bba03e")) return 5;
    if (!equals(server.hp, "c206b8d9b9f0f37644430b490eeaa314")) return 6;

    // RFC 9000 appendix A.1 varint samples
    const std::uint64_t values[] = {37, 15293, 494878333, 151288809941952652ull};
    const char* encodings[] = {"25", "7bbd", "9d7f3e7d", "c2197c5eff14e88c"};
    for (int i = 0; i < 4; ++i) {
        Bytes enc;
        put_varint(enc, values[i]);
        if (enc != from_hex(encodings[i])) return 7;
        std::size_t pos = 0;
        std::uint64_t back = 0;
        if (!get_varint(enc.data(), enc.size(), pos, back) || back != values[i] || pos != enc.size()) return 8;
    }
    {
        Bytes cut = from_hex("7b");
        std::size_t pos = 0;
        std::uint64_t v = 0;
        if (get_varint(cut.data(), cut.size(), pos, v)) return 9;
    }

    const Bytes scid = from_hex("c101c202c303c404");
    Bytes hello = build_client_hello("example.com", scid);
    if (hello.size() < 100 || hello[0] != 0x01) return 10;
    const std::size_t body = (std::size_t(hello[1]) << 16) | (std::size_t(hello[2]) << 8) | hello[3];
    if (body + 4 != hello.size()) return 11;

    // client Initial: padded, decryptable with the client keys
    Bytes datagram = seal_initial(dcid, scid, crypto_frame(hello), client, 0, true);
    if (datagram.size() < kMinInitialDatagram) return 12;
    if ((datagram[0] & 0xF0) != 0xC0) return 13;
    auto opened = open_packet(datagram.data(), datagram.size(), client);
    if (!opened || opened->kind != PacketKind::Initial || opened->version != kVersion1) return 14;
    if (opened->dcid != dcid || opened->scid != scid || opened->packet_number != 0) return 15;
    FrameSummary fs = summarize_frames(opened->frames);
    if (!fs.crypto || fs.connection_close) return 16;
    // wrong keys fail authentication
    if (open_packet(datagram.data(), datagram.size(), server)) return 17;

    // server Initial carrying ACK + CONNECTION_CLOSE
    Bytes frames = from_hex("0200000000");
    frames.push_back(0x1c);
    put_varint(frames, 0x0a);
    put_varint(frames, 0x06);
    const std::string reason = "bye";
    put_varint(frames, reason.size());
    frames.insert(frames.end(), reason.begin(), reason.end());
    Bytes reply = seal_initial(scid, from_hex("0102030405060708"), frames, server, 3, false);
    if (reply.size() >= kMinInitialDatagram) return 18;
    auto sr = open_packet(reply.data(), reply.size(), server);
    if (!sr || sr->packet_number != 3) return 19;
    fs = summarize_frames(sr->frames);
    if (!fs.ack || !fs.connection_close || fs.close_code != 0x0a || fs.close_reason != "bye") return 20;

    // version negotiation needs no keys
    Bytes vn = {0x80, 0, 0, 0, 0, 8};
    vn.insert(vn.end(), scid.begin(), scid.end());
    vn.push_back(8);
    vn.insert(vn.end(), dcid.begin(), dcid.end());
    Bytes versions = from_hex("6b3343cfff00001d");
    vn.insert(vn.end(), versions.begin(), versions.end());
    auto v = open_packet(vn.data(), vn.size(), client);
    if (!v || v->kind != PacketKind::VersionNegotiation) return 21;

    // truncated and short-header datagrams are rejected
    if (open_packet(datagram.data(), 40, client)) return 22;
    Bytes short_hdr = from_hex("4000000000000000");
    if (open_packet(short_hdr.data(), short_hdr.size(), client)) return 23;
    return 0;
}
