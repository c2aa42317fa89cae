// ===================== File: include/quic_initial.hpp =====================
#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace netprobe::quic {

using Bytes = std::vector<std::uint8_t>;

constexpr std::uint32_t kVersion1 = 0x00000001;
constexpr std::size_t kMinInitialDatagram = 1200;

// RFC 9001 section 5.2 Initial secrets, per direction.
struct InitialKeys {
    std::array<std::uint8_t, 16> key{};
    std::array<std::uint8_t, 12> iv{};
    std::array<std::uint8_t, 16> hp{};
};

// Both directions derive from the client's original destination CID.
// Throws ProtocolError when OpenSSL fails.
InitialKeys derive_initial_keys(const Bytes& original_dcid, bool server_side);

// RFC 9000 section 16 variable-length integers.
void put_varint(Bytes& out, std::uint64_t v);
bool get_varint(const std::uint8_t* buf, std::size_t len, std::size_t& pos, std::uint64_t& out);

// quic_transport_parameters extension body for a client.
Bytes client_transport_params(const Bytes& scid);

// TLS 1.3 ClientHello handshake message (no record header) for `server_name`
// offering ALPN h3 / hq-interop, produced by OpenSSL. Throws ProtocolError.
Bytes build_client_hello(const std::string& server_name, const Bytes& scid);

// Protects one Initial packet holding `frames`. Client packets are padded
// so the datagram reaches 1200 bytes.
Bytes seal_initial(const Bytes& dcid, const Bytes& scid, const Bytes& frames,
                   const InitialKeys& keys, std::uint32_t packet_number, bool pad_to_min);

// CRYPTO frame at offset 0.
Bytes crypto_frame(const Bytes& data);

enum class PacketKind { Initial, ZeroRtt, Handshake, Retry, VersionNegotiation, Unknown };

struct OpenedPacket {
    PacketKind kind = PacketKind::Unknown;
    std::uint32_t version = 0;
    Bytes dcid;
    Bytes scid;
    std::uint64_t packet_number = 0;
    Bytes frames; // plaintext, Initial only
};

// Parses the first long-header packet of a datagram and, for Initial packets,
// removes header protection and decrypts with `keys`. nullopt when the
// datagram is malformed or fails authentication.
std::optional<OpenedPacket> open_packet(const std::uint8_t* buf, std::size_t len, const InitialKeys& keys);

struct FrameSummary {
    bool crypto = false;
    bool ack = false;
    bool connection_close = false;
    std::uint64_t close_code = 0;
    std::string close_reason;
};

FrameSummary summarize_frames(const Bytes& frames);

} // namespace netprobe::quic
