// ===================== File: src/quic_initial.cpp =====================
#include "quic_initial.hpp"

#include <algorithm>
#include <cstring>
#include <memory>
#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/ssl.h>

#include "errors.hpp"
#include "ip_address.hpp"

namespace netprobe::quic {

namespace {

const std::uint8_t kInitialSaltV1[20] = {
    0x38, 0x76, 0x2c, 0xf7, 0xf5, 0x59, 0x34, 0xb3, 0x4d, 0x17,
    0x9a, 0xe6, 0xa4, 0xc8, 0x0c, 0xad, 0xcc, 0xbb, 0x7f, 0x0a,
};

// "h3", "hq-interop" in wire format
const unsigned char kAlpn[] = {2, 'h', '3', 10, 'h', 'q', '-', 'i', 'n', 't', 'e', 'r', 'o', 'p'};

constexpr unsigned int kTransportParamsExt = 57;
constexpr std::size_t kTagLen = 16;
constexpr std::size_t kPnLen = 4;

using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

Bytes hkdf(int mode, const std::uint8_t* salt, std::size_t salt_len,
           const std::uint8_t* key, std::size_t key_len,
           const std::uint8_t* info, std::size_t info_len, std::size_t out_len) {
    PkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr), EVP_PKEY_CTX_free);
    if (!ctx || EVP_PKEY_derive_init(ctx.get()) <= 0 ||
        EVP_PKEY_CTX_set_hkdf_md(ctx.get(), EVP_sha256()) <= 0 ||
        EVP_PKEY_CTX_set_hkdf_mode(ctx.get(), mode) <= 0 ||
        EVP_PKEY_CTX_set1_hkdf_key(ctx.get(), key, static_cast<int>(key_len)) <= 0)
        throw ProtocolError("HKDF setup failed");
    if (salt && EVP_PKEY_CTX_set1_hkdf_salt(ctx.get(), salt, static_cast<int>(salt_len)) <= 0)
        throw ProtocolError("HKDF salt rejected");
    if (info && EVP_PKEY_CTX_add1_hkdf_info(ctx.get(), info, static_cast<int>(info_len)) <= 0)
        throw ProtocolError("HKDF info rejected");

    Bytes out(out_len);
    std::size_t n = out_len;
    if (EVP_PKEY_derive(ctx.get(), out.data(), &n) <= 0) throw ProtocolError("HKDF derive failed");
    out.resize(n);
    return out;
}

// TLS 1.3 HKDF-Expand-Label with an empty context
Bytes expand_label(const Bytes& secret, const std::string& label, std::size_t len) {
    const std::string full = "tls13 " + label;
    Bytes info;
    info.push_back(static_cast<std::uint8_t>(len >> 8));
    info.push_back(static_cast<std::uint8_t>(len));
    info.push_back(static_cast<std::uint8_t>(full.size()));
    info.insert(info.end(), full.begin(), full.end());
    info.push_back(0);
    return hkdf(EVP_PKEY_HKDEF_MODE_EXPAND_ONLY, nullptr, 0, secret.data(), secret.size(),
                info.data(), info.size(), len);
}

std::array<std::uint8_t, 16> hp_mask(const std::array<std::uint8_t, 16>& hp, const std::uint8_t* sample) {
    CipherCtxPtr ctx(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
    std::array<std::uint8_t, 16> mask{};
    int outl = 0;
    if (!ctx || EVP_EncryptInit_ex(ctx.get(), EVP_aes_128_ecb(), nullptr, hp.data(), nullptr) != 1 ||
        EVP_CIPHER_CTX_set_padding(ctx.get(), 0) != 1 ||
        EVP_EncryptUpdate(ctx.get(), mask.data(), &outl, sample, 16) != 1 || outl != 16)
        throw ProtocolError("header protection failed");
    return mask;
}

std::array<std::uint8_t, 12> make_nonce(const std::array<std::uint8_t, 12>& iv, std::uint64_t pn) {
    auto nonce = iv;
    for (int i = 0; i < 8; ++i) nonce[11 - i] ^= static_cast<std::uint8_t>(pn >> (8 * i));
    return nonce;
}

Bytes gcm_seal(const InitialKeys& keys, std::uint64_t pn, const Bytes& aad, const Bytes& plain) {
    CipherCtxPtr ctx(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
    const auto nonce = make_nonce(keys.iv, pn);
    Bytes out(plain.size() + kTagLen);
    int len = 0;
    if (!ctx || EVP_EncryptInit_ex(ctx.get(), EVP_aes_128_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, 12, nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, keys.key.data(), nonce.data()) != 1 ||
        EVP_EncryptUpdate(ctx.get(), nullptr, &len, aad.data(), static_cast<int>(aad.size())) != 1 ||
        EVP_EncryptUpdate(ctx.get(), out.data(), &len, plain.data(), static_cast<int>(plain.size())) != 1 ||
        EVP_EncryptFinal_ex(ctx.get(), out.data() + len, &len) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(kTagLen),
                            out.data() + plain.size()) != 1)
        throw ProtocolError("AES-GCM seal failed");
    return out;
}

std::optional<Bytes> gcm_open(const InitialKeys& keys, std::uint64_t pn, const Bytes& aad,
                              const std::uint8_t* ct, std::size_t ct_len) {
    if (ct_len < kTagLen) return std::nullopt;
    CipherCtxPtr ctx(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
    const auto nonce = make_nonce(keys.iv, pn);
    const std::size_t body = ct_len - kTagLen;
    Bytes out(body);
    Bytes tag(ct + body, ct + ct_len);
    int len = 0;
    if (!ctx || EVP_DecryptInit_ex(ctx.get(), EVP_aes_128_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, 12, nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, keys.key.data(), nonce.data()) != 1 ||
        EVP_DecryptUpdate(ctx.get(), nullptr, &len, aad.data(), static_cast<int>(aad.size())) != 1 ||
        EVP_DecryptUpdate(ctx.get(), out.data(), &len, ct, static_cast<int>(body)) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(kTagLen), tag.data()) != 1)
        return std::nullopt;
    if (EVP_DecryptFinal_ex(ctx.get(), out.data() + len, &len) != 1) return std::nullopt;
    return out;
}

int add_transport_params(SSL*, unsigned int, unsigned int, const unsigned char** out, std::size_t* outlen,
                         X509*, std::size_t, int*, void* add_arg) {
    const auto* params = static_cast<const Bytes*>(add_arg);
    *out = params->data();
    *outlen = params->size();
    return 1;
}

int parse_transport_params(SSL*, unsigned int, unsigned int, const unsigned char*, std::size_t,
                           X509*, std::size_t, int*, void*) {
    return 1;
}

void put_param(Bytes& out, std::uint64_t id, std::uint64_t value) {
    Bytes v;
    put_varint(v, value);
    put_varint(out, id);
    put_varint(out, v.size());
    out.insert(out.end(), v.begin(), v.end());
}

} // namespace

InitialKeys derive_initial_keys(const Bytes& original_dcid, bool server_side) {
    Bytes initial = hkdf(EVP_PKEY_HKDEF_MODE_EXTRACT_ONLY, kInitialSaltV1, sizeof(kInitialSaltV1),
                         original_dcid.data(), original_dcid.size(), nullptr, 0, 32);
    Bytes secret = expand_label(initial, server_side ? "server in" : "client in", 32);

    InitialKeys k;
    Bytes key = expand_label(secret, "quic key", 16);
    Bytes iv = expand_label(secret, "quic iv", 12);
    Bytes hp = expand_label(secret, "quic hp", 16);
    std::copy(key.begin(), key.end(), k.key.begin());
    std::copy(iv.begin(), iv.end(), k.iv.begin());
    std::copy(hp.begin(), hp.end(), k.hp.begin());
    return k;
}

void put_varint(Bytes& out, std::uint64_t v) {
    if (v < (1ull << 6)) {
        out.push_back(static_cast<std::uint8_t>(v));
    } else if (v < (1ull << 14)) {
        out.push_back(static_cast<std::uint8_t>(0x40 | (v >> 8)));
        out.push_back(static_cast<std::uint8_t>(v));
    } else if (v < (1ull << 30)) {
        out.push_back(static_cast<std::uint8_t>(0x80 | (v >> 24)));
        for (int s = 16; s >= 0; s -= 8) out.push_back(static_cast<std::uint8_t>(v >> s));
    } else {
        out.push_back(static_cast<std::uint8_t>(0xC0 | ((v >> 56) & 0x3F)));
        for (int s = 48; s >= 0; s -= 8) out.push_back(static_cast<std::uint8_t>(v >> s));
    }
}

bool get_varint(const std::uint8_t* buf, std::size_t len, std::size_t& pos, std::uint64_t& out) {
    if (pos >= len) return false;
    const std::size_t n = std::size_t(1) << (buf[pos] >> 6);
    if (pos + n > len) return false;
    std::uint64_t v = buf[pos] & 0x3F;
    for (std::size_t i = 1; i < n; ++i) v = (v << 8) | buf[pos + i];
    pos += n;
    out = v;
    return true;
}

Bytes client_transport_params(const Bytes& scid) {
    Bytes p;
    put_param(p, 0x01, 30000);   // max_idle_timeout (ms)
    put_param(p, 0x03, 1472);    // max_udp_payload_size
    put_param(p, 0x04, 1048576); // initial_max_data
    put_param(p, 0x05, 262144);  // initial_max_stream_data_bidi_local
    put_param(p, 0x06, 262144);  // initial_max_stream_data_bidi_remote
    put_param(p, 0x07, 262144);  // initial_max_stream_data_uni
    put_param(p, 0x08, 100);     // initial_max_streams_bidi
    put_param(p, 0x09, 100);     // initial_max_streams_uni
    // initial_source_connection_id
    put_varint(p, 0x0f);
    put_varint(p, scid.size());
    p.insert(p.end(), scid.begin(), scid.end());
    return p;
}

Bytes build_client_hello(const std::string& server_name, const Bytes& scid) {
    const Bytes params = client_transport_params(scid);

    std::unique_ptr<SSL_CTX, decltype(&SSL_CTX_free)> ctx(SSL_CTX_new(TLS_client_method()), SSL_CTX_free);
    if (!ctx) throw ProtocolError("SSL_CTX_new failed");
    SSL_CTX_set_min_proto_version(ctx.get(), TLS1_3_VERSION);
    SSL_CTX_set_max_proto_version(ctx.get(), TLS1_3_VERSION);
    // QUIC forbids the middlebox-compat session id / CCS
    SSL_CTX_clear_options(ctx.get(), SSL_OP_ENABLE_MIDDLEBOX_COMPAT);
    if (SSL_CTX_set_alpn_protos(ctx.get(), kAlpn, sizeof(kAlpn)) != 0)
        throw ProtocolError("ALPN setup failed");
    if (SSL_CTX_add_custom_ext(ctx.get(), kTransportParamsExt,
                               SSL_EXT_CLIENT_HELLO | SSL_EXT_TLS1_3_ENCRYPTED_EXTENSIONS,
                               add_transport_params, nullptr, const_cast<Bytes*>(&params),
                               parse_transport_params, nullptr) != 1)
        throw ProtocolError("transport parameter extension rejected");

    std::unique_ptr<SSL, decltype(&SSL_free)> ssl(SSL_new(ctx.get()), SSL_free);
    if (!ssl) throw ProtocolError("SSL_new failed");
    BIO* rbio = BIO_new(BIO_s_mem());
    BIO* wbio = BIO_new(BIO_s_mem());
    if (!rbio || !wbio) {
        BIO_free(rbio);
        BIO_free(wbio);
        throw ProtocolError("BIO_new failed");
    }
    SSL_set_bio(ssl.get(), rbio, wbio); // ssl owns both now
    if (!server_name.empty() && !IpAddress::parse(server_name))
        SSL_set_tlsext_host_name(ssl.get(), server_name.c_str());
    SSL_set_connect_state(ssl.get());

    int rc = SSL_do_handshake(ssl.get());
    if (rc == 1 || SSL_get_error(ssl.get(), rc) != SSL_ERROR_WANT_READ)
        throw ProtocolError("ClientHello generation failed");

    char* data = nullptr;
    long n = BIO_get_mem_data(wbio, &data);
    if (n <= 0 || !data) throw ProtocolError("empty ClientHello");

    // strip TLS record headers, keep handshake bytes
    Bytes hello;
    const auto* rec = reinterpret_cast<const std::uint8_t*>(data);
    std::size_t off = 0;
    while (off + 5 <= static_cast<std::size_t>(n)) {
        const std::uint8_t type = rec[off];
        const std::size_t rlen = (std::size_t(rec[off + 3]) << 8) | rec[off + 4];
        if (off + 5 + rlen > static_cast<std::size_t>(n)) break;
        if (type == 22) hello.insert(hello.end(), rec + off + 5, rec + off + 5 + rlen);
        off += 5 + rlen;
    }
    if (hello.empty() || hello[0] != 1) throw ProtocolError("unexpected TLS output");
    return hello;
}

Bytes crypto_frame(const Bytes& data) {
    Bytes f;
    f.push_back(0x06);
    put_varint(f, 0);
    put_varint(f, data.size());
    f.insert(f.end(), data.begin(), data.end());
    return f;
}

Bytes seal_initial(const Bytes& dcid, const Bytes& scid, const Bytes& frames,
                   const InitialKeys& keys, std::uint32_t packet_number, bool pad_to_min) {
    Bytes hdr;
    hdr.push_back(static_cast<std::uint8_t>(0xC0 | (kPnLen - 1)));
    for (int s = 24; s >= 0; s -= 8) hdr.push_back(static_cast<std::uint8_t>(kVersion1 >> s));
    hdr.push_back(static_cast<std::uint8_t>(dcid.size()));
    hdr.insert(hdr.end(), dcid.begin(), dcid.end());
    hdr.push_back(static_cast<std::uint8_t>(scid.size()));
    hdr.insert(hdr.end(), scid.begin(), scid.end());
    hdr.push_back(0); // token length

    // length field is always the 2-byte varint form
    const std::size_t header_len = hdr.size() + 2 + kPnLen;
    std::size_t payload_len = frames.size();
    if (pad_to_min && header_len + payload_len + kTagLen < kMinInitialDatagram)
        payload_len = kMinInitialDatagram - header_len - kTagLen;

    const std::size_t length = kPnLen + payload_len + kTagLen;
    if (length >= (1u << 14)) throw ProtocolError("Initial packet too large");
    hdr.push_back(static_cast<std::uint8_t>(0x40 | (length >> 8)));
    hdr.push_back(static_cast<std::uint8_t>(length));
    const std::size_t pn_offset = hdr.size();
    for (int s = 24; s >= 0; s -= 8) hdr.push_back(static_cast<std::uint8_t>(packet_number >> s));

    Bytes plain = frames;
    plain.resize(payload_len, 0x00); // PADDING frames

    Bytes sealed = gcm_seal(keys, packet_number, hdr, plain);
    Bytes pkt = hdr;
    pkt.insert(pkt.end(), sealed.begin(), sealed.end());

    const auto mask = hp_mask(keys.hp, pkt.data() + pn_offset + 4);
    pkt[0] ^= mask[0] & 0x0F;
    for (std::size_t i = 0; i < kPnLen; ++i) pkt[pn_offset + i] ^= mask[1 + i];
    return pkt;
}

std::optional<OpenedPacket> open_packet(const std::uint8_t* buf, std::size_t len, const InitialKeys& keys) {
    if (len < 7 || !(buf[0] & 0x80)) return std::nullopt;

    OpenedPacket p;
    p.version = (std::uint32_t(buf[1]) << 24) | (std::uint32_t(buf[2]) << 16) |
                (std::uint32_t(buf[3]) << 8) | std::uint32_t(buf[4]);
    std::size_t pos = 5;
    const std::size_t dlen = buf[pos++];
    if (dlen > 20 || pos + dlen >= len) return std::nullopt;
    p.dcid.assign(buf + pos, buf + pos + dlen);
    pos += dlen;
    const std::size_t slen = buf[pos++];
    if (slen > 20 || pos + slen > len) return std::nullopt;
    p.scid.assign(buf + pos, buf + pos + slen);
    pos += slen;

    if (p.version == 0) {
        p.kind = PacketKind::VersionNegotiation;
        return p;
    }
    if (p.version != kVersion1) return p;

    switch ((buf[0] >> 4) & 0x03) {
        case 0: p.kind = PacketKind::Initial; break;
        case 1: p.kind = PacketKind::ZeroRtt; return p;
        case 2: p.kind = PacketKind::Handshake; return p;
        default: p.kind = PacketKind::Retry; return p;
    }

    std::uint64_t token_len = 0, length = 0;
    if (!get_varint(buf, len, pos, token_len) || pos + token_len > len) return std::nullopt;
    pos += static_cast<std::size_t>(token_len);
    if (!get_varint(buf, len, pos, length)) return std::nullopt;
    const std::size_t pn_offset = pos;
    if (length < 4 + kTagLen || pn_offset + length > len) return std::nullopt;

    const auto mask = hp_mask(keys.hp, buf + pn_offset + 4);
    Bytes hdr(buf, buf + pn_offset + 4);
    hdr[0] ^= mask[0] & 0x0F;
    const std::size_t pn_len = (hdr[0] & 0x03) + 1;
    std::uint64_t pn = 0;
    for (std::size_t i = 0; i < pn_len; ++i) {
        hdr[pn_offset + i] ^= mask[1 + i];
        pn = (pn << 8) | hdr[pn_offset + i];
    }
    hdr.resize(pn_offset + pn_len);

    auto plain = gcm_open(keys, pn, hdr, buf + pn_offset + pn_len, length - pn_len);
    if (!plain) return std::nullopt;
    p.packet_number = pn;
    p.frames = std::move(*plain);
    return p;
}

FrameSummary summarize_frames(const Bytes& frames) {
    FrameSummary s;
    const std::uint8_t* b = frames.data();
    const std::size_t n = frames.size();
    std::size_t pos = 0;
    while (pos < n) {
        std::uint64_t type = 0;
        if (!get_varint(b, n, pos, type)) break;
        std::uint64_t a = 0, c = 0;
        switch (type) {
            case 0x00: // PADDING
            case 0x01: // PING
                continue;
            case 0x02:
            case 0x03: {
                std::uint64_t largest, delay, ranges, first;
                if (!get_varint(b, n, pos, largest) || !get_varint(b, n, pos, delay) ||
                    !get_varint(b, n, pos, ranges) || !get_varint(b, n, pos, first))
                    return s;
                for (std::uint64_t i = 0; i < ranges; ++i)
                    if (!get_varint(b, n, pos, a) || !get_varint(b, n, pos, c)) return s;
                if (type == 0x03) {
                    for (int i = 0; i < 3; ++i)
                        if (!get_varint(b, n, pos, a)) return s;
                }
                s.ack = true;
                continue;
            }
            case 0x06: // CRYPTO
                if (!get_varint(b, n, pos, a) || !get_varint(b, n, pos, c) || pos + c > n) return s;
                pos += static_cast<std::size_t>(c);
                s.crypto = true;
                continue;
            case 0x07: // NEW_TOKEN
                if (!get_varint(b, n, pos, c) || pos + c > n) return s;
                pos += static_cast<std::size_t>(c);
                continue;
            case 0x1c:
            case 0x1d: {
                std::uint64_t frame_type = 0, reason_len = 0;
                if (!get_varint(b, n, pos, s.close_code)) return s;
                if (type == 0x1c && !get_varint(b, n, pos, frame_type)) return s;
                s.connection_close = true;
                if (!get_varint(b, n, pos, reason_len) || pos + reason_len > n) return s;
                s.close_reason.assign(reinterpret_cast<const char*>(b + pos), static_cast<std::size_t>(reason_len));
                return s;
            }
            default:
                return s;
        }
    }
    return s;
}

} // namespace netprobe::quic
