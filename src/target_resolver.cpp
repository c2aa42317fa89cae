// ===================== File: src/target_resolver.cpp =====================
#include "target_resolver.hpp"

#include <limits>
#include <unordered_set>

#include "dns_resolver.hpp"
#include "errors.hpp"

namespace netprobe {

static std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return std::string{};
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

static std::uint64_t saturating_add(std::uint64_t a, std::uint64_t b) {
    const std::uint64_t max = std::numeric_limits<std::uint64_t>::max();
    return b > max - a ? max : a + b;
}

bool TargetResolver::parse_cidr(const std::string& text, CidrBlock& out) {
    const std::string t = trim(text);
    size_t slash = t.find('/');
    if (slash == std::string::npos) return false;

    const std::string addr_s = t.substr(0, slash);
    const std::string prefix_s = t.substr(slash + 1);
    auto ip = IpAddress::parse(addr_s);
    if (!ip) throw ResolutionError::invalid(text, "bad network address");

    if (prefix_s.empty() || prefix_s.size() > 3 ||
        prefix_s.find_first_not_of("0123456789") != std::string::npos)
        throw ResolutionError::invalid(text, "bad prefix length");
    int prefix = std::stoi(prefix_s);
    const int bits = ip->is_v4() ? 32 : 128;
    if (prefix < 0 || prefix > bits) throw ResolutionError::invalid(text, "bad prefix length");

    // clear host bits
    auto bytes = ip->bytes();
    const int nbytes = bits / 8;
    for (int i = 0; i < nbytes; ++i) {
        int keep = prefix - i * 8;
        if (keep >= 8) continue;
        if (keep <= 0) { bytes[i] = 0; continue; }
        bytes[i] &= static_cast<std::uint8_t>(0xFF << (8 - keep));
    }
    if (ip->is_v4()) {
        std::uint32_t v = (std::uint32_t(bytes[0]) << 24) | (std::uint32_t(bytes[1]) << 16) |
                          (std::uint32_t(bytes[2]) << 8) | std::uint32_t(bytes[3]);
        out.base = IpAddress::v4(v);
    } else {
        out.base = IpAddress::v6(bytes);
    }
    out.prefix = prefix;
    return true;
}

std::uint64_t TargetResolver::usable_host_count(const CidrBlock& block) {
    if (block.base.is_v4()) {
        const int host_bits = 32 - block.prefix;
        std::uint64_t total = std::uint64_t(1) << host_bits;
        return block.prefix <= 30 ? total - 2 : total;
    }
    const int host_bits = 128 - block.prefix;
    if (host_bits >= 64) return std::numeric_limits<std::uint64_t>::max();
    return std::uint64_t(1) << host_bits;
}

std::vector<IpAddress> TargetResolver::expand(const CidrBlock& block) {
    std::vector<IpAddress> out;
    const std::uint64_t n = usable_host_count(block);
    out.reserve(static_cast<size_t>(n));

    if (block.base.is_v4()) {
        std::uint32_t first = block.base.v4_host_order();
        if (block.prefix <= 30) first += 1;
        for (std::uint64_t i = 0; i < n; ++i) out.push_back(IpAddress::v4(first + static_cast<std::uint32_t>(i)));
        return out;
    }

    auto cur = block.base.bytes();
    for (std::uint64_t i = 0; i < n; ++i) {
        out.push_back(IpAddress::v6(cur));
        for (int b = 15; b >= 0; --b) {
            if (++cur[b] != 0) break;
        }
    }
    return out;
}

ProbeTarget TargetResolver::resolve_one(const std::string& host) const {
    const std::string h = trim(host);
    if (h.empty()) throw ResolutionError::invalid(host, "empty target");
    if (h.find('/') != std::string::npos) throw ResolutionError::invalid(host, "expected a single host");

    ProbeTarget t;
    if (auto ip = IpAddress::parse(h)) {
        t.ip = *ip;
        return t;
    }

    auto addrs = DNSResolver::resolve(h);
    const ResolvedAddress* pick = &addrs.front();
    for (const auto& ra : addrs) {
        if (ra.family == AF_INET) { pick = &ra; break; }
    }
    t.ip = pick->ip();
    t.hostname = h;
    return t;
}

std::vector<ProbeTarget> TargetResolver::resolve(const std::string& host_or_cidr) const {
    return resolve_all({host_or_cidr});
}

std::vector<ProbeTarget> TargetResolver::resolve_all(const std::vector<std::string>& entries) const {
    // Size check first so an oversized request has no side effects.
    std::vector<CidrBlock> blocks(entries.size());
    std::vector<bool> is_block(entries.size(), false);
    std::uint64_t total = 0;
    for (size_t i = 0; i < entries.size(); ++i) {
        if (parse_cidr(entries[i], blocks[i])) {
            is_block[i] = true;
            total = saturating_add(total, usable_host_count(blocks[i]));
        } else {
            total = saturating_add(total, 1);
        }
    }
    if (total > max_expand_) throw ResolutionError::too_large(total, max_expand_);

    std::vector<ProbeTarget> out;
    out.reserve(static_cast<size_t>(total));
    std::unordered_set<IpAddress, IpAddressHash> seen;
    for (size_t i = 0; i < entries.size(); ++i) {
        if (is_block[i]) {
            for (const auto& ip : expand(blocks[i])) {
                if (!seen.insert(ip).second) continue;
                ProbeTarget t;
                t.ip = ip;
                out.push_back(std::move(t));
            }
        } else {
            ProbeTarget t = resolve_one(entries[i]);
            if (!seen.insert(t.ip).second) continue;
            out.push_back(std::move(t));
        }
    }
    return out;
}

ProbeTarget TargetResolver::lookup(const std::string& host) const {
    ProbeTarget t = resolve_one(host);
    if (!t.hostname) t.hostname = DNSResolver::reverse(t.ip);
    return t;
}

} // namespace netprobe
