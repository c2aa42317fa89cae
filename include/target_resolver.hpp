// ===================== File: include/target_resolver.hpp =====================
#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "probe_types.hpp"

namespace netprobe {

constexpr std::uint64_t kDefaultMaxExpand = 65536;

struct CidrBlock {
    IpAddress base; // network address, host bits cleared
    int prefix = 0;
};

// Turns host names, literal addresses and CIDR blocks into probe targets.
// Failures throw ResolutionError; nothing is returned partially.
class TargetResolver {
public:
    explicit TargetResolver(std::uint64_t max_expand = kDefaultMaxExpand) : max_expand_(max_expand) {}

    std::uint64_t max_expand() const { return max_expand_; }

    // One representative address for a name or literal (IPv4 preferred).
    ProbeTarget resolve_one(const std::string& host) const;

    // Name, literal or CIDR block.
    std::vector<ProbeTarget> resolve(const std::string& host_or_cidr) const;

    // Several entries. Duplicates are dropped, first occurrence wins. The
    // expansion limit applies to the combined count.
    std::vector<ProbeTarget> resolve_all(const std::vector<std::string>& entries) const;

    // resolve_one plus a best-effort reverse name when given a literal.
    ProbeTarget lookup(const std::string& host) const;

    // Parses "a.b.c.d/p" or "x::/p". Returns false when `text` has no '/'.
    // Throws ResolutionError(InvalidInput) when it has one but is malformed.
    static bool parse_cidr(const std::string& text, CidrBlock& out);

    // IPv4 prefixes up to /30 lose the network and broadcast addresses.
    // Saturates at UINT64_MAX for very short IPv6 prefixes.
    static std::uint64_t usable_host_count(const CidrBlock& block);

    static std::vector<IpAddress> expand(const CidrBlock& block);

private:
    std::uint64_t max_expand_;
};

} // namespace netprobe
