// ===================== File: include/neighbor_table.hpp =====================
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "ip_address.hpp"
#include "target_resolver.hpp"

namespace netprobe {

// Local link facts used to scan and annotate neighbors.
struct InterfaceInfo {
    std::string name;
    IpAddress ipv4;
    int prefix = 0;
    std::vector<IpAddress> addrs; // every address on the interface
    std::optional<IpAddress> gateway;
    std::vector<IpAddress> dns_servers;
};

// Interface carrying the IPv4 default route, from /proc/net/route.
std::optional<std::string> default_route_interface(const std::string& route_path = "/proc/net/route");
std::optional<IpAddress> read_default_gateway(const std::string& iface,
                                              const std::string& route_path = "/proc/net/route");

// Complete ARP entries only (flags 0x2). `iface` filters by device when set.
std::unordered_map<IpAddress, std::string, IpAddressHash>
read_arp_table(const std::string& path = "/proc/net/arp", const std::string& iface = {});

// nameserver lines from resolv.conf.
std::vector<IpAddress> read_dns_servers(const std::string& path = "/etc/resolv.conf");

// Looks up `name` (the default-route interface when empty) with getifaddrs.
// Throws ProbeError when it does not exist or has no IPv4 address.
InterfaceInfo find_interface(const std::string& name);

// The interface's subnet, narrowed to the /24 around `addr` when larger.
CidrBlock scan_subnet(const IpAddress& addr, int prefix);

// IEEE OUI registry (oui.txt "(hex)" lines) keyed by the first three MAC octets.
class OuiDb {
public:
    static OuiDb load(const std::string& path);

    std::optional<std::string> lookup(const std::string& mac) const;
    std::size_t size() const { return vendors_.size(); }

private:
    std::unordered_map<std::uint32_t, std::string> vendors_;
};

} // namespace netprobe
