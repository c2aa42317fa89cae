#include "neighbor_table.hpp"

#include <arpa/inet.h>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <ifaddrs.h>
#include <netinet/in.h>
#include <sstream>

#include "errors.hpp"

namespace netprobe {

namespace {

struct RouteLine {
    std::string iface;
    std::uint32_t dest = 0;
    std::uint32_t gateway = 0; // as the kernel prints it: raw s_addr
    unsigned flags = 0;
};

std::vector<RouteLine> read_routes(const std::string& path) {
    std::vector<RouteLine> out;
    std::ifstream in(path);
    std::string line;
    if (!std::getline(in, line)) return out; // header
    while (std::getline(in, line)) {
        std::istringstream ls(line);
        std::string iface, dest, gw, flags;
        if (!(ls >> iface >> dest >> gw >> flags)) continue;
        RouteLine r;
        r.iface = iface;
        r.dest = static_cast<std::uint32_t>(std::strtoul(dest.c_str(), nullptr, 16));
        r.gateway = static_cast<std::uint32_t>(std::strtoul(gw.c_str(), nullptr, 16));
        r.flags = static_cast<unsigned>(std::strtoul(flags.c_str(), nullptr, 16));
        out.push_back(r);
    }
    return out;
}

constexpr unsigned kRouteUp = 0x1;
constexpr unsigned kRouteGateway = 0x2;

std::optional<std::uint32_t> parse_oui(const std::string& text) {
    std::string hex;
    for (char c : text) {
        if (std::isxdigit(static_cast<unsigned char>(c))) hex.push_back(c);
        else if (c != '-' && c != ':' && c != '.') break;
        if (hex.size() == 6) break;
    }
    if (hex.size() != 6) return std::nullopt;
    return static_cast<std::uint32_t>(std::strtoul(hex.c_str(), nullptr, 16));
}

} // namespace

std::optional<std::string> default_route_interface(const std::string& route_path) {
    for (const auto& r : read_routes(route_path)) {
        if (r.dest == 0 && (r.flags & kRouteUp)) return r.iface;
    }
    return std::nullopt;
}

std::optional<IpAddress> read_default_gateway(const std::string& iface, const std::string& route_path) {
    for (const auto& r : read_routes(route_path)) {
        if (r.dest != 0 || !(r.flags & kRouteUp) || !(r.flags & kRouteGateway)) continue;
        if (!iface.empty() && r.iface != iface) continue;
        return IpAddress::v4(ntohl(r.gateway));
    }
    return std::nullopt;
}

std::unordered_map<IpAddress, std::string, IpAddressHash>
read_arp_table(const std::string& path, const std::string& iface) {
    std::unordered_map<IpAddress, std::string, IpAddressHash> out;
    std::ifstream in(path);
    std::string line;
    if (!std::getline(in, line)) return out;
    while (std::getline(in, line)) {
        std::istringstream ls(line);
        std::string ip, hw_type, flags, mac, mask, dev;
        if (!(ls >> ip >> hw_type >> flags >> mac >> mask >> dev)) continue;
        if ((std::strtoul(flags.c_str(), nullptr, 16) & 0x2) == 0) continue;
        if (!iface.empty() && dev != iface) continue;
        auto addr = IpAddress::parse(ip);
        if (!addr || mac == "00:00:00:00:00:00") continue;
        out[*addr] = mac;
    }
    return out;
}

std::vector<IpAddress> read_dns_servers(const std::string& path) {
    std::vector<IpAddress> out;
    std::ifstream in(path);
    std::string line;
    while (std::getline(in, line)) {
        std::istringstream ls(line);
        std::string key, value;
        if (!(ls >> key >> value) || key != "nameserver") continue;
        // drop a scope suffix such as fe80::1%eth0
        auto pct = value.find('%');
        if (pct != std::string::npos) value.erase(pct);
        if (auto ip = IpAddress::parse(value)) out.push_back(*ip);
    }
    return out;
}

InterfaceInfo find_interface(const std::string& name) {
    InterfaceInfo info;
    if (name.empty()) {
        auto def = default_route_interface();
        if (!def) throw ProbeError("no default route; pass an interface name");
        info.name = *def;
    } else {
        info.name = name;
    }

    ifaddrs* list = nullptr;
    if (::getifaddrs(&list) != 0) throw ProbeError("getifaddrs failed");

    bool found = false;
    bool have_v4 = false;
    for (ifaddrs* it = list; it; it = it->ifa_next) {
        if (!it->ifa_name || info.name != it->ifa_name) continue;
        found = true;
        if (!it->ifa_addr) continue;
        auto ip = IpAddress::from_sockaddr(it->ifa_addr);
        if (!ip) continue;
        info.addrs.push_back(*ip);
        if (ip->is_v4() && !have_v4 && it->ifa_netmask) {
            auto mask = IpAddress::from_sockaddr(it->ifa_netmask);
            std::uint32_t m = mask ? mask->v4_host_order() : 0;
            int prefix = 0;
            while (prefix < 32 && (m & (0x80000000u >> prefix))) ++prefix;
            info.ipv4 = *ip;
            info.prefix = prefix;
            have_v4 = true;
        }
    }
    ::freeifaddrs(list);

    if (!found) throw ProbeError("no such interface: " + info.name);
    if (!have_v4) throw ProbeError("interface " + info.name + " has no IPv4 address");

    info.gateway = read_default_gateway(info.name);
    info.dns_servers = read_dns_servers();
    return info;
}

CidrBlock scan_subnet(const IpAddress& addr, int prefix) {
    CidrBlock b;
    b.prefix = prefix < 24 ? 24 : prefix;
    if (b.prefix > 32) b.prefix = 32;
    std::uint32_t mask = b.prefix == 0 ? 0 : 0xFFFFFFFFu << (32 - b.prefix);
    b.base = IpAddress::v4(addr.v4_host_order() & mask);
    return b;
}

OuiDb OuiDb::load(const std::string& path) {
    OuiDb db;
    std::ifstream in(path);
    std::string line;
    while (std::getline(in, line)) {
        auto tag = line.find("(hex)");
        if (tag == std::string::npos) continue;
        auto key = parse_oui(line.substr(0, tag));
        if (!key) continue;
        std::string vendor = line.substr(tag + 5);
        auto b = vendor.find_first_not_of(" \t");
        auto e = vendor.find_last_not_of(" \t\r");
        if (b == std::string::npos) continue;
        db.vendors_.emplace(*key, vendor.substr(b, e - b + 1));
    }
    return db;
}

std::optional<std::string> OuiDb::lookup(const std::string& mac) const {
    auto key = parse_oui(mac);
    if (!key) return std::nullopt;
    auto it = vendors_.find(*key);
    if (it == vendors_.end()) return std::nullopt;
    return it->second;
}

} // namespace netprobe
