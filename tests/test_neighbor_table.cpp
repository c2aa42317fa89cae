#include <cstdio>
#include <fstream>
#include <string>

#include "neighbor_table.hpp"

using namespace netprobe;

static void write_file(const std::string& path, const std::string& body) {
    std::ofstream f(path);
    f << body;
}

int main() {
    const std::string dir = "/tmp/netprobe_neigh_";
    const std::string route = dir + "route", arp = dir + "arp", resolv = dir + "resolv", oui = dir + "oui";

    write_file(route,
               "Iface\tDestination\tGateway \tFlags\tRefCnt\tUse\tMetric\tMask\t\tMTU\tWindow\tIRTT\n"
               "eth0\t0001A8C0\t00000000\t0001\t0\t0\t100\t00FFFFFF\t0\t0\t0\n"
               "eth0\t00000000\t0101A8C0\t0003\t0\t0\t100\t00000000\t0\t0\t0\n");
    write_file(arp,
               "IP address       HW type     Flags       HW address            Mask     Device\n"
               "192.168.1.1      0x1         0x2         aa:bb:cc:11:22:33     *        eth0\n"
               "192.168.1.50     0x1         0x0         00:00:00:00:00:00     *        eth0\n"
               "192.168.1.60     0x1         0x2         00:11:22:33:44:55     *        wlan0\n");
    write_file(resolv,
               "# generated\n"
               "search lan\n"
               "nameserver 192.168.1.1\n"
               "nameserver fe80::1%eth0\n"
               "nameserver not-an-ip\n");
    write_file(oui,
               "OUI/MA-L                                                    Organization\n"
               "AA-BB-CC   (hex)\t\tExample Networks Ltd\n"
               "AABBCC     (base 16)\t\tExample Networks Ltd\n"
               "00-11-22   (hex)\t\tCIMSYS Inc \n");

    auto def = default_route_interface(route);
    if (!def || *def != "eth0") return 1;
    auto gw = read_default_gateway("eth0", route);
    if (!gw || gw->to_string() != "192.168.1.1") return 2;
    if (read_default_gateway("wlan0", route)) return 3;

    auto table = read_arp_table(arp);
    if (table.size() != 2) return 4;
    if (table.at(*IpAddress::parse("192.168.1.1")) != "aa:bb:cc:11:22:33") return 5;
    if (table.count(*IpAddress::parse("192.168.1.50"))) return 6;
    if (read_arp_table(arp, "eth0").size() != 1) return 7;

    auto dns = read_dns_servers(resolv);
    if (dns.size() != 2 || dns[0].to_string() != "192.168.1.1" || !dns[1].is_v6()) return 8;

    OuiDb db = OuiDb::load(oui);
    if (db.size() != 2) return 9;
    auto v = db.lookup("aa:bb:cc:11:22:33");
    if (!v || *v != "Example Networks Ltd") return 10;
    auto v2 = db.lookup("00-11-22-33-44-55");
    if (!v2 || *v2 != "CIMSYS Inc") return 11;
    if (db.lookup("ff:ff:ff:00:00:00") || db.lookup("zz")) return 12;
    if (OuiDb::load("/nonexistent/oui.txt").size() != 0) return 13;

    // large subnets are narrowed to the /24 around the address
    CidrBlock b = scan_subnet(*IpAddress::parse("10.20.30.40"), 16);
    if (b.base.to_string() != "10.20.30.0" || b.prefix != 24) return 14;
    CidrBlock small = scan_subnet(*IpAddress::parse("192.168.1.77"), 28);
    if (small.base.to_string() != "192.168.1.64" || small.prefix != 28) return 15;
    if (TargetResolver::expand(b).size() != 254) return 16;

    bool threw = false;
    try {
        find_interface("netprobe-no-such-if0");
    } catch (const std::exception&) {
        threw = true;
    }
    if (!threw) return 17;

    std::remove(route.c_str());
    std::remove(arp.c_str());
    std::remove(resolv.c_str());
    std::remove(oui.c_str());
    return 0;
}
