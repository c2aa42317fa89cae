#include <algorithm>
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "port_presets.hpp"

using namespace netprobe;

static bool rejects(const std::string& text) {
    try {
        parse_port_list(text);
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

int main() {
    const auto& common = common_ports();
    if (common.size() != 30) return 1;
    if (std::find(common.begin(), common.end(), 443) == common.end()) return 2;

    auto list = parse_port_list("80, 443,8080-8082");
    if (list != std::vector<std::uint16_t>({80, 443, 8080, 8081, 8082})) return 3;
    if (!rejects("abc") || !rejects("0") || !rejects("70000") || !rejects("90-80") || !rejects("") ||
        !rejects("1-"))
        return 4;
    if (!rejects("99999999999999999999999") || !rejects("80-123456789012345678901") || !rejects("\xff" "80") ||
        !rejects("8\xe9"))
        return 40;
    if (parse_port_list(" 22 ,\t23\n") != std::vector<std::uint16_t>({22, 23})) return 41;

    auto custom = select_ports(PortPreset::Custom, {8080, 80, 80}, PortScanProtocol::Tcp, "");
    if (custom != std::vector<std::uint16_t>({80, 8080})) return 5;
    if (!select_ports(PortPreset::Custom, {}, PortScanProtocol::Tcp, "").empty()) return 6;

    auto wk = select_ports(PortPreset::WellKnown, {8443}, PortScanProtocol::Tcp, "");
    if (wk.size() != 1024 || wk.front() != 1 || wk.back() != 8443) return 7;
    if (select_ports(PortPreset::Full, {}, PortScanProtocol::Tcp, "").size() != 65535) return 8;
    auto cm = select_ports(PortPreset::Common, {}, PortScanProtocol::Tcp, "");
    if (cm.size() != 30 || !std::is_sorted(cm.begin(), cm.end())) return 9;

    const std::string path = "/tmp/netprobe_test_services";
    {
        std::ofstream f(path);
        f << "# comment line\n"
          << "http\t80/tcp\t0.484143\t# World Wide Web HTTP\n"
          << "ssh\t22/tcp\t0.182286\t# Secure Shell Login\n"
          << "telnet\t23/tcp\t0.221265\n"
          << "domain\t53/udp\t0.213496\n"
          << "broken\tx/tcp\t0.9\n";
    }
    auto top_tcp = top_ports(3, "tcp", path);
    if (top_tcp != std::vector<std::uint16_t>({80, 23, 22})) return 10;
    auto top_udp = top_ports(3, "udp", path);
    if (top_udp != std::vector<std::uint16_t>({53, 21, 22})) return 11;
    std::remove(path.c_str());

    auto fallback = top_ports(1000, "tcp", "/nonexistent/nmap-services");
    if (fallback.size() != 1000 || fallback.front() != 21) return 12;
    std::sort(fallback.begin(), fallback.end());
    if (std::adjacent_find(fallback.begin(), fallback.end()) != fallback.end()) return 13;
    if (select_ports(PortPreset::Top1000, {}, PortScanProtocol::Udp, "/nonexistent").size() != 1000) return 14;

    // services database is optional on minimal systems
    if (auto name = service_name(22, "tcp")) {
        if (*name != "ssh") return 15;
    }
    return 0;
}
