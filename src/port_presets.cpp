#include "port_presets.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <netdb.h>
#include <netinet/in.h>
#include <set>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace netprobe {

const std::vector<std::uint16_t>& common_ports() {
    static const std::vector<std::uint16_t> ports = {
        21, 22, 23, 25, 53, 80, 110, 111, 135, 139, 143, 443, 445, 465, 587,
        993, 995, 1433, 1521, 1723, 3306, 3389, 5432, 5900, 6379, 8000, 8080, 8443, 9200, 27017};
    return ports;
}

std::vector<std::uint16_t> top_ports(std::size_t n, const std::string& proto,
                                     const std::string& services_path) {
    std::vector<std::pair<double, std::uint16_t>> ranked;
    std::ifstream in(services_path);
    std::string line;
    while (in && std::getline(in, line)) {
        if (line.empty() || line[0] == '#') continue;
        std::istringstream ls(line);
        std::string name, port_proto;
        double freq = 0.0;
        if (!(ls >> name >> port_proto >> freq)) continue;
        auto slash = port_proto.find('/');
        if (slash == std::string::npos || port_proto.substr(slash + 1) != proto) continue;
        int port = 0;
        try {
            port = std::stoi(port_proto.substr(0, slash));
        } catch (const std::exception&) {
            continue;
        }
        if (port < 1 || port > 65535) continue;
        ranked.emplace_back(freq, static_cast<std::uint16_t>(port));
    }
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const auto& a, const auto& b) { return a.first > b.first; });

    std::vector<std::uint16_t> out;
    std::set<std::uint16_t> seen;
    auto take = [&](std::uint16_t p) {
        if (out.size() < n && seen.insert(p).second) out.push_back(p);
    };
    for (const auto& r : ranked) take(r.second);
    for (auto p : common_ports()) take(p);
    for (std::uint32_t p = 1; p <= 65535 && out.size() < n; ++p) take(static_cast<std::uint16_t>(p));
    return out;
}

std::vector<std::uint16_t> select_ports(PortPreset preset, const std::vector<std::uint16_t>& user_ports,
                                        PortScanProtocol protocol, const std::string& services_path) {
    std::set<std::uint16_t> ports;
    switch (preset) {
        case PortPreset::Common:
            ports.insert(common_ports().begin(), common_ports().end());
            break;
        case PortPreset::WellKnown:
            for (std::uint16_t p = 1; p <= 1023; ++p) ports.insert(p);
            break;
        case PortPreset::Top1000: {
            auto top = top_ports(1000, protocol == PortScanProtocol::Tcp ? "tcp" : "udp", services_path);
            ports.insert(top.begin(), top.end());
            break;
        }
        case PortPreset::Full:
            for (std::uint32_t p = 1; p <= 65535; ++p) ports.insert(static_cast<std::uint16_t>(p));
            break;
        case PortPreset::Custom:
            break;
    }
    for (auto p : user_ports) {
        if (p != 0) ports.insert(p);
    }
    return std::vector<std::uint16_t>(ports.begin(), ports.end());
}

static std::uint16_t parse_port(const std::string& s) {
    if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos)
        throw std::invalid_argument("bad port: '" + s + "'");
    // stoul would throw out_of_range on long digit strings
    if (s.size() > 5) throw std::invalid_argument("port out of range: " + s);
    unsigned long v = std::stoul(s);
    if (v < 1 || v > 65535) throw std::invalid_argument("port out of range: " + s);
    return static_cast<std::uint16_t>(v);
}

std::vector<std::uint16_t> parse_port_list(const std::string& text) {
    std::vector<std::uint16_t> out;
    std::istringstream in(text);
    std::string item;
    while (std::getline(in, item, ',')) {
        item.erase(std::remove_if(item.begin(), item.end(),
                                  [](unsigned char c) { return std::isspace(c) != 0; }),
                   item.end());
        if (item.empty()) continue;
        auto dash = item.find('-');
        if (dash == std::string::npos) {
            out.push_back(parse_port(item));
            continue;
        }
        std::uint16_t lo = parse_port(item.substr(0, dash));
        std::uint16_t hi = parse_port(item.substr(dash + 1));
        if (lo > hi) throw std::invalid_argument("bad range: " + item);
        for (std::uint32_t p = lo; p <= hi; ++p) out.push_back(static_cast<std::uint16_t>(p));
    }
    if (out.empty()) throw std::invalid_argument("empty port list");
    return out;
}

std::optional<std::string> service_name(std::uint16_t port, const char* proto) {
    servent se{};
    servent* res = nullptr;
    char buf[1024];
    if (::getservbyport_r(htons(port), proto, &se, buf, sizeof(buf), &res) != 0 || !res || !res->s_name)
        return std::nullopt;
    return std::string(res->s_name);
}

} // namespace netprobe
