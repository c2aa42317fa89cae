// ===================== File: include/port_presets.hpp =====================
#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "scan_types.hpp"

namespace netprobe {

const std::vector<std::uint16_t>& common_ports();

// Most frequently open ports for "tcp" or "udp" according to an
// nmap-services file. Falls back to the common set, then ascending port
// numbers, when the file is missing or short.
std::vector<std::uint16_t> top_ports(std::size_t n, const std::string& proto,
                                     const std::string& services_path);

// Preset ports plus `user_ports`, deduplicated and ascending.
std::vector<std::uint16_t> select_ports(PortPreset preset, const std::vector<std::uint16_t>& user_ports,
                                        PortScanProtocol protocol, const std::string& services_path);

// "22,80,8080-8082". Throws std::invalid_argument on malformed input.
std::vector<std::uint16_t> parse_port_list(const std::string& text);

// Name from the system services database, e.g. 443/tcp -> "https".
std::optional<std::string> service_name(std::uint16_t port, const char* proto);

} // namespace netprobe
