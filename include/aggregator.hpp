// ===================== File: include/aggregator.hpp =====================
#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "probe_types.hpp"
#include "scan_types.hpp"

namespace netprobe {

// Folds one sample into the running ping statistics. transmitted always
// grows; received, min/avg/max only count Done samples that carry an rtt.
ProbeStat update(ProbeStat stat, const ProbeSample& sample);

// Keeps open ports for the report and counts the rest.
class PortScanAggregator {
public:
    using ServiceLookup = std::function<std::optional<std::string>(std::uint16_t)>;

    PortScanAggregator(IpAddress ip, std::optional<std::string> hostname,
                       PortScanProtocol protocol, std::uint32_t total);

    // Stamps done/total on the sample and records it.
    PortScanSample add(PortScanSample sample);

    std::uint32_t done() const { return done_; }

    // Open ports sorted by port, service names filled by `services` when set.
    PortScanReport report(const ServiceLookup& services = nullptr) const;

private:
    PortScanReport base_;
    std::uint32_t total_;
    std::uint32_t done_ = 0;
};

// Partitions scanned hosts into alive and unreachable.
class HostScanAggregator {
public:
    explicit HostScanAggregator(std::uint32_t total) : total_(total) {}

    HostScanProgress add(HostScanProgress progress);

    std::uint32_t done() const { return done_; }
    const HostScanReport& report() const { return report_; }

private:
    HostScanReport report_;
    std::uint32_t total_;
    std::uint32_t done_ = 0;
};

} // namespace netprobe
