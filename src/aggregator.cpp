#include "aggregator.hpp"

#include <algorithm>

namespace netprobe {

ProbeStat update(ProbeStat stat, const ProbeSample& sample) {
    ++stat.transmitted;
    if (sample.status == SampleStatus::Done && sample.rtt_ms) {
        const double rtt = *sample.rtt_ms;
        ++stat.received;
        stat.rtt_total_ms += rtt;
        stat.min_ms = stat.min_ms ? std::min(*stat.min_ms, rtt) : rtt;
        stat.max_ms = stat.max_ms ? std::max(*stat.max_ms, rtt) : rtt;
        stat.avg_ms = stat.rtt_total_ms / stat.received;
    }
    stat.samples.push_back(sample);
    return stat;
}

PortScanAggregator::PortScanAggregator(IpAddress ip, std::optional<std::string> hostname,
                                       PortScanProtocol protocol, std::uint32_t total)
    : total_(total) {
    base_.ip = ip;
    base_.hostname = std::move(hostname);
    base_.protocol = protocol;
}

PortScanSample PortScanAggregator::add(PortScanSample sample) {
    sample.done = ++done_;
    sample.total = total_;
    ++base_.attempted;
    switch (sample.state) {
        case PortState::Open:
            ++base_.open_count;
            base_.open.push_back(sample);
            break;
        case PortState::Closed:
            ++base_.closed_count;
            break;
        case PortState::Filtered:
            ++base_.filtered_count;
            break;
    }
    return sample;
}

PortScanReport PortScanAggregator::report(const ServiceLookup& services) const {
    PortScanReport r = base_;
    std::sort(r.open.begin(), r.open.end(),
              [](const PortScanSample& a, const PortScanSample& b) { return a.port < b.port; });
    if (services) {
        for (auto& s : r.open) {
            if (!s.service_name) s.service_name = services(s.port);
        }
    }
    return r;
}

HostScanProgress HostScanAggregator::add(HostScanProgress progress) {
    progress.done = ++done_;
    progress.total = total_;
    if (progress.state == HostState::Alive) {
        report_.alive.push_back(AliveHost{progress.ip, progress.rtt_ms.value_or(0.0)});
    } else {
        report_.unreachable.push_back(progress.ip);
    }
    report_.total = done_;
    return progress;
}

} // namespace netprobe
