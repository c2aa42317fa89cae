// ===================== File: src/engine_scan.cpp =====================
#include "engine.hpp"

#include <algorithm>
#include <cerrno>

#include "aggregator.hpp"
#include "diag_logger.hpp"
#include "engine_common.hpp"
#include "errors.hpp"
#include "neighbor_table.hpp"
#include "port_presets.hpp"

namespace netprobe {

PortState classify_port(PortScanProtocol protocol, const ProbeOutcome& o, std::optional<std::string>& message) {
    switch (protocol) {
        case PortScanProtocol::Tcp:
            if (o.status == SampleStatus::Done) return PortState::Open;
            if (o.refused) return PortState::Closed;
            if (o.status == SampleStatus::Timeout || o.sys_error == EHOSTUNREACH || o.sys_error == ENETUNREACH) {
                message = o.message;
                return PortState::Filtered;
            }
            message = o.message;
            return PortState::Closed;

        case PortScanProtocol::Udp:
            if (o.refused) return PortState::Closed;
            if (o.status == SampleStatus::Done) return PortState::Open;
            if (o.status == SampleStatus::Timeout) {
                message = "open|filtered";
                return PortState::Filtered;
            }
            message = o.message;
            return PortState::Filtered;

        case PortScanProtocol::Quic:
            if (o.status == SampleStatus::Done || o.responded) {
                if (o.status != SampleStatus::Done) message = o.message;
                return PortState::Open;
            }
            if (o.refused) return PortState::Closed;
            message = o.message;
            return PortState::Filtered;
    }
    return PortState::Filtered;
}

bool host_alive(const ProbeOutcome& o) {
    return o.status == SampleStatus::Done || o.refused;
}

static Protocol driver_protocol(PortScanProtocol p) {
    switch (p) {
        case PortScanProtocol::Tcp:  return Protocol::Tcp;
        case PortScanProtocol::Quic: return Protocol::Quic;
        case PortScanProtocol::Udp:  return Protocol::Udp;
    }
    return Protocol::Tcp;
}

RunOutcome<PortScanReport> Engine::port_scan(const PortScanSetting& setting) {
    const PortScanSetting& s = setting;

    auto run = registry_.begin(RunKind::PortScan);
    RunEmitter em(bus_, registry_, run);
    RunOutcome<PortScanReport> out;
    out.run_id = run->id;
    em.start(s);
    log("run " + run->id + " portscan " + s.target + " proto=" + to_string(s.protocol) +
        " preset=" + to_string(s.preset));

    ProbeTarget target;
    std::vector<std::uint16_t> ports;
    std::unique_ptr<ProbeDriver> driver;
    try {
        target = resolver_.resolve_one(s.target);
        ports = select_ports(s.preset, s.user_ports, s.protocol, config_.services_path);
        if (ports.empty()) throw ResolutionError::invalid(s.target, "no ports selected");
        driver = make_probe_driver(driver_protocol(s.protocol));
    } catch (const ProbeError& e) {
        if (diag_) diag_->log(LogLevel::Error, "run " + run->id + " setup failed: " + e.what());
        detail::fail_run(em, out, e.what());
        return out;
    }
    if (!s.ordered) detail::shuffle_in_place(ports);

    PortScanAggregator agg(target.ip, target.hostname, s.protocol, static_cast<std::uint32_t>(ports.size()));

    ProbeScheduler<std::uint16_t, PortScanSample>::Options opt;
    opt.concurrency = detail::pick_concurrency(s.concurrency, config_.concurrency);
    opt.ordered = s.ordered;

    const CancelToken& cancel = *run->cancel;
    bool complete = false;
    try {
        auto sum = ProbeScheduler<std::uint16_t, PortScanSample>::run(
            ports, opt, cancel,
            [&](const std::uint16_t& port, std::uint32_t seq) -> std::optional<PortScanSample> {
                ProbeRequest req;
                req.target = target;
                req.target.port = port;
                req.seq = seq;
                req.timeout = s.timeout;
                req.hop_limit = 0;
                ProbeOutcome o = driver->probe(req, cancel);
                if (o.aborted) return std::nullopt;

                PortScanSample sample;
                sample.ip = target.ip;
                sample.port = port;
                sample.state = classify_port(s.protocol, o, sample.message);
                if (sample.state == PortState::Open) sample.rtt_ms = o.rtt_ms;
                return sample;
            },
            [&](std::uint32_t, PortScanSample&& sample) { em.progress(agg.add(std::move(sample))); });
        if (diag_)
            diag_->log(LogLevel::Debug, "run " + run->id + " dispatched " + std::to_string(sum.dispatched) +
                                            " aborted " + std::to_string(sum.aborted));
        complete = sum.complete(ports.size());
    } catch (const std::exception& e) {
        if (diag_) diag_->log(LogLevel::Error, "run " + run->id + " failed: " + e.what());
        detail::fail_run(em, out, e.what());
        return out;
    }

    const char* proto = s.protocol == PortScanProtocol::Tcp ? "tcp" : "udp";
    PortScanReport report = agg.report([proto](std::uint16_t port) { return service_name(port, proto); });
    detail::finish_run(em, complete, out, std::move(report));
    log("run " + run->id + " " + to_string(out.status) + " open=" + std::to_string(out.report->open_count));
    return out;
}

HostScanReport Engine::scan_hosts(RunEmitter& em, const CancelToken& cancel,
                                  std::vector<ProbeTarget> targets, const HostScanSetting& s,
                                  bool& complete) {
    const Protocol protocol = s.protocol == HostScanProtocol::Tcp ? Protocol::Tcp : Protocol::Icmp;
    auto driver = make_probe_driver(protocol);

    if (!s.ordered) detail::shuffle_in_place(targets);

    HostScanAggregator agg(static_cast<std::uint32_t>(targets.size()));

    ProbeScheduler<ProbeTarget, HostScanProgress>::Options opt;
    opt.concurrency = detail::pick_concurrency(s.concurrency.value_or(0), config_.host_scan_concurrency);
    opt.ordered = s.ordered;

    const std::string payload = s.payload ? *s.payload : std::string("np:hs");

    const std::size_t total = targets.size();
    auto sum = ProbeScheduler<ProbeTarget, HostScanProgress>::run(
        targets, opt, cancel,
        [&](const ProbeTarget& t, std::uint32_t seq) -> std::optional<HostScanProgress> {
            HostScanProgress p;
            p.ip = t.ip;
            p.state = HostState::Unreachable;
            for (std::uint32_t attempt = 0; attempt < s.count; ++attempt) {
                ProbeRequest req;
                req.target = t;
                if (protocol == Protocol::Tcp) req.target.port = s.port;
                req.seq = seq;
                req.timeout = s.timeout;
                req.hop_limit = s.hop_limit;
                req.payload = payload;
                ProbeOutcome o = driver->probe(req, cancel);
                if (o.aborted) return std::nullopt;
                if (host_alive(o)) {
                    p.state = HostState::Alive;
                    p.rtt_ms = o.rtt_ms;
                    p.message.reset();
                    break;
                }
                p.message = o.message;
            }
            return p;
        },
        [&](std::uint32_t, HostScanProgress&& p) { em.progress(agg.add(std::move(p))); });

    complete = sum.complete(total);
    return agg.report();
}

RunOutcome<HostScanReport> Engine::host_scan(const HostScanSetting& setting) {
    HostScanSetting s = setting;
    if (s.count == 0) s.count = 1;
    if (s.hop_limit <= 0) s.hop_limit = 64;

    auto run = registry_.begin(RunKind::HostScan);
    RunEmitter em(bus_, registry_, run);
    RunOutcome<HostScanReport> out;
    out.run_id = run->id;
    em.start(s);
    log("run " + run->id + " hostscan " + std::to_string(s.targets.size()) + " entries proto=" +
        to_string(s.protocol));

    const CancelToken& cancel = *run->cancel;
    HostScanReport report;
    bool complete = false;
    try {
        auto targets = resolver_.resolve_all(s.targets);
        log("run " + run->id + " scanning " + std::to_string(targets.size()) + " hosts");
        report = scan_hosts(em, cancel, std::move(targets), s, complete);
    } catch (const std::exception& e) {
        if (diag_) diag_->log(LogLevel::Error, "run " + run->id + " failed: " + e.what());
        detail::fail_run(em, out, e.what());
        return out;
    }

    detail::finish_run(em, complete, out, std::move(report));
    log("run " + run->id + " " + to_string(out.status) + " alive=" + std::to_string(out.report->alive.size()));
    return out;
}

RunOutcome<NeighborScanReport> Engine::neighbor_scan(const std::string& iface) {
    auto run = registry_.begin(RunKind::NeighborScan);
    RunEmitter em(bus_, registry_, run);
    RunOutcome<NeighborScanReport> out;
    out.run_id = run->id;
    em.start(iface);
    log("run " + run->id + " neighborscan iface=" + (iface.empty() ? std::string("(default)") : iface));

    const CancelToken& cancel = *run->cancel;
    NeighborScanReport report;
    bool complete = false;
    try {
        InterfaceInfo info = find_interface(iface);
        CidrBlock block = scan_subnet(info.ipv4, info.prefix);
        report.iface = info.name;
        report.subnet = block.base.to_string() + "/" + std::to_string(block.prefix);

        auto targets = resolver_.resolve(report.subnet);

        HostScanSetting hs;
        hs.hop_limit = 64;
        hs.timeout = std::chrono::milliseconds(1000);
        hs.count = 1;
        hs.payload = std::string("np:neigh");
        hs.ordered = true;
        hs.concurrency = 100;
        hs.protocol = HostScanProtocol::Icmp;

        HostScanReport hosts = scan_hosts(em, cancel, std::move(targets), hs, complete);

        const auto arp = read_arp_table("/proc/net/arp", info.name);
        const OuiDb oui = OuiDb::load(config_.oui_path);
        if (oui.size() == 0 && diag_)
            diag_->log(LogLevel::Warn, "no OUI vendors loaded from " + config_.oui_path);

        for (const auto& h : hosts.alive) {
            NeighborHost n;
            n.ip = h.ip;
            n.rtt_ms = h.rtt_ms;
            auto it = arp.find(h.ip);
            if (it != arp.end()) {
                n.mac = it->second;
                n.vendor = oui.lookup(it->second);
            }
            if (std::find(info.addrs.begin(), info.addrs.end(), h.ip) != info.addrs.end()) n.tags.push_back("Self");
            if (info.gateway && *info.gateway == h.ip) n.tags.push_back("Gateway");
            if (std::find(info.dns_servers.begin(), info.dns_servers.end(), h.ip) != info.dns_servers.end())
                n.tags.push_back("DNS");
            report.neighbors.push_back(std::move(n));
        }
        report.total = hosts.total;
    } catch (const std::exception& e) {
        if (diag_) diag_->log(LogLevel::Error, "run " + run->id + " failed: " + e.what());
        detail::fail_run(em, out, e.what());
        return out;
    }

    detail::finish_run(em, complete, out, std::move(report));
    log("run " + run->id + " " + to_string(out.status) + " neighbors=" +
        std::to_string(out.report->neighbors.size()));
    return out;
}

} // namespace netprobe
