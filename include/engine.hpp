// ===================== File: include/engine.hpp =====================
#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "events.hpp"
#include "hop_walker.hpp"
#include "probe_driver.hpp"
#include "probe_scheduler.hpp"
#include "run_registry.hpp"
#include "scan_types.hpp"
#include "target_resolver.hpp"

namespace netprobe {

class DiagLogger;
class IcmpSocket;

struct EngineConfig {
    std::size_t concurrency = kDefaultConcurrency;
    std::size_t host_scan_concurrency = 256;
    std::uint64_t max_expand = kDefaultMaxExpand;
    std::chrono::milliseconds retention = std::chrono::seconds(60);
    std::string oui_path = "/usr/share/ieee-data/oui.txt";
    std::string services_path = "/usr/share/nmap/nmap-services";
    // Off for callers that never send ICMP and should not need CAP_NET_RAW.
    bool open_icmp = true;
};

// What a synchronous boundary call hands back. `report` is set for Done and
// Cancelled runs; `error` for Failed ones.
template <typename Report>
struct RunOutcome {
    RunId run_id;
    RunStatus status = RunStatus::Running;
    std::optional<Report> report;
    std::string error;

    bool ok() const { return status == RunStatus::Done; }
};

// Port-scan reading of a probe outcome. Sets `message` for ambiguous or
// failed probes.
PortState classify_port(PortScanProtocol protocol, const ProbeOutcome& outcome,
                        std::optional<std::string>& message);

// Host-scan reading: any reply, including a TCP refusal, proves the host.
bool host_alive(const ProbeOutcome& outcome);

// Entry point for every probing operation. Each call registers a run,
// publishes start / progress / exactly one terminal event on the bus, and
// returns when the run is over. Calls may run concurrently from different
// threads; cancel() is the way to stop one from another thread.
class Engine {
public:
    using DriverFactory = std::function<std::unique_ptr<ProbeDriver>(Protocol)>;
    using HopProberFactory = std::function<std::unique_ptr<HopProber>(const TraceSetting&)>;

    Engine(EventBus& bus, EngineConfig config = {}, DiagLogger* diag = nullptr);
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    RunOutcome<ProbeStat> ping(const PingSetting& setting);
    bool ping_cancel(const RunId& run_id);

    RunOutcome<TraceDone> traceroute(const TraceSetting& setting);
    RunOutcome<PortScanReport> port_scan(const PortScanSetting& setting);
    RunOutcome<HostScanReport> host_scan(const HostScanSetting& setting);
    // Empty name scans the interface carrying the default route.
    RunOutcome<NeighborScanReport> neighbor_scan(const std::string& iface);

    // Throws ResolutionError.
    ProbeTarget lookup_host(const std::string& host) const;

    bool cancel(const RunId& run_id);
    std::optional<RunStatus> status(const RunId& run_id) const;
    bool acknowledge(const RunId& run_id);

    bool icmp_available() const { return icmp_ != nullptr; }
    const std::string& icmp_error() const { return icmp_error_; }

    void set_driver_factory(DriverFactory factory) { driver_factory_ = std::move(factory); }
    void set_hop_prober_factory(HopProberFactory factory) { hop_factory_ = std::move(factory); }

    const EngineConfig& config() const { return config_; }

private:
    std::unique_ptr<ProbeDriver> make_probe_driver(Protocol protocol) const;
    std::unique_ptr<HopProber> make_hop_prober(const TraceSetting& setting) const;
    ProbeTarget ping_target(const PingSetting& setting) const;

    // Host scan body shared with neighbor_scan. Emits HostScanProgress on
    // `em`; returns whatever was gathered when cancelled. `complete` is set
    // when every host was probed to the end.
    HostScanReport scan_hosts(RunEmitter& em, const CancelToken& cancel,
                              std::vector<ProbeTarget> targets, const HostScanSetting& setting,
                              bool& complete);

    void log(const std::string& line) const;

    EventBus& bus_;
    EngineConfig config_;
    DiagLogger* diag_;
    RunRegistry registry_;
    TargetResolver resolver_;
    std::shared_ptr<IcmpSocket> icmp_;
    std::string icmp_error_;
    DriverFactory driver_factory_;
    HopProberFactory hop_factory_;
};

} // namespace netprobe
