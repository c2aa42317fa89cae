#include "engine.hpp"

#include "diag_logger.hpp"
#include "engine_common.hpp"
#include "errors.hpp"

namespace netprobe {

std::unique_ptr<HopProber> Engine::make_hop_prober(const TraceSetting& s) const {
    if (hop_factory_) {
        auto p = hop_factory_(s);
        if (p) return p;
    }
    if (s.protocol == TraceProtocol::Udp) return std::make_unique<UdpHopProber>(33434, s.tries_per_hop);
    if (!icmp_) throw PermissionError(icmp_error_);
    return std::make_unique<IcmpHopProber>(icmp_);
}

RunOutcome<TraceDone> Engine::traceroute(const TraceSetting& setting) {
    const TraceSetting s = sanitize(setting);

    auto run = registry_.begin(RunKind::Traceroute);
    RunEmitter em(bus_, registry_, run);
    RunOutcome<TraceDone> out;
    out.run_id = run->id;
    em.start(s);
    log("run " + run->id + " traceroute " + s.target + " proto=" + to_string(s.protocol) +
        " max_hops=" + std::to_string(s.max_hops));

    ProbeTarget target;
    std::unique_ptr<HopProber> prober;
    try {
        target = resolver_.resolve_one(s.target);
        prober = make_hop_prober(s);
    } catch (const ProbeError& e) {
        if (diag_) diag_->log(LogLevel::Error, "run " + run->id + " setup failed: " + e.what());
        detail::fail_run(em, out, e.what());
        return out;
    }

    const CancelToken& cancel = *run->cancel;
    HopWalker walker(*prober, target.ip, s, diag_);
    HopWalker::State state;
    try {
        state = walker.run(cancel, [&](const TraceHop& hop) {
            TraceHop h = hop;
            if (h.reached) h.hostname = target.hostname;
            em.progress(std::move(h));
        });
    } catch (const std::exception& e) {
        if (diag_) diag_->log(LogLevel::Error, "run " + run->id + " failed: " + e.what());
        detail::fail_run(em, out, e.what());
        return out;
    }

    TraceDone done;
    done.destination = target.ip;
    done.hostname = target.hostname;
    done.protocol = s.protocol;
    done.reached = walker.reached();
    done.max_hops = s.max_hops;
    done.hops = walker.hops();
    for (auto& h : done.hops) {
        if (h.reached) h.hostname = target.hostname;
    }

    detail::finish_run(em, state != HopWalker::State::Cancelled, out, std::move(done));
    log("run " + run->id + " " + to_string(out.status) + " (" + to_string(state) + ")");
    return out;
}

} // namespace netprobe
