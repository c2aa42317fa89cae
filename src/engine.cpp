// ===================== File: src/engine.cpp =====================
#include "engine.hpp"

#include "aggregator.hpp"
#include "diag_logger.hpp"
#include "engine_common.hpp"
#include "errors.hpp"
#include "icmp_socket.hpp"
#include "parsed_url.hpp"

namespace netprobe {

Engine::Engine(EventBus& bus, EngineConfig config, DiagLogger* diag)
    : bus_(bus),
      config_(std::move(config)),
      diag_(diag),
      registry_(config_.retention),
      resolver_(config_.max_expand) {
    if (!config_.open_icmp) {
        icmp_error_ = "ICMP disabled by configuration";
        return;
    }
    try {
        icmp_ = IcmpSocket::open();
        log("raw ICMP socket ready");
    } catch (const ProbeError& e) {
        // ICMP runs report this; other protocols keep working
        icmp_error_ = e.what();
        if (diag_) diag_->log(LogLevel::Warn, std::string("ICMP unavailable: ") + e.what());
    }
}

Engine::~Engine() = default;

void Engine::log(const std::string& line) const {
    if (diag_) diag_->log(line);
}

std::unique_ptr<ProbeDriver> Engine::make_probe_driver(Protocol protocol) const {
    if (driver_factory_) {
        auto d = driver_factory_(protocol);
        if (d) return d;
    }
    if (protocol == Protocol::Icmp && !icmp_) throw PermissionError(icmp_error_);
    return make_driver(protocol, icmp_);
}

ProbeTarget Engine::ping_target(const PingSetting& s) const {
    if (s.protocol == Protocol::Http && s.target.find("://") != std::string::npos) {
        ParsedURL url(s.target);
        ProbeTarget t = resolver_.resolve_one(url.host);
        t.hostname = s.target;
        t.port = url.port;
        return t;
    }
    ProbeTarget t = resolver_.resolve_one(s.target);
    t.port = s.port ? s.port : default_port(s.protocol);
    return t;
}

RunOutcome<ProbeStat> Engine::ping(const PingSetting& setting) {
    PingSetting s = setting;
    if (s.count == 0) s.count = 1;
    if (s.hop_limit <= 0) s.hop_limit = 64;

    auto run = registry_.begin(RunKind::Ping);
    RunEmitter em(bus_, registry_, run);
    RunOutcome<ProbeStat> out;
    out.run_id = run->id;
    em.start(s);
    log("run " + run->id + " ping " + s.target + " proto=" + to_string(s.protocol) +
        " count=" + std::to_string(s.count));

    ProbeTarget target;
    std::unique_ptr<ProbeDriver> driver;
    try {
        target = ping_target(s);
        driver = make_probe_driver(s.protocol);
    } catch (const ProbeError& e) {
        if (diag_) diag_->log(LogLevel::Error, "run " + run->id + " setup failed: " + e.what());
        detail::fail_run(em, out, e.what());
        return out;
    }

    ProbeStat stat;
    stat.target = target;
    stat.protocol = s.protocol;

    std::vector<std::uint32_t> items(s.count);
    for (std::uint32_t i = 0; i < s.count; ++i) items[i] = i + 1;

    ProbeScheduler<std::uint32_t, ProbeSample>::Options opt;
    opt.concurrency = 1;
    opt.ordered = true;
    opt.interval = s.interval;

    const CancelToken& cancel = *run->cancel;
    bool complete = false;
    try {
        auto sum = ProbeScheduler<std::uint32_t, ProbeSample>::run(
            items, opt, cancel,
            [&](const std::uint32_t&, std::uint32_t seq) -> std::optional<ProbeSample> {
                ProbeRequest req;
                req.target = target;
                req.seq = seq;
                req.timeout = s.timeout;
                req.hop_limit = s.hop_limit;
                req.payload = s.payload;
                ProbeOutcome o = driver->probe(req, cancel);
                if (o.aborted) return std::nullopt;
                if (o.status == SampleStatus::Error && diag_)
                    diag_->log(LogLevel::Warn, "run " + run->id + " seq " + std::to_string(seq) + ": " + o.message);
                return to_sample(req, o, s.protocol);
            },
            [&](std::uint32_t, ProbeSample&& sample) {
                stat = update(std::move(stat), sample);
                PingProgress p;
                p.sample = std::move(sample);
                p.transmitted = stat.transmitted;
                p.received = stat.received;
                p.percent = 100.0 * stat.transmitted / s.count;
                em.progress(std::move(p));
            });
        complete = sum.complete(items.size());
    } catch (const std::exception& e) {
        if (diag_) diag_->log(LogLevel::Error, "run " + run->id + " failed: " + e.what());
        detail::fail_run(em, out, e.what());
        return out;
    }

    detail::finish_run(em, complete, out, std::move(stat));
    log("run " + run->id + " " + to_string(out.status));
    return out;
}

bool Engine::ping_cancel(const RunId& run_id) {
    return cancel(run_id);
}

bool Engine::cancel(const RunId& run_id) {
    bool ok = registry_.cancel(run_id);
    log("cancel " + run_id + (ok ? " requested" : " ignored"));
    return ok;
}

std::optional<RunStatus> Engine::status(const RunId& run_id) const {
    return registry_.status(run_id);
}

bool Engine::acknowledge(const RunId& run_id) {
    return registry_.acknowledge(run_id);
}

ProbeTarget Engine::lookup_host(const std::string& host) const {
    return resolver_.lookup(host);
}

} // namespace netprobe
