#include <arpa/inet.h>
#include <atomic>
#include <cerrno>
#include <fcntl.h>
#include <functional>
#include <chrono>
#include <memory>
#include <mutex>
#include <netinet/in.h>
#include <string>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>
#include <vector>

#include "engine.hpp"
#include "event_channel.hpp"

using namespace netprobe;

class Recorder : public EventSink {
public:
    void on_event(const Event& ev) override {
        std::lock_guard<std::mutex> lk(mu_);
        events_.push_back(ev);
    }
    RunId last_start() {
        std::lock_guard<std::mutex> lk(mu_);
        for (auto it = events_.rbegin(); it != events_.rend(); ++it)
            if (it->type == EventType::Start) return it->run_id;
        return {};
    }
    std::vector<Event> of(const RunId& id) {
        std::lock_guard<std::mutex> lk(mu_);
        std::vector<Event> out;
        for (const auto& e : events_)
            if (e.run_id == id) out.push_back(e);
        return out;
    }

private:
    std::mutex mu_;
    std::vector<Event> events_;
};

// start first, exactly one terminal and it is last
static bool well_formed(const std::vector<Event>& evs, EventType terminal) {
    if (evs.size() < 2 || evs.front().type != EventType::Start) return false;
    for (std::size_t i = 1; i + 1 < evs.size(); ++i)
        if (evs[i].type != EventType::Progress) return false;
    return evs.back().type == terminal;
}

// Answers from a table: address -> outcome. Optionally waits for cancellation.
class FakeDriver : public ProbeDriver {
public:
    explicit FakeDriver(Protocol p, bool block = false) : protocol_(p), block_(block) {}
    Protocol protocol() const override { return protocol_; }
    ProbeOutcome probe(const ProbeRequest& req, const CancelToken& cancel) override {
        if (block_) {
            if (req.seq <= 2) return ProbeOutcome::done(1.0 * req.seq);
            if (cancel.wait_for(std::chrono::seconds(5))) return ProbeOutcome::cancelled();
            return ProbeOutcome::timeout(req.timeout);
        }
        if (req.target.ip.to_string() == "10.0.0.1") return ProbeOutcome::done(2.5);
        if (req.target.ip.to_string() == "10.0.0.3") {
            auto o = ProbeOutcome::error("connection refused", ECONNREFUSED);
            o.refused = true;
            o.rtt_ms = 0.7;
            return o;
        }
        return ProbeOutcome::timeout(req.timeout);
    }

private:
    Protocol protocol_;
    bool block_;
};

// Completes every probe; the last one also cancels the run it belongs to.
class LastProbeCancels : public ProbeDriver {
public:
    LastProbeCancels(Protocol p, std::uint32_t last, std::function<void()> on_last)
        : protocol_(p), last_(last), on_last_(std::move(on_last)) {}
    Protocol protocol() const override { return protocol_; }
    ProbeOutcome probe(const ProbeRequest& req, const CancelToken&) override {
        if (req.seq == last_) on_last_();
        return ProbeOutcome::done(0.5);
    }

private:
    Protocol protocol_;
    std::uint32_t last_;
    std::function<void()> on_last_;
};

class FakeHops : public HopProber {
public:
    HopReply probe(const IpAddress& dst, int ttl, int, std::chrono::milliseconds, const CancelToken&) override {
        HopReply r;
        r.rtt_ms = ttl * 1.0;
        if (ttl == 3) {
            r.kind = HopReplyKind::DestinationReached;
            r.from = dst;
        } else {
            r.kind = HopReplyKind::TimeExceeded;
            r.from = IpAddress::v4(0xC0A80000u + static_cast<std::uint32_t>(ttl));
        }
        return r;
    }
};

static int listen_loopback(uint16_t& port, bool do_listen) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in a{};
    a.sin_family = AF_INET;
    a.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    if (fd < 0 || ::bind(fd, reinterpret_cast<sockaddr*>(&a), sizeof(a)) != 0) return -1;
    socklen_t len = sizeof(a);
    ::getsockname(fd, reinterpret_cast<sockaddr*>(&a), &len);
    port = ntohs(a.sin_port);
    if (do_listen && ::listen(fd, 64) != 0) return -1;
    return fd;
}

int main() {
    EventBus bus;
    Recorder rec;
    bus.add_sink(&rec);

    EngineConfig cfg;
    cfg.open_icmp = false;
    Engine engine(bus, cfg);
    if (engine.icmp_available()) return 1;

    uint16_t open_port = 0, closed_a = 0, closed_b = 0;
    int lfd = listen_loopback(open_port, true);
    int ca = listen_loopback(closed_a, false);
    int cb = listen_loopback(closed_b, false);
    if (lfd < 0 || ca < 0 || cb < 0) return 2;
    ::close(ca);
    ::close(cb);

    // TCP port scan, custom ports on loopback
    {
        PortScanSetting s;
        s.target = "127.0.0.1";
        s.preset = PortPreset::Custom;
        s.user_ports = {closed_a, open_port, closed_b};
        s.timeout = std::chrono::milliseconds(500);
        auto out = engine.port_scan(s);
        if (out.status != RunStatus::Done || !out.report) return 3;
        const auto& r = *out.report;
        if (r.attempted != 3 || r.open_count != 1 || r.closed_count != 2) return 4;
        if (r.open.size() != 1 || r.open[0].port != open_port || r.open[0].state != PortState::Open) return 5;
        auto evs = rec.of(out.run_id);
        if (!well_formed(evs, EventType::Done) || evs.size() != 5) return 6;
        std::uint32_t last_done = 0;
        for (std::size_t i = 1; i + 1 < evs.size(); ++i) {
            auto* p = evs[i].as<PortScanSample>();
            if (!p || p->total != 3 || p->done != last_done + 1) return 7;
            last_done = p->done;
        }
        if (engine.status(out.run_id) != RunStatus::Done) return 8;
        if (engine.cancel(out.run_id)) return 9;
        if (!engine.acknowledge(out.run_id) || engine.status(out.run_id)) return 10;
    }

    // TCP ping, 4 probes
    {
        PingSetting s;
        s.protocol = Protocol::Tcp;
        s.target = "127.0.0.1";
        s.port = open_port;
        s.count = 4;
        s.interval = std::chrono::milliseconds(0);
        s.timeout = std::chrono::milliseconds(500);
        auto out = engine.ping(s);
        if (out.status != RunStatus::Done || !out.report) return 11;
        if (out.report->transmitted != 4 || out.report->received != 4) return 12;
        if (!(*out.report->min_ms <= *out.report->avg_ms && *out.report->avg_ms <= *out.report->max_ms)) return 13;
        auto evs = rec.of(out.run_id);
        if (!well_formed(evs, EventType::Done) || evs.size() != 6) return 14;
        for (std::uint32_t i = 1; i <= 4; ++i) {
            auto* p = evs[i].as<PingProgress>();
            if (!p || p->sample.seq != i || p->transmitted != i) return 15;
        }
        if (evs[4].as<PingProgress>()->percent != 100.0) return 16;
    }
    // drain the connections the ping left in the backlog
    ::fcntl(lfd, F_SETFL, ::fcntl(lfd, F_GETFL) | O_NONBLOCK);
    for (int c; (c = ::accept(lfd, nullptr, nullptr)) >= 0;) ::close(c);

    // everything after here uses fake drivers
    engine.set_driver_factory([](Protocol p) { return std::make_unique<FakeDriver>(p); });

    // host scan of a /30: two usable targets
    {
        HostScanSetting s;
        s.targets = {"10.0.0.0/30"};
        s.protocol = HostScanProtocol::Tcp;
        s.timeout = std::chrono::milliseconds(50);
        s.count = 2;
        auto out = engine.host_scan(s);
        if (out.status != RunStatus::Done || !out.report) return 17;
        const auto& r = *out.report;
        if (r.total != 2 || r.alive.size() + r.unreachable.size() != r.total) return 18;
        if (r.alive.size() != 1 || r.alive[0].ip.to_string() != "10.0.0.1" || r.alive[0].rtt_ms != 2.5) return 19;
        if (r.unreachable[0].to_string() != "10.0.0.2") return 20;
        auto evs = rec.of(out.run_id);
        if (!well_formed(evs, EventType::Done) || evs.size() != 4) return 21;
    }

    // a TCP refusal proves the host
    {
        HostScanSetting s;
        s.targets = {"10.0.0.3", "10.0.0.3", "10.0.0.4"};
        s.protocol = HostScanProtocol::Tcp;
        s.ordered = true;
        auto out = engine.host_scan(s);
        if (!out.ok() || out.report->total != 2 || out.report->alive.size() != 1) return 22;
        if (out.report->alive[0].ip.to_string() != "10.0.0.3") return 23;
    }

    // malformed CIDR: one error event, no progress
    {
        HostScanSetting s;
        s.targets = {"10.0.0.0/99"};
        auto out = engine.host_scan(s);
        if (out.status != RunStatus::Failed || out.error.empty() || out.report) return 24;
        auto evs = rec.of(out.run_id);
        if (evs.size() != 2 || !well_formed(evs, EventType::Error)) return 25;
    }

    // too large to expand
    {
        EngineConfig small = cfg;
        small.max_expand = 100;
        Engine e2(bus, small);
        HostScanSetting s;
        s.targets = {"10.0.0.0/24"};
        auto out = e2.host_scan(s);
        if (out.status != RunStatus::Failed) return 26;
        if (rec.of(out.run_id).size() != 2) return 27;
    }

    // custom preset without ports
    {
        PortScanSetting s;
        s.target = "127.0.0.1";
        s.preset = PortPreset::Custom;
        if (engine.port_scan(s).status != RunStatus::Failed) return 28;
    }

    // cancelling a ping mid-flight
    {
        engine.set_driver_factory([](Protocol p) { return std::make_unique<FakeDriver>(p, true); });
        ChannelSink chan;
        bus.add_sink(&chan);
        std::thread canceller([&] {
            while (auto ev = chan.next(std::chrono::seconds(5))) {
                if (ev->type == EventType::Progress && ev->as<PingProgress>()->sample.seq == 2) {
                    engine.ping_cancel(ev->run_id);
                }
            }
        });
        PingSetting s;
        s.protocol = Protocol::Udp;
        s.target = "127.0.0.1";
        s.count = 10;
        s.interval = std::chrono::milliseconds(0);
        auto out = engine.ping(s);
        canceller.join();
        chan.close();
        bus.remove_sink(&chan);

        if (out.status != RunStatus::Cancelled || !out.report) return 29;
        if (out.report->transmitted != 2) return 30;
        auto evs = rec.of(out.run_id);
        if (!well_formed(evs, EventType::Cancelled)) return 31;
        int cancelled = 0;
        for (const auto& e : evs)
            if (e.type == EventType::Cancelled) ++cancelled;
        if (cancelled != 1) return 32;
        for (std::uint32_t i = 1; i + 1 < evs.size(); ++i)
            if (evs[i].as<PingProgress>()->sample.seq != i) return 33;
        if (engine.ping_cancel(out.run_id)) return 34;
    }

    // a cancel that lands after the last probe still reports a finished run
    {
        engine.set_driver_factory([&](Protocol p) {
            return std::make_unique<LastProbeCancels>(p, 3, [&] { engine.ping_cancel(rec.last_start()); });
        });
        PingSetting s;
        s.protocol = Protocol::Tcp;
        s.target = "127.0.0.1";
        s.count = 3;
        s.interval = std::chrono::milliseconds(0);
        auto out = engine.ping(s);
        if (out.status != RunStatus::Done || !out.report || out.report->transmitted != 3) return 53;
        if (!well_formed(rec.of(out.run_id), EventType::Done)) return 54;
    }

    // ICMP without a raw socket fails at setup
    {
        engine.set_driver_factory(nullptr);
        PingSetting s;
        s.target = "127.0.0.1";
        auto out = engine.ping(s);
        if (out.status != RunStatus::Failed || out.error.empty()) return 35;
        if (!well_formed(rec.of(out.run_id), EventType::Error)) return 36;
    }

    // traceroute through a fake path
    {
        engine.set_hop_prober_factory([](const TraceSetting&) { return std::make_unique<FakeHops>(); });
        TraceSetting s;
        s.target = "203.0.113.9";
        s.tries_per_hop = 0;
        auto out = engine.traceroute(s);
        if (out.status != RunStatus::Done || !out.report) return 37;
        if (!out.report->reached || out.report->hops.size() != 3 || out.report->max_hops != 30) return 38;
        auto evs = rec.of(out.run_id);
        if (!well_formed(evs, EventType::Done) || evs.size() != 5) return 39;
        for (int i = 1; i <= 3; ++i)
            if (evs[i].as<TraceHop>()->hop != i) return 40;
    }

    // port-state reading of probe outcomes
    {
        std::optional<std::string> msg;
        auto refused = ProbeOutcome::error("connection refused", ECONNREFUSED);
        refused.refused = true;
        if (classify_port(PortScanProtocol::Tcp, ProbeOutcome::done(1.0), msg) != PortState::Open) return 41;
        if (classify_port(PortScanProtocol::Tcp, refused, msg) != PortState::Closed) return 42;
        if (classify_port(PortScanProtocol::Tcp, ProbeOutcome::timeout(std::chrono::milliseconds(1)), msg) !=
            PortState::Filtered)
            return 43;
        if (classify_port(PortScanProtocol::Tcp, ProbeOutcome::error("x", EHOSTUNREACH), msg) != PortState::Filtered)
            return 44;
        if (classify_port(PortScanProtocol::Tcp, ProbeOutcome::error("x", EACCES), msg) != PortState::Closed)
            return 45;

        msg.reset();
        if (classify_port(PortScanProtocol::Udp, ProbeOutcome::timeout(std::chrono::milliseconds(1)), msg) !=
                PortState::Filtered ||
            !msg || *msg != "open|filtered")
            return 46;
        auto unreach = ProbeOutcome::done(1.0, "port unreachable");
        unreach.refused = true;
        if (classify_port(PortScanProtocol::Udp, unreach, msg) != PortState::Closed) return 47;
        if (classify_port(PortScanProtocol::Udp, ProbeOutcome::done(1.0), msg) != PortState::Open) return 48;

        auto retry = ProbeOutcome::error("server requested retry");
        retry.responded = true;
        if (classify_port(PortScanProtocol::Quic, retry, msg) != PortState::Open) return 49;
        if (classify_port(PortScanProtocol::Quic, ProbeOutcome::timeout(std::chrono::milliseconds(1)), msg) !=
            PortState::Filtered)
            return 50;

        if (!host_alive(refused) || host_alive(ProbeOutcome::timeout(std::chrono::milliseconds(1)))) return 51;
    }

    // lookup of a literal needs no network
    if (engine.lookup_host("127.0.0.1").ip.to_string() != "127.0.0.1") return 52;

    ::close(lfd);
    bus.remove_sink(&rec);
    return 0;
}
