#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "event_channel.hpp"
#include "events.hpp"

using namespace netprobe;

class Recorder : public EventSink {
public:
    void on_event(const Event& ev) override {
        std::lock_guard<std::mutex> lk(mu);
        events.push_back(ev);
    }
    std::vector<Event> of(const RunId& id) {
        std::lock_guard<std::mutex> lk(mu);
        std::vector<Event> out;
        for (const auto& e : events)
            if (e.run_id == id) out.push_back(e);
        return out;
    }
    std::mutex mu;
    std::vector<Event> events;
};

// Blocks inside on_event for the held run's first progress event until released.
class Stuck : public EventSink {
public:
    void hold(const RunId& id) {
        std::lock_guard<std::mutex> lk(mu);
        held = id;
    }
    void on_event(const Event& ev) override {
        std::unique_lock<std::mutex> lk(mu);
        if (ev.run_id != held || ev.type != EventType::Progress) return;
        entered = true;
        cv.notify_all();
        cv.wait(lk, [this] { return released; });
    }
    bool wait_entered() {
        std::unique_lock<std::mutex> lk(mu);
        return cv.wait_for(lk, std::chrono::seconds(2), [this] { return entered; });
    }
    void release() {
        {
            std::lock_guard<std::mutex> lk(mu);
            released = true;
        }
        cv.notify_all();
    }

private:
    std::mutex mu;
    std::condition_variable cv;
    RunId held;
    bool entered = false;
    bool released = false;
};

int main() {
    EventBus bus;
    RunRegistry reg;
    Recorder rec;
    ChannelSink chan(16);
    bus.add_sink(&rec);
    bus.add_sink(&chan);

    auto run = reg.begin(RunKind::Ping);
    RunEmitter em(bus, reg, run);
    PingSetting setting;
    setting.target = "192.0.2.1";
    em.start(setting);
    em.start(setting);

    // another run interleaving on the same bus
    auto other = reg.begin(RunKind::HostScan);
    RunEmitter em2(bus, reg, other);
    em2.start(HostScanSetting{});

    PingProgress p;
    p.sample.seq = 1;
    if (!em.progress(p)) return 1;
    ProbeStat stat;
    stat.transmitted = 1;
    if (!em.done(stat)) return 2;
    if (em.progress(p)) return 3;
    if (em.error("late")) return 4;
    if (em.cancelled(stat)) return 5;
    if (!em.finished()) return 6;
    if (reg.status(run->id) != RunStatus::Done) return 7;

    auto evs = rec.of(run->id);
    if (evs.size() != 3) return 8;
    if (evs[0].type != EventType::Start || evs[0].topic() != "ping:start") return 9;
    if (evs[1].type != EventType::Progress || !evs[1].as<PingProgress>()) return 10;
    if (!evs[2].terminal() || evs[2].topic() != "ping:done") return 11;
    if (!evs[2].as<ProbeStat>() || evs[2].as<ProbeStat>()->transmitted != 1) return 12;

    // channel bound to the first start it saw and closed on its terminal
    if (!chan.following() || *chan.following() != run->id) return 13;
    if (!chan.closed()) return 14;
    int n = 0;
    while (auto ev = chan.next(std::chrono::milliseconds(10))) {
        if (ev->run_id != run->id) return 15;
        ++n;
    }
    if (n != 3) return 16;
    bus.remove_sink(&chan);

    // racing terminal calls: exactly one event
    for (int round = 0; round < 30; ++round) {
        auto r = reg.begin(RunKind::PortScan);
        RunEmitter e(bus, reg, r);
        e.start(PortScanSetting{});
        std::atomic<int> wins{0};
        std::thread t1([&] { if (e.done(PortScanReport{})) ++wins; });
        std::thread t2([&] { if (e.cancelled(PortScanReport{})) ++wins; });
        std::thread t3([&] { if (e.error("x")) ++wins; });
        t1.join();
        t2.join();
        t3.join();
        if (wins.load() != 1) return 17;
        int terminals = 0;
        for (const auto& ev : rec.of(r->id))
            if (ev.terminal()) ++terminals;
        if (terminals != 1) return 18;
    }

    // a run already finished elsewhere gets no terminal event
    auto lost = reg.begin(RunKind::Traceroute);
    RunEmitter el(bus, reg, lost);
    reg.finish(lost->id, RunStatus::Failed);
    if (el.done(TraceDone{})) return 19;

    // error carries the message
    em2.error("no route");
    auto e2 = rec.of(other->id);
    if (e2.back().type != EventType::Error || !e2.back().as<std::string>() || *e2.back().as<std::string>() != "no route")
        return 20;

    // explicit follow
    ChannelSink follower(4);
    follower.follow(other->id);
    if (!follower.following() || *follower.following() != other->id) return 21;
    follower.close();
    if (follower.next(std::chrono::milliseconds(1))) return 22;

    // a consumer that never drains neither stalls the run nor grows unbounded
    {
        ChannelSink small(4, std::chrono::milliseconds(10));
        bus.add_sink(&small);
        auto r = reg.begin(RunKind::PortScan);
        RunEmitter e(bus, reg, r);
        e.start(PortScanSetting{});
        const auto t0 = std::chrono::steady_clock::now();
        for (std::uint32_t i = 0; i < 2000; ++i) {
            PortScanSample sample;
            sample.done = i + 1;
            sample.total = 2000;
            e.progress(sample);
        }
        if (!e.done(PortScanReport{})) return 23;
        if (std::chrono::steady_clock::now() - t0 > std::chrono::seconds(2)) return 24;
        bus.remove_sink(&small);

        // start + three progress fill the queue; the terminal still lands
        if (small.dropped() != 1997) return 25;
        std::vector<Event> got;
        while (auto ev = small.next(std::chrono::milliseconds(10))) got.push_back(*ev);
        if (got.size() != 5) return 26;
        if (got.front().type != EventType::Start || got.back().type != EventType::Done) return 27;
        if (got[3].as<PortScanSample>()->done != 3) return 28;
    }

    // a sink stuck on one run does not hold up another run on the same bus
    {
        Stuck stuck;
        bus.add_sink(&stuck);
        auto slow = reg.begin(RunKind::Ping);
        RunEmitter es(bus, reg, slow);
        stuck.hold(slow->id);
        std::thread t([&] {
            es.start(PingSetting{});
            es.progress(PingProgress{});
        });
        if (!stuck.wait_entered()) return 29;

        auto fast = reg.begin(RunKind::Ping);
        RunEmitter ef(bus, reg, fast);
        ef.start(PingSetting{});
        if (!ef.done(ProbeStat{})) return 30;
        if (rec.of(fast->id).size() != 2) return 31;

        stuck.release();
        t.join();
        bus.remove_sink(&stuck);
        es.done(ProbeStat{});
    }

    bus.remove_sink(&rec);
    return 0;
}
