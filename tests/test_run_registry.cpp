#include <atomic>
#include <chrono>
#include <set>
#include <thread>
#include <vector>

#include "run_registry.hpp"

using namespace netprobe;

int main() {
    RunRegistry reg;

    auto a = reg.begin(RunKind::Ping);
    auto b = reg.begin(RunKind::PortScan);
    if (a->id == b->id || a->id.size() != 36) return 1;
    if (reg.status(a->id) != RunStatus::Running) return 2;
    if (reg.status("no-such-run")) return 3;

    if (!reg.cancel(a->id) || !a->cancel->cancelled()) return 4;
    if (b->cancel->cancelled()) return 5;

    if (!reg.finish(a->id, RunStatus::Cancelled)) return 6;
    if (reg.finish(a->id, RunStatus::Done)) return 7;
    if (reg.status(a->id) != RunStatus::Cancelled) return 8;
    // cancelling a finished run is a no-op
    if (reg.cancel(a->id)) return 9;
    if (reg.cancel("no-such-run")) return 10;

    if (reg.acknowledge(b->id)) return 11; // still running
    if (!reg.acknowledge(a->id) || reg.status(a->id)) return 12;

    // exactly one terminal transition under concurrent finish and cancel
    for (int round = 0; round < 50; ++round) {
        auto r = reg.begin(RunKind::HostScan);
        std::atomic<int> wins{0};
        std::vector<std::thread> ts;
        for (int i = 0; i < 8; ++i) {
            ts.emplace_back([&, i] {
                reg.cancel(r->id);
                if (reg.finish(r->id, i % 2 ? RunStatus::Done : RunStatus::Cancelled)) ++wins;
            });
        }
        for (auto& t : ts) t.join();
        if (wins.load() != 1) return 13;
    }

    std::set<RunId> ids;
    for (int i = 0; i < 200; ++i) ids.insert(reg.begin(RunKind::Traceroute)->id);
    if (ids.size() != 200) return 14;

    // retention window
    RunRegistry quick(std::chrono::milliseconds(10));
    auto q = quick.begin(RunKind::NeighborScan);
    quick.finish(q->id, RunStatus::Done);
    auto keep = quick.begin(RunKind::Ping);
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    if (quick.prune() != 1) return 15;
    if (quick.status(q->id) || !quick.status(keep->id)) return 16;
    if (quick.size() != 1) return 17;
    return 0;
}
