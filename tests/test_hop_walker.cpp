#include <map>
#include <string>
#include <vector>

#include "hop_walker.hpp"

using namespace netprobe;

// Path of routers 10.0.0.<ttl>; the destination answers from `reach_at` on.
// TTLs listed in `silent` never answer.
class FakePath : public HopProber {
public:
    FakePath(IpAddress dst, int reach_at) : dst_(dst), reach_at_(reach_at) {}

    HopReply probe(const IpAddress&, int ttl, int attempt, std::chrono::milliseconds,
                   const CancelToken& cancel) override {
        calls.push_back(ttl);
        HopReply r;
        if (cancel.cancelled()) {
            r.kind = HopReplyKind::Aborted;
            return r;
        }
        if (ttl == cancel_at && cancel_token) {
            cancel_token->cancel();
            r.kind = HopReplyKind::Aborted;
            return r;
        }
        if (silent.count(ttl)) {
            r.kind = HopReplyKind::Timeout;
            return r;
        }
        if (ttl == error_at) {
            r.kind = HopReplyKind::Error;
            r.message = "send error: Network is unreachable";
            return r;
        }
        if (ttl >= reach_at_) {
            r.kind = HopReplyKind::DestinationReached;
            r.from = dst_;
        } else {
            r.kind = HopReplyKind::TimeExceeded;
            r.from = IpAddress::v4(0x0A000000u + static_cast<std::uint32_t>(ttl));
        }
        r.rtt_ms = 10.0 * ttl + (attempt == 1 ? -1.0 : 0.0);
        return r;
    }

    std::vector<int> calls;
    std::map<int, bool> silent;
    int error_at = -1;
    int cancel_at = -1;
    CancelToken* cancel_token = nullptr;

private:
    IpAddress dst_;
    int reach_at_;
};

static int contiguous(const std::vector<TraceHop>& hops) {
    for (std::size_t i = 0; i < hops.size(); ++i)
        if (hops[i].hop != static_cast<int>(i + 1)) return 1;
    return 0;
}

int main() {
    const IpAddress dst = *IpAddress::parse("198.51.100.7");

    // reaches the destination at hop 4, hop 2 is silent
    {
        FakePath path(dst, 4);
        path.silent[2] = true;
        TraceSetting s;
        s.max_hops = 30;
        s.tries_per_hop = 3;
        HopWalker w(path, dst, s);
        CancelToken cancel;
        std::vector<TraceHop> seen;
        auto st = w.run(cancel, [&](const TraceHop& h) { seen.push_back(h); });
        if (st != HopWalker::State::Reached || !w.reached()) return 1;
        if (seen.size() != 4 || w.hops().size() != 4) return 2;
        if (contiguous(seen) != 0) return 3;
        if (seen[1].ip || !seen[1].note || *seen[1].note != "timeout") return 4;
        if (!seen[0].ip || seen[0].ip->to_string() != "10.0.0.1") return 5;
        // best of the tries is kept
        if (!seen[0].rtt_ms || *seen[0].rtt_ms != 9.0) return 6;
        if (!seen[3].reached || *seen[3].ip != dst) return 7;
        for (int i = 0; i < 3; ++i)
            if (seen[i].reached) return 8;
        // the hop that reached stops probing early
        int hop4 = 0;
        for (int t : path.calls)
            if (t == 4) ++hop4;
        if (hop4 != 1) return 9;
    }

    // never reached: exhausts max_hops
    {
        FakePath path(dst, 100);
        TraceSetting s;
        s.max_hops = 5;
        s.tries_per_hop = 1;
        HopWalker w(path, dst, s);
        CancelToken cancel;
        auto st = w.run(cancel, nullptr);
        if (st != HopWalker::State::Exhausted || w.reached()) return 10;
        if (w.hops().size() != 5 || contiguous(w.hops()) != 0) return 11;
        if (w.hops().back().hop != 5) return 12;
        // terminal states do not move
        if (w.step(cancel) != HopWalker::State::Exhausted || w.hops().size() != 5) return 13;
    }

    // zero values are sanitized
    {
        TraceSetting s;
        s.max_hops = 0;
        s.tries_per_hop = 0;
        s.timeout = std::chrono::milliseconds(0);
        TraceSetting c = sanitize(s);
        if (c.max_hops != 30 || c.tries_per_hop != 1 || c.timeout.count() != 1000) return 14;
    }

    // cancellation mid-walk: no partial hop, no further probes
    {
        FakePath path(dst, 100);
        CancelToken cancel;
        path.cancel_at = 3;
        path.cancel_token = &cancel;
        TraceSetting s;
        s.tries_per_hop = 2;
        HopWalker w(path, dst, s);
        std::vector<TraceHop> seen;
        auto st = w.run(cancel, [&](const TraceHop& h) { seen.push_back(h); });
        if (st != HopWalker::State::Cancelled) return 15;
        if (seen.size() != 2 || contiguous(seen) != 0) return 16;
        if (path.calls.back() != 3) return 17;
    }

    // cancelled before the first hop
    {
        FakePath path(dst, 1);
        CancelToken cancel;
        cancel.cancel();
        HopWalker w(path, dst, TraceSetting{});
        if (w.step(cancel) != HopWalker::State::Cancelled) return 18;
        if (!path.calls.empty() || !w.hops().empty()) return 19;
    }

    // local send errors become the hop note
    {
        FakePath path(dst, 3);
        path.error_at = 1;
        TraceSetting s;
        s.tries_per_hop = 2;
        HopWalker w(path, dst, s);
        CancelToken cancel;
        w.run(cancel, nullptr);
        if (w.hops().size() != 3) return 20;
        if (w.hops()[0].ip || !w.hops()[0].note || w.hops()[0].note->find("send error") != 0) return 21;
        if (!w.reached()) return 22;
    }

    if (std::string(to_string(HopWalker::State::Reached)) != "reached") return 23;
    return 0;
}
