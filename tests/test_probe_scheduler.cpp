#include <atomic>
#include <chrono>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "probe_scheduler.hpp"

using namespace netprobe;
using Sched = ProbeScheduler<int, int>;

int main() {
    std::vector<int> items;
    for (int i = 0; i < 40; ++i) items.push_back(i);

    // never more than `concurrency` jobs at once
    {
        std::atomic<int> live{0}, peak{0};
        std::vector<std::uint32_t> seqs;
        Sched::Options opt;
        opt.concurrency = 4;
        CancelToken cancel;
        auto sum = Sched::run(
            items, opt, cancel,
            [&](const int& v, std::uint32_t seq) -> std::optional<int> {
                int now = ++live;
                int p = peak.load();
                while (now > p && !peak.compare_exchange_weak(p, now)) {}
                std::this_thread::sleep_for(std::chrono::milliseconds(2 + (v % 3)));
                --live;
                if (seq != static_cast<std::uint32_t>(v + 1)) return -1;
                return v;
            },
            [&](std::uint32_t seq, int&& r) {
                if (r < 0) return;
                seqs.push_back(seq);
            });
        if (peak.load() > 4 || peak.load() < 1) return 1;
        if (sum.dispatched != 40 || sum.completed != 40 || sum.aborted != 0 || sum.cancelled) return 2;
        if (seqs.size() != 40) return 3;
        if (std::set<std::uint32_t>(seqs.begin(), seqs.end()).size() != 40) return 4;
    }

    // ordered: emission follows input order even when later items finish first
    {
        std::vector<int> emitted;
        Sched::Options opt;
        opt.concurrency = 8;
        opt.ordered = true;
        CancelToken cancel;
        Sched::run(
            items, opt, cancel,
            [&](const int& v, std::uint32_t) -> std::optional<int> {
                std::this_thread::sleep_for(std::chrono::milliseconds((40 - v) % 7));
                return v;
            },
            [&](std::uint32_t seq, int&& r) {
                if (seq != static_cast<std::uint32_t>(r + 1)) emitted.push_back(-1);
                emitted.push_back(r);
            });
        if (emitted.size() != 40) return 5;
        for (int i = 0; i < 40; ++i)
            if (emitted[i] != i) return 6;
    }

    // cancellation stops dispatch; what was emitted is a prefix-consistent set
    {
        std::vector<std::uint32_t> seqs;
        Sched::Options opt;
        opt.concurrency = 2;
        opt.ordered = true;
        CancelToken cancel;
        auto sum = Sched::run(
            items, opt, cancel,
            [&](const int& v, std::uint32_t) -> std::optional<int> {
                if (v == 9) cancel.cancel();
                if (v >= 10) {
                    // wait for the token like a socket would
                    cancel.wait_for(std::chrono::milliseconds(200));
                    return std::nullopt;
                }
                return v;
            },
            [&](std::uint32_t seq, int&&) { seqs.push_back(seq); });
        if (!sum.cancelled) return 7;
        if (sum.dispatched >= 40) return 8;
        if (seqs.size() < 10) return 9;
        for (std::size_t i = 0; i < seqs.size(); ++i)
            if (seqs[i] != i + 1) return 10;
    }

    // interval spaces dispatches
    {
        Sched::Options opt;
        opt.concurrency = 4;
        opt.interval = std::chrono::milliseconds(20);
        CancelToken cancel;
        std::vector<int> five = {0, 1, 2, 3, 4};
        auto t0 = std::chrono::steady_clock::now();
        Sched::run(five, opt, cancel, [](const int& v, std::uint32_t) -> std::optional<int> { return v; },
                   [](std::uint32_t, int&&) {});
        auto took = std::chrono::steady_clock::now() - t0;
        if (took < std::chrono::milliseconds(75)) return 11;
    }

    // a throwing job surfaces after the pool drains
    {
        Sched::Options opt;
        opt.concurrency = 3;
        CancelToken cancel;
        try {
            Sched::run(items, opt, cancel,
                       [](const int& v, std::uint32_t) -> std::optional<int> {
                           if (v == 5) throw std::runtime_error("boom");
                           return v;
                       },
                       [](std::uint32_t, int&&) {});
            return 12;
        } catch (const std::runtime_error&) {
        }
    }

    // a throwing emit (a failing sink) surfaces the same way, in both modes
    for (bool ordered : {false, true}) {
        Sched::Options opt;
        opt.concurrency = 2;
        opt.ordered = ordered;
        CancelToken cancel;
        std::atomic<int> calls{0};
        std::vector<int> four = {0, 1, 2, 3};
        try {
            Sched::run(four, opt, cancel, [](const int& v, std::uint32_t) -> std::optional<int> { return v; },
                       [&](std::uint32_t, int&&) {
                           ++calls;
                           throw std::runtime_error("sink failed");
                       });
            return 14;
        } catch (const std::runtime_error& e) {
            if (std::string(e.what()) != "sink failed") return 15;
        }
        if (calls.load() != 1) return 16;
    }

    // run completion: all items ran, or a cancel cut one short
    {
        CancelToken cancel;
        auto sum = Sched::run(items, Sched::Options{}, cancel,
                              [&](const int& v, std::uint32_t) -> std::optional<int> { return v; },
                              [&](std::uint32_t, int&&) {});
        cancel.cancel();
        if (!sum.complete(items.size())) return 17;

        CancelToken stop;
        auto cut = Sched::run(items, Sched::Options{}, stop,
                              [&](const int& v, std::uint32_t) -> std::optional<int> {
                                  stop.cancel();
                                  if (v > 0) return std::nullopt;
                                  return v;
                              },
                              [&](std::uint32_t, int&&) {});
        if (cut.complete(items.size())) return 18;
    }

    // empty input
    {
        CancelToken cancel;
        auto sum = Sched::run({}, Sched::Options{}, cancel,
                              [](const int& v, std::uint32_t) -> std::optional<int> { return v; },
                              [](std::uint32_t, int&&) {});
        if (sum.dispatched != 0) return 13;
    }
    return 0;
}
