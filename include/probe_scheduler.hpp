// ===================== File: include/probe_scheduler.hpp =====================
#pragma once
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "cancel_token.hpp"

namespace netprobe {

constexpr std::size_t kDefaultConcurrency = 100;

// Runs one job per item on a pool of at most `concurrency` threads.
//
// Items are dispatched in input order; item i gets sequence number i + 1 at
// dispatch. A job returns nullopt when cancellation aborted it mid-flight.
// Results reach `emit` one at a time (under the scheduler lock), in
// completion order, or in input order when `ordered` is set; early results
// are then held back until every earlier item has reported.
//
// Cancellation stops dispatch; jobs already running finish (their sockets
// watch the same token) and their results are still emitted. An exception
// from `job` or `emit` stops dispatch and is rethrown once the pool joins.
template <typename Item, typename Result>
class ProbeScheduler {
public:
    struct Options {
        std::size_t concurrency = kDefaultConcurrency;
        bool ordered = false;
        // Minimum spacing between two dispatches.
        std::chrono::milliseconds interval{0};
    };

    struct Summary {
        std::size_t dispatched = 0;
        std::size_t completed = 0;
        std::size_t aborted = 0;
        bool cancelled = false;

        // Every item ran and none was cut short.
        bool complete(std::size_t total) const { return dispatched == total && aborted == 0; }
    };

    using Job = std::function<std::optional<Result>(const Item&, std::uint32_t seq)>;
    using Emit = std::function<void(std::uint32_t seq, Result&& result)>;

    static Summary run(const std::vector<Item>& items, const Options& opt,
                       const CancelToken& cancel, const Job& job, const Emit& emit) {
        using Clock = std::chrono::steady_clock;

        Summary sum;
        if (items.empty()) {
            sum.cancelled = cancel.cancelled();
            return sum;
        }

        std::mutex mu;
        std::size_t next = 0;
        std::size_t next_emit = 0;
        std::map<std::size_t, std::optional<Result>> held;
        Clock::time_point next_slot = Clock::now();
        std::atomic<bool> halt{false};
        std::exception_ptr failure;

        // Called with `mu` held. A throwing emit halts the pool like a
        // throwing job; later results are dropped.
        auto emit_locked = [&](std::size_t idx, Result&& r) {
            if (failure) return;
            try {
                emit(static_cast<std::uint32_t>(idx + 1), std::move(r));
            } catch (...) {
                failure = std::current_exception();
                halt.store(true);
            }
        };

        auto flush_locked = [&]() {
            while (!held.empty() && held.begin()->first == next_emit) {
                auto node = held.begin();
                if (node->second) emit_locked(node->first, std::move(*node->second));
                held.erase(node);
                ++next_emit;
            }
        };

        auto deliver = [&](std::size_t idx, std::optional<Result> r) {
            std::lock_guard<std::mutex> lk(mu);
            if (r) ++sum.completed;
            else ++sum.aborted;
            if (!opt.ordered) {
                if (r) emit_locked(idx, std::move(*r));
                return;
            }
            held.emplace(idx, std::move(r));
            flush_locked();
        };

        auto worker = [&]() {
            for (;;) {
                std::size_t idx;
                std::chrono::milliseconds pause{0};
                {
                    std::lock_guard<std::mutex> lk(mu);
                    if (halt.load() || cancel.cancelled() || next >= items.size()) return;
                    idx = next++;
                    ++sum.dispatched;
                    if (opt.interval.count() > 0) {
                        auto now = Clock::now();
                        if (next_slot > now)
                            pause = std::chrono::duration_cast<std::chrono::milliseconds>(next_slot - now);
                        next_slot = std::max(now, next_slot) + opt.interval;
                    }
                }
                if (pause.count() > 0 && cancel.wait_for(pause)) {
                    deliver(idx, std::nullopt);
                    return;
                }

                std::optional<Result> r;
                try {
                    r = job(items[idx], static_cast<std::uint32_t>(idx + 1));
                } catch (...) {
                    std::lock_guard<std::mutex> lk(mu);
                    if (!failure) failure = std::current_exception();
                    halt.store(true);
                }
                deliver(idx, std::move(r));
            }
        };

        const std::size_t width = std::max<std::size_t>(1, std::min(opt.concurrency, items.size()));
        std::vector<std::thread> pool;
        pool.reserve(width);
        try {
            for (std::size_t i = 0; i < width; ++i) pool.emplace_back(worker);
        } catch (...) {
            halt.store(true);
            for (auto& t : pool) t.join();
            throw;
        }
        for (auto& t : pool) t.join();

        if (failure) std::rethrow_exception(failure);
        sum.cancelled = cancel.cancelled();
        return sum;
    }
};

} // namespace netprobe
