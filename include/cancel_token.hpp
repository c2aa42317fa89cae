#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace netprobe {

// Cooperative cancellation flag shared between a run and its workers.
class CancelToken {
public:
    void cancel();
    bool cancelled() const { return flag_.load(std::memory_order_acquire); }

    // Sleeps for up to `d`. Returns true if cancellation was observed.
    bool wait_for(std::chrono::milliseconds d) const;

private:
    std::atomic<bool> flag_{false};
    mutable std::mutex mu_;
    mutable std::condition_variable cv_;
};

} // namespace netprobe
