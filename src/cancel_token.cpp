#include "cancel_token.hpp"

namespace netprobe {

void CancelToken::cancel() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        flag_.store(true, std::memory_order_release);
    }
    cv_.notify_all();
}

bool CancelToken::wait_for(std::chrono::milliseconds d) const {
    if (d.count() <= 0) return cancelled();
    std::unique_lock<std::mutex> lk(mu_);
    return cv_.wait_for(lk, d, [this] { return flag_.load(std::memory_order_acquire); });
}

} // namespace netprobe
