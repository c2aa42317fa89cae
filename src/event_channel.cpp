#include "event_channel.hpp"

namespace netprobe {

ChannelSink::ChannelSink(std::size_t capacity, std::chrono::milliseconds max_block)
    : capacity_(capacity == 0 ? 1 : capacity), max_block_(max_block) {}

ChannelSink::~ChannelSink() { close(); }

void ChannelSink::follow(const RunId& run_id) {
    std::lock_guard<std::mutex> lk(mu_);
    run_ = run_id;
}

std::optional<RunId> ChannelSink::following() const {
    std::lock_guard<std::mutex> lk(mu_);
    return run_;
}

bool ChannelSink::accepts_locked(const Event& ev) {
    if (closed_) return false;
    if (!run_) {
        if (ev.type != EventType::Start) return false;
        run_ = ev.run_id;
        return true;
    }
    return *run_ == ev.run_id;
}

void ChannelSink::on_event(const Event& ev) {
    std::unique_lock<std::mutex> lk(mu_);
    if (!accepts_locked(ev)) return;
    if (ev.type == EventType::Progress) {
        if (overflowing_ ||
            !not_full_.wait_for(lk, max_block_, [this] { return closed_ || queue_.size() < capacity_; })) {
            overflowing_ = true;
            ++dropped_;
            return;
        }
        if (closed_) return;
    }
    queue_.push_back(ev);
    if (ev.terminal()) closed_ = true;
    lk.unlock();
    not_empty_.notify_one();
}

std::optional<Event> ChannelSink::next(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(mu_);
    if (!not_empty_.wait_for(lk, timeout, [this] { return !queue_.empty() || closed_; }))
        return std::nullopt;
    if (queue_.empty()) return std::nullopt;
    Event ev = std::move(queue_.front());
    queue_.pop_front();
    if (overflowing_ && queue_.size() <= capacity_ / 2) overflowing_ = false;
    lk.unlock();
    not_full_.notify_one();
    return ev;
}

std::optional<Event> ChannelSink::try_next() {
    return next(std::chrono::milliseconds(0));
}

void ChannelSink::close() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        closed_ = true;
    }
    not_full_.notify_all();
    not_empty_.notify_all();
}

bool ChannelSink::closed() const {
    std::lock_guard<std::mutex> lk(mu_);
    return closed_;
}

std::size_t ChannelSink::dropped() const {
    std::lock_guard<std::mutex> lk(mu_);
    return dropped_;
}

std::size_t ChannelSink::pending() const {
    std::lock_guard<std::mutex> lk(mu_);
    return queue_.size();
}

} // namespace netprobe
