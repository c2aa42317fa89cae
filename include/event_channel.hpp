#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

#include "events.hpp"

namespace netprobe {

// Bounded queue of one run's events for a pulling consumer. Until follow() is
// called the channel binds to the first run whose start event it sees. After
// that run's terminal event the channel closes itself; next() then drains the
// remainder and returns nullopt.
//
// When the queue is full, on_event() waits up to `max_block` for the consumer.
// If no room appears, progress events are dropped (counted by dropped()) until
// the consumer drains the queue to half capacity. Start and terminal events
// are always queued.
class ChannelSink : public EventSink {
public:
    explicit ChannelSink(std::size_t capacity = 1024,
                         std::chrono::milliseconds max_block = std::chrono::milliseconds(100));
    ~ChannelSink() override;

    void follow(const RunId& run_id);
    std::optional<RunId> following() const;

    void on_event(const Event& ev) override;

    std::optional<Event> next(std::chrono::milliseconds timeout);
    std::optional<Event> try_next();

    void close();
    bool closed() const;
    std::size_t pending() const;
    std::size_t dropped() const;

private:
    bool accepts_locked(const Event& ev);

    const std::size_t capacity_;
    const std::chrono::milliseconds max_block_;
    mutable std::mutex mu_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<Event> queue_;
    std::optional<RunId> run_;
    bool closed_ = false;
    bool overflowing_ = false;
    std::size_t dropped_ = 0;
};

} // namespace netprobe
