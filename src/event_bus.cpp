#include "events.hpp"

#include <algorithm>

namespace netprobe {

const char* to_string(EventType t) {
    switch (t) {
        case EventType::Start:     return "start";
        case EventType::Progress:  return "progress";
        case EventType::Done:      return "done";
        case EventType::Error:     return "error";
        case EventType::Cancelled: return "cancelled";
    }
    return "?";
}

std::string Event::topic() const {
    return std::string(to_string(kind)) + ":" + to_string(type);
}

void EventBus::add_sink(EventSink* sink) {
    std::lock_guard<std::mutex> lk(mu_);
    sinks_.push_back(sink);
}

void EventBus::remove_sink(EventSink* sink) {
    std::unique_lock<std::mutex> lk(mu_);
    sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
    // the sink may still be inside a delivery that started before the erase
    idle_.wait(lk, [this] { return in_flight_ == 0; });
}

void EventBus::emit(const Event& ev) {
    std::vector<EventSink*> sinks;
    {
        std::lock_guard<std::mutex> lk(mu_);
        sinks = sinks_;
        ++in_flight_;
    }
    struct Leave {
        EventBus& bus;
        ~Leave() {
            {
                std::lock_guard<std::mutex> lk(bus.mu_);
                --bus.in_flight_;
            }
            bus.idle_.notify_all();
        }
    } leave{*this};
    for (auto* s : sinks) s->on_event(ev);
}

RunEmitter::RunEmitter(EventBus& bus, RunRegistry& registry, RunHandle run)
    : bus_(bus), registry_(registry), run_(std::move(run)) {}

void RunEmitter::publish(EventType type, EventPayload payload) {
    Event ev;
    ev.run_id = run_->id;
    ev.kind = run_->kind;
    ev.type = type;
    ev.payload = std::move(payload);
    bus_.emit(ev);
}

void RunEmitter::start(EventPayload setting) {
    std::lock_guard<std::mutex> lk(mu_);
    if (started_ || finished_) return;
    started_ = true;
    publish(EventType::Start, std::move(setting));
}

bool RunEmitter::progress(EventPayload payload) {
    std::lock_guard<std::mutex> lk(mu_);
    if (finished_) return false;
    publish(EventType::Progress, std::move(payload));
    return true;
}

bool RunEmitter::done(EventPayload report) {
    return terminal(EventType::Done, RunStatus::Done, std::move(report));
}

bool RunEmitter::error(const std::string& message) {
    return terminal(EventType::Error, RunStatus::Failed, message);
}

bool RunEmitter::cancelled(EventPayload partial) {
    return terminal(EventType::Cancelled, RunStatus::Cancelled, std::move(partial));
}

bool RunEmitter::finished() const {
    std::lock_guard<std::mutex> lk(mu_);
    return finished_;
}

bool RunEmitter::terminal(EventType type, RunStatus status, EventPayload payload) {
    std::lock_guard<std::mutex> lk(mu_);
    if (finished_) return false;
    finished_ = true;
    if (!registry_.finish(run_->id, status)) return false;
    publish(type, std::move(payload));
    return true;
}

} // namespace netprobe
