// ===================== File: include/events.hpp =====================
#pragma once
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <string>
#include <variant>
#include <vector>

#include "probe_types.hpp"
#include "run_registry.hpp"
#include "scan_types.hpp"

namespace netprobe {

enum class EventType { Start, Progress, Done, Error, Cancelled };
const char* to_string(EventType t);

// Start carries the run's setting (interface name for neighbor scans),
// Error carries the message, the others carry a sample or report.
using EventPayload = std::variant<std::monostate,
                                  std::string,
                                  PingSetting, PingProgress, ProbeStat,
                                  TraceSetting, TraceHop, TraceDone,
                                  PortScanSetting, PortScanSample, PortScanReport,
                                  HostScanSetting, HostScanProgress, HostScanReport,
                                  NeighborScanReport>;

struct Event {
    RunId run_id;
    RunKind kind = RunKind::Ping;
    EventType type = EventType::Start;
    EventPayload payload;

    // "ping:progress", "portscan:done", ...
    std::string topic() const;
    bool terminal() const {
        return type == EventType::Done || type == EventType::Error || type == EventType::Cancelled;
    }

    template <typename T>
    const T* as() const { return std::get_if<T>(&payload); }
};

class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void on_event(const Event& ev) = 0;
};

// Fans events out to every registered sink. Delivery runs on the emitting
// thread without the bus lock, so a slow sink only delays the run that emits.
// remove_sink() returns once no delivery is in flight; it must not be called
// from on_event().
class EventBus {
public:
    void add_sink(EventSink* sink);
    void remove_sink(EventSink* sink);
    void emit(const Event& ev);

private:
    std::mutex mu_;
    std::condition_variable idle_;
    std::size_t in_flight_ = 0;
    std::vector<EventSink*> sinks_;
};

// Per-run publisher. Emits start once, progress until the terminal event, and
// at most one terminal event, which must also win RunRegistry::finish().
class RunEmitter {
public:
    RunEmitter(EventBus& bus, RunRegistry& registry, RunHandle run);

    const RunId& run_id() const { return run_->id; }

    void start(EventPayload setting);
    bool progress(EventPayload payload);

    bool done(EventPayload report);
    bool error(const std::string& message);
    bool cancelled(EventPayload partial);

    bool finished() const;

private:
    bool terminal(EventType type, RunStatus status, EventPayload payload);
    void publish(EventType type, EventPayload payload);

    EventBus& bus_;
    RunRegistry& registry_;
    RunHandle run_;
    mutable std::mutex mu_;
    bool started_ = false;
    bool finished_ = false;
};

} // namespace netprobe
