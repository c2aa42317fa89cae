// ===================== File: include/run_registry.hpp =====================
#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "cancel_token.hpp"

namespace netprobe {

using RunId = std::string;

enum class RunKind { Ping, Traceroute, PortScan, HostScan, NeighborScan };
enum class RunStatus { Running, Done, Cancelled, Failed };

const char* to_string(RunKind k);
const char* to_string(RunStatus s);

struct Run {
    RunId id;
    RunKind kind;
    std::shared_ptr<CancelToken> cancel;
};

using RunHandle = std::shared_ptr<const Run>;

// Process-wide table of runs. Owns each run's cancel token and guarantees a
// single terminal transition per run. Every mutation is one short critical
// section; no I/O happens under the lock.
class RunRegistry {
public:
    explicit RunRegistry(std::chrono::milliseconds retention = std::chrono::seconds(60));

    RunHandle begin(RunKind kind);

    // False for unknown runs and runs that already finished.
    bool cancel(const RunId& id);

    std::optional<RunStatus> status(const RunId& id) const;

    // Moves a running run to `terminal`. Only the first call per run returns
    // true; that caller owns delivery of the terminal event.
    bool finish(const RunId& id, RunStatus terminal);

    // The consumer has seen the terminal event; the entry can go.
    bool acknowledge(const RunId& id);

    // Drops finished runs older than the retention window.
    std::size_t prune();

    std::size_t size() const;

private:
    struct Entry {
        RunHandle run;
        RunStatus status = RunStatus::Running;
        std::chrono::steady_clock::time_point finished_at{};
    };

    RunId make_id();
    std::size_t prune_locked(std::chrono::steady_clock::time_point now);

    mutable std::mutex mu_;
    std::unordered_map<RunId, Entry> runs_;
    std::chrono::milliseconds retention_;
};

} // namespace netprobe
