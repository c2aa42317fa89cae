#include "run_registry.hpp"

#include <random>

namespace netprobe {

const char* to_string(RunKind k) {
    switch (k) {
        case RunKind::Ping:         return "ping";
        case RunKind::Traceroute:   return "traceroute";
        case RunKind::PortScan:     return "portscan";
        case RunKind::HostScan:     return "hostscan";
        case RunKind::NeighborScan: return "neighborscan";
    }
    return "?";
}

const char* to_string(RunStatus s) {
    switch (s) {
        case RunStatus::Running:   return "running";
        case RunStatus::Done:      return "done";
        case RunStatus::Cancelled: return "cancelled";
        case RunStatus::Failed:    return "failed";
    }
    return "?";
}

// uuid4-shaped random id
static std::string random_id() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    static const char* hex = "0123456789abcdef";
    std::uint64_t a = rng(), b = rng();
    std::string out(36, '0');
    int idx = 0;
    auto write = [&](std::uint64_t v, int digits) {
        for (int i = 0; i < digits; ++i) {
            out[idx++] = hex[(v >> 60) & 0xF];
            v <<= 4;
        }
    };
    write(a, 8);
    out[idx++] = '-';
    write(a << 32, 4);
    out[idx++] = '-';
    write((b & 0x0FFFFFFFFFFFFFFFull) | 0x4000000000000000ull, 4);
    out[idx++] = '-';
    write(b << 16, 4);
    out[idx++] = '-';
    write(b << 32, 8);
    write(a << 48, 4);
    return out;
}

RunRegistry::RunRegistry(std::chrono::milliseconds retention) : retention_(retention) {}

RunId RunRegistry::make_id() {
    for (;;) {
        RunId id = random_id();
        if (runs_.find(id) == runs_.end()) return id;
    }
}

RunHandle RunRegistry::begin(RunKind kind) {
    std::lock_guard<std::mutex> lk(mu_);
    prune_locked(std::chrono::steady_clock::now());

    auto run = std::make_shared<Run>();
    run->id = make_id();
    run->kind = kind;
    run->cancel = std::make_shared<CancelToken>();

    Entry e;
    e.run = run;
    runs_.emplace(run->id, std::move(e));
    return run;
}

bool RunRegistry::cancel(const RunId& id) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = runs_.find(id);
    if (it == runs_.end() || it->second.status != RunStatus::Running) return false;
    it->second.run->cancel->cancel();
    return true;
}

std::optional<RunStatus> RunRegistry::status(const RunId& id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = runs_.find(id);
    if (it == runs_.end()) return std::nullopt;
    return it->second.status;
}

bool RunRegistry::finish(const RunId& id, RunStatus terminal) {
    if (terminal == RunStatus::Running) return false;
    std::lock_guard<std::mutex> lk(mu_);
    auto it = runs_.find(id);
    if (it == runs_.end() || it->second.status != RunStatus::Running) return false;
    it->second.status = terminal;
    it->second.finished_at = std::chrono::steady_clock::now();
    return true;
}

bool RunRegistry::acknowledge(const RunId& id) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = runs_.find(id);
    if (it == runs_.end() || it->second.status == RunStatus::Running) return false;
    runs_.erase(it);
    return true;
}

std::size_t RunRegistry::prune() {
    std::lock_guard<std::mutex> lk(mu_);
    return prune_locked(std::chrono::steady_clock::now());
}

std::size_t RunRegistry::prune_locked(std::chrono::steady_clock::time_point now) {
    std::size_t dropped = 0;
    for (auto it = runs_.begin(); it != runs_.end();) {
        const Entry& e = it->second;
        if (e.status != RunStatus::Running && now - e.finished_at >= retention_) {
            it = runs_.erase(it);
            ++dropped;
        } else {
            ++it;
        }
    }
    return dropped;
}

std::size_t RunRegistry::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return runs_.size();
}

} // namespace netprobe
