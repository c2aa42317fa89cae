#pragma once

#include "engine.hpp"

#include <algorithm>
#include <random>
#include <string>
#include <vector>

namespace netprobe {
namespace detail {

// Publishes the terminal event for a run that got past setup. A run whose
// work all finished is done even if a cancel arrived after the last probe.
template <typename Report>
void finish_run(RunEmitter& em, bool complete, RunOutcome<Report>& out, Report report) {
    out.report = report;
    if (!complete) {
        em.cancelled(std::move(report));
        out.status = RunStatus::Cancelled;
    } else {
        em.done(std::move(report));
        out.status = RunStatus::Done;
    }
}

template <typename Report>
void fail_run(RunEmitter& em, RunOutcome<Report>& out, const std::string& message) {
    em.error(message);
    out.status = RunStatus::Failed;
    out.error = message;
}

template <typename T>
void shuffle_in_place(std::vector<T>& v) {
    std::mt19937 rng(std::random_device{}());
    std::shuffle(v.begin(), v.end(), rng);
}

inline std::size_t pick_concurrency(std::size_t requested, std::size_t fallback) {
    if (requested > 0) return requested;
    return fallback > 0 ? fallback : kDefaultConcurrency;
}

} // namespace detail
} // namespace netprobe
