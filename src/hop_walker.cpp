// ===================== File: src/hop_walker.cpp =====================
#include "hop_walker.hpp"

#include "diag_logger.hpp"

namespace netprobe {

const char* to_string(HopWalker::State s) {
    switch (s) {
        case HopWalker::State::Probing:   return "probing";
        case HopWalker::State::Reached:   return "reached";
        case HopWalker::State::Exhausted: return "exhausted";
        case HopWalker::State::Cancelled: return "cancelled";
    }
    return "?";
}

TraceSetting sanitize(TraceSetting s) {
    if (s.max_hops <= 0) s.max_hops = 30;
    if (s.max_hops > 255) s.max_hops = 255;
    if (s.tries_per_hop <= 0) s.tries_per_hop = 1;
    if (s.timeout.count() <= 0) s.timeout = std::chrono::milliseconds(1000);
    return s;
}

HopWalker::HopWalker(HopProber& prober, const IpAddress& destination, const TraceSetting& setting,
                     DiagLogger* diag)
    : prober_(prober), dst_(destination), setting_(sanitize(setting)), diag_(diag) {}

HopWalker::State HopWalker::step(const CancelToken& cancel) {
    if (state_ != State::Probing) return state_;
    if (cancel.cancelled()) {
        state_ = State::Cancelled;
        return state_;
    }

    std::optional<HopReply> best;
    std::optional<std::string> error_note;
    bool reached = false;

    for (int attempt = 0; attempt < setting_.tries_per_hop; ++attempt) {
        HopReply r = prober_.probe(dst_, hop_, attempt, setting_.timeout, cancel);
        if (r.kind == HopReplyKind::Aborted) {
            state_ = State::Cancelled;
            return state_;
        }
        if (r.kind == HopReplyKind::Timeout) continue;
        if (r.kind == HopReplyKind::Error) {
            if (diag_) diag_->log(LogLevel::Warn, "trace hop " + std::to_string(hop_) + ": " + r.message);
            error_note = r.message;
            continue;
        }
        if (!r.from) continue;

        if (*r.from == dst_) {
            reached = true;
            best = r;
            break;
        }
        // keep the fastest responder for this hop
        if (!best || (r.rtt_ms && (!best->rtt_ms || *r.rtt_ms < *best->rtt_ms))) best = r;
    }

    TraceHop hop;
    hop.hop = hop_;
    hop.reached = reached;
    if (best) {
        hop.ip = best->from;
        hop.rtt_ms = best->rtt_ms;
        if (best->kind == HopReplyKind::Unreachable && !reached)
            hop.note = best->message.empty() ? std::string("unreachable") : best->message;
    } else {
        hop.note = error_note ? *error_note : std::string("timeout");
    }
    hops_.push_back(hop);

    if (reached) {
        state_ = State::Reached;
    } else if (hop_ >= setting_.max_hops) {
        state_ = State::Exhausted;
    } else {
        ++hop_;
    }
    return state_;
}

HopWalker::State HopWalker::run(const CancelToken& cancel, const HopCallback& on_hop) {
    while (state_ == State::Probing) {
        const std::size_t before = hops_.size();
        step(cancel);
        if (hops_.size() > before && on_hop) on_hop(hops_.back());
    }
    if (diag_)
        diag_->log(LogLevel::Debug, "trace to " + dst_.to_string() + " ended " + to_string(state_) +
                                        " after " + std::to_string(hops_.size()) + " hops");
    return state_;
}

} // namespace netprobe
