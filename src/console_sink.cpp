#include "console_sink.hpp"

#include <iomanip>
#include <ostream>
#include <sstream>

namespace netprobe {

static std::string ms(const std::optional<double>& v) {
    if (!v) return "*";
    std::ostringstream os;
    os << std::fixed << std::setprecision(3) << *v;
    return os.str();
}

ConsoleSink::ConsoleSink(std::ostream& out, bool verbose) : out_(out), verbose_(verbose) {}

void ConsoleSink::on_event(const Event& ev) {
    std::lock_guard<std::mutex> lk(mu_);
    switch (ev.type) {
        case EventType::Start:    print_start(ev); break;
        case EventType::Progress: print_progress(ev); break;
        default:                  print_terminal(ev); break;
    }
    out_.flush();
}

void ConsoleSink::print_start(const Event& ev) {
    out_ << "[" << ev.topic() << "] run " << ev.run_id;
    if (auto* p = ev.as<PingSetting>())
        out_ << " - " << to_string(p->protocol) << " ping " << p->target << ", " << p->count << " probes";
    else if (auto* t = ev.as<TraceSetting>())
        out_ << " - " << to_string(t->protocol) << " traceroute to " << t->target << ", " << t->max_hops
             << " hops max";
    else if (auto* s = ev.as<PortScanSetting>())
        out_ << " - " << to_string(s->protocol) << " port scan of " << s->target << " (" << to_string(s->preset)
             << ")";
    else if (auto* h = ev.as<HostScanSetting>())
        out_ << " - " << to_string(h->protocol) << " host scan of " << h->targets.size() << " entries";
    else if (auto* i = ev.as<std::string>())
        out_ << " - interface " << (i->empty() ? std::string("(default)") : *i);
    out_ << "\n";
}

void ConsoleSink::print_progress(const Event& ev) {
    if (auto* p = ev.as<PingProgress>()) {
        const auto& s = p->sample;
        out_ << "seq=" << s.seq << " " << s.target.display() << " ";
        if (s.ok()) out_ << "time=" << ms(s.rtt_ms) << " ms";
        else out_ << to_string(s.status) << ": " << s.message;
        out_ << "\n";
    } else if (auto* h = ev.as<TraceHop>()) {
        out_ << "Hop " << h->hop << ": ";
        if (!h->ip) {
            out_ << "* (" << h->note.value_or("no reply") << ")\n";
            return;
        }
        out_ << h->ip->to_string();
        if (h->hostname) out_ << " (" << *h->hostname << ")";
        out_ << " - RTT = " << ms(h->rtt_ms) << " ms";
        if (h->reached) out_ << " [destination]";
        else if (h->note) out_ << " [" << *h->note << "]";
        out_ << "\n";
    } else if (auto* s = ev.as<PortScanSample>()) {
        if (s->state != PortState::Open && !verbose_) return;
        out_ << "[" << s->done << "/" << s->total << "] " << s->port << " " << to_string(s->state);
        if (s->rtt_ms) out_ << " " << ms(s->rtt_ms) << " ms";
        if (s->message) out_ << " (" << *s->message << ")";
        out_ << "\n";
    } else if (auto* hp = ev.as<HostScanProgress>()) {
        if (hp->state != HostState::Alive && !verbose_) return;
        out_ << "[" << hp->done << "/" << hp->total << "] " << hp->ip.to_string() << " " << to_string(hp->state);
        if (hp->rtt_ms) out_ << " " << ms(hp->rtt_ms) << " ms";
        out_ << "\n";
    }
}

void ConsoleSink::print_terminal(const Event& ev) {
    out_ << "[" << ev.topic() << "]";
    if (auto* err = ev.as<std::string>()) {
        out_ << " " << *err << "\n";
        return;
    }
    out_ << "\n";

    if (auto* st = ev.as<ProbeStat>()) {
        out_ << "--- " << st->target.display() << " " << to_string(st->protocol) << " statistics ---\n"
             << st->transmitted << " transmitted, " << st->received << " received, " << std::fixed
             << std::setprecision(1) << st->loss_rate() * 100.0 << "% loss\n"
             << "rtt min/avg/max = " << ms(st->min_ms) << "/" << ms(st->avg_ms) << "/" << ms(st->max_ms)
             << " ms\n";
    } else if (auto* d = ev.as<TraceDone>()) {
        out_ << (d->reached ? "Reached " : "Did not reach ") << d->destination.to_string();
        if (d->hostname) out_ << " (" << *d->hostname << ")";
        out_ << " in " << d->hops.size() << " hops via " << to_string(d->protocol) << "\n";
    } else if (auto* r = ev.as<PortScanReport>()) {
        out_ << r->ip.to_string() << ": " << r->open_count << " open, " << r->closed_count << " closed, "
             << r->filtered_count << " filtered of " << r->attempted << "\n";
        for (const auto& s : r->open) {
            out_ << "  " << s.port << "/" << to_string(r->protocol) << " open";
            if (s.service_name) out_ << " " << *s.service_name;
            out_ << "\n";
        }
    } else if (auto* h = ev.as<HostScanReport>()) {
        out_ << h->alive.size() << " alive, " << h->unreachable.size() << " unreachable of " << h->total << "\n";
        for (const auto& a : h->alive) out_ << "  " << a.ip.to_string() << " " << ms(a.rtt_ms) << " ms\n";
    } else if (auto* n = ev.as<NeighborScanReport>()) {
        out_ << n->iface << " " << n->subnet << ": " << n->neighbors.size() << " neighbors of " << n->total << "\n";
        for (const auto& nb : n->neighbors) {
            out_ << "  " << std::left << std::setw(16) << nb.ip.to_string() << " " << std::setw(17)
                 << nb.mac.value_or("-") << " " << nb.vendor.value_or("");
            for (const auto& t : nb.tags) out_ << " [" << t << "]";
            out_ << std::right << "\n";
        }
    }
}

} // namespace netprobe
