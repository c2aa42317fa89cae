/**
 * netprobe_trace: hop-by-hop route to a host.
 *
 * Examples with options:
 *   sudo ./netprobe_trace cloudflare.com
 *   ./netprobe_trace usp.ac.fj 30 2000 --proto=udp --log=diag_usp.txt
 *   sudo ./netprobe_trace google.com --tries=1 --log=diag_icmp.txt
 */

#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "diag_logger.hpp"
#include "engine.hpp"

using namespace std;
using namespace netprobe;

static volatile sig_atomic_t g_interrupted = 0;

static void on_sigint(int) { g_interrupted = 1; }

static void print_usage(const char *argv0) {
    cerr << "Usage:\n"
         << "  " << argv0 << " <host> [max_hops=30] [timeout_ms=1000] [--proto=icmp|udp] [--max-hops=30] [--tries=3] [--log=PATH]\n"
         << "\nNotes:\n"
         << "  - --proto=icmp (default) needs a raw socket (sudo or CAP_NET_RAW).\n"
         << "  - --proto=udp mirrors classic traceroute and reads ICMP errors from the\n"
         << "    socket error queue, so it runs unprivileged.\n";
}

// ---- helpers for pretty output ----
static bool is_private(const IpAddress &ip) {
    if (ip.is_v6()) {
        const auto &b = ip.bytes();
        return (b[0] & 0xFE) == 0xFC || (b[0] == 0xFE && (b[1] & 0xC0) == 0x80); // ULA, link-local
    }
    uint32_t x = ip.v4_host_order();
    if ((x & 0xFF000000) == 0x0A000000) return true;        // 10.0.0.0/8
    if ((x & 0xFFF00000) == 0xAC100000) return true;        // 172.16.0.0/12
    if ((x & 0xFFFF0000) == 0xC0A80000) return true;        // 192.168.0.0/16
    if ((x & 0xFFC00000) == 0x64400000) return true;        // 100.64.0.0/10 (CGNAT)
    if ((x & 0xFFFF0000) == 0xA9FE0000) return true;        // 169.254.0.0/16 (link-local)
    return false;
}

// Prints hops as they arrive and remembers the run id for Ctrl+C.
class HopPrinter : public EventSink {
public:
    void on_event(const Event &ev) override {
        lock_guard<mutex> lk(mu_);
        if (ev.type == EventType::Start) run_ = ev.run_id;
        if (ev.type != EventType::Progress) return;
        const TraceHop *h = ev.as<TraceHop>();
        if (!h) return;

        if (!h->ip) {
            cout << "Hop " << h->hop << ": * (" << h->note.value_or("no reply") << ")\n";
        } else {
            string desc = h->reached ? "Destination" : (is_private(*h->ip) ? "Local Router" : "Router");
            if (h->hostname) desc += ", " + *h->hostname;
            cout << "Hop " << h->hop << ": " << h->ip->to_string() << " (" << desc << ") - RTT = ";
            if (h->rtt_ms) cout << fixed << setprecision(2) << *h->rtt_ms << " ms";
            else cout << "*";
            if (h->note && !h->reached) cout << " [" << *h->note << "]";
            cout << "\n";
        }
        cout.flush();
    }

    optional<RunId> run() {
        lock_guard<mutex> lk(mu_);
        return run_;
    }

private:
    mutex mu_;
    optional<RunId> run_;
};

int main(int argc, char *argv[]) {
    ios::sync_with_stdio(false);

    if (argc < 2) { print_usage(argv[0]); return 1; }

    // Parse flags in any position:
    //   positional: <host> [max_hops] [timeout_ms]
    //   flags: --proto=icmp|udp , --max-hops=N , --tries=N , --log=PATH
    vector<string> pos;
    string log_path;
    TraceSetting setting;

    try {
        for (int i = 1; i < argc; ++i) {
            string a = argv[i];
            if (a.rfind("--proto=", 0) == 0) {
                auto p = parse_trace_protocol(a.substr(8));
                if (!p) throw invalid_argument("bad protocol: " + a.substr(8));
                setting.protocol = *p;
            } else if (a.rfind("--max-hops=", 0) == 0) {
                setting.max_hops = stoi(a.substr(11));
            } else if (a.rfind("--tries=", 0) == 0) {
                setting.tries_per_hop = stoi(a.substr(8));
            } else if (a.rfind("--log=", 0) == 0) {
                log_path = a.substr(6);
            } else {
                pos.push_back(a);
            }
        }
        if (pos.empty()) { print_usage(argv[0]); return 1; }

        setting.target = pos[0];
        if (pos.size() >= 2) setting.max_hops = stoi(pos[1]);
        if (pos.size() >= 3) setting.timeout = chrono::milliseconds(stoi(pos[2]));
    } catch (const exception &e) {
        cerr << e.what() << "\n";
        print_usage(argv[0]);
        return 1;
    }

    try {
        // Optional diagnostics
        DiagLogger diag(log_path);
        DiagLogger *dptr = (diag.ok() && !log_path.empty()) ? &diag : nullptr;
        if (!log_path.empty() && !diag.ok()) {
            cerr << "Warning: couldn't open log file: " << log_path << "\n";
        }

        EventBus bus;
        HopPrinter printer;
        bus.add_sink(&printer);

        EngineConfig cfg;
        cfg.open_icmp = setting.protocol == TraceProtocol::Icmp;
        Engine engine(bus, cfg, dptr);

        // Show destination
        ProbeTarget dst = engine.lookup_host(setting.target);
        cout << "[Destination - " << dst.ip.to_string() << "]\n";

        std::signal(SIGINT, on_sigint);
        bool stop = false;
        mutex stop_mu;
        thread watcher([&] {
            for (;;) {
                {
                    lock_guard<mutex> lk(stop_mu);
                    if (stop) return;
                }
                if (g_interrupted) {
                    if (auto id = printer.run()) engine.cancel(*id);
                }
                this_thread::sleep_for(chrono::milliseconds(50));
            }
        });

        auto out = engine.traceroute(setting);
        {
            lock_guard<mutex> lk(stop_mu);
            stop = true;
        }
        watcher.join();
        bus.remove_sink(&printer);

        if (out.status == RunStatus::Failed) {
            cerr << "Error: " << out.error << '\n';
            return 1;
        }

        const TraceDone &done = *out.report;
        cout << string(43, '-') << '\n';
        if (done.reached) cout << "Total hops: " << done.hops.size() << '\n';
        else if (!done.hops.empty())
            cout << "Total hops: " << done.hops.back().hop << " (destination not reached)\n";
        if (out.status == RunStatus::Cancelled) cout << "(cancelled)\n";

        return out.status == RunStatus::Done ? 0 : 130;
    } catch (const exception &e) {
        cerr << "Error: " << e.what() << '\n';
        return 1;
    }
}
