/**
 * netprobe: ping, port scan, host scan, neighbor scan and lookup.
 *
 * Examples:
 *   sudo ./netprobe ping 1.1.1.1 --count=4
 *   ./netprobe ping example.com --proto=tcp --port=443
 *   ./netprobe ping https://example.com/ --proto=http
 *   ./netprobe scan 192.168.1.10 --ports=22,80,8080-8082 --preset=custom
 *   ./netprobe hosts 10.0.0.0/24 --proto=tcp --port=22 --log=diag.txt
 *   sudo ./netprobe neighbors --iface=eth0
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "console_sink.hpp"
#include "diag_logger.hpp"
#include "engine.hpp"
#include "errors.hpp"
#include "port_presets.hpp"

using namespace std;
using namespace netprobe;

static volatile sig_atomic_t g_interrupted = 0;

static void on_sigint(int) { g_interrupted = 1; }

static void print_usage(const char *argv0) {
    cerr << "Usage:\n"
         << "  " << argv0 << " ping <host|url> [--proto=icmp|tcp|udp|quic|http] [--port=N] [--count=4]\n"
         << "        [--timeout=1000] [--interval=1000] [--ttl=64]\n"
         << "  " << argv0 << " scan <host> [--proto=tcp|quic|udp] [--preset=common|wellknown|top1000|full|custom]\n"
         << "        [--ports=22,80,8000-8010] [--timeout=1000] [--concurrency=100] [--ordered]\n"
         << "  " << argv0 << " hosts <host|cidr>... [--proto=icmp|tcp] [--port=80] [--count=1] [--timeout=1000]\n"
         << "        [--ttl=64] [--concurrency=256] [--ordered]\n"
         << "  " << argv0 << " neighbors [--iface=NAME]\n"
         << "  " << argv0 << " lookup <host>\n"
         << "\nCommon options: --log=PATH --log-level=debug|info|warn|error --verbose\n"
         << "\nNotes:\n"
         << "  - ICMP probes need a raw socket (sudo or CAP_NET_RAW).\n"
         << "  - Ctrl+C cancels the running operation and prints partial results.\n";
}

// Remembers the id of the run in progress so Ctrl+C can cancel it.
class RunTracker : public EventSink {
public:
    void on_event(const Event &ev) override {
        lock_guard<mutex> lk(mu_);
        if (ev.type == EventType::Start) current_ = ev.run_id;
        else if (ev.terminal()) current_.reset();
    }
    optional<RunId> current() {
        lock_guard<mutex> lk(mu_);
        return current_;
    }

private:
    mutex mu_;
    optional<RunId> current_;
};

struct Options {
    string command;
    vector<string> pos;
    string log_path;
    LogLevel log_level = LogLevel::Info;
    bool verbose = false;
    bool ordered = false;
    optional<string> proto;
    optional<string> preset;
    optional<string> ports;
    optional<string> iface;
    optional<int> port;
    optional<int> count;
    optional<int> timeout_ms;
    optional<int> interval_ms;
    optional<int> ttl;
    optional<int> concurrency;
};

static bool take(const string &a, const char *flag, string &value) {
    const string f(flag);
    if (a.rfind(f, 0) != 0) return false;
    value = a.substr(f.size());
    return true;
}

static int to_int(const string &flag, const string &v, int lo, int hi) {
    size_t used = 0;
    int n = stoi(v, &used);
    if (used != v.size() || n < lo || n > hi) throw invalid_argument("bad value for " + flag + ": " + v);
    return n;
}

static Options parse_args(int argc, char *argv[]) {
    if (argc < 2) throw invalid_argument("missing command");
    Options o;
    o.command = argv[1];
    for (int i = 2; i < argc; ++i) {
        string a = argv[i], v;
        if (take(a, "--log=", v)) o.log_path = v;
        else if (take(a, "--log-level=", v)) {
            if (!parse_log_level(v, o.log_level)) throw invalid_argument("bad log level: " + v);
        }
        else if (a == "--verbose") o.verbose = true;
        else if (a == "--ordered") o.ordered = true;
        else if (take(a, "--proto=", v)) o.proto = v;
        else if (take(a, "--preset=", v)) o.preset = v;
        else if (take(a, "--ports=", v)) o.ports = v;
        else if (take(a, "--iface=", v)) o.iface = v;
        else if (take(a, "--port=", v)) o.port = to_int("--port", v, 1, 65535);
        else if (take(a, "--count=", v)) o.count = to_int("--count", v, 0, 1000000);
        else if (take(a, "--timeout=", v)) o.timeout_ms = to_int("--timeout", v, 0, 600000);
        else if (take(a, "--interval=", v)) o.interval_ms = to_int("--interval", v, 0, 600000);
        else if (take(a, "--ttl=", v)) o.ttl = to_int("--ttl", v, 0, 255);
        else if (take(a, "--concurrency=", v)) o.concurrency = to_int("--concurrency", v, 0, 65535);
        else if (a.rfind("--", 0) == 0) throw invalid_argument("unknown option: " + a);
        else o.pos.push_back(a);
    }
    return o;
}

template <typename Report>
static int exit_code(const RunOutcome<Report> &r) {
    switch (r.status) {
        case RunStatus::Done:      return 0;
        case RunStatus::Cancelled: return 130;
        default:                   return 1;
    }
}

static int run_ping(Engine &engine, const Options &o) {
    if (o.pos.empty()) throw invalid_argument("ping needs a target");
    PingSetting s;
    s.target = o.pos[0];
    if (o.proto) {
        auto p = parse_protocol(*o.proto);
        if (!p) throw invalid_argument("bad protocol: " + *o.proto);
        s.protocol = *p;
    }
    if (o.port) s.port = static_cast<uint16_t>(*o.port);
    if (o.count) s.count = static_cast<uint32_t>(*o.count);
    if (o.timeout_ms) s.timeout = chrono::milliseconds(*o.timeout_ms);
    if (o.interval_ms) s.interval = chrono::milliseconds(*o.interval_ms);
    if (o.ttl) s.hop_limit = *o.ttl;
    return exit_code(engine.ping(s));
}

static int run_scan(Engine &engine, const Options &o) {
    if (o.pos.empty()) throw invalid_argument("scan needs a target");
    PortScanSetting s;
    s.target = o.pos[0];
    if (o.proto) {
        auto p = parse_port_scan_protocol(*o.proto);
        if (!p) throw invalid_argument("bad protocol: " + *o.proto);
        s.protocol = *p;
    }
    if (o.ports) {
        s.user_ports = parse_port_list(*o.ports);
        if (!o.preset) s.preset = PortPreset::Custom;
    }
    if (o.preset) {
        auto p = parse_port_preset(*o.preset);
        if (!p) throw invalid_argument("bad preset: " + *o.preset);
        s.preset = *p;
    }
    if (o.timeout_ms) s.timeout = chrono::milliseconds(*o.timeout_ms);
    if (o.concurrency) s.concurrency = static_cast<size_t>(*o.concurrency);
    s.ordered = o.ordered;
    return exit_code(engine.port_scan(s));
}

static int run_hosts(Engine &engine, const Options &o) {
    if (o.pos.empty()) throw invalid_argument("hosts needs at least one target");
    HostScanSetting s;
    s.targets = o.pos;
    if (o.proto) {
        auto p = parse_host_scan_protocol(*o.proto);
        if (!p) throw invalid_argument("bad protocol: " + *o.proto);
        s.protocol = *p;
    }
    if (o.port) s.port = static_cast<uint16_t>(*o.port);
    if (o.count) s.count = static_cast<uint32_t>(*o.count);
    if (o.timeout_ms) s.timeout = chrono::milliseconds(*o.timeout_ms);
    if (o.ttl) s.hop_limit = *o.ttl;
    if (o.concurrency) s.concurrency = static_cast<size_t>(*o.concurrency);
    s.ordered = o.ordered;
    return exit_code(engine.host_scan(s));
}

static int run_lookup(Engine &engine, const Options &o) {
    if (o.pos.empty()) throw invalid_argument("lookup needs a host");
    try {
        ProbeTarget t = engine.lookup_host(o.pos[0]);
        cout << o.pos[0] << " -> " << t.ip.to_string();
        if (t.hostname && *t.hostname != o.pos[0]) cout << " (" << *t.hostname << ")";
        cout << "\n";
        return 0;
    } catch (const ResolutionError &e) {
        cerr << e.what() << "\n";
        return 1;
    }
}

int main(int argc, char *argv[]) {
    ios::sync_with_stdio(false);

    Options o;
    try {
        o = parse_args(argc, argv);
    } catch (const exception &e) {
        cerr << e.what() << "\n";
        print_usage(argv[0]);
        return 1;
    }

    // Optional diagnostics
    DiagLogger diag(o.log_path, o.log_level);
    DiagLogger *dptr = (diag.ok() && !o.log_path.empty()) ? &diag : nullptr;
    if (!o.log_path.empty() && !diag.ok()) {
        cerr << "Warning: couldn't open log file: " << o.log_path << "\n";
    }

    EventBus bus;
    ConsoleSink console(cout, o.verbose);
    RunTracker tracker;
    bus.add_sink(&console);
    bus.add_sink(&tracker);

    EngineConfig cfg;
    const bool wants_icmp = o.command == "neighbors" ||
                            ((o.command == "ping" || o.command == "hosts") && (!o.proto || *o.proto == "icmp"));
    cfg.open_icmp = wants_icmp;
    Engine engine(bus, cfg, dptr);

    std::signal(SIGINT, on_sigint);
    atomic<bool> stop{false};
    thread watcher([&] {
        while (!stop.load()) {
            if (g_interrupted) {
                if (auto id = tracker.current()) engine.cancel(*id);
            }
            this_thread::sleep_for(chrono::milliseconds(50));
        }
    });

    int rc = 1;
    try {
        if (o.command == "ping") rc = run_ping(engine, o);
        else if (o.command == "scan") rc = run_scan(engine, o);
        else if (o.command == "hosts") rc = run_hosts(engine, o);
        else if (o.command == "neighbors") rc = exit_code(engine.neighbor_scan(o.iface.value_or(string{})));
        else if (o.command == "lookup") rc = run_lookup(engine, o);
        else {
            cerr << "unknown command: " << o.command << "\n";
            print_usage(argv[0]);
        }
    } catch (const invalid_argument &e) {
        cerr << e.what() << "\n";
        print_usage(argv[0]);
        rc = 1;
    } catch (const exception &e) {
        cerr << "Error: " << e.what() << "\n";
        rc = 1;
    }

    stop.store(true);
    watcher.join();
    bus.remove_sink(&tracker);
    bus.remove_sink(&console);
    return rc;
}
