// ===================== File: include/console_sink.hpp =====================
#pragma once
#include <iosfwd>
#include <mutex>

#include "events.hpp"

namespace netprobe {

// Prints events as human-readable lines.
class ConsoleSink : public EventSink {
public:
    explicit ConsoleSink(std::ostream& out, bool verbose = false);

    void on_event(const Event& ev) override;

private:
    void print_start(const Event& ev);
    void print_progress(const Event& ev);
    void print_terminal(const Event& ev);

    std::ostream& out_;
    bool verbose_;
    std::mutex mu_;
};

} // namespace netprobe
