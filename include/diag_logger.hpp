// ===================== File: include/diag_logger.hpp =====================
#pragma once
#include <fstream>
#include <mutex>
#include <string>

namespace netprobe {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

const char* to_string(LogLevel level);
bool parse_log_level(const std::string& s, LogLevel& out);

// Append-only diagnostics file. Callers hold a DiagLogger* and skip logging
// when it is null. Safe to share between worker threads.
class DiagLogger {
public:
    explicit DiagLogger(const std::string& path, LogLevel min_level = LogLevel::Info);
    ~DiagLogger();

    bool ok() const { return out_.is_open(); }
    void set_level(LogLevel level);

    void log(const std::string& line) { log(LogLevel::Info, line); }
    void log(LogLevel level, const std::string& line);

private:
    std::ofstream out_;
    LogLevel min_level_;
    std::mutex mu_;
};

} // namespace netprobe
