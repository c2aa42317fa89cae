// ===================== File: src/diag_logger.cpp =====================
#include "diag_logger.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace netprobe {

static std::string now_ts() {
    using namespace std::chrono;
    auto t  = system_clock::now();
    auto tt = system_clock::to_time_t(t);
    auto ms = duration_cast<milliseconds>(t.time_since_epoch()) % 1000;

    std::tm tm{};
    localtime_r(&tt, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.'
        << std::setw(3) << std::setfill('0') << ms.count();
    return oss.str();
}

const char* to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

bool parse_log_level(const std::string& s, LogLevel& out) {
    if (s == "debug") { out = LogLevel::Debug; return true; }
    if (s == "info")  { out = LogLevel::Info;  return true; }
    if (s == "warn")  { out = LogLevel::Warn;  return true; }
    if (s == "error") { out = LogLevel::Error; return true; }
    return false;
}

DiagLogger::DiagLogger(const std::string& path, LogLevel min_level)
    : out_(path, std::ios::app), min_level_(min_level) {
    if (out_.is_open()) out_ << "=== netprobe diag start " << now_ts() << " ===\n";
}

DiagLogger::~DiagLogger() {
    if (out_.is_open()) out_ << "=== netprobe diag end " << now_ts() << " ===\n";
}

void DiagLogger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lk(mu_);
    min_level_ = level;
}

void DiagLogger::log(LogLevel level, const std::string& line) {
    std::lock_guard<std::mutex> lk(mu_);
    if (!out_.is_open() || level < min_level_) return;
    out_ << now_ts() << " | " << to_string(level) << " | " << line << '\n';
    out_.flush();
}

} // namespace netprobe
