#include "../include/log.hpp"
#include "../include/util.hpp"
#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace nlpq {

namespace {
std::mutex g_log_mutex;

LogLevel level_from_env() {
    return parse_log_level(getenv_or("NLPQ_LOG_LEVEL", "info"));
}

std::atomic<LogLevel>& current_level() {
    static std::atomic<LogLevel> level{level_from_env()};
    return level;
}

const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Error: return "ERROR";
        case LogLevel::Warn: return "WARN ";
        case LogLevel::Info: return "INFO ";
        default: return "DEBUG";
    }
}
}

void set_log_level(LogLevel level) noexcept { current_level().store(level); }

LogLevel log_level() noexcept { return current_level().load(); }

LogLevel parse_log_level(const std::string& name, LogLevel fallback) {
    std::string s = to_lower(name);
    if (s == "error") return LogLevel::Error;
    if (s == "warn" || s == "warning") return LogLevel::Warn;
    if (s == "info") return LogLevel::Info;
    if (s == "debug") return LogLevel::Debug;
    return fallback;
}

void log(LogLevel level, const std::string& tag, const std::string& message) {
    if (static_cast<std::uint8_t>(level) > static_cast<std::uint8_t>(log_level())) return;

    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::tm tm{};
    localtime_r(&t, &tm);

    std::ostringstream ss;
    ss << '[' << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
       << ms.count() << "] [" << level_name(level) << "] [" << tag << "] " << message;

    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::cerr << ss.str() << std::endl;
}

} // namespace nlpq
