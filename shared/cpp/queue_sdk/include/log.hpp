#pragma once
#include <cstdint>
#include <string>

namespace nlpq {

enum class LogLevel : std::uint8_t { Error = 0, Warn = 1, Info = 2, Debug = 3 };

void set_log_level(LogLevel level) noexcept;
LogLevel log_level() noexcept;
LogLevel parse_log_level(const std::string& name, LogLevel fallback = LogLevel::Info);

void log(LogLevel level, const std::string& tag, const std::string& message);

inline void log_error(const std::string& tag, const std::string& msg) { log(LogLevel::Error, tag, msg); }
inline void log_warn(const std::string& tag, const std::string& msg) { log(LogLevel::Warn, tag, msg); }
inline void log_info(const std::string& tag, const std::string& msg) { log(LogLevel::Info, tag, msg); }
inline void log_debug(const std::string& tag, const std::string& msg) { log(LogLevel::Debug, tag, msg); }

} // namespace nlpq
