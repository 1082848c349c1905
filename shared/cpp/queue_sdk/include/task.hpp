#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace nlpq {

// UNKNOWN is never stored: it is the answer when no record exists.
enum class TaskStatus : std::uint8_t { Unknown, Pending, Started, Done, Error };

struct Task {
    std::string id;
    std::string doc;
};

const char* to_string(TaskStatus status) noexcept;
std::optional<TaskStatus> parse_status(const std::string& name);

// HTTP status code the queue service answers a HEAD request with.
int status_http_code(TaskStatus status) noexcept;

inline bool is_terminal(TaskStatus status) noexcept {
    return status == TaskStatus::Done || status == TaskStatus::Error;
}

} // namespace nlpq
