#include "../include/task.hpp"

namespace nlpq {

const char* to_string(TaskStatus status) noexcept {
    switch (status) {
        case TaskStatus::Pending: return "PENDING";
        case TaskStatus::Started: return "STARTED";
        case TaskStatus::Done: return "DONE";
        case TaskStatus::Error: return "ERROR";
        default: return "UNKNOWN";
    }
}

std::optional<TaskStatus> parse_status(const std::string& name) {
    if (name == "UNKNOWN") return TaskStatus::Unknown;
    if (name == "PENDING") return TaskStatus::Pending;
    if (name == "STARTED") return TaskStatus::Started;
    if (name == "DONE") return TaskStatus::Done;
    if (name == "ERROR") return TaskStatus::Error;
    return std::nullopt;
}

int status_http_code(TaskStatus status) noexcept {
    switch (status) {
        case TaskStatus::Pending:
        case TaskStatus::Started: return 202;
        case TaskStatus::Done: return 200;
        case TaskStatus::Error: return 500;
        default: return 404;
    }
}

} // namespace nlpq
