#include "../include/errors.hpp"

namespace nlpq {

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::UnknownModule: return "UnknownModule";
        case ErrorKind::InvalidTransition: return "InvalidTransition";
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::NotReady: return "NotReady";
        case ErrorKind::ProcessingFailed: return "ProcessingFailed";
        case ErrorKind::RemoteError: return "RemoteError";
        case ErrorKind::StorageError: return "StorageError";
        case ErrorKind::Timeout: return "Timeout";
        case ErrorKind::BadRequest: return "BadRequest";
        default: return "None";
    }
}

std::optional<ErrorKind> parse_error_kind(const std::string& name) {
    static const ErrorKind all[] = {
        ErrorKind::None, ErrorKind::UnknownModule, ErrorKind::InvalidTransition, ErrorKind::NotFound,
        ErrorKind::NotReady, ErrorKind::ProcessingFailed, ErrorKind::RemoteError, ErrorKind::StorageError,
        ErrorKind::Timeout, ErrorKind::BadRequest};
    for (ErrorKind k : all) {
        if (name == to_string(k)) return k;
    }
    return std::nullopt;
}

QueueError::QueueError(ErrorKind kind, const std::string& message, long http_status, std::string body)
    : std::runtime_error(message), kind_(kind), http_status_(http_status), body_(std::move(body)) {}

} // namespace nlpq
