#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace nlpq {

enum class ErrorKind : std::uint8_t {
    None = 0,
    UnknownModule,
    InvalidTransition,
    NotFound,
    NotReady,
    ProcessingFailed,
    RemoteError,
    StorageError,
    Timeout,
    BadRequest
};

const char* to_string(ErrorKind kind) noexcept;
std::optional<ErrorKind> parse_error_kind(const std::string& name);

class QueueError : public std::runtime_error {
public:
    QueueError(ErrorKind kind, const std::string& message, long http_status = 0, std::string body = {});

    ErrorKind kind() const noexcept { return kind_; }
    long http_status() const noexcept { return http_status_; }
    const std::string& body() const noexcept { return body_; }

private:
    ErrorKind kind_;
    long http_status_;
    std::string body_;
};

// Outcome of a result lookup. Expected conditions (NotFound, NotReady,
// ProcessingFailed, Timeout) are reported here instead of thrown.
struct ResultReply {
    bool ok = false;
    std::string text;
    ErrorKind error = ErrorKind::None;
    std::string message;

    explicit operator bool() const noexcept { return ok; }

    static ResultReply success(std::string text) { return {true, std::move(text), ErrorKind::None, {}}; }
    static ResultReply failure(ErrorKind kind, std::string message) { return {false, {}, kind, std::move(message)}; }
};

} // namespace nlpq
