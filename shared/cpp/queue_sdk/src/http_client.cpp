#include "../include/http_client.hpp"
#include "../include/log.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace nlpq {

namespace {
QueueError remote_error(const std::string& what, const HttpResponse& r) {
    return QueueError(ErrorKind::RemoteError,
                      what + "; return code: " + std::to_string(r.status) + ":\n" + r.body, r.status, r.body);
}

json parse_body(const std::string& what, const HttpResponse& r) {
    try {
        return json::parse(r.body);
    } catch (const json::exception& e) {
        throw QueueError(ErrorKind::RemoteError, what + ": invalid JSON response: " + e.what(), r.status, r.body);
    }
}

template <typename T>
T field_as(const json& v, const std::string& what, const HttpResponse& r) {
    try {
        return v.get<T>();
    } catch (const json::exception& e) {
        throw QueueError(ErrorKind::RemoteError, what + ": unexpected JSON shape: " + e.what(), r.status, r.body);
    }
}

// Error bodies look like {"error": "<Kind>", "message": "..."}.
std::optional<std::pair<ErrorKind, std::string>> parse_descriptor(const std::string& body) {
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object() || !j.contains("error") || !j["error"].is_string()) {
        return std::nullopt;
    }
    auto kind = parse_error_kind(j["error"].get<std::string>());
    if (!kind) return std::nullopt;
    return std::make_pair(*kind, j.value("message", std::string()));
}

ResultReply reply_from_json(const json& v) {
    if (v.is_string()) return ResultReply::success(v.get<std::string>());
    if (v.is_object()) {
        auto kind = parse_error_kind(v.value("error", std::string()));
        return ResultReply::failure(kind ? *kind : ErrorKind::RemoteError, v.value("message", std::string()));
    }
    return ResultReply::failure(ErrorKind::RemoteError, "unexpected bulk result entry: " + v.dump());
}
}

HttpQueueClient::HttpQueueClient(std::string base_url, long timeout_ms)
    : base_(std::move(base_url)), timeout_ms_(timeout_ms) {
    while (!base_.empty() && base_.back() == '/') base_.pop_back();
    log_debug("queue", "remote queue at " + base_);
}

std::string HttpQueueClient::module_url(const std::string& module) const {
    return base_ + "/modules/" + url_encode(module) + "/";
}

std::string HttpQueueClient::task_url(const std::string& module, const std::string& id) const {
    return module_url(module) + url_encode(id);
}

HttpResponse HttpQueueClient::send(const std::string& method, const std::string& url, const std::string& body,
                                   const std::string& content_type) const {
    HttpRequest req;
    req.method = method;
    req.url = url;
    req.body = body;
    req.content_type = content_type;
    req.timeout_ms = timeout_ms_;
    return http_send(req);
}

std::string HttpQueueClient::submit(const std::string& module, const std::string& doc,
                                    const std::optional<std::string>& id) {
    std::string url = module_url(module);
    if (id) url += "?id=" + url_encode(*id);
    auto r = send("POST", url, doc);
    if (r.status == 202) {
        std::string tid = r.header("ID");
        if (tid.empty()) throw remote_error("No ID header when submitting to " + module, r);
        return tid;
    }
    if (r.status == 404) {
        throw QueueError(ErrorKind::UnknownModule, "Unknown module: " + module, r.status, r.body);
    }
    if (r.status == 400) {
        auto desc = parse_descriptor(r.body);
        throw QueueError(ErrorKind::BadRequest, desc ? desc->second : r.body, r.status, r.body);
    }
    throw remote_error("Error on processing doc with " + module, r);
}

TaskStatus HttpQueueClient::status(const std::string& module, const std::string& id) {
    auto r = send("HEAD", task_url(module, id));
    if (r.has_header("Status")) {
        if (auto st = parse_status(r.header("Status"))) return *st;
    }
    throw remote_error("Cannot determine status for " + module + "/" + id, r);
}

ResultReply HttpQueueClient::result(const std::string& module, const std::string& id,
                                    const std::optional<std::string>& format) {
    std::string url = task_url(module, id);
    if (format) url += "?format=" + url_encode(*format);
    auto r = send("GET", url);
    if (r.status == 200) return ResultReply::success(std::move(r.body));

    if (auto desc = parse_descriptor(r.body)) {
        switch (desc->first) {
            case ErrorKind::NotFound:
            case ErrorKind::NotReady:
            case ErrorKind::ProcessingFailed:
                return ResultReply::failure(desc->first, desc->second);
            case ErrorKind::UnknownModule:
            case ErrorKind::BadRequest:
                throw QueueError(desc->first, desc->second, r.status, r.body);
            default:
                break;
        }
    }
    if (r.status == 404) return ResultReply::failure(ErrorKind::NotFound, r.body);
    throw remote_error("Error on getting result for " + module + "/" + id, r);
}

std::optional<Task> HttpQueueClient::claim(const std::string& module) {
    auto r = send("GET", module_url(module));
    if (r.status == 404) return std::nullopt;
    if (r.status != 200) throw remote_error("Error on getting a task for " + module, r);
    std::string id = r.header("ID");
    if (id.empty()) throw remote_error("No ID header on task for " + module, r);
    return Task{id, std::move(r.body)};
}

void HttpQueueClient::store(const std::string& module, const std::string& id, const std::string& body,
                            const std::string& content_type) {
    auto r = send("PUT", task_url(module, id), body, content_type);
    if (r.status == 204) return;
    auto desc = parse_descriptor(r.body);
    if (r.status == 409) {
        throw QueueError(ErrorKind::InvalidTransition, desc ? desc->second : r.body, r.status, r.body);
    }
    if (r.status == 400) {
        throw QueueError(ErrorKind::BadRequest, desc ? desc->second : r.body, r.status, r.body);
    }
    throw remote_error("Error on storing outcome for " + module + "/" + id, r);
}

void HttpQueueClient::store_result(const std::string& module, const std::string& id, const std::string& result) {
    store(module, id, result, "text/plain; charset=utf-8");
}

void HttpQueueClient::store_error(const std::string& module, const std::string& id, const std::string& error) {
    store(module, id, error, kErrorContentType);
}

std::map<TaskStatus, std::size_t> HttpQueueClient::statistics(const std::string& module) {
    auto r = send("GET", module_url(module) + "bulk/statistics");
    if (r.status != 200) throw remote_error("Error on getting statistics for " + module, r);
    json j = parse_body("statistics", r);
    if (!j.is_object()) throw remote_error("Statistics did not return an object", r);
    std::map<TaskStatus, std::size_t> out;
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (auto st = parse_status(it.key())) out[*st] = field_as<std::size_t>(it.value(), "statistics", r);
    }
    return out;
}

std::map<std::string, TaskStatus> HttpQueueClient::bulk_status(const std::string& module,
                                                               const std::vector<std::string>& ids) {
    std::map<std::string, TaskStatus> out;
    if (ids.empty()) return out;
    auto r = send("POST", module_url(module) + "bulk/status", json(ids).dump(), "application/json");
    if (r.status != 200) throw remote_error("Error on bulk status for " + module, r);
    json j = parse_body("bulk status", r);
    if (!j.is_object()) throw remote_error("Bulk status did not return an object", r);
    for (const auto& id : ids) {
        auto st = j.contains(id) ? parse_status(field_as<std::string>(j[id], "bulk status", r)) : std::nullopt;
        if (!st) throw remote_error("No status for " + id + " in bulk response", r);
        out[id] = *st;
    }
    return out;
}

std::map<std::string, ResultReply> HttpQueueClient::bulk_result(const std::string& module,
                                                                const std::vector<std::string>& ids,
                                                                const std::optional<std::string>& format) {
    std::map<std::string, ResultReply> out;
    if (ids.empty()) return out;
    std::string url = module_url(module) + "bulk/result";
    if (format) url += "?format=" + url_encode(*format);
    auto r = send("POST", url, json(ids).dump(), "application/json");
    if (r.status != 200) {
        auto desc = parse_descriptor(r.body);
        if (desc && (desc->first == ErrorKind::UnknownModule || desc->first == ErrorKind::BadRequest)) {
            throw QueueError(desc->first, desc->second, r.status, r.body);
        }
        throw remote_error("Error on bulk result for " + module, r);
    }
    json j = parse_body("bulk result", r);
    if (!j.is_object()) throw remote_error("Bulk result did not return an object", r);
    for (const auto& id : ids) {
        out[id] = j.contains(id) ? reply_from_json(j[id])
                                 : ResultReply::failure(ErrorKind::RemoteError, "missing from bulk response");
    }
    return out;
}

std::vector<std::string> HttpQueueClient::bulk_submit(const std::string& module,
                                                      const std::vector<std::string>& docs,
                                                      const std::vector<std::string>& ids,
                                                      const BulkSubmitOptions& options) {
    if (!ids.empty() && ids.size() != docs.size()) {
        throw QueueError(ErrorKind::BadRequest, "bulk submit: " + std::to_string(ids.size()) + " ids for " +
                                                    std::to_string(docs.size()) + " documents");
    }
    if (docs.empty()) return {};

    json body;
    if (ids.empty()) {
        body = docs;
    } else {
        body = json::object();
        for (std::size_t i = 0; i < docs.size(); ++i) body[ids[i]] = docs[i];
    }
    std::string url = module_url(module) + "bulk/process";
    std::string sep = "?";
    if (options.reset_error) { url += sep + "reset_error=1"; sep = "&"; }
    if (options.reset_pending) { url += sep + "reset_pending=1"; }

    auto r = send("POST", url, body.dump(), "application/json");
    if (r.status == 404) {
        throw QueueError(ErrorKind::UnknownModule, "Unknown module: " + module, r.status, r.body);
    }
    if (r.status != 200) throw remote_error("Error on bulk process for " + module, r);
    json j = parse_body("bulk process", r);
    if (!j.is_array()) throw remote_error("Bulk process did not return a list", r);
    // Explicit ids are honoured verbatim, so their order is the caller's.
    if (!ids.empty()) return ids;
    auto out = field_as<std::vector<std::string>>(j, "bulk process", r);
    if (out.size() != docs.size()) throw remote_error("Bulk process returned " + std::to_string(out.size()) + " ids", r);
    return out;
}

} // namespace nlpq
