#include "../include/queue_api.hpp"
#include "errors.hpp"
#include "http_client.hpp"
#include "log.hpp"
#include "module.hpp"
#include "queue_client.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <optional>

using json = nlohmann::json;
using nlpq::ErrorKind;

namespace {
ApiResponse text_response(int status, std::string body) {
    ApiResponse r;
    r.status = status;
    r.body = std::move(body);
    return r;
}

ApiResponse json_response(int status, const json& body) {
    ApiResponse r;
    r.status = status;
    r.body = body.dump();
    r.content_type = "application/json";
    return r;
}

ApiResponse descriptor(int status, ErrorKind kind, const std::string& message) {
    return json_response(status, json{{"error", nlpq::to_string(kind)}, {"message", message}});
}

int http_code(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UnknownModule:
        case ErrorKind::NotFound: return 404;
        case ErrorKind::InvalidTransition:
        case ErrorKind::NotReady: return 409;
        case ErrorKind::BadRequest: return 400;
        case ErrorKind::RemoteError: return 502;
        case ErrorKind::Timeout: return 504;
        default: return 500;
    }
}

std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> out;
    std::string::size_type start = 0;
    while (true) {
        auto pos = s.find(sep, start);
        out.push_back(s.substr(start, pos == std::string::npos ? std::string::npos : pos - start));
        if (pos == std::string::npos) break;
        start = pos + 1;
    }
    return out;
}

std::string query_or(const ApiRequest& req, const std::string& key, const std::string& def = {}) {
    auto it = req.query.find(key);
    return it == req.query.end() ? def : it->second;
}

std::optional<std::string> query_opt(const ApiRequest& req, const std::string& key) {
    auto it = req.query.find(key);
    if (it == req.query.end() || it->second.empty()) return std::nullopt;
    return it->second;
}

std::string id_string(const json& v) {
    return v.is_string() ? v.get<std::string>() : v.dump();
}

// Non-empty JSON list of ids; empty optional if the body is malformed.
std::optional<std::vector<std::string>> parse_id_list(const std::string& body) {
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_array() || j.empty()) return std::nullopt;
    std::vector<std::string> ids;
    ids.reserve(j.size());
    for (const auto& v : j) ids.push_back(id_string(v));
    return ids;
}

std::string task_location(const std::string& module, const std::string& id) {
    return "/modules/" + module + "/" + id;
}
}

QueueApi::QueueApi(nlpq::QueueClient& client, const nlpq::ModuleRegistry& modules)
    : client_(client), modules_(modules) {}

ApiResponse QueueApi::handle(const ApiRequest& request) {
    std::string path = request.path;
    if (path.rfind("/api/", 0) == 0) path = path.substr(4);
    const std::string& m = request.method;
    try {
        if (path == "/" && m == "GET") return index();

        const std::string prefix = "/modules/";
        if (path.rfind(prefix, 0) == 0) {
            auto parts = split(path.substr(prefix.size()), '/');
            const std::string& module = parts[0];
            if (!module.empty()) {
                bool collection = parts.size() == 1 || (parts.size() == 2 && parts[1].empty());
                if (collection) {
                    if (m == "POST") return post_task(module, request);
                    if (m == "GET") return get_task(module);
                } else if (parts.size() == 2) {
                    const std::string& id = parts[1];
                    if (m == "HEAD") return task_status(module, id);
                    if (m == "GET") return task_result(module, id, request);
                    if (m == "PUT") return put_outcome(module, id, request);
                } else if (parts.size() == 3 && parts[1] == "bulk") {
                    const std::string& op = parts[2];
                    if (m == "POST" && op == "status") return bulk_status(module, request);
                    if (m == "POST" && op == "result") return bulk_result(module, request);
                    if (m == "POST" && op == "process") return bulk_process(module, request);
                    if (m == "GET" && op == "statistics") return statistics(module);
                }
            }
        }
        return json_response(404, json{{"error", "not found"}});
    } catch (const nlpq::QueueError& e) {
        if (e.kind() == ErrorKind::StorageError) nlpq::log_error("queue", m + " " + request.path + ": " + e.what());
        return descriptor(http_code(e.kind()), e.kind(), e.what());
    } catch (const json::exception& e) {
        return descriptor(400, ErrorKind::BadRequest, e.what());
    } catch (const std::exception& e) {
        nlpq::log_error("queue", m + " " + request.path + ": " + e.what());
        return descriptor(500, ErrorKind::StorageError, e.what());
    }
}

ApiResponse QueueApi::index() {
    json out = json::object();
    for (const auto& name : modules_.names()) {
        json counts = json::object();
        for (const auto& kv : client_.statistics(name)) counts[nlpq::to_string(kv.first)] = kv.second;
        out[name] = counts;
    }
    return json_response(200, out);
}

ApiResponse QueueApi::post_task(const std::string& module, const ApiRequest& request) {
    if (!modules_.find(module)) {
        return descriptor(404, ErrorKind::UnknownModule, "Unknown module: " + module);
    }
    std::string id = client_.submit(module, request.body, query_opt(request, "id"));
    ApiResponse r = text_response(202, id + "\n");
    r.headers.emplace_back("Location", task_location(module, id));
    r.headers.emplace_back("ID", id);
    return r;
}

ApiResponse QueueApi::task_status(const std::string& module, const std::string& id) {
    nlpq::TaskStatus st = client_.status(module, id);
    ApiResponse r = text_response(nlpq::status_http_code(st), {});
    r.headers.emplace_back("Status", nlpq::to_string(st));
    return r;
}

ApiResponse QueueApi::task_result(const std::string& module, const std::string& id, const ApiRequest& request) {
    auto reply = client_.result(module, id, query_opt(request, "format"));
    if (reply) return text_response(200, std::move(reply.text));
    return descriptor(http_code(reply.error), reply.error, reply.message);
}

ApiResponse QueueApi::get_task(const std::string& module) {
    auto task = client_.claim(module);
    if (!task) return text_response(404, "Queue " + module + " empty!\n");
    ApiResponse r = text_response(200, std::move(task->doc));
    r.headers.emplace_back("Location", task_location(module, task->id));
    r.headers.emplace_back("ID", task->id);
    return r;
}

ApiResponse QueueApi::put_outcome(const std::string& module, const std::string& id, const ApiRequest& request) {
    std::string ctype = request.content_type.substr(0, request.content_type.find(';'));
    if (nlpq::to_lower(ctype) == nlpq::kErrorContentType) {
        client_.store_error(module, id, request.body);
    } else {
        client_.store_result(module, id, request.body);
    }
    return text_response(204, {});
}

ApiResponse QueueApi::bulk_status(const std::string& module, const ApiRequest& request) {
    auto ids = parse_id_list(request.body);
    if (!ids) return text_response(400, "Error: Please provide bulk IDs as a json list\n");
    json out = json::object();
    for (const auto& kv : client_.bulk_status(module, *ids)) out[kv.first] = nlpq::to_string(kv.second);
    return json_response(200, out);
}

ApiResponse QueueApi::bulk_result(const std::string& module, const ApiRequest& request) {
    auto ids = parse_id_list(request.body);
    if (!ids) return text_response(400, "Error: Please provide bulk IDs as a json list\n");
    json out = json::object();
    for (const auto& kv : client_.bulk_result(module, *ids, query_opt(request, "format"))) {
        const auto& reply = kv.second;
        if (reply) out[kv.first] = reply.text;
        else out[kv.first] = json{{"error", nlpq::to_string(reply.error)}, {"message", reply.message}};
    }
    return json_response(200, out);
}

ApiResponse QueueApi::bulk_process(const std::string& module, const ApiRequest& request) {
    if (!modules_.find(module)) {
        return descriptor(404, ErrorKind::UnknownModule, "Unknown module: " + module);
    }
    nlpq::BulkSubmitOptions options;
    options.reset_error = nlpq::is_truthy(query_or(request, "reset_error"));
    options.reset_pending = nlpq::is_truthy(query_or(request, "reset_pending"));

    json j = json::parse(request.body, nullptr, false);
    std::vector<std::string> docs;
    std::vector<std::string> ids;
    if (!j.is_discarded() && j.is_array()) {
        for (const auto& v : j) docs.push_back(v.get<std::string>());
    } else if (!j.is_discarded() && j.is_object()) {
        for (auto it = j.begin(); it != j.end(); ++it) {
            ids.push_back(it.key());
            docs.push_back(it.value().get<std::string>());
        }
    }
    if (docs.empty()) {
        nlpq::log_warn("queue", "bulk/process: cannot parse body " + request.body.substr(0, 20));
        return text_response(400, "Error: Please provide bulk docs as a json list or {id: doc} dict\n");
    }
    return json_response(200, json(client_.bulk_submit(module, docs, ids, options)));
}

ApiResponse QueueApi::statistics(const std::string& module) {
    json out = json::object();
    for (const auto& kv : client_.statistics(module)) out[nlpq::to_string(kv.first)] = kv.second;
    return json_response(200, out);
}
