#include "../include/queue_server.hpp"
#include "../include/queue_api.hpp"
#include "log.hpp"
#include <arpa/inet.h>
#include <cstring>
#include <microhttpd.h>
#include <netinet/in.h>

#if MHD_VERSION >= 0x00097002
using MhdResult = enum MHD_Result;
#else
using MhdResult = int;
#endif

namespace {
struct ConnInfo {
    std::string method;
    std::string url;
    std::string body;
};

MhdResult collect_query(void* cls, enum MHD_ValueKind, const char* key, const char* val) {
    auto* m = static_cast<std::map<std::string, std::string>*>(cls);
    (*m)[key ? key : ""] = val ? val : "";
    return MHD_YES;
}

MhdResult send_response(struct MHD_Connection* conn, const ApiResponse& api) {
    struct MHD_Response* resp = MHD_create_response_from_buffer(api.body.size(), (void*)api.body.data(),
                                                                MHD_RESPMEM_MUST_COPY);
    if (!resp) return MHD_NO;
    if (!api.body.empty() || api.status != 204) {
        MHD_add_response_header(resp, MHD_HTTP_HEADER_CONTENT_TYPE, api.content_type.c_str());
    }
    for (const auto& h : api.headers) {
        MHD_add_response_header(resp, h.first.c_str(), h.second.c_str());
    }
    MhdResult ret = MHD_queue_response(conn, static_cast<unsigned int>(api.status), resp);
    MHD_destroy_response(resp);
    return ret;
}

MhdResult handler(void* cls, struct MHD_Connection* connection, const char* url, const char* method,
                  const char* /*version*/, const char* upload_data, size_t* upload_data_size, void** con_cls) {
    ConnInfo* ci = static_cast<ConnInfo*>(*con_cls);
    if (!ci) {
        ci = new ConnInfo{method, url, {}};
        *con_cls = ci;
        return MHD_YES;
    }

    if (*upload_data_size) {
        ci->body.append(upload_data, *upload_data_size);
        *upload_data_size = 0;
        return MHD_YES;
    }

    auto* api = static_cast<QueueApi*>(cls);
    ApiRequest req;
    req.method = ci->method;
    req.path = ci->url;
    req.body = std::move(ci->body);
    MHD_get_connection_values(connection, MHD_GET_ARGUMENT_KIND, &collect_query, &req.query);
    const char* ctype = MHD_lookup_connection_value(connection, MHD_HEADER_KIND, MHD_HTTP_HEADER_CONTENT_TYPE);
    req.content_type = ctype ? ctype : "";

    ApiResponse resp = api->handle(req);
    nlpq::log_debug("queue", req.method + " " + req.path + " -> " + std::to_string(resp.status));
    return send_response(connection, resp);
}

void request_completed(void* /*cls*/, struct MHD_Connection* /*connection*/, void** con_cls,
                       enum MHD_RequestTerminationCode /*toe*/) {
    delete static_cast<ConnInfo*>(*con_cls);
    *con_cls = nullptr;
}
}

QueueServer::QueueServer(QueueApi& api) : api_(api) {}

QueueServer::~QueueServer() { stop(); }

bool QueueServer::start(const std::string& host, int port) {
    if (daemon_) return true;

    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    std::string bind_host = (host.empty() || host == "localhost") ? "127.0.0.1" : host;
    if (inet_pton(AF_INET, bind_host.c_str(), &addr.sin_addr) != 1) {
        nlpq::log_error("queue", "Invalid IPv4 bind address: " + host);
        return false;
    }

    daemon_ = MHD_start_daemon(MHD_USE_AUTO | MHD_USE_INTERNAL_POLLING_THREAD, static_cast<uint16_t>(port),
                               nullptr, nullptr, &handler, &api_,
                               MHD_OPTION_SOCK_ADDR, reinterpret_cast<struct sockaddr*>(&addr),
                               MHD_OPTION_NOTIFY_COMPLETED, &request_completed, nullptr,
                               MHD_OPTION_END);
    if (!daemon_) {
        nlpq::log_error("queue", "Failed to start HTTP server on " + bind_host + ":" + std::to_string(port));
        return false;
    }
    const union MHD_DaemonInfo* info = MHD_get_daemon_info(daemon_, MHD_DAEMON_INFO_BIND_PORT);
    port_ = info ? static_cast<int>(info->port) : port;
    nlpq::log_info("queue", "Listening on " + bind_host + ":" + std::to_string(port_));
    return true;
}

void QueueServer::stop() noexcept {
    if (!daemon_) return;
    MHD_stop_daemon(daemon_);
    daemon_ = nullptr;
}
