#pragma once
#include <map>
#include <string>

namespace nlpq {

struct HttpRequest {
    std::string method{"GET"};
    std::string url;
    std::string body;
    std::string content_type;
    long timeout_ms{30000};
};

struct HttpResponse {
    long status{0};
    std::string body;
    std::map<std::string, std::string> headers; // keys lower-cased

    std::string header(const std::string& name) const;
    bool has_header(const std::string& name) const;
};

// Performs one blocking request. Transport failures throw QueueError(RemoteError).
HttpResponse http_send(const HttpRequest& request);

std::string url_encode(const std::string& value);

} // namespace nlpq
