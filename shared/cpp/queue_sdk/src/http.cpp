#include "../include/http.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"
#include <curl/curl.h>
#include <mutex>

namespace nlpq {

namespace {
size_t write_cb(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    std::string* s = static_cast<std::string*>(userp);
    s->append(static_cast<char*>(contents), total);
    return total;
}

size_t header_cb(char* buffer, size_t size, size_t nitems, void* userp) {
    size_t total = size * nitems;
    auto* headers = static_cast<std::map<std::string, std::string>*>(userp);
    std::string line(buffer, total);
    auto colon = line.find(':');
    if (colon == std::string::npos) return total; // status line or blank separator
    std::string key = to_lower(line.substr(0, colon));
    std::string value = line.substr(colon + 1);
    auto first = value.find_first_not_of(" \t");
    auto last = value.find_last_not_of(" \t\r\n");
    value = first == std::string::npos ? std::string() : value.substr(first, last - first + 1);
    (*headers)[key] = value;
    return total;
}

void global_init() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

struct CurlHandle {
    CURL* h{nullptr};
    struct curl_slist* headers{nullptr};
    CurlHandle() {
        global_init();
        h = curl_easy_init();
        if (!h) throw QueueError(ErrorKind::RemoteError, "curl_easy_init failed");
    }
    ~CurlHandle() {
        if (headers) curl_slist_free_all(headers);
        if (h) curl_easy_cleanup(h);
    }
    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};
}

std::string HttpResponse::header(const std::string& name) const {
    auto it = headers.find(to_lower(name));
    return it == headers.end() ? std::string() : it->second;
}

bool HttpResponse::has_header(const std::string& name) const {
    return headers.count(to_lower(name)) > 0;
}

HttpResponse http_send(const HttpRequest& request) {
    CurlHandle c;
    HttpResponse resp;

    curl_easy_setopt(c.h, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(c.h, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(c.h, CURLOPT_WRITEDATA, &resp.body);
    curl_easy_setopt(c.h, CURLOPT_HEADERFUNCTION, header_cb);
    curl_easy_setopt(c.h, CURLOPT_HEADERDATA, &resp.headers);
    curl_easy_setopt(c.h, CURLOPT_TIMEOUT_MS, request.timeout_ms);
    curl_easy_setopt(c.h, CURLOPT_NOSIGNAL, 1L);

    if (request.method == "HEAD") {
        curl_easy_setopt(c.h, CURLOPT_NOBODY, 1L);
    } else if (request.method == "POST" || request.method == "PUT") {
        if (request.method == "PUT") curl_easy_setopt(c.h, CURLOPT_CUSTOMREQUEST, "PUT");
        curl_easy_setopt(c.h, CURLOPT_POSTFIELDS, request.body.data());
        curl_easy_setopt(c.h, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
        std::string ctype = "Content-Type: " + (request.content_type.empty() ? std::string("text/plain; charset=utf-8")
                                                                              : request.content_type);
        c.headers = curl_slist_append(c.headers, ctype.c_str());
        // Avoid the 100-continue round trip on larger bodies.
        c.headers = curl_slist_append(c.headers, "Expect:");
        curl_easy_setopt(c.h, CURLOPT_HTTPHEADER, c.headers);
    } else if (request.method != "GET") {
        curl_easy_setopt(c.h, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    }

    CURLcode code = curl_easy_perform(c.h);
    if (code != CURLE_OK) {
        throw QueueError(ErrorKind::RemoteError, request.method + " " + request.url + " failed: " +
                                                     curl_easy_strerror(code));
    }
    curl_easy_getinfo(c.h, CURLINFO_RESPONSE_CODE, &resp.status);
    return resp;
}

std::string url_encode(const std::string& value) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size());
    for (unsigned char ch : value) {
        if ((ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9') ||
            ch == '-' || ch == '_' || ch == '.' || ch == '~') {
            out.push_back(static_cast<char>(ch));
        } else {
            out.push_back('%');
            out.push_back(hex[ch >> 4]);
            out.push_back(hex[ch & 0xF]);
        }
    }
    return out;
}

} // namespace nlpq
