#pragma once
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace nlpq {
class ModuleRegistry;
class QueueClient;
}

struct ApiRequest {
    std::string method;
    std::string path;
    std::map<std::string, std::string> query;
    std::string body;
    std::string content_type;
};

struct ApiResponse {
    int status{200};
    std::string body;
    std::string content_type{"text/plain; charset=utf-8"};
    std::vector<std::pair<std::string, std::string>> headers;
};

// Maps the queue service's HTTP surface onto a QueueClient. Independent of
// the HTTP server library so it can be exercised directly.
class QueueApi {
public:
    QueueApi(nlpq::QueueClient& client, const nlpq::ModuleRegistry& modules);

    ApiResponse handle(const ApiRequest& request);

private:
    ApiResponse index();
    ApiResponse post_task(const std::string& module, const ApiRequest& request);
    ApiResponse task_status(const std::string& module, const std::string& id);
    ApiResponse task_result(const std::string& module, const std::string& id, const ApiRequest& request);
    ApiResponse get_task(const std::string& module);
    ApiResponse put_outcome(const std::string& module, const std::string& id, const ApiRequest& request);
    ApiResponse bulk_status(const std::string& module, const ApiRequest& request);
    ApiResponse bulk_result(const std::string& module, const ApiRequest& request);
    ApiResponse bulk_process(const std::string& module, const ApiRequest& request);
    ApiResponse statistics(const std::string& module);

    nlpq::QueueClient& client_;
    const nlpq::ModuleRegistry& modules_;
};
