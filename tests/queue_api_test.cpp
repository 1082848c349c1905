#include <catch2/catch.hpp>
#include <nlohmann/json.hpp>
#include "fs_client.hpp"
#include "http_client.hpp"
#include "module.hpp"
#include "queue_api.hpp"
#include "task_id.hpp"
#include "test_util.hpp"

using json = nlohmann::json;
using namespace nlpq;

namespace {
ApiRequest request(std::string method, std::string path, std::string body = {}) {
    ApiRequest r;
    r.method = std::move(method);
    r.path = std::move(path);
    r.body = std::move(body);
    return r;
}

std::string header(const ApiResponse& r, const std::string& name) {
    for (const auto& h : r.headers) {
        if (h.first == name) return h.second;
    }
    return {};
}

struct ApiFixture {
    TempDir dir;
    ModuleRegistry modules = builtin_modules();
    FsQueueClient client{dir.path(), &modules};
    QueueApi api{client, modules};
};
}

TEST_CASE_METHOD(ApiFixture, "API: submit, claim, store and fetch", "[api]") {
    auto submitted = api.handle(request("POST", "/modules/echo/", "hello"));
    REQUIRE(submitted.status == 202);
    const std::string id = task_id("hello");
    REQUIRE(header(submitted, "ID") == id);
    REQUIRE(header(submitted, "Location") == "/modules/echo/" + id);
    REQUIRE(submitted.body == id + "\n");

    auto head = api.handle(request("HEAD", "/modules/echo/" + id));
    REQUIRE(head.status == 202);
    REQUIRE(header(head, "Status") == "PENDING");

    auto claimed = api.handle(request("GET", "/modules/echo/"));
    REQUIRE(claimed.status == 200);
    REQUIRE(claimed.body == "hello");
    REQUIRE(header(claimed, "ID") == id);
    REQUIRE(api.handle(request("GET", "/modules/echo/")).status == 404);

    REQUIRE(api.handle(request("PUT", "/modules/echo/" + id, "HELLO")).status == 204);
    auto done = api.handle(request("HEAD", "/modules/echo/" + id));
    REQUIRE(done.status == 200);
    REQUIRE(header(done, "Status") == "DONE");

    auto result = api.handle(request("GET", "/modules/echo/" + id));
    REQUIRE(result.status == 200);
    REQUIRE(result.body == "HELLO");

    auto converted = request("GET", "/api/modules/echo/" + id);
    converted.query["format"] = "json";
    REQUIRE(api.handle(converted).body == R"({"text":"HELLO"})");
}

TEST_CASE_METHOD(ApiFixture, "API: error sentinel stores an error", "[api]") {
    auto id = client.submit("echo", "will fail");
    REQUIRE(client.claim("echo"));

    auto put = request("PUT", "/modules/echo/" + id, "it broke");
    put.content_type = std::string(kErrorContentType) + "; charset=utf-8";
    REQUIRE(api.handle(put).status == 204);
    REQUIRE(client.status("echo", id) == TaskStatus::Error);

    auto head = api.handle(request("HEAD", "/modules/echo/" + id));
    REQUIRE(head.status == 500);
    REQUIRE(header(head, "Status") == "ERROR");

    auto result = api.handle(request("GET", "/modules/echo/" + id));
    REQUIRE(result.status == 500);
    auto body = json::parse(result.body);
    REQUIRE(body["error"] == "ProcessingFailed");
    REQUIRE(body["message"] == "it broke");
}

TEST_CASE_METHOD(ApiFixture, "API: failure status codes", "[api]") {
    REQUIRE(api.handle(request("POST", "/modules/frog/", "text")).status == 404);
    REQUIRE(api.handle(request("HEAD", "/modules/echo/nothing")).status == 404);
    REQUIRE(header(api.handle(request("HEAD", "/modules/echo/nothing")), "Status") == "UNKNOWN");
    REQUIRE(json::parse(api.handle(request("GET", "/modules/echo/nothing")).body)["error"] == "NotFound");

    auto id = client.submit("echo", "queued");
    auto not_ready = api.handle(request("GET", "/modules/echo/" + id));
    REQUIRE(not_ready.status == 409);
    REQUIRE(json::parse(not_ready.body)["error"] == "NotReady");

    auto invalid = api.handle(request("PUT", "/modules/echo/" + id, "too early"));
    REQUIRE(invalid.status == 409);
    REQUIRE(json::parse(invalid.body)["error"] == "InvalidTransition");

    REQUIRE(api.handle(request("POST", "/modules/echo/bulk/status", "not json")).status == 400);
    REQUIRE(api.handle(request("POST", "/modules/echo/bulk/status", "[]")).status == 400);
    REQUIRE(api.handle(request("POST", "/modules/echo/bulk/process", "{}")).status == 400);
    REQUIRE(api.handle(request("DELETE", "/modules/echo/" + id)).status == 404);
    REQUIRE(api.handle(request("GET", "/nowhere")).status == 404);
}

TEST_CASE_METHOD(ApiFixture, "API: explicit id on submit", "[api]") {
    auto req = request("POST", "/modules/echo/", "text");
    req.query["id"] = "my-doc";
    auto resp = api.handle(req);
    REQUIRE(resp.status == 202);
    REQUIRE(header(resp, "ID") == "my-doc");
    REQUIRE(client.status("echo", "my-doc") == TaskStatus::Pending);

    req.query["id"] = ".hidden";
    REQUIRE(api.handle(req).status == 400);
}

TEST_CASE_METHOD(ApiFixture, "API: bulk endpoints", "[api]") {
    auto process = api.handle(request("POST", "/modules/upper/bulk/process", R"(["a", "b"])"));
    REQUIRE(process.status == 200);
    REQUIRE(json::parse(process.body) == json({task_id("a"), task_id("b")}));

    auto keyed = api.handle(request("POST", "/modules/upper/bulk/process", R"({"k1": "x", "k2": "y"})"));
    REQUIRE(json::parse(keyed.body) == json({"k1", "k2"}));

    auto task = client.claim("upper");
    REQUIRE(task);
    client.store_result("upper", task->id, "A");

    const std::string pending_id = task->id == "k1" ? "k2" : "k1";
    json ids = {task->id, pending_id, "missing"};
    auto statuses = json::parse(api.handle(request("POST", "/modules/upper/bulk/status", ids.dump())).body);
    REQUIRE(statuses[task->id] == "DONE");
    REQUIRE(statuses[pending_id] == "PENDING");
    REQUIRE(statuses["missing"] == "UNKNOWN");

    auto results = json::parse(api.handle(request("POST", "/modules/upper/bulk/result", ids.dump())).body);
    REQUIRE(results[task->id] == "A");
    REQUIRE(results[pending_id]["error"] == "NotReady");
    REQUIRE(results["missing"]["error"] == "NotFound");

    auto stats = json::parse(api.handle(request("GET", "/modules/upper/bulk/statistics")).body);
    REQUIRE(stats["DONE"] == 1);
    REQUIRE(stats["PENDING"] == 3);

    auto index = json::parse(api.handle(request("GET", "/")).body);
    REQUIRE(index["upper"]["DONE"] == 1);
    REQUIRE(index.contains("wordcount"));
}

TEST_CASE_METHOD(ApiFixture, "API: bulk process reset flags", "[api]") {
    auto id = client.submit("echo", "retry me");
    REQUIRE(client.claim("echo"));
    client.store_error("echo", id, "oops");

    api.handle(request("POST", "/modules/echo/bulk/process", R"(["retry me"])"));
    REQUIRE(client.status("echo", id) == TaskStatus::Error);

    auto req = request("POST", "/modules/echo/bulk/process", R"(["retry me"])");
    req.query["reset_error"] = "True";
    REQUIRE(api.handle(req).status == 200);
    REQUIRE(client.status("echo", id) == TaskStatus::Pending);
}
