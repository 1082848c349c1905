#include <catch2/catch.hpp>
#include <microhttpd.h>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <thread>
#include "connect.hpp"
#include "fs_client.hpp"
#include "http_client.hpp"
#include "module.hpp"
#include "queue_api.hpp"
#include "queue_server.hpp"
#include "task_id.hpp"
#include "test_util.hpp"
#include "worker.hpp"

using namespace nlpq;

namespace {
// Queue service on an ephemeral port, backed by a scratch directory.
struct ServerFixture {
    TempDir dir;
    ModuleRegistry modules = builtin_modules();
    FsQueueClient storage{dir.path(), &modules};
    QueueApi api{storage, modules};
    QueueServer server{api};
    std::unique_ptr<HttpQueueClient> client;

    ServerFixture() {
        REQUIRE(server.start("127.0.0.1", 0));
        REQUIRE(server.port() > 0);
        client = std::make_unique<HttpQueueClient>(url(), 5000);
    }

    std::string url() const { return "http://127.0.0.1:" + std::to_string(server.port()); }
};
}

namespace {
#if MHD_VERSION >= 0x00097002
using MhdResult = enum MHD_Result;
#else
using MhdResult = int;
#endif

// Answers every request with 200 and a fixed body.
class CannedServer {
public:
    explicit CannedServer(std::string body) : body_(std::move(body)) {
        daemon_ = MHD_start_daemon(MHD_USE_AUTO | MHD_USE_INTERNAL_POLLING_THREAD, 0, nullptr, nullptr,
                                   &CannedServer::answer, this, MHD_OPTION_END);
        REQUIRE(daemon_ != nullptr);
        const union MHD_DaemonInfo* info = MHD_get_daemon_info(daemon_, MHD_DAEMON_INFO_BIND_PORT);
        REQUIRE(info != nullptr);
        port_ = info->port;
    }
    ~CannedServer() { MHD_stop_daemon(daemon_); }
    CannedServer(const CannedServer&) = delete;
    CannedServer& operator=(const CannedServer&) = delete;

    std::string url() const { return "http://127.0.0.1:" + std::to_string(port_); }

private:
    static MhdResult answer(void* cls, struct MHD_Connection* connection, const char* /*url*/,
                            const char* /*method*/, const char* /*version*/, const char* /*upload_data*/,
                            size_t* upload_data_size, void** con_cls) {
        static int started;
        if (*con_cls == nullptr) {
            *con_cls = &started;
            return MHD_YES;
        }
        if (*upload_data_size) {
            *upload_data_size = 0;
            return MHD_YES;
        }
        auto* self = static_cast<CannedServer*>(cls);
        struct MHD_Response* resp = MHD_create_response_from_buffer(
            self->body_.size(), (void*)self->body_.data(), MHD_RESPMEM_MUST_COPY);
        MhdResult ret = MHD_queue_response(connection, 200, resp);
        MHD_destroy_response(resp);
        return ret;
    }

    std::string body_;
    MHD_Daemon* daemon_{nullptr};
    int port_{0};
};

ErrorKind kind_of(const std::function<void()>& call) {
    try {
        call();
    } catch (const QueueError& e) {
        return e.kind();
    }
    return ErrorKind::None;
}
}

TEST_CASE("Address parsing selects the backend", "[connect]") {
    REQUIRE(parse_address("http://localhost:5001").backend == Backend::Http);
    REQUIRE(parse_address("https://queue.example.org/api").backend == Backend::Http);
    REQUIRE(parse_address("/srv/nlpq").backend == Backend::Filesystem);
    REQUIRE(parse_address("relative/dir").location == "relative/dir");

    TempDir dir;
    auto client = nlpq::connect(dir.str());
    REQUIRE(dynamic_cast<FsQueueClient*>(client.get()) != nullptr);
    auto remote = nlpq::connect("http://127.0.0.1:1");
    REQUIRE(dynamic_cast<HttpQueueClient*>(remote.get()) != nullptr);
    REQUIRE_THROWS_AS(nlpq::connect(""), QueueError);
}

TEST_CASE_METHOD(ServerFixture, "Remote queue: full task lifecycle", "[http]") {
    std::string id = client->submit("echo", "hello");
    REQUIRE(id == task_id("hello"));
    REQUIRE(client->status("echo", id) == TaskStatus::Pending);

    auto task = client->claim("echo");
    REQUIRE(task);
    REQUIRE(task->id == id);
    REQUIRE(task->doc == "hello");
    REQUIRE(client->status("echo", id) == TaskStatus::Started);

    client->store_result("echo", id, "HELLO");
    REQUIRE(client->status("echo", id) == TaskStatus::Done);
    auto reply = client->result("echo", id);
    REQUIRE(reply);
    REQUIRE(reply.text == "HELLO");
    REQUIRE(client->result("echo", id, std::string("json")).text == R"({"text":"HELLO"})");

    REQUIRE_FALSE(client->claim("echo"));
}

TEST_CASE_METHOD(ServerFixture, "Remote queue: unknown ids and modules", "[http]") {
    REQUIRE(client->status("echo", "nonexistent") == TaskStatus::Unknown);
    auto reply = client->result("echo", "nonexistent");
    REQUIRE_FALSE(reply);
    REQUIRE(reply.error == ErrorKind::NotFound);

    try {
        client->submit("frog", "text");
        FAIL("submitting to an unknown module should throw");
    } catch (const QueueError& e) {
        REQUIRE(e.kind() == ErrorKind::UnknownModule);
    }
}

TEST_CASE_METHOD(ServerFixture, "Remote queue: errors, overwrite and invalid transitions", "[http]") {
    std::string id = client->submit("echo", "trouble", std::string("doc-7"));
    REQUIRE(id == "doc-7");
    REQUIRE(client->result("echo", id).error == ErrorKind::NotReady);

    try {
        client->store_result("echo", id, "too early");
        FAIL("storing on a pending task should throw");
    } catch (const QueueError& e) {
        REQUIRE(e.kind() == ErrorKind::InvalidTransition);
    }

    REQUIRE(client->claim("echo"));
    client->store_error("echo", id, "E");
    REQUIRE(client->status("echo", id) == TaskStatus::Error);
    auto failed = client->result("echo", id);
    REQUIRE(failed.error == ErrorKind::ProcessingFailed);
    REQUIRE(failed.message == "E");

    client->store_result("echo", id, "fixed");
    REQUIRE(client->status("echo", id) == TaskStatus::Done);
    REQUIRE(client->result("echo", id).text == "fixed");
}

TEST_CASE_METHOD(ServerFixture, "Remote queue: bulk operations", "[http][bulk]") {
    auto ids = client->bulk_submit("wordcount", {"a", "b"});
    REQUIRE(ids == std::vector<std::string>{task_id("a"), task_id("b")});

    auto keyed = client->bulk_submit("wordcount", {"x y", "y z"}, {"k2", "k1"});
    REQUIRE(keyed == std::vector<std::string>{"k2", "k1"});

    auto task = client->claim("wordcount");
    REQUIRE(task);
    client->store_error("wordcount", task->id, "failed once");

    auto statuses = client->bulk_status("wordcount", {task->id, "missing"});
    REQUIRE(statuses[task->id] == TaskStatus::Error);
    REQUIRE(statuses["missing"] == TaskStatus::Unknown);

    BulkSubmitOptions options;
    options.reset_error = true;
    client->bulk_submit("wordcount", {task->doc}, {task->id}, options);
    REQUIRE(client->status("wordcount", task->id) == TaskStatus::Pending);

    auto stats = client->statistics("wordcount");
    REQUIRE(stats[TaskStatus::Pending] == 4);
    REQUIRE(stats[TaskStatus::Error] == 0);

    const Module& wc = modules.get("wordcount");
    std::size_t handled = 0;
    while (work_once(*client, wc)) ++handled;
    REQUIRE(handled == 4);

    auto results = client->bulk_result("wordcount", {"k1", "missing"}, std::string("json"));
    REQUIRE(results["k1"].ok);
    REQUIRE(results["k1"].text == R"({"y":1,"z":1})");
    REQUIRE(results["missing"].error == ErrorKind::NotFound);
}

TEST_CASE_METHOD(ServerFixture, "Remote queue: process_inline against a worker", "[http][worker]") {
    std::atomic<bool> stop{false};
    WorkerOptions options;
    options.poll_interval = std::chrono::milliseconds(10);
    std::thread worker([&] {
        HttpQueueClient own(url(), 5000);
        run_worker(own, modules.get("upper"), options, stop);
    });

    InlineOptions inline_options;
    inline_options.interval = std::chrono::milliseconds(10);
    inline_options.deadline = std::chrono::milliseconds(10000);
    auto reply = client->process_inline("upper", "make me loud", inline_options);
    stop.store(true);
    worker.join();

    REQUIRE(reply);
    REQUIRE(reply.text == "MAKE ME LOUD");
}

TEST_CASE_METHOD(ServerFixture, "Remote queue: concurrent claims are exclusive", "[http][concurrency]") {
    const int n = 16;
    for (int i = 0; i < n; ++i) client->submit("echo", "doc " + std::to_string(i));

    std::mutex mtx;
    std::vector<std::string> claimed;
    std::vector<std::thread> threads;
    for (int t = 0; t < n; ++t) {
        threads.emplace_back([&] {
            HttpQueueClient own(url(), 5000);
            if (auto task = own.claim("echo")) {
                std::lock_guard<std::mutex> lock(mtx);
                claimed.push_back(task->id);
            }
        });
    }
    for (auto& th : threads) th.join();

    std::set<std::string> unique(claimed.begin(), claimed.end());
    REQUIRE(unique.size() == claimed.size());
    REQUIRE(claimed.size() == static_cast<std::size_t>(n));
}

TEST_CASE("Remote queue: unreachable service raises RemoteError", "[http]") {
    HttpQueueClient client("http://127.0.0.1:1", 1000);
    try {
        client.status("echo", "x");
        FAIL("expected a transport failure");
    } catch (const QueueError& e) {
        REQUIRE(e.kind() == ErrorKind::RemoteError);
        REQUIRE(e.http_status() == 0);
    }
}

TEST_CASE("Remote queue: badly shaped replies raise RemoteError", "[http]") {
    CannedServer server(R"({"PENDING": "lots", "x": 5})");
    HttpQueueClient client(server.url(), 5000);

    REQUIRE(kind_of([&] { client.statistics("echo"); }) == ErrorKind::RemoteError);
    REQUIRE(kind_of([&] { client.bulk_status("echo", {"x"}); }) == ErrorKind::RemoteError);
    REQUIRE(kind_of([&] { client.bulk_submit("echo", {"doc"}); }) == ErrorKind::RemoteError);
    REQUIRE(client.bulk_result("echo", {"x"})["x"].error == ErrorKind::RemoteError);
}
