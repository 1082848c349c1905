#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>
#include "../include/queue_api.hpp"
#include "../include/queue_server.hpp"
#include "fs_client.hpp"
#include "log.hpp"
#include "module.hpp"
#include "util.hpp"
#include "worker.hpp"

static std::atomic<bool> g_stop{false};

static void usage() {
    std::cerr << "nlpq_queue usage:\n"
              << "  nlpq_queue [directory] [--port N] [--host ADDR] [--workers [mod,mod...]] [--verbose]\n"
              << "  directory defaults to $NLPQ_DIR or a fresh temp directory\n";
}

static std::vector<std::string> split_list(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : s) {
        if (c == ',') { if (!cur.empty()) out.push_back(cur); cur.clear(); }
        else cur.push_back(c);
    }
    if (!cur.empty()) out.push_back(cur);
    return out;
}

int main(int argc, char** argv) {
    std::string dir = nlpq::getenv_or("NLPQ_DIR", "");
    std::string host = nlpq::getenv_or("NLPQ_HOST", "127.0.0.1");
    int port = static_cast<int>(nlpq::getenv_long("NLPQ_PORT", 5001));
    bool run_workers = false;
    std::vector<std::string> worker_modules;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--port" && i + 1 < argc) {
            auto v = nlpq::parse_long(argv[++i]);
            if (!v || *v < 0 || *v > 65535) { usage(); return 1; }
            port = static_cast<int>(*v);
        }
        else if (a == "--host" && i + 1 < argc) host = argv[++i];
        else if (a == "--workers") {
            run_workers = true;
            if (i + 1 < argc && argv[i + 1][0] != '-') worker_modules = split_list(argv[++i]);
        }
        else if (a == "--verbose" || a == "-v") nlpq::set_log_level(nlpq::LogLevel::Debug);
        else if (a == "--help" || a == "-h") { usage(); return 0; }
        else if (!a.empty() && a[0] != '-') dir = a;
        else { usage(); return 1; }
    }

    try {
        if (dir.empty()) {
            auto tmp = std::filesystem::temp_directory_path() / ("nlpq_" + std::to_string(::getpid()));
            std::filesystem::create_directories(tmp);
            dir = tmp.string();
        }

        nlpq::ModuleRegistry modules = nlpq::builtin_modules();
        nlpq::FsQueueClient client(dir, &modules);
        QueueApi api(client, modules);
        QueueServer server(api);

        if (!server.start(host, port)) return 1;
        nlpq::log_info("queue", "Serving from " + dir);

        std::signal(SIGINT, [](int) { g_stop.store(true); });
        std::signal(SIGTERM, [](int) { g_stop.store(true); });

        std::vector<std::thread> workers;
        if (run_workers) {
            if (worker_modules.empty()) worker_modules = modules.names();
            nlpq::WorkerOptions options;
            options.poll_interval = std::chrono::milliseconds(nlpq::getenv_long("NLPQ_POLL_MS", 1000));
            for (const auto& name : worker_modules) {
                const nlpq::Module& module = modules.get(name);
                nlpq::log_debug("queue", "Starting worker for " + name);
                workers.emplace_back([&client, &module, options] {
                    try {
                        nlpq::run_worker(client, module, options, g_stop);
                    } catch (const std::exception& e) {
                        nlpq::log_error(module.name(), std::string("Worker died: ") + e.what());
                    }
                });
            }
        }

        while (!g_stop.load()) std::this_thread::sleep_for(std::chrono::milliseconds(200));

        nlpq::log_info("queue", "Shutting down");
        for (auto& t : workers) t.join();
        server.stop();
        return 0;
    } catch (const std::exception& e) {
        nlpq::log_error("queue", e.what());
        return 1;
    }
}
