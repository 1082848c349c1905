#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include "connect.hpp"
#include "log.hpp"
#include "module.hpp"
#include "queue_client.hpp"
#include "util.hpp"
#include "worker.hpp"

static std::atomic<bool> g_stop{false};

static void usage() {
    std::cerr << "nlpq_worker usage:\n"
              << "  nlpq_worker <module> [--server <dir|url>] [--poll-ms N] [--once] [--verbose]\n"
              << "  server defaults to $NLPQ_SERVER or http://localhost:5001\n";
}

int main(int argc, char** argv) {
    std::string server = nlpq::getenv_or("NLPQ_SERVER", "http://localhost:5001");
    long timeout_ms = nlpq::getenv_long("NLPQ_HTTP_TIMEOUT_MS", 30000);
    nlpq::WorkerOptions options;
    options.poll_interval = std::chrono::milliseconds(nlpq::getenv_long("NLPQ_POLL_MS", 1000));
    std::string module_name;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--once") options.once = true;
        else if (a == "--poll-ms" && i + 1 < argc) {
            auto v = nlpq::parse_long(argv[++i]);
            if (!v || *v < 0) { usage(); return 1; }
            options.poll_interval = std::chrono::milliseconds(*v);
        }
        else if (a == "--server" && i + 1 < argc) server = argv[++i];
        else if (a == "--verbose" || a == "-v") nlpq::set_log_level(nlpq::LogLevel::Debug);
        else if (!a.empty() && a[0] != '-' && module_name.empty()) module_name = a;
        else { usage(); return 1; }
    }
    if (module_name.empty()) { usage(); return 2; }

    try {
        nlpq::ModuleRegistry modules = nlpq::builtin_modules();
        const nlpq::Module& module = modules.get(module_name);
        auto client = nlpq::connect(server, &modules, timeout_ms);

        std::signal(SIGINT, [](int) { g_stop.store(true); });
        std::signal(SIGTERM, [](int) { g_stop.store(true); });

        nlpq::log_info(module_name, "Starting. server=" + server);
        nlpq::run_worker(*client, module, options, g_stop);
        return 0;
    } catch (const std::exception& e) {
        nlpq::log_error(module_name, e.what());
        return 1;
    }
}
