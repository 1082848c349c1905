#include <chrono>
#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include "connect.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "module.hpp"
#include "queue_client.hpp"
#include "util.hpp"

static void usage() {
    std::cerr << "nlpq usage:\n"
              << "  nlpq <dir|url> <module> status <id>\n"
              << "  nlpq <dir|url> <module> result <id> [--format F]\n"
              << "  nlpq <dir|url> <module> process <doc|-> [--id ID]\n"
              << "  nlpq <dir|url> <module> process_inline <doc|-> [--timeout-ms N]\n"
              << "  nlpq <dir|url> <module> get_task\n"
              << "  nlpq <dir|url> <module> store_result <id> <text|->\n"
              << "  nlpq <dir|url> <module> store_error <id> <text|->\n"
              << "  nlpq <dir|url> <module> stats\n"
              << "  options: --verbose\n";
}

// Prints a reply, returning the process exit code.
static int print_reply(const nlpq::ResultReply& reply) {
    if (reply) {
        std::cout << reply.text << "\n";
        return 0;
    }
    std::cerr << "[" << nlpq::to_string(reply.error) << "] " << reply.message << "\n";
    return 3;
}

int main(int argc, char** argv) {
    std::vector<std::string> pos;
    std::optional<std::string> format;
    std::optional<std::string> explicit_id;
    std::optional<long> timeout_ms;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--format" && i + 1 < argc) format = argv[++i];
        else if (a == "--id" && i + 1 < argc) explicit_id = argv[++i];
        else if (a == "--timeout-ms" && i + 1 < argc) {
            timeout_ms = nlpq::parse_long(argv[++i]);
            if (!timeout_ms || *timeout_ms < 0) { usage(); return 1; }
        }
        else if (a == "--verbose" || a == "-v") nlpq::set_log_level(nlpq::LogLevel::Debug);
        else if (a == "--help" || a == "-h") { usage(); return 0; }
        else pos.push_back(a);
    }
    if (pos.size() < 3) { usage(); return 1; }
    const std::string& server = pos[0];
    const std::string& module = pos[1];
    const std::string& action = pos[2];
    auto arg = [&](std::size_t i) -> const std::string& {
        if (pos.size() <= 3 + i) throw nlpq::QueueError(nlpq::ErrorKind::BadRequest, action + ": missing argument");
        return pos[3 + i];
    };

    try {
        nlpq::ModuleRegistry modules = nlpq::builtin_modules();
        auto client = nlpq::connect(server, &modules, nlpq::getenv_long("NLPQ_HTTP_TIMEOUT_MS", 30000));

        if (action == "status") {
            std::cout << nlpq::to_string(client->status(module, arg(0))) << "\n";
        } else if (action == "result") {
            return print_reply(client->result(module, arg(0), format));
        } else if (action == "process") {
            std::cout << client->submit(module, nlpq::arg_or_stdin(arg(0)), explicit_id) << "\n";
        } else if (action == "process_inline") {
            nlpq::InlineOptions options;
            if (timeout_ms) options.deadline = std::chrono::milliseconds(*timeout_ms);
            return print_reply(client->process_inline(module, nlpq::arg_or_stdin(arg(0)), options));
        } else if (action == "get_task") {
            if (auto task = client->claim(module)) {
                std::cerr << task->id << "\n";
                std::cout << task->doc << "\n";
            }
        } else if (action == "store_result") {
            client->store_result(module, arg(0), nlpq::arg_or_stdin(arg(1)));
        } else if (action == "store_error") {
            client->store_error(module, arg(0), nlpq::arg_or_stdin(arg(1)));
        } else if (action == "stats") {
            for (const auto& kv : client->statistics(module)) {
                std::cout << nlpq::to_string(kv.first) << "\t" << kv.second << "\n";
            }
        } else {
            usage();
            return 1;
        }
        return 0;
    } catch (const nlpq::QueueError& e) {
        std::cerr << "[ERROR] " << nlpq::to_string(e.kind()) << ": " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 1;
    }
}
