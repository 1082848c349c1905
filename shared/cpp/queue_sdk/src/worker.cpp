#include "../include/worker.hpp"
#include "../include/log.hpp"
#include "../include/module.hpp"
#include "../include/queue_client.hpp"
#include <algorithm>
#include <thread>

namespace nlpq {

bool work_once(QueueClient& client, const Module& module) {
    const std::string name = module.name();
    auto task = client.claim(name);
    if (!task) return false;

    log_info(name, "Processing task " + task->id);
    std::string result;
    try {
        result = module.process(task->doc);
    } catch (const std::exception& e) {
        log_warn(name, "Task " + task->id + " failed: " + e.what());
        client.store_error(name, task->id, e.what());
        return true;
    }
    client.store_result(name, task->id, result);
    return true;
}

std::size_t run_worker(QueueClient& client, const Module& module, const WorkerOptions& options,
                       const std::atomic<bool>& stop) {
    std::size_t handled = 0;
    log_info(module.name(), "Worker started, poll_ms=" + std::to_string(options.poll_interval.count()) +
                                (options.once ? " once" : " loop"));
    while (!stop.load()) {
        if (work_once(client, module)) {
            ++handled;
            continue;
        }
        if (options.once) break;
        // Sleep in small steps so a stop request is honoured promptly.
        auto slept = std::chrono::milliseconds(0);
        while (slept < options.poll_interval && !stop.load()) {
            auto step = std::min(options.poll_interval - slept, std::chrono::milliseconds(50));
            std::this_thread::sleep_for(step);
            slept += step;
        }
    }
    log_info(module.name(), "Worker stopped after " + std::to_string(handled) + " tasks");
    return handled;
}

} // namespace nlpq
