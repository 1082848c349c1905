#pragma once
#include <atomic>
#include <chrono>
#include <cstddef>

namespace nlpq {

class Module;
class QueueClient;

struct WorkerOptions {
    std::chrono::milliseconds poll_interval{1000};
    bool once{false}; // exit when the queue is empty instead of polling
};

// Claims and processes at most one task. Returns false if the queue was empty.
bool work_once(QueueClient& client, const Module& module);

// Returns the number of tasks handled.
std::size_t run_worker(QueueClient& client, const Module& module, const WorkerOptions& options,
                       const std::atomic<bool>& stop);

} // namespace nlpq
