#include "../include/queue_client.hpp"
#include "../include/log.hpp"
#include "../include/task_id.hpp"
#include <algorithm>
#include <thread>

namespace nlpq {

ClaimSequence::ClaimSequence(QueueClient& client, std::string module, std::size_t limit)
    : client_(client), module_(std::move(module)), remaining_(limit) {}

std::optional<Task> ClaimSequence::next() {
    if (remaining_ == 0) return std::nullopt;
    auto task = client_.claim(module_);
    // A drained queue ends the sequence even if the limit was not reached.
    remaining_ = task ? remaining_ - 1 : 0;
    return task;
}

ClaimSequence::iterator::iterator(ClaimSequence* seq) : seq_(seq), current_(seq->next()) {}

ClaimSequence::iterator& ClaimSequence::iterator::operator++() {
    current_ = seq_ ? seq_->next() : std::nullopt;
    return *this;
}

ClaimSequence QueueClient::claim_many(const std::string& module, std::size_t n) {
    return ClaimSequence(*this, module, n);
}

std::map<std::string, TaskStatus> QueueClient::bulk_status(const std::string& module,
                                                           const std::vector<std::string>& ids) {
    std::map<std::string, TaskStatus> out;
    for (const auto& id : ids) out[id] = status(module, id);
    return out;
}

std::map<std::string, ResultReply> QueueClient::bulk_result(const std::string& module,
                                                            const std::vector<std::string>& ids,
                                                            const std::optional<std::string>& format) {
    std::map<std::string, ResultReply> out;
    for (const auto& id : ids) out[id] = result(module, id, format);
    return out;
}

std::vector<std::string> QueueClient::bulk_submit(const std::string& module,
                                                  const std::vector<std::string>& docs,
                                                  const std::vector<std::string>& ids,
                                                  const BulkSubmitOptions& options) {
    if (!ids.empty() && ids.size() != docs.size()) {
        throw QueueError(ErrorKind::BadRequest, "bulk submit: " + std::to_string(ids.size()) + " ids for " +
                                                    std::to_string(docs.size()) + " documents");
    }
    std::vector<std::string> out;
    out.reserve(docs.size());
    for (std::size_t i = 0; i < docs.size(); ++i) {
        std::string id = ids.empty() ? task_id(docs[i]) : ids[i];
        TaskStatus st = status(module, id);
        if ((options.reset_error && st == TaskStatus::Error) ||
            (options.reset_pending && st == TaskStatus::Pending)) {
            log_debug("queue", "requeue " + module + "/" + id + " (was " + to_string(st) + ")");
            requeue(module, id, docs[i]);
        } else if (st == TaskStatus::Unknown) {
            submit(module, docs[i], id);
        }
        out.push_back(std::move(id));
    }
    return out;
}

void QueueClient::requeue(const std::string& module, const std::string& id, const std::string& /*doc*/) {
    throw QueueError(ErrorKind::BadRequest, "this backend cannot reset " + module + "/" + id);
}

ResultReply QueueClient::process_inline(const std::string& module, const std::string& doc,
                                        const InlineOptions& options) {
    const auto started = std::chrono::steady_clock::now();
    std::string id = task_id(doc);
    if (status(module, id) == TaskStatus::Unknown) {
        submit(module, doc);
    }
    while (true) {
        if (is_terminal(status(module, id))) {
            return result(module, id);
        }
        if (options.cancel && options.cancel->load()) {
            return ResultReply::failure(ErrorKind::Timeout, "cancelled while waiting for " + module + "/" + id);
        }
        auto wait = options.interval;
        if (options.deadline) {
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started);
            if (elapsed >= *options.deadline) {
                return ResultReply::failure(ErrorKind::Timeout, "no result for " + module + "/" + id + " after " +
                                                                    std::to_string(elapsed.count()) + " ms");
            }
            wait = std::min(wait, *options.deadline - elapsed);
        }
        std::this_thread::sleep_for(wait);
    }
}

} // namespace nlpq
