#pragma once
#include <atomic>
#include <chrono>
#include <cstddef>
#include <iterator>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "errors.hpp"
#include "task.hpp"

namespace nlpq {

class QueueClient;

struct InlineOptions {
    std::chrono::milliseconds interval{100};
    std::optional<std::chrono::milliseconds> deadline;
    const std::atomic<bool>* cancel{nullptr};
};

struct BulkSubmitOptions {
    bool reset_error{false};
    bool reset_pending{false};
};

// Lazy single-pass sequence of claimed tasks; each element is claimed on demand.
class ClaimSequence {
public:
    ClaimSequence(QueueClient& client, std::string module, std::size_t limit);

    std::optional<Task> next();

    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Task;
        using difference_type = std::ptrdiff_t;
        using pointer = const Task*;
        using reference = const Task&;

        iterator() = default;
        explicit iterator(ClaimSequence* seq);

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }
        iterator& operator++();
        bool operator==(const iterator& other) const noexcept { return !current_ && !other.current_; }
        bool operator!=(const iterator& other) const noexcept { return !(*this == other); }

    private:
        ClaimSequence* seq_{nullptr};
        std::optional<Task> current_;
    };

    iterator begin() { return iterator(this); }
    iterator end() { return iterator(); }

private:
    QueueClient& client_;
    std::string module_;
    std::size_t remaining_;
};

// The queue contract shared by the filesystem and the HTTP backend.
class QueueClient {
public:
    virtual ~QueueClient() = default;

    // Creates a PENDING record unless the id is already known. Returns the id.
    virtual std::string submit(const std::string& module, const std::string& doc,
                               const std::optional<std::string>& id = std::nullopt) = 0;

    virtual TaskStatus status(const std::string& module, const std::string& id) = 0;

    virtual ResultReply result(const std::string& module, const std::string& id,
                               const std::optional<std::string>& format = std::nullopt) = 0;

    // Moves the oldest PENDING task to STARTED. Empty when nothing is pending.
    virtual std::optional<Task> claim(const std::string& module) = 0;

    // Both require the task to be STARTED, DONE or ERROR.
    virtual void store_result(const std::string& module, const std::string& id, const std::string& result) = 0;
    virtual void store_error(const std::string& module, const std::string& id, const std::string& error) = 0;

    virtual std::map<TaskStatus, std::size_t> statistics(const std::string& module) = 0;

    virtual std::map<std::string, TaskStatus> bulk_status(const std::string& module,
                                                          const std::vector<std::string>& ids);
    virtual std::map<std::string, ResultReply> bulk_result(const std::string& module,
                                                           const std::vector<std::string>& ids,
                                                           const std::optional<std::string>& format = std::nullopt);
    // `ids`, when non-empty, must correspond to `docs` one to one.
    virtual std::vector<std::string> bulk_submit(const std::string& module,
                                                 const std::vector<std::string>& docs,
                                                 const std::vector<std::string>& ids = {},
                                                 const BulkSubmitOptions& options = {});

    ClaimSequence claim_many(const std::string& module, std::size_t n);

    // Blocks until the document is processed, the deadline passes or the
    // cancel flag is raised.
    ResultReply process_inline(const std::string& module, const std::string& doc, const InlineOptions& options = {});

protected:
    // Replaces a PENDING or ERROR record with a fresh PENDING one. Used by the
    // default bulk_submit; backends that override bulk_submit need not provide it.
    virtual void requeue(const std::string& module, const std::string& id, const std::string& doc);
};

} // namespace nlpq
