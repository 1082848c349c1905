#pragma once
#include <string>

#include "http.hpp"
#include "queue_client.hpp"

namespace nlpq {

constexpr const char* kErrorContentType = "application/prs.error+text";

// Queue backed by a remote queue service. One round trip per operation.
class HttpQueueClient final : public QueueClient {
public:
    explicit HttpQueueClient(std::string base_url, long timeout_ms = 30000);

    std::string submit(const std::string& module, const std::string& doc,
                       const std::optional<std::string>& id = std::nullopt) override;
    TaskStatus status(const std::string& module, const std::string& id) override;
    ResultReply result(const std::string& module, const std::string& id,
                       const std::optional<std::string>& format = std::nullopt) override;
    std::optional<Task> claim(const std::string& module) override;
    void store_result(const std::string& module, const std::string& id, const std::string& result) override;
    void store_error(const std::string& module, const std::string& id, const std::string& error) override;
    std::map<TaskStatus, std::size_t> statistics(const std::string& module) override;

    std::map<std::string, TaskStatus> bulk_status(const std::string& module,
                                                  const std::vector<std::string>& ids) override;
    std::map<std::string, ResultReply> bulk_result(const std::string& module,
                                                   const std::vector<std::string>& ids,
                                                   const std::optional<std::string>& format = std::nullopt) override;
    std::vector<std::string> bulk_submit(const std::string& module,
                                         const std::vector<std::string>& docs,
                                         const std::vector<std::string>& ids = {},
                                         const BulkSubmitOptions& options = {}) override;

    const std::string& base_url() const noexcept { return base_; }

private:
    std::string module_url(const std::string& module) const;
    std::string task_url(const std::string& module, const std::string& id) const;
    HttpResponse send(const std::string& method, const std::string& url, const std::string& body = {},
                      const std::string& content_type = {}) const;
    void store(const std::string& module, const std::string& id, const std::string& body,
               const std::string& content_type);

    std::string base_;
    long timeout_ms_;
};

} // namespace nlpq
