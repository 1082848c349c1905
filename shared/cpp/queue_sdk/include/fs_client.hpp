#pragma once
#include <filesystem>
#include <optional>
#include <string>

#include "queue_client.hpp"

namespace nlpq {

class ModuleRegistry;

// Queue backed by a (possibly shared) directory tree. One directory per
// (module, state); a task's state is the directory that holds its record.
class FsQueueClient final : public QueueClient {
public:
    explicit FsQueueClient(std::filesystem::path root, const ModuleRegistry* modules = nullptr);

    std::string submit(const std::string& module, const std::string& doc,
                       const std::optional<std::string>& id = std::nullopt) override;
    TaskStatus status(const std::string& module, const std::string& id) override;
    ResultReply result(const std::string& module, const std::string& id,
                       const std::optional<std::string>& format = std::nullopt) override;
    std::optional<Task> claim(const std::string& module) override;
    void store_result(const std::string& module, const std::string& id, const std::string& result) override;
    void store_error(const std::string& module, const std::string& id, const std::string& error) override;
    std::map<TaskStatus, std::size_t> statistics(const std::string& module) override;

    const std::filesystem::path& root() const noexcept { return root_; }

protected:
    void requeue(const std::string& module, const std::string& id, const std::string& doc) override;

private:
    std::filesystem::path container(const std::string& module, TaskStatus status) const;
    std::filesystem::path staging(const std::string& module) const;
    void ensure_containers(const std::string& module) const;

    std::filesystem::path scratch_path(const std::string& module, const std::string& id) const;
    std::filesystem::path stage(const std::string& module, const std::string& id, const std::string& content) const;
    void write_record(const std::string& module, TaskStatus status, const std::string& id,
                      const std::string& content) const;
    std::optional<std::string> read_record(const std::string& module, TaskStatus status,
                                           const std::string& id) const;
    // Publishes a PENDING record unless the id already has one or has moved past it.
    bool publish_pending(const std::string& module, const std::string& id, const std::string& doc);
    bool has_record(const std::string& module, TaskStatus status, const std::string& id) const;
    bool has_later_record(const std::string& module, const std::string& id) const;
    bool retract(const std::string& module, TaskStatus status, const std::string& id) const;
    void remove_record(const std::string& module, TaskStatus status, const std::string& id) const;
    void store_outcome(const std::string& module, const std::string& id, TaskStatus target,
                       const std::string& content);

    std::filesystem::path root_;
    const ModuleRegistry* modules_;
};

} // namespace nlpq
