#include "../include/fs_client.hpp"
#include "../include/log.hpp"
#include "../include/module.hpp"
#include "../include/task_id.hpp"
#include <algorithm>
#include <atomic>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <utility>
#include <vector>
#include <cerrno>
#include <cstdio>
#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace nlpq {

namespace {
const TaskStatus kStoredStates[] = {TaskStatus::Pending, TaskStatus::Started, TaskStatus::Done, TaskStatus::Error};

const char* container_name(TaskStatus status) {
    switch (status) {
        case TaskStatus::Pending: return "queue";
        case TaskStatus::Started: return "inprogress";
        case TaskStatus::Done: return "results";
        case TaskStatus::Error: return "errors";
        default: throw QueueError(ErrorKind::StorageError, "UNKNOWN has no container");
    }
}

void require_safe(const std::string& name, const char* what) {
    if (!is_safe_name(name)) {
        throw QueueError(ErrorKind::BadRequest, std::string("Invalid ") + what + ": '" + name + "'");
    }
}

QueueError storage_error(const std::string& what, const fs::path& path, const std::error_code& ec) {
    return QueueError(ErrorKind::StorageError, what + " " + path.string() + ": " + ec.message());
}

bool is_missing(const std::error_code& ec) {
    return ec == std::errc::no_such_file_or_directory;
}

// Atomic rename that refuses to replace an existing target.
enum class Move { Done, Exists, Missing };

Move move_exclusive(const fs::path& from, const fs::path& to) {
    if (::renameat2(AT_FDCWD, from.c_str(), AT_FDCWD, to.c_str(), RENAME_NOREPLACE) == 0) return Move::Done;
    int err = errno;
    if (err == EEXIST) return Move::Exists;
    if (err == ENOENT) return Move::Missing;
    throw storage_error("cannot move to", to, std::error_code(err, std::generic_category()));
}

std::string host_tag() {
    char buf[256] = {0};
    if (::gethostname(buf, sizeof(buf) - 1) != 0) return "host";
    return buf;
}
}

FsQueueClient::FsQueueClient(fs::path root, const ModuleRegistry* modules)
    : root_(std::move(root)), modules_(modules) {
    log_debug("queue", "filesystem queue at " + root_.string());
}

fs::path FsQueueClient::container(const std::string& module, TaskStatus status) const {
    return root_ / module / container_name(status);
}

fs::path FsQueueClient::staging(const std::string& module) const {
    return root_ / module / ".incoming";
}

void FsQueueClient::ensure_containers(const std::string& module) const {
    std::error_code ec;
    for (TaskStatus st : kStoredStates) {
        auto dir = container(module, st);
        fs::create_directories(dir, ec);
        if (ec) throw storage_error("cannot create", dir, ec);
    }
    fs::create_directories(staging(module), ec);
    if (ec) throw storage_error("cannot create", staging(module), ec);
}

fs::path FsQueueClient::scratch_path(const std::string& module, const std::string& id) const {
    static std::atomic<std::uint64_t> counter{0};
    static const std::string tag = host_tag() + "." + std::to_string(::getpid());
    return staging(module) / (id + "." + tag + "." + std::to_string(counter.fetch_add(1)));
}

fs::path FsQueueClient::stage(const std::string& module, const std::string& id, const std::string& content) const {
    ensure_containers(module);
    auto tmp = scratch_path(module, id);
    std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
    if (!f) {
        throw QueueError(ErrorKind::StorageError, "cannot open " + tmp.string());
    }
    f.write(content.data(), static_cast<std::streamsize>(content.size()));
    f.close();
    if (!f) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw QueueError(ErrorKind::StorageError, "cannot write " + tmp.string());
    }
    return tmp;
}

void FsQueueClient::write_record(const std::string& module, TaskStatus status, const std::string& id,
                                 const std::string& content) const {
    // Stage then rename, so readers never observe a partially written record.
    auto tmp = stage(module, id, content);
    std::error_code ec;
    auto target = container(module, status) / id;
    fs::rename(tmp, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw storage_error("cannot publish", target, ec);
    }
}

bool FsQueueClient::publish_pending(const std::string& module, const std::string& id, const std::string& doc) {
    auto tmp = stage(module, id, doc);
    Move moved = move_exclusive(tmp, container(module, TaskStatus::Pending) / id);
    if (moved != Move::Done) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        if (moved == Move::Missing) {
            throw QueueError(ErrorKind::StorageError, "staged record disappeared: " + tmp.string());
        }
        return false; // already pending
    }
    // A submitter that checked the status before another one published can
    // land here after the task moved on; its record is a stale duplicate.
    if (has_later_record(module, id)) {
        retract(module, TaskStatus::Pending, id);
        log_debug("queue", "dropped duplicate submission of " + module + "/" + id);
        return false;
    }
    return true;
}

bool FsQueueClient::has_record(const std::string& module, TaskStatus status, const std::string& id) const {
    std::error_code ec;
    auto path = container(module, status) / id;
    if (fs::exists(path, ec)) return true;
    if (ec && !is_missing(ec)) throw storage_error("cannot stat", path, ec);
    return false;
}

bool FsQueueClient::has_later_record(const std::string& module, const std::string& id) const {
    return has_record(module, TaskStatus::Started, id) || has_record(module, TaskStatus::Done, id) ||
           has_record(module, TaskStatus::Error, id);
}

bool FsQueueClient::retract(const std::string& module, TaskStatus status, const std::string& id) const {
    auto scratch = scratch_path(module, id);
    std::error_code ec;
    fs::rename(container(module, status) / id, scratch, ec);
    if (ec) {
        if (is_missing(ec)) return false;
        throw storage_error("cannot retract", container(module, status) / id, ec);
    }
    fs::remove(scratch, ec);
    if (ec && !is_missing(ec)) throw storage_error("cannot remove", scratch, ec);
    return true;
}

std::optional<std::string> FsQueueClient::read_record(const std::string& module, TaskStatus status,
                                                      const std::string& id) const {
    auto path = container(module, status) / id;
    std::ifstream f(path, std::ios::binary);
    if (!f) {
        std::error_code ec;
        if (!fs::exists(path, ec) && !ec) return std::nullopt;
        throw QueueError(ErrorKind::StorageError, "cannot read " + path.string());
    }
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

void FsQueueClient::remove_record(const std::string& module, TaskStatus status, const std::string& id) const {
    std::error_code ec;
    auto path = container(module, status) / id;
    fs::remove(path, ec);
    if (ec && !is_missing(ec)) throw storage_error("cannot remove", path, ec);
}

std::string FsQueueClient::submit(const std::string& module, const std::string& doc,
                                  const std::optional<std::string>& id) {
    require_safe(module, "module name");
    std::string tid = id ? *id : task_id(doc);
    require_safe(tid, "task id");
    if (status(module, tid) == TaskStatus::Unknown && publish_pending(module, tid, doc)) {
        log_debug("queue", "submitted " + module + "/" + tid);
    }
    return tid;
}

TaskStatus FsQueueClient::status(const std::string& module, const std::string& id) {
    if (!is_safe_name(module) || !is_safe_name(id)) return TaskStatus::Unknown;
    for (TaskStatus st : kStoredStates) {
        if (has_record(module, st, id)) return st;
    }
    return TaskStatus::Unknown;
}

ResultReply FsQueueClient::result(const std::string& module, const std::string& id,
                                  const std::optional<std::string>& format) {
    // A concurrent store may move the record between the lookup and the read.
    for (int attempt = 0; attempt < 3; ++attempt) {
        TaskStatus st = status(module, id);
        if (st == TaskStatus::Unknown) {
            return ResultReply::failure(ErrorKind::NotFound, "Unknown document: " + module + "/" + id);
        }
        if (!is_terminal(st)) {
            return ResultReply::failure(ErrorKind::NotReady, "Status of " + id + " is " + to_string(st));
        }
        auto content = read_record(module, st, id);
        if (!content) continue;
        if (st == TaskStatus::Error) {
            return ResultReply::failure(ErrorKind::ProcessingFailed, *content);
        }
        if (format) {
            if (!modules_) {
                throw QueueError(ErrorKind::UnknownModule, "No module registry to convert " + module + " results");
            }
            return ResultReply::success(modules_->get(module).convert(*content, *format));
        }
        return ResultReply::success(std::move(*content));
    }
    return ResultReply::failure(ErrorKind::NotFound, "Document " + module + "/" + id + " kept moving");
}

std::optional<Task> FsQueueClient::claim(const std::string& module) {
    require_safe(module, "module name");
    auto dir = container(module, TaskStatus::Pending);

    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        if (is_missing(ec)) return std::nullopt;
        throw storage_error("cannot list", dir, ec);
    }
    std::vector<std::pair<fs::file_time_type, std::string>> candidates;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) throw storage_error("cannot list", dir, ec);
        std::string name = it->path().filename().string();
        if (name.empty() || name.front() == '.') continue;
        std::error_code tec;
        auto written = it->last_write_time(tec);
        if (tec) continue; // claimed while listing
        candidates.emplace_back(written, std::move(name));
    }
    if (ec) throw storage_error("cannot list", dir, ec);
    if (candidates.empty()) return std::nullopt;

    ensure_containers(module);
    std::sort(candidates.begin(), candidates.end());
    for (const auto& candidate : candidates) {
        const std::string& id = candidate.second;
        auto target = container(module, TaskStatus::Started) / id;
        Move moved = move_exclusive(dir / id, target);
        if (moved == Move::Missing) {
            log_debug("queue", "lost claim race for " + module + "/" + id);
            continue;
        }
        if (moved == Move::Exists) {
            // Already in progress: the pending record is a duplicate.
            retract(module, TaskStatus::Pending, id);
            continue;
        }
        if (has_record(module, TaskStatus::Done, id) || has_record(module, TaskStatus::Error, id)) {
            // Finished before this record was published; undo the claim.
            remove_record(module, TaskStatus::Started, id);
            log_debug("queue", "dropped stale pending record " + module + "/" + id);
            continue;
        }
        auto doc = read_record(module, TaskStatus::Started, id);
        if (!doc) {
            throw QueueError(ErrorKind::StorageError, "claimed record disappeared: " + target.string());
        }
        log_debug("queue", "claimed " + module + "/" + id);
        return Task{id, std::move(*doc)};
    }
    return std::nullopt;
}

void FsQueueClient::store_outcome(const std::string& module, const std::string& id, TaskStatus target,
                                  const std::string& content) {
    require_safe(module, "module name");
    require_safe(id, "task id");
    TaskStatus st = status(module, id);
    if (st == TaskStatus::Unknown || st == TaskStatus::Pending) {
        throw QueueError(ErrorKind::InvalidTransition, std::string("Cannot store ") + to_string(target) +
                                                           " for task " + id + " with status " + to_string(st));
    }
    write_record(module, target, id, content);
    remove_record(module, TaskStatus::Started, id);
    remove_record(module, target == TaskStatus::Done ? TaskStatus::Error : TaskStatus::Done, id);
    log_debug("queue", "stored " + std::string(to_string(target)) + " for " + module + "/" + id);
}

void FsQueueClient::store_result(const std::string& module, const std::string& id, const std::string& result) {
    store_outcome(module, id, TaskStatus::Done, result);
}

void FsQueueClient::store_error(const std::string& module, const std::string& id, const std::string& error) {
    store_outcome(module, id, TaskStatus::Error, error);
}

void FsQueueClient::requeue(const std::string& module, const std::string& id, const std::string& doc) {
    require_safe(module, "module name");
    require_safe(id, "task id");
    TaskStatus st = status(module, id);
    if (st != TaskStatus::Pending && st != TaskStatus::Error) return;
    ensure_containers(module);
    // Take the old record away first; if it is gone a claimer or another
    // reset got there and the task is no longer ours to reset.
    if (!retract(module, st, id)) return;
    publish_pending(module, id, doc);
}

std::map<TaskStatus, std::size_t> FsQueueClient::statistics(const std::string& module) {
    require_safe(module, "module name");
    std::map<TaskStatus, std::size_t> counts;
    for (TaskStatus st : kStoredStates) {
        std::size_t n = 0;
        std::error_code ec;
        auto dir = container(module, st);
        fs::directory_iterator it(dir, ec);
        if (ec && !is_missing(ec)) throw storage_error("cannot list", dir, ec);
        if (!ec) {
            for (; it != fs::directory_iterator(); it.increment(ec)) {
                if (ec) throw storage_error("cannot list", dir, ec);
                auto name = it->path().filename().string();
                if (!name.empty() && name.front() != '.') ++n;
            }
        }
        counts[st] = n;
    }
    return counts;
}

} // namespace nlpq
