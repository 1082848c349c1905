#pragma once
#include <cstddef>
#include <string>

namespace nlpq {

// Task ids look like "0x" + 32 lowercase hex digits (an MD5 of the document).
constexpr std::size_t kTaskIdLength = 34;

bool looks_like_task_id(const std::string& value) noexcept;

// Returns `doc` unchanged if it already looks like a task id, otherwise the
// content hash of its bytes.
std::string task_id(const std::string& doc);

// True if `name` can be used as a single storage path segment.
bool is_safe_name(const std::string& name) noexcept;

} // namespace nlpq
