#pragma once
#include <cstdint>
#include <memory>
#include <string>

#include "queue_client.hpp"

namespace nlpq {

class ModuleRegistry;

enum class Backend : std::uint8_t { Filesystem, Http };

struct QueueAddress {
    Backend backend{Backend::Filesystem};
    std::string location;
};

// "http://..." or "https://..." select the remote backend, anything else is a directory.
QueueAddress parse_address(const std::string& address);

std::unique_ptr<QueueClient> connect(const QueueAddress& address, const ModuleRegistry* modules = nullptr,
                                     long http_timeout_ms = 30000);
std::unique_ptr<QueueClient> connect(const std::string& address, const ModuleRegistry* modules = nullptr,
                                     long http_timeout_ms = 30000);

} // namespace nlpq
