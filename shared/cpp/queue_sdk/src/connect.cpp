#include "../include/connect.hpp"
#include "../include/fs_client.hpp"
#include "../include/http_client.hpp"
#include "../include/log.hpp"

namespace nlpq {

QueueAddress parse_address(const std::string& address) {
    if (address.rfind("http:", 0) == 0 || address.rfind("https:", 0) == 0) {
        return {Backend::Http, address};
    }
    return {Backend::Filesystem, address};
}

std::unique_ptr<QueueClient> connect(const QueueAddress& address, const ModuleRegistry* modules,
                                     long http_timeout_ms) {
    if (address.location.empty()) {
        throw QueueError(ErrorKind::BadRequest, "empty queue address");
    }
    switch (address.backend) {
        case Backend::Http:
            log_debug("queue", "Connecting to queue service at " + address.location);
            return std::make_unique<HttpQueueClient>(address.location, http_timeout_ms);
        case Backend::Filesystem:
        default:
            log_debug("queue", "Connecting to local repository " + address.location);
            return std::make_unique<FsQueueClient>(address.location, modules);
    }
}

std::unique_ptr<QueueClient> connect(const std::string& address, const ModuleRegistry* modules,
                                     long http_timeout_ms) {
    return connect(parse_address(address), modules, http_timeout_ms);
}

} // namespace nlpq
