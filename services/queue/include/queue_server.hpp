#pragma once
#include <string>

struct MHD_Daemon;
class QueueApi;

// libmicrohttpd front end for QueueApi.
class QueueServer {
public:
    explicit QueueServer(QueueApi& api);
    ~QueueServer();

    QueueServer(const QueueServer&) = delete;
    QueueServer& operator=(const QueueServer&) = delete;

    // Port 0 binds an ephemeral port, see port().
    bool start(const std::string& host, int port);
    void stop() noexcept;
    int port() const noexcept { return port_; }
    bool running() const noexcept { return daemon_ != nullptr; }

private:
    QueueApi& api_;
    MHD_Daemon* daemon_{nullptr};
    int port_{0};
};
