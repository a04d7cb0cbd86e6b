#pragma once

#ifdef __cplusplus

#include "realdb/configuration.hpp"
#include "realdb/scheduler.hpp"
#include "realdb/storage.hpp"
#include "realdb/types.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <thread>

namespace realdb {

/// Run `fn` and return its payload. A query_error, or any other
/// std::exception escaping it, comes back as an error envelope instead.
std::string guard_query(const std::function<std::string()>& fn);

/// Compile `text` (no lock held), then run it and render the result while
/// holding the database lock. Never throws; failures are error envelopes.
std::string handle_query(std::string_view text, database& db, row_generator& rows);

// ============================================================================
// TCP server: listens on host:port, hands each connection to a scheduler
// ============================================================================

class tcp_server {
public:
    /// Serve on a worker_pool sized from config.
    tcp_server(const configuration& config, database& db, row_generator& rows);

    /// Serve on a caller-provided scheduler.
    tcp_server(const configuration& config, database& db, row_generator& rows,
               SharedScheduler sched);

    ~tcp_server();

    // Non-copyable
    tcp_server(const tcp_server&) = delete;
    tcp_server& operator=(const tcp_server&) = delete;

    /// Bind, listen and start the accept thread. Throws std::runtime_error
    /// if the socket cannot be set up.
    void start();

    /// Stop accepting and close the listen socket. Connections already handed
    /// to the scheduler finish normally, even after the server is destroyed;
    /// `db` and `rows` must outlive them.
    void stop();

    /// Returns true if the server is currently listening.
    bool is_listening() const { return is_listening_.load(); }

    /// The bound port (resolves port 0 after start()).
    uint16_t port() const { return port_; }

    const configuration& config() const { return config_; }

private:
    configuration config_;
    database& db_;
    row_generator& rows_;
    SharedScheduler sched_;
    int listen_fd_ = -1;
    uint16_t port_ = 0;
    std::atomic<bool> is_listening_{false};
    std::atomic<bool> should_stop_{false};
    std::thread accept_thread_;
};

} // namespace realdb

#endif // __cplusplus
