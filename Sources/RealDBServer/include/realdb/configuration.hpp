#pragma once

#ifdef __cplusplus

#include "realdb/log.hpp"
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace realdb {

class config_error : public std::runtime_error {
public:
    explicit config_error(const std::string& msg) : std::runtime_error(msg) {}
};

// ============================================================================
// Server configuration
// ============================================================================

struct configuration {
    /// Address to bind. "0.0.0.0" listens on every interface.
    std::string host = "127.0.0.1";

    /// TCP port. 0 = let the kernel pick one (see tcp_server::port()).
    uint16_t port = 7878;

    /// Worker threads serving connections. 0 = hardware concurrency.
    size_t worker_count = 0;

    /// Largest query body read from a request; longer bodies are truncated.
    size_t max_body_bytes = 512;

    /// listen() backlog
    int backlog = 64;

    log_level level = log_level::info;

    configuration() = default;

    configuration(const std::string& h, uint16_t p) : host(h), port(p) {}

    /// Worker count with 0 resolved to the number of hardware threads (at least 1)
    size_t effective_worker_count() const;

    /// Read a JSON object such as
    ///   {"host": "0.0.0.0", "port": 7878, "workers": 8,
    ///    "max_body_bytes": 512, "backlog": 64, "log_level": "debug"}
    /// Missing keys keep their defaults, unknown keys are ignored.
    /// Throws config_error on unreadable files, bad JSON or wrong types.
    static configuration from_json(const std::string& text);
    static configuration from_json_file(const std::string& path);
};

} // namespace realdb

#endif // __cplusplus
