#include "realdb/server.hpp"
#include "realdb/compiler.hpp"
#include "realdb/http.hpp"
#include "realdb/log.hpp"
#include "realdb/response.hpp"
#include "realdb/vm.hpp"

#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <stdexcept>

namespace realdb {

// ============================================================================
// Query handling
// ============================================================================

std::string guard_query(const std::function<std::string()>& fn) {
    try {
        return fn();
    } catch (const query_error& e) {
        LOG_WARN("query", "%s", e.what());
        return render_error(e.what());
    } catch (const std::exception& e) {
        LOG_ERROR("query", "query aborted: %s", e.what());
        return render_error(e.what());
    }
}

std::string handle_query(std::string_view text, database& db, row_generator& rows) {
    LOG_DEBUG("query", "%.*s", static_cast<int>(text.size()), text.data());
    return guard_query([&] {
        // Lexing and compiling need no shared state beyond the row generator
        program prog = compile(text, rows);

        auto handle = db.acquire();
        result_set ids = execute(handle, prog);
        return render_records(handle, ids);
    });
}

namespace {

// Client socket owned by the task serving it. Closed when the task finishes
// or when a scheduler discards the task without running it.
class connection {
public:
    explicit connection(int fd) : fd_(fd) {}
    ~connection() {
        ::shutdown(fd_, SHUT_WR);
        ::close(fd_);
    }

    connection(const connection&) = delete;
    connection& operator=(const connection&) = delete;

    int fd() const { return fd_; }

private:
    int fd_;
};

void serve_connection(const connection& conn, size_t max_body, database& db, row_generator& rows) {
    auto req = read_request(conn.fd(), max_body);
    if (!req) return;
    std::string payload = handle_query(req->body, db, rows);
    if (!write_response(conn.fd(), payload)) {
        LOG_WARN("tcp_server", "failed to write response on fd=%d", conn.fd());
    }
}

} // namespace

// ============================================================================
// tcp_server implementation
// ============================================================================

tcp_server::tcp_server(const configuration& config, database& db, row_generator& rows)
    : tcp_server(config, db, rows, std::make_shared<worker_pool>(config.effective_worker_count())) {}

tcp_server::tcp_server(const configuration& config, database& db, row_generator& rows,
                       SharedScheduler sched)
    : config_(config)
    , db_(db)
    , rows_(rows)
    , sched_(std::move(sched)) {}

tcp_server::~tcp_server() {
    stop();
}

void tcp_server::start() {
    if (is_listening_) return;

    listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (listen_fd_ < 0) {
        throw std::runtime_error("tcp_server: socket() failed: " + std::string(strerror(errno)));
    }

    int reuse = 1;
    ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(config_.port);
    if (::inet_pton(AF_INET, config_.host.c_str(), &addr.sin_addr) != 1) {
        ::close(listen_fd_);
        listen_fd_ = -1;
        throw std::runtime_error("tcp_server: invalid IPv4 address: " + config_.host);
    }

    if (::bind(listen_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        int err = errno;
        ::close(listen_fd_);
        listen_fd_ = -1;
        throw std::runtime_error("tcp_server: bind() failed: " + std::string(strerror(err)));
    }

    if (::listen(listen_fd_, config_.backlog) < 0) {
        int err = errno;
        ::close(listen_fd_);
        listen_fd_ = -1;
        throw std::runtime_error("tcp_server: listen() failed: " + std::string(strerror(err)));
    }

    struct sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (::getsockname(listen_fd_, reinterpret_cast<struct sockaddr*>(&bound), &len) == 0) {
        port_ = ntohs(bound.sin_port);
    } else {
        port_ = config_.port;
    }

    is_listening_ = true;
    should_stop_ = false;

    accept_thread_ = std::thread([this]() {
        LOG_DEBUG("tcp_server", "Accept thread started on %s:%u", config_.host.c_str(), unsigned(port_));
        while (!should_stop_) {
            int client_fd = ::accept(listen_fd_, nullptr, nullptr);
            if (client_fd < 0) {
                if (should_stop_ || errno == EBADF || errno == EINVAL) break;
                LOG_DEBUG("tcp_server", "accept() error: %s", strerror(errno));
                continue;
            }
            LOG_DEBUG("tcp_server", "Accepted client fd=%d", client_fd);
            if (!sched_->can_invoke()) {
                ::close(client_fd);
                continue;
            }
            // The task must not touch `this`: it may run after the server is gone
            auto conn = std::make_shared<connection>(client_fd);
            sched_->invoke([conn, max_body = config_.max_body_bytes, db = &db_, rows = &rows_] {
                serve_connection(*conn, max_body, *db, *rows);
            });
        }
        LOG_DEBUG("tcp_server", "Accept thread exiting");
    });

    LOG_INFO("tcp_server", "Listening on %s:%u", config_.host.c_str(), unsigned(port_));
}

void tcp_server::stop() {
    if (!is_listening_ && listen_fd_ < 0) return;

    should_stop_ = true;
    is_listening_ = false;

    if (listen_fd_ >= 0) {
        ::shutdown(listen_fd_, SHUT_RDWR);
        ::close(listen_fd_);
        listen_fd_ = -1;
    }

    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
    LOG_INFO("tcp_server", "Stopped");
}

} // namespace realdb
