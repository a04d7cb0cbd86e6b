#pragma once

#include <RealDBCore.hpp>
#include <realdb/configuration.hpp>
#include <realdb/http.hpp>
#include <realdb/response.hpp>
#include <realdb/scheduler.hpp>
#include <realdb/server.hpp>
#include <nlohmann/json.hpp>
#include <cassert>
#include <iostream>
#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <new>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <sys/time.h>
#include <unistd.h>
#include <cerrno>

namespace server_tests {

using json = nlohmann::json;

static void write_all(int fd, const std::string& bytes) {
    size_t written = 0;
    while (written < bytes.size()) {
        ssize_t n = ::write(fd, bytes.data() + written, bytes.size() - written);
        assert(n > 0);
        written += static_cast<size_t>(n);
    }
}

static std::string read_all(int fd) {
    std::string out;
    char buf[1024];
    while (true) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n <= 0) break;
        out.append(buf, static_cast<size_t>(n));
    }
    return out;
}

// Connect to 127.0.0.1:port, failing the test on error.
static int connect_local(uint16_t port) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    assert(fd >= 0);

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    int rc = ::connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr));
    assert(rc == 0);
    return fd;
}

// Holds tasks until the test runs them.
class deferred_scheduler : public realdb::scheduler {
public:
    void invoke(std::function<void()>&& fn) override {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks_.push_back(std::move(fn));
    }
    [[nodiscard]] bool is_on_thread() const noexcept override { return false; }
    [[nodiscard]] bool can_invoke() const noexcept override { return true; }

    size_t pending() {
        std::lock_guard<std::mutex> lock(mutex_);
        return tasks_.size();
    }

    void run_all() {
        std::vector<std::function<void()>> tasks;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            tasks.swap(tasks_);
        }
        for (auto& task : tasks) task();
    }

private:
    std::mutex mutex_;
    std::vector<std::function<void()>> tasks_;
};

// Accepts work and throws it away, like a pool that has shut down.
class discarding_scheduler : public realdb::scheduler {
public:
    void invoke(std::function<void()>&& fn) override {
        std::function<void()> dropped = std::move(fn);
        discarded_.fetch_add(1);
    }
    [[nodiscard]] bool is_on_thread() const noexcept override { return false; }
    [[nodiscard]] bool can_invoke() const noexcept override { return true; }

    int discarded() const { return discarded_.load(); }

private:
    std::atomic<int> discarded_{0};
};

// Send one query to 127.0.0.1:port and return the response body.
static std::string send_query(uint16_t port, const std::string& query) {
    int fd = connect_local(port);

    write_all(fd, "POST /query HTTP/1.1\r\nHost: localhost\r\n\r\n" + query + "\n");
    std::string response = read_all(fd);
    ::close(fd);

    assert(response.rfind("HTTP/1.1 200 OK\r\n", 0) == 0);
    auto split = response.find("\r\n\r\n");
    assert(split != std::string::npos);
    return response.substr(split + 4);
}

// ============================================================================
// test_request_framing: header block then single-line body
// ============================================================================

void test_request_framing() {
    std::cout << "  test_request_framing..." << std::flush;

    int fds[2];
    int ret = socketpair(AF_UNIX, SOCK_STREAM, 0, fds);
    assert(ret == 0);

    write_all(fds[0],
              "POST / HTTP/1.1\r\n"
              "Host: example\r\n"
              "X-Custom:   spaced   \r\n"
              "\r\n"
              "@t:1 \"k\" 5 set select\r\n"
              "this line is ignored\n");
    ::shutdown(fds[0], SHUT_WR);

    auto req = realdb::read_request(fds[1], 512);
    assert(req.has_value());
    assert(req->request_line == "POST / HTTP/1.1");
    assert(req->headers.at("host") == "example");
    assert(req->headers.at("x-custom") == "spaced");
    assert(req->body == "@t:1 \"k\" 5 set select");
    assert(!req->content_length());

    ::close(fds[0]);
    ::close(fds[1]);
    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_body_limits: max_body truncation and Content-Length
// ============================================================================

void test_body_limits() {
    std::cout << "  test_body_limits..." << std::flush;

    {
        int fds[2];
        assert(socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);
        write_all(fds[0], "POST / HTTP/1.1\r\n\r\n" + std::string(600, 'a'));
        ::shutdown(fds[0], SHUT_WR);

        auto req = realdb::read_request(fds[1], 512);
        assert(req.has_value());
        assert(req->body.size() == 512);
        ::close(fds[0]);
        ::close(fds[1]);
    }

    {
        int fds[2];
        assert(socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);
        write_all(fds[0], "POST / HTTP/1.1\r\nContent-Length: 5\r\n\r\nhello world\n");
        ::shutdown(fds[0], SHUT_WR);

        auto req = realdb::read_request(fds[1], 512);
        assert(req.has_value());
        assert(req->content_length() == size_t{5});
        assert(req->body == "hello");
        ::close(fds[0]);
        ::close(fds[1]);
    }

    {
        // Content-Length never raises the limit
        int fds[2];
        assert(socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);
        write_all(fds[0], "POST / HTTP/1.1\r\nContent-Length: 100\r\n\r\n" + std::string(20, 'b'));
        ::shutdown(fds[0], SHUT_WR);

        auto req = realdb::read_request(fds[1], 8);
        assert(req.has_value());
        assert(req->body == std::string(8, 'b'));
        ::close(fds[0]);
        ::close(fds[1]);
    }

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_truncated_headers: peer closes before the blank line
// ============================================================================

void test_truncated_headers() {
    std::cout << "  test_truncated_headers..." << std::flush;

    int fds[2];
    assert(socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);
    write_all(fds[0], "POST / HTTP/1.1\r\nHost: x\r\n");
    ::shutdown(fds[0], SHUT_WR);

    assert(!realdb::read_request(fds[1], 512).has_value());
    ::close(fds[0]);
    ::close(fds[1]);

    assert(socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);
    ::shutdown(fds[0], SHUT_WR);
    assert(!realdb::read_request(fds[1], 512).has_value());
    ::close(fds[0]);
    ::close(fds[1]);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_write_response: status line, headers, JSON body
// ============================================================================

void test_write_response() {
    std::cout << "  test_write_response..." << std::flush;

    std::string body = R"({"message":"OK","data":[]})";
    std::string expected = realdb::format_response(body);
    assert(expected.rfind("HTTP/1.1 200 OK\r\n", 0) == 0);
    assert(expected.find("Content-Type: application/json\r\n") != std::string::npos);
    assert(expected.find("Content-Length: " + std::to_string(body.size()) + "\r\n") != std::string::npos);
    assert(expected.size() >= body.size());
    assert(expected.compare(expected.size() - body.size(), body.size(), body) == 0);

    int fds[2];
    assert(socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);
    assert(realdb::write_response(fds[0], body));
    ::close(fds[0]);
    assert(read_all(fds[1]) == expected);
    ::close(fds[1]);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_render: success and error envelopes
// ============================================================================

void test_render() {
    std::cout << "  test_render..." << std::flush;

    realdb::database db;
    auto handle = db.acquire();
    handle->upsert("person", 1, "name", realdb::value("Ada \"the\" Countess\n"));
    handle->upsert("person", 1, "age", realdb::value(int64_t{36}));
    handle->upsert("person", 1, "height", realdb::value(1.65));
    handle->upsert("person", 1, "friend", realdb::value(realdb::record_identity("person", 2)));

    std::string text = realdb::render_records(handle, {realdb::record_identity("person", 1)});
    assert(text.rfind("{\"message\":\"OK\"", 0) == 0);

    auto j = json::parse(text);
    assert(j["message"] == "OK");
    assert(j["data"].size() == 1);
    const auto& rec = j["data"][0];
    assert(rec["id"] == "person:1");
    assert(rec["name"] == "Ada \"the\" Countess\n");
    assert(rec["age"] == 36);
    assert(rec["height"] == 1.65);
    assert(rec["friend"] == "person:2");

    // "id" leads every record
    auto ordered = realdb::render_record(*handle->find_record(realdb::record_identity("person", 1)));
    assert(ordered.begin().key() == "id");

    // Duplicated identities render twice
    j = json::parse(realdb::render_records(handle, {realdb::record_identity("person", 1),
                                                    realdb::record_identity("person", 1)}));
    assert(j["data"].size() == 2);

    j = json::parse(realdb::render_records(handle, {}));
    assert(j["data"].is_array() && j["data"].empty());

    std::string err = realdb::render_error("Table `x` not found");
    assert(err == R"({"message":"Table `x` not found"})");

    // Quotes in Text are escaped so the envelope stays valid JSON
    err = realdb::render_error("Key must be a string, got text \"a\"");
    assert(err == R"({"message":"Key must be a string, got text \"a\""})");
    assert(json::parse(err)["message"] == "Key must be a string, got text \"a\"");

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_handle_query: compile, run and render in one call
// ============================================================================

void test_handle_query() {
    std::cout << "  test_handle_query..." << std::flush;

    realdb::database db;
    realdb::row_generator rows(3);

    auto j = json::parse(realdb::handle_query("@t:1 \"k\" 5 set select", db, rows));
    assert(j["message"] == "OK");
    assert(j["data"][0]["k"] == 5);

    j = json::parse(realdb::handle_query("@t:999 select", db, rows));
    assert(j.size() == 1);
    assert(j["message"].get<std::string>().find("not found") != std::string::npos);

    j = json::parse(realdb::handle_query("range 2 do", db, rows));
    assert(j["message"].get<std::string>().find("unclosed") != std::string::npos);

    // An empty query is a valid empty program
    j = json::parse(realdb::handle_query("", db, rows));
    assert(j["message"] == "OK");
    assert(j["data"].empty());

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_configuration: JSON config file parsing
// ============================================================================

void test_configuration() {
    std::cout << "  test_configuration..." << std::flush;

    realdb::configuration defaults;
    assert(defaults.host == "127.0.0.1");
    assert(defaults.port == 7878);
    assert(defaults.max_body_bytes == 512);
    assert(defaults.effective_worker_count() >= 1);

    auto config = realdb::configuration::from_json(
        R"({"host": "0.0.0.0", "port": 9000, "workers": 3, "max_body_bytes": 1024,
            "backlog": 16, "log_level": "DEBUG", "unknown": true})");
    assert(config.host == "0.0.0.0");
    assert(config.port == 9000);
    assert(config.worker_count == 3);
    assert(config.effective_worker_count() == 3);
    assert(config.max_body_bytes == 1024);
    assert(config.backlog == 16);
    assert(config.level == realdb::log_level::debug);

    config = realdb::configuration::from_json("{}");
    assert(config.port == 7878);

    auto rejects = [](const std::string& text) {
        try {
            realdb::configuration::from_json(text);
        } catch (const realdb::config_error&) {
            return true;
        }
        return false;
    };
    assert(rejects("not json"));
    assert(rejects("[1, 2]"));
    assert(rejects(R"({"port": 70000})"));
    assert(rejects(R"({"port": "80"})"));
    assert(rejects(R"({"workers": -1})"));
    assert(rejects(R"({"log_level": "loud"})"));

    bool threw = false;
    try {
        realdb::configuration::from_json_file("/nonexistent/realdb.json");
    } catch (const realdb::config_error&) {
        threw = true;
    }
    assert(threw);

    assert(realdb::parse_log_level("Warning") == realdb::log_level::warn);
    assert(!realdb::parse_log_level("verbose"));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_worker_pool: every task runs, pending work drains on destruction
// ============================================================================

void test_worker_pool() {
    std::cout << "  test_worker_pool..." << std::flush;

    std::atomic<int> count{0};
    {
        auto pool = std::make_shared<realdb::worker_pool>(4);
        assert(pool->size() == 4);
        assert(pool->can_invoke());
        assert(!pool->is_on_thread());
        for (int i = 0; i < 100; ++i) {
            pool->invoke([&count] { count.fetch_add(1); });
        }
    }
    assert(count.load() == 100);

    realdb::immediate_scheduler immediate;
    int ran = 0;
    immediate.invoke([&ran] { ++ran; });
    assert(ran == 1);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_tcp_round_trip: live server on an ephemeral port
// ============================================================================

void test_tcp_round_trip() {
    std::cout << "  test_tcp_round_trip..." << std::flush;

    realdb::database db;
    realdb::row_generator rows;
    realdb::configuration config("127.0.0.1", 0);
    config.worker_count = 2;

    realdb::tcp_server server(config, db, rows);
    server.start();
    assert(server.is_listening());
    assert(server.port() != 0);

    auto j = json::parse(send_query(server.port(), "@person:1 \"name\" \"Ada\" set select"));
    assert(j["message"] == "OK");
    assert(j["data"][0]["id"] == "person:1");

    // State persists across connections
    j = json::parse(send_query(server.port(), "@person:_ select_all"));
    assert(j["data"].size() == 1);
    assert(j["data"][0]["name"] == "Ada");

    j = json::parse(send_query(server.port(), "@nobody:1 select_all"));
    assert(j["message"] == "Table `nobody` not found");

    server.stop();
    assert(!server.is_listening());

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_concurrent_clients: parallel writers all land
// ============================================================================

void test_concurrent_clients() {
    std::cout << "  test_concurrent_clients..." << std::flush;

    realdb::database db;
    realdb::row_generator rows;
    realdb::configuration config("127.0.0.1", 0);
    config.worker_count = 4;

    realdb::tcp_server server(config, db, rows);
    server.start();

    constexpr int client_count = 8;
    std::vector<std::thread> clients;
    std::atomic<int> ok{0};
    for (int i = 0; i < client_count; ++i) {
        clients.emplace_back([&, i] {
            auto body = send_query(server.port(),
                                   "@t:" + std::to_string(i + 1) + " \"k\" " + std::to_string(i) + " set select");
            if (json::parse(body)["message"] == "OK") ok.fetch_add(1);
        });
    }
    for (auto& c : clients) c.join();
    server.stop();

    assert(ok.load() == client_count);
    assert(db.acquire()->record_count() == static_cast<size_t>(client_count));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_guard_query: every exception becomes an error envelope
// ============================================================================

void test_guard_query() {
    std::cout << "  test_guard_query..." << std::flush;

    assert(realdb::guard_query([] { return std::string("payload"); }) == "payload");

    auto j = json::parse(realdb::guard_query([]() -> std::string {
        throw realdb::execution_error("Record t:1 not found");
    }));
    assert(j["message"] == "Record t:1 not found");

    // Resource exhaustion inside a query must not escape to the worker thread
    j = json::parse(realdb::guard_query([]() -> std::string { throw std::bad_alloc(); }));
    assert(j.size() == 1);
    assert(!j["message"].get<std::string>().empty());

    j = json::parse(realdb::guard_query([]() -> std::string {
        throw std::length_error("vector too long");
    }));
    assert(j["message"] == "vector too long");

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_queued_connection_outlives_server: handed-off work owns its state
// ============================================================================

void test_queued_connection_outlives_server() {
    std::cout << "  test_queued_connection_outlives_server..." << std::flush;

    realdb::database db;
    realdb::row_generator rows;
    auto sched = std::make_shared<deferred_scheduler>();

    int client = -1;
    {
        realdb::tcp_server server(realdb::configuration("127.0.0.1", 0), db, rows, sched);
        server.start();

        client = connect_local(server.port());
        write_all(client, "POST / HTTP/1.1\r\n\r\n@t:1 \"k\" 5 set select\n");

        for (int i = 0; i < 500 && sched->pending() == 0; ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        assert(sched->pending() == 1);
    }

    // The server is gone; the queued connection is still served
    sched->run_all();
    std::string response = read_all(client);
    ::close(client);

    auto split = response.find("\r\n\r\n");
    assert(split != std::string::npos);
    auto j = json::parse(response.substr(split + 4));
    assert(j["message"] == "OK");
    assert(j["data"][0]["k"] == 5);
    assert(db.acquire()->record_count() == 1);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_discarded_connection_is_closed: dropped work releases the socket
// ============================================================================

void test_discarded_connection_is_closed() {
    std::cout << "  test_discarded_connection_is_closed..." << std::flush;

    realdb::database db;
    realdb::row_generator rows;
    auto sched = std::make_shared<discarding_scheduler>();

    realdb::tcp_server server(realdb::configuration("127.0.0.1", 0), db, rows, sched);
    server.start();

    int client = connect_local(server.port());
    struct timeval timeout{};
    timeout.tv_sec = 5;
    ::setsockopt(client, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));

    // EOF (0), not a receive timeout (-1): the server closed its end
    char byte = 0;
    ssize_t n = ::read(client, &byte, 1);
    assert(n == 0);
    assert(sched->discarded() == 1);

    ::close(client);
    server.stop();

    std::cout << " OK" << std::endl;
}

// ============================================================================
// Run all server tests
// ============================================================================

void run_all() {
    std::cout << std::endl;
    std::cout << "--- Server Tests ---" << std::endl;

    test_request_framing();
    test_body_limits();
    test_truncated_headers();
    test_write_response();
    test_render();
    test_handle_query();
    test_configuration();
    test_worker_pool();
    test_tcp_round_trip();
    test_concurrent_clients();
    test_guard_query();
    test_queued_connection_outlives_server();
    test_discarded_connection_is_closed();

    std::cout << "--- Server Tests: All passed ---" << std::endl;
}

} // namespace server_tests
