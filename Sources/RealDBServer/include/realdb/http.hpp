#pragma once

#ifdef __cplusplus

#include <cstddef>
#include <map>
#include <optional>
#include <string>

namespace realdb {

// ============================================================================
// HTTP-like request framing
// ============================================================================
//
// A request is a request line, header lines, a blank line, then a single-line
// query body of at most `max_body` bytes. Headers are only consulted for
// Content-Length; everything else is read and discarded.

struct request {
    std::string request_line;
    std::map<std::string, std::string> headers;  // lowercase names
    std::string body;

    std::optional<size_t> content_length() const;
};

/// Buffered reader over a socket file descriptor.
class request_reader {
public:
    explicit request_reader(int fd) : fd_(fd) {}

    /// Next line without its "\n" or "\r\n". nullopt on EOF or error before
    /// any byte of the line was read; a final unterminated line is returned.
    std::optional<std::string> read_line();

    /// Up to `limit` bytes, stopping early at a newline (not included) or EOF.
    std::string read_body(size_t limit);

private:
    bool fill();

    int fd_;
    std::string buffer_;
    size_t pos_ = 0;
    bool eof_ = false;
};

/// Read one request. nullopt if the peer closed before the header block ended.
std::optional<request> read_request(int fd, size_t max_body);

/// Write a 200 response carrying `json`. Returns false on a write failure.
bool write_response(int fd, const std::string& json);

/// The full response bytes written by write_response().
std::string format_response(const std::string& json);

} // namespace realdb

#endif // __cplusplus
