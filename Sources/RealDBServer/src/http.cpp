#include "realdb/http.hpp"
#include "realdb/log.hpp"

#include <sys/socket.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <cstring>

namespace realdb {

namespace {

constexpr size_t read_chunk = 4096;

std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t");
    if (begin == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t");
    return s.substr(begin, end - begin + 1);
}

std::string lowercase(std::string s) {
    for (char& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

} // namespace

std::optional<size_t> request::content_length() const {
    auto it = headers.find("content-length");
    if (it == headers.end()) return std::nullopt;
    size_t n = 0;
    const auto& text = it->second;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), n);
    if (ec != std::errc() || ptr != text.data() + text.size()) return std::nullopt;
    return n;
}

// ============================================================================
// request_reader
// ============================================================================

bool request_reader::fill() {
    if (eof_) return false;
    if (pos_ > 0) {
        buffer_.erase(0, pos_);
        pos_ = 0;
    }
    char chunk[read_chunk];
    while (true) {
        ssize_t n = ::read(fd_, chunk, sizeof(chunk));
        if (n > 0) {
            buffer_.append(chunk, static_cast<size_t>(n));
            return true;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0) {
            LOG_DEBUG("http", "read() failed: %s", strerror(errno));
        }
        eof_ = true;
        return false;
    }
}

std::optional<std::string> request_reader::read_line() {
    while (true) {
        size_t nl = buffer_.find('\n', pos_);
        if (nl != std::string::npos) {
            std::string line = buffer_.substr(pos_, nl - pos_);
            pos_ = nl + 1;
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return line;
        }
        if (!fill()) {
            if (pos_ >= buffer_.size()) return std::nullopt;
            std::string line = buffer_.substr(pos_);
            pos_ = buffer_.size();
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return line;
        }
    }
}

std::string request_reader::read_body(size_t limit) {
    std::string body;
    while (body.size() < limit) {
        if (pos_ >= buffer_.size() && !fill()) break;

        size_t available = std::min(buffer_.size() - pos_, limit - body.size());
        size_t nl = buffer_.find('\n', pos_);
        if (nl != std::string::npos && nl < pos_ + available) {
            body.append(buffer_, pos_, nl - pos_);
            pos_ = nl + 1;
            break;
        }
        body.append(buffer_, pos_, available);
        pos_ += available;
    }
    if (!body.empty() && body.back() == '\r') body.pop_back();
    return body;
}

// ============================================================================
// Requests and responses
// ============================================================================

std::optional<request> read_request(int fd, size_t max_body) {
    request_reader reader(fd);
    request req;

    auto first = reader.read_line();
    if (!first) return std::nullopt;
    req.request_line = *first;

    while (true) {
        auto line = reader.read_line();
        if (!line) {
            LOG_DEBUG("http", "connection closed inside header block");
            return std::nullopt;
        }
        if (line->empty()) break;

        auto colon = line->find(':');
        if (colon == std::string::npos) continue;
        req.headers[lowercase(trim(line->substr(0, colon)))] = trim(line->substr(colon + 1));
    }

    size_t limit = max_body;
    if (auto length = req.content_length()) {
        limit = std::min(limit, *length);
    }
    req.body = reader.read_body(limit);
    return req;
}

std::string format_response(const std::string& json) {
    std::string out;
    out.reserve(json.size() + 128);
    out += "HTTP/1.1 200 OK\r\n";
    out += "Content-Type: application/json\r\n";
    out += "Content-Length: " + std::to_string(json.size()) + "\r\n";
    out += "Connection: close\r\n";
    out += "\r\n";
    out += json;
    return out;
}

bool write_response(int fd, const std::string& json) {
    std::string bytes = format_response(json);
    size_t written = 0;
    while (written < bytes.size()) {
        ssize_t n = ::send(fd, bytes.data() + written, bytes.size() - written, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            LOG_DEBUG("http", "send() failed: %s", strerror(errno));
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

} // namespace realdb
