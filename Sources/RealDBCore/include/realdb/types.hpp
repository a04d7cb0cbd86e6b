#pragma once

#ifdef __cplusplus

#include <cstdint>
#include <string>
#include <vector>
#include <variant>
#include <random>
#include <mutex>
#include <stdexcept>
#include <tuple>

namespace realdb {

// Row number inside a table
using row_t = uint64_t;

// ============================================================================
// Errors
// ============================================================================

// Base of every error a query can raise (compile or execution).
class query_error : public std::runtime_error {
public:
    explicit query_error(const std::string& msg) : std::runtime_error(msg) {}
};

// ============================================================================
// Record identity: (table_name, row)
// ============================================================================

struct record_identity {
    std::string table;
    row_t row = 0;

    record_identity() = default;
    record_identity(std::string t, row_t r) : table(std::move(t)), row(r) {}

    // "table:row", the form used on the wire
    std::string to_string() const {
        return table + ":" + std::to_string(row);
    }

    bool operator==(const record_identity& other) const {
        return row == other.row && table == other.table;
    }
    bool operator!=(const record_identity& other) const { return !(*this == other); }

    bool operator<(const record_identity& other) const {
        return std::tie(table, row) < std::tie(other.table, other.row);
    }
};

// ============================================================================
// Value - tagged union stored in record fields and on the VM stack
// ============================================================================

enum class value_kind : int {
    identity = 0,
    integer = 1,
    real = 2,
    text = 3
};

const char* to_string(value_kind kind);

struct value {
    using value_type = std::variant<
        record_identity,  // identity
        int64_t,          // integer
        double,           // real
        std::string       // text
    >;

    value_type data = int64_t{0};

    value() = default;
    value(record_identity v) : data(std::move(v)) {}
    value(int64_t v) : data(v) {}
    value(int v) : data(static_cast<int64_t>(v)) {}
    value(double v) : data(v) {}
    value(const std::string& v) : data(v) {}
    value(std::string&& v) : data(std::move(v)) {}
    value(const char* v) : data(std::string(v)) {}

    value_kind kind() const { return static_cast<value_kind>(data.index()); }

    bool is_identity() const { return std::holds_alternative<record_identity>(data); }
    bool is_integer() const { return std::holds_alternative<int64_t>(data); }
    bool is_real() const { return std::holds_alternative<double>(data); }
    bool is_text() const { return std::holds_alternative<std::string>(data); }

    const record_identity& as_identity() const { return std::get<record_identity>(data); }
    int64_t as_integer() const { return std::get<int64_t>(data); }
    double as_real() const { return std::get<double>(data); }
    const std::string& as_text() const { return std::get<std::string>(data); }

    // Debug rendering: @t:1, 42, 1.5, "text"
    std::string to_string() const;

    // Values of different kinds are never equal.
    bool operator==(const value& other) const { return data == other.data; }
    bool operator!=(const value& other) const { return !(*this == other); }
};

std::string to_string(const std::vector<value>& stack);

// ============================================================================
// Row generator - process-wide source of rows for `@table:_` literals
// ============================================================================

class row_generator {
public:
    // Seeded once from std::random_device
    row_generator() : engine_(std::random_device{}()) {}

    // Deterministic sequence (tests)
    explicit row_generator(uint64_t seed) : engine_(seed) {}

    row_generator(const row_generator&) = delete;
    row_generator& operator=(const row_generator&) = delete;

    row_t next() {
        std::lock_guard<std::mutex> lock(mutex_);
        return dist_(engine_);
    }

private:
    std::mutex mutex_;
    std::mt19937_64 engine_;
    std::uniform_int_distribution<row_t> dist_;
};

} // namespace realdb

#endif // __cplusplus
