#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace realdb {

// Field name (lowercase) -> value. Always contains "id".
using record = std::unordered_map<std::string, value>;

// Row -> record
using table = std::unordered_map<row_t, record>;

// ============================================================================
// Filter predicates
// ============================================================================

enum class filter_predicate {
    equal,          // ==
    less,           // <
    less_equal,     // <=
    greater,        // >
    greater_equal   // >=
};

std::optional<filter_predicate> parse_predicate(std::string_view name);

const char* to_string(filter_predicate predicate);

/// predicate(field, operand). Operands of different kinds never match,
/// whatever the predicate.
bool matches(filter_predicate predicate, const value& field, const value& operand);

/// Lowercase a field name the way writes store it.
std::string fold_key(std::string_view key);

// ============================================================================
// Store - all tables, no locking of its own
// ============================================================================

class store {
public:
    /// Insert or overwrite `key` in (table, row), creating the table and the
    /// record on first write. A new record starts with "id" -> its identity;
    /// writes to "id" leave it untouched.
    void upsert(const std::string& table_name, row_t row, std::string_view key, value v);

    /// Rows of `table_name` holding a field `key` for which
    /// predicate(field, operand) holds. Linear scan, no index.
    std::vector<row_t> scan_filter(const std::string& table_name,
                                   std::string_view key,
                                   filter_predicate predicate,
                                   const value& operand) const;

    const table* find_table(const std::string& table_name) const;
    const record* find_record(const record_identity& id) const;

    /// Every row of `table_name`, in storage order. Empty for an unknown table.
    std::vector<row_t> rows(const std::string& table_name) const;

    size_t table_count() const { return tables_.size(); }
    size_t record_count() const;

private:
    std::unordered_map<std::string, table> tables_;
};

// ============================================================================
// Database - the store behind one process-wide exclusive lock
// ============================================================================

class database;

// RAII handle: holds the database lock for its whole lifetime
class locked_database {
public:
    locked_database(locked_database&&) = default;
    locked_database& operator=(locked_database&&) = default;

    locked_database(const locked_database&) = delete;
    locked_database& operator=(const locked_database&) = delete;

    store* operator->() { return store_; }
    const store* operator->() const { return store_; }
    store& operator*() { return *store_; }
    const store& operator*() const { return *store_; }

private:
    friend class database;
    locked_database(std::mutex& mutex, store& s) : lock_(mutex), store_(&s) {}

    std::unique_lock<std::mutex> lock_;
    store* store_;
};

class database {
public:
    database() = default;

    // Non-copyable, non-movable (handles point into it)
    database(const database&) = delete;
    database& operator=(const database&) = delete;

    /// Block until the lock is free and return a handle owning it.
    locked_database acquire() { return locked_database(mutex_, store_); }

private:
    std::mutex mutex_;
    store store_;
};

} // namespace realdb

#endif // __cplusplus
