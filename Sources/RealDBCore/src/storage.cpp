#include "realdb/storage.hpp"
#include "realdb/log.hpp"
#include <cctype>

namespace realdb {

namespace {

template<typename T>
bool compare(filter_predicate predicate, const T& a, const T& b) {
    switch (predicate) {
        case filter_predicate::equal:         return a == b;
        case filter_predicate::less:          return a < b;
        case filter_predicate::less_equal:    return a < b || a == b;
        case filter_predicate::greater:       return b < a;
        case filter_predicate::greater_equal: return b < a || a == b;
    }
    return false;
}

} // namespace

// ============================================================================
// Predicates
// ============================================================================

std::optional<filter_predicate> parse_predicate(std::string_view name) {
    if (name == "==") return filter_predicate::equal;
    if (name == "<")  return filter_predicate::less;
    if (name == "<=") return filter_predicate::less_equal;
    if (name == ">")  return filter_predicate::greater;
    if (name == ">=") return filter_predicate::greater_equal;
    return std::nullopt;
}

const char* to_string(filter_predicate predicate) {
    switch (predicate) {
        case filter_predicate::equal:         return "==";
        case filter_predicate::less:          return "<";
        case filter_predicate::less_equal:    return "<=";
        case filter_predicate::greater:       return ">";
        case filter_predicate::greater_equal: return ">=";
    }
    return "?";
}

bool matches(filter_predicate predicate, const value& field, const value& operand) {
    if (field.kind() != operand.kind()) {
        return false;
    }
    switch (field.kind()) {
        case value_kind::identity:
            return compare(predicate, field.as_identity(), operand.as_identity());
        case value_kind::integer:
            return compare(predicate, field.as_integer(), operand.as_integer());
        case value_kind::real:
            return compare(predicate, field.as_real(), operand.as_real());
        case value_kind::text:
            return compare(predicate, field.as_text(), operand.as_text());
    }
    return false;
}

std::string fold_key(std::string_view key) {
    std::string folded(key);
    for (char& c : folded) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return folded;
}

// ============================================================================
// store
// ============================================================================

void store::upsert(const std::string& table_name, row_t row, std::string_view key, value v) {
    std::string field = fold_key(key);
    auto& rows = tables_[table_name];

    auto it = rows.find(row);
    if (it == rows.end()) {
        record fresh;
        fresh.emplace("id", value(record_identity(table_name, row)));
        it = rows.emplace(row, std::move(fresh)).first;
        LOG_DEBUG("store", "created record %s:%llu", table_name.c_str(), (unsigned long long)row);
    }

    if (field == "id") {
        return;
    }
    it->second.insert_or_assign(std::move(field), std::move(v));
}

std::vector<row_t> store::scan_filter(const std::string& table_name,
                                      std::string_view key,
                                      filter_predicate predicate,
                                      const value& operand) const {
    std::vector<row_t> rows;
    const table* t = find_table(table_name);
    if (!t) return rows;

    std::string field = fold_key(key);
    for (const auto& [row, fields] : *t) {
        auto it = fields.find(field);
        if (it != fields.end() && matches(predicate, it->second, operand)) {
            rows.push_back(row);
        }
    }
    return rows;
}

const table* store::find_table(const std::string& table_name) const {
    auto it = tables_.find(table_name);
    return it == tables_.end() ? nullptr : &it->second;
}

const record* store::find_record(const record_identity& id) const {
    const table* t = find_table(id.table);
    if (!t) return nullptr;
    auto it = t->find(id.row);
    return it == t->end() ? nullptr : &it->second;
}

std::vector<row_t> store::rows(const std::string& table_name) const {
    std::vector<row_t> out;
    const table* t = find_table(table_name);
    if (!t) return out;
    out.reserve(t->size());
    for (const auto& [row, fields] : *t) {
        out.push_back(row);
    }
    return out;
}

size_t store::record_count() const {
    size_t count = 0;
    for (const auto& [name, rows] : tables_) {
        count += rows.size();
    }
    return count;
}

} // namespace realdb
