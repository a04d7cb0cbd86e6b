#include "realdb/vm.hpp"
#include "realdb/log.hpp"

namespace realdb {

machine::machine(locked_database& db, const program& prog)
    : db_(db)
    , prog_(prog)
    , loop_state_(prog.size(), 0)
{
    for (size_t i = 0; i < prog_.size(); ++i) {
        if (prog_[i].code == op_code::range) {
            loop_state_[i] = prog_[i].count;
        }
    }
}

result_set machine::run() {
    while (pc_ < prog_.size()) {
        step(prog_[pc_]);
    }
    LOG_DEBUG("vm", "program finished: %zu result(s), %zu value(s) left on stack",
              result_.size(), stack_.size());
    return result_;
}

void machine::step(const operation& op) {
    switch (op.code) {
        case op_code::start:
        case op_code::end:
            break;
        case op_code::push:
            stack_.push_back(op.operand);
            break;
        case op_code::set:
            op_set();
            break;
        case op_code::select:
            op_select();
            break;
        case op_code::select_all:
            op_select_all();
            break;
        case op_code::filter:
            op_filter();
            break;
        case op_code::drop:
            require(1, "drop");
            stack_.pop_back();
            break;
        case op_code::add:
        case op_code::subtract:
            op_arithmetic(op.code);
            break;
        case op_code::it:
            stack_.push_back(value(it_));
            break;
        case op_code::range: {
            int64_t& remaining = loop_state_[pc_];
            if (remaining > 0) {
                it_ = remaining;
                --remaining;
                ++pc_;
            } else {
                pc_ = op.target;
            }
            return;
        }
        case op_code::jump:
            pc_ = op.target;
            return;
    }
    ++pc_;
}

// ============================================================================
// Stack helpers
// ============================================================================

void machine::require(size_t count, const char* op_name) const {
    if (stack_.size() < count) {
        throw execution_error(std::string("`") + op_name + "` needs at least " + std::to_string(count) +
                              " value(s) on the stack, current stack is " + to_string(stack_));
    }
}

value machine::pop() {
    value v = std::move(stack_.back());
    stack_.pop_back();
    return v;
}

record_identity machine::pop_identity(const char* role) {
    value v = pop();
    if (!v.is_identity()) {
        throw execution_error(std::string(role) + " must be an identity, got " + to_string(v.kind()) +
                              " " + v.to_string());
    }
    return std::get<record_identity>(std::move(v.data));
}

std::string machine::pop_text(const char* role) {
    value v = pop();
    if (!v.is_text()) {
        throw execution_error(std::string(role) + " must be a string, got " + to_string(v.kind()) +
                              " " + v.to_string());
    }
    return std::get<std::string>(std::move(v.data));
}

int64_t machine::pop_integer(const char* role) {
    value v = pop();
    if (!v.is_integer()) {
        throw execution_error(std::string(role) + " must be an integer, got " + to_string(v.kind()) +
                              " " + v.to_string());
    }
    return v.as_integer();
}

// ============================================================================
// Intrinsics
// ============================================================================

// record_id key value -> record_id
void machine::op_set() {
    require(3, "set");
    value v = pop();
    std::string key = pop_text("Key");
    record_identity id = pop_identity("Record id");

    db_->upsert(id.table, id.row, key, std::move(v));
    stack_.push_back(value(std::move(id)));
}

// record_id ->
void machine::op_select() {
    require(1, "select");
    record_identity id = pop_identity("Record id");

    if (!db_->find_table(id.table)) {
        throw execution_error("Table `" + id.table + "` not found");
    }
    if (!db_->find_record(id)) {
        throw execution_error("Record " + id.to_string() + " not found");
    }
    result_.push_back(std::move(id));
}

// record_id -> ; only the table part is used
void machine::op_select_all() {
    require(1, "select_all");
    record_identity id = pop_identity("Record id");

    if (!db_->find_table(id.table)) {
        throw execution_error("Table `" + id.table + "` not found");
    }
    for (row_t row : db_->rows(id.table)) {
        result_.emplace_back(id.table, row);
    }
}

// record_id key value predicate -> ; only the table part is used
void machine::op_filter() {
    require(4, "filter");
    std::string predicate_name = pop_text("Predicate");
    auto predicate = parse_predicate(predicate_name);
    if (!predicate) {
        throw execution_error("Predicate `" + predicate_name + "` unknown, expected one of == < <= > >=");
    }
    value operand = pop();
    std::string key = pop_text("Key");
    record_identity id = pop_identity("Record id");

    if (!db_->find_table(id.table)) {
        throw execution_error("Table `" + id.table + "` not found");
    }
    for (row_t row : db_->scan_filter(id.table, key, *predicate, operand)) {
        result_.emplace_back(id.table, row);
    }
}

// a b -> a+b | a-b, two's-complement wraparound
void machine::op_arithmetic(op_code code) {
    const char* name = code == op_code::add ? "+" : "-";
    require(2, name);
    auto b = static_cast<uint64_t>(pop_integer("Right operand"));
    auto a = static_cast<uint64_t>(pop_integer("Left operand"));
    uint64_t r = code == op_code::add ? a + b : a - b;
    stack_.push_back(value(static_cast<int64_t>(r)));
}

result_set execute(locked_database& db, const program& prog) {
    machine vm(db, prog);
    return vm.run();
}

} // namespace realdb
