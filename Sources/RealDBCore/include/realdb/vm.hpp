#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "compiler.hpp"
#include "storage.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace realdb {

class execution_error : public query_error {
public:
    explicit execution_error(const std::string& msg) : query_error(msg) {}
};

using result_set = std::vector<record_identity>;

// ============================================================================
// Stack machine
// ============================================================================
//
// Runs one program against a locked database. The program itself is never
// modified: remaining Range counts live in loop_state_, one slot per program
// position, seeded from Range::count when the machine is created. A slot is
// never reset, so a nested range that ran out stays exhausted when its outer
// loop comes back around.
//
// There is a single iterator register shared by every open range; an inner
// range overwrites the value the outer range set.

class machine {
public:
    machine(locked_database& db, const program& prog);

    /// Run to completion. Throws execution_error on the first failing
    /// operation; writes made before the failure stay in the database.
    result_set run();

    /// Operand stack as left by the last run (tests, diagnostics)
    const std::vector<value>& stack() const { return stack_; }

    int64_t iterator() const { return it_; }

private:
    void step(const operation& op);

    void require(size_t count, const char* op_name) const;
    value pop();
    record_identity pop_identity(const char* role);
    std::string pop_text(const char* role);
    int64_t pop_integer(const char* role);

    void op_set();
    void op_select();
    void op_select_all();
    void op_filter();
    void op_arithmetic(op_code code);

    locked_database& db_;
    const program& prog_;
    std::vector<value> stack_;
    std::vector<int64_t> loop_state_;
    result_set result_;
    size_t pc_ = 0;
    int64_t it_ = 0;
};

/// Run `prog` against `db` and return the identities it selected, in order.
result_set execute(locked_database& db, const program& prog);

} // namespace realdb

#endif // __cplusplus
