#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "lexer.hpp"
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace realdb {

class compile_error : public query_error {
public:
    explicit compile_error(const std::string& msg) : query_error(msg) {}
};

// ============================================================================
// Bytecode
// ============================================================================

enum class op_code {
    start,
    end,
    push,
    set,
    select,
    select_all,
    filter,
    drop,
    add,
    subtract,
    it,
    range,
    jump
};

const char* to_string(op_code code);

struct operation {
    op_code code = op_code::start;
    value operand;          // push
    int64_t count = 0;      // range: iterations
    size_t target = 0;      // range: index past the loop's jump; jump: destination

    operation() = default;
    explicit operation(op_code c) : code(c) {}

    static operation push(value v) {
        operation op(op_code::push);
        op.operand = std::move(v);
        return op;
    }

    static operation range(int64_t count, size_t end) {
        operation op(op_code::range);
        op.count = count;
        op.target = end;
        return op;
    }

    static operation jump(size_t target) {
        operation op(op_code::jump);
        op.target = target;
        return op;
    }
};

using program = std::vector<operation>;

// ============================================================================
// Compiler
// ============================================================================

/// Compile a token stream. `range ... do ... end` blocks are resolved into
/// Range/Jump pairs with absolute targets. `@table:_` literals draw their row
/// from `rows`. Throws compile_error.
program compile(const std::vector<token>& tokens, row_generator& rows);

/// tokenize() + compile()
program compile(std::string_view text, row_generator& rows);

/// One operation per line: "index: MNEMONIC operand"
std::string disassemble(const program& prog);

} // namespace realdb

#endif // __cplusplus
