#include "realdb/compiler.hpp"
#include "realdb/log.hpp"
#include <algorithm>
#include <charconv>
#include <sstream>

namespace realdb {

namespace {

std::string position(const token& t) {
    return std::to_string(t.line) + ":" + std::to_string(t.column);
}

int64_t parse_integer(const token& t) {
    std::string_view word = t.word;
    if (word.size() > 1 && word.front() == '+') word.remove_prefix(1);
    int64_t out = 0;
    auto [ptr, ec] = std::from_chars(word.data(), word.data() + word.size(), out);
    if (ec != std::errc() || ptr != word.data() + word.size()) {
        throw compile_error("invalid integer `" + t.word + "` at line " + position(t));
    }
    return out;
}

double real_literal(const token& t) {
    auto out = parse_real(t.word);
    if (!out) {
        throw compile_error("invalid number `" + t.word + "` at line " + position(t));
    }
    return *out;
}

// @table:row, row is digits or `_`
record_identity parse_identity(const token& t, row_generator& rows) {
    auto malformed = [&t](const std::string& why) {
        return compile_error("malformed identity `" + t.word + "` at line " + position(t) + ": " + why);
    };

    std::string_view body = t.word;
    if (body.empty() || body.front() != '@') {
        throw malformed("expected `@table:row`");
    }
    body.remove_prefix(1);

    auto separators = std::count(body.begin(), body.end(), ':');
    if (separators != 1) {
        throw malformed("expected exactly one `:` separator");
    }

    auto colon = body.find(':');
    std::string table(body.substr(0, colon));
    std::string_view row = body.substr(colon + 1);

    if (table.empty()) {
        throw malformed("table name is empty");
    }
    if (row == "_") {
        return record_identity(std::move(table), rows.next());
    }
    if (row.empty() || !std::all_of(row.begin(), row.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        throw malformed("row must be digits or `_`");
    }

    row_t n = 0;
    auto [ptr, ec] = std::from_chars(row.data(), row.data() + row.size(), n);
    if (ec != std::errc() || ptr != row.data() + row.size()) {
        throw malformed("row does not fit in 64 bits");
    }
    return record_identity(std::move(table), n);
}

} // namespace

const char* to_string(op_code code) {
    switch (code) {
        case op_code::start:      return "START";
        case op_code::end:        return "END";
        case op_code::push:       return "PUSH";
        case op_code::set:        return "SET";
        case op_code::select:     return "SELECT";
        case op_code::select_all: return "SELECT_ALL";
        case op_code::filter:     return "FILTER";
        case op_code::drop:       return "DROP";
        case op_code::add:        return "ADD";
        case op_code::subtract:   return "SUBTRACT";
        case op_code::it:         return "IT";
        case op_code::range:      return "RANGE";
        case op_code::jump:       return "JUMP";
    }
    return "UNKNOWN";
}

program compile(const std::vector<token>& tokens, row_generator& rows) {
    program prog;
    // Indices of Range operations whose `end` has not been seen yet
    std::vector<size_t> scopes;
    std::vector<const token*> scope_tokens;

    prog.emplace_back(op_code::start);

    for (size_t i = 0; i < tokens.size(); ++i) {
        const token& t = tokens[i];

        switch (t.kind) {
            case token_kind::string:
                prog.push_back(operation::push(value(t.word.substr(1, t.word.size() - 2))));
                break;
            case token_kind::integer:
                prog.push_back(operation::push(value(parse_integer(t))));
                break;
            case token_kind::real:
                prog.push_back(operation::push(value(real_literal(t))));
                break;
            case token_kind::identity:
                prog.push_back(operation::push(value(parse_identity(t, rows))));
                break;

            case token_kind::set:        prog.emplace_back(op_code::set); break;
            case token_kind::select:     prog.emplace_back(op_code::select); break;
            case token_kind::select_all: prog.emplace_back(op_code::select_all); break;
            case token_kind::filter:     prog.emplace_back(op_code::filter); break;
            case token_kind::drop:       prog.emplace_back(op_code::drop); break;
            case token_kind::plus:       prog.emplace_back(op_code::add); break;
            case token_kind::minus:      prog.emplace_back(op_code::subtract); break;

            case token_kind::range: {
                if (i + 1 >= tokens.size() || tokens[i + 1].kind != token_kind::integer) {
                    throw compile_error("`range` at line " + position(t) + " must be followed by an integer");
                }
                int64_t count = parse_integer(tokens[++i]);
                scopes.push_back(prog.size());
                scope_tokens.push_back(&t);
                prog.push_back(operation::range(count, 0));
                break;
            }
            case token_kind::it:
                if (scopes.empty()) {
                    throw compile_error("`it` used outside of a range at line " + position(t));
                }
                prog.emplace_back(op_code::it);
                break;
            case token_kind::do_:
                break;
            case token_kind::end: {
                if (scopes.empty()) {
                    throw compile_error("unmatched `end` at line " + position(t));
                }
                size_t start = scopes.back();
                scopes.pop_back();
                scope_tokens.pop_back();
                // The loop exits to the operation right after its Jump
                prog[start].target = prog.size() + 1;
                prog.push_back(operation::jump(start));
                break;
            }

            case token_kind::word:
                if (!t.word.empty() && t.word.front() == '@') {
                    throw compile_error("malformed identity `" + t.word + "` at line " + position(t) +
                                        ": expected `@table:row`");
                }
                throw compile_error("unknown word `" + t.word + "` at line " + position(t));
        }
    }

    if (!scopes.empty()) {
        throw compile_error("unclosed `range` at line " + position(*scope_tokens.back()));
    }

    prog.emplace_back(op_code::end);
    LOG_DEBUG("compiler", "compiled %zu tokens into %zu operations", tokens.size(), prog.size());
    return prog;
}

program compile(std::string_view text, row_generator& rows) {
    return compile(tokenize(text), rows);
}

std::string disassemble(const program& prog) {
    std::ostringstream out;
    for (size_t i = 0; i < prog.size(); ++i) {
        const auto& op = prog[i];
        out << i << ": " << to_string(op.code);
        switch (op.code) {
            case op_code::push:
                out << ' ' << op.operand.to_string();
                break;
            case op_code::range:
                out << ' ' << op.count << " -> " << op.target;
                break;
            case op_code::jump:
                out << ' ' << op.target;
                break;
            default:
                break;
        }
        out << '\n';
    }
    return out.str();
}

} // namespace realdb
