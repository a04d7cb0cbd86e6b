#pragma once

#ifdef __cplusplus

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace realdb {

enum class token_kind {
    set,
    select,
    select_all,
    filter,
    drop,
    range,
    it,
    do_,
    end,
    plus,
    minus,
    string,
    integer,
    real,
    identity,
    word    // unrecognized, rejected by the compiler
};

const char* to_string(token_kind kind);

struct token {
    std::string word;
    token_kind kind = token_kind::word;
    size_t line = 1;    // 1-based, position of the first character
    size_t column = 1;
};

/// Decimal floating-point literal: optional sign, digits, '.', exponent, or
/// inf/nan. Hex floats are rejected. Literals beyond the double range
/// saturate to +-inf or +-0.
std::optional<double> parse_real(std::string_view word);

/// Classify a single flushed word.
token_kind classify(std::string_view word);

/// Split query text into tokens. Never fails: unknown words come back as
/// token_kind::word and are reported by the compiler.
std::vector<token> tokenize(std::string_view text);

} // namespace realdb

#endif // __cplusplus
