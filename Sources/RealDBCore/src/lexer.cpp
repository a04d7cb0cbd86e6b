#include "realdb/lexer.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <limits>

namespace realdb {

namespace {

std::string to_lower(std::string_view word) {
    std::string lower(word);
    for (char& c : lower) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return lower;
}

// Accepts an optional leading '+' or '-' followed by digits that fit int64_t.
bool parses_as_integer(std::string_view word) {
    if (word.size() > 1 && word.front() == '+' && word[1] != '-') word.remove_prefix(1);
    if (word.empty()) return false;
    int64_t out = 0;
    auto [ptr, ec] = std::from_chars(word.data(), word.data() + word.size(), out);
    return ec == std::errc() && ptr == word.data() + word.size();
}

// Value of a well-formed decimal literal that from_chars reported as out of
// range: +-inf when the leading significant digit sits above 10^0, +-0 below.
double saturate(std::string_view word) {
    bool negative = word.front() == '-';
    if (word.front() == '-' || word.front() == '+') word.remove_prefix(1);

    size_t e = word.find_first_of("eE");
    std::string_view mantissa = word.substr(0, e);
    int64_t exponent = 0;
    if (e != std::string_view::npos) {
        std::string_view digits = word.substr(e + 1);
        if (!digits.empty() && digits.front() == '+') digits.remove_prefix(1);
        auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), exponent);
        if (ec == std::errc::result_out_of_range) {
            exponent = digits.front() == '-' ? std::numeric_limits<int64_t>::min() / 2
                                             : std::numeric_limits<int64_t>::max() / 2;
        }
    }

    size_t dot = mantissa.find('.');
    size_t integer_digits = dot == std::string_view::npos ? mantissa.size() : dot;
    size_t first = mantissa.find_first_not_of("0.");
    if (first == std::string_view::npos) return negative ? -0.0 : 0.0;
    int64_t lead = first < integer_digits
        ? static_cast<int64_t>(integer_digits - first - 1)
        : -static_cast<int64_t>(first - integer_digits);

    double magnitude = exponent + lead > 0 ? std::numeric_limits<double>::infinity() : 0.0;
    return negative ? -magnitude : magnitude;
}

bool is_separator(char c) {
    return c == ' ' || c == '\n' || c == '\r' || c == '\t';
}

} // namespace

const char* to_string(token_kind kind) {
    switch (kind) {
        case token_kind::set:        return "set";
        case token_kind::select:     return "select";
        case token_kind::select_all: return "select_all";
        case token_kind::filter:     return "filter";
        case token_kind::drop:       return "drop";
        case token_kind::range:      return "range";
        case token_kind::it:         return "it";
        case token_kind::do_:        return "do";
        case token_kind::end:        return "end";
        case token_kind::plus:       return "+";
        case token_kind::minus:      return "-";
        case token_kind::string:     return "string";
        case token_kind::integer:    return "integer";
        case token_kind::real:       return "float";
        case token_kind::identity:   return "identity";
        case token_kind::word:       return "word";
    }
    return "unknown";
}

std::optional<double> parse_real(std::string_view word) {
    // from_chars takes no leading '+'
    if (word.size() > 1 && word.front() == '+' && word[1] != '-') word.remove_prefix(1);
    if (word.empty()) return std::nullopt;

    double out = 0;
    auto [ptr, ec] = std::from_chars(word.data(), word.data() + word.size(), out,
                                     std::chars_format::general);
    if (ptr != word.data() + word.size()) return std::nullopt;
    if (ec == std::errc::result_out_of_range) return saturate(word);
    if (ec != std::errc()) return std::nullopt;
    return out;
}

token_kind classify(std::string_view word) {
    std::string lower = to_lower(word);

    if (lower == "set") return token_kind::set;
    if (lower == "select") return token_kind::select;
    if (lower == "select_all") return token_kind::select_all;
    if (lower == "filter") return token_kind::filter;
    if (lower == "drop") return token_kind::drop;
    if (lower == "range") return token_kind::range;
    if (lower == "it") return token_kind::it;
    if (lower == "do") return token_kind::do_;
    if (lower == "end") return token_kind::end;
    if (lower == "+") return token_kind::plus;
    if (lower == "-") return token_kind::minus;

    if (word.size() >= 2 && word.front() == '"' && word.back() == '"') {
        return token_kind::string;
    }
    if (parses_as_integer(word)) return token_kind::integer;
    if (parse_real(word)) return token_kind::real;

    if (word.size() > 1 && word.front() == '@' &&
        std::count(word.begin(), word.end(), ':') == 1) {
        return token_kind::identity;
    }
    return token_kind::word;
}

std::vector<token> tokenize(std::string_view text) {
    std::vector<token> tokens;
    std::string word;
    size_t word_line = 1;
    size_t word_column = 1;
    bool in_string = false;
    bool in_comment = false;
    size_t line = 1;
    size_t column = 1;

    auto flush = [&]() {
        if (word.empty()) return;
        token t;
        t.kind = classify(word);
        t.word = std::move(word);
        t.line = word_line;
        t.column = word_column;
        tokens.push_back(std::move(t));
        word.clear();
    };

    for (char ch : text) {
        if (ch == '\n') {
            // A newline ends comments and, outside quotes, the current word
            in_comment = false;
            if (in_string) {
                word.push_back(ch);
            } else {
                flush();
            }
            ++line;
            column = 1;
            continue;
        }

        if (in_comment) {
            ++column;
            continue;
        }

        if (!in_string && is_separator(ch)) {
            flush();
        } else if (!in_string && ch == '#') {
            in_comment = true;
        } else {
            if (ch == '"') in_string = !in_string;
            if (word.empty()) {
                word_line = line;
                word_column = column;
            }
            word.push_back(ch);
        }
        ++column;
    }

    flush();
    return tokens;
}

} // namespace realdb
