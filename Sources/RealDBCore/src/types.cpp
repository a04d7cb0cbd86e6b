#include "realdb/types.hpp"
#include <sstream>

namespace realdb {

const char* to_string(value_kind kind) {
    switch (kind) {
        case value_kind::identity: return "identity";
        case value_kind::integer:  return "integer";
        case value_kind::real:     return "float";
        case value_kind::text:     return "string";
    }
    return "unknown";
}

std::string value::to_string() const {
    std::ostringstream out;
    switch (kind()) {
        case value_kind::identity:
            out << '@' << as_identity().to_string();
            break;
        case value_kind::integer:
            out << as_integer();
            break;
        case value_kind::real:
            out << as_real();
            break;
        case value_kind::text:
            out << '"' << as_text() << '"';
            break;
    }
    return out.str();
}

std::string to_string(const std::vector<value>& stack) {
    std::string out = "[";
    for (size_t i = 0; i < stack.size(); ++i) {
        if (i > 0) out += ", ";
        out += stack[i].to_string();
    }
    out += "]";
    return out;
}

} // namespace realdb
