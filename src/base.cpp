#include "base.hpp"

#include <sstream>

namespace adso {

// Hashes for std::string use FNV-1a
template<> u32 hash<string>(const string& s) {
    // prime: 16777619
    // offset basis: 2166136261
    u32 res = 2166136261;
    for (u32 i=0; i<s.length(); ++i) {
        res ^= (u8)s[i];
        res *= 16777619;
    }
    return res;
}

const char* fault_kind_name(fault_kind kind) {
    switch (kind) {
    case fk_none:
        return "none";
    case fk_lex:
        return "LexError";
    case fk_parse:
        return "ParseError";
    case fk_unbound_name:
        return "UnboundNameError";
    case fk_not_callable:
        return "NotCallableError";
    case fk_arity:
        return "ArityOrTypeError";
    case fk_type:
        return "TypeError";
    case fk_recursion:
        return "RecursionError";
    case fk_io:
        return "IOError";
    case fk_internal:
        return "InternalError";
    }
    // this is unreachable code to silence a compiler warning
    return "";
}

adso_exception::adso_exception(fault_kind kind,
        const string& subsystem,
        const string& message,
        const source_loc& origin)
    : kind{kind}
    , subsystem{subsystem}
    , message{message}
    , origin{origin} {
    // build formatted error message
    std::ostringstream ss;
    ss << "[" + subsystem + "] " << fault_kind_name(kind);
    if (origin.known()) {
        ss << " at line " << origin.line << ", col " << origin.col;
        if (!origin.filename.empty()) {
            ss << " in " << origin.filename;
        }
    }
    ss << ":\n\t" << message;
    formatted = ss.str();
}

void adso_exception::to_fault(fault* err) const {
    set_fault(err, kind, origin, subsystem, message);
}

parse_error::parse_error(const string& context,
        const string& expected,
        const string& found,
        const source_loc& origin)
    : adso_exception{fk_parse, "parser",
        "failed to parse " + context + ": expected " + expected
            + ", found " + found,
        origin}
    , context{context}
    , expected{expected}
    , found{found} {
}

unbound_name_error::unbound_name_error(const string& name,
        const source_loc& origin)
    : adso_exception{fk_unbound_name, "interpreter",
        "unbound name '" + name + "'", origin}
    , name{name} {
}

not_callable_error::not_callable_error(const string& name,
        const source_loc& origin)
    : adso_exception{fk_not_callable, "interpreter",
        "'" + name + "' is not a function", origin}
    , name{name} {
}

arity_error::arity_error(const string& expected,
        const string& actual,
        const source_loc& origin)
    : adso_exception{fk_arity, "interpreter",
        "argument mismatch: expected " + expected + ", got " + actual,
        origin}
    , expected{expected}
    , actual{actual} {
}

type_error::type_error(const string& context,
        const string& expected,
        const string& actual,
        const source_loc& origin)
    : adso_exception{fk_type, "interpreter",
        "type error in " + context + ": expected " + expected + ", got "
            + actual,
        origin}
    , context{context}
    , expected{expected}
    , actual{actual} {
}

recursion_error::recursion_error(const string& what,
        u32 limit,
        const source_loc& origin)
    : adso_exception{fk_recursion, "interpreter",
        "maximum " + what + " of " + std::to_string(limit) + " exceeded",
        origin}
    , limit{limit} {
}

}
