// base.hpp -- common definitions and error handling code for adso

#ifndef __ADSO_BASE_HPP
#define __ADSO_BASE_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <iostream>
#include <vector>

namespace adso {

/// aliases imported from std
template<class T> using optional = std::optional<T>;
template<class T> using vector = std::vector<T>;
using string = std::string;

template<class T> using unique_ptr = std::unique_ptr<T>;

/// integer typedefs by bitwidth
typedef uint8_t u8;
typedef uint16_t u16;
typedef uint32_t u32;
typedef uint64_t u64;

typedef int8_t i8;
typedef int16_t i16;
typedef int32_t i32;
typedef int64_t i64;

// this is implemented for std::string
template<typename T> u32 hash(const T& v);
template<> u32 hash<string>(const string& s);

// Used to track debugging information. Lines and columns are 1-based. A line of
// 0 means the location is unknown (e.g. the synthesized call to main).
struct source_loc {
    string filename;
    int line = 0;
    int col = 0;
    bool known() const {
        return line > 0;
    }
};

// every error the pipeline can produce. The names follow the phase that
// raises them.
enum fault_kind {
    fk_none,
    fk_lex,
    fk_parse,
    fk_unbound_name,
    fk_not_callable,
    fk_arity,
    fk_type,
    fk_recursion,
    fk_io,
    fk_internal
};

const char* fault_kind_name(fault_kind kind);

struct fault {
    bool happened = false;
    fault_kind kind = fk_none;
    source_loc origin;
    string subsystem;
    string message;
};
inline void set_fault(fault* f,
        fault_kind kind,
        const source_loc& origin,
        const string& subsystem,
        const string& message) {
    f->happened = true;
    f->kind = kind;
    f->origin = origin;
    f->subsystem = subsystem;
    f->message = message;
}

// Base class for everything thrown inside the scanner, parser and evaluator.
// These never leave the library: public entry points catch them and convert
// them to a fault.
class adso_exception : public std::exception {
    string formatted;

public:
    const fault_kind kind;
    const string subsystem;
    const string message;
    const source_loc origin;

    adso_exception(fault_kind kind,
            const string& subsystem,
            const string& message,
            const source_loc& origin);

    const char* what() const noexcept override {
        return formatted.c_str();
    }

    // fill out a fault structure with the contents of this exception
    void to_fault(fault* err) const;
};

// Bad character or malformed numeric literal
class lex_error : public adso_exception {
public:
    lex_error(const string& message, const source_loc& origin)
        : adso_exception{fk_lex, "scanner", message, origin} {
    }
    int line() const {
        return origin.line;
    }
    int col() const {
        return origin.col;
    }
};

// The token stream does not match the production named by context
class parse_error : public adso_exception {
public:
    const string context;
    const string expected;
    const string found;

    parse_error(const string& context,
            const string& expected,
            const string& found,
            const source_loc& origin);
};

class unbound_name_error : public adso_exception {
public:
    const string name;

    unbound_name_error(const string& name, const source_loc& origin);
};

// A function was expected but the name resolved to a plain value
class not_callable_error : public adso_exception {
public:
    const string name;

    not_callable_error(const string& name, const source_loc& origin);
};

// Argument presence or declared type does not match the callee
class arity_error : public adso_exception {
public:
    const string expected;
    const string actual;

    arity_error(const string& expected,
            const string& actual,
            const source_loc& origin);
};

// An operand has the wrong kind of value
class type_error : public adso_exception {
public:
    const string context;
    const string expected;
    const string actual;

    type_error(const string& context,
            const string& expected,
            const string& actual,
            const source_loc& origin);
};

// Too many nested calls or evaluation steps. what names the exhausted limit,
// e.g. "call depth".
class recursion_error : public adso_exception {
public:
    const u32 limit;

    recursion_error(const string& what, u32 limit, const source_loc& origin);
};

}

#endif
