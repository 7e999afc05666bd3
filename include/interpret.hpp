// Main interface to the interpreter
#ifndef __ADSO_INTERPRET_HPP
#define __ADSO_INTERPRET_HPP

#include "array.hpp"
#include "ast.hpp"
#include "base.hpp"
#include "log.hpp"
#include "parse.hpp"
#include "scope.hpp"
#include "values.hpp"

namespace adso {

using namespace adso_parse;

struct interpreter;

// Signature of a native function. arg is null when the call has no argument. A
// native that produces a value pushes it onto the interpreter stack.
typedef void (*native_function)(interpreter* inter, const value* arg);

struct builtin_function {
    string name;
    // type name of the parameter, or nullopt if the builtin takes no argument
    optional<string> param_type;
    native_function native;
};

struct interpreter_options {
    // maximum number of simultaneously active calls, including main
    u32 max_call_depth;
    // maximum number of expressions and statements being evaluated at once,
    // counted across all active calls
    u32 max_eval_depth;
    // log progress messages at the info level
    bool verbose = false;

    interpreter_options();
};

// outcome of executing a statement or a function body
enum exec_status {
    // ran to the end
    es_completed,
    // a return statement was executed. Its value is on top of the stack.
    es_returned
};

struct interpreter {
private:
    // programs loaded by interpret_*(). Function bindings point into these, so
    // they are kept for the lifetime of the interpreter.
    vector<unique_ptr<ast_program>> programs;
    vector<unique_ptr<builtin_function>> builtins;
    scope_chain scopes;
    // operand stack used to hand the result of an expression to its consumer
    dyn_array<value> stack;
    // current number of nested eval_expr()/exec_stmt() invocations
    u32 eval_depth = 0;

    logger* log;
    std::ostream* out;
    interpreter_options opts;

    // pop the top of the stack and check that it's an int. context is used for
    // error messages
    i64 pop_int(const string& context, const source_loc& loc);
    // value of the left operand of a binary expression
    i64 atom_int(const ast_expr& atom);
    // discard everything left over from a failed evaluation
    void reset_state();

public:
    // The logger and output stream must not be null and must outlive this
    // interpreter instance. print writes to out. The root scope starts out
    // holding the builtins.
    interpreter(logger* log,
            std::ostream* out,
            const interpreter_options& opts=interpreter_options{});
    ~interpreter();

    // Accessors
    scope_chain* get_scopes();
    logger* get_log();
    std::ostream* get_output();

    // stack operations, used by natives
    void push(value v);
    value pop();
    value peek() const;
    u32 stack_size() const;

    // adds a native function to the root scope
    void add_builtin_function(const string& name,
            const optional<string>& param_type,
            native_function native);

    // Evaluate an expression, leaving exactly one value on the stack
    void eval_expr(const ast_expr& expr);
    // Execute a statement. On es_returned the returned value is on the stack.
    exec_status exec_stmt(const ast_stmt& stmt);
    // execute statements in order, stopping at the first return
    exec_status exec_body(const vector<unique_ptr<ast_stmt>>& body);
    // Perform a call. Returns true if the callee produced a value, in which
    // case it is left on top of the stack.
    bool call(const ast_expr& fn_call);

    // Register every function of the program in the root scope. The program
    // must outlive the interpreter. Unknown type names are logged as warnings.
    void define_functions(const ast_program& program);
    // Call main with no argument. Throws on failure.
    void run_main();

    // These take ownership of the program (or parse one), define its
    // functions and run main. Return false and set err on failure.
    bool run_program(unique_ptr<ast_program> program, fault* err);
    bool interpret_string(const string& src,
            const string& filename,
            fault* err);
    bool interpret_stream(std::istream& in,
            const string& filename,
            fault* err);
    bool interpret_file(const string& path, fault* err);
};

}

#endif
