#include "interpret.hpp"
#include "builtin.hpp"
#include "config.h"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace adso {

namespace fs = std::filesystem;

// type names usable in function definitions
static bool is_value_type(const string& name) {
    return name == "int" || name == "bool";
}
static bool is_return_type(const string& name) {
    return is_value_type(name) || name == "void";
}

static string describe_arg(const value* arg) {
    if (arg == nullptr) {
        return "no argument";
    }
    return string{"argument of type "} + v_type_name(*arg);
}

static string describe_param(const optional<string>& param_type) {
    if (!param_type.has_value()) {
        return "no argument";
    }
    return "argument of type " + *param_type;
}

// counts one level of evaluator nesting while it's alive
class nesting_guard {
    u32* depth;

public:
    nesting_guard(u32* depth, u32 limit, const source_loc& loc)
        : depth{depth} {
        if (*depth >= limit) {
            throw recursion_error{"nesting depth", limit, loc};
        }
        ++*depth;
    }
    ~nesting_guard() {
        --*depth;
    }
};

interpreter_options::interpreter_options()
    : max_call_depth{ADSO_DEFAULT_MAX_CALL_DEPTH}
    , max_eval_depth{ADSO_DEFAULT_MAX_EVAL_DEPTH} {
}

interpreter::interpreter(logger* log,
        std::ostream* out,
        const interpreter_options& opts)
    : log{log}
    , out{out}
    , opts{opts} {
    install_builtins(*this);
}

interpreter::~interpreter() {
}

scope_chain* interpreter::get_scopes() {
    return &scopes;
}

logger* interpreter::get_log() {
    return log;
}

std::ostream* interpreter::get_output() {
    return out;
}

void interpreter::push(value v) {
    stack.push_back(v);
}

value interpreter::pop() {
    if (stack.size == 0) {
        throw adso_exception{fk_internal, "interpreter",
            "pop from an empty stack", source_loc{}};
    }
    auto res = stack.back();
    stack.pop_back();
    return res;
}

value interpreter::peek() const {
    if (stack.size == 0) {
        throw adso_exception{fk_internal, "interpreter",
            "peek at an empty stack", source_loc{}};
    }
    return stack[stack.size-1];
}

u32 interpreter::stack_size() const {
    return stack.size;
}

void interpreter::add_builtin_function(const string& name,
        const optional<string>& param_type,
        native_function native) {
    if (scopes.get_current() != ROOT_SCOPE) {
        throw adso_exception{fk_internal, "interpreter",
            "builtins must be added while no call is active", source_loc{}};
    }
    builtins.push_back(std::make_unique<builtin_function>(
                builtin_function{name, param_type, native}));
    scopes.define(name, mk_builtin_binding(builtins.back().get()));
}

i64 interpreter::pop_int(const string& context, const source_loc& loc) {
    auto v = pop();
    if (!vis_int(v)) {
        throw type_error{context, "int", v_type_name(v), loc};
    }
    return vint(v);
}

i64 interpreter::atom_int(const ast_expr& atom) {
    if (atom.kind == ek_number) {
        return atom.num;
    }
    auto& b = scopes.lookup(atom.name, atom.loc);
    if (b.kind != bind_value) {
        throw type_error{"left operand '" + atom.name + "'", "int",
            "function", atom.loc};
    } else if (!vis_int(b.val)) {
        throw type_error{"left operand '" + atom.name + "'", "int",
            v_type_name(b.val), atom.loc};
    }
    return vint(b.val);
}

void interpreter::eval_expr(const ast_expr& expr) {
    nesting_guard guard{&eval_depth, opts.max_eval_depth, expr.loc};
    switch (expr.kind) {
    case ek_number:
        push(vbox_int(expr.num));
        break;

    case ek_ident: {
        auto& b = scopes.lookup(expr.name, expr.loc);
        if (b.kind != bind_value) {
            throw type_error{"identifier '" + expr.name + "'", "value",
                "function", expr.loc};
        }
        push(b.val);
    }
        break;

    case ek_call:
        if (!call(expr)) {
            throw type_error{"call to '" + expr.name + "'", "value",
                "void", expr.loc};
        }
        break;

    case ek_binop: {
        auto context = string{"operator '"} + binop_name(expr.op) + "'";
        auto left = atom_int(*expr.left);
        eval_expr(*expr.right);
        auto right = pop_int(context, expr.right->loc);
        // arithmetic wraps around on overflow
        switch (expr.op) {
        case bk_lt:
            push(vbox_bool(left < right));
            break;
        case bk_mul:
            push(vbox_int((i64)((u64)left * (u64)right)));
            break;
        case bk_sub:
            push(vbox_int((i64)((u64)left - (u64)right)));
            break;
        }
    }
        break;
    }
}

exec_status interpreter::exec_stmt(const ast_stmt& stmt) {
    nesting_guard guard{&eval_depth, opts.max_eval_depth, stmt.loc};
    switch (stmt.kind) {
    case sk_if: {
        eval_expr(*stmt.expr);
        auto v = pop();
        if (!vis_bool(v)) {
            throw type_error{"if condition", "bool", v_type_name(v),
                stmt.expr->loc};
        }
        if (vbool(v)) {
            return exec_body(stmt.body);
        }
    }
        break;

    case sk_return:
        eval_expr(*stmt.expr);
        return es_returned;

    case sk_call:
        if (call(*stmt.expr)) {
            pop();
        }
        break;
    }
    return es_completed;
}

exec_status interpreter::exec_body(const vector<unique_ptr<ast_stmt>>& body) {
    for (auto& s : body) {
        if (exec_stmt(*s) == es_returned) {
            return es_returned;
        }
    }
    return es_completed;
}

bool interpreter::call(const ast_expr& fn_call) {
    auto& loc = fn_call.loc;
    // copy the binding since pushing scopes may reorganize the arena
    auto callee = scopes.lookup(fn_call.name, loc);
    if (!callee.is_callable()) {
        throw not_callable_error{fn_call.name, loc};
    }

    optional<value> arg;
    if (fn_call.arg) {
        eval_expr(*fn_call.arg);
        arg = pop();
    }

    const optional<string>& param_type = callee.kind == bind_function
        ? callee.fn->param_type
        : callee.builtin->param_type;
    const value* arg_ptr = arg.has_value() ? &*arg : nullptr;
    if (param_type.has_value() != arg.has_value()) {
        throw arity_error{describe_param(param_type), describe_arg(arg_ptr),
            loc};
    } else if (arg.has_value() && *param_type != v_type_name(*arg)) {
        throw arity_error{*param_type, v_type_name(*arg), loc};
    }

    // the root scope doesn't count as a call
    if (scopes.depth() - 1 >= opts.max_call_depth) {
        throw recursion_error{"call depth", opts.max_call_depth, loc};
    }

    auto height = stack.size;
    // the language has no closures, so every activation hangs off the root
    scopes.push_child(ROOT_SCOPE);
    bool has_result = false;
    try {
        if (callee.kind == bind_function) {
            auto fn = callee.fn;
            if (arg.has_value()) {
                scopes.define(*fn->param_name, mk_value_binding(*arg));
            }
            if (exec_body(fn->body) == es_returned) {
                // the returned value is the result whatever the declaration
                // says
                auto v = peek();
                if (fn->return_type != v_type_name(v)) {
                    log->log_warning(loc, "interpreter", "'" + fn->name
                            + "' is declared to return " + fn->return_type
                            + " but returned " + v_type_name(v));
                }
                has_result = true;
            }
        } else {
            callee.builtin->native(this, arg_ptr);
            has_result = stack.size > height;
        }
    } catch (...) {
        scopes.pop();
        throw;
    }
    scopes.pop();
    return has_result;
}

void interpreter::define_functions(const ast_program& program) {
    for (auto& def : program.defs) {
        // unknown type names only matter once the function is called
        if (!is_return_type(def->return_type)) {
            log->log_warning(def->loc, "interpreter", "unknown return type '"
                    + def->return_type + "' in definition of '" + def->name
                    + "'");
        }
        if (def->has_param() && !is_value_type(*def->param_type)) {
            log->log_warning(def->loc, "interpreter", "unknown parameter type '"
                    + *def->param_type + "' in definition of '" + def->name
                    + "'");
        }
        if (scopes.find(def->name) != nullptr) {
            log->log_warning(def->loc, "interpreter",
                    "redefinition of '" + def->name + "'");
        }
        scopes.define(def->name, mk_function_binding(def.get()));
    }
    if (opts.verbose) {
        log->log_info("interpreter", "defined "
                + std::to_string(program.defs.size()) + " function(s)");
    }
}

void interpreter::run_main() {
    // synthesized call with no argument and no source location
    auto main_call = mk_call_expr(source_loc{}, "main", nullptr);
    if (opts.verbose) {
        log->log_info("interpreter", "calling main");
    }
    if (call(*main_call)) {
        pop();
    }
}

void interpreter::reset_state() {
    stack.clear();
    while (scopes.get_current() != ROOT_SCOPE) {
        scopes.pop();
    }
}

bool interpreter::run_program(unique_ptr<ast_program> program, fault* err) {
    programs.push_back(std::move(program));
    try {
        define_functions(*programs.back());
        run_main();
    } catch (const adso_exception& e) {
        e.to_fault(err);
        reset_state();
        return false;
    }
    return true;
}

bool interpreter::interpret_stream(std::istream& in,
        const string& filename,
        fault* err) {
    auto program = parse_stream(in, filename, err);
    if (!program) {
        return false;
    }
    if (opts.verbose) {
        log->log_info("parser", "parsed " + filename);
    }
    return run_program(std::move(program), err);
}

bool interpreter::interpret_string(const string& src,
        const string& filename,
        fault* err) {
    std::istringstream in{src};
    return interpret_stream(in, filename, err);
}

bool interpreter::interpret_file(const string& path, fault* err) {
    std::ifstream in{path};
    if (!in) {
        set_fault(err, fk_io, source_loc{}, "interpreter",
                "failed to read " + path);
        return false;
    }
    return interpret_stream(in, fs::path{path}.filename().string(), err);
}

}
