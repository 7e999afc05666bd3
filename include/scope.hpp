#ifndef __ADSO_SCOPE_HPP
#define __ADSO_SCOPE_HPP

#include "array.hpp"
#include "ast.hpp"
#include "base.hpp"
#include "table.hpp"
#include "values.hpp"

namespace adso {

struct builtin_function;

enum binding_kind {
    bind_value,
    bind_function,
    bind_builtin
};

// What a name in a scope refers to. Function bindings point into the program
// AST and builtin bindings into the interpreter's builtin table, both of which
// must outlive the scope chain.
struct binding {
    binding_kind kind;
    value val;                                 // only for bind_value
    const adso_parse::ast_fn_def* fn;          // only for bind_function
    const builtin_function* builtin;           // only for bind_builtin

    bool is_callable() const {
        return kind != bind_value;
    }
};

binding mk_value_binding(value v);
binding mk_function_binding(const adso_parse::ast_fn_def* fn);
binding mk_builtin_binding(const builtin_function* builtin);

// scopes are addressed by their index in the scope chain
typedef u32 scope_id;
constexpr scope_id ROOT_SCOPE = 0;

struct scope {
    table<string,binding> bindings;
    // enclosing scope for lookups. The root is its own parent.
    scope_id parent;
    // the scope that was current when this one was pushed, restored by pop()
    scope_id previous;

    scope(scope_id parent, scope_id previous)
        : parent{parent}
        , previous{previous} {
    }
};

// Arena of scopes with a cursor for the current one. Scopes are pushed and
// popped in stack order, so the current scope is always the last one in the
// arena.
class scope_chain {
private:
    dyn_array<scope> scopes;
    scope_id current;

public:
    // creates the root scope and makes it current
    scope_chain();

    // create a new scope whose parent is the current scope and make it current
    scope_id push_child();
    // create a new scope with an explicit parent and make it current
    scope_id push_child(scope_id parent);
    // discard the current scope and restore the one that was current before
    // it was pushed. Throws an internal error on the root.
    void pop();

    // search the current scope, then each ancestor. Throws unbound_name_error
    // (reported at loc) if no scope binds the name.
    const binding& lookup(const string& name, const source_loc& loc) const;
    // like lookup() but returns null if the name is unbound
    const binding* find(const string& name) const;
    // insert or overwrite a binding in the current scope only
    void define(const string& name, const binding& b);

    scope_id get_current() const {
        return current;
    }
    // number of live scopes, including the root
    u32 depth() const {
        return scopes.size;
    }
};

}

#endif
