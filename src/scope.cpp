#include "scope.hpp"

namespace adso {

binding mk_value_binding(value v) {
    return binding{bind_value, v, nullptr, nullptr};
}

binding mk_function_binding(const adso_parse::ast_fn_def* fn) {
    return binding{bind_function, vbox_int(0), fn, nullptr};
}

binding mk_builtin_binding(const builtin_function* builtin) {
    return binding{bind_builtin, vbox_int(0), nullptr, builtin};
}

scope_chain::scope_chain()
    : current{ROOT_SCOPE} {
    scopes.push_back(scope{ROOT_SCOPE, ROOT_SCOPE});
}

scope_id scope_chain::push_child() {
    return push_child(current);
}

scope_id scope_chain::push_child(scope_id parent) {
    scopes.push_back(scope{parent, current});
    current = scopes.size - 1;
    return current;
}

void scope_chain::pop() {
    if (current == ROOT_SCOPE) {
        throw adso_exception{fk_internal, "interpreter",
            "attempted to pop the root scope", source_loc{}};
    }
    auto prev = scopes[current].previous;
    scopes.pop_back();
    current = prev;
}

const binding* scope_chain::find(const string& name) const {
    auto id = current;
    while (true) {
        auto res = scopes[id].bindings.get(name);
        if (res != nullptr) {
            return res;
        } else if (id == ROOT_SCOPE) {
            return nullptr;
        }
        id = scopes[id].parent;
    }
}

const binding& scope_chain::lookup(const string& name,
        const source_loc& loc) const {
    auto res = find(name);
    if (res == nullptr) {
        throw unbound_name_error{name, loc};
    }
    return *res;
}

void scope_chain::define(const string& name, const binding& b) {
    scopes[current].bindings.insert(name, b);
}

}
