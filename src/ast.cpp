#include "ast.hpp"

#include <sstream>

namespace adso_parse {

const char* binop_name(binop_kind op) {
    switch (op) {
    case bk_mul:
        return "*";
    case bk_sub:
        return "-";
    case bk_lt:
        return "<";
    }
    return "";
}

unique_ptr<ast_expr> mk_number_expr(const source_loc& loc, i64 num) {
    auto res = std::make_unique<ast_expr>();
    res->loc = loc;
    res->kind = ek_number;
    res->num = num;
    return res;
}

unique_ptr<ast_expr> mk_ident_expr(const source_loc& loc, const string& name) {
    auto res = std::make_unique<ast_expr>();
    res->loc = loc;
    res->kind = ek_ident;
    res->name = name;
    return res;
}

unique_ptr<ast_expr> mk_call_expr(const source_loc& loc,
        const string& name,
        unique_ptr<ast_expr> arg) {
    auto res = std::make_unique<ast_expr>();
    res->loc = loc;
    res->kind = ek_call;
    res->name = name;
    res->arg = std::move(arg);
    return res;
}

unique_ptr<ast_expr> mk_binop_expr(const source_loc& loc,
        unique_ptr<ast_expr> left,
        binop_kind op,
        unique_ptr<ast_expr> right) {
    if (!left->is_atom()) {
        throw adso_exception{fk_internal, "parser",
            "binary expression built with a compound left operand", loc};
    }
    auto res = std::make_unique<ast_expr>();
    res->loc = loc;
    res->kind = ek_binop;
    res->op = op;
    res->left = std::move(left);
    res->right = std::move(right);
    return res;
}

string ast_expr::as_string() const {
    switch (kind) {
    case ek_number:
        return std::to_string(num);
    case ek_ident:
        return name;
    case ek_call:
        return name + "(" + (arg ? arg->as_string() : "") + ")";
    case ek_binop:
        // the right operand binds everything to its right, so no parentheses
        // are needed
        return left->as_string() + " " + binop_name(op) + " "
            + right->as_string();
    }
    return "";
}

// compare two optional children
template<typename T>
static bool child_equals(const unique_ptr<T>& a, const unique_ptr<T>& b) {
    if (!a || !b) {
        return !a && !b;
    }
    return a->equals(*b);
}

static bool body_equals(const vector<unique_ptr<ast_stmt>>& a,
        const vector<unique_ptr<ast_stmt>>& b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (!a[i]->equals(*b[i])) {
            return false;
        }
    }
    return true;
}

bool ast_expr::equals(const ast_expr& other) const {
    if (kind != other.kind) {
        return false;
    }
    switch (kind) {
    case ek_number:
        return num == other.num;
    case ek_ident:
        return name == other.name;
    case ek_call:
        return name == other.name && child_equals(arg, other.arg);
    case ek_binop:
        return op == other.op
            && child_equals(left, other.left)
            && child_equals(right, other.right);
    }
    return false;
}

unique_ptr<ast_stmt> mk_if_stmt(const source_loc& loc,
        unique_ptr<ast_expr> condition,
        vector<unique_ptr<ast_stmt>> body) {
    auto res = std::make_unique<ast_stmt>();
    res->loc = loc;
    res->kind = sk_if;
    res->expr = std::move(condition);
    res->body = std::move(body);
    return res;
}

unique_ptr<ast_stmt> mk_return_stmt(const source_loc& loc,
        unique_ptr<ast_expr> val) {
    auto res = std::make_unique<ast_stmt>();
    res->loc = loc;
    res->kind = sk_return;
    res->expr = std::move(val);
    return res;
}

unique_ptr<ast_stmt> mk_call_stmt(const source_loc& loc,
        unique_ptr<ast_expr> call) {
    if (call->kind != ek_call) {
        throw adso_exception{fk_internal, "parser",
            "call statement built from a non-call expression", loc};
    }
    auto res = std::make_unique<ast_stmt>();
    res->loc = loc;
    res->kind = sk_call;
    res->expr = std::move(call);
    return res;
}

static void write_indent(std::ostream& os, u32 depth) {
    for (u32 i = 0; i < depth; ++i) {
        os << "    ";
    }
}

static void write_body(std::ostream& os,
        const vector<unique_ptr<ast_stmt>>& body,
        u32 depth) {
    os << "{\n";
    for (auto& s : body) {
        os << s->as_string(depth + 1);
    }
    write_indent(os, depth);
    os << "}";
}

string ast_stmt::as_string(u32 depth) const {
    std::ostringstream os;
    write_indent(os, depth);
    switch (kind) {
    case sk_if:
        os << "if (" << expr->as_string() << ") ";
        write_body(os, body, depth);
        break;
    case sk_return:
        os << "return " << expr->as_string() << ";";
        break;
    case sk_call:
        os << expr->as_string() << ";";
        break;
    }
    os << '\n';
    return os.str();
}

bool ast_stmt::equals(const ast_stmt& other) const {
    return kind == other.kind
        && child_equals(expr, other.expr)
        && body_equals(body, other.body);
}

string ast_fn_def::as_string() const {
    std::ostringstream os;
    os << return_type << " " << name << "(";
    if (has_param()) {
        os << *param_type << " " << *param_name;
    }
    os << ") ";
    write_body(os, body, 0);
    os << '\n';
    return os.str();
}

bool ast_fn_def::equals(const ast_fn_def& other) const {
    return return_type == other.return_type
        && name == other.name
        && param_type == other.param_type
        && param_name == other.param_name
        && body_equals(body, other.body);
}

string ast_program::as_string() const {
    string res;
    for (u32 i = 0; i < defs.size(); ++i) {
        if (i > 0) {
            res += '\n';
        }
        res += defs[i]->as_string();
    }
    return res;
}

bool ast_program::equals(const ast_program& other) const {
    if (defs.size() != other.defs.size()) {
        return false;
    }
    for (size_t i = 0; i < defs.size(); ++i) {
        if (!defs[i]->equals(*other.defs[i])) {
            return false;
        }
    }
    return true;
}

}
