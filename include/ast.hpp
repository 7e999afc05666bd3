#ifndef __ADSO_AST_HPP
#define __ADSO_AST_HPP

#include "base.hpp"

namespace adso_parse {

using namespace adso;

enum expr_kind {
    ek_number,
    ek_ident,
    ek_call,
    ek_binop
};

enum binop_kind {
    bk_mul,
    bk_sub,
    bk_lt
};

// source spelling of an operator
const char* binop_name(binop_kind op);

struct ast_expr {
    source_loc loc;
    expr_kind kind;
    i64 num = 0;               // only used for numbers
    string name;               // used for identifiers and calls
    binop_kind op = bk_mul;    // only used for binops
    // call argument. Null for calls without an argument and for all other
    // kinds of expression.
    unique_ptr<ast_expr> arg;
    // binop operands. left is always a number or identifier.
    unique_ptr<ast_expr> left;
    unique_ptr<ast_expr> right;

    bool is_atom() const {
        return kind == ek_number || kind == ek_ident;
    }

    // render as source code
    string as_string() const;
    // structural equality. Source locations are ignored.
    bool equals(const ast_expr& other) const;
};

unique_ptr<ast_expr> mk_number_expr(const source_loc& loc, i64 num);
unique_ptr<ast_expr> mk_ident_expr(const source_loc& loc, const string& name);
// arg may be null
unique_ptr<ast_expr> mk_call_expr(const source_loc& loc,
        const string& name,
        unique_ptr<ast_expr> arg);
// left must be a number or identifier
unique_ptr<ast_expr> mk_binop_expr(const source_loc& loc,
        unique_ptr<ast_expr> left,
        binop_kind op,
        unique_ptr<ast_expr> right);

enum stmt_kind {
    sk_if,
    sk_return,
    sk_call
};

struct ast_stmt {
    source_loc loc;
    stmt_kind kind;
    // the condition of an if, the value of a return, or the call expression
    // of a call statement
    unique_ptr<ast_expr> expr;
    // only used for if statements
    vector<unique_ptr<ast_stmt>> body;

    // render as source code, indented by depth levels
    string as_string(u32 depth=0) const;
    bool equals(const ast_stmt& other) const;
};

unique_ptr<ast_stmt> mk_if_stmt(const source_loc& loc,
        unique_ptr<ast_expr> condition,
        vector<unique_ptr<ast_stmt>> body);
unique_ptr<ast_stmt> mk_return_stmt(const source_loc& loc,
        unique_ptr<ast_expr> val);
// call must be an ek_call expression
unique_ptr<ast_stmt> mk_call_stmt(const source_loc& loc,
        unique_ptr<ast_expr> call);

struct ast_fn_def {
    source_loc loc;
    string return_type;
    string name;
    // these are either both present or both absent
    optional<string> param_type;
    optional<string> param_name;
    vector<unique_ptr<ast_stmt>> body;

    bool has_param() const {
        return param_name.has_value();
    }

    string as_string() const;
    bool equals(const ast_fn_def& other) const;
};

// The program owns every node reachable from it. Declaration order is kept,
// but it only matters when two functions share a name (the later one wins).
struct ast_program {
    vector<unique_ptr<ast_fn_def>> defs;

    string as_string() const;
    bool equals(const ast_program& other) const;
};

}

#endif
