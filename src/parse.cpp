#include "parse.hpp"
#include "config.h"

#include <cstdio>
#include <sstream>

namespace adso_parse {

static string describe_peek(int ch) {
    if (ch == EOF) {
        return "EOF";
    }
    return string{"'"} + (char)ch + "'";
}

// counts one level of parser nesting while it's alive
class nesting_guard {
    u32* depth;

public:
    nesting_guard(u32* depth, const char* context, const source_loc& loc)
        : depth{depth} {
        if (*depth >= ADSO_MAX_NESTING_DEPTH) {
            throw parse_error{context,
                "at most " + std::to_string(ADSO_MAX_NESTING_DEPTH)
                    + " levels of nesting",
                "deeper nesting",
                loc};
        }
        ++*depth;
    }
    ~nesting_guard() {
        --*depth;
    }
};

parser::parser(scanner* sc)
    : sc{sc}
    , depth{0} {
}

int parser::peek() {
    sc->eof_skip_ws();
    return sc->peek_char();
}

token parser::eat(const char* context, token_kind tk) {
    auto tok = sc->next_token();
    if (tok.tk != tk) {
        throw parse_error{context,
            string{"'"} + token_kind_name(tk) + "'",
            tok.to_string(),
            tok.loc};
    }
    return tok;
}

string parser::ident(const char* context) {
    auto tok = sc->next_token();
    if (tok.tk != tk_ident) {
        throw parse_error{context, "identifier", tok.to_string(), tok.loc};
    }
    return tok.str;
}

unique_ptr<ast_program> parser::parse_program() {
    auto res = std::make_unique<ast_program>();
    if (sc->eof_skip_ws()) {
        throw parse_error{"Program", "function definition", "EOF",
            sc->get_loc()};
    }
    while (!sc->eof_skip_ws()) {
        res->defs.push_back(parse_fn_def());
    }
    return res;
}

// fn_def := ident ident '(' (ident ident)? ')' '{' stmt* '}'
unique_ptr<ast_fn_def> parser::parse_fn_def() {
    auto res = std::make_unique<ast_fn_def>();
    res->loc = sc->get_loc();
    res->return_type = ident("FnDef");
    res->name = ident("FnDef");
    eat("FnDef", tk_lparen);
    if (peek() != ')') {
        res->param_type = ident("FnDef");
        res->param_name = ident("FnDef");
    }
    eat("FnDef", tk_rparen);
    res->body = parse_body("FnDef");
    return res;
}

vector<unique_ptr<ast_stmt>> parser::parse_body(const char* context) {
    vector<unique_ptr<ast_stmt>> res;
    eat(context, tk_lbrace);
    // at EOF, parse_stmt() reports the missing brace
    while (peek() != '}') {
        res.push_back(parse_stmt());
    }
    eat(context, tk_rbrace);
    return res;
}

// stmt := if_st | return_st | fn_call ';'
unique_ptr<ast_stmt> parser::parse_stmt() {
    auto t0 = sc->next_token();
    switch (t0.tk) {
    case tk_if:
        return parse_if(t0);
    case tk_return:
        return parse_return(t0);
    case tk_ident: {
        auto call = parse_call_tail(t0);
        eat("St", tk_semicolon);
        return mk_call_stmt(t0.loc, std::move(call));
    }
    default:
        throw parse_error{"St", "statement", t0.to_string(), t0.loc};
    }
}

// if_st := 'if' '(' expr ')' '{' stmt* '}'
unique_ptr<ast_stmt> parser::parse_if(const token& t0) {
    nesting_guard guard{&depth, "IfSt", t0.loc};
    eat("IfSt", tk_lparen);
    auto condition = parse_expr();
    eat("IfSt", tk_rparen);
    auto body = parse_body("IfSt");
    return mk_if_stmt(t0.loc, std::move(condition), std::move(body));
}

// return_st := 'return' expr ';'
unique_ptr<ast_stmt> parser::parse_return(const token& t0) {
    auto val = parse_expr();
    eat("ReturnSt", tk_semicolon);
    return mk_return_stmt(t0.loc, std::move(val));
}

// expr := (number | ident) [ fn_call_tail | bin_op_tail ]
unique_ptr<ast_expr> parser::parse_expr() {
    nesting_guard guard{&depth, "Expr", sc->get_loc()};
    auto t0 = sc->next_token();
    unique_ptr<ast_expr> atom;
    switch (t0.tk) {
    case tk_number:
        atom = mk_number_expr(t0.loc, t0.num);
        break;
    case tk_ident:
        atom = mk_ident_expr(t0.loc, t0.str);
        break;
    default:
        throw parse_error{"Expr", "number or identifier", t0.to_string(),
            t0.loc};
    }

    auto ch = peek();
    switch (ch) {
    case '(':
        if (t0.tk != tk_ident) {
            throw parse_error{"Expr", "operator or end of expression",
                describe_peek(ch), sc->get_loc()};
        }
        return parse_call_tail(t0);
    case '*':
    case '-':
    case '<':
        return parse_binop_tail(std::move(atom));
    default:
        return atom;
    }
}

// fn_call := ident '(' expr? ')'
unique_ptr<ast_expr> parser::parse_call_tail(const token& name) {
    eat("FnCall", tk_lparen);
    unique_ptr<ast_expr> arg;
    if (peek() != ')') {
        arg = parse_expr();
    }
    eat("FnCall", tk_rparen);
    return mk_call_expr(name.loc, name.str, std::move(arg));
}

// bin_op_tail := ('*' | '-' | '<') expr
unique_ptr<ast_expr> parser::parse_binop_tail(unique_ptr<ast_expr> left) {
    auto op_tok = sc->next_token();
    binop_kind op;
    switch (op_tok.tk) {
    case tk_star:
        op = bk_mul;
        break;
    case tk_minus:
        op = bk_sub;
        break;
    case tk_lt:
        op = bk_lt;
        break;
    default:
        throw parse_error{"ArithExpr", "operator", op_tok.to_string(),
            op_tok.loc};
    }
    auto right = parse_expr();
    return mk_binop_expr(op_tok.loc, std::move(left), op, std::move(right));
}

unique_ptr<ast_program> parse_program(scanner* sc) {
    parser p{sc};
    return p.parse_program();
}

unique_ptr<ast_program> parse_stream(std::istream& in,
        const string& filename,
        fault* err) {
    scanner sc{&in, filename};
    try {
        return parse_program(&sc);
    } catch (const adso_exception& e) {
        e.to_fault(err);
    }
    return nullptr;
}

unique_ptr<ast_program> parse_string(const string& src,
        const string& filename,
        fault* err) {
    std::istringstream in{src};
    return parse_stream(in, filename, err);
}

}
