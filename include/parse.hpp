#ifndef __ADSO_PARSE_HPP
#define __ADSO_PARSE_HPP

#include "ast.hpp"
#include "base.hpp"
#include "scan.hpp"

namespace adso_parse {

using namespace adso;
using namespace adso_scan;

// Recursive descent parser. Decisions are made with one token of lookahead,
// except after an atom in an expression, where the parser skips whitespace and
// peeks at the next raw character to tell calls and binary operators apart.
// Errors are thrown as parse_error (or lex_error from the scanner) on the first
// malformed token; there is no backtracking. Expressions and if statements may
// be nested at most ADSO_MAX_NESTING_DEPTH levels deep.
class parser {
public:
    parser(scanner* sc);

    // program := fn_def+
    unique_ptr<ast_program> parse_program();

private:
    scanner* sc;
    // number of expressions and if statements currently being parsed
    u32 depth;

    // skip whitespace and return the next raw character (EOF at the end)
    int peek();
    // get the next token and check its kind. context names the production
    // for error messages.
    token eat(const char* context, token_kind tk);
    // get an identifier token and return its name
    string ident(const char* context);

    unique_ptr<ast_fn_def> parse_fn_def();
    // '{' stmt* '}'
    vector<unique_ptr<ast_stmt>> parse_body(const char* context);
    unique_ptr<ast_stmt> parse_stmt();
    // these take the already-consumed keyword token
    unique_ptr<ast_stmt> parse_if(const token& t0);
    unique_ptr<ast_stmt> parse_return(const token& t0);

    unique_ptr<ast_expr> parse_expr();
    // '(' expr? ')' following a function name
    unique_ptr<ast_expr> parse_call_tail(const token& name);
    // the operator and right-hand side of a binary expression
    unique_ptr<ast_expr> parse_binop_tail(unique_ptr<ast_expr> left);
};

// parse a whole program from the scanner. Throws on failure.
unique_ptr<ast_program> parse_program(scanner* sc);

// Parse a whole program from a string or stream. On failure, returns null and
// sets err.
unique_ptr<ast_program> parse_string(const string& src,
        const string& filename,
        fault* err);
unique_ptr<ast_program> parse_stream(std::istream& in,
        const string& filename,
        fault* err);

}
#endif
