#ifndef __ADSO_SCAN_HPP
#define __ADSO_SCAN_HPP

#include "base.hpp"

#include <iostream>

namespace adso_scan {

using namespace adso;

enum token_kind {
    // eof
    tk_eof,
    // keywords
    tk_if,
    tk_return,
    // atoms
    tk_ident,
    tk_number,
    // paired delimiters
    tk_lparen,
    tk_rparen,
    tk_lbrace,
    tk_rbrace,
    // punctuation and operators
    tk_semicolon,
    tk_lt,
    tk_star,
    tk_minus
};

// printable name of a token kind, used in parser diagnostics
const char* token_kind_name(token_kind tk);

struct token {
    token_kind tk;
    // location of the first character of the token
    source_loc loc;
    // name for identifiers, spelling for everything else
    string str;
    // only valid for numbers
    i64 num;

    token() : tk{tk_eof}, num{0} { }
    token(token_kind tk, const source_loc& loc, const string& str)
        : tk{tk}
        , loc{loc}
        , str{str}
        , num{0} {
    }
    token(const source_loc& loc, const string& digits, i64 num)
        : tk{tk_number}
        , loc{loc}
        , str{digits}
        , num{num} {
    }

    string to_string() const;
};


class scanner {
public:
    scanner(std::istream* in, const string& filename="", int line=1, int col=0)
        : input{in}
        , filename{filename}
        , line{line}
        , col{col} {
    }

    // Get the next token. Once the input is exhausted this keeps returning
    // tk_eof tokens. Throws lex_error on malformed input.
    token next_token();

    // tell if EOF has been reached
    bool eof();
    // skip whitespace, then tell if EOF has been reached
    bool eof_skip_ws();
    // the next raw character without consuming it, or EOF at the end of input
    int peek_char();

    // location of the next character
    source_loc get_loc() const;

private:
    std::istream *input;

    // these track location in input (used for generating error messages).
    // col is the number of characters consumed on the current line.
    string filename;
    int line;
    int col;

    // increment the scanner position, keeping track of lines and columns
    void advance(char ch);
    // this raises a lex_error at EOF
    char get_char();

    // methods to scan variable-length tokens. first is the first character,
    // which has already been consumed.
    token scan_number(const source_loc& start, char first);
    token scan_word(const source_loc& start, char first);

    [[noreturn]] void error(const string& msg, const source_loc& loc);
};

}


#endif
