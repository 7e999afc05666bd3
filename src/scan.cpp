#include "scan.hpp"

#include <cstdio>
#include <limits>

namespace adso_scan {

// is whitespace. Other control characters, including '\r', are lexical errors.
static inline bool is_ws(int c) {
    return c == ' ' || c == '\t' || c == '\n';
}

static inline bool is_digit(int c) {
    return c >= '0' && c <= '9';
}

static inline bool is_letter(int c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

// printable rendering of a character for error messages
static string describe_char(char c) {
    if (c >= 0x20 && c < 0x7f) {
        return string{"'"} + c + "'";
    }
    char buf[8];
    std::snprintf(buf, sizeof(buf), "\\x%02x", (unsigned)(u8)c);
    return buf;
}

const char* token_kind_name(token_kind tk) {
    switch (tk) {
    case tk_eof:
        return "EOF";
    case tk_if:
        return "if";
    case tk_return:
        return "return";
    case tk_ident:
        return "identifier";
    case tk_number:
        return "number";
    case tk_lparen:
        return "(";
    case tk_rparen:
        return ")";
    case tk_lbrace:
        return "{";
    case tk_rbrace:
        return "}";
    case tk_semicolon:
        return ";";
    case tk_lt:
        return "<";
    case tk_star:
        return "*";
    case tk_minus:
        return "-";
    }
    // this is unreachable code to silence a compiler warning
    return "";
}

string token::to_string() const {
    switch (tk) {
    case tk_ident:
        return "identifier '" + str + "'";
    case tk_number:
        return "number " + str;
    case tk_eof:
        return "EOF";
    default:
        return string{"'"} + token_kind_name(tk) + "'";
    }
}

source_loc scanner::get_loc() const {
    return source_loc{filename, line, col + 1};
}

// increment the scanner position, keeping track of lines and columns
void scanner::advance(char ch) {
    if (ch == '\n') {
        ++line;
        col = 0;
    } else {
        ++col;
    }
}

void scanner::error(const string& msg, const source_loc& loc) {
    throw lex_error{msg, loc};
}

// this is the main scanning function
token scanner::next_token() {
    while (!eof()) {
        auto start = get_loc();
        auto c = get_char();
        if (is_ws(c)) {
            continue;
        }
        switch (c) {
        case '(':
            return token{tk_lparen, start, "("};
        case ')':
            return token{tk_rparen, start, ")"};
        case '{':
            return token{tk_lbrace, start, "{"};
        case '}':
            return token{tk_rbrace, start, "}"};
        case ';':
            return token{tk_semicolon, start, ";"};
        case '<':
            return token{tk_lt, start, "<"};
        case '*':
            return token{tk_star, start, "*"};
        case '-':
            return token{tk_minus, start, "-"};
        }

        if (is_digit(c)) {
            return scan_number(start, c);
        } else if (is_letter(c)) {
            return scan_word(start, c);
        }
        error("Invalid lexical element starting with " + describe_char(c),
                start);
    }
    // if we get here, we encountered EOF
    return token{tk_eof, get_loc(), ""};
}

token scanner::scan_number(const source_loc& start, char first) {
    constexpr i64 max = std::numeric_limits<i64>::max();
    string digits{first};
    i64 total = first - '0';
    bool overflow = false;

    // consume the whole run even after an overflow so the error covers the
    // entire literal
    while (is_digit(peek_char())) {
        auto ch = get_char();
        digits.push_back(ch);
        i64 d = ch - '0';
        if (overflow || total > (max - d) / 10) {
            overflow = true;
        } else {
            total = total*10 + d;
        }
    }

    if (overflow) {
        error("can't parse " + digits + " as a number: out of range", start);
    }
    return token{start, digits, total};
}

token scanner::scan_word(const source_loc& start, char first) {
    string word{first};
    while (is_letter(peek_char())) {
        word.push_back(get_char());
    }

    if (word == "if") {
        return token{tk_if, start, word};
    } else if (word == "return") {
        return token{tk_return, start, word};
    }
    return token{tk_ident, start, word};
}

bool scanner::eof() {
    return input->peek() == EOF;
}

bool scanner::eof_skip_ws() {
    while (!eof() && is_ws(peek_char())) {
        get_char();
    }
    return eof();
}

char scanner::get_char() {
    if (eof()) {
        error("Unexpected EOF while scanning.", get_loc());
    }
    char c = input->get();
    advance(c);
    return c;
}

int scanner::peek_char() {
    if (eof()) {
        return EOF;
    }
    return input->peek();
}

}
