#pragma once

#include <algorithm>
#include <memory>
#include <string>

#include "SourceManager.hpp"

// Token types (keep in sync with the lexer keyword table and the parser)
enum class TokenType {
    // -----------------------
    // Declarations / statements
    // -----------------------
    LET,
    FN,
    STRUCT,
    RETURN,
    IMPORT,

    // -----------------------
    // Control-flow
    // -----------------------
    IF,
    ELSE,
    WHILE,
    FOR,
    IN,
    BREAK,
    CONTINUE,

    // -----------------------
    // Literals & identifiers
    // -----------------------
    IDENTIFIER,
    INTEGER,  // decimal digits; may exceed 64 bits
    STRING,
    TRUE,
    FALSE,
    NULL_LITERAL,
    THIS,

    // -----------------------
    // Punctuation
    // -----------------------
    SEMICOLON,
    COMMA,
    COLON,
    DOT,
    OPENPARENTHESIS,
    CLOSEPARENTHESIS,
    OPENBRACE,
    CLOSEBRACE,
    OPENBRACKET,
    CLOSEBRACKET,

    // -----------------------
    // Operators
    // -----------------------
    ASSIGN,
    PLUS,
    MINUS,
    STAR,
    SLASH,
    PERCENT,
    NOT,
    AND,
    OR,
    EQUALITY,
    NOTEQUAL,
    LESSTHAN,
    LESSOREQUALTHAN,
    GREATERTHAN,
    GREATEROREQUALTHAN,

    EOF_TOKEN,
    UNKNOWN
};

std::string token_type_name(TokenType type);

// Small struct for token location / span in source
struct TokenLocation {
   public:
    std::string filename;  // source filename (or "<repl>")
    int line = 1;          // 1-based
    int col = 1;           // 1-based column of token start
    int length = 0;        // token length in characters

    // shared so that locations held by long-lived AST (closures, REPL history) stay valid
    std::shared_ptr<const SourceManager> src_mgr;

    TokenLocation() = default;
    TokenLocation(const std::string& fn, int ln, int c, int len = 0, std::shared_ptr<const SourceManager> mgr = nullptr)
        : filename(fn), line(ln), col(c), length(len), src_mgr(std::move(mgr)) {}

    int end_col() const { return col + std::max(0, length - 1); }

    std::string to_string() const {
        return filename + ":" + std::to_string(line) + ":" + std::to_string(col);
    }
    std::string get_line_trace() const;
};

// Represents a single token with location
struct Token {
    TokenType type = TokenType::UNKNOWN;
    std::string value;  // raw lexeme (unescaped for strings)
    TokenLocation loc;

    Token() = default;
    Token(TokenType t, const std::string& v, const TokenLocation& l)
        : type(t), value(v), loc(l) {}

    const std::string& filename() const { return loc.filename; }
    int line() const { return loc.line; }
    int col() const { return loc.col; }
    int length() const { return loc.length; }

    std::string debug_string() const {
        return loc.to_string() + " " + token_type_name(type) + " [" + value + "]";
    }
};

inline std::string TokenLocation::get_line_trace() const {
    if (!src_mgr) {
        return "(source context unavailable)";
    }
    return src_mgr->render_trace(line, col, length);
}
