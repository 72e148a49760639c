#pragma once

#include <memory>
#include <string>
#include <vector>

#include "GiuError.hpp"
#include "SourceManager.hpp"
#include "token.hpp"

// Pull-based tokenizer. next_token() yields one token at a time and keeps
// returning EOF_TOKEN once the input is exhausted; reset() rewinds to the start.
// Lexical errors are thrown as GiuError("LexError", ...).
class Lexer {
   public:
    Lexer(const std::string& source, const std::string& filename = "");

    Token next_token();
    void reset();

    // Drains the stream from the start; the last element is always EOF_TOKEN.
    std::vector<Token> tokenize();

    std::shared_ptr<const SourceManager> source_manager() const { return src_mgr; }

   private:
    const std::string src;
    const std::string filename;
    std::shared_ptr<const SourceManager> src_mgr;
    size_t i = 0;
    int line = 1;
    int col = 1;

    // helpers
    bool eof() const;
    char peek(size_t offset = 0) const;
    char peek_next() const;
    char advance();

    Token make_token(TokenType type, const std::string& value, int tok_line, int tok_col, int tok_length = -1) const;
    GiuError lex_error(const std::string& message, int tok_line, int tok_col) const;

    void skip_whitespace_and_comments();
    Token scan_number(int tok_line, int tok_col);
    Token scan_identifier_or_keyword(int tok_line, int tok_col);
    Token scan_quoted_string(int tok_line, int tok_col);
    Token scan_operator(int tok_line, int tok_col);
    void skip_line_comment();
};
