#include "lexer.hpp"

#include <cctype>
#include <unordered_map>

std::string token_type_name(TokenType type) {
    switch (type) {
        case TokenType::LET: return "'let'";
        case TokenType::FN: return "'fn'";
        case TokenType::STRUCT: return "'struct'";
        case TokenType::RETURN: return "'return'";
        case TokenType::IMPORT: return "'import'";
        case TokenType::IF: return "'if'";
        case TokenType::ELSE: return "'else'";
        case TokenType::WHILE: return "'while'";
        case TokenType::FOR: return "'for'";
        case TokenType::IN: return "'in'";
        case TokenType::BREAK: return "'break'";
        case TokenType::CONTINUE: return "'continue'";
        case TokenType::IDENTIFIER: return "identifier";
        case TokenType::INTEGER: return "integer literal";
        case TokenType::STRING: return "string literal";
        case TokenType::TRUE: return "'true'";
        case TokenType::FALSE: return "'false'";
        case TokenType::NULL_LITERAL: return "'null'";
        case TokenType::THIS: return "'this'";
        case TokenType::SEMICOLON: return "';'";
        case TokenType::COMMA: return "','";
        case TokenType::COLON: return "':'";
        case TokenType::DOT: return "'.'";
        case TokenType::OPENPARENTHESIS: return "'('";
        case TokenType::CLOSEPARENTHESIS: return "')'";
        case TokenType::OPENBRACE: return "'{'";
        case TokenType::CLOSEBRACE: return "'}'";
        case TokenType::OPENBRACKET: return "'['";
        case TokenType::CLOSEBRACKET: return "']'";
        case TokenType::ASSIGN: return "'='";
        case TokenType::PLUS: return "'+'";
        case TokenType::MINUS: return "'-'";
        case TokenType::STAR: return "'*'";
        case TokenType::SLASH: return "'/'";
        case TokenType::PERCENT: return "'%'";
        case TokenType::NOT: return "'!'";
        case TokenType::AND: return "'&&'";
        case TokenType::OR: return "'||'";
        case TokenType::EQUALITY: return "'=='";
        case TokenType::NOTEQUAL: return "'!='";
        case TokenType::LESSTHAN: return "'<'";
        case TokenType::LESSOREQUALTHAN: return "'<='";
        case TokenType::GREATERTHAN: return "'>'";
        case TokenType::GREATEROREQUALTHAN: return "'>='";
        case TokenType::EOF_TOKEN: return "end of input";
        case TokenType::UNKNOWN: return "unknown token";
    }
    return "unknown token";
}

// Constructor
Lexer::Lexer(const std::string& source, const std::string& filename)
    : src(source),
      filename(filename.empty() ? "<repl>" : filename),
      src_mgr(std::make_shared<SourceManager>(filename.empty() ? "<repl>" : filename, source)) {
    reset();
}

void Lexer::reset() {
    i = 0;
    line = 1;
    col = 1;
    // skip UTF-8 BOM if present
    if (src.size() >= 3 && (unsigned char)src[0] == 0xEF && (unsigned char)src[1] == 0xBB && (unsigned char)src[2] == 0xBF) {
        i = 3;
    }
}

bool Lexer::eof() const {
    return i >= src.size();
}
char Lexer::peek(size_t offset) const {
    size_t idx = i + offset;
    if (idx >= src.size()) return '\0';
    return src[idx];
}
char Lexer::peek_next() const {
    return peek(1);
}

char Lexer::advance() {
    if (eof()) return '\0';
    char c = src[i++];
    if (c == '\n') {
        line++;
        col = 1;
    } else {
        col++;
    }
    return c;
}

Token Lexer::make_token(TokenType type, const std::string& value, int tok_line, int tok_col, int tok_length) const {
    int len = tok_length >= 0 ? tok_length : static_cast<int>(value.size());
    return Token{type, value, TokenLocation(filename, tok_line, tok_col, len, src_mgr)};
}

GiuError Lexer::lex_error(const std::string& message, int tok_line, int tok_col) const {
    return GiuError("LexError", message, TokenLocation(filename, tok_line, tok_col, 1, src_mgr));
}

void Lexer::skip_line_comment() {
    while (!eof() && peek() != '\n') advance();
}

void Lexer::skip_whitespace_and_comments() {
    while (!eof()) {
        char c = peek();
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
            advance();
        } else if (c == '/' && peek_next() == '/') {
            skip_line_comment();
        } else {
            break;
        }
    }
}

// Integer literals keep their digits verbatim; the parser decides between
// Integer and BigInteger so oversized literals are never rejected here.
Token Lexer::scan_number(int tok_line, int tok_col) {
    std::string digits;
    while (!eof() && std::isdigit((unsigned char)peek())) {
        digits.push_back(advance());
    }
    if (std::isalpha((unsigned char)peek()) || peek() == '_') {
        throw lex_error("Invalid numeric literal '" + digits + std::string(1, peek()) + "'", tok_line, tok_col);
    }
    return make_token(TokenType::INTEGER, digits, tok_line, tok_col);
}

Token Lexer::scan_identifier_or_keyword(int tok_line, int tok_col) {
    std::string id;
    while (!eof()) {
        char c = peek();
        if (std::isalnum((unsigned char)c) || c == '_')
            id.push_back(advance());
        else
            break;
    }

    static const std::unordered_map<std::string, TokenType> keywords = {
        {"let", TokenType::LET},
        {"fn", TokenType::FN},
        {"struct", TokenType::STRUCT},
        {"return", TokenType::RETURN},
        {"import", TokenType::IMPORT},

        // control-flow keywords
        {"if", TokenType::IF},
        {"else", TokenType::ELSE},
        {"while", TokenType::WHILE},
        {"for", TokenType::FOR},
        {"in", TokenType::IN},
        {"break", TokenType::BREAK},
        {"continue", TokenType::CONTINUE},

        // literal keywords
        {"true", TokenType::TRUE},
        {"false", TokenType::FALSE},
        {"null", TokenType::NULL_LITERAL},
        {"this", TokenType::THIS},
    };

    auto it = keywords.find(id);
    if (it != keywords.end()) {
        return make_token(it->second, id, tok_line, tok_col);
    }
    return make_token(TokenType::IDENTIFIER, id, tok_line, tok_col);
}

// start position is the opening quote
Token Lexer::scan_quoted_string(int tok_line, int tok_col) {
    size_t start_index = i;
    advance();  // opening quote
    std::string val;

    while (true) {
        if (eof()) {
            throw lex_error("Unterminated string literal", tok_line, tok_col);
        }
        char c = peek();
        if (c == '"') {
            advance();
            break;
        }
        if (c == '\\') {
            advance();  // consume backslash
            char nxt = peek();
            if (nxt == 'n') {
                val.push_back('\n');
            } else if (nxt == 't') {
                val.push_back('\t');
            } else if (nxt == 'r') {
                val.push_back('\r');
            } else if (nxt == '0') {
                val.push_back('\0');
            } else if (nxt == '"') {
                val.push_back('"');
            } else if (nxt == '\\') {
                val.push_back('\\');
            } else if (nxt == '\0' && eof()) {
                throw lex_error("Unterminated string literal", tok_line, tok_col);
            } else {
                throw lex_error(std::string("Unknown escape sequence '\\") + nxt + "'", line, col - 1);
            }
            advance();
            continue;
        }
        val.push_back(advance());
    }

    return make_token(TokenType::STRING, val, tok_line, tok_col, static_cast<int>(i - start_index));
}

Token Lexer::scan_operator(int tok_line, int tok_col) {
    char c = advance();
    char n = peek();

    switch (c) {
        case ';': return make_token(TokenType::SEMICOLON, ";", tok_line, tok_col);
        case ',': return make_token(TokenType::COMMA, ",", tok_line, tok_col);
        case ':': return make_token(TokenType::COLON, ":", tok_line, tok_col);
        case '.': return make_token(TokenType::DOT, ".", tok_line, tok_col);
        case '(': return make_token(TokenType::OPENPARENTHESIS, "(", tok_line, tok_col);
        case ')': return make_token(TokenType::CLOSEPARENTHESIS, ")", tok_line, tok_col);
        case '{': return make_token(TokenType::OPENBRACE, "{", tok_line, tok_col);
        case '}': return make_token(TokenType::CLOSEBRACE, "}", tok_line, tok_col);
        case '[': return make_token(TokenType::OPENBRACKET, "[", tok_line, tok_col);
        case ']': return make_token(TokenType::CLOSEBRACKET, "]", tok_line, tok_col);
        case '+': return make_token(TokenType::PLUS, "+", tok_line, tok_col);
        case '-': return make_token(TokenType::MINUS, "-", tok_line, tok_col);
        case '*': return make_token(TokenType::STAR, "*", tok_line, tok_col);
        case '/': return make_token(TokenType::SLASH, "/", tok_line, tok_col);
        case '%': return make_token(TokenType::PERCENT, "%", tok_line, tok_col);
        case '=':
            if (n == '=') {
                advance();
                return make_token(TokenType::EQUALITY, "==", tok_line, tok_col);
            }
            return make_token(TokenType::ASSIGN, "=", tok_line, tok_col);
        case '!':
            if (n == '=') {
                advance();
                return make_token(TokenType::NOTEQUAL, "!=", tok_line, tok_col);
            }
            return make_token(TokenType::NOT, "!", tok_line, tok_col);
        case '<':
            if (n == '=') {
                advance();
                return make_token(TokenType::LESSOREQUALTHAN, "<=", tok_line, tok_col);
            }
            return make_token(TokenType::LESSTHAN, "<", tok_line, tok_col);
        case '>':
            if (n == '=') {
                advance();
                return make_token(TokenType::GREATEROREQUALTHAN, ">=", tok_line, tok_col);
            }
            return make_token(TokenType::GREATERTHAN, ">", tok_line, tok_col);
        case '&':
            if (n == '&') {
                advance();
                return make_token(TokenType::AND, "&&", tok_line, tok_col);
            }
            break;
        case '|':
            if (n == '|') {
                advance();
                return make_token(TokenType::OR, "||", tok_line, tok_col);
            }
            break;
        default:
            break;
    }
    throw lex_error(std::string("Unexpected character '") + c + "'", tok_line, tok_col);
}

Token Lexer::next_token() {
    skip_whitespace_and_comments();

    int tok_line = line;
    int tok_col = col;
    if (eof()) {
        return make_token(TokenType::EOF_TOKEN, "", tok_line, tok_col, 0);
    }

    char c = peek();
    if (std::isdigit((unsigned char)c)) {
        return scan_number(tok_line, tok_col);
    }
    if (std::isalpha((unsigned char)c) || c == '_') {
        return scan_identifier_or_keyword(tok_line, tok_col);
    }
    if (c == '"') {
        return scan_quoted_string(tok_line, tok_col);
    }
    return scan_operator(tok_line, tok_col);
}

std::vector<Token> Lexer::tokenize() {
    reset();
    std::vector<Token> out;
    while (true) {
        Token t = next_token();
        bool done = t.type == TokenType::EOF_TOKEN;
        out.push_back(std::move(t));
        if (done) break;
    }
    return out;
}
