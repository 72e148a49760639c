// src/parser/parser.cpp
#include "parser.hpp"

Parser::Parser(const std::vector<Token>& tokens) : tokens(tokens) {}

// Return current token or EOF token
Token Parser::peek() const {
    if (position < tokens.size()) return tokens[position];
    if (!tokens.empty()) return tokens.back();
    return Token{
        TokenType::EOF_TOKEN,
        "",
        TokenLocation("<eof>", 0, 0, 0)};
}

Token Parser::peek_next(size_t offset) const {
    if (position + offset < tokens.size()) {
        return tokens[position + offset];
    }
    if (!tokens.empty()) return tokens.back();
    return Token{
        TokenType::EOF_TOKEN,
        "",
        TokenLocation("<eof>", 0, 0, 0)};
}

// Consume and return the next token; EOF is never consumed past.
Token Parser::consume() {
    Token t = peek();
    if (position < tokens.size() && t.type != TokenType::EOF_TOKEN) position++;
    return t;
}

bool Parser::match(TokenType t) {
    if (peek().type == t) {
        consume();
        return true;
    }
    return false;
}

GiuError Parser::parse_error(const Token& tok, const std::string& expected) const {
    std::string found = tok.type == TokenType::EOF_TOKEN ? "end of input" : "'" + tok.value + "'";
    return GiuError("ParseError", "Expected " + expected + ", found " + found, tok.loc);
}

Token Parser::expect(TokenType t, const std::string& expected) {
    if (peek().type != t) {
        throw parse_error(peek(), expected);
    }
    return consume();
}

std::unique_ptr<ProgramNode> Parser::parse() {
    auto program = std::make_unique<ProgramNode>();
    program->token = peek();
    while (peek().type != TokenType::EOF_TOKEN) {
        if (match(TokenType::SEMICOLON)) continue;
        program->body.push_back(parse_statement());
    }
    return program;
}
