// src/parser/blocks.cpp
#include "parser.hpp"

// ---------- helper: parse block ----------
std::unique_ptr<BlockNode> Parser::parse_block() {
    Token openTok = expect(TokenType::OPENBRACE, "'{' to start block");
    auto block = std::make_unique<BlockNode>();
    block->token = openTok;

    while (peek().type != TokenType::CLOSEBRACE && peek().type != TokenType::EOF_TOKEN) {
        if (match(TokenType::SEMICOLON)) continue;
        block->body.push_back(parse_statement());
    }
    expect(TokenType::CLOSEBRACE, "'}' to close block");
    return block;
}
