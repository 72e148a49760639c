// src/parser/control_flow.cpp
#include "parser.hpp"

// if (cond) { ... } [else if (...) { ... }]* [else { ... }]
std::unique_ptr<ExpressionNode> Parser::parse_if_expression() {
    Token ifTok = expect(TokenType::IF, "'if'");
    auto node = std::make_unique<IfExpressionNode>();
    node->token = ifTok;

    expect(TokenType::OPENPARENTHESIS, "'(' after 'if'");
    node->condition = parse_expression();
    expect(TokenType::CLOSEPARENTHESIS, "')' after if condition");
    node->then_block = parse_block();

    if (match(TokenType::ELSE)) {
        if (peek().type == TokenType::IF) {
            // else-if: nested if wrapped in a single-statement block
            Token nestedTok = peek();
            auto stmt = std::make_unique<ExpressionStatementNode>();
            stmt->token = nestedTok;
            stmt->expression = parse_if_expression();
            auto block = std::make_unique<BlockNode>();
            block->token = nestedTok;
            block->body.push_back(std::move(stmt));
            node->else_block = std::move(block);
        } else {
            node->else_block = parse_block();
        }
    }
    return node;
}

std::unique_ptr<StatementNode> Parser::parse_while_statement() {
    Token whileTok = expect(TokenType::WHILE, "'while'");
    auto node = std::make_unique<WhileStatementNode>();
    node->token = whileTok;

    expect(TokenType::OPENPARENTHESIS, "'(' after 'while'");
    node->condition = parse_expression();
    expect(TokenType::CLOSEPARENTHESIS, "')' after while condition");
    node->body = parse_block();
    return node;
}

std::unique_ptr<StatementNode> Parser::parse_for_statement() {
    Token forTok = expect(TokenType::FOR, "'for'");
    expect(TokenType::OPENPARENTHESIS, "'(' after 'for'");

    if (peek().type == TokenType::IDENTIFIER && peek_next().type == TokenType::IN) {
        return parse_for_in_statement(forTok);
    }
    return parse_for_classic_statement(forTok);
}

// `for (` already consumed
std::unique_ptr<StatementNode> Parser::parse_for_in_statement(const Token& forTok) {
    auto node = std::make_unique<ForInStatementNode>();
    node->token = forTok;
    node->variable = expect(TokenType::IDENTIFIER, "loop variable").value;
    expect(TokenType::IN, "'in' after loop variable");
    node->iterable = parse_expression();
    expect(TokenType::CLOSEPARENTHESIS, "')' after for-in header");
    node->body = parse_block();
    return node;
}

// `for (` already consumed
std::unique_ptr<StatementNode> Parser::parse_for_classic_statement(const Token& forTok) {
    auto node = std::make_unique<ForStatementNode>();
    node->token = forTok;

    if (peek().type != TokenType::SEMICOLON) {
        if (peek().type == TokenType::LET) {
            node->init = parse_variable_declaration();
        } else {
            node->init = parse_expression_statement();
        }
    }
    expect(TokenType::SEMICOLON, "';' after for initializer");

    if (peek().type != TokenType::SEMICOLON) {
        node->condition = parse_expression();
    }
    expect(TokenType::SEMICOLON, "';' after for condition");

    if (peek().type != TokenType::CLOSEPARENTHESIS) {
        node->post = parse_expression();
    }
    expect(TokenType::CLOSEPARENTHESIS, "')' after for clauses");

    node->body = parse_block();
    return node;
}

std::unique_ptr<StatementNode> Parser::parse_break_statement() {
    Token t = expect(TokenType::BREAK, "'break'");
    auto node = std::make_unique<BreakStatementNode>();
    node->token = t;
    return node;
}

std::unique_ptr<StatementNode> Parser::parse_continue_statement() {
    Token t = expect(TokenType::CONTINUE, "'continue'");
    auto node = std::make_unique<ContinueStatementNode>();
    node->token = t;
    return node;
}
