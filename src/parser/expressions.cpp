// src/parser/expressions.cpp
#include <cstdint>
#include <limits>

#include "parser.hpp"

std::unique_ptr<ExpressionNode> Parser::parse_expression() {
    return parse_assignment();
}

// assignment is right-associative and binds loosest
std::unique_ptr<ExpressionNode> Parser::parse_assignment() {
    auto left = parse_logical_or();
    if (peek().type != TokenType::ASSIGN) return left;

    Token opTok = consume();
    bool assignable = dynamic_cast<IdentifierNode*>(left.get()) ||
        dynamic_cast<IndexExpressionNode*>(left.get()) ||
        dynamic_cast<MemberExpressionNode*>(left.get());
    if (!assignable) {
        throw GiuError("ParseError",
            "Invalid assignment target '" + left->to_string() + "'; expected identifier, index or field",
            opTok.loc);
    }

    auto node = std::make_unique<AssignmentExpressionNode>();
    node->token = opTok;
    node->target = std::move(left);
    node->value = parse_assignment();
    return node;
}

std::unique_ptr<ExpressionNode> Parser::parse_logical_or() {
    auto left = parse_logical_and();
    while (peek().type == TokenType::OR) {
        Token opTok = consume();
        auto right = parse_logical_and();
        auto node = std::make_unique<BinaryExpressionNode>();
        node->op = opTok.value;
        node->left = std::move(left);
        node->right = std::move(right);
        node->token = opTok;
        left = std::move(node);
    }
    return left;
}

std::unique_ptr<ExpressionNode> Parser::parse_logical_and() {
    auto left = parse_equality();
    while (peek().type == TokenType::AND) {
        Token opTok = consume();
        auto right = parse_equality();
        auto node = std::make_unique<BinaryExpressionNode>();
        node->op = opTok.value;
        node->left = std::move(left);
        node->right = std::move(right);
        node->token = opTok;
        left = std::move(node);
    }
    return left;
}

std::unique_ptr<ExpressionNode> Parser::parse_equality() {
    auto left = parse_comparison();
    while (peek().type == TokenType::EQUALITY || peek().type == TokenType::NOTEQUAL) {
        Token opTok = consume();
        auto right = parse_comparison();
        auto node = std::make_unique<BinaryExpressionNode>();
        node->op = opTok.value;
        node->left = std::move(left);
        node->right = std::move(right);
        node->token = opTok;
        left = std::move(node);
    }
    return left;
}

std::unique_ptr<ExpressionNode> Parser::parse_comparison() {
    auto left = parse_additive();
    while (peek().type == TokenType::GREATERTHAN || peek().type == TokenType::GREATEROREQUALTHAN ||
        peek().type == TokenType::LESSTHAN || peek().type == TokenType::LESSOREQUALTHAN) {
        Token opTok = consume();
        auto right = parse_additive();
        auto node = std::make_unique<BinaryExpressionNode>();
        node->op = opTok.value;
        node->left = std::move(left);
        node->right = std::move(right);
        node->token = opTok;
        left = std::move(node);
    }
    return left;
}

std::unique_ptr<ExpressionNode> Parser::parse_additive() {
    auto left = parse_multiplicative();
    while (peek().type == TokenType::PLUS || peek().type == TokenType::MINUS) {
        Token opTok = consume();
        auto right = parse_multiplicative();
        auto node = std::make_unique<BinaryExpressionNode>();
        node->op = opTok.value;
        node->left = std::move(left);
        node->right = std::move(right);
        node->token = opTok;
        left = std::move(node);
    }
    return left;
}

std::unique_ptr<ExpressionNode> Parser::parse_multiplicative() {
    auto left = parse_unary();
    while (peek().type == TokenType::STAR || peek().type == TokenType::SLASH || peek().type == TokenType::PERCENT) {
        Token opTok = consume();
        auto right = parse_unary();
        auto node = std::make_unique<BinaryExpressionNode>();
        node->op = opTok.value;
        node->left = std::move(left);
        node->right = std::move(right);
        node->token = opTok;
        left = std::move(node);
    }
    return left;
}

std::unique_ptr<ExpressionNode> Parser::parse_unary() {
    Token p = peek();
    if (p.type == TokenType::NOT || p.type == TokenType::MINUS) {
        Token opTok = consume();
        auto operand = parse_unary();
        auto node = std::make_unique<UnaryExpressionNode>();
        node->op = opTok.value;
        node->operand = std::move(operand);
        node->token = opTok;
        return node;
    }
    return parse_postfix(parse_primary());
}

// call / index / member chains: a.b(c)[d]
std::unique_ptr<ExpressionNode> Parser::parse_postfix(std::unique_ptr<ExpressionNode> expr) {
    while (true) {
        if (peek().type == TokenType::OPENPARENTHESIS) {
            expr = parse_call(std::move(expr));
            continue;
        }

        if (peek().type == TokenType::OPENBRACKET) {
            Token openTok = consume();
            auto idx = parse_expression();
            expect(TokenType::CLOSEBRACKET, "']' after index expression");
            auto node = std::make_unique<IndexExpressionNode>();
            node->object = std::move(expr);
            node->index = std::move(idx);
            node->token = openTok;
            expr = std::move(node);
            continue;
        }

        if (peek().type == TokenType::DOT) {
            Token dotTok = consume();
            Token propTok = expect(TokenType::IDENTIFIER, "field or method name after '.'");
            auto node = std::make_unique<MemberExpressionNode>();
            node->object = std::move(expr);
            node->property = propTok.value;
            node->token = propTok;
            expr = std::move(node);
            continue;
        }

        break;
    }
    return expr;
}

std::unique_ptr<ExpressionNode> Parser::parse_call(std::unique_ptr<ExpressionNode> callee) {
    Token openTok = expect(TokenType::OPENPARENTHESIS, "'(' to start argument list");
    auto call = std::make_unique<CallExpressionNode>();
    call->callee = std::move(callee);
    call->token = openTok;

    if (peek().type != TokenType::CLOSEPARENTHESIS) {
        do {
            if (peek().type == TokenType::CLOSEPARENTHESIS) break;  // trailing comma
            call->arguments.push_back(parse_expression());
        } while (match(TokenType::COMMA));
    }
    expect(TokenType::CLOSEPARENTHESIS, "')' after call arguments");
    return call;
}

std::unique_ptr<ExpressionNode> Parser::parse_primary() {
    Token t = peek();

    switch (t.type) {
        case TokenType::INTEGER:
            return parse_integer_literal();

        case TokenType::STRING: {
            consume();
            auto node = std::make_unique<StringLiteralNode>();
            node->value = t.value;
            node->token = t;
            return node;
        }

        case TokenType::TRUE:
        case TokenType::FALSE: {
            consume();
            auto node = std::make_unique<BooleanLiteralNode>();
            node->value = t.type == TokenType::TRUE;
            node->token = t;
            return node;
        }

        case TokenType::NULL_LITERAL: {
            consume();
            auto node = std::make_unique<NullNode>();
            node->token = t;
            return node;
        }

        case TokenType::THIS: {
            consume();
            auto node = std::make_unique<ThisExpressionNode>();
            node->token = t;
            return node;
        }

        case TokenType::IDENTIFIER: {
            if (is_struct_literal_ahead()) return parse_struct_literal();
            consume();
            auto node = std::make_unique<IdentifierNode>();
            node->name = t.value;
            node->token = t;
            return node;
        }

        case TokenType::OPENPARENTHESIS: {
            consume();
            auto inner = parse_expression();
            expect(TokenType::CLOSEPARENTHESIS, "')' to close grouped expression");
            return inner;
        }

        case TokenType::OPENBRACKET:
            return parse_array_literal();

        case TokenType::OPENBRACE:
            return parse_hash_literal();

        case TokenType::FN: {
            Token fnTok = consume();
            return parse_function_literal(fnTok, "");
        }

        case TokenType::IF:
            return parse_if_expression();

        default:
            break;
    }

    throw parse_error(t, "expression");
}

std::unique_ptr<ExpressionNode> Parser::parse_integer_literal() {
    Token t = consume();
    auto node = std::make_unique<IntegerLiteralNode>();
    node->token = t;
    node->digits = t.value;

    // accumulate with overflow detection; oversized literals become BigInteger at eval time
    const int64_t max = std::numeric_limits<int64_t>::max();
    int64_t acc = 0;
    for (char c : t.value) {
        int d = c - '0';
        if (acc > (max - d) / 10) {
            node->is_big = true;
            break;
        }
        acc = acc * 10 + d;
    }
    if (!node->is_big) node->value = acc;
    return node;
}

std::unique_ptr<ExpressionNode> Parser::parse_array_literal() {
    Token openTok = expect(TokenType::OPENBRACKET, "'['");
    auto arr = std::make_unique<ArrayExpressionNode>();
    arr->token = openTok;

    while (peek().type != TokenType::CLOSEBRACKET) {
        arr->elements.push_back(parse_expression());
        if (!match(TokenType::COMMA)) break;
    }
    expect(TokenType::CLOSEBRACKET, "']' to close array literal");
    return arr;
}

std::unique_ptr<ExpressionNode> Parser::parse_hash_literal() {
    Token openTok = expect(TokenType::OPENBRACE, "'{'");
    auto hash = std::make_unique<HashMapExpressionNode>();
    hash->token = openTok;

    while (peek().type != TokenType::CLOSEBRACE) {
        auto key = parse_expression();
        expect(TokenType::COLON, "':' after hash key");
        auto value = parse_expression();
        hash->entries.emplace_back(std::move(key), std::move(value));
        if (!match(TokenType::COMMA)) break;
    }
    expect(TokenType::CLOSEBRACE, "'}' to close hash literal");
    return hash;
}

// Name { } or Name { ident: ... }
bool Parser::is_struct_literal_ahead() const {
    if (peek().type != TokenType::IDENTIFIER || peek_next().type != TokenType::OPENBRACE) return false;
    TokenType after = peek_next(2).type;
    if (after == TokenType::CLOSEBRACE) return true;
    return after == TokenType::IDENTIFIER && peek_next(3).type == TokenType::COLON;
}

std::unique_ptr<ExpressionNode> Parser::parse_struct_literal() {
    Token nameTok = expect(TokenType::IDENTIFIER, "struct name");
    expect(TokenType::OPENBRACE, "'{' after struct name");

    auto lit = std::make_unique<StructLiteralNode>();
    lit->token = nameTok;
    lit->struct_name = nameTok.value;

    while (peek().type != TokenType::CLOSEBRACE) {
        Token fieldTok = expect(TokenType::IDENTIFIER, "field name in struct literal");
        expect(TokenType::COLON, "':' after field name");
        lit->fields.push_back(FieldInitializer{fieldTok.value, parse_expression(), fieldTok});
        if (!match(TokenType::COMMA)) break;
    }
    expect(TokenType::CLOSEBRACE, "'}' to close struct literal");
    return lit;
}

std::vector<std::string> Parser::parse_parameter_list() {
    expect(TokenType::OPENPARENTHESIS, "'(' to start parameter list");
    std::vector<std::string> params;
    while (peek().type != TokenType::CLOSEPARENTHESIS) {
        Token p = expect(TokenType::IDENTIFIER, "parameter name");
        for (const auto& existing : params) {
            if (existing == p.value) {
                throw GiuError("ParseError", "Duplicate parameter name '" + p.value + "'", p.loc);
            }
        }
        params.push_back(p.value);
        if (!match(TokenType::COMMA)) break;
    }
    expect(TokenType::CLOSEPARENTHESIS, "')' after parameters");
    return params;
}

// `fn` has already been consumed
std::unique_ptr<FunctionExpressionNode> Parser::parse_function_literal(const Token& fnTok, const std::string& name) {
    auto fn = std::make_unique<FunctionExpressionNode>();
    fn->token = fnTok;
    fn->name = name;
    fn->parameters = parse_parameter_list();
    fn->body = parse_block();
    return fn;
}
