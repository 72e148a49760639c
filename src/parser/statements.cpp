// src/parser/statements.cpp
#include "parser.hpp"

std::unique_ptr<StatementNode> Parser::parse_statement() {
    Token p = peek();
    std::unique_ptr<StatementNode> stmt;

    switch (p.type) {
        case TokenType::LET:
            stmt = parse_variable_declaration();
            break;
        case TokenType::FN:
            // `fn name(...)` declares; a bare `fn(...)` is an expression
            if (peek_next().type == TokenType::IDENTIFIER) {
                stmt = parse_function_declaration();
            } else {
                stmt = parse_expression_statement();
            }
            break;
        case TokenType::STRUCT:
            stmt = parse_struct_declaration();
            break;
        case TokenType::RETURN:
            stmt = parse_return_statement();
            break;
        case TokenType::IMPORT:
            stmt = parse_import_statement();
            break;
        case TokenType::WHILE:
            stmt = parse_while_statement();
            break;
        case TokenType::FOR:
            stmt = parse_for_statement();
            break;
        case TokenType::BREAK:
            stmt = parse_break_statement();
            break;
        case TokenType::CONTINUE:
            stmt = parse_continue_statement();
            break;
        default:
            stmt = parse_expression_statement();
            break;
    }

    // statement terminators are optional
    match(TokenType::SEMICOLON);
    return stmt;
}

std::unique_ptr<StatementNode> Parser::parse_variable_declaration() {
    expect(TokenType::LET, "'let'");
    Token idTok = expect(TokenType::IDENTIFIER, "variable name after 'let'");
    expect(TokenType::ASSIGN, "'=' after variable name");

    auto node = std::make_unique<LetStatementNode>();
    node->token = idTok;
    node->identifier = idTok.value;
    node->value = parse_expression();
    return node;
}

// fn name(a, b) { ... }  ==>  let name = fn(a, b) { ... }
std::unique_ptr<StatementNode> Parser::parse_function_declaration() {
    Token fnTok = expect(TokenType::FN, "'fn'");
    Token nameTok = expect(TokenType::IDENTIFIER, "function name");

    auto node = std::make_unique<LetStatementNode>();
    node->token = nameTok;
    node->identifier = nameTok.value;
    node->value = parse_function_literal(fnTok, nameTok.value);
    return node;
}

std::unique_ptr<StatementNode> Parser::parse_struct_declaration() {
    expect(TokenType::STRUCT, "'struct'");
    Token nameTok = expect(TokenType::IDENTIFIER, "struct name");
    expect(TokenType::OPENBRACE, "'{' to start struct body");

    auto node = std::make_unique<StructDeclarationNode>();
    node->token = nameTok;
    node->name = nameTok.value;

    auto already_declared = [&](const std::string& member) {
        for (const auto& f : node->fields)
            if (f.name == member) return true;
        for (const auto& m : node->methods)
            if (m.name == member) return true;
        return false;
    };

    while (peek().type != TokenType::CLOSEBRACE) {
        Token memberTok = expect(TokenType::IDENTIFIER, "field or method name in struct body");
        if (already_declared(memberTok.value)) {
            throw GiuError("ParseError",
                "Duplicate member '" + memberTok.value + "' in struct '" + node->name + "'",
                memberTok.loc);
        }
        expect(TokenType::COLON, "':' after struct member name");

        // function literals declare methods; anything else is a field default
        if (peek().type == TokenType::FN && peek_next().type == TokenType::OPENPARENTHESIS) {
            Token fnTok = consume();
            node->methods.push_back(StructMethodNode{memberTok.value, parse_function_literal(fnTok, memberTok.value), memberTok});
        } else {
            node->fields.push_back(StructFieldNode{memberTok.value, parse_expression(), memberTok});
        }

        if (!match(TokenType::COMMA)) break;
    }
    expect(TokenType::CLOSEBRACE, "'}' to close struct '" + node->name + "'");
    return node;
}

std::unique_ptr<StatementNode> Parser::parse_return_statement() {
    Token retTok = expect(TokenType::RETURN, "'return'");
    auto node = std::make_unique<ReturnStatementNode>();
    node->token = retTok;

    TokenType next = peek().type;
    if (next != TokenType::SEMICOLON && next != TokenType::CLOSEBRACE && next != TokenType::EOF_TOKEN) {
        node->value = parse_expression();
    }
    return node;
}

// import a.b;  /  import a.b.{x, y};
std::unique_ptr<StatementNode> Parser::parse_import_statement() {
    Token importTok = expect(TokenType::IMPORT, "'import'");
    auto node = std::make_unique<ImportDeclarationNode>();
    node->token = importTok;

    node->path.push_back(expect(TokenType::IDENTIFIER, "module name after 'import'").value);
    while (match(TokenType::DOT)) {
        if (peek().type == TokenType::OPENBRACE) {
            consume();
            while (peek().type != TokenType::CLOSEBRACE) {
                Token nameTok = expect(TokenType::IDENTIFIER, "imported name");
                node->names.push_back(nameTok.value);
                node->name_tokens.push_back(nameTok);
                if (!match(TokenType::COMMA)) break;
            }
            expect(TokenType::CLOSEBRACE, "'}' to close import list");
            if (node->names.empty()) {
                throw GiuError("ParseError", "Empty import list for module '" + node->module_name() + "'", importTok.loc);
            }
            break;
        }
        node->path.push_back(expect(TokenType::IDENTIFIER, "module path segment after '.'").value);
    }
    return node;
}

std::unique_ptr<StatementNode> Parser::parse_expression_statement() {
    Token start = peek();
    auto node = std::make_unique<ExpressionStatementNode>();
    node->token = start;
    node->expression = parse_expression();
    return node;
}
