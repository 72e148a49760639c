#pragma once
#include <memory>
#include <vector>

#include "GiuError.hpp"
#include "ast.hpp"
#include "token.hpp"

// Recursive-descent parser with a precedence-climbing expression chain.
// The first syntax error aborts the parse with GiuError("ParseError", ...).
class Parser {
   public:
    Parser(const std::vector<Token>& tokens);
    std::unique_ptr<ProgramNode> parse();

   private:
    std::vector<Token> tokens;
    size_t position = 0;

    Token peek() const;
    Token peek_next(size_t offset = 1) const;

    Token consume();
    bool match(TokenType t);
    Token expect(TokenType t, const std::string& expected);
    GiuError parse_error(const Token& tok, const std::string& expected) const;

    bool is_struct_literal_ahead() const;

    // expression parsing (precedence chain, lowest first)
    std::unique_ptr<ExpressionNode> parse_expression();
    std::unique_ptr<ExpressionNode> parse_assignment();
    std::unique_ptr<ExpressionNode> parse_logical_or();
    std::unique_ptr<ExpressionNode> parse_logical_and();
    std::unique_ptr<ExpressionNode> parse_equality();
    std::unique_ptr<ExpressionNode> parse_comparison();
    std::unique_ptr<ExpressionNode> parse_additive();
    std::unique_ptr<ExpressionNode> parse_multiplicative();
    std::unique_ptr<ExpressionNode> parse_unary();
    std::unique_ptr<ExpressionNode> parse_postfix(std::unique_ptr<ExpressionNode> expr);
    std::unique_ptr<ExpressionNode> parse_primary();
    std::unique_ptr<ExpressionNode> parse_call(std::unique_ptr<ExpressionNode> callee);

    std::unique_ptr<ExpressionNode> parse_integer_literal();
    std::unique_ptr<ExpressionNode> parse_array_literal();
    std::unique_ptr<ExpressionNode> parse_hash_literal();
    std::unique_ptr<ExpressionNode> parse_struct_literal();
    std::unique_ptr<FunctionExpressionNode> parse_function_literal(const Token& fnTok, const std::string& name);
    std::vector<std::string> parse_parameter_list();

    // statements
    std::unique_ptr<StatementNode> parse_statement();
    std::unique_ptr<StatementNode> parse_variable_declaration();
    std::unique_ptr<StatementNode> parse_function_declaration();
    std::unique_ptr<StatementNode> parse_struct_declaration();
    std::unique_ptr<StatementNode> parse_return_statement();
    std::unique_ptr<StatementNode> parse_import_statement();
    std::unique_ptr<StatementNode> parse_expression_statement();

    // control-flow parsing
    std::unique_ptr<ExpressionNode> parse_if_expression();
    std::unique_ptr<StatementNode> parse_while_statement();
    std::unique_ptr<StatementNode> parse_for_statement();
    std::unique_ptr<StatementNode> parse_for_in_statement(const Token& forTok);
    std::unique_ptr<StatementNode> parse_for_classic_statement(const Token& forTok);
    std::unique_ptr<StatementNode> parse_break_statement();
    std::unique_ptr<StatementNode> parse_continue_statement();

    // `{ statement* }`
    std::unique_ptr<BlockNode> parse_block();
};
