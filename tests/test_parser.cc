#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

#include "GiuError.hpp"
#include "ast.hpp"
#include "lexer.hpp"
#include "parser.hpp"

using namespace std;

// Helper: run lexer + parser
static unique_ptr<ProgramNode> parseProgram(const string& src, const string& filename = "<test>") {
    Lexer lx(src, filename);
    auto toks = lx.tokenize();
    Parser p(toks);
    return p.parse();
}

// Helper: canonical form of the first statement
static string firstStatement(const string& src) {
    auto prog = parseProgram(src);
    if (prog->body.empty()) return "";
    return prog->body[0]->to_string();
}

// --- Tests --------------------------------------------------------------

TEST(ParserBasic, LetDeclaration) {
    unique_ptr<ProgramNode> prog;
    ASSERT_NO_THROW(prog = parseProgram("let x = 42;"));
    ASSERT_EQ(prog->body.size(), 1u);
    auto let = dynamic_cast<LetStatementNode*>(prog->body[0].get());
    ASSERT_NE(let, nullptr);
    EXPECT_EQ(let->identifier, "x");
    EXPECT_EQ(let->to_string(), "let x = 42;");
}

TEST(ParserBasic, SemicolonsAreOptional) {
    auto prog = parseProgram("let a = 1\nlet b = 2\na + b");
    EXPECT_EQ(prog->body.size(), 3u);
}

TEST(ParserBasic, EmptyProgram) {
    auto prog = parseProgram("");
    EXPECT_TRUE(prog->body.empty());
}

TEST(ParserPrecedence, MultiplicationBindsTighterThanAddition) {
    EXPECT_EQ(firstStatement("1 + 2 * 3"), "(1 + (2 * 3))");
    EXPECT_EQ(firstStatement("(1 + 2) * 3"), "((1 + 2) * 3)");
}

TEST(ParserPrecedence, LeftAssociativeArithmetic) {
    EXPECT_EQ(firstStatement("10 - 4 - 3"), "((10 - 4) - 3)");
    EXPECT_EQ(firstStatement("8 / 2 % 3"), "((8 / 2) % 3)");
}

TEST(ParserPrecedence, ComparisonBelowArithmeticAboveLogic) {
    EXPECT_EQ(firstStatement("a + 1 < b && c == d || e"), "((((a + 1) < b) && (c == d)) || e)");
}

TEST(ParserPrecedence, UnaryOperators) {
    EXPECT_EQ(firstStatement("-a * b"), "((-a) * b)");
    EXPECT_EQ(firstStatement("!x == y"), "((!x) == y)");
}

TEST(ParserPrecedence, AssignmentIsRightAssociative) {
    EXPECT_EQ(firstStatement("a = b = 3"), "(a = (b = 3))");
}

TEST(ParserExpressions, PostfixChains) {
    EXPECT_EQ(firstStatement("a.b[1](2, 3)"), "(a.b[1])(2, 3)");
    EXPECT_EQ(firstStatement("xs.push(1).len()"), "xs.push(1).len()");
}

TEST(ParserExpressions, ArrayAndHashLiterals) {
    EXPECT_EQ(firstStatement("[1, \"two\", [3]]"), "[1, \"two\", [3]]");
    EXPECT_EQ(firstStatement("let h = {\"a\": 1, 2: true}"), "let h = {\"a\": 1, 2: true};");
}

TEST(ParserExpressions, StructLiteral) {
    EXPECT_EQ(firstStatement("Point { x: 1, y: 2 }"), "Point { x: 1, y: 2 }");
    EXPECT_EQ(firstStatement("let p = Point {}"), "let p = Point { };");
}

TEST(ParserExpressions, FunctionLiteralAndDeclaration) {
    EXPECT_EQ(firstStatement("let add = fn(a, b) { a + b }"), "let add = fn(a, b) { (a + b) };");

    auto prog = parseProgram("fn add(a, b) { return a + b; }");
    auto let = dynamic_cast<LetStatementNode*>(prog->body[0].get());
    ASSERT_NE(let, nullptr);
    EXPECT_EQ(let->identifier, "add");
    auto fn = dynamic_cast<FunctionExpressionNode*>(let->value.get());
    ASSERT_NE(fn, nullptr);
    EXPECT_EQ(fn->name, "add");
    EXPECT_EQ(fn->parameters, (vector<string>{"a", "b"}));
}

TEST(ParserControlFlow, IfElseIfChain) {
    auto prog = parseProgram("if (a) { 1 } else if (b) { 2 } else { 3 }");
    auto stmt = dynamic_cast<ExpressionStatementNode*>(prog->body[0].get());
    ASSERT_NE(stmt, nullptr);
    auto ifx = dynamic_cast<IfExpressionNode*>(stmt->expression.get());
    ASSERT_NE(ifx, nullptr);
    ASSERT_NE(ifx->else_block, nullptr);
    ASSERT_EQ(ifx->else_block->body.size(), 1u);
    auto nested = dynamic_cast<ExpressionStatementNode*>(ifx->else_block->body[0].get());
    ASSERT_NE(nested, nullptr);
    EXPECT_NE(dynamic_cast<IfExpressionNode*>(nested->expression.get()), nullptr);
}

TEST(ParserControlFlow, WhileAndForIn) {
    auto prog = parseProgram("while (i < 3) { i = i + 1; }\nfor (x in xs) { print(x); }");
    ASSERT_EQ(prog->body.size(), 2u);
    EXPECT_NE(dynamic_cast<WhileStatementNode*>(prog->body[0].get()), nullptr);
    auto forin = dynamic_cast<ForInStatementNode*>(prog->body[1].get());
    ASSERT_NE(forin, nullptr);
    EXPECT_EQ(forin->variable, "x");
}

TEST(ParserControlFlow, ClassicForWithOptionalClauses) {
    auto prog = parseProgram("for (let i = 0; i < 3; i = i + 1) { }\nfor (;;) { break; }");
    ASSERT_EQ(prog->body.size(), 2u);
    auto full = dynamic_cast<ForStatementNode*>(prog->body[0].get());
    ASSERT_NE(full, nullptr);
    EXPECT_NE(full->init, nullptr);
    EXPECT_NE(full->condition, nullptr);
    EXPECT_NE(full->post, nullptr);

    auto bare = dynamic_cast<ForStatementNode*>(prog->body[1].get());
    ASSERT_NE(bare, nullptr);
    EXPECT_EQ(bare->init, nullptr);
    EXPECT_EQ(bare->condition, nullptr);
    EXPECT_EQ(bare->post, nullptr);
}

TEST(ParserStructs, StructDeclarationSplitsFieldsAndMethods) {
    auto prog = parseProgram(
        "struct Counter {\n"
        "  count: 0,\n"
        "  step: 1,\n"
        "  inc: fn() { this.count = this.count + this.step; }\n"
        "}\n");
    auto decl = dynamic_cast<StructDeclarationNode*>(prog->body[0].get());
    ASSERT_NE(decl, nullptr);
    EXPECT_EQ(decl->name, "Counter");
    ASSERT_EQ(decl->fields.size(), 2u);
    EXPECT_EQ(decl->fields[0].name, "count");
    ASSERT_EQ(decl->methods.size(), 1u);
    EXPECT_EQ(decl->methods[0].name, "inc");
}

TEST(ParserImports, WholeAndSelectiveImports) {
    auto prog = parseProgram("import utils.math;\nimport std.string.{join, repeat};");
    ASSERT_EQ(prog->body.size(), 2u);

    auto whole = dynamic_cast<ImportDeclarationNode*>(prog->body[0].get());
    ASSERT_NE(whole, nullptr);
    EXPECT_EQ(whole->path, (vector<string>{"utils", "math"}));
    EXPECT_TRUE(whole->names.empty());

    auto sel = dynamic_cast<ImportDeclarationNode*>(prog->body[1].get());
    ASSERT_NE(sel, nullptr);
    EXPECT_EQ(sel->path, (vector<string>{"std", "string"}));
    EXPECT_EQ(sel->names, (vector<string>{"join", "repeat"}));
    EXPECT_EQ(sel->to_string(), "import std.string.{join, repeat};");
}

TEST(ParserErrors, InvalidAssignmentTarget) {
    EXPECT_THROW(parseProgram("1 = 2"), GiuError);
    EXPECT_THROW(parseProgram("f() = 2"), GiuError);
}

TEST(ParserErrors, ReportsExpectedConstructAndPosition) {
    try {
        parseProgram("let = 5;");
        FAIL() << "expected a parse error";
    } catch (const GiuError& e) {
        EXPECT_EQ(e.kind(), "ParseError");
        EXPECT_EQ(e.location().line, 1);
        EXPECT_EQ(e.location().col, 5);
    }
}

TEST(ParserErrors, UnclosedBlockMentionsEndOfInput) {
    try {
        parseProgram("fn f() { return 1;");
        FAIL() << "expected a parse error";
    } catch (const GiuError& e) {
        EXPECT_NE(e.message().find("end of input"), string::npos);
    }
}

TEST(ParserClone, CloneKeepsCanonicalForm) {
    auto prog = parseProgram("let f = fn(n) { if (n < 2) { n } else { f(n - 1) + f(n - 2) } }");
    auto let = dynamic_cast<LetStatementNode*>(prog->body[0].get());
    ASSERT_NE(let, nullptr);
    auto copy = let->clone();
    EXPECT_EQ(copy->to_string(), let->to_string());
}

// --- Literal round trip -------------------------------------------------

// Parses `src` as a single literal expression and re-lexes its printed form.
static vector<Token> relexLiteral(const string& src, string& printed) {
    auto prog = parseProgram(src);
    auto stmt = dynamic_cast<ExpressionStatementNode*>(prog->body[0].get());
    printed = stmt ? stmt->expression->to_string() : "";
    Lexer lx(printed, "<relex>");
    return lx.tokenize();
}

TEST(ParserLiterals, StringLiteralRelexesToSameToken) {
    const string src = R"("tab\there \"quoted\" back\\slash\r\nnul\0 caf)" "\xC3\xA9" R"(")";
    Lexer original(src, "<test>");
    Token first = original.tokenize()[0];

    string printed;
    auto again = relexLiteral(src, printed);
    ASSERT_EQ(again.size(), 2u) << printed;
    EXPECT_EQ(again[0].type, TokenType::STRING);
    EXPECT_EQ(again[0].value, first.value);
    EXPECT_EQ(printed, src);
}

TEST(ParserLiterals, IntegerLiteralRelexesToSameToken) {
    for (const string src : {"0", "42", "9223372036854775807", "9223372036854775808",
             "123456789012345678901234567890123"}) {
        string printed;
        auto again = relexLiteral(src, printed);
        ASSERT_EQ(again.size(), 2u) << src;
        EXPECT_EQ(again[0].type, TokenType::INTEGER);
        EXPECT_EQ(again[0].value, src);
    }
}

TEST(ParserLiterals, OversizedIntegerIsMarkedBig) {
    auto prog = parseProgram("9223372036854775808");
    auto stmt = dynamic_cast<ExpressionStatementNode*>(prog->body[0].get());
    ASSERT_NE(stmt, nullptr);
    auto lit = dynamic_cast<IntegerLiteralNode*>(stmt->expression.get());
    ASSERT_NE(lit, nullptr);
    EXPECT_TRUE(lit->is_big);
    EXPECT_EQ(lit->to_string(), "9223372036854775808");
}

TEST(ParserClone, ClonedFunctionSharesBody) {
    auto prog = parseProgram("fn twice(n) { n * 2 }");
    auto let = dynamic_cast<LetStatementNode*>(prog->body[0].get());
    ASSERT_NE(let, nullptr);
    auto fn = dynamic_cast<FunctionExpressionNode*>(let->value.get());
    ASSERT_NE(fn, nullptr);
    auto copy = fn->clone_function();
    EXPECT_EQ(copy->body, fn->body);
    EXPECT_EQ(copy->to_string(), fn->to_string());
}
