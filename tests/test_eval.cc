#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <sstream>

#include "GiuError.hpp"
#include "evaluator.hpp"
#include "lexer.hpp"
#include "parser.hpp"

// Helper functions to evaluate a source string and inspect the outcome
class EvaluatorTestHelper {
   public:
    static std::unique_ptr<ProgramNode> parse(const std::string& source) {
        Lexer lexer(source + "\n", "test.giu");
        std::vector<Token> tokens = lexer.tokenize();
        Parser parser(tokens);
        return parser.parse();
    }

    // Composite values are emptied when their evaluator goes away,
    // so only scalars are meaningful here.
    static Value eval(const std::string& source) {
        auto ast = parse(source);
        Evaluator evaluator;
        std::ostringstream sink;
        evaluator.set_output(sink);
        return evaluator.evaluate(ast.get());
    }

    static std::string evalToString(const std::string& source) {
        auto ast = parse(source);
        Evaluator evaluator;
        std::ostringstream sink;
        evaluator.set_output(sink);
        Value v = evaluator.evaluate(ast.get());
        return evaluator.value_to_string(v);
    }

    static std::string output(const std::string& source) {
        auto ast = parse(source);
        Evaluator evaluator;
        std::ostringstream out;
        evaluator.set_output(out);
        evaluator.evaluate(ast.get());
        return out.str();
    }

    static std::optional<RuntimeError> runError(const std::string& source) {
        auto ast = parse(source);
        Evaluator evaluator;
        std::ostringstream sink;
        evaluator.set_output(sink);
        EvalResult r = evaluator.execute(ast.get());
        if (r.is_error()) return r.error();
        return std::nullopt;
    }

    static RuntimeErrorKind errorKind(const std::string& source) {
        auto err = runError(source);
        EXPECT_TRUE(err.has_value()) << "expected a runtime error from: " << source;
        return err ? err->kind : RuntimeErrorKind::InvalidOperation;
    }
};

// ============================================================================
// BASIC ARITHMETIC TESTS
// ============================================================================

TEST(EvaluatorTest, EvaluatesSimpleAddition) {
    Value result = EvaluatorTestHelper::eval("5 + 3");

    ASSERT_TRUE(std::holds_alternative<int64_t>(result));
    EXPECT_EQ(std::get<int64_t>(result), 8);
}

TEST(EvaluatorTest, RespectsPrecedence) {
    Value result = EvaluatorTestHelper::eval("2 + 3 * 4 - (10 - 4) / 2");

    ASSERT_TRUE(std::holds_alternative<int64_t>(result));
    EXPECT_EQ(std::get<int64_t>(result), 11);
}

TEST(EvaluatorTest, DivisionTruncatesTowardZero) {
    EXPECT_EQ(std::get<int64_t>(EvaluatorTestHelper::eval("7 / 2")), 3);
    EXPECT_EQ(std::get<int64_t>(EvaluatorTestHelper::eval("-7 / 2")), -3);
}

TEST(EvaluatorTest, ModuloTakesSignOfDividend) {
    EXPECT_EQ(std::get<int64_t>(EvaluatorTestHelper::eval("7 % 3")), 1);
    EXPECT_EQ(std::get<int64_t>(EvaluatorTestHelper::eval("-7 % 3")), -1);
}

TEST(EvaluatorTest, DivisionByZeroIsRuntimeError) {
    EXPECT_EQ(EvaluatorTestHelper::errorKind("1 / 0"), RuntimeErrorKind::DivisionByZero);
    EXPECT_EQ(EvaluatorTestHelper::errorKind("1 % 0"), RuntimeErrorKind::ModuloByZero);
}

TEST(EvaluatorTest, EvaluateRaisesRuntimeErrorWithKind) {
    try {
        EvaluatorTestHelper::eval("let x = 10;\nx / 0");
        FAIL() << "expected a runtime error";
    } catch (const GiuError& e) {
        EXPECT_EQ(e.kind(), "RuntimeError");
        EXPECT_EQ(e.message().rfind("DivisionByZero: ", 0), 0u);
        EXPECT_EQ(e.location().line, 2);
    }
}

TEST(EvaluatorTest, StringConcatenation) {
    Value result = EvaluatorTestHelper::eval("\"foo\" + \"bar\"");

    ASSERT_TRUE(std::holds_alternative<std::string>(result));
    EXPECT_EQ(std::get<std::string>(result), "foobar");
}

TEST(EvaluatorTest, MixedOperandsAreTypeMismatch) {
    EXPECT_EQ(EvaluatorTestHelper::errorKind("\"a\" + 1"), RuntimeErrorKind::TypeMismatch);
    EXPECT_EQ(EvaluatorTestHelper::errorKind("true * 2"), RuntimeErrorKind::TypeMismatch);
    EXPECT_EQ(EvaluatorTestHelper::errorKind("-\"x\""), RuntimeErrorKind::TypeMismatch);
}

// ============================================================================
// INTEGER PROMOTION TESTS
// ============================================================================

TEST(EvaluatorPromotion, AdditionOverflowPromotesToBigInteger) {
    Value result = EvaluatorTestHelper::eval("9223372036854775807 + 1");

    ASSERT_TRUE(std::holds_alternative<BigInt>(result));
    EXPECT_EQ(std::get<BigInt>(result).str(), "9223372036854775808");
}

TEST(EvaluatorPromotion, BigIntegerCollapsesBackWhenItFits) {
    Value result = EvaluatorTestHelper::eval("let big = 9223372036854775807 + 1;\nbig - 1");

    ASSERT_TRUE(std::holds_alternative<int64_t>(result));
    EXPECT_EQ(std::get<int64_t>(result), 9223372036854775807LL);
}

TEST(EvaluatorPromotion, MinimumIntegerStaysFixedWidth) {
    Value result = EvaluatorTestHelper::eval("-9223372036854775807 - 1");

    ASSERT_TRUE(std::holds_alternative<int64_t>(result));
    EXPECT_EQ(std::get<int64_t>(result), std::numeric_limits<int64_t>::min());
}

TEST(EvaluatorPromotion, MultiplicationOfBigLiterals) {
    Value result = EvaluatorTestHelper::eval("100000000000000000000 * 100000000000000000000");

    ASSERT_TRUE(std::holds_alternative<BigInt>(result));
    EXPECT_EQ(std::get<BigInt>(result).str(), "1" + std::string(40, '0'));
}

TEST(EvaluatorPromotion, OversizedLiteralIsBigInteger) {
    EXPECT_EQ(EvaluatorTestHelper::evalToString("type(123456789012345678901234567890)"), "biginteger");
    EXPECT_EQ(EvaluatorTestHelper::evalToString("type(00042)"), "integer");
}

TEST(EvaluatorPromotion, FactorialGrowsPastSixtyFourBits) {
    std::string src =
        "fn fact(n) { if (n < 2) { 1 } else { n * fact(n - 1) } }\n"
        "fact(25)";
    EXPECT_EQ(EvaluatorTestHelper::evalToString(src), "15511210043330985984000000");
}

TEST(EvaluatorPromotion, MixedWidthsCompareByValue) {
    EXPECT_TRUE(std::get<bool>(EvaluatorTestHelper::eval("9223372036854775808 > 1")));
    EXPECT_TRUE(std::get<bool>(EvaluatorTestHelper::eval("(9223372036854775807 + 1) - 1 == 9223372036854775807")));
}

// ============================================================================
// COMPARISON AND LOGIC TESTS
// ============================================================================

TEST(EvaluatorLogic, Comparisons) {
    EXPECT_TRUE(std::get<bool>(EvaluatorTestHelper::eval("1 < 2")));
    EXPECT_TRUE(std::get<bool>(EvaluatorTestHelper::eval("2 >= 2")));
    EXPECT_TRUE(std::get<bool>(EvaluatorTestHelper::eval("\"apple\" < \"banana\"")));
    EXPECT_EQ(EvaluatorTestHelper::errorKind("1 < \"a\""), RuntimeErrorKind::TypeMismatch);
}

TEST(EvaluatorLogic, EqualityIsStructuralForCollections) {
    EXPECT_TRUE(std::get<bool>(EvaluatorTestHelper::eval("[1, [2, 3]] == [1, [2, 3]]")));
    EXPECT_TRUE(std::get<bool>(EvaluatorTestHelper::eval("{\"a\": 1} == {\"a\": 1}")));
    EXPECT_FALSE(std::get<bool>(EvaluatorTestHelper::eval("1 == \"1\"")));
    EXPECT_TRUE(std::get<bool>(EvaluatorTestHelper::eval("null == null")));
    EXPECT_TRUE(std::get<bool>(EvaluatorTestHelper::eval("[1] != [2]")));
}

TEST(EvaluatorLogic, EqualityOnCyclicCollectionsTerminates) {
    EXPECT_TRUE(std::get<bool>(EvaluatorTestHelper::eval(
        "let a = [1];\npush(a, a);\nlet b = [1];\npush(b, b);\na == b")));
    EXPECT_FALSE(std::get<bool>(EvaluatorTestHelper::eval(
        "let a = [1];\npush(a, a);\nlet b = [2];\npush(b, b);\na == b")));
    EXPECT_TRUE(std::get<bool>(EvaluatorTestHelper::eval(
        "let h = {};\nh[\"me\"] = h;\nlet g = {};\ng[\"me\"] = g;\nh == g")));
    EXPECT_FALSE(std::get<bool>(EvaluatorTestHelper::eval(
        "let h = {\"k\": 1};\nh[\"me\"] = h;\nlet g = {\"k\": 2};\ng[\"me\"] = g;\nh != h || h == g")));
}

TEST(EvaluatorLogic, ShortCircuitSkipsRightOperand) {
    EXPECT_FALSE(std::get<bool>(EvaluatorTestHelper::eval("false && undefined_name")));
    EXPECT_TRUE(std::get<bool>(EvaluatorTestHelper::eval("true || undefined_name")));
}

TEST(EvaluatorLogic, LogicRequiresBooleans) {
    EXPECT_EQ(EvaluatorTestHelper::errorKind("1 && true"), RuntimeErrorKind::TypeMismatch);
    EXPECT_EQ(EvaluatorTestHelper::errorKind("!0"), RuntimeErrorKind::TypeMismatch);
    EXPECT_EQ(EvaluatorTestHelper::errorKind("if (1) { 2 }"), RuntimeErrorKind::TypeMismatch);
}

// ============================================================================
// VARIABLES AND SCOPE TESTS
// ============================================================================

TEST(EvaluatorScope, AssignmentMutatesExistingBinding) {
    EXPECT_EQ(std::get<int64_t>(EvaluatorTestHelper::eval("let x = 1;\nx = 2;\nx")), 2);
}

TEST(EvaluatorScope, AssignmentNeverCreatesBinding) {
    auto err = EvaluatorTestHelper::runError("y = 5");
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind, RuntimeErrorKind::UndefinedVariable);
    EXPECT_EQ(EvaluatorTestHelper::errorKind("missing + 1"), RuntimeErrorKind::UndefinedVariable);
}

TEST(EvaluatorScope, LetInBlockShadowsWithoutMutating) {
    EXPECT_EQ(std::get<int64_t>(EvaluatorTestHelper::eval("let x = 1;\nif (true) { let x = 2; }\nx")), 1);
    EXPECT_EQ(std::get<int64_t>(EvaluatorTestHelper::eval("let x = 1;\nif (true) { x = 2; }\nx")), 2);
}

TEST(EvaluatorScope, RedeclarationInSameScopeReplaces) {
    EXPECT_EQ(std::get<std::string>(EvaluatorTestHelper::eval("let x = 1;\nlet x = \"two\";\nx")), "two");
}

TEST(EvaluatorScope, IfIsAnExpression) {
    EXPECT_EQ(std::get<std::string>(EvaluatorTestHelper::eval("let v = if (1 < 2) { \"yes\" } else { \"no\" };\nv")), "yes");
    EXPECT_TRUE(std::holds_alternative<std::monostate>(EvaluatorTestHelper::eval("if (false) { 1 }")));
    EXPECT_EQ(std::get<int64_t>(EvaluatorTestHelper::eval(
                  "let n = 5;\nif (n < 3) { 1 } else if (n < 10) { 2 } else { 3 }")),
        2);
}

// ============================================================================
// FUNCTIONS AND CLOSURES TESTS
// ============================================================================

TEST(EvaluatorFunctions, CallsNamedFunction) {
    EXPECT_EQ(std::get<int64_t>(EvaluatorTestHelper::eval("fn add(a, b) { return a + b; }\nadd(2, 3)")), 5);
}

TEST(EvaluatorFunctions, ImplicitValueOfLastExpression) {
    EXPECT_EQ(std::get<int64_t>(EvaluatorTestHelper::eval("let sq = fn(n) { n * n };\nsq(9)")), 81);
    EXPECT_TRUE(std::holds_alternative<std::monostate>(EvaluatorTestHelper::eval("let f = fn() { let a = 1; };\nf()")));
}

TEST(EvaluatorFunctions, ClosureKeepsPrivateState) {
    std::string src =
        "let make_counter = fn() {\n"
        "  let count = 0;\n"
        "  return fn() { count = count + 1; count };\n"
        "};\n"
        "let c = make_counter();\n"
        "let other = make_counter();\n"
        "c(); c(); other();\n"
        "c()";
    EXPECT_EQ(std::get<int64_t>(EvaluatorTestHelper::eval(src)), 3);
}

TEST(EvaluatorFunctions, ScopingIsLexicalNotDynamic) {
    std::string src =
        "let x = \"global\";\n"
        "let show = fn() { x };\n"
        "let run = fn() { let x = \"local\"; show() };\n"
        "run()";
    EXPECT_EQ(std::get<std::string>(EvaluatorTestHelper::eval(src)), "global");
}

TEST(EvaluatorFunctions, Recursion) {
    std::string src =
        "fn fib(n) { if (n < 2) { return n; } fib(n - 1) + fib(n - 2) }\n"
        "fib(15)";
    EXPECT_EQ(std::get<int64_t>(EvaluatorTestHelper::eval(src)), 610);
}

TEST(EvaluatorFunctions, HigherOrderFunctions) {
    std::string src =
        "let map = fn(xs, f) { let out = []; for (x in xs) { push(out, f(x)); } out };\n"
        "map([1, 2, 3], fn(v) { v * 10 })";
    EXPECT_EQ(EvaluatorTestHelper::evalToString(src), "[10, 20, 30]");
}

TEST(EvaluatorFunctions, WrongArgumentCount) {
    EXPECT_EQ(EvaluatorTestHelper::errorKind("let f = fn(a) { a };\nf(1, 2)"), RuntimeErrorKind::WrongArgumentCount);
    EXPECT_EQ(EvaluatorTestHelper::errorKind("len()"), RuntimeErrorKind::WrongArgumentCount);
}

TEST(EvaluatorFunctions, CallingNonFunctionIsNotCallable) {
    EXPECT_EQ(EvaluatorTestHelper::errorKind("let x = 1;\nx()"), RuntimeErrorKind::NotCallable);
}

TEST(EvaluatorFunctions, RunawayRecursionHitsCallDepthLimit) {
    auto err = EvaluatorTestHelper::runError("let f = fn(n) { f(n + 1) };\nf(0)");
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind, RuntimeErrorKind::InvalidOperation);
    EXPECT_NE(err->message.find("Maximum call depth"), std::string::npos);
}

TEST(EvaluatorFunctions, CallDepthLimitIsConfigurable) {
    auto ast = EvaluatorTestHelper::parse("fn down(n) { if (n == 0) { 0 } else { down(n - 1) } }\ndown(20)");
    Evaluator evaluator;
    evaluator.set_max_call_depth(10);
    EvalResult r = evaluator.execute(ast.get());
    ASSERT_TRUE(r.is_error());
    EXPECT_NE(r.error().message.find("10"), std::string::npos);

    Evaluator roomy;
    roomy.set_max_call_depth(100);
    EvalResult ok = roomy.execute(ast.get());
    ASSERT_TRUE(ok.is_value());
    EXPECT_EQ(std::get<int64_t>(ok.value()), 0);
}

TEST(EvaluatorFunctions, LoopNestedRecursionStopsBeforeNativeStackRunsOut) {
    std::string src =
        "fn f(n) {\n"
        "  if (n == 0) { return 0; }\n"
        "  while (true) { for (x in [1]) { if (true) { if (true) { return 1 + f(n - 1); } } } }\n"
        "}\n"
        "f(995)";
    auto ast = EvaluatorTestHelper::parse(src);

    Evaluator tight;
    tight.set_stack_budget(64 * 1024);
    EvalResult r = tight.execute(ast.get());
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error().kind, RuntimeErrorKind::InvalidOperation);
    EXPECT_NE(r.error().message.find("native stack"), std::string::npos);

    // default budget: either it fits or it is reported, never a crash
    Evaluator defaults;
    EvalResult d = defaults.execute(ast.get());
    if (d.is_value()) {
        EXPECT_EQ(std::get<int64_t>(d.value()), 995);
    } else {
        EXPECT_EQ(d.error().kind, RuntimeErrorKind::InvalidOperation);
    }
}

TEST(EvaluatorFunctions, DeeplyNestedBlocksAreReported) {
    std::string src;
    for (int i = 0; i < 500; ++i) src += "if (true) { ";
    src += "1";
    for (int i = 0; i < 500; ++i) src += " }";
    auto ast = EvaluatorTestHelper::parse(src);
    Evaluator evaluator;
    evaluator.set_stack_budget(16 * 1024);
    EvalResult r = evaluator.execute(ast.get());
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error().kind, RuntimeErrorKind::InvalidOperation);
}

TEST(EvaluatorFunctions, FunctionOutlivesTheProgramThatDefinedIt) {
    Evaluator evaluator;
    std::ostringstream sink;
    evaluator.set_output(sink);
    {
        auto defs = EvaluatorTestHelper::parse(
            "fn scale(x) { let k = 3; x * k }\n"
            "struct Counter { n: 0, bump: fn() { this.n = this.n + 1; this.n } }\n");
        evaluator.evaluate(defs.get());
    }
    auto use = EvaluatorTestHelper::parse("let c = Counter { };\nc.bump();\nscale(14) + c.bump() - 2");
    Value v = evaluator.evaluate(use.get());
    EXPECT_EQ(std::get<int64_t>(v), 42);
}

// ============================================================================
// CONTROL FLOW TESTS
// ============================================================================

TEST(EvaluatorControlFlow, WhileLoop) {
    std::string src = "let i = 0;\nlet s = 0;\nwhile (i < 5) { s = s + i; i = i + 1; }\ns";
    EXPECT_EQ(std::get<int64_t>(EvaluatorTestHelper::eval(src)), 10);
}

TEST(EvaluatorControlFlow, ClassicForWithBreakAndContinue) {
    std::string src =
        "let s = 0;\n"
        "for (let i = 0; i < 100; i = i + 1) {\n"
        "  if (i % 2 == 0) { continue; }\n"
        "  if (i > 9) { break; }\n"
        "  s = s + i;\n"
        "}\n"
        "s";
    // 1 + 3 + 5 + 7 + 9
    EXPECT_EQ(std::get<int64_t>(EvaluatorTestHelper::eval(src)), 25);
}

TEST(EvaluatorControlFlow, ForLoopVariableIsScopedToLoop) {
    EXPECT_EQ(EvaluatorTestHelper::errorKind("for (let i = 0; i < 2; i = i + 1) { }\ni"),
        RuntimeErrorKind::UndefinedVariable);
}

TEST(EvaluatorControlFlow, ForInOverArrayStringAndHash) {
    EXPECT_EQ(EvaluatorTestHelper::output("for (x in [1, 2, 3]) { print(x, \" \"); }"), "1 2 3 ");
    EXPECT_EQ(EvaluatorTestHelper::output("for (c in \"abc\") { print(c, \".\"); }"), "a.b.c.");
    // keys come out ordered: booleans, integers, strings
    EXPECT_EQ(EvaluatorTestHelper::output("for (k in {\"b\": 1, 2: 0, \"a\": 1, true: 3}) { print(k, \",\"); }"),
        "true,2,a,b,");
}

TEST(EvaluatorControlFlow, ForInOverStringStepsByCharacter) {
    EXPECT_EQ(EvaluatorTestHelper::output("for (c in \"h\xC3\xA9\xE2\x82\xAC\") { print(c, \".\"); }"),
        "h.\xC3\xA9.\xE2\x82\xAC.");
    EXPECT_EQ(std::get<int64_t>(EvaluatorTestHelper::eval(
                  "let n = 0;\nfor (c in \"\xF0\x9F\x99\x82!\") { n = n + 1; }\nn")),
        2);
    EXPECT_EQ(EvaluatorTestHelper::evalToString("split(\"a\xC3\xA9\", \"\")"), "[\"a\", \"\xC3\xA9\"]");
}

TEST(EvaluatorControlFlow, ForInSeesElementsPushedDuringIteration) {
    std::string src =
        "let xs = [1];\n"
        "let n = 0;\n"
        "for (x in xs) { if (len(xs) < 3) { push(xs, x + 1); } n = n + 1; }\n"
        "n";
    EXPECT_EQ(std::get<int64_t>(EvaluatorTestHelper::eval(src)), 3);
}

TEST(EvaluatorControlFlow, ForInOverIntegerIsTypeMismatch) {
    EXPECT_EQ(EvaluatorTestHelper::errorKind("for (x in 5) { }"), RuntimeErrorKind::TypeMismatch);
}

TEST(EvaluatorControlFlow, ReturnFromInsideLoop) {
    std::string src =
        "let find = fn(xs) { for (x in xs) { if (x > 2) { return x; } } null };\n"
        "find([1, 5, 3])";
    EXPECT_EQ(std::get<int64_t>(EvaluatorTestHelper::eval(src)), 5);
}

TEST(EvaluatorControlFlow, BreakOutsideLoopIsError) {
    EXPECT_EQ(EvaluatorTestHelper::errorKind("break;"), RuntimeErrorKind::InvalidOperation);
    EXPECT_EQ(EvaluatorTestHelper::errorKind("let f = fn() { continue; };\nf()"), RuntimeErrorKind::InvalidOperation);
}

TEST(EvaluatorControlFlow, TopLevelReturnStopsProgram) {
    std::string src = "let a = 1;\nreturn a + 1;\nprint(\"unreachable\");";
    EXPECT_EQ(std::get<int64_t>(EvaluatorTestHelper::eval(src)), 2);
    EXPECT_EQ(EvaluatorTestHelper::output(src), "");
}

// ============================================================================
// COLLECTION TESTS
// ============================================================================

TEST(EvaluatorCollections, ArrayIndexing) {
    EXPECT_EQ(std::get<int64_t>(EvaluatorTestHelper::eval("[10, 20, 30][1]")), 20);
    EXPECT_EQ(std::get<int64_t>(EvaluatorTestHelper::eval("let a = [1, 2];\na[0] = 9;\na[0]")), 9);
}

TEST(EvaluatorCollections, ArrayIndexErrors) {
    EXPECT_EQ(EvaluatorTestHelper::errorKind("[1][5]"), RuntimeErrorKind::IndexOutOfBounds);
    EXPECT_EQ(EvaluatorTestHelper::errorKind("[1][-1]"), RuntimeErrorKind::IndexOutOfBounds);
    EXPECT_EQ(EvaluatorTestHelper::errorKind("[1][\"0\"]"), RuntimeErrorKind::TypeMismatch);
    EXPECT_EQ(EvaluatorTestHelper::errorKind("let a = [];\na[0] = 1"), RuntimeErrorKind::IndexOutOfBounds);
    EXPECT_EQ(EvaluatorTestHelper::errorKind("5[0]"), RuntimeErrorKind::NotIndexable);
}

TEST(EvaluatorCollections, AssignmentAliasesStorage) {
    EXPECT_EQ(std::get<int64_t>(EvaluatorTestHelper::eval("let a = [1];\nlet b = a;\npush(b, 2);\nlen(a)")), 2);
    EXPECT_EQ(std::get<int64_t>(EvaluatorTestHelper::eval("let h = {};\nlet g = h;\ng[\"k\"] = 7;\nh[\"k\"]")), 7);
}

TEST(EvaluatorCollections, HashLookupAndInsert) {
    EXPECT_EQ(std::get<int64_t>(EvaluatorTestHelper::eval("let h = {\"a\": 1};\nh[\"b\"] = 2;\nh[\"a\"] + h[\"b\"]")), 3);
    EXPECT_EQ(std::get<std::string>(EvaluatorTestHelper::eval("let h = {1: \"int\", true: \"bool\"};\nh[1] + h[true]")),
        "intbool");
}

TEST(EvaluatorCollections, HashErrors) {
    EXPECT_EQ(EvaluatorTestHelper::errorKind("{\"a\": 1}[\"b\"]"), RuntimeErrorKind::MissingKey);
    EXPECT_EQ(EvaluatorTestHelper::errorKind("{[1]: 2}"), RuntimeErrorKind::NotHashable);
    EXPECT_EQ(EvaluatorTestHelper::errorKind("let h = {};\nh[null] = 1"), RuntimeErrorKind::NotHashable);
}

// ============================================================================
// DISPLAY TESTS
// ============================================================================

TEST(EvaluatorDisplay, NestedCollections) {
    EXPECT_EQ(EvaluatorTestHelper::evalToString("[1, \"two\", [true, null]]"), "[1, \"two\", [true, null]]");
    EXPECT_EQ(EvaluatorTestHelper::evalToString("{\"b\": 2, \"a\": [1], 1: true, false: 0}"),
        "{false : 0, 1 : true, \"a\" : [1], \"b\" : 2}");
    EXPECT_EQ(EvaluatorTestHelper::evalToString("\"plain\""), "plain");
}

TEST(EvaluatorDisplay, CyclicCollectionsPrintPlaceholders) {
    EXPECT_EQ(EvaluatorTestHelper::evalToString("let a = [1];\npush(a, a);\na"), "[1, [...]]");
    EXPECT_EQ(EvaluatorTestHelper::evalToString("let h = {};\nh[\"self\"] = h;\nh"), "{\"self\" : {...}}");
}

TEST(EvaluatorDisplay, SharedButAcyclicIsPrintedTwice) {
    EXPECT_EQ(EvaluatorTestHelper::evalToString("let x = [0];\n[x, x]"), "[[0], [0]]");
}

TEST(EvaluatorDisplay, Functions) {
    EXPECT_EQ(EvaluatorTestHelper::evalToString("fn add(a, b) { a + b }\nadd"), "[function: add]");
    EXPECT_EQ(EvaluatorTestHelper::evalToString("fn(x) { x }"), "[function]");
    EXPECT_EQ(EvaluatorTestHelper::evalToString("print"), "[built-in function: print]");
}

TEST(EvaluatorDisplay, TypeNames) {
    EXPECT_EQ(EvaluatorTestHelper::evalToString("type(null)"), "null");
    EXPECT_EQ(EvaluatorTestHelper::evalToString("type(true)"), "boolean");
    EXPECT_EQ(EvaluatorTestHelper::evalToString("type(1)"), "integer");
    EXPECT_EQ(EvaluatorTestHelper::evalToString("type(\"s\")"), "string");
    EXPECT_EQ(EvaluatorTestHelper::evalToString("type([])"), "array");
    EXPECT_EQ(EvaluatorTestHelper::evalToString("type({})"), "hash");
    EXPECT_EQ(EvaluatorTestHelper::evalToString("type(fn() { })"), "function");
    EXPECT_EQ(EvaluatorTestHelper::evalToString("type(len)"), "builtin function");
}

TEST(EvaluatorDisplay, PrintWritesToConfiguredStream) {
    EXPECT_EQ(EvaluatorTestHelper::output("print(\"a\", 1, [2]);\nprintln(\"b\");\nprintln()"), "a1[2]b\n\n");
}

// ============================================================================
// INPUT AND LIFETIME TESTS
// ============================================================================

TEST(EvaluatorIO, InputReadsLinesThenNull) {
    auto ast = EvaluatorTestHelper::parse("let a = input(\"name? \");\nlet b = input();\n[a, b]");
    Evaluator evaluator;
    std::istringstream in("giu\r\n");
    std::ostringstream out;
    evaluator.set_input(in);
    evaluator.set_output(out);
    Value v = evaluator.evaluate(ast.get());
    EXPECT_EQ(evaluator.value_to_string(v), "[\"giu\", null]");
    EXPECT_EQ(out.str(), "name? ");
}

TEST(EvaluatorLifetime, EvaluatorStatePersistsAcrossPrograms) {
    Evaluator evaluator;
    auto first = EvaluatorTestHelper::parse("let total = 40;");
    auto second = EvaluatorTestHelper::parse("total + 2");
    evaluator.evaluate(first.get());
    Value v = evaluator.evaluate(second.get());
    EXPECT_EQ(std::get<int64_t>(v), 42);
}

TEST(EvaluatorLifetime, SeparateEvaluatorsDoNotShareState) {
    Evaluator one;
    Evaluator two;
    auto def = EvaluatorTestHelper::parse("let secret = 1;");
    auto use = EvaluatorTestHelper::parse("secret");
    one.evaluate(def.get());
    EXPECT_TRUE(two.execute(use.get()).is_error());
}

TEST(EvaluatorLifetime, TeardownReleasesCycles) {
    std::weak_ptr<Environment> env;
    std::weak_ptr<ArrayValue> arr;
    {
        auto ast = EvaluatorTestHelper::parse(
            "let self_ref = [];\n"
            "push(self_ref, self_ref);\n"
            "let counter = fn() { counter };\n");
        Evaluator evaluator;
        evaluator.evaluate(ast.get());
        env = evaluator.main_env();
        Value v = evaluator.main_env()->values["self_ref"];
        ASSERT_TRUE(std::holds_alternative<ArrayPtr>(v));
        arr = std::get<ArrayPtr>(v);
    }
    EXPECT_TRUE(env.expired());
    EXPECT_TRUE(arr.expired());
}

TEST(EvaluatorLifetime, UnreachableObjectsArePruned) {
    Evaluator evaluator;
    size_t baseline = evaluator.live_objects();
    auto ast = EvaluatorTestHelper::parse("for (let i = 0; i < 50; i = i + 1) { let tmp = [i]; }");
    evaluator.evaluate(ast.get());
    EXPECT_EQ(evaluator.live_objects(), baseline);
}

TEST(EvaluatorLifetime, DroppingLongChainDoesNotRecurse) {
    std::string src =
        "let l = null;\n"
        "let i = 0;\n"
        "while (i < 300000) { l = [i, l]; i = i + 1; }\n"
        "l = null;\n"
        "let h = null;\n"
        "i = 0;\n"
        "while (i < 100000) { h = {\"next\": h}; i = i + 1; }\n"
        "h = null;\n"
        "println(\"dropped\");";
    EXPECT_EQ(EvaluatorTestHelper::output(src), "dropped\n");
}

TEST(EvaluatorLifetime, DroppingLongInstanceChainDoesNotRecurse) {
    std::string src =
        "struct Link { next: null }\n"
        "let head = null;\n"
        "let i = 0;\n"
        "while (i < 200000) { head = Link { next: head }; i = i + 1; }\n"
        "head = null;\n"
        "println(\"dropped\");";
    EXPECT_EQ(EvaluatorTestHelper::output(src), "dropped\n");
}
