#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <sstream>

#include "evaluator.hpp"
#include "lexer.hpp"
#include "parser.hpp"

namespace {

// Keeps the evaluator alive so instances can be inspected after a run
struct StructFixture : public ::testing::Test {
    Evaluator evaluator;
    std::ostringstream out;
    std::vector<std::unique_ptr<ProgramNode>> programs;

    void SetUp() override { evaluator.set_output(out); }

    EvalResult run(const std::string& source) {
        Lexer lexer(source + "\n", "structs.giu");
        Parser parser(lexer.tokenize());
        programs.push_back(parser.parse());
        return evaluator.execute(programs.back().get());
    }

    std::string show(const std::string& source) {
        EvalResult r = run(source);
        if (r.is_error()) return "error: " + r.error().to_string();
        return evaluator.value_to_string(r.value());
    }

    std::optional<RuntimeErrorKind> error_kind(const std::string& source) {
        EvalResult r = run(source);
        if (!r.is_error()) return std::nullopt;
        return r.error().kind;
    }
};

const char* kPoint = "struct Point { x: 0, y: 0 }\n";

const char* kCounter =
    "struct Counter {\n"
    "  count: 0,\n"
    "  step: 1,\n"
    "  inc: fn() { this.count = this.count + this.step; this },\n"
    "  add: fn(n) { this.count = this.count + n; this.count }\n"
    "}\n";

}  // namespace

// ============================================================================
// DEFINITION AND INSTANTIATION
// ============================================================================

TEST_F(StructFixture, DeclarationBindsStructValue) {
    EXPECT_EQ(show(std::string(kPoint) + "Point"), "[struct Point]");
    EXPECT_EQ(show("type(Point)"), "struct");
    EXPECT_EQ(show("name(Point)"), "Point");
}

TEST_F(StructFixture, LiteralOverridesDefaults) {
    EXPECT_EQ(show(std::string(kPoint) + "Point { y: 5 }"), "Point { x: 0, y: 5 }");
    EXPECT_EQ(show("Point { }"), "Point { x: 0, y: 0 }");
}

TEST_F(StructFixture, InstanceTypeIsStructName) {
    run(kPoint);
    EXPECT_EQ(show("type(Point { x: 1 })"), "Point");
}

TEST_F(StructFixture, FieldsKeepDeclarationOrder) {
    run("struct Row { zeta: 1, alpha: 2, mid: 3 }");
    EXPECT_EQ(show("Row { mid: 9 }"), "Row { zeta: 1, alpha: 2, mid: 9 }");
    EXPECT_EQ(show("fields(Row { })"), "[\"zeta\", \"alpha\", \"mid\"]");
}

TEST_F(StructFixture, DefaultsAreEvaluatedOnceAtDeclaration) {
    run("let calls = 0;\n"
        "let next = fn() { calls = calls + 1; calls };\n"
        "struct Tagged { id: next() }");
    run("let a = Tagged { };\nlet b = Tagged { };");
    EXPECT_EQ(show("[a.id, b.id, calls]"), "[1, 1, 1]");
}

TEST_F(StructFixture, UnknownFieldInLiteralIsError) {
    run(kPoint);
    EXPECT_EQ(error_kind("Point { z: 1 }"), RuntimeErrorKind::UndefinedField);
}

TEST_F(StructFixture, LiteralOfNonStructIsError) {
    run("let NotAStruct = 1;");
    EXPECT_EQ(error_kind("NotAStruct { }"), RuntimeErrorKind::TypeMismatch);
    EXPECT_EQ(error_kind("Missing { }"), RuntimeErrorKind::UndefinedVariable);
}

// ============================================================================
// FIELDS
// ============================================================================

TEST_F(StructFixture, FieldReadAndWrite) {
    run(kPoint);
    EXPECT_EQ(show("let p = Point { x: 1, y: 2 };\np.x = p.x + 10;\np.x"), "11");
}

TEST_F(StructFixture, InstancesAliasOnAssignment) {
    run(kPoint);
    EXPECT_EQ(show("let p = Point { };\nlet q = p;\nq.x = 5;\np.x"), "5");
}

TEST_F(StructFixture, InstancesAreIndependent) {
    run(kPoint);
    EXPECT_EQ(show("let a = Point { };\nlet b = Point { };\na.x = 3;\n[a.x, b.x, a == b, a == a]"),
        "[3, 0, false, true]");
}

TEST_F(StructFixture, UndeclaredFieldAccessIsError) {
    run(std::string(kPoint) + "let p = Point { };");
    EXPECT_EQ(error_kind("p.z"), RuntimeErrorKind::UndefinedField);
    EXPECT_EQ(error_kind("p.z = 1"), RuntimeErrorKind::UndefinedField);
}

TEST_F(StructFixture, SettingFieldOnNonInstanceIsError) {
    EXPECT_EQ(error_kind("let h = {};\nh.x = 1"), RuntimeErrorKind::InvalidOperation);
}

TEST_F(StructFixture, ReflectionBuiltins) {
    run(std::string(kPoint) + "let p = Point { x: 4 };");
    EXPECT_EQ(show("get_field(p, \"x\")"), "4");
    EXPECT_EQ(show("set_field(p, \"y\", 7)"), "Point { x: 4, y: 7 }");
    EXPECT_EQ(show("name(p)"), "Point");
    EXPECT_EQ(error_kind("get_field(p, \"w\")"), RuntimeErrorKind::UndefinedField);
    EXPECT_EQ(error_kind("set_field(p, \"w\", 1)"), RuntimeErrorKind::UndefinedField);
    EXPECT_EQ(error_kind("fields(1)"), RuntimeErrorKind::TypeMismatch);
}

// ============================================================================
// METHODS
// ============================================================================

TEST_F(StructFixture, MethodSeesThis) {
    run(kCounter);
    EXPECT_EQ(show("let c = Counter { };\nc.add(5);\nc.add(2)"), "7");
}

TEST_F(StructFixture, MethodsChainThroughReturnedThis) {
    run(kCounter);
    EXPECT_EQ(show("let c = Counter { step: 3 };\nc.inc().inc().inc().count"), "9");
}

TEST_F(StructFixture, MethodReadOffInstanceStaysBound) {
    run(kCounter);
    EXPECT_EQ(show("let c = Counter { };\nlet bump = c.inc;\nbump();\nbump();\nc.count"), "2");
    EXPECT_EQ(show("c.inc"), "[function: inc]");
}

TEST_F(StructFixture, MethodsCloseOverDeclaringScope) {
    run("let bonus = 10;\n"
        "struct Acc { total: 0, add: fn() { this.total = this.total + bonus; } }\n"
        "let a = Acc { };\n");
    EXPECT_EQ(show("let run = fn() { let bonus = 1000; a.add(); a.total };\nrun()"), "10");
}

TEST_F(StructFixture, MethodCallsAnotherMethod) {
    run("struct Rect {\n"
        "  w: 0,\n"
        "  h: 0,\n"
        "  area: fn() { this.w * this.h },\n"
        "  describe: fn() { \"area=\" + to_string(this.area()) }\n"
        "}\n");
    EXPECT_EQ(show("Rect { w: 3, h: 4 }.describe()"), "area=12");
}

TEST_F(StructFixture, UserMethodTakesPriorityOverBuiltinName) {
    run("struct Odd { size: 3, len: fn() { 99 } }\n");
    EXPECT_EQ(show("Odd { }.len()"), "99");
    EXPECT_EQ(show("Odd { }.size"), "3");
}

TEST_F(StructFixture, MissingMethodIsUndefinedMethod) {
    run(std::string(kPoint) + "let p = Point { };");
    EXPECT_EQ(error_kind("p.norm()"), RuntimeErrorKind::UndefinedMethod);
}

TEST_F(StructFixture, MethodArityIsChecked) {
    run(std::string(kCounter) + "let c = Counter { };");
    EXPECT_EQ(error_kind("c.add()"), RuntimeErrorKind::WrongArgumentCount);
}

TEST_F(StructFixture, ThisOutsideMethodIsError) {
    EXPECT_EQ(error_kind("this"), RuntimeErrorKind::InvalidOperation);
    EXPECT_EQ(error_kind("let f = fn() { this };\nf()"), RuntimeErrorKind::InvalidOperation);
}

TEST_F(StructFixture, SelfReferencingInstanceDisplay) {
    run("struct Node { value: 0, next: null }\n"
        "let n = Node { value: 1 };\n"
        "n.next = n;\n");
    EXPECT_EQ(show("n"), "Node { value: 1, next: Node {...} }");
}
