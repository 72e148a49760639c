#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>

#include "evaluator.hpp"
#include "lexer.hpp"
#include "parser.hpp"

namespace fs = std::filesystem;

class ModuleTest : public ::testing::Test {
   protected:
    void SetUp() override {
        test_dir = fs::temp_directory_path() /
                   (std::string("giu_modules_") + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
        main_path = test_dir / "main.giu";
        evaluator.set_entry_point(main_path.string());
        evaluator.set_output(out);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    fs::path test_dir;
    fs::path main_path;
    Evaluator evaluator;
    std::ostringstream out;
    std::vector<std::unique_ptr<ProgramNode>> programs;

    void createTestFile(const std::string& filename, const std::string& content) {
        fs::path filepath = test_dir / filename;
        fs::create_directories(filepath.parent_path());
        std::ofstream file(filepath);
        file << content;
        file.close();
    }

    // Runs `source` as if it were the body of main.giu
    EvalResult run(const std::string& source) {
        Lexer lexer(source, main_path.string());
        Parser parser(lexer.tokenize());
        programs.push_back(parser.parse());
        return evaluator.execute(programs.back().get());
    }

    std::string show(const std::string& source) {
        EvalResult r = run(source);
        if (r.is_error()) return "error: " + r.error().to_string();
        return evaluator.value_to_string(r.value());
    }

    RuntimeErrorKind errorKind(const std::string& source) {
        EvalResult r = run(source);
        EXPECT_TRUE(r.is_error()) << "expected a runtime error from: " << source;
        return r.is_error() ? r.error().kind : RuntimeErrorKind::InvalidOperation;
    }
};

// ============================================================================
// FILE MODULES
// ============================================================================

TEST_F(ModuleTest, WholeImportBringsEveryBinding) {
    createTestFile("utils.giu", "let greet = fn(n) { \"hi \" + n };\nlet answer = 42;\n");
    EXPECT_EQ(show("import utils;\ngreet(\"giu\") + \" \" + to_string(answer)"), "hi giu 42");
}

TEST_F(ModuleTest, DottedPathMapsToDirectories) {
    createTestFile("lib/text/shout.giu", "fn shout(s) { s.upper() + \"!\" }\n");
    EXPECT_EQ(show("import lib.text.shout;\nshout(\"hey\")"), "HEY!");
}

TEST_F(ModuleTest, SelectiveImportBindsOnlyListedNames) {
    createTestFile("utils.giu", "let greet = fn(n) { n };\nlet answer = 42;\n");
    EXPECT_EQ(show("import utils.{answer};\nanswer"), "42");
    EXPECT_EQ(errorKind("greet"), RuntimeErrorKind::UndefinedVariable);
}

TEST_F(ModuleTest, SelectiveImportOfMissingNameIsUnknownExport) {
    createTestFile("utils.giu", "let answer = 42;\n");
    EvalResult r = run("import utils.{answer, nope};");
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error().kind, RuntimeErrorKind::UnknownExport);
    EXPECT_NE(r.error().message.find("nope"), std::string::npos);
}

TEST_F(ModuleTest, ModuleBodyRunsOnce) {
    createTestFile("noisy.giu", "println(\"loaded\");\nlet hits = [];\n");
    createTestFile("user.giu", "import noisy;\npush(hits, \"user\");\n");
    EXPECT_EQ(show("import noisy;\nimport user;\nimport noisy;\npush(hits, \"main\");\nhits"), "[\"user\", \"main\"]");
    EXPECT_EQ(out.str(), "loaded\n");
}

TEST_F(ModuleTest, ModulesDoNotSeeImporterBindings) {
    createTestFile("peek.giu", "let peek = fn() { secret };\n");
    EXPECT_EQ(errorKind("let secret = 1;\nimport peek;\npeek()"), RuntimeErrorKind::UndefinedVariable);
}

TEST_F(ModuleTest, ModulesSeeBuiltins) {
    createTestFile("sizes.giu", "let size = len([1, 2, 3]);\n");
    EXPECT_EQ(show("import sizes;\nsize"), "3");
}

TEST_F(ModuleTest, ImportCycleIsReported) {
    createTestFile("a.giu", "import b;\nlet from_a = 1;\n");
    createTestFile("b.giu", "import a;\nlet from_b = 2;\n");
    EvalResult r = run("import a;");
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error().kind, RuntimeErrorKind::ImportCycle);
    EXPECT_NE(r.error().message.find("a.giu -> b.giu -> a.giu"), std::string::npos);
}

TEST_F(ModuleTest, ModuleImportingItselfIsACycle) {
    createTestFile("self.giu", "import self;\nlet value = 1;\n");
    EvalResult r = run("import self;");
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error().kind, RuntimeErrorKind::ImportCycle);
    EXPECT_NE(r.error().message.find("self.giu -> self.giu"), std::string::npos);
}

TEST_F(ModuleTest, FailedImportCanBeRetried) {
    createTestFile("flaky.giu", "let value = 1 / 0;\n");
    EXPECT_EQ(errorKind("import flaky;"), RuntimeErrorKind::DivisionByZero);

    createTestFile("flaky.giu", "let value = 10 / 2;\n");
    EXPECT_EQ(show("import flaky;\nvalue"), "5");
}

TEST_F(ModuleTest, SyntaxErrorInModuleFailsImport) {
    createTestFile("bad.giu", "let = ;\n");
    EvalResult r = run("import bad;");
    ASSERT_TRUE(r.is_error());
    EXPECT_NE(r.error().message.find("Failed to load module"), std::string::npos);
    EXPECT_NE(r.error().message.find("ParseError"), std::string::npos);
}

TEST_F(ModuleTest, MissingModuleIsModuleNotFound) {
    EXPECT_EQ(errorKind("import does.not.exist;"), RuntimeErrorKind::ModuleNotFound);
}

TEST_F(ModuleTest, ModulePathsAreSearched) {
    fs::path extra = test_dir / "vendor";
    createTestFile("vendor/shared.giu", "let shared = \"from vendor\";\n");
    evaluator.set_module_paths({extra.string()});
    EXPECT_EQ(show("import shared;\nshared"), "from vendor");
}

TEST_F(ModuleTest, NestedImportsResolveAgainstImporterDirectory) {
    createTestFile("pkg/outer.giu", "import inner;\nlet outer = inner + 1;\n");
    createTestFile("pkg/inner.giu", "let inner = 41;\n");
    EXPECT_EQ(show("import pkg.outer.{outer};\nouter"), "42");
}

TEST_F(ModuleTest, ImportedClosuresKeepModuleState) {
    createTestFile("counter.giu",
        "let count = 0;\n"
        "let tick = fn() { count = count + 1; count };\n");
    EXPECT_EQ(show("import counter.{tick};\ntick();\ntick();\ntick()"), "3");
}

// ============================================================================
// STANDARD MODULES
// ============================================================================

TEST_F(ModuleTest, StdMath) {
    EXPECT_EQ(show("import std.math;\n[abs(-5), min(3, 9), max(3, 9), pow(2, 10)]"), "[5, 3, 9, 1024]");
    EXPECT_EQ(show("import std.math.{clamp, sqrt};\n[clamp(15, 0, 10), clamp(-1, 0, 10), sqrt(17)]"), "[10, 0, 4]");
    EXPECT_EQ(show("sqrt(10000000000000000000000)"), "100000000000");
}

TEST_F(ModuleTest, StdMathArgumentErrors) {
    run("import std.math;");
    EXPECT_EQ(errorKind("clamp(1, 10, 0)"), RuntimeErrorKind::InvalidArguments);
    EXPECT_EQ(errorKind("sqrt(-4)"), RuntimeErrorKind::InvalidArguments);
    EXPECT_EQ(errorKind("random(0)"), RuntimeErrorKind::InvalidArguments);
    EXPECT_EQ(errorKind("abs(\"x\")"), RuntimeErrorKind::TypeMismatch);
}

TEST_F(ModuleTest, StdMathRandomStaysInRange) {
    run("import std.math.{random};");
    EvalResult r = run(
        "let ok = true;\n"
        "for (let i = 0; i < 200; i = i + 1) {\n"
        "  let a = random();\n"
        "  let b = random(5);\n"
        "  let c = random(-3, 3);\n"
        "  if (a < 0 || a > 10 || b < 0 || b >= 5 || c < -3 || c > 3) { ok = false; }\n"
        "}\n"
        "ok");
    ASSERT_TRUE(r.is_value());
    EXPECT_TRUE(std::get<bool>(r.value()));
}

TEST_F(ModuleTest, StdString) {
    EXPECT_EQ(show("import std.string;\njoin([\"a\", \"b\", \"c\"], \"-\")"), "a-b-c");
    EXPECT_EQ(show("repeat(\"ab\", 3)"), "ababab");
    EXPECT_EQ(show("reverse(\"giu\")"), "uig");
    EXPECT_EQ(show("reverse(\"h\xC3\xA9!\") == \"!\xC3\xA9h\""), "true");
    EXPECT_EQ(show("upper(\"MiXed\") + lower(\"MiXed\")"), "MIXEDmixed");
    EXPECT_EQ(errorKind("join([1, 2], \",\")"), RuntimeErrorKind::TypeMismatch);
    EXPECT_EQ(errorKind("repeat(\"x\", -1)"), RuntimeErrorKind::InvalidArguments);
}

TEST_F(ModuleTest, StdJsonSerialize) {
    run("import std.json;");
    EXPECT_EQ(show("serialize({\"b\": [1, true, null], \"a\": \"x\"})"), "{\"a\":\"x\",\"b\":[1,true,null]}");
    EXPECT_EQ(show("serialize([1, 2], 2)"), "[\n  1,\n  2\n]");
    EXPECT_EQ(show("serialize({1: \"one\"})"), "{\"1\":\"one\"}");
    EXPECT_EQ(show("struct P { x: 1, y: 2 }\nserialize(P { y: 5 })"), "{\"x\":1,\"y\":5}");
}

TEST_F(ModuleTest, StdJsonSerializeErrors) {
    run("import std.json;");
    EXPECT_EQ(errorKind("serialize(fn() { })"), RuntimeErrorKind::InvalidOperation);
    EXPECT_EQ(errorKind("let a = [];\npush(a, a);\nserialize(a)"), RuntimeErrorKind::InvalidOperation);
    EXPECT_EQ(errorKind("serialize(pow(2, 80))"), RuntimeErrorKind::InvalidOperation);
    EXPECT_EQ(errorKind("serialize(1, 99)"), RuntimeErrorKind::InvalidArguments);
}

TEST_F(ModuleTest, StdJsonDeserialize) {
    run("import std.json.{deserialize};");
    EXPECT_EQ(show("deserialize(\"{\\\"xs\\\": [1, 2, {\\\"ok\\\": true}], \\\"n\\\": null}\")"),
        "{\"n\" : null, \"xs\" : [1, 2, {\"ok\" : true}]}");
    EXPECT_EQ(show("type(deserialize(\"18446744073709551615\"))"), "biginteger");
    EXPECT_EQ(show("type(deserialize(\"-5\"))"), "integer");
    EXPECT_EQ(errorKind("deserialize(\"1.5\")"), RuntimeErrorKind::InvalidArguments);
    EXPECT_EQ(errorKind("deserialize(\"{broken\")"), RuntimeErrorKind::InvalidArguments);
}

TEST_F(ModuleTest, StdModulesAreShared) {
    EXPECT_EQ(show("import std.math.{abs};\nlet first = abs;\nimport std.math.{abs};\nfirst == abs"), "true");
}

TEST_F(ModuleTest, UnknownStdModule) {
    EXPECT_EQ(errorKind("import std.nope;"), RuntimeErrorKind::ModuleNotFound);
    EXPECT_EQ(errorKind("import std.math.extra;"), RuntimeErrorKind::ModuleNotFound);
}

TEST_F(ModuleTest, StdTime) {
    run("import std.time;");
    EXPECT_EQ(show("type(now())"), "integer");
    EXPECT_EQ(show("now() > 0"), "true");
    EXPECT_EQ(show("let before = now();\nsleep(5);\nnow() - before >= 5"), "true");
    EXPECT_EQ(show("sleep(0)"), "null");
    EXPECT_EQ(errorKind("sleep(-1)"), RuntimeErrorKind::InvalidArguments);
    EXPECT_EQ(errorKind("sleep(\"1\")"), RuntimeErrorKind::TypeMismatch);
}

TEST_F(ModuleTest, StdEnvArgs) {
    evaluator.set_script_args({"--verbose", "input.txt"});
    EXPECT_EQ(show("import std.env.{args};\nargs()"), "[\"--verbose\", \"input.txt\"]");
}

TEST_F(ModuleTest, StdEnvArgsEmptyByDefault) {
    EXPECT_EQ(show("import std.env;\nlen(args())"), "0");
}

TEST_F(ModuleTest, StdIoFiles) {
    std::string dir = (test_dir / "data").string();
    std::string file = (test_dir / "data" / "notes.txt").string();
    run("import std.io;\nlet dir = \"" + dir + "\";\nlet file = \"" + file + "\";");

    EXPECT_EQ(show("create_dir(dir)"), "null");
    EXPECT_EQ(show("is_dir(dir)"), "true");
    EXPECT_EQ(show("exists(file)"), "false");
    EXPECT_EQ(show("write_file(file, \"one\\n\")"), "null");
    EXPECT_EQ(show("append_file(file, \"two\\n\")"), "null");
    EXPECT_EQ(show("read_file(file)"), "one\ntwo\n");
    EXPECT_EQ(show("is_file(file)"), "true");
    EXPECT_EQ(show("is_file(dir)"), "false");

    run("write_file(dir + \"/a.txt\", \"\");");
    EXPECT_EQ(show("list_dir(dir)"), "[\"a.txt\", \"notes.txt\"]");

    EXPECT_EQ(show("delete_file(file)"), "null");
    EXPECT_EQ(show("exists(file)"), "false");
    EXPECT_EQ(show("delete_dir(dir)"), "null");
    EXPECT_FALSE(fs::exists(dir));
}

TEST_F(ModuleTest, StdIoFailuresAreRuntimeErrors) {
    std::string missing = (test_dir / "missing.txt").string();
    run("import std.io;\nlet missing = \"" + missing + "\";");
    EvalResult r = run("read_file(missing)");
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error().kind, RuntimeErrorKind::InvalidOperation);
    EXPECT_NE(r.error().message.find("missing.txt"), std::string::npos);
    EXPECT_EQ(errorKind("delete_file(missing)"), RuntimeErrorKind::InvalidOperation);
    EXPECT_EQ(errorKind("list_dir(missing)"), RuntimeErrorKind::InvalidOperation);
    EXPECT_EQ(errorKind("read_file(1)"), RuntimeErrorKind::TypeMismatch);
}
