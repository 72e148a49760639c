// std.io: synchronous file and directory helpers.
// Paths are used as given, so relative ones resolve against the working directory.
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>

#include "builtins.hpp"
#include "evaluator.hpp"

namespace fs = std::filesystem;

namespace {

EvalResult io_failure(const std::string& what, const std::string& path, const std::string& reason, const Token& tok) {
    return EvalResult::error(RuntimeErrorKind::InvalidOperation,
        "Could not " + what + " '" + path + "': " + reason, tok.loc);
}

EvalResult write_text(const std::string& fn, const std::vector<Value>& args, std::ios::openmode mode, const Token& tok) {
    GIU_TRY(path, expect_arg_string(fn, args, 0, tok));
    GIU_TRY(content, expect_arg_string(fn, args, 1, tok));
    const std::string& p = std::get<std::string>(path);

    std::ofstream file(p, mode | std::ios::binary);
    if (!file) return io_failure("open file", p, "cannot open for writing", tok);
    file << std::get<std::string>(content);
    if (!file) return io_failure("write to file", p, "write failed", tok);
    return Value{};
}

}  // namespace

EnvPtr make_io_module(Evaluator& evaluator) {
    EnvPtr env = evaluator.make_env(evaluator.globals());
    Evaluator* ev = &evaluator;

    auto def = [&](const std::string& name, size_t min_args, size_t max_args, NativeImpl impl) {
        env->define(name, Value{make_native_fn("io." + name, min_args, max_args, std::move(impl), env)});
    };

    def("read_file", 1, 1, [](const std::vector<Value>& args, EnvPtr, const Token& tok) -> EvalResult {
        GIU_TRY(path, expect_arg_string("io.read_file", args, 0, tok));
        const std::string& p = std::get<std::string>(path);
        std::error_code ec;
        if (!fs::is_regular_file(p, ec)) return io_failure("read from file", p, "no such file", tok);

        std::ifstream file(p, std::ios::binary);
        if (!file) return io_failure("read from file", p, "cannot open for reading", tok);
        std::ostringstream buffer;
        buffer << file.rdbuf();
        return Value{buffer.str()};
    });

    // write_file replaces the content; append_file creates the file when missing
    def("write_file", 2, 2, [](const std::vector<Value>& args, EnvPtr, const Token& tok) -> EvalResult {
        return write_text("io.write_file", args, std::ios::out | std::ios::trunc, tok);
    });

    def("append_file", 2, 2, [](const std::vector<Value>& args, EnvPtr, const Token& tok) -> EvalResult {
        return write_text("io.append_file", args, std::ios::out | std::ios::app, tok);
    });

    def("exists", 1, 1, [](const std::vector<Value>& args, EnvPtr, const Token& tok) -> EvalResult {
        GIU_TRY(path, expect_arg_string("io.exists", args, 0, tok));
        std::error_code ec;
        return Value{fs::exists(std::get<std::string>(path), ec)};
    });

    def("is_file", 1, 1, [](const std::vector<Value>& args, EnvPtr, const Token& tok) -> EvalResult {
        GIU_TRY(path, expect_arg_string("io.is_file", args, 0, tok));
        std::error_code ec;
        return Value{fs::is_regular_file(std::get<std::string>(path), ec)};
    });

    def("is_dir", 1, 1, [](const std::vector<Value>& args, EnvPtr, const Token& tok) -> EvalResult {
        GIU_TRY(path, expect_arg_string("io.is_dir", args, 0, tok));
        std::error_code ec;
        return Value{fs::is_directory(std::get<std::string>(path), ec)};
    });

    // entry names, sorted
    def("list_dir", 1, 1, [ev](const std::vector<Value>& args, EnvPtr, const Token& tok) -> EvalResult {
        GIU_TRY(path, expect_arg_string("io.list_dir", args, 0, tok));
        const std::string& p = std::get<std::string>(path);
        std::error_code ec;
        if (!fs::is_directory(p, ec)) return io_failure("list directory", p, "not a directory", tok);

        std::vector<std::string> names;
        for (fs::directory_iterator it(p, ec), end; !ec && it != end; it.increment(ec)) {
            names.push_back(it->path().filename().string());
        }
        if (ec) return io_failure("list directory", p, ec.message(), tok);
        std::sort(names.begin(), names.end());

        std::vector<Value> out;
        for (auto& n : names) out.push_back(Value{std::move(n)});
        return Value{ev->make_array(std::move(out))};
    });

    // creates missing parents as well; an existing directory is not an error
    def("create_dir", 1, 1, [](const std::vector<Value>& args, EnvPtr, const Token& tok) -> EvalResult {
        GIU_TRY(path, expect_arg_string("io.create_dir", args, 0, tok));
        const std::string& p = std::get<std::string>(path);
        std::error_code ec;
        fs::create_directories(p, ec);
        if (ec) return io_failure("create directory", p, ec.message(), tok);
        return Value{};
    });

    def("delete_file", 1, 1, [](const std::vector<Value>& args, EnvPtr, const Token& tok) -> EvalResult {
        GIU_TRY(path, expect_arg_string("io.delete_file", args, 0, tok));
        const std::string& p = std::get<std::string>(path);
        std::error_code ec;
        if (!fs::is_regular_file(p, ec)) return io_failure("delete file", p, "no such file", tok);
        fs::remove(p, ec);
        if (ec) return io_failure("delete file", p, ec.message(), tok);
        return Value{};
    });

    // removes the directory and everything under it
    def("delete_dir", 1, 1, [](const std::vector<Value>& args, EnvPtr, const Token& tok) -> EvalResult {
        GIU_TRY(path, expect_arg_string("io.delete_dir", args, 0, tok));
        const std::string& p = std::get<std::string>(path);
        std::error_code ec;
        if (!fs::is_directory(p, ec)) return io_failure("delete directory", p, "not a directory", tok);
        fs::remove_all(p, ec);
        if (ec) return io_failure("delete directory", p, ec.message(), tok);
        return Value{};
    });

    return env;
}
