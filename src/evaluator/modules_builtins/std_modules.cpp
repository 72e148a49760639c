// Native standard modules: std.math, std.string, std.time, std.env
// (std.json lives in std_json.cpp, std.io in std_io.cpp).
#include <chrono>
#include <memory>
#include <random>
#include <string>
#include <thread>

#include "builtins.hpp"
#include "evaluator.hpp"

EnvPtr make_std_module(Evaluator& evaluator, const std::string& name) {
    if (name == "math") return make_math_module(evaluator);
    if (name == "string") return make_string_module(evaluator);
    if (name == "json") return make_json_module(evaluator);
    if (name == "time") return make_time_module(evaluator);
    if (name == "env") return make_env_module(evaluator);
    if (name == "io") return make_io_module(evaluator);
    return nullptr;
}

// ----------------- std.math -----------------

EnvPtr make_math_module(Evaluator& evaluator) {
    EnvPtr env = evaluator.make_env(evaluator.globals());

    auto def = [&](const std::string& name, size_t min_args, size_t max_args, NativeImpl impl) {
        env->define(name, Value{make_native_fn("math." + name, min_args, max_args, std::move(impl), env)});
    };

    def("abs", 1, 1, [](const std::vector<Value>& args, EnvPtr, const Token& tok) -> EvalResult {
        GIU_TRY(n, expect_arg_integer("math.abs", args, 0, tok));
        if (compare_integers(n, Value{int64_t(0)}) < 0) return checked_neg(n, tok);
        return n;
    });

    def("min", 2, 2, [](const std::vector<Value>& args, EnvPtr, const Token& tok) -> EvalResult {
        GIU_TRY(a, expect_arg_integer("math.min", args, 0, tok));
        GIU_TRY(b, expect_arg_integer("math.min", args, 1, tok));
        return compare_integers(a, b) <= 0 ? a : b;
    });

    def("max", 2, 2, [](const std::vector<Value>& args, EnvPtr, const Token& tok) -> EvalResult {
        GIU_TRY(a, expect_arg_integer("math.max", args, 0, tok));
        GIU_TRY(b, expect_arg_integer("math.max", args, 1, tok));
        return compare_integers(a, b) >= 0 ? a : b;
    });

    def("pow", 2, 2, [](const std::vector<Value>& args, EnvPtr, const Token& tok) -> EvalResult {
        return checked_pow(args[0], args[1], tok);
    });

    // clamp(n, lo, hi)
    def("clamp", 3, 3, [](const std::vector<Value>& args, EnvPtr, const Token& tok) -> EvalResult {
        GIU_TRY(n, expect_arg_integer("math.clamp", args, 0, tok));
        GIU_TRY(lo, expect_arg_integer("math.clamp", args, 1, tok));
        GIU_TRY(hi, expect_arg_integer("math.clamp", args, 2, tok));
        if (compare_integers(lo, hi) > 0) {
            return EvalResult::error(RuntimeErrorKind::InvalidArguments,
                "math.clamp(): min cannot be greater than max", tok.loc);
        }
        if (compare_integers(n, lo) < 0) return lo;
        if (compare_integers(n, hi) > 0) return hi;
        return n;
    });

    // integer square root, rounded down
    def("sqrt", 1, 1, [](const std::vector<Value>& args, EnvPtr, const Token& tok) -> EvalResult {
        GIU_TRY(n, expect_arg_integer("math.sqrt", args, 0, tok));
        BigInt b = to_bigint(n);
        if (b < 0) {
            return EvalResult::error(RuntimeErrorKind::InvalidArguments,
                "math.sqrt(): argument must be non-negative", tok.loc);
        }
        BigInt r = boost::multiprecision::sqrt(b);
        return normalize_integer(r);
    });

    // random() -> [0, 10], random(max) -> [0, max), random(lo, hi) -> [lo, hi]
    auto rng = std::make_shared<std::mt19937_64>(std::random_device{}());
    def("random", 0, 2, [rng](const std::vector<Value>& args, EnvPtr, const Token& tok) -> EvalResult {
        int64_t lo = 0, hi = 10;
        for (size_t i = 0; i < args.size(); ++i) {
            if (!std::holds_alternative<int64_t>(args[i])) {
                return EvalResult::error(RuntimeErrorKind::InvalidArguments,
                    "math.random() expects 0, 1, or 2 integer arguments", tok.loc);
            }
        }
        if (args.size() == 1) {
            hi = std::get<int64_t>(args[0]);
            if (hi <= 0) {
                return EvalResult::error(RuntimeErrorKind::InvalidArguments,
                    "math.random(): max must be positive", tok.loc);
            }
            hi -= 1;
        } else if (args.size() == 2) {
            lo = std::get<int64_t>(args[0]);
            hi = std::get<int64_t>(args[1]);
            if (hi < lo) {
                return EvalResult::error(RuntimeErrorKind::InvalidArguments,
                    "math.random(): min must be lower than or equal to max", tok.loc);
            }
        }
        std::uniform_int_distribution<int64_t> dist(lo, hi);
        return Value{dist(*rng)};
    });

    return env;
}

// ----------------- std.string -----------------

EnvPtr make_string_module(Evaluator& evaluator) {
    EnvPtr env = evaluator.make_env(evaluator.globals());

    auto def = [&](const std::string& name, size_t min_args, size_t max_args, NativeImpl impl) {
        env->define(name, Value{make_native_fn("string." + name, min_args, max_args, std::move(impl), env)});
    };

    // join(array of strings, separator)
    def("join", 2, 2, [](const std::vector<Value>& args, EnvPtr, const Token& tok) -> EvalResult {
        GIU_TRY(a, expect_arg_array("string.join", args, 0, tok));
        GIU_TRY(sep, expect_arg_string("string.join", args, 1, tok));
        std::string out;
        const auto& elems = std::get<ArrayPtr>(a)->elements;
        for (size_t i = 0; i < elems.size(); ++i) {
            if (!std::holds_alternative<std::string>(elems[i])) {
                return EvalResult::error(RuntimeErrorKind::TypeMismatch,
                    "string.join() expects an array of strings, found " + value_type_name(elems[i]), tok.loc);
            }
            if (i) out += std::get<std::string>(sep);
            out += std::get<std::string>(elems[i]);
        }
        return Value{out};
    });

    def("reverse", 1, 1, [](const std::vector<Value>& args, EnvPtr, const Token& tok) -> EvalResult {
        GIU_TRY(s, expect_arg_string("string.reverse", args, 0, tok));
        std::vector<std::string> chars = utf8_chars(std::get<std::string>(s));
        std::string out;
        for (auto it = chars.rbegin(); it != chars.rend(); ++it) out += *it;
        return Value{out};
    });

    def("repeat", 2, 2, [](const std::vector<Value>& args, EnvPtr, const Token& tok) -> EvalResult {
        GIU_TRY(s, expect_arg_string("string.repeat", args, 0, tok));
        GIU_TRY(n, expect_arg_integer("string.repeat", args, 1, tok));
        if (!std::holds_alternative<int64_t>(n) || std::get<int64_t>(n) < 0) {
            return EvalResult::error(RuntimeErrorKind::InvalidArguments,
                "string.repeat(): count must be a non-negative integer", tok.loc);
        }
        std::string out;
        for (int64_t i = 0; i < std::get<int64_t>(n); ++i) out += std::get<std::string>(s);
        return Value{out};
    });

    def("upper", 1, 1, [](const std::vector<Value>& args, EnvPtr, const Token& tok) -> EvalResult {
        GIU_TRY(s, expect_arg_string("string.upper", args, 0, tok));
        return Value{to_upper(std::get<std::string>(s))};
    });

    def("lower", 1, 1, [](const std::vector<Value>& args, EnvPtr, const Token& tok) -> EvalResult {
        GIU_TRY(s, expect_arg_string("string.lower", args, 0, tok));
        return Value{to_lower(std::get<std::string>(s))};
    });

    return env;
}

// ----------------- std.time -----------------

EnvPtr make_time_module(Evaluator& evaluator) {
    EnvPtr env = evaluator.make_env(evaluator.globals());

    auto def = [&](const std::string& name, size_t min_args, size_t max_args, NativeImpl impl) {
        env->define(name, Value{make_native_fn("time." + name, min_args, max_args, std::move(impl), env)});
    };

    // milliseconds since the Unix epoch
    def("now", 0, 0, [](const std::vector<Value>&, EnvPtr, const Token&) -> EvalResult {
        using namespace std::chrono;
        auto ms = duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
        return Value{static_cast<int64_t>(ms)};
    });

    // blocks the whole interpreter for `ms` milliseconds
    def("sleep", 1, 1, [](const std::vector<Value>& args, EnvPtr, const Token& tok) -> EvalResult {
        GIU_TRY(ms, expect_arg_integer("time.sleep", args, 0, tok));
        if (compare_integers(ms, Value{int64_t(0)}) < 0) {
            return EvalResult::error(RuntimeErrorKind::InvalidArguments,
                "time.sleep(): duration must be non-negative", tok.loc);
        }
        if (!std::holds_alternative<int64_t>(ms)) {
            return EvalResult::error(RuntimeErrorKind::InvalidArguments,
                "time.sleep(): duration is too large", tok.loc);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(std::get<int64_t>(ms)));
        return Value{};
    });

    return env;
}

// ----------------- std.env -----------------

EnvPtr make_env_module(Evaluator& evaluator) {
    EnvPtr env = evaluator.make_env(evaluator.globals());
    Evaluator* ev = &evaluator;

    // the arguments given after the script path on the command line
    env->define("args", Value{make_native_fn("env.args", 0, 0,
                            [ev](const std::vector<Value>&, EnvPtr, const Token&) -> EvalResult {
                                std::vector<Value> out;
                                for (const auto& a : ev->script_args()) out.push_back(Value{a});
                                return Value{ev->make_array(std::move(out))};
                            },
                            env)});

    return env;
}
