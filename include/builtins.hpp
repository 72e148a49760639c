#pragma once
#include <string>
#include <utility>

#include "evaluator.hpp"

// Helper: create a native FunctionValue from a lambda
template <typename F>
FunctionPtr make_native_fn(const std::string& name, size_t min_args, size_t max_args, F impl, EnvPtr env = nullptr) {
    return std::make_shared<FunctionValue>(name, min_args, max_args, NativeImpl(std::move(impl)), env, Token());
}

// Registers the global built-in functions (print, len, push, ...) into `env`.
void register_builtins(Evaluator& evaluator, EnvPtr env);

// Built-in method `name` of a primitive receiver (integer, string, array, hash),
// bound to that receiver. nullptr when the receiver's type has no such method.
FunctionPtr lookup_builtin_method(Evaluator& evaluator, const Value& receiver, const std::string& name, const Token& tok);

// Factories for the native `std.*` modules. Each returns a fresh module environment
// parented at the evaluator's globals, or nullptr for an unknown name.
EnvPtr make_std_module(Evaluator& evaluator, const std::string& name);
EnvPtr make_math_module(Evaluator& evaluator);
EnvPtr make_string_module(Evaluator& evaluator);
EnvPtr make_json_module(Evaluator& evaluator);
EnvPtr make_time_module(Evaluator& evaluator);
EnvPtr make_env_module(Evaluator& evaluator);
EnvPtr make_io_module(Evaluator& evaluator);

// Argument helpers shared by the built-in implementations. Each returns a TypeMismatch
// error naming the built-in and the argument position when the type does not match.
EvalResult expect_arg_string(const std::string& fn, const std::vector<Value>& args, size_t i, const Token& tok);
EvalResult expect_arg_integer(const std::string& fn, const std::vector<Value>& args, size_t i, const Token& tok);
EvalResult expect_arg_array(const std::string& fn, const std::vector<Value>& args, size_t i, const Token& tok);
EvalResult expect_arg_hash(const std::string& fn, const std::vector<Value>& args, size_t i, const Token& tok);
EvalResult expect_arg_instance(const std::string& fn, const std::vector<Value>& args, size_t i, const Token& tok);

// Shared operations used by both the global built-ins and the method table.
EvalResult builtin_len(const std::string& fn, const Value& v, const Token& tok);
// Splits UTF-8 text into one string per code point.
std::vector<std::string> utf8_chars(const std::string& s);
std::vector<std::string> split_string(const std::string& s, const std::string& sep);
std::string replace_all(std::string s, const std::string& from, const std::string& to);
std::string trim_string(const std::string& s);
std::string to_upper(std::string s);
std::string to_lower(std::string s);
