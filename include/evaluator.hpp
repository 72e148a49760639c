#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iostream>
#include <limits>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

#include <boost/multiprecision/cpp_int.hpp>

#include "ast.hpp"
#include "token.hpp"

// Forward declaration
class Environment;
class Evaluator;

using BigInt = boost::multiprecision::cpp_int;

// Our language's value types
struct FunctionValue;
using FunctionPtr = std::shared_ptr<FunctionValue>;

// Environment
using EnvPtr = std::shared_ptr<Environment>;

// Forward-declare composite values so Value can hold pointers to them
struct ArrayValue;
using ArrayPtr = std::shared_ptr<ArrayValue>;

struct HashMapValue;
using HashMapPtr = std::shared_ptr<HashMapValue>;

struct StructDefValue;
using StructDefPtr = std::shared_ptr<StructDefValue>;

struct InstanceValue;
using InstancePtr = std::shared_ptr<InstanceValue>;

// NOTE: construct Integers from int64_t and Strings from std::string explicitly;
// a plain int or a string literal would pick the wrong alternative.
using Value = std::variant<
    std::monostate,
    bool,
    int64_t,
    BigInt,
    std::string,
    ArrayPtr,
    HashMapPtr,
    FunctionPtr,
    StructDefPtr,
    InstancePtr>;

// Hashable keys: Boolean, Integer, String. Ordered by alternative, then by value,
// which gives booleans first, integers ascending, strings lexicographically.
using HashKey = std::variant<bool, int64_t, std::string>;

// ----------------- Runtime errors and control signals -----------------

enum class RuntimeErrorKind {
    UndefinedVariable,
    UndefinedField,
    UndefinedMethod,
    TypeMismatch,
    DivisionByZero,
    ModuloByZero,
    IndexOutOfBounds,
    MissingKey,
    WrongArgumentCount,
    NotCallable,
    NotHashable,
    NotIndexable,
    InvalidArguments,
    InvalidOperation,
    ImportCycle,
    ModuleNotFound,
    UnknownExport
};

std::string runtime_error_kind_name(RuntimeErrorKind kind);

struct RuntimeError {
    RuntimeErrorKind kind = RuntimeErrorKind::InvalidOperation;
    std::string message;
    TokenLocation loc;

    // "<Kind>: <message>"
    std::string to_string() const {
        return runtime_error_kind_name(kind) + ": " + message;
    }
};

struct ControlSignal {
    enum class Kind {
        Break,
        Continue,
        Return
    };
    Kind kind = Kind::Return;
    Value value;  // payload of Return
    Token token;  // where the signal was raised
};

// Outcome of every evaluation step: a value, a control signal, or a runtime error.
class EvalResult {
   public:
    EvalResult() : data_(Value{}) {}
    EvalResult(Value v) : data_(std::move(v)) {}
    EvalResult(ControlSignal s) : data_(std::move(s)) {}
    EvalResult(RuntimeError e) : data_(std::move(e)) {}

    static EvalResult error(RuntimeErrorKind kind, const std::string& message, const TokenLocation& loc) {
        return EvalResult(RuntimeError{kind, message, loc});
    }

    bool is_value() const { return std::holds_alternative<Value>(data_); }
    bool is_signal() const { return std::holds_alternative<ControlSignal>(data_); }
    bool is_error() const { return std::holds_alternative<RuntimeError>(data_); }

    Value& value() { return std::get<Value>(data_); }
    const Value& value() const { return std::get<Value>(data_); }
    ControlSignal& signal() { return std::get<ControlSignal>(data_); }
    const ControlSignal& signal() const { return std::get<ControlSignal>(data_); }
    const RuntimeError& error() const { return std::get<RuntimeError>(data_); }

   private:
    std::variant<Value, ControlSignal, RuntimeError> data_;
};

// Evaluate `expr`; a signal or an error is returned from the enclosing function,
// otherwise its value is bound to `var`.
#define GIU_TRY(var, expr)              \
    Value var;                          \
    {                                   \
        EvalResult giu_try_r_ = (expr); \
        if (!giu_try_r_.is_value()) {   \
            return giu_try_r_;          \
        }                               \
        var = std::move(giu_try_r_.value()); \
    }

// ----------------- Composite values -----------------

// Composites free their children with a worklist (Evaluator.cpp), so dropping
// a long chain such as `l = [i, l]` never nests destructor calls.
struct ArrayValue {
    std::vector<Value> elements;
    ~ArrayValue();
};

struct HashMapValue {
    std::map<HashKey, Value> entries;
    ~HashMapValue();
};

using NativeImpl = std::function<EvalResult(const std::vector<Value>&, EnvPtr, const Token&)>;

// Function value: closure with parameters, body, and defining environment,
// or a native built-in with an arity range.
struct FunctionValue {
    std::string name;
    std::vector<std::string> parameters;
    std::shared_ptr<BlockNode> body;
    EnvPtr closure;
    Token token;

    // set when the function was read off an instance (`obj.method`)
    InstancePtr bound_this;

    bool is_native = false;
    size_t min_args = 0;
    size_t max_args = 0;  // VARIADIC for no upper bound
    NativeImpl native_impl;

    static constexpr size_t VARIADIC = std::numeric_limits<size_t>::max();

    FunctionValue(const std::string& nm,
        const std::vector<std::string>& params,
        std::shared_ptr<BlockNode> b,
        const EnvPtr& env,
        const Token& tok) : name(nm),
                            parameters(params),
                            body(std::move(b)),
                            closure(env),
                            token(tok),
                            is_native(false) {}

    // Native constructor
    FunctionValue(const std::string& nm,
        size_t min_arity,
        size_t max_arity,
        NativeImpl impl,
        const EnvPtr& env,
        const Token& tok) : name(nm),
                            closure(env),
                            token(tok),
                            is_native(true),
                            min_args(min_arity),
                            max_args(max_arity),
                            native_impl(std::move(impl)) {}
};

struct StructDefValue {
    std::string name;
    std::vector<std::string> field_names;  // declaration order
    std::unordered_map<std::string, Value> defaults;
    std::unordered_map<std::string, FunctionPtr> methods;
    Token token;

    bool has_field(const std::string& f) const { return defaults.count(f) > 0; }
};

struct InstanceValue {
    StructDefPtr def;
    std::unordered_map<std::string, Value> fields;
    ~InstanceValue();
};

// ----------------- Environment -----------------

class Environment : public std::enable_shared_from_this<Environment> {
   public:
    Environment(EnvPtr parent = nullptr) : parent(parent) {
    }

    // map from name -> value
    std::unordered_map<std::string, Value> values;
    EnvPtr parent;

    // check if name exists in this environment or any parent
    bool has(const std::string& name) const;
    // check this scope only
    bool has_local(const std::string& name) const;

    // introduce a binding in this scope, shadowing any outer one
    void define(const std::string& name, const Value& value);

    // walk the chain; UndefinedVariable if absent
    EvalResult get(const std::string& name, const Token& tok) const;

    // mutate the nearest existing binding; never creates one
    EvalResult set(const std::string& name, const Value& value, const Token& tok);
};

// ----------------- Heap tracker -----------------

// Weak registry of every environment and composite the evaluator allocates.
// Teardown clears whatever is still alive, which breaks reference cycles
// (closure <-> environment, instance <-> bound method, self-containing arrays).
struct HeapTracker {
    std::vector<std::weak_ptr<Environment>> envs;
    std::vector<std::weak_ptr<ArrayValue>> arrays;
    std::vector<std::weak_ptr<HashMapValue>> hashes;
    std::vector<std::weak_ptr<InstanceValue>> instances;

    void prune();
    void collect();
    size_t tracked() const { return envs.size() + arrays.size() + hashes.size() + instances.size(); }

    size_t prune_threshold = 4096;
};

// ----------------- Evaluator -----------------

class Evaluator {
   public:
    Evaluator();
    ~Evaluator();

    Evaluator(const Evaluator&) = delete;
    Evaluator& operator=(const Evaluator&) = delete;

    // Evaluate whole program. Runtime errors and stray break/continue are raised as
    // GiuError("RuntimeError", ...). Returns the value of the last expression statement.
    Value evaluate(ProgramNode* program);

    // Same, but hands back the raw outcome without raising.
    EvalResult execute(ProgramNode* program);

    std::string value_to_string(const Value& v) const;
    std::string type_name(const Value& v) const;
    bool is_equal(const Value& a, const Value& b) const;

    // Resolve the main file; relative imports of the program are resolved against it.
    void set_entry_point(const std::string& filename);
    // Extra directories searched for `import a.b` after the importer's directory.
    void set_module_paths(const std::vector<std::string>& paths);

    // Command-line arguments that follow the script path; read by std.env.args().
    void set_script_args(const std::vector<std::string>& args) { script_args_ = args; }
    const std::vector<std::string>& script_args() const { return script_args_; }

    void set_output(std::ostream& os) { out_ = &os; }
    void set_input(std::istream& is) { in_ = &is; }
    std::ostream& output() { return *out_; }
    std::istream& input() { return *in_; }

    void set_max_call_depth(size_t depth) { max_call_depth_ = depth; }
    // Bytes of native stack evaluation may use before calls fail with InvalidOperation.
    // Defaults to three quarters of RLIMIT_STACK; lower it when running on a smaller thread stack.
    void set_stack_budget(size_t bytes) { stack_budget_ = bytes; }

    EnvPtr globals() const { return global_env; }
    EnvPtr main_env() const { return main_module_env; }

    // Lets native built-ins call back into interpreter functions.
    EvalResult invoke_function(FunctionPtr fn, const std::vector<Value>& args, const Token& callToken);

    // Tracked allocation
    EnvPtr make_env(EnvPtr parent);
    ArrayPtr make_array(std::vector<Value> elements = {});
    HashMapPtr make_hash();
    InstancePtr make_instance(StructDefPtr def);

    // Number of live tracked objects (after pruning).
    size_t live_objects();

   private:
    EnvPtr global_env;
    EnvPtr main_module_env;
    std::string entry_file;

    std::vector<std::string> module_paths;
    std::vector<std::string> script_args_;

    std::ostream* out_ = &std::cout;
    std::istream* in_ = &std::cin;

    HeapTracker heap_;

    size_t call_depth_ = 0;
    size_t max_call_depth_ = 1000;

    // Stack position of the outermost execute(); 0 while idle.
    std::uintptr_t stack_base_ = 0;
    size_t stack_budget_;
    size_t stack_in_use() const;

    // Module loader records for caching and circular dependency handling.
    struct ModuleRecord {
        enum class State {
            Loading,
            Loaded
        };
        State state = State::Loading;
        EnvPtr module_env = nullptr;  // environment used while evaluating module
        std::string path;             // canonical filesystem path used as cache key
    };

    // map canonical module path (or "std::name") -> ModuleRecord
    std::unordered_map<std::string,
        std::shared_ptr<ModuleRecord>>
        module_cache;
    std::vector<std::string> import_stack;

    EvalResult import_module(ImportDeclarationNode* node, EnvPtr env);
    EvalResult load_module(const std::vector<std::string>& path, const Token& requesterTok, EnvPtr& out_env);
    EvalResult load_std_module(const std::string& name, const Token& tok, EnvPtr& out_env);
    std::string resolve_module_path(const std::vector<std::string>& path, const std::string& requester_filename);

    // Expression & statement evaluators. Pass the environment explicitly for lexical scoping.
    EvalResult evaluate_expression(ExpressionNode* expr, EnvPtr env);
    EvalResult evaluate_statement(StatementNode* stmt, EnvPtr env);
    EvalResult evaluate_block(BlockNode* block, EnvPtr env);
    EvalResult evaluate_body(const std::vector<std::unique_ptr<StatementNode>>& body, EnvPtr env);

    EvalResult evaluate_unary(UnaryExpressionNode* node, EnvPtr env);
    EvalResult evaluate_binary(BinaryExpressionNode* node, EnvPtr env);
    EvalResult evaluate_logical(BinaryExpressionNode* node, EnvPtr env);
    EvalResult evaluate_assignment(AssignmentExpressionNode* node, EnvPtr env);
    EvalResult evaluate_call(CallExpressionNode* node, EnvPtr env);
    EvalResult evaluate_index(IndexExpressionNode* node, EnvPtr env);
    EvalResult evaluate_member(MemberExpressionNode* node, EnvPtr env);
    EvalResult evaluate_array_literal(ArrayExpressionNode* node, EnvPtr env);
    EvalResult evaluate_hash_literal(HashMapExpressionNode* node, EnvPtr env);
    EvalResult evaluate_if(IfExpressionNode* node, EnvPtr env);
    EvalResult evaluate_function_literal(FunctionExpressionNode* node, EnvPtr env);

    EvalResult evaluate_while(WhileStatementNode* node, EnvPtr env);
    EvalResult evaluate_for_in(ForInStatementNode* node, EnvPtr env);
    EvalResult evaluate_for(ForStatementNode* node, EnvPtr env);

    // structs (StructRuntime.cpp)
    EvalResult evaluate_struct_declaration(StructDeclarationNode* node, EnvPtr env);
    EvalResult evaluate_struct_literal(StructLiteralNode* node, EnvPtr env);
    // for_call only changes the error kind reported for a missing member
    EvalResult get_member(const Value& object, const std::string& name, const Token& tok, bool for_call = false);
    EvalResult set_member(const Value& object, const std::string& name, const Value& value, const Token& tok);
    FunctionPtr bind_method(const FunctionPtr& method, const InstancePtr& inst);

    EvalResult call_function(FunctionPtr fn, const std::vector<Value>& args, const Token& callToken);

    // helpers: conditions, indexing, arithmetic
    EvalResult expect_bool(const Value& v, const std::string& what, const Token& tok);
    EvalResult index_value(const Value& object, const Value& index, const Token& tok);
    EvalResult assign_index(const Value& object, const Value& index, const Value& value, const Token& tok);
    EvalResult binary_op(const std::string& op, const Value& left, const Value& right, const Token& tok);

    std::string print_value(const Value& v, bool quote_strings, std::unordered_set<const void*>& visiting) const;
    bool values_equal(const Value& a, const Value& b, std::set<std::pair<const void*, const void*>>& comparing) const;
};

// ----------------- Shared helpers (EvaluatorHelper.cpp) -----------------

bool is_integer(const Value& v);
BigInt to_bigint(const Value& v);
// BigInteger that fits 64 bits collapses back to Integer
Value normalize_integer(const BigInt& b);

EvalResult checked_add(const Value& a, const Value& b, const Token& tok);
EvalResult checked_sub(const Value& a, const Value& b, const Token& tok);
EvalResult checked_mul(const Value& a, const Value& b, const Token& tok);
EvalResult checked_div(const Value& a, const Value& b, const Token& tok);
EvalResult checked_mod(const Value& a, const Value& b, const Token& tok);
EvalResult checked_neg(const Value& a, const Token& tok);
EvalResult checked_pow(const Value& base, const Value& exponent, const Token& tok);
// -1, 0, 1
int compare_integers(const Value& a, const Value& b);

// NotHashable unless v is a Boolean, Integer or String
EvalResult to_hash_key(const Value& v, HashKey& out, const Token& tok);
Value hash_key_to_value(const HashKey& k);

std::string value_type_name(const Value& v);
