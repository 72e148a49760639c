#include "builtins.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <string>

#include "evaluator.hpp"

// ----------------- Argument helpers -----------------

static EvalResult arg_mismatch(const std::string& fn, size_t i, const std::string& expected, const Value& got, const Token& tok) {
    return EvalResult::error(RuntimeErrorKind::TypeMismatch,
        fn + "() expects " + expected + " as argument " + std::to_string(i + 1) + ", got " + value_type_name(got),
        tok.loc);
}

EvalResult expect_arg_string(const std::string& fn, const std::vector<Value>& args, size_t i, const Token& tok) {
    if (!std::holds_alternative<std::string>(args[i])) return arg_mismatch(fn, i, "a string", args[i], tok);
    return args[i];
}

EvalResult expect_arg_integer(const std::string& fn, const std::vector<Value>& args, size_t i, const Token& tok) {
    if (!is_integer(args[i])) return arg_mismatch(fn, i, "an integer", args[i], tok);
    return args[i];
}

EvalResult expect_arg_array(const std::string& fn, const std::vector<Value>& args, size_t i, const Token& tok) {
    if (!std::holds_alternative<ArrayPtr>(args[i])) return arg_mismatch(fn, i, "an array", args[i], tok);
    return args[i];
}

EvalResult expect_arg_hash(const std::string& fn, const std::vector<Value>& args, size_t i, const Token& tok) {
    if (!std::holds_alternative<HashMapPtr>(args[i])) return arg_mismatch(fn, i, "a hash", args[i], tok);
    return args[i];
}

EvalResult expect_arg_instance(const std::string& fn, const std::vector<Value>& args, size_t i, const Token& tok) {
    if (!std::holds_alternative<InstancePtr>(args[i])) return arg_mismatch(fn, i, "a struct instance", args[i], tok);
    return args[i];
}

// ----------------- Shared string / collection operations -----------------

EvalResult builtin_len(const std::string& fn, const Value& v, const Token& tok) {
    if (std::holds_alternative<std::string>(v)) return Value{static_cast<int64_t>(std::get<std::string>(v).size())};
    if (std::holds_alternative<ArrayPtr>(v)) return Value{static_cast<int64_t>(std::get<ArrayPtr>(v)->elements.size())};
    if (std::holds_alternative<HashMapPtr>(v)) return Value{static_cast<int64_t>(std::get<HashMapPtr>(v)->entries.size())};
    return EvalResult::error(RuntimeErrorKind::TypeMismatch,
        fn + "() expects a string, array or hash, got " + value_type_name(v), tok.loc);
}

// Lead byte -> sequence length. Stray continuation bytes and truncated
// sequences at the end come out as single-byte pieces.
std::vector<std::string> utf8_chars(const std::string& s) {
    std::vector<std::string> chars;
    size_t i = 0;
    while (i < s.size()) {
        unsigned char lead = static_cast<unsigned char>(s[i]);
        size_t len = 1;
        if ((lead & 0xE0) == 0xC0) {
            len = 2;
        } else if ((lead & 0xF0) == 0xE0) {
            len = 3;
        } else if ((lead & 0xF8) == 0xF0) {
            len = 4;
        }
        if (i + len > s.size()) len = 1;
        for (size_t k = 1; k < len; ++k) {
            if ((static_cast<unsigned char>(s[i + k]) & 0xC0) != 0x80) {
                len = 1;
                break;
            }
        }
        chars.push_back(s.substr(i, len));
        i += len;
    }
    return chars;
}

std::vector<std::string> split_string(const std::string& s, const std::string& sep) {
    // empty separator splits into single characters
    if (sep.empty()) return utf8_chars(s);
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t pos = s.find(sep, start);
        if (pos == std::string::npos) {
            parts.push_back(s.substr(start));
            break;
        }
        parts.push_back(s.substr(start, pos - start));
        start = pos + sep.size();
    }
    return parts;
}

std::string replace_all(std::string s, const std::string& from, const std::string& to) {
    if (from.empty()) return s;
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
    return s;
}

std::string trim_string(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// ----------------- Global built-ins -----------------

void register_builtins(Evaluator& evaluator, EnvPtr env) {
    Evaluator* ev = &evaluator;
    const size_t VARIADIC = FunctionValue::VARIADIC;

    auto def = [&](const std::string& name, size_t min_args, size_t max_args, NativeImpl impl) {
        env->define(name, Value{make_native_fn(name, min_args, max_args, std::move(impl), env)});
    };

    // ---- I/O ----
    def("print", 0, VARIADIC, [ev](const std::vector<Value>& args, EnvPtr, const Token&) -> EvalResult {
        for (const auto& a : args) ev->output() << ev->value_to_string(a);
        ev->output().flush();
        return Value{};
    });

    def("println", 0, VARIADIC, [ev](const std::vector<Value>& args, EnvPtr, const Token&) -> EvalResult {
        for (const auto& a : args) ev->output() << ev->value_to_string(a);
        ev->output() << "\n";
        ev->output().flush();
        return Value{};
    });

    // input([prompt]) -> string, or null at end of input
    def("input", 0, 1, [ev](const std::vector<Value>& args, EnvPtr, const Token& tok) -> EvalResult {
        if (!args.empty() && !std::holds_alternative<std::monostate>(args[0])) {
            GIU_TRY(prompt, expect_arg_string("input", args, 0, tok));
            ev->output() << std::get<std::string>(prompt);
            ev->output().flush();
        }
        std::string line;
        if (!std::getline(ev->input(), line)) return Value{};
        if (!line.empty() && line.back() == '\r') line.pop_back();
        return Value{line};
    });

    // ---- core ----
    def("type", 1, 1, [ev](const std::vector<Value>& args, EnvPtr, const Token&) -> EvalResult {
        return Value{ev->type_name(args[0])};
    });

    def("to_string", 1, 1, [ev](const std::vector<Value>& args, EnvPtr, const Token&) -> EvalResult {
        return Value{ev->value_to_string(args[0])};
    });

    def("len", 1, 1, [](const std::vector<Value>& args, EnvPtr, const Token& tok) -> EvalResult {
        return builtin_len("len", args[0], tok);
    });

    def("is_empty", 1, 1, [](const std::vector<Value>& args, EnvPtr, const Token& tok) -> EvalResult {
        GIU_TRY(n, builtin_len("is_empty", args[0], tok));
        return Value{std::get<int64_t>(n) == 0};
    });

    // ---- arrays ----
    def("head", 1, 1, [](const std::vector<Value>& args, EnvPtr, const Token& tok) -> EvalResult {
        GIU_TRY(a, expect_arg_array("head", args, 0, tok));
        const auto& arr = std::get<ArrayPtr>(a);
        if (arr->elements.empty()) {
            return EvalResult::error(RuntimeErrorKind::InvalidOperation, "head() of an empty array", tok.loc);
        }
        return arr->elements.front();
    });

    def("tail", 1, 1, [ev](const std::vector<Value>& args, EnvPtr, const Token& tok) -> EvalResult {
        GIU_TRY(a, expect_arg_array("tail", args, 0, tok));
        const auto& arr = std::get<ArrayPtr>(a);
        if (arr->elements.empty()) {
            return EvalResult::error(RuntimeErrorKind::InvalidOperation, "tail() of an empty array", tok.loc);
        }
        return Value{ev->make_array(std::vector<Value>(arr->elements.begin() + 1, arr->elements.end()))};
    });

    def("cons", 2, 2, [ev](const std::vector<Value>& args, EnvPtr, const Token& tok) -> EvalResult {
        GIU_TRY(a, expect_arg_array("cons", args, 1, tok));
        const auto& arr = std::get<ArrayPtr>(a);
        std::vector<Value> elements;
        elements.reserve(arr->elements.size() + 1);
        elements.push_back(args[0]);
        elements.insert(elements.end(), arr->elements.begin(), arr->elements.end());
        return Value{ev->make_array(std::move(elements))};
    });

    // push mutates the shared array in place
    def("push", 2, 2, [](const std::vector<Value>& args, EnvPtr, const Token& tok) -> EvalResult {
        GIU_TRY(a, expect_arg_array("push", args, 0, tok));
        std::get<ArrayPtr>(a)->elements.push_back(args[1]);
        return a;
    });

    // ---- strings ----
    def("split", 2, 2, [ev](const std::vector<Value>& args, EnvPtr, const Token& tok) -> EvalResult {
        GIU_TRY(s, expect_arg_string("split", args, 0, tok));
        GIU_TRY(sep, expect_arg_string("split", args, 1, tok));
        std::vector<Value> parts;
        for (auto& p : split_string(std::get<std::string>(s), std::get<std::string>(sep))) parts.push_back(Value{p});
        return Value{ev->make_array(std::move(parts))};
    });

    def("replace", 3, 3, [](const std::vector<Value>& args, EnvPtr, const Token& tok) -> EvalResult {
        GIU_TRY(s, expect_arg_string("replace", args, 0, tok));
        GIU_TRY(from, expect_arg_string("replace", args, 1, tok));
        GIU_TRY(to, expect_arg_string("replace", args, 2, tok));
        if (std::get<std::string>(from).empty()) {
            return EvalResult::error(RuntimeErrorKind::InvalidArguments, "replace() needs a non-empty pattern", tok.loc);
        }
        return Value{replace_all(std::get<std::string>(s), std::get<std::string>(from), std::get<std::string>(to))};
    });

    def("trim", 1, 1, [](const std::vector<Value>& args, EnvPtr, const Token& tok) -> EvalResult {
        GIU_TRY(s, expect_arg_string("trim", args, 0, tok));
        return Value{trim_string(std::get<std::string>(s))};
    });

    // contains(string, substring) / contains(array, value) / contains(hash, key)
    def("contains", 2, 2, [ev](const std::vector<Value>& args, EnvPtr, const Token& tok) -> EvalResult {
        const Value& c = args[0];
        if (std::holds_alternative<std::string>(c)) {
            GIU_TRY(sub, expect_arg_string("contains", args, 1, tok));
            return Value{std::get<std::string>(c).find(std::get<std::string>(sub)) != std::string::npos};
        }
        if (std::holds_alternative<ArrayPtr>(c)) {
            for (const auto& e : std::get<ArrayPtr>(c)->elements) {
                if (ev->is_equal(e, args[1])) return Value{true};
            }
            return Value{false};
        }
        if (std::holds_alternative<HashMapPtr>(c)) {
            HashKey key;
            EvalResult kr = to_hash_key(args[1], key, tok);
            if (kr.is_error()) return kr;
            return Value{std::get<HashMapPtr>(c)->entries.count(key) > 0};
        }
        return EvalResult::error(RuntimeErrorKind::TypeMismatch,
            "contains() expects a string, array or hash, got " + ev->type_name(c), tok.loc);
    });

    // slice(string|array, start [, end]) -> [start, end)
    def("slice", 2, 3, [ev](const std::vector<Value>& args, EnvPtr, const Token& tok) -> EvalResult {
        const Value& c = args[0];
        bool is_str = std::holds_alternative<std::string>(c);
        if (!is_str && !std::holds_alternative<ArrayPtr>(c)) {
            return EvalResult::error(RuntimeErrorKind::TypeMismatch,
                "slice() expects a string or array, got " + ev->type_name(c), tok.loc);
        }
        size_t len = is_str ? std::get<std::string>(c).size() : std::get<ArrayPtr>(c)->elements.size();

        GIU_TRY(sv, expect_arg_integer("slice", args, 1, tok));
        Value ev_end = Value{static_cast<int64_t>(len)};
        if (args.size() == 3) {
            GIU_TRY(e, expect_arg_integer("slice", args, 2, tok));
            ev_end = e;
        }
        if (!std::holds_alternative<int64_t>(sv) || !std::holds_alternative<int64_t>(ev_end)) {
            return EvalResult::error(RuntimeErrorKind::IndexOutOfBounds, "slice() bounds out of range", tok.loc);
        }
        int64_t start = std::get<int64_t>(sv), end = std::get<int64_t>(ev_end);
        if (start < 0 || end < start || static_cast<uint64_t>(end) > len) {
            return EvalResult::error(RuntimeErrorKind::IndexOutOfBounds,
                "slice(" + std::to_string(start) + ", " + std::to_string(end) + ") out of bounds for length " +
                    std::to_string(len),
                tok.loc);
        }
        if (is_str) {
            return Value{std::get<std::string>(c).substr(static_cast<size_t>(start), static_cast<size_t>(end - start))};
        }
        const auto& elems = std::get<ArrayPtr>(c)->elements;
        return Value{ev->make_array(std::vector<Value>(elems.begin() + start, elems.begin() + end))};
    });

    // ---- integers ----
    def("pow", 2, 2, [](const std::vector<Value>& args, EnvPtr, const Token& tok) -> EvalResult {
        return checked_pow(args[0], args[1], tok);
    });

    def("abs", 1, 1, [](const std::vector<Value>& args, EnvPtr, const Token& tok) -> EvalResult {
        GIU_TRY(n, expect_arg_integer("abs", args, 0, tok));
        if (compare_integers(n, Value{int64_t(0)}) < 0) return checked_neg(n, tok);
        return n;
    });

    def("min", 2, 2, [](const std::vector<Value>& args, EnvPtr, const Token& tok) -> EvalResult {
        GIU_TRY(a, expect_arg_integer("min", args, 0, tok));
        GIU_TRY(b, expect_arg_integer("min", args, 1, tok));
        return compare_integers(a, b) <= 0 ? a : b;
    });

    def("max", 2, 2, [](const std::vector<Value>& args, EnvPtr, const Token& tok) -> EvalResult {
        GIU_TRY(a, expect_arg_integer("max", args, 0, tok));
        GIU_TRY(b, expect_arg_integer("max", args, 1, tok));
        return compare_integers(a, b) >= 0 ? a : b;
    });

    // ---- hashes ----
    def("keys", 1, 1, [ev](const std::vector<Value>& args, EnvPtr, const Token& tok) -> EvalResult {
        GIU_TRY(h, expect_arg_hash("keys", args, 0, tok));
        std::vector<Value> out;
        for (const auto& kv : std::get<HashMapPtr>(h)->entries) out.push_back(hash_key_to_value(kv.first));
        return Value{ev->make_array(std::move(out))};
    });

    def("values", 1, 1, [ev](const std::vector<Value>& args, EnvPtr, const Token& tok) -> EvalResult {
        GIU_TRY(h, expect_arg_hash("values", args, 0, tok));
        std::vector<Value> out;
        for (const auto& kv : std::get<HashMapPtr>(h)->entries) out.push_back(kv.second);
        return Value{ev->make_array(std::move(out))};
    });

    def("clear", 1, 1, [](const std::vector<Value>& args, EnvPtr, const Token& tok) -> EvalResult {
        GIU_TRY(h, expect_arg_hash("clear", args, 0, tok));
        std::get<HashMapPtr>(h)->entries.clear();
        return h;
    });

    // ---- struct reflection ----
    def("fields", 1, 1, [ev](const std::vector<Value>& args, EnvPtr, const Token& tok) -> EvalResult {
        GIU_TRY(i, expect_arg_instance("fields", args, 0, tok));
        std::vector<Value> names;
        for (const auto& f : std::get<InstancePtr>(i)->def->field_names) names.push_back(Value{f});
        return Value{ev->make_array(std::move(names))};
    });

    def("name", 1, 1, [](const std::vector<Value>& args, EnvPtr, const Token& tok) -> EvalResult {
        if (std::holds_alternative<StructDefPtr>(args[0])) return Value{std::get<StructDefPtr>(args[0])->name};
        GIU_TRY(i, expect_arg_instance("name", args, 0, tok));
        return Value{std::get<InstancePtr>(i)->def->name};
    });

    def("get_field", 2, 2, [](const std::vector<Value>& args, EnvPtr, const Token& tok) -> EvalResult {
        GIU_TRY(i, expect_arg_instance("get_field", args, 0, tok));
        GIU_TRY(f, expect_arg_string("get_field", args, 1, tok));
        const auto& inst = std::get<InstancePtr>(i);
        auto it = inst->fields.find(std::get<std::string>(f));
        if (it == inst->fields.end()) {
            return EvalResult::error(RuntimeErrorKind::UndefinedField,
                "Struct '" + inst->def->name + "' has no field '" + std::get<std::string>(f) + "'", tok.loc);
        }
        return it->second;
    });

    // set_field mutates the instance in place and returns it
    def("set_field", 3, 3, [](const std::vector<Value>& args, EnvPtr, const Token& tok) -> EvalResult {
        GIU_TRY(i, expect_arg_instance("set_field", args, 0, tok));
        GIU_TRY(f, expect_arg_string("set_field", args, 1, tok));
        const auto& inst = std::get<InstancePtr>(i);
        const std::string& field = std::get<std::string>(f);
        if (!inst->def->has_field(field)) {
            return EvalResult::error(RuntimeErrorKind::UndefinedField,
                "Struct '" + inst->def->name + "' has no field '" + field + "'", tok.loc);
        }
        inst->fields[field] = args[2];
        return i;
    });
}
