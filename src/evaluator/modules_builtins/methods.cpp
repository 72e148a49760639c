// Built-in methods of primitive receivers: `5.pow(2)`, `"a,b".split(",")`, `xs.push(1)`, `h.get("k")`.
#include <cctype>
#include <string>

#include "builtins.hpp"
#include "evaluator.hpp"

namespace {

using Impl = NativeImpl;

FunctionPtr make_method(Evaluator& ev, const std::string& name, size_t min_args, size_t max_args, Impl impl) {
    return make_native_fn(name, min_args, max_args, std::move(impl), ev.globals());
}

// Parses an optionally signed run of decimal digits; anything else is rejected.
bool parse_integer_literal(const std::string& text, Value& out) {
    std::string s = trim_string(text);
    size_t i = 0;
    bool negative = false;
    if (i < s.size() && (s[i] == '+' || s[i] == '-')) {
        negative = s[i] == '-';
        ++i;
    }
    if (i == s.size()) return false;
    for (size_t j = i; j < s.size(); ++j) {
        if (!std::isdigit(static_cast<unsigned char>(s[j]))) return false;
    }
    // a leading 0 would make the parse octal
    while (i + 1 < s.size() && s[i] == '0') ++i;
    BigInt b(s.substr(i).c_str());
    if (negative) b = -b;
    out = normalize_integer(b);
    return true;
}

FunctionPtr integer_method(Evaluator& ev, const Value& self, const std::string& name) {
    if (name == "to_string") {
        return make_method(ev, name, 0, 0, [&ev, self](const std::vector<Value>&, EnvPtr, const Token&) -> EvalResult {
            return Value{ev.value_to_string(self)};
        });
    }
    if (name == "pow") {
        return make_method(ev, name, 1, 1, [self](const std::vector<Value>& args, EnvPtr, const Token& tok) -> EvalResult {
            return checked_pow(self, args[0], tok);
        });
    }
    if (name == "abs") {
        return make_method(ev, name, 0, 0, [self](const std::vector<Value>&, EnvPtr, const Token& tok) -> EvalResult {
            if (compare_integers(self, Value{int64_t(0)}) < 0) return checked_neg(self, tok);
            return self;
        });
    }
    if (name == "min" || name == "max") {
        bool want_min = name == "min";
        return make_method(ev, name, 1, 1, [self, name, want_min](const std::vector<Value>& args, EnvPtr, const Token& tok) -> EvalResult {
            GIU_TRY(other, expect_arg_integer(name, args, 0, tok));
            int c = compare_integers(self, other);
            if (want_min) return c <= 0 ? self : other;
            return c >= 0 ? self : other;
        });
    }
    return nullptr;
}

FunctionPtr string_method(Evaluator& ev, const std::string& self, const std::string& name) {
    if (name == "len" || name == "is_empty") {
        bool empty_check = name == "is_empty";
        return make_method(ev, name, 0, 0, [self, empty_check](const std::vector<Value>&, EnvPtr, const Token&) -> EvalResult {
            if (empty_check) return Value{self.empty()};
            return Value{static_cast<int64_t>(self.size())};
        });
    }
    if (name == "to_int") {
        return make_method(ev, name, 0, 0, [self](const std::vector<Value>&, EnvPtr, const Token& tok) -> EvalResult {
            Value out;
            if (!parse_integer_literal(self, out)) {
                return EvalResult::error(RuntimeErrorKind::InvalidArguments,
                    "Cannot convert \"" + self + "\" to an integer", tok.loc);
            }
            return out;
        });
    }
    if (name == "starts_with" || name == "ends_with" || name == "contains") {
        return make_method(ev, name, 1, 1, [self, name](const std::vector<Value>& args, EnvPtr, const Token& tok) -> EvalResult {
            GIU_TRY(a, expect_arg_string(name, args, 0, tok));
            const std::string& needle = std::get<std::string>(a);
            if (name == "contains") return Value{self.find(needle) != std::string::npos};
            if (needle.size() > self.size()) return Value{false};
            if (name == "starts_with") return Value{self.compare(0, needle.size(), needle) == 0};
            return Value{self.compare(self.size() - needle.size(), needle.size(), needle) == 0};
        });
    }
    if (name == "replace") {
        return make_method(ev, name, 2, 2, [self](const std::vector<Value>& args, EnvPtr, const Token& tok) -> EvalResult {
            GIU_TRY(from, expect_arg_string("replace", args, 0, tok));
            GIU_TRY(to, expect_arg_string("replace", args, 1, tok));
            if (std::get<std::string>(from).empty()) {
                return EvalResult::error(RuntimeErrorKind::InvalidArguments, "replace() needs a non-empty pattern", tok.loc);
            }
            return Value{replace_all(self, std::get<std::string>(from), std::get<std::string>(to))};
        });
    }
    if (name == "split") {
        return make_method(ev, name, 1, 1, [&ev, self](const std::vector<Value>& args, EnvPtr, const Token& tok) -> EvalResult {
            GIU_TRY(sep, expect_arg_string("split", args, 0, tok));
            std::vector<Value> parts;
            for (auto& p : split_string(self, std::get<std::string>(sep))) parts.push_back(Value{p});
            return Value{ev.make_array(std::move(parts))};
        });
    }
    if (name == "trim") {
        return make_method(ev, name, 0, 0, [self](const std::vector<Value>&, EnvPtr, const Token&) -> EvalResult {
            return Value{trim_string(self)};
        });
    }
    if (name == "upper" || name == "lower") {
        bool up = name == "upper";
        return make_method(ev, name, 0, 0, [self, up](const std::vector<Value>&, EnvPtr, const Token&) -> EvalResult {
            return Value{up ? to_upper(self) : to_lower(self)};
        });
    }
    return nullptr;
}

FunctionPtr array_method(Evaluator& ev, const ArrayPtr& self, const std::string& name) {
    if (name == "len" || name == "is_empty") {
        bool empty_check = name == "is_empty";
        return make_method(ev, name, 0, 0, [self, empty_check](const std::vector<Value>&, EnvPtr, const Token&) -> EvalResult {
            if (empty_check) return Value{self->elements.empty()};
            return Value{static_cast<int64_t>(self->elements.size())};
        });
    }
    if (name == "head") {
        return make_method(ev, name, 0, 0, [self](const std::vector<Value>&, EnvPtr, const Token& tok) -> EvalResult {
            if (self->elements.empty()) {
                return EvalResult::error(RuntimeErrorKind::InvalidOperation, "head() of an empty array", tok.loc);
            }
            return self->elements.front();
        });
    }
    if (name == "tail") {
        return make_method(ev, name, 0, 0, [&ev, self](const std::vector<Value>&, EnvPtr, const Token& tok) -> EvalResult {
            if (self->elements.empty()) {
                return EvalResult::error(RuntimeErrorKind::InvalidOperation, "tail() of an empty array", tok.loc);
            }
            return Value{ev.make_array(std::vector<Value>(self->elements.begin() + 1, self->elements.end()))};
        });
    }
    if (name == "push") {
        return make_method(ev, name, 1, 1, [self](const std::vector<Value>& args, EnvPtr, const Token&) -> EvalResult {
            self->elements.push_back(args[0]);
            return Value{self};
        });
    }
    if (name == "pop") {
        return make_method(ev, name, 0, 0, [self](const std::vector<Value>&, EnvPtr, const Token& tok) -> EvalResult {
            if (self->elements.empty()) {
                return EvalResult::error(RuntimeErrorKind::InvalidOperation, "pop() of an empty array", tok.loc);
            }
            Value last = std::move(self->elements.back());
            self->elements.pop_back();
            return last;
        });
    }
    if (name == "contains") {
        return make_method(ev, name, 1, 1, [&ev, self](const std::vector<Value>& args, EnvPtr, const Token&) -> EvalResult {
            for (const auto& e : self->elements) {
                if (ev.is_equal(e, args[0])) return Value{true};
            }
            return Value{false};
        });
    }
    if (name == "join") {
        return make_method(ev, name, 1, 1, [&ev, self](const std::vector<Value>& args, EnvPtr, const Token& tok) -> EvalResult {
            GIU_TRY(sep, expect_arg_string("join", args, 0, tok));
            std::string out;
            for (size_t i = 0; i < self->elements.size(); ++i) {
                if (i) out += std::get<std::string>(sep);
                out += ev.value_to_string(self->elements[i]);
            }
            return Value{out};
        });
    }
    return nullptr;
}

FunctionPtr hash_method(Evaluator& ev, const HashMapPtr& self, const std::string& name) {
    if (name == "len" || name == "is_empty") {
        bool empty_check = name == "is_empty";
        return make_method(ev, name, 0, 0, [self, empty_check](const std::vector<Value>&, EnvPtr, const Token&) -> EvalResult {
            if (empty_check) return Value{self->entries.empty()};
            return Value{static_cast<int64_t>(self->entries.size())};
        });
    }
    // get(key [, default]) never fails on a missing key
    if (name == "get") {
        return make_method(ev, name, 1, 2, [self](const std::vector<Value>& args, EnvPtr, const Token& tok) -> EvalResult {
            HashKey key;
            EvalResult kr = to_hash_key(args[0], key, tok);
            if (kr.is_error()) return kr;
            auto it = self->entries.find(key);
            if (it != self->entries.end()) return it->second;
            return args.size() == 2 ? args[1] : Value{};
        });
    }
    if (name == "set") {
        return make_method(ev, name, 2, 2, [self](const std::vector<Value>& args, EnvPtr, const Token& tok) -> EvalResult {
            HashKey key;
            EvalResult kr = to_hash_key(args[0], key, tok);
            if (kr.is_error()) return kr;
            self->entries[key] = args[1];
            return Value{self};
        });
    }
    if (name == "has") {
        return make_method(ev, name, 1, 1, [self](const std::vector<Value>& args, EnvPtr, const Token& tok) -> EvalResult {
            HashKey key;
            EvalResult kr = to_hash_key(args[0], key, tok);
            if (kr.is_error()) return kr;
            return Value{self->entries.count(key) > 0};
        });
    }
    // remove(key) -> removed value, or null when absent
    if (name == "remove") {
        return make_method(ev, name, 1, 1, [self](const std::vector<Value>& args, EnvPtr, const Token& tok) -> EvalResult {
            HashKey key;
            EvalResult kr = to_hash_key(args[0], key, tok);
            if (kr.is_error()) return kr;
            auto it = self->entries.find(key);
            if (it == self->entries.end()) return Value{};
            Value removed = std::move(it->second);
            self->entries.erase(it);
            return removed;
        });
    }
    if (name == "keys" || name == "values") {
        bool want_keys = name == "keys";
        return make_method(ev, name, 0, 0, [&ev, self, want_keys](const std::vector<Value>&, EnvPtr, const Token&) -> EvalResult {
            std::vector<Value> out;
            for (const auto& kv : self->entries) out.push_back(want_keys ? hash_key_to_value(kv.first) : kv.second);
            return Value{ev.make_array(std::move(out))};
        });
    }
    if (name == "clear") {
        return make_method(ev, name, 0, 0, [self](const std::vector<Value>&, EnvPtr, const Token&) -> EvalResult {
            self->entries.clear();
            return Value{self};
        });
    }
    return nullptr;
}

}  // namespace

FunctionPtr lookup_builtin_method(Evaluator& evaluator, const Value& receiver, const std::string& name, const Token&) {
    if (is_integer(receiver)) return integer_method(evaluator, receiver, name);
    if (std::holds_alternative<std::string>(receiver)) return string_method(evaluator, std::get<std::string>(receiver), name);
    if (std::holds_alternative<ArrayPtr>(receiver)) return array_method(evaluator, std::get<ArrayPtr>(receiver), name);
    if (std::holds_alternative<HashMapPtr>(receiver)) return hash_method(evaluator, std::get<HashMapPtr>(receiver), name);
    return nullptr;
}
