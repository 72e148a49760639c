#include <cstdint>
#include <limits>
#include <set>
#include <sstream>
#include <unordered_set>

#include "evaluator.hpp"

namespace {

constexpr int64_t I64_MAX = std::numeric_limits<int64_t>::max();
constexpr int64_t I64_MIN = std::numeric_limits<int64_t>::min();

const BigInt& big_i64_max() {
    static const BigInt v(I64_MAX);
    return v;
}

const BigInt& big_i64_min() {
    static const BigInt v(I64_MIN);
    return v;
}

EvalResult arithmetic_mismatch(const std::string& op, const Value& a, const Value& b, const Token& tok) {
    return EvalResult::error(RuntimeErrorKind::TypeMismatch,
        "Operator '" + op + "' expects integers, got " + value_type_name(a) + " and " + value_type_name(b),
        tok.loc);
}

}  // namespace

std::string runtime_error_kind_name(RuntimeErrorKind kind) {
    switch (kind) {
        case RuntimeErrorKind::UndefinedVariable: return "UndefinedVariable";
        case RuntimeErrorKind::UndefinedField: return "UndefinedField";
        case RuntimeErrorKind::UndefinedMethod: return "UndefinedMethod";
        case RuntimeErrorKind::TypeMismatch: return "TypeMismatch";
        case RuntimeErrorKind::DivisionByZero: return "DivisionByZero";
        case RuntimeErrorKind::ModuloByZero: return "ModuloByZero";
        case RuntimeErrorKind::IndexOutOfBounds: return "IndexOutOfBounds";
        case RuntimeErrorKind::MissingKey: return "MissingKey";
        case RuntimeErrorKind::WrongArgumentCount: return "WrongArgumentCount";
        case RuntimeErrorKind::NotCallable: return "NotCallable";
        case RuntimeErrorKind::NotHashable: return "NotHashable";
        case RuntimeErrorKind::NotIndexable: return "NotIndexable";
        case RuntimeErrorKind::InvalidArguments: return "InvalidArguments";
        case RuntimeErrorKind::InvalidOperation: return "InvalidOperation";
        case RuntimeErrorKind::ImportCycle: return "ImportCycle";
        case RuntimeErrorKind::ModuleNotFound: return "ModuleNotFound";
        case RuntimeErrorKind::UnknownExport: return "UnknownExport";
    }
    return "RuntimeError";
}

// ----------------- Evaluator helpers -----------------

std::string value_type_name(const Value& v) {
    if (std::holds_alternative<std::monostate>(v)) return "null";
    if (std::holds_alternative<bool>(v)) return "boolean";
    if (std::holds_alternative<int64_t>(v)) return "integer";
    if (std::holds_alternative<BigInt>(v)) return "biginteger";
    if (std::holds_alternative<std::string>(v)) return "string";
    if (std::holds_alternative<ArrayPtr>(v)) return "array";
    if (std::holds_alternative<HashMapPtr>(v)) return "hash";
    if (std::holds_alternative<FunctionPtr>(v)) {
        const auto& fn = std::get<FunctionPtr>(v);
        return fn && fn->is_native ? "builtin function" : "function";
    }
    if (std::holds_alternative<StructDefPtr>(v)) return "struct";
    if (std::holds_alternative<InstancePtr>(v)) {
        const auto& inst = std::get<InstancePtr>(v);
        return inst && inst->def ? inst->def->name : "instance";
    }
    return "unknown";
}

std::string Evaluator::type_name(const Value& v) const {
    return value_type_name(v);
}

bool is_integer(const Value& v) {
    return std::holds_alternative<int64_t>(v) || std::holds_alternative<BigInt>(v);
}

BigInt to_bigint(const Value& v) {
    if (std::holds_alternative<int64_t>(v)) return BigInt(std::get<int64_t>(v));
    if (std::holds_alternative<BigInt>(v)) return std::get<BigInt>(v);
    return BigInt(0);
}

Value normalize_integer(const BigInt& b) {
    if (b >= big_i64_min() && b <= big_i64_max()) {
        return Value{b.convert_to<int64_t>()};
    }
    return Value{b};
}

int compare_integers(const Value& a, const Value& b) {
    if (std::holds_alternative<int64_t>(a) && std::holds_alternative<int64_t>(b)) {
        int64_t x = std::get<int64_t>(a), y = std::get<int64_t>(b);
        return x < y ? -1 : (x > y ? 1 : 0);
    }
    BigInt x = to_bigint(a), y = to_bigint(b);
    return x < y ? -1 : (x > y ? 1 : 0);
}

// ----------------- Integer arithmetic with promotion -----------------

EvalResult checked_add(const Value& a, const Value& b, const Token& tok) {
    if (!is_integer(a) || !is_integer(b)) return arithmetic_mismatch("+", a, b, tok);
    if (std::holds_alternative<int64_t>(a) && std::holds_alternative<int64_t>(b)) {
        int64_t x = std::get<int64_t>(a), y = std::get<int64_t>(b);
        bool overflow = (y > 0 && x > I64_MAX - y) || (y < 0 && x < I64_MIN - y);
        if (!overflow) return Value{x + y};
    }
    BigInt r = to_bigint(a) + to_bigint(b);
    return normalize_integer(r);
}

EvalResult checked_sub(const Value& a, const Value& b, const Token& tok) {
    if (!is_integer(a) || !is_integer(b)) return arithmetic_mismatch("-", a, b, tok);
    if (std::holds_alternative<int64_t>(a) && std::holds_alternative<int64_t>(b)) {
        int64_t x = std::get<int64_t>(a), y = std::get<int64_t>(b);
        bool overflow = (y < 0 && x > I64_MAX + y) || (y > 0 && x < I64_MIN + y);
        if (!overflow) return Value{x - y};
    }
    BigInt r = to_bigint(a) - to_bigint(b);
    return normalize_integer(r);
}

EvalResult checked_mul(const Value& a, const Value& b, const Token& tok) {
    if (!is_integer(a) || !is_integer(b)) return arithmetic_mismatch("*", a, b, tok);
    if (std::holds_alternative<int64_t>(a) && std::holds_alternative<int64_t>(b)) {
        int64_t x = std::get<int64_t>(a), y = std::get<int64_t>(b);
        if (x == 0 || y == 0) return Value{int64_t(0)};
        bool overflow;
        if (x > 0) {
            overflow = y > 0 ? x > I64_MAX / y : y < I64_MIN / x;
        } else {
            overflow = y > 0 ? x < I64_MIN / y : x < I64_MAX / y;
        }
        if (!overflow) return Value{x * y};
    }
    BigInt r = to_bigint(a) * to_bigint(b);
    return normalize_integer(r);
}

// truncates toward zero
EvalResult checked_div(const Value& a, const Value& b, const Token& tok) {
    if (!is_integer(a) || !is_integer(b)) return arithmetic_mismatch("/", a, b, tok);
    if (to_bigint(b) == 0) {
        return EvalResult::error(RuntimeErrorKind::DivisionByZero, "Division by zero", tok.loc);
    }
    if (std::holds_alternative<int64_t>(a) && std::holds_alternative<int64_t>(b)) {
        int64_t x = std::get<int64_t>(a), y = std::get<int64_t>(b);
        if (!(x == I64_MIN && y == -1)) return Value{x / y};
    }
    BigInt r = to_bigint(a) / to_bigint(b);
    return normalize_integer(r);
}

// result takes the sign of the dividend
EvalResult checked_mod(const Value& a, const Value& b, const Token& tok) {
    if (!is_integer(a) || !is_integer(b)) return arithmetic_mismatch("%", a, b, tok);
    if (to_bigint(b) == 0) {
        return EvalResult::error(RuntimeErrorKind::ModuloByZero, "Modulo by zero", tok.loc);
    }
    if (std::holds_alternative<int64_t>(a) && std::holds_alternative<int64_t>(b)) {
        int64_t x = std::get<int64_t>(a), y = std::get<int64_t>(b);
        if (y == -1) return Value{int64_t(0)};
        return Value{x % y};
    }
    BigInt r = to_bigint(a) % to_bigint(b);
    return normalize_integer(r);
}

EvalResult checked_neg(const Value& a, const Token& tok) {
    if (std::holds_alternative<int64_t>(a)) {
        int64_t x = std::get<int64_t>(a);
        if (x != I64_MIN) return Value{-x};
    } else if (!std::holds_alternative<BigInt>(a)) {
        return EvalResult::error(RuntimeErrorKind::TypeMismatch,
            "Unary '-' expects an integer, got " + value_type_name(a), tok.loc);
    }
    BigInt r = -to_bigint(a);
    return normalize_integer(r);
}

EvalResult checked_pow(const Value& base, const Value& exponent, const Token& tok) {
    if (!is_integer(base) || !is_integer(exponent)) return arithmetic_mismatch("pow", base, exponent, tok);
    BigInt e = to_bigint(exponent);
    if (e < 0) {
        return EvalResult::error(RuntimeErrorKind::InvalidArguments,
            "pow expects a non-negative exponent, got " + e.str(), tok.loc);
    }
    if (e > BigInt(std::numeric_limits<unsigned>::max())) {
        return EvalResult::error(RuntimeErrorKind::InvalidArguments,
            "pow exponent " + e.str() + " is too large", tok.loc);
    }
    BigInt r = boost::multiprecision::pow(to_bigint(base), e.convert_to<unsigned>());
    return normalize_integer(r);
}

// ----------------- Hash keys -----------------

EvalResult to_hash_key(const Value& v, HashKey& out, const Token& tok) {
    if (std::holds_alternative<bool>(v)) {
        out = std::get<bool>(v);
    } else if (std::holds_alternative<int64_t>(v)) {
        out = std::get<int64_t>(v);
    } else if (std::holds_alternative<std::string>(v)) {
        out = std::get<std::string>(v);
    } else {
        return EvalResult::error(RuntimeErrorKind::NotHashable,
            "Value of type " + value_type_name(v) + " cannot be used as a hash key", tok.loc);
    }
    return Value{};
}

Value hash_key_to_value(const HashKey& k) {
    if (std::holds_alternative<bool>(k)) return Value{std::get<bool>(k)};
    if (std::holds_alternative<int64_t>(k)) return Value{std::get<int64_t>(k)};
    return Value{std::get<std::string>(k)};
}

// ----------------- Equality -----------------

bool Evaluator::is_equal(const Value& a, const Value& b) const {
    std::set<std::pair<const void*, const void*>> comparing;
    return values_equal(a, b, comparing);
}

// `comparing` holds the composite pairs currently on the recursion stack.
// Meeting a pair again means both sides cycle back at the same point, so
// the pair is taken as equal and the remaining elements decide.
bool Evaluator::values_equal(const Value& a, const Value& b, std::set<std::pair<const void*, const void*>>& comparing) const {
    // Integer and BigInteger compare by numeric value
    if (is_integer(a) && is_integer(b)) return compare_integers(a, b) == 0;

    if (a.index() != b.index()) return false;

    if (std::holds_alternative<std::monostate>(a)) return true;
    if (std::holds_alternative<bool>(a)) return std::get<bool>(a) == std::get<bool>(b);
    if (std::holds_alternative<std::string>(a)) return std::get<std::string>(a) == std::get<std::string>(b);

    if (std::holds_alternative<ArrayPtr>(a)) {
        const auto& x = std::get<ArrayPtr>(a);
        const auto& y = std::get<ArrayPtr>(b);
        if (x == y) return true;
        if (!x || !y || x->elements.size() != y->elements.size()) return false;
        std::pair<const void*, const void*> key(x.get(), y.get());
        if (!comparing.insert(key).second) return true;
        bool same = true;
        for (size_t i = 0; same && i < x->elements.size(); ++i) {
            same = values_equal(x->elements[i], y->elements[i], comparing);
        }
        comparing.erase(key);
        return same;
    }

    if (std::holds_alternative<HashMapPtr>(a)) {
        const auto& x = std::get<HashMapPtr>(a);
        const auto& y = std::get<HashMapPtr>(b);
        if (x == y) return true;
        if (!x || !y || x->entries.size() != y->entries.size()) return false;
        std::pair<const void*, const void*> key(x.get(), y.get());
        if (!comparing.insert(key).second) return true;
        bool same = true;
        for (const auto& kv : x->entries) {
            auto it = y->entries.find(kv.first);
            if (it == y->entries.end() || !values_equal(kv.second, it->second, comparing)) {
                same = false;
                break;
            }
        }
        comparing.erase(key);
        return same;
    }

    // functions, struct definitions and instances compare by identity
    if (std::holds_alternative<FunctionPtr>(a)) return std::get<FunctionPtr>(a) == std::get<FunctionPtr>(b);
    if (std::holds_alternative<StructDefPtr>(a)) return std::get<StructDefPtr>(a) == std::get<StructDefPtr>(b);
    if (std::holds_alternative<InstancePtr>(a)) return std::get<InstancePtr>(a) == std::get<InstancePtr>(b);
    return false;
}

// ----------------- Textual form -----------------

std::string Evaluator::value_to_string(const Value& v) const {
    std::unordered_set<const void*> visiting;
    return print_value(v, false, visiting);
}

std::string Evaluator::print_value(const Value& v, bool quote_strings, std::unordered_set<const void*>& visiting) const {
    if (std::holds_alternative<std::monostate>(v)) return "null";
    if (std::holds_alternative<bool>(v)) return std::get<bool>(v) ? "true" : "false";
    if (std::holds_alternative<int64_t>(v)) return std::to_string(std::get<int64_t>(v));
    if (std::holds_alternative<BigInt>(v)) return std::get<BigInt>(v).str();
    if (std::holds_alternative<std::string>(v)) {
        const auto& s = std::get<std::string>(v);
        return quote_strings ? "\"" + s + "\"" : s;
    }

    if (std::holds_alternative<ArrayPtr>(v)) {
        const auto& arr = std::get<ArrayPtr>(v);
        if (!arr) return "[]";
        if (!visiting.insert(arr.get()).second) return "[...]";
        std::ostringstream ss;
        ss << "[";
        for (size_t i = 0; i < arr->elements.size(); ++i) {
            if (i) ss << ", ";
            ss << print_value(arr->elements[i], true, visiting);
        }
        ss << "]";
        visiting.erase(arr.get());
        return ss.str();
    }

    if (std::holds_alternative<HashMapPtr>(v)) {
        const auto& h = std::get<HashMapPtr>(v);
        if (!h) return "{}";
        if (!visiting.insert(h.get()).second) return "{...}";
        std::ostringstream ss;
        ss << "{";
        bool first = true;
        for (const auto& kv : h->entries) {
            if (!first) ss << ", ";
            first = false;
            ss << print_value(hash_key_to_value(kv.first), true, visiting) << " : "
               << print_value(kv.second, true, visiting);
        }
        ss << "}";
        visiting.erase(h.get());
        return ss.str();
    }

    if (std::holds_alternative<FunctionPtr>(v)) {
        const auto& fn = std::get<FunctionPtr>(v);
        if (!fn) return "[function]";
        if (fn->is_native) return "[built-in function: " + fn->name + "]";
        if (fn->name.empty()) return "[function]";
        return "[function: " + fn->name + "]";
    }

    if (std::holds_alternative<StructDefPtr>(v)) {
        const auto& def = std::get<StructDefPtr>(v);
        return "[struct " + (def ? def->name : std::string("?")) + "]";
    }

    if (std::holds_alternative<InstancePtr>(v)) {
        const auto& inst = std::get<InstancePtr>(v);
        if (!inst || !inst->def) return "[instance]";
        if (!visiting.insert(inst.get()).second) return inst->def->name + " {...}";
        std::ostringstream ss;
        ss << inst->def->name << " {";
        bool first = true;
        for (const auto& f : inst->def->field_names) {
            auto it = inst->fields.find(f);
            if (it == inst->fields.end()) continue;
            ss << (first ? " " : ", ") << f << ": " << print_value(it->second, true, visiting);
            first = false;
        }
        ss << (first ? "}" : " }");
        visiting.erase(inst.get());
        return ss.str();
    }

    return "<unknown>";
}
