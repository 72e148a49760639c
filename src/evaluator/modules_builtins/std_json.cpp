// std.json: serialize(value [, indent]) / deserialize(text), backed by nlohmann/json.
#include <limits>
#include <string>
#include <unordered_set>

#include <nlohmann/json.hpp>

#include "builtins.hpp"
#include "evaluator.hpp"

using json = nlohmann::json;

namespace {

std::string json_key(const HashKey& k) {
    if (std::holds_alternative<std::string>(k)) return std::get<std::string>(k);
    if (std::holds_alternative<int64_t>(k)) return std::to_string(std::get<int64_t>(k));
    return std::get<bool>(k) ? "true" : "false";
}

EvalResult to_json(const Value& v, json& out, std::unordered_set<const void*>& visiting, const Token& tok) {
    if (std::holds_alternative<std::monostate>(v)) {
        out = nullptr;
    } else if (std::holds_alternative<bool>(v)) {
        out = std::get<bool>(v);
    } else if (std::holds_alternative<int64_t>(v)) {
        out = std::get<int64_t>(v);
    } else if (std::holds_alternative<BigInt>(v)) {
        const BigInt& b = std::get<BigInt>(v);
        if (b < 0 || b > BigInt(std::numeric_limits<uint64_t>::max())) {
            return EvalResult::error(RuntimeErrorKind::InvalidOperation,
                "BigInteger " + b.str() + " is too large for JSON representation", tok.loc);
        }
        out = b.convert_to<uint64_t>();
    } else if (std::holds_alternative<std::string>(v)) {
        out = std::get<std::string>(v);
    } else if (std::holds_alternative<ArrayPtr>(v)) {
        const auto& arr = std::get<ArrayPtr>(v);
        if (!visiting.insert(arr.get()).second) {
            return EvalResult::error(RuntimeErrorKind::InvalidOperation, "Cannot serialize a cyclic array to JSON", tok.loc);
        }
        out = json::array();
        for (const auto& e : arr->elements) {
            json item;
            EvalResult r = to_json(e, item, visiting, tok);
            if (r.is_error()) return r;
            out.push_back(std::move(item));
        }
        visiting.erase(arr.get());
    } else if (std::holds_alternative<HashMapPtr>(v)) {
        const auto& h = std::get<HashMapPtr>(v);
        if (!visiting.insert(h.get()).second) {
            return EvalResult::error(RuntimeErrorKind::InvalidOperation, "Cannot serialize a cyclic hash to JSON", tok.loc);
        }
        out = json::object();
        for (const auto& kv : h->entries) {
            json item;
            EvalResult r = to_json(kv.second, item, visiting, tok);
            if (r.is_error()) return r;
            out[json_key(kv.first)] = std::move(item);
        }
        visiting.erase(h.get());
    } else if (std::holds_alternative<InstancePtr>(v)) {
        const auto& inst = std::get<InstancePtr>(v);
        if (!visiting.insert(inst.get()).second) {
            return EvalResult::error(RuntimeErrorKind::InvalidOperation, "Cannot serialize a cyclic instance to JSON", tok.loc);
        }
        out = json::object();
        for (const auto& f : inst->def->field_names) {
            json item;
            EvalResult r = to_json(inst->fields[f], item, visiting, tok);
            if (r.is_error()) return r;
            out[f] = std::move(item);
        }
        visiting.erase(inst.get());
    } else {
        return EvalResult::error(RuntimeErrorKind::InvalidOperation,
            "Cannot serialize type '" + value_type_name(v) + "' to JSON", tok.loc);
    }
    return Value{};
}

EvalResult from_json(Evaluator& ev, const json& j, const Token& tok) {
    switch (j.type()) {
        case json::value_t::null:
            return Value{};
        case json::value_t::boolean:
            return Value{j.get<bool>()};
        case json::value_t::number_integer:
            return Value{j.get<int64_t>()};
        case json::value_t::number_unsigned: {
            BigInt b(j.get<uint64_t>());
            return normalize_integer(b);
        }
        case json::value_t::number_float:
            return EvalResult::error(RuntimeErrorKind::InvalidArguments,
                "JSON number " + j.dump() + " is not an integer", tok.loc);
        case json::value_t::string:
            return Value{j.get<std::string>()};
        case json::value_t::array: {
            auto arr = ev.make_array();
            for (const auto& e : j) {
                GIU_TRY(item, from_json(ev, e, tok));
                arr->elements.push_back(std::move(item));
            }
            return Value{arr};
        }
        case json::value_t::object: {
            auto h = ev.make_hash();
            for (auto it = j.begin(); it != j.end(); ++it) {
                GIU_TRY(item, from_json(ev, it.value(), tok));
                h->entries[HashKey{it.key()}] = std::move(item);
            }
            return Value{h};
        }
        default:
            return EvalResult::error(RuntimeErrorKind::InvalidArguments,
                "Unsupported JSON value: " + j.dump(), tok.loc);
    }
}

}  // namespace

EnvPtr make_json_module(Evaluator& evaluator) {
    EnvPtr env = evaluator.make_env(evaluator.globals());
    Evaluator* ev = &evaluator;

    // serialize(value [, indent]) -> string
    env->define("serialize", Value{make_native_fn("json.serialize", 1, 2, [](const std::vector<Value>& args, EnvPtr, const Token& tok) -> EvalResult {
        int indent = -1;
        if (args.size() == 2) {
            GIU_TRY(n, expect_arg_integer("json.serialize", args, 1, tok));
            if (!std::holds_alternative<int64_t>(n) || std::get<int64_t>(n) < 0 || std::get<int64_t>(n) > 16) {
                return EvalResult::error(RuntimeErrorKind::InvalidArguments,
                    "json.serialize(): indent must be between 0 and 16", tok.loc);
            }
            indent = static_cast<int>(std::get<int64_t>(n));
        }
        json j;
        std::unordered_set<const void*> visiting;
        EvalResult r = to_json(args[0], j, visiting, tok);
        if (r.is_error()) return r;
        try {
            return Value{j.dump(indent)};
        } catch (const json::type_error& e) {
            // invalid UTF-8 in a string
            return EvalResult::error(RuntimeErrorKind::InvalidOperation,
                std::string("JSON serialize error: ") + e.what(), tok.loc);
        }
    }, env)});

    // deserialize(text) -> value; objects become hashes with string keys
    env->define("deserialize", Value{make_native_fn("json.deserialize", 1, 1, [ev](const std::vector<Value>& args, EnvPtr, const Token& tok) -> EvalResult {
        GIU_TRY(s, expect_arg_string("json.deserialize", args, 0, tok));
        json j;
        try {
            j = json::parse(std::get<std::string>(s));
        } catch (const json::parse_error& e) {
            return EvalResult::error(RuntimeErrorKind::InvalidArguments,
                std::string("JSON parse error: ") + e.what(), tok.loc);
        }
        return from_json(*ev, j, tok);
    }, env)});

    return env;
}
