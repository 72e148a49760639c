#include <string>

#include "builtins.hpp"
#include "evaluator.hpp"

EvalResult Evaluator::evaluate_expression(ExpressionNode* expr, EnvPtr env) {
    if (!expr) return Value{};

    if (auto n = dynamic_cast<IntegerLiteralNode*>(expr)) {
        if (n->is_big) {
            // strip leading zeros so the parse stays decimal
            size_t nz = n->digits.find_first_not_of('0');
            BigInt b(nz == std::string::npos ? "0" : n->digits.c_str() + nz);
            return normalize_integer(b);
        }
        return Value{n->value};
    }
    if (auto s = dynamic_cast<StringLiteralNode*>(expr)) return Value{s->value};
    if (auto b = dynamic_cast<BooleanLiteralNode*>(expr)) return Value{b->value};
    if (dynamic_cast<NullNode*>(expr)) return Value{};

    if (auto id = dynamic_cast<IdentifierNode*>(expr)) {
        return env->get(id->name, id->token);
    }

    if (auto self = dynamic_cast<ThisExpressionNode*>(expr)) {
        if (!env->has("this")) {
            return EvalResult::error(RuntimeErrorKind::InvalidOperation,
                "'this' can only be used inside a struct method", self->token.loc);
        }
        return env->get("this", self->token);
    }

    if (auto u = dynamic_cast<UnaryExpressionNode*>(expr)) return evaluate_unary(u, env);
    if (auto b = dynamic_cast<BinaryExpressionNode*>(expr)) {
        if (b->op == "&&" || b->op == "||") return evaluate_logical(b, env);
        return evaluate_binary(b, env);
    }
    if (auto a = dynamic_cast<AssignmentExpressionNode*>(expr)) return evaluate_assignment(a, env);
    if (auto call = dynamic_cast<CallExpressionNode*>(expr)) return evaluate_call(call, env);
    if (auto idx = dynamic_cast<IndexExpressionNode*>(expr)) return evaluate_index(idx, env);
    if (auto mem = dynamic_cast<MemberExpressionNode*>(expr)) return evaluate_member(mem, env);
    if (auto arr = dynamic_cast<ArrayExpressionNode*>(expr)) return evaluate_array_literal(arr, env);
    if (auto h = dynamic_cast<HashMapExpressionNode*>(expr)) return evaluate_hash_literal(h, env);
    if (auto lit = dynamic_cast<StructLiteralNode*>(expr)) return evaluate_struct_literal(lit, env);
    if (auto fn = dynamic_cast<FunctionExpressionNode*>(expr)) return evaluate_function_literal(fn, env);
    if (auto ife = dynamic_cast<IfExpressionNode*>(expr)) return evaluate_if(ife, env);

    return EvalResult::error(RuntimeErrorKind::InvalidOperation,
        "Unsupported expression '" + expr->to_string() + "'", expr->token.loc);
}

EvalResult Evaluator::expect_bool(const Value& v, const std::string& what, const Token& tok) {
    if (!std::holds_alternative<bool>(v)) {
        return EvalResult::error(RuntimeErrorKind::TypeMismatch,
            what + " must be a boolean, got " + type_name(v) + " (" + value_to_string(v) + ")",
            tok.loc);
    }
    return v;
}

EvalResult Evaluator::evaluate_unary(UnaryExpressionNode* node, EnvPtr env) {
    GIU_TRY(operand, evaluate_expression(node->operand.get(), env));
    if (node->op == "!") {
        GIU_TRY(b, expect_bool(operand, "Operand of '!'", node->token));
        return Value{!std::get<bool>(b)};
    }
    if (node->op == "-") return checked_neg(operand, node->token);

    return EvalResult::error(RuntimeErrorKind::InvalidOperation,
        "Unknown unary operator '" + node->op + "'", node->token.loc);
}

// && and || short-circuit; both operands must be booleans
EvalResult Evaluator::evaluate_logical(BinaryExpressionNode* node, EnvPtr env) {
    GIU_TRY(left, evaluate_expression(node->left.get(), env));
    GIU_TRY(lb, expect_bool(left, "Left operand of '" + node->op + "'", node->token));
    bool l = std::get<bool>(lb);
    if (node->op == "&&" && !l) return Value{false};
    if (node->op == "||" && l) return Value{true};

    GIU_TRY(right, evaluate_expression(node->right.get(), env));
    return expect_bool(right, "Right operand of '" + node->op + "'", node->token);
}

EvalResult Evaluator::evaluate_binary(BinaryExpressionNode* node, EnvPtr env) {
    GIU_TRY(left, evaluate_expression(node->left.get(), env));
    GIU_TRY(right, evaluate_expression(node->right.get(), env));
    return binary_op(node->op, left, right, node->token);
}

EvalResult Evaluator::binary_op(const std::string& op, const Value& left, const Value& right, const Token& tok) {
    if (op == "+") {
        if (std::holds_alternative<std::string>(left) && std::holds_alternative<std::string>(right)) {
            return Value{std::get<std::string>(left) + std::get<std::string>(right)};
        }
        if (is_integer(left) && is_integer(right)) return checked_add(left, right, tok);
        return EvalResult::error(RuntimeErrorKind::TypeMismatch,
            "Operator '+' expects two integers or two strings, got " + type_name(left) + " and " + type_name(right),
            tok.loc);
    }
    if (op == "-") return checked_sub(left, right, tok);
    if (op == "*") return checked_mul(left, right, tok);
    if (op == "/") return checked_div(left, right, tok);
    if (op == "%") return checked_mod(left, right, tok);

    if (op == "==") return Value{is_equal(left, right)};
    if (op == "!=") return Value{!is_equal(left, right)};

    if (op == "<" || op == "<=" || op == ">" || op == ">=") {
        int cmp;
        if (is_integer(left) && is_integer(right)) {
            cmp = compare_integers(left, right);
        } else if (std::holds_alternative<std::string>(left) && std::holds_alternative<std::string>(right)) {
            int c = std::get<std::string>(left).compare(std::get<std::string>(right));
            cmp = c < 0 ? -1 : (c > 0 ? 1 : 0);
        } else {
            return EvalResult::error(RuntimeErrorKind::TypeMismatch,
                "Operator '" + op + "' cannot compare " + type_name(left) + " with " + type_name(right),
                tok.loc);
        }
        if (op == "<") return Value{cmp < 0};
        if (op == "<=") return Value{cmp <= 0};
        if (op == ">") return Value{cmp > 0};
        return Value{cmp >= 0};
    }

    return EvalResult::error(RuntimeErrorKind::InvalidOperation,
        "Unknown binary operator '" + op + "'", tok.loc);
}

EvalResult Evaluator::evaluate_assignment(AssignmentExpressionNode* node, EnvPtr env) {
    if (auto id = dynamic_cast<IdentifierNode*>(node->target.get())) {
        GIU_TRY(value, evaluate_expression(node->value.get(), env));
        return env->set(id->name, value, id->token);
    }

    if (auto idx = dynamic_cast<IndexExpressionNode*>(node->target.get())) {
        GIU_TRY(object, evaluate_expression(idx->object.get(), env));
        GIU_TRY(index, evaluate_expression(idx->index.get(), env));
        GIU_TRY(value, evaluate_expression(node->value.get(), env));
        return assign_index(object, index, value, idx->token);
    }

    if (auto mem = dynamic_cast<MemberExpressionNode*>(node->target.get())) {
        GIU_TRY(object, evaluate_expression(mem->object.get(), env));
        GIU_TRY(value, evaluate_expression(node->value.get(), env));
        return set_member(object, mem->property, value, mem->token);
    }

    return EvalResult::error(RuntimeErrorKind::InvalidOperation,
        "Invalid assignment target '" + node->target->to_string() + "'", node->token.loc);
}

EvalResult Evaluator::evaluate_call(CallExpressionNode* node, EnvPtr env) {
    Value callee;
    if (auto mem = dynamic_cast<MemberExpressionNode*>(node->callee.get())) {
        // obj.method(...)
        GIU_TRY(object, evaluate_expression(mem->object.get(), env));
        GIU_TRY(m, get_member(object, mem->property, mem->token, true));
        callee = std::move(m);
    } else {
        GIU_TRY(c, evaluate_expression(node->callee.get(), env));
        callee = std::move(c);
    }

    std::vector<Value> args;
    args.reserve(node->arguments.size());
    for (auto& a : node->arguments) {
        GIU_TRY(v, evaluate_expression(a.get(), env));
        args.push_back(std::move(v));
    }

    if (!std::holds_alternative<FunctionPtr>(callee) || !std::get<FunctionPtr>(callee)) {
        return EvalResult::error(RuntimeErrorKind::NotCallable,
            "'" + node->callee->to_string() + "' is not callable (it is " + type_name(callee) + ")",
            node->token.loc);
    }
    return call_function(std::get<FunctionPtr>(callee), args, node->token);
}

EvalResult Evaluator::evaluate_index(IndexExpressionNode* node, EnvPtr env) {
    GIU_TRY(object, evaluate_expression(node->object.get(), env));
    GIU_TRY(index, evaluate_expression(node->index.get(), env));
    return index_value(object, index, node->token);
}

EvalResult Evaluator::index_value(const Value& object, const Value& index, const Token& tok) {
    if (std::holds_alternative<ArrayPtr>(object)) {
        const auto& arr = std::get<ArrayPtr>(object);
        if (!is_integer(index)) {
            return EvalResult::error(RuntimeErrorKind::TypeMismatch,
                "Array index must be an integer, got " + type_name(index), tok.loc);
        }
        if (!std::holds_alternative<int64_t>(index) || std::get<int64_t>(index) < 0 ||
            static_cast<uint64_t>(std::get<int64_t>(index)) >= arr->elements.size()) {
            return EvalResult::error(RuntimeErrorKind::IndexOutOfBounds,
                "Index " + value_to_string(index) + " out of bounds for array of length " +
                    std::to_string(arr->elements.size()),
                tok.loc);
        }
        return arr->elements[static_cast<size_t>(std::get<int64_t>(index))];
    }

    if (std::holds_alternative<HashMapPtr>(object)) {
        const auto& h = std::get<HashMapPtr>(object);
        HashKey key;
        EvalResult kr = to_hash_key(index, key, tok);
        if (kr.is_error()) return kr;
        auto it = h->entries.find(key);
        if (it == h->entries.end()) {
            return EvalResult::error(RuntimeErrorKind::MissingKey,
                "Key " + (std::holds_alternative<std::string>(index) ? "\"" + std::get<std::string>(index) + "\"" : value_to_string(index)) +
                    " not found in hash",
                tok.loc);
        }
        return it->second;
    }

    return EvalResult::error(RuntimeErrorKind::NotIndexable,
        "Value of type " + type_name(object) + " cannot be indexed", tok.loc);
}

EvalResult Evaluator::assign_index(const Value& object, const Value& index, const Value& value, const Token& tok) {
    if (std::holds_alternative<ArrayPtr>(object)) {
        const auto& arr = std::get<ArrayPtr>(object);
        if (!is_integer(index)) {
            return EvalResult::error(RuntimeErrorKind::TypeMismatch,
                "Array index must be an integer, got " + type_name(index), tok.loc);
        }
        if (!std::holds_alternative<int64_t>(index) || std::get<int64_t>(index) < 0 ||
            static_cast<uint64_t>(std::get<int64_t>(index)) >= arr->elements.size()) {
            return EvalResult::error(RuntimeErrorKind::IndexOutOfBounds,
                "Index " + value_to_string(index) + " out of bounds for array of length " +
                    std::to_string(arr->elements.size()),
                tok.loc);
        }
        arr->elements[static_cast<size_t>(std::get<int64_t>(index))] = value;
        return value;
    }

    if (std::holds_alternative<HashMapPtr>(object)) {
        HashKey key;
        EvalResult kr = to_hash_key(index, key, tok);
        if (kr.is_error()) return kr;
        std::get<HashMapPtr>(object)->entries[key] = value;
        return value;
    }

    return EvalResult::error(RuntimeErrorKind::NotIndexable,
        "Cannot assign by index into a value of type " + type_name(object), tok.loc);
}

EvalResult Evaluator::evaluate_member(MemberExpressionNode* node, EnvPtr env) {
    GIU_TRY(object, evaluate_expression(node->object.get(), env));
    return get_member(object, node->property, node->token);
}

EvalResult Evaluator::evaluate_array_literal(ArrayExpressionNode* node, EnvPtr env) {
    std::vector<Value> elements;
    elements.reserve(node->elements.size());
    for (auto& e : node->elements) {
        GIU_TRY(v, evaluate_expression(e.get(), env));
        elements.push_back(std::move(v));
    }
    return Value{make_array(std::move(elements))};
}

EvalResult Evaluator::evaluate_hash_literal(HashMapExpressionNode* node, EnvPtr env) {
    auto h = make_hash();
    for (auto& entry : node->entries) {
        GIU_TRY(k, evaluate_expression(entry.first.get(), env));
        HashKey key;
        EvalResult kr = to_hash_key(k, key, entry.first->token);
        if (kr.is_error()) return kr;
        GIU_TRY(v, evaluate_expression(entry.second.get(), env));
        h->entries[key] = std::move(v);
    }
    return Value{h};
}

EvalResult Evaluator::evaluate_if(IfExpressionNode* node, EnvPtr env) {
    GIU_TRY(cond, evaluate_expression(node->condition.get(), env));
    GIU_TRY(b, expect_bool(cond, "Condition of 'if'", node->condition->token));

    if (std::get<bool>(b)) return evaluate_block(node->then_block.get(), env);
    if (node->else_block) return evaluate_block(node->else_block.get(), env);
    return Value{};
}

EvalResult Evaluator::evaluate_function_literal(FunctionExpressionNode* node, EnvPtr env) {
    auto fn = std::make_shared<FunctionValue>(node->name, node->parameters, node->body, env, node->token);
    return Value{fn};
}
