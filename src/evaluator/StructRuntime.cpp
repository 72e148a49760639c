// src/evaluator/StructRuntime.cpp
#include <string>

#include "builtins.hpp"
#include "evaluator.hpp"

// Field defaults are evaluated once, here; instances share composite defaults.
// Methods close over the declaring environment.
EvalResult Evaluator::evaluate_struct_declaration(StructDeclarationNode* node, EnvPtr env) {
    auto def = std::make_shared<StructDefValue>();
    def->name = node->name;
    def->token = node->token;

    for (auto& f : node->fields) {
        GIU_TRY(v, evaluate_expression(f.default_value.get(), env));
        def->field_names.push_back(f.name);
        def->defaults[f.name] = std::move(v);
    }

    for (auto& m : node->methods) {
        FunctionExpressionNode* fnode = m.function.get();
        def->methods[m.name] = std::make_shared<FunctionValue>(m.name, fnode->parameters, fnode->body, env, m.token);
    }

    env->define(node->name, Value{def});
    return Value{};
}

EvalResult Evaluator::evaluate_struct_literal(StructLiteralNode* node, EnvPtr env) {
    GIU_TRY(target, env->get(node->struct_name, node->token));
    if (!std::holds_alternative<StructDefPtr>(target)) {
        return EvalResult::error(RuntimeErrorKind::TypeMismatch,
            "'" + node->struct_name + "' is not a struct (it is " + type_name(target) + ")", node->token.loc);
    }
    auto def = std::get<StructDefPtr>(target);

    auto inst = make_instance(def);
    inst->fields = def->defaults;

    for (auto& init : node->fields) {
        if (!def->has_field(init.name)) {
            return EvalResult::error(RuntimeErrorKind::UndefinedField,
                "Struct '" + def->name + "' has no field '" + init.name + "'", init.token.loc);
        }
        GIU_TRY(v, evaluate_expression(init.value.get(), env));
        inst->fields[init.name] = std::move(v);
    }
    return Value{inst};
}

FunctionPtr Evaluator::bind_method(const FunctionPtr& method, const InstancePtr& inst) {
    auto bound = std::make_shared<FunctionValue>(*method);
    bound->bound_this = inst;
    return bound;
}

// Instances: field first, then the struct's method table (bound to the instance).
// Everything else: built-in methods of the receiver's type.
EvalResult Evaluator::get_member(const Value& object, const std::string& name, const Token& tok, bool for_call) {
    if (std::holds_alternative<InstancePtr>(object)) {
        const auto& inst = std::get<InstancePtr>(object);
        auto fit = inst->fields.find(name);
        if (fit != inst->fields.end()) return fit->second;

        auto mit = inst->def->methods.find(name);
        if (mit != inst->def->methods.end()) return Value{bind_method(mit->second, inst)};

        return EvalResult::error(for_call ? RuntimeErrorKind::UndefinedMethod : RuntimeErrorKind::UndefinedField,
            "Struct '" + inst->def->name + "' has no " + (for_call ? "method '" : "field or method '") + name + "'",
            tok.loc);
    }

    FunctionPtr method = lookup_builtin_method(*this, object, name, tok);
    if (method) return Value{method};

    return EvalResult::error(for_call ? RuntimeErrorKind::UndefinedMethod : RuntimeErrorKind::UndefinedField,
        "Value of type " + type_name(object) + " has no " + (for_call ? "method '" : "member '") + name + "'",
        tok.loc);
}

EvalResult Evaluator::set_member(const Value& object, const std::string& name, const Value& value, const Token& tok) {
    if (!std::holds_alternative<InstancePtr>(object)) {
        return EvalResult::error(RuntimeErrorKind::InvalidOperation,
            "Cannot set field '" + name + "' on a value of type " + type_name(object), tok.loc);
    }
    const auto& inst = std::get<InstancePtr>(object);
    if (!inst->def->has_field(name)) {
        return EvalResult::error(RuntimeErrorKind::UndefinedField,
            "Struct '" + inst->def->name + "' has no field '" + name + "'", tok.loc);
    }
    inst->fields[name] = value;
    return value;
}
