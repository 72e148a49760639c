#include <string>

#include "builtins.hpp"
#include "evaluator.hpp"

EvalResult Evaluator::evaluate_statement(StatementNode* stmt, EnvPtr env) {
    if (!stmt) return Value{};

    if (auto es = dynamic_cast<ExpressionStatementNode*>(stmt)) {
        return evaluate_expression(es->expression.get(), env);
    }

    // `let` always defines in the current scope, shadowing any outer binding
    if (auto ls = dynamic_cast<LetStatementNode*>(stmt)) {
        GIU_TRY(value, evaluate_expression(ls->value.get(), env));
        env->define(ls->identifier, value);
        return Value{};
    }

    if (auto rs = dynamic_cast<ReturnStatementNode*>(stmt)) {
        Value payload;
        if (rs->value) {
            GIU_TRY(v, evaluate_expression(rs->value.get(), env));
            payload = std::move(v);
        }
        return ControlSignal{ControlSignal::Kind::Return, std::move(payload), rs->token};
    }

    if (auto bs = dynamic_cast<BreakStatementNode*>(stmt)) {
        return ControlSignal{ControlSignal::Kind::Break, Value{}, bs->token};
    }
    if (auto cs = dynamic_cast<ContinueStatementNode*>(stmt)) {
        return ControlSignal{ControlSignal::Kind::Continue, Value{}, cs->token};
    }

    if (auto ws = dynamic_cast<WhileStatementNode*>(stmt)) return evaluate_while(ws, env);
    if (auto fi = dynamic_cast<ForInStatementNode*>(stmt)) return evaluate_for_in(fi, env);
    if (auto fs = dynamic_cast<ForStatementNode*>(stmt)) return evaluate_for(fs, env);
    if (auto sd = dynamic_cast<StructDeclarationNode*>(stmt)) return evaluate_struct_declaration(sd, env);
    if (auto im = dynamic_cast<ImportDeclarationNode*>(stmt)) return import_module(im, env);

    return EvalResult::error(RuntimeErrorKind::InvalidOperation,
        "Unsupported statement '" + stmt->to_string() + "'", stmt->token.loc);
}

// Runs statements in `env` itself. The value is that of the last expression
// statement; any other trailing statement yields null.
EvalResult Evaluator::evaluate_body(const std::vector<std::unique_ptr<StatementNode>>& body, EnvPtr env) {
    Value last;
    for (const auto& s : body) {
        EvalResult r = evaluate_statement(s.get(), env);
        if (!r.is_value()) return r;
        if (dynamic_cast<ExpressionStatementNode*>(s.get())) {
            last = std::move(r.value());
        } else {
            last = Value{};
        }
    }
    return last;
}

EvalResult Evaluator::evaluate_block(BlockNode* block, EnvPtr env) {
    if (!block) return Value{};
    if (stack_in_use() > stack_budget_) {
        return EvalResult::error(RuntimeErrorKind::InvalidOperation,
            "Blocks nested too deeply: native stack budget of " + std::to_string(stack_budget_) + " bytes used up",
            block->token.loc);
    }
    return evaluate_body(block->body, make_env(env));
}

// ----------------- Loops -----------------
// Break and Continue are consumed here; Return and errors pass through.

EvalResult Evaluator::evaluate_while(WhileStatementNode* node, EnvPtr env) {
    while (true) {
        GIU_TRY(cond, evaluate_expression(node->condition.get(), env));
        GIU_TRY(b, expect_bool(cond, "Condition of 'while'", node->condition->token));
        if (!std::get<bool>(b)) break;

        EvalResult r = evaluate_block(node->body.get(), env);
        if (r.is_error()) return r;
        if (r.is_signal()) {
            auto kind = r.signal().kind;
            if (kind == ControlSignal::Kind::Break) break;
            if (kind == ControlSignal::Kind::Continue) continue;
            return r;
        }
    }
    return Value{};
}

// Arrays are walked by live index so elements pushed during the loop are visited.
EvalResult Evaluator::evaluate_for_in(ForInStatementNode* node, EnvPtr env) {
    GIU_TRY(iterable, evaluate_expression(node->iterable.get(), env));

    auto run_iteration = [&](const Value& item, bool& stop) -> EvalResult {
        auto iter_env = make_env(env);
        iter_env->define(node->variable, item);
        EvalResult r = evaluate_block(node->body.get(), iter_env);
        if (r.is_signal()) {
            auto kind = r.signal().kind;
            if (kind == ControlSignal::Kind::Break) {
                stop = true;
                return Value{};
            }
            if (kind == ControlSignal::Kind::Continue) return Value{};
        }
        return r;
    };

    bool stop = false;
    if (std::holds_alternative<ArrayPtr>(iterable)) {
        auto arr = std::get<ArrayPtr>(iterable);
        for (size_t i = 0; i < arr->elements.size() && !stop; ++i) {
            Value item = arr->elements[i];
            EvalResult r = run_iteration(item, stop);
            if (!r.is_value()) return r;
        }
        return Value{};
    }

    if (std::holds_alternative<std::string>(iterable)) {
        std::vector<std::string> chars = utf8_chars(std::get<std::string>(iterable));
        for (size_t i = 0; i < chars.size() && !stop; ++i) {
            EvalResult r = run_iteration(Value{chars[i]}, stop);
            if (!r.is_value()) return r;
        }
        return Value{};
    }

    if (std::holds_alternative<HashMapPtr>(iterable)) {
        // snapshot keys; the body may mutate the hash
        std::vector<Value> keys;
        for (const auto& kv : std::get<HashMapPtr>(iterable)->entries) keys.push_back(hash_key_to_value(kv.first));
        for (size_t i = 0; i < keys.size() && !stop; ++i) {
            EvalResult r = run_iteration(keys[i], stop);
            if (!r.is_value()) return r;
        }
        return Value{};
    }

    return EvalResult::error(RuntimeErrorKind::TypeMismatch,
        "Cannot iterate over a value of type " + type_name(iterable) + " (expected array, string or hash)",
        node->iterable->token.loc);
}

// for (init; cond; post) { body }: init lives in its own scope around the loop
EvalResult Evaluator::evaluate_for(ForStatementNode* node, EnvPtr env) {
    auto loop_env = make_env(env);
    if (node->init) {
        EvalResult r = evaluate_statement(node->init.get(), loop_env);
        if (!r.is_value()) return r;
    }

    while (true) {
        if (node->condition) {
            GIU_TRY(cond, evaluate_expression(node->condition.get(), loop_env));
            GIU_TRY(b, expect_bool(cond, "Condition of 'for'", node->condition->token));
            if (!std::get<bool>(b)) break;
        }

        EvalResult r = evaluate_block(node->body.get(), loop_env);
        if (r.is_error()) return r;
        if (r.is_signal()) {
            auto kind = r.signal().kind;
            if (kind == ControlSignal::Kind::Break) break;
            if (kind != ControlSignal::Kind::Continue) return r;
        }

        if (node->post) {
            EvalResult p = evaluate_expression(node->post.get(), loop_env);
            if (!p.is_value()) return p;
        }
    }
    return Value{};
}
