#include <sstream>
#include <string>

#include "evaluator.hpp"

namespace {

struct CallDepthGuard {
    size_t& depth;
    explicit CallDepthGuard(size_t& d) : depth(d) { ++depth; }
    ~CallDepthGuard() { --depth; }
};

std::string display_name(const FunctionPtr& fn) {
    return fn->name.empty() ? "<lambda>" : fn->name;
}

std::string arity_text(size_t min_args, size_t max_args) {
    if (min_args == max_args) return std::to_string(min_args);
    if (max_args == FunctionValue::VARIADIC) return "at least " + std::to_string(min_args);
    return std::to_string(min_args) + " to " + std::to_string(max_args);
}

}  // namespace

EvalResult Evaluator::invoke_function(FunctionPtr fn, const std::vector<Value>& args, const Token& callToken) {
    return call_function(fn, args, callToken);
}

EvalResult Evaluator::call_function(FunctionPtr fn, const std::vector<Value>& args, const Token& callToken) {
    if (!fn) {
        return EvalResult::error(RuntimeErrorKind::NotCallable, "Attempt to call a null function", callToken.loc);
    }

    if (call_depth_ >= max_call_depth_) {
        return EvalResult::error(RuntimeErrorKind::InvalidOperation,
            "Maximum call depth of " + std::to_string(max_call_depth_) + " exceeded in '" + display_name(fn) + "'",
            callToken.loc);
    }
    // Loop and block nesting inside each call costs extra native frames, so the
    // call count alone does not bound the stack.
    if (stack_in_use() > stack_budget_) {
        return EvalResult::error(RuntimeErrorKind::InvalidOperation,
            "Maximum call depth exceeded in '" + display_name(fn) + "': native stack budget of " +
                std::to_string(stack_budget_) + " bytes used up at depth " + std::to_string(call_depth_),
            callToken.loc);
    }

    // Native function: check the arity range, then call the C++ implementation directly.
    if (fn->is_native) {
        if (args.size() < fn->min_args || args.size() > fn->max_args) {
            std::ostringstream ss;
            ss << "Built-in '" << fn->name << "' expects " << arity_text(fn->min_args, fn->max_args)
               << " argument(s) but got " << args.size();
            return EvalResult::error(RuntimeErrorKind::WrongArgumentCount, ss.str(), callToken.loc);
        }
        if (!fn->native_impl) {
            return EvalResult::error(RuntimeErrorKind::InvalidOperation,
                "Native function '" + fn->name + "' has no implementation", callToken.loc);
        }
        CallDepthGuard guard(call_depth_);
        return fn->native_impl(args, fn->closure, callToken);
    }

    if (args.size() != fn->parameters.size()) {
        std::ostringstream ss;
        ss << "Function '" << display_name(fn) << "' expects " << fn->parameters.size()
           << " argument(s) but got " << args.size();
        return EvalResult::error(RuntimeErrorKind::WrongArgumentCount, ss.str(), callToken.loc);
    }

    // fresh call scope parented at the captured environment
    auto call_env = make_env(fn->closure);
    if (fn->bound_this) call_env->define("this", Value{fn->bound_this});
    for (size_t i = 0; i < fn->parameters.size(); ++i) {
        call_env->define(fn->parameters[i], args[i]);
    }

    CallDepthGuard guard(call_depth_);
    EvalResult r = fn->body ? evaluate_body(fn->body->body, call_env) : EvalResult(Value{});

    if (r.is_signal()) {
        const auto& sig = r.signal();
        if (sig.kind == ControlSignal::Kind::Return) return sig.value;
        return EvalResult::error(RuntimeErrorKind::InvalidOperation,
            std::string(sig.kind == ControlSignal::Kind::Break ? "'break'" : "'continue'") + " outside of a loop",
            sig.token.loc);
    }
    return r;
}
