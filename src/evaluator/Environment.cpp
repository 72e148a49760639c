//src/evaluator/Environment.cpp
#include "evaluator.hpp"

// ----------------- Environment methods -----------------

bool Environment::has(const std::string& name) const {
    auto it = values.find(name);
    if (it != values.end()) return true;
    if (parent) return parent->has(name);
    return false;
}

bool Environment::has_local(const std::string& name) const {
    return values.find(name) != values.end();
}

void Environment::define(const std::string& name, const Value& value) {
    values[name] = value;
}

EvalResult Environment::get(const std::string& name, const Token& tok) const {
    for (const Environment* e = this; e; e = e->parent.get()) {
        auto it = e->values.find(name);
        if (it != e->values.end()) return it->second;
    }
    return EvalResult::error(RuntimeErrorKind::UndefinedVariable,
        "Undefined variable '" + name + "'", tok.loc);
}

EvalResult Environment::set(const std::string& name, const Value& value, const Token& tok) {
    for (Environment* e = this; e; e = e->parent.get()) {
        auto it = e->values.find(name);
        if (it != e->values.end()) {
            it->second = value;
            return value;
        }
    }
    return EvalResult::error(RuntimeErrorKind::UndefinedVariable,
        "Cannot assign to undefined variable '" + name + "' (declare it with 'let' first)", tok.loc);
}
