// src/evaluator/Evaluator.cpp
#include "evaluator.hpp"

#include <sys/resource.h>

#include <algorithm>
#include <filesystem>

#include "GiuError.hpp"
#include "builtins.hpp"
namespace fs = std::filesystem;

// ----------------- Heap tracker -----------------

namespace {

template <typename T>
void drop_expired(std::vector<std::weak_ptr<T>>& v) {
    v.erase(std::remove_if(v.begin(), v.end(), [](const std::weak_ptr<T>& w) { return w.expired(); }), v.end());
}

// Moves the children of a composite that `v` solely owns onto `pending`.
// Shared composites are left alone: dropping `v` only decrements them.
void take_children(Value& v, std::vector<Value>& pending) {
    if (auto* a = std::get_if<ArrayPtr>(&v)) {
        if (*a && a->use_count() == 1) {
            for (auto& e : (*a)->elements) pending.push_back(std::move(e));
            (*a)->elements.clear();
        }
    } else if (auto* h = std::get_if<HashMapPtr>(&v)) {
        if (*h && h->use_count() == 1) {
            for (auto& kv : (*h)->entries) pending.push_back(std::move(kv.second));
            (*h)->entries.clear();
        }
    } else if (auto* i = std::get_if<InstancePtr>(&v)) {
        if (*i && i->use_count() == 1) {
            for (auto& kv : (*i)->fields) pending.push_back(std::move(kv.second));
            (*i)->fields.clear();
        }
    }
}

void release_values(std::vector<Value> pending) {
    while (!pending.empty()) {
        Value v = std::move(pending.back());
        pending.pop_back();
        take_children(v, pending);
    }
}

}  // namespace

ArrayValue::~ArrayValue() {
    release_values(std::move(elements));
}

HashMapValue::~HashMapValue() {
    std::vector<Value> pending;
    pending.reserve(entries.size());
    for (auto& kv : entries) pending.push_back(std::move(kv.second));
    release_values(std::move(pending));
}

InstanceValue::~InstanceValue() {
    std::vector<Value> pending;
    pending.reserve(fields.size());
    for (auto& kv : fields) pending.push_back(std::move(kv.second));
    release_values(std::move(pending));
}

void HeapTracker::prune() {
    drop_expired(envs);
    drop_expired(arrays);
    drop_expired(hashes);
    drop_expired(instances);
    prune_threshold = std::max<size_t>(4096, tracked() * 2);
}

// Empties every object still alive. Contents are moved out before they are
// destroyed so destructors never observe a half-cleared container.
void HeapTracker::collect() {
    for (auto& w : envs) {
        if (auto e = w.lock()) {
            auto doomed = std::move(e->values);
            e->values.clear();
        }
    }
    for (auto& w : instances) {
        if (auto i = w.lock()) {
            auto doomed = std::move(i->fields);
            i->fields.clear();
        }
    }
    for (auto& w : arrays) {
        if (auto a = w.lock()) {
            auto doomed = std::move(a->elements);
            a->elements.clear();
        }
    }
    for (auto& w : hashes) {
        if (auto h = w.lock()) {
            auto doomed = std::move(h->entries);
            h->entries.clear();
        }
    }
    envs.clear();
    instances.clear();
    arrays.clear();
    hashes.clear();
}

EnvPtr Evaluator::make_env(EnvPtr parent) {
    auto env = std::make_shared<Environment>(std::move(parent));
    if (heap_.tracked() >= heap_.prune_threshold) heap_.prune();
    heap_.envs.push_back(env);
    return env;
}

ArrayPtr Evaluator::make_array(std::vector<Value> elements) {
    auto arr = std::make_shared<ArrayValue>();
    arr->elements = std::move(elements);
    if (heap_.tracked() >= heap_.prune_threshold) heap_.prune();
    heap_.arrays.push_back(arr);
    return arr;
}

HashMapPtr Evaluator::make_hash() {
    auto h = std::make_shared<HashMapValue>();
    if (heap_.tracked() >= heap_.prune_threshold) heap_.prune();
    heap_.hashes.push_back(h);
    return h;
}

InstancePtr Evaluator::make_instance(StructDefPtr def) {
    auto inst = std::make_shared<InstanceValue>();
    inst->def = std::move(def);
    if (heap_.tracked() >= heap_.prune_threshold) heap_.prune();
    heap_.instances.push_back(inst);
    return inst;
}

size_t Evaluator::live_objects() {
    heap_.prune();
    return heap_.tracked();
}

// ----------------- Native stack -----------------

namespace {

// Three quarters of the soft stack limit (8 MiB when unlimited or unknown).
// The rest is headroom for built-ins and for the frames between two checks.
size_t default_stack_budget() {
    size_t limit = size_t(8) * 1024 * 1024;
    struct rlimit rl;
    if (getrlimit(RLIMIT_STACK, &rl) == 0 && rl.rlim_cur != RLIM_INFINITY) {
        limit = static_cast<size_t>(rl.rlim_cur);
    }
    return limit / 4 * 3;
}

// Records the stack position of the outermost execute() and clears it on exit.
struct StackBaseGuard {
    std::uintptr_t& base;
    bool outermost;
    StackBaseGuard(std::uintptr_t& b, std::uintptr_t here) : base(b), outermost(b == 0) {
        if (outermost) base = here;
    }
    ~StackBaseGuard() {
        if (outermost) base = 0;
    }
};

}  // namespace

size_t Evaluator::stack_in_use() const {
    if (stack_base_ == 0) return 0;
    char marker;
    auto here = reinterpret_cast<std::uintptr_t>(&marker);
    return here < stack_base_ ? stack_base_ - here : here - stack_base_;
}

// ----------------- Lifetime -----------------

Evaluator::Evaluator() : stack_budget_(default_stack_budget()) {
    global_env = make_env(nullptr);
    register_builtins(*this, global_env);

    // The main program gets its own scope so imported modules, which are parented at
    // global_env, never see the program's top-level bindings.
    main_module_env = make_env(global_env);
}

Evaluator::~Evaluator() {
    module_cache.clear();
    heap_.collect();
}

void Evaluator::set_entry_point(const std::string& filename) {
    // Resolve filename to canonical absolute path if provided; empty => REPL
    entry_file.clear();
    if (!filename.empty()) {
        std::error_code ec;
        fs::path canon = fs::weakly_canonical(fs::path(filename), ec);
        entry_file = ec ? fs::absolute(fs::path(filename)).string() : canon.string();
    }
}

// ----------------- Program evaluation -----------------

EvalResult Evaluator::execute(ProgramNode* program) {
    if (!program) return Value{};

    char marker;
    StackBaseGuard stack_guard(stack_base_, reinterpret_cast<std::uintptr_t>(&marker));

    EvalResult r = evaluate_body(program->body, main_module_env);
    if (r.is_signal()) {
        const auto& sig = r.signal();
        // a top-level return stops the script
        if (sig.kind == ControlSignal::Kind::Return) return sig.value;
        return EvalResult::error(RuntimeErrorKind::InvalidOperation,
            std::string(sig.kind == ControlSignal::Kind::Break ? "'break'" : "'continue'") + " outside of a loop",
            sig.token.loc);
    }
    return r;
}

Value Evaluator::evaluate(ProgramNode* program) {
    EvalResult r = execute(program);
    if (r.is_error()) {
        const RuntimeError& err = r.error();
        throw GiuError("RuntimeError", err.to_string(), err.loc);
    }
    return r.value();
}
