#include <filesystem>
#include <fstream>
#include <sstream>

#include "GiuError.hpp"
#include "builtins.hpp"  // native std.* module factories
#include "evaluator.hpp"
#include "lexer.hpp"
#include "parser.hpp"
namespace fs = std::filesystem;

namespace {

std::string join_path(const std::vector<std::string>& path, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < path.size(); ++i) {
        if (i) out += sep;
        out += path[i];
    }
    return out;
}

}  // namespace

void Evaluator::set_module_paths(const std::vector<std::string>& paths) {
    module_paths = paths;
}

// Resolve `a.b` to a/b.giu. Tries, in order:
// - the directory of the importing file (the entry file's directory, or
//   current_path(), for code without a file)
// - each configured module path
// - current_path()
// Returns an empty string when nothing exists.
std::string Evaluator::resolve_module_path(const std::vector<std::string>& path, const std::string& requester_filename) {
    fs::path rel;
    for (const auto& seg : path) rel /= seg;
    rel += ".giu";

    std::vector<fs::path> bases;
    if (requester_filename.empty() || requester_filename == "<repl>") {
        bases.push_back(entry_file.empty() ? fs::current_path() : fs::path(entry_file).parent_path());
    } else {
        bases.push_back(fs::path(requester_filename).parent_path());
    }
    for (const auto& mp : module_paths) bases.push_back(fs::path(mp));
    bases.push_back(fs::current_path());

    std::error_code ec;
    for (const auto& base : bases) {
        fs::path cand = base / rel;
        if (fs::is_regular_file(cand, ec)) {
            fs::path canon = fs::weakly_canonical(cand, ec);
            return ec ? fs::absolute(cand).string() : canon.string();
        }
    }
    return "";
}

EvalResult Evaluator::load_std_module(const std::string& name, const Token& tok, EnvPtr& out_env) {
    const std::string key = "std::" + name;
    auto it = module_cache.find(key);
    if (it != module_cache.end()) {
        out_env = it->second->module_env;
        return Value{};
    }

    EnvPtr env = make_std_module(*this, name);
    if (!env) {
        return EvalResult::error(RuntimeErrorKind::ModuleNotFound,
            "Unknown standard module 'std::" + name + "'", tok.loc);
    }

    auto rec = std::make_shared<ModuleRecord>();
    rec->state = ModuleRecord::State::Loaded;
    rec->module_env = env;
    rec->path = key;
    module_cache[key] = rec;
    out_env = env;
    return Value{};
}

// load_module: lexes, parses and evaluates a module file once, caching its environment.
// A record in Loading state marks a module still being evaluated; reaching it again is a
// cycle. A failed load removes its record so a later import can retry.
EvalResult Evaluator::load_module(const std::vector<std::string>& path, const Token& requesterTok, EnvPtr& out_env) {
    const std::string module_name = join_path(path, "::");

    if (!path.empty() && path[0] == "std") {
        if (path.size() != 2) {
            return EvalResult::error(RuntimeErrorKind::ModuleNotFound,
                "Unknown standard module '" + module_name + "'", requesterTok.loc);
        }
        return load_std_module(path[1], requesterTok, out_env);
    }

    std::string resolved = resolve_module_path(path, requesterTok.loc.filename);
    if (resolved.empty()) {
        return EvalResult::error(RuntimeErrorKind::ModuleNotFound,
            "Module '" + module_name + "' not found (looked for " + join_path(path, "/") + ".giu)",
            requesterTok.loc);
    }

    auto it = module_cache.find(resolved);
    if (it != module_cache.end()) {
        if (it->second->state == ModuleRecord::State::Loading) {
            std::string chain;
            for (const auto& p : import_stack) chain += fs::path(p).filename().string() + " -> ";
            chain += fs::path(resolved).filename().string();
            return EvalResult::error(RuntimeErrorKind::ImportCycle,
                "Import cycle detected while loading '" + module_name + "': " + chain, requesterTok.loc);
        }
        out_env = it->second->module_env;
        return Value{};
    }

    std::ifstream in(resolved, std::ios::binary);
    if (!in.is_open()) {
        return EvalResult::error(RuntimeErrorKind::ModuleNotFound,
            "Unable to open module file: " + resolved, requesterTok.loc);
    }
    std::stringstream ss;
    ss << in.rdbuf();
    std::string src = ss.str();

    auto rec = std::make_shared<ModuleRecord>();
    rec->state = ModuleRecord::State::Loading;
    rec->module_env = make_env(global_env);
    rec->path = resolved;
    module_cache[resolved] = rec;
    import_stack.push_back(resolved);

    auto fail = [&](EvalResult err) {
        module_cache.erase(resolved);
        import_stack.pop_back();
        return err;
    };

    std::unique_ptr<ProgramNode> ast;
    try {
        Lexer lexer(src, resolved);
        std::vector<Token> tokens = lexer.tokenize();
        Parser parser(tokens);
        ast = parser.parse();
    } catch (const GiuError& e) {
        return fail(EvalResult::error(RuntimeErrorKind::InvalidOperation,
            "Failed to load module '" + module_name + "':\n" + e.what(), requesterTok.loc));
    }

    EvalResult r = evaluate_body(ast->body, rec->module_env);
    if (r.is_error()) return fail(r);
    if (r.is_signal() && r.signal().kind != ControlSignal::Kind::Return) {
        return fail(EvalResult::error(RuntimeErrorKind::InvalidOperation,
            std::string(r.signal().kind == ControlSignal::Kind::Break ? "'break'" : "'continue'") + " outside of a loop",
            r.signal().token.loc));
    }

    rec->state = ModuleRecord::State::Loaded;
    import_stack.pop_back();
    out_env = rec->module_env;
    return Value{};
}

// `import a.b;` merges every binding of the module; `import a.b.{x, y};` only the listed ones.
EvalResult Evaluator::import_module(ImportDeclarationNode* node, EnvPtr env) {
    EnvPtr module_env;
    EvalResult r = load_module(node->path, node->token, module_env);
    if (!r.is_value()) return r;

    if (node->names.empty()) {
        for (const auto& kv : module_env->values) env->define(kv.first, kv.second);
        return Value{};
    }

    for (size_t i = 0; i < node->names.size(); ++i) {
        if (!module_env->has_local(node->names[i])) {
            const Token& t = i < node->name_tokens.size() ? node->name_tokens[i] : node->token;
            return EvalResult::error(RuntimeErrorKind::UnknownExport,
                "Module '" + node->module_name() + "' has no binding named '" + node->names[i] + "'", t.loc);
        }
    }
    for (const auto& name : node->names) env->define(name, module_env->values[name]);
    return Value{};
}
