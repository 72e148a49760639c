#include "cli_commands.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

#include "GiuError.hpp"
#include "colors.hpp"
#include "evaluator.hpp"
#include "lexer.hpp"
#include "parser.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace giu {
namespace cli {

namespace {

bool color_enabled = true;

bool read_source(const std::string& path, std::string& out) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return false;
    std::stringstream buffer;
    buffer << file.rdbuf();
    out = buffer.str();
    return true;
}

}  // namespace

void set_color_enabled(bool enabled) {
    color_enabled = enabled;
}

bool use_color(int fd) {
    return color_enabled && Color::supports_color(fd);
}

std::string error_prefix() {
    if (use_color(STDERR_FILENO)) return Color::red + "Error:" + Color::reset + " ";
    return "Error: ";
}

// Parse giu.json with nlohmann/json
std::optional<ProjectConfig> parse_giu_json(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }

    try {
        json j = json::parse(file);
        if (!j.is_object()) {
            std::cerr << error_prefix() << filepath << ": top-level value must be an object\n";
            return std::nullopt;
        }

        ProjectConfig config;
        config.is_valid = true;
        config.root = fs::absolute(fs::path(filepath)).parent_path().string();

        config.name = j.value("name", "");
        config.version = j.value("version", "");
        config.entry = j.value("entry", "");

        if (j.contains("module_paths") && j["module_paths"].is_array()) {
            for (const auto& p : j["module_paths"]) {
                if (p.is_string()) {
                    config.module_paths.push_back(p.get<std::string>());
                }
            }
        }

        return config;

    } catch (const json::parse_error& e) {
        std::cerr << error_prefix() << "JSON parse error in " << filepath << ": " << e.what() << std::endl;
        return std::nullopt;
    } catch (const json::exception& e) {
        std::cerr << error_prefix() << "JSON error in " << filepath << ": " << e.what() << std::endl;
        return std::nullopt;
    }
}

std::string get_project_root(const std::string& start_dir) {
    fs::path current = fs::absolute(start_dir);

    while (true) {
        fs::path config_path = current / "giu.json";
        if (fs::exists(config_path)) {
            return current.string();
        }

        if (!current.has_parent_path() || current == current.parent_path()) {
            break;
        }
        current = current.parent_path();
    }

    return "";
}

std::optional<ProjectConfig> find_and_parse_giu_json(const std::string& start_dir) {
    std::string root = get_project_root(start_dir);
    if (root.empty()) {
        return std::nullopt;
    }

    return parse_giu_json((fs::path(root) / "giu.json").string());
}

std::optional<std::string> resolve_script_path(const std::string& name) {
    fs::path p(name);
    std::error_code ec;
    if (fs::is_regular_file(p, ec)) return p.string();
    if (p.has_extension()) return std::nullopt;

    fs::path candidate = p;
    candidate += ".giu";
    if (fs::is_regular_file(candidate, ec)) return candidate.string();
    return std::nullopt;
}

int run_file(const std::string& path, const std::vector<std::string>& module_paths, std::ostream& err,
    const std::vector<std::string>& script_args) {
    std::string source_code;
    if (!read_source(path, source_code)) {
        err << error_prefix() << "Could not open file " << path << std::endl;
        return 1;
    }

    try {
        Lexer lexer(source_code, path);
        std::vector<Token> tokens = lexer.tokenize();

        Parser parser(tokens);
        std::unique_ptr<ProgramNode> ast = parser.parse();

        Evaluator evaluator;
        evaluator.set_entry_point(path);
        evaluator.set_module_paths(module_paths);
        evaluator.set_script_args(script_args);
        evaluator.evaluate(ast.get());
    } catch (const GiuError& e) {
        err << error_prefix() << e.what() << std::endl;
        return 1;
    }
    return 0;
}

int check_file(const std::string& path, std::ostream& out, std::ostream& err) {
    std::string source_code;
    if (!read_source(path, source_code)) {
        err << error_prefix() << "Could not open file " << path << std::endl;
        return 1;
    }

    try {
        Lexer lexer(source_code, path);
        std::vector<Token> tokens = lexer.tokenize();
        Parser parser(tokens);
        parser.parse();
    } catch (const GiuError& e) {
        err << error_prefix() << e.what() << std::endl;
        return 1;
    }

    out << "OK: " << path << std::endl;
    return 0;
}

// `giu run [file]`; without a file the project's entry is run from its root.
CommandResult cmd_run(const std::vector<std::string>& args) {
    auto config_opt = find_and_parse_giu_json(".");

    std::vector<std::string> module_paths;
    if (config_opt.has_value()) {
        for (const auto& mp : config_opt->module_paths) {
            module_paths.push_back((fs::path(config_opt->root) / mp).string());
        }
    }

    std::string target;
    std::vector<std::string> script_args;
    if (!args.empty()) {
        script_args.assign(args.begin() + 1, args.end());
        auto resolved = resolve_script_path(args[0]);
        if (!resolved.has_value()) {
            return {1, "File not found: " + args[0]};
        }
        target = resolved.value();
    } else {
        if (!config_opt.has_value()) {
            return {1, "No file given and no giu.json found in current directory or parent directories."};
        }
        if (config_opt->entry.empty()) {
            return {1, "No entry point specified in giu.json."};
        }
        fs::path entry_path = fs::path(config_opt->root) / config_opt->entry;
        if (!fs::exists(entry_path)) {
            return {1, "Entry point '" + config_opt->entry + "' not found at: " + entry_path.string()};
        }
        target = entry_path.string();
    }

    return {run_file(target, module_paths, std::cerr, script_args), ""};
}

CommandResult cmd_check(const std::vector<std::string>& args) {
    if (args.empty()) {
        return {1, "Usage: giu check <file>"};
    }
    auto resolved = resolve_script_path(args[0]);
    if (!resolved.has_value()) {
        return {1, "File not found: " + args[0]};
    }
    return {check_file(resolved.value()), ""};
}

CommandResult execute_command(const std::vector<std::string>& args) {
    if (args.empty()) {
        return {1, "No command given"};
    }

    const std::string& command = args[0];
    std::vector<std::string> cmd_args(args.begin() + 1, args.end());

    if (command == "run") {
        return cmd_run(cmd_args);
    } else if (command == "check") {
        return cmd_check(cmd_args);
    }
    return {1, "Unknown command: " + command};
}

}  // namespace cli
}  // namespace giu
