#ifndef GIU_CLI_COMMANDS_HPP
#define GIU_CLI_COMMANDS_HPP

#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace giu {
namespace cli {

// Structure to hold parsed giu.json data
struct ProjectConfig {
    std::string name;
    std::string version;
    std::string entry;
    std::vector<std::string> module_paths;  // relative to root

    std::string root;  // directory holding giu.json

    bool is_valid = false;
};

// Command result structure
struct CommandResult {
    int exit_code;
    std::string message;
};

// Main command dispatcher: args[0] is the subcommand ("run" or "check").
// For `run <file> a b`, the words after the file are passed to the script.
CommandResult execute_command(const std::vector<std::string>& args);

// Individual command implementations
CommandResult cmd_run(const std::vector<std::string>& args);
CommandResult cmd_check(const std::vector<std::string>& args);

// Lex, parse and evaluate a script. Diagnostics go to `err`; returns the exit code.
// `script_args` are what std.env.args() returns.
int run_file(const std::string& path, const std::vector<std::string>& module_paths, std::ostream& err = std::cerr,
    const std::vector<std::string>& script_args = {});
// Lex and parse only; prints "OK: <file>" to `out` on success.
int check_file(const std::string& path, std::ostream& out = std::cout, std::ostream& err = std::cerr);

// Helper functions
std::optional<ProjectConfig> find_and_parse_giu_json(const std::string& start_dir = ".");
std::optional<ProjectConfig> parse_giu_json(const std::string& filepath);
std::string get_project_root(const std::string& start_dir = ".");
// `name` as given, else `name.giu` when `name` has no extension
std::optional<std::string> resolve_script_path(const std::string& name);

// "Error: " in red when stderr is a terminal and colour is enabled
std::string error_prefix();
void set_color_enabled(bool enabled);
// colour enabled and `fd` is a terminal
bool use_color(int fd);

}  // namespace cli
}  // namespace giu

#endif  // GIU_CLI_COMMANDS_HPP
