#include <iostream>
#include <string>
#include <vector>

#include "cli_commands.hpp"
#include "repl.hpp"

int main(int argc, char* argv[]) {
    auto print_usage = []() {
        std::cout << "Usage: giu [options] [command] [file]\n"
                  << "Commands:\n"
                  << "  run [file]       Run a script (default: the entry of giu.json)\n"
                  << "  check <file>     Lex and parse a script without running it\n"
                  << "  <file>           Same as `run <file>`\n"
                  << "Options:\n"
                  << "  -v, --version    Print version and exit\n"
                  << "  -i               Start REPL (interactive)\n"
                  << "  -h, --help       Show this help message\n"
                  << "  --no-color       Disable coloured diagnostics\n"
                  << "\n"
                  << "If a filename starts with '-', either use `--` to end options\n"
                  << "or prefix the filename with a path (for example `./-weird.giu`):\n"
                  << "  giu -- -weird.giu\n";
    };

    // Simple options parser: scan argv until we hit a non-option or `--`.
    std::vector<std::string> positional;
    bool seen_double_dash = false;
    bool start_repl = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (seen_double_dash || !positional.empty()) {
            positional.push_back(arg);
            continue;
        }

        if (arg == "--") {
            seen_double_dash = true;
            continue;
        }

        if (!arg.empty() && arg[0] == '-') {
            if (arg == "-v" || arg == "--version") {
                std::cout << "giu v" << GIU_VERSION << std::endl;
                return 0;
            } else if (arg == "-i") {
                start_repl = true;
            } else if (arg == "-h" || arg == "--help") {
                print_usage();
                return 0;
            } else if (arg == "--no-color") {
                giu::cli::set_color_enabled(false);
            } else {
                std::cerr << "giu: unknown option '" << arg << "'\n";
                std::cerr << "Try 'giu --help' for more information.\n";
                return 1;
            }
            continue;
        }

        positional.push_back(arg);
    }

    if (start_repl || positional.empty()) {
        run_repl_mode();
        return 0;
    }

    // `giu <file>` is shorthand for `giu run <file>`
    if (seen_double_dash || (positional[0] != "run" && positional[0] != "check")) {
        positional.insert(positional.begin(), "run");
    }

    giu::cli::CommandResult result = giu::cli::execute_command(positional);
    if (!result.message.empty()) {
        std::cerr << giu::cli::error_prefix() << result.message << std::endl;
    }
    return result.exit_code;
}
