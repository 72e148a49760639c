#include "repl.hpp"

#include <cstdlib>
#include <filesystem>
#include <optional>

#include "cli_commands.hpp"
#include "colors.hpp"
#include "linenoise.h"
namespace fs = std::filesystem;

static std::optional<fs::path> get_home_dir() {
    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') return fs::path(home);
    return std::nullopt;
}

static fs::path history_file_in_home() {
    auto home = get_home_dir();
    if (home.has_value()) {
        return home.value() / ".giu_history";
    }
    return fs::current_path() / ".giu_history";
}

void run_repl_mode() {
    ReplSession session(std::cout, std::cerr);

    bool color = giu::cli::use_color(STDOUT_FILENO);
    std::cout << (color ? Color::cyan : "") << "giu v" << GIU_VERSION << (color ? Color::reset : "")
              << " | built on " << __DATE__ << "\n";
    std::cout << (color ? Color::bright_black : "") << "type 'exit' or 'quit' or Ctrl-D to quit"
              << (color ? Color::reset : "") << "\n";

    fs::path history_path = history_file_in_home();
    linenoiseHistoryLoad(history_path.string().c_str());

    std::string last_added_history;

    while (true) {
        char* raw = linenoise(session.prompt());
        if (!raw) {  // EOF (Ctrl-D) or error
            std::cout << "\n";
            break;
        }

        std::string line(raw);
        linenoiseFree(raw);

        if (!line.empty() && line != last_added_history) {
            linenoiseHistoryAdd(line.c_str());
            last_added_history = line;
        }

        if (session.feed_line(line) == ReplStatus::Exit) break;
    }

    linenoiseHistorySave(history_path.string().c_str());
}
