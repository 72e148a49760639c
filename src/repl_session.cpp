#include <cctype>
#include <memory>

#include "GiuError.hpp"
#include "cli_commands.hpp"
#include "lexer.hpp"
#include "parser.hpp"
#include "repl.hpp"

bool is_likely_incomplete_input(const std::string& err) {
    return err.find("found end of input") != std::string::npos;
}

static char last_non_ws_char(const std::string& line) {
    for (size_t i = line.size(); i > 0; --i) {
        unsigned char ch = static_cast<unsigned char>(line[i - 1]);
        if (!std::isspace(ch)) return static_cast<char>(ch);
    }
    return '\0';
}

static bool ends_with_open_brace(const std::string& line) {
    return last_non_ws_char(line) == '{';
}

static bool is_blank(const std::string& s) {
    for (unsigned char c : s)
        if (!std::isspace(c)) return false;
    return true;
}

// Return the count of *unclosed* bracket-like tokens: {...}, (...), [...]
// Characters inside double quotes and `//` comments are ignored.
int unclosed_brackets_depth(const std::string& s) {
    int braces = 0, paren = 0, square = 0;
    bool in_string = false;
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (in_string) {
            if (c == '\\') {
                ++i;
            } else if (c == '"') {
                in_string = false;
            }
            continue;
        }
        if (c == '"') {
            in_string = true;
            continue;
        }
        if (c == '/' && i + 1 < s.size() && s[i + 1] == '/') {
            while (i < s.size() && s[i] != '\n') ++i;
            continue;
        }

        if (c == '{')
            ++braces;
        else if (c == '}')
            --braces;
        else if (c == '(')
            ++paren;
        else if (c == ')')
            --paren;
        else if (c == '[')
            ++square;
        else if (c == ']')
            --square;
    }

    int openOnly = 0;
    if (braces > 0) openOnly += braces;
    if (paren > 0) openOnly += paren;
    if (square > 0) openOnly += square;
    return openOnly;  // zero if all balanced (or more closes than opens)
}

ReplSession::ReplSession(std::ostream& out, std::ostream& err) : out(out), err(err) {
    eval.set_entry_point("");
    eval.set_output(out);
}

ReplStatus ReplSession::feed_line(const std::string& line) {
    if (buffer.empty()) {
        if (line == "exit" || line == "quit") return ReplStatus::Exit;
        if (is_blank(line)) return ReplStatus::Evaluated;
    }

    buffer += line;
    buffer.push_back('\n');

    if (ends_with_open_brace(line) || unclosed_brackets_depth(buffer) > 0) {
        return ReplStatus::NeedMore;
    }

    std::unique_ptr<ProgramNode> ast;
    try {
        Lexer lexer(buffer, "<repl>");
        std::vector<Token> tokens = lexer.tokenize();
        Parser parser(tokens);
        ast = parser.parse();
    } catch (const GiuError& e) {
        if (e.kind() == "ParseError" && is_likely_incomplete_input(e.message())) {
            return ReplStatus::NeedMore;
        }
        err << giu::cli::error_prefix() << e.what() << std::endl;
        buffer.clear();
        return ReplStatus::Failed;
    }
    buffer.clear();

    try {
        Value v = eval.evaluate(ast.get());
        if (!std::holds_alternative<std::monostate>(v)) {
            out << eval.value_to_string(v) << "\n";
        }
    } catch (const GiuError& e) {
        err << giu::cli::error_prefix() << e.what() << std::endl;
        return ReplStatus::Failed;
    }
    return ReplStatus::Evaluated;
}
