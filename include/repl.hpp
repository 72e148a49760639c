#pragma once
#include <iostream>
#include <string>

#include "evaluator.hpp"

// Result of feeding one input line to a ReplSession.
enum class ReplStatus {
    NeedMore,   // buffered; the unit is not complete yet
    Evaluated,  // unit ran (its value, if any, was printed)
    Failed,     // unit raised an error; the session continues
    Exit        // `exit` / `quit`
};

// Line-at-a-time REPL core, independent of the terminal. Every accepted unit runs
// against the same evaluator, so top-level bindings persist across units.
class ReplSession {
   public:
    ReplSession(std::ostream& out, std::ostream& err);

    ReplStatus feed_line(const std::string& line);

    // true while a multi-line unit is being collected
    bool continuing() const { return !buffer.empty(); }
    const char* prompt() const { return continuing() ? ".. " : ">> "; }

    Evaluator& evaluator() { return eval; }

   private:
    Evaluator eval;
    std::string buffer;
    std::ostream& out;
    std::ostream& err;
};

// Count of unclosed (), [], {} outside string literals.
int unclosed_brackets_depth(const std::string& s);
// A parse error that hit end of input means the unit continues on the next line.
bool is_likely_incomplete_input(const std::string& err);

void run_repl_mode();
