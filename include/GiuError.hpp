#pragma once
#include <stdexcept>
#include <string>

#include "token.hpp"

// Error raised to the outermost caller (script runner, REPL, module import site).
// The kind is one of "LexError", "ParseError" or "RuntimeError".
class GiuError : public std::runtime_error {
   public:
    GiuError(const std::string& kind,
        const std::string& message,
        const TokenLocation& loc) : std::runtime_error(format_message(kind, message, loc)),
                                    kind_(kind),
                                    message_(message),
                                    loc_(loc) {}

    const std::string& kind() const { return kind_; }
    const std::string& message() const { return message_; }
    const TokenLocation& location() const { return loc_; }

   private:
    std::string kind_;
    std::string message_;
    TokenLocation loc_;

    static std::string format_message(const std::string& kind,
        const std::string& message,
        const TokenLocation& loc) {
        return kind + " at " + loc.to_string() + "\n" +
            message + "\n" +
            " --> Traced at:\n" +
            loc.get_line_trace();
    }
};
