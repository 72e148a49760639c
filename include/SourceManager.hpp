#pragma once
#include <algorithm>
#include <string>
#include <utility>
#include <vector>

// Text of one lexed file or REPL unit, indexed by line start so diagnostics
// can quote the offending line with a marker under the token.
class SourceManager {
   public:
    SourceManager(std::string name, std::string text) : name_(std::move(name)), text_(std::move(text)) {
        line_starts_.push_back(0);
        for (size_t i = 0; i < text_.size(); ++i) {
            if (text_[i] == '\n') line_starts_.push_back(i + 1);
        }
    }

    const std::string& name() const { return name_; }
    size_t line_count() const { return line_starts_.size(); }

    // 1-based; without the line terminator (`\n` or `\r\n`). Empty when out of range.
    std::string line_text(int line) const {
        if (line < 1 || static_cast<size_t>(line) > line_starts_.size()) return "";
        size_t begin = line_starts_[line - 1];
        size_t end = text_.find('\n', begin);
        if (end == std::string::npos) end = text_.size();
        if (end > begin && text_[end - 1] == '\r') --end;
        return text_.substr(begin, end - begin);
    }

    //  * 2 | let b = a / 0
    //              ^~~~~
    // The marker covers `length` columns (at least one) and stops at the end of the line.
    // Tabs before the column are repeated in the padding so the marker lines up.
    std::string render_trace(int line, int col, int length) const {
        std::string text = line_text(line);
        std::string gutter = " * " + std::to_string(line) + " | ";

        size_t start = std::min(static_cast<size_t>(col > 0 ? col - 1 : 0), text.size());
        std::string pad(gutter.size(), ' ');
        for (size_t i = 0; i < start; ++i) pad.push_back(text[i] == '\t' ? '\t' : ' ');

        size_t span = 1;
        if (start < text.size()) span = std::min(static_cast<size_t>(std::max(length, 1)), text.size() - start);

        return gutter + text + "\n" + pad + "^" + std::string(span - 1, '~');
    }

   private:
    std::string name_;
    std::string text_;
    std::vector<size_t> line_starts_;
};
