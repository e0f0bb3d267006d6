#pragma once
#include <sstream>
#include <string>
#include <vector>

// Keeps the script text around so diagnostics can quote the offending line.
// Tokens point at the manager of the source they came from; the ProgramNode
// produced by the parser shares ownership so the pointer stays valid.
class SourceManager {
   public:
    std::string filename;
    std::string source;
    std::vector<std::string> lines;

    SourceManager(const std::string& fname, const std::string& src)
        : filename(fname), source(src) {
        build_line_table();
    }

    std::string get_line(int line_num) const {
        if (line_num < 1 || static_cast<size_t>(line_num) > lines.size()) return "";
        return lines[static_cast<size_t>(line_num) - 1];
    }

    std::string format_error_context(int line, int col) const {
        std::stringstream ss;
        std::string prefix = " * " + std::to_string(line) + " | ";
        std::string line_text = get_line(line);
        ss << prefix << line_text << "\n";

        // keep tabs so the caret lines up under the same glyphs
        std::string pad(prefix.size(), ' ');
        for (int c = 1; c < col && static_cast<size_t>(c - 1) < line_text.size(); ++c) {
            pad.push_back(line_text[static_cast<size_t>(c - 1)] == '\t' ? '\t' : ' ');
        }
        ss << pad << "^";
        return ss.str();
    }

   private:
    void build_line_table() {
        std::string current_line;
        for (char c : source) {
            if (c == '\n') {
                lines.push_back(current_line);
                current_line.clear();
            } else if (c != '\r') {
                current_line += c;
            }
        }
        if (!current_line.empty()) {
            lines.push_back(current_line);
        }
    }
};
