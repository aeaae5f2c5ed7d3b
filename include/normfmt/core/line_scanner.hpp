#pragma once

#include <span>
#include <string>
#include <vector>

namespace normfmt {

// Lexical view of one source line. Columns in `code` match the original line:
// comment text becomes spaces and string/char literal contents become spaces
// (the quotes stay), so structural characters found in `code` are real code.
struct LineInfo {
    std::string code;
    bool starts_in_comment = false;     // Line begins inside a /* */ comment
    bool starts_in_string = false;      // Line continues a literal ended by `\`
    bool ends_in_string = false;        // Line ends with `\` inside a literal
    bool has_comment = false;           // Any comment text on this line
    bool preprocessor = false;          // Directive or a continuation of one
    int brace_depth{};                  // Depth before the first character
    int paren_depth{};                  // Depth before the first character
};

auto scan_lines(std::span<const std::string> lines) -> std::vector<LineInfo>;

// Mask a single line with no carried state (used on freshly split pieces)
auto mask_code(const std::string& line) -> std::string;

// True when the masked code of the line is only whitespace
auto is_code_blank(const LineInfo& info) -> bool;

// Last non-space character of the masked code, or '\0'
auto last_code_char(const LineInfo& info) -> char;

} // namespace normfmt
