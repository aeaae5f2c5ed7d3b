#include "normfmt/core/line_scanner.hpp"

namespace normfmt {

namespace {

struct MaskState {
    bool in_comment = false;
    char quote = '\0';     // Open literal carried over a backslash-newline
};

auto mask_line(const std::string& line, MaskState& state, bool& has_comment) -> std::string {
    std::string code(line.size(), ' ');
    char quote = state.quote;
    state.quote = '\0';

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];

        if (state.in_comment) {
            has_comment = true;
            if (c == '*' && i + 1 < line.size() && line[i + 1] == '/') {
                state.in_comment = false;
                ++i;
            }
            continue;
        }

        if (quote != '\0') {
            if (c == '\\') {
                if (i + 1 == line.size()) {
                    state.quote = quote;
                }
                ++i;  // Escaped character stays masked
            } else if (c == quote) {
                code[i] = c;
                quote = '\0';
            }
            continue;
        }

        if (c == '/' && i + 1 < line.size() && line[i + 1] == '*') {
            has_comment = true;
            state.in_comment = true;
            ++i;
            continue;
        }
        if (c == '/' && i + 1 < line.size() && line[i + 1] == '/') {
            has_comment = true;
            break;
        }
        if (c == '"' || c == '\'') {
            quote = c;
        }
        code[i] = c;
    }

    return code;
}

auto first_code_char(const std::string& code) -> char {
    auto pos = code.find_first_not_of(" \t");
    return pos == std::string::npos ? '\0' : code[pos];
}

} // namespace

auto scan_lines(std::span<const std::string> lines) -> std::vector<LineInfo> {
    std::vector<LineInfo> infos;
    infos.reserve(lines.size());

    MaskState state;
    bool continues_directive = false;
    int brace_depth = 0;
    int paren_depth = 0;

    for (const auto& line : lines) {
        LineInfo info;
        info.starts_in_comment = state.in_comment;
        info.starts_in_string = state.quote != '\0';
        info.brace_depth = brace_depth;
        info.paren_depth = paren_depth;
        info.code = mask_line(line, state, info.has_comment);
        info.ends_in_string = state.quote != '\0';
        info.preprocessor = continues_directive
            || (!info.starts_in_comment && first_code_char(info.code) == '#');

        continues_directive = info.preprocessor && !line.empty() && line.back() == '\\';

        if (!info.preprocessor) {
            for (char c : info.code) {
                switch (c) {
                case '{':
                    ++brace_depth;
                    break;
                case '}':
                    brace_depth = brace_depth > 0 ? brace_depth - 1 : 0;
                    break;
                case '(':
                    ++paren_depth;
                    break;
                case ')':
                    paren_depth = paren_depth > 0 ? paren_depth - 1 : 0;
                    break;
                default:
                    break;
                }
            }
        }

        infos.push_back(std::move(info));
    }

    return infos;
}

auto mask_code(const std::string& line) -> std::string {
    MaskState state;
    bool has_comment = false;
    return mask_line(line, state, has_comment);
}

auto is_code_blank(const LineInfo& info) -> bool {
    return info.code.find_first_not_of(" \t") == std::string::npos;
}

auto last_code_char(const LineInfo& info) -> char {
    auto pos = info.code.find_last_not_of(" \t");
    return pos == std::string::npos ? '\0' : info.code[pos];
}

} // namespace normfmt
