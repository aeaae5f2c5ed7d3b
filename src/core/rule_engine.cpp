#include "normfmt/core/rule_engine.hpp"
#include "normfmt/core/declaration.hpp"
#include "normfmt/core/header_block.hpp"
#include "normfmt/core/line_scanner.hpp"
#include "normfmt/string_utils.hpp"
#include <algorithm>
#include <iterator>
#include <optional>

namespace normfmt::rule_engine {

namespace {

// Line passes can expose work for each other (a split brace line may reveal a
// declaration), so they repeat until the buffer stops changing.
constexpr int kMaxRounds = 8;

auto applied(const char* pass, size_t line_number) -> PassOutcome {
    return PassOutcome{.pass = pass,
                       .status = PassOutcome::Status::APPLIED,
                       .line_number = line_number,
                       .reason = ""};
}

auto skipped(const char* pass, size_t line_number, std::string reason) -> PassOutcome {
    return PassOutcome{.pass = pass,
                       .status = PassOutcome::Status::SKIPPED,
                       .line_number = line_number,
                       .reason = std::move(reason)};
}

enum class BraceKind {
    BLOCK,
    INITIALIZER
};

// Which lines touch an initializer brace (`= {`, `return (t_vec){`, `g((t_vec){`,
// nested `{1, 2}`). A `(` that does not follow a name or a closing bracket opens a
// cast, and a `{` right after that cast starts a compound literal.
auto find_initializer_lines(const std::vector<LineInfo>& infos) -> std::vector<bool> {
    std::vector<bool> touches(infos.size(), false);
    std::vector<BraceKind> stack;
    std::vector<bool> casts;    // One entry per open paren
    bool closed_cast = false;   // The last `)` closed a cast
    char last_significant = '\0';
    std::string last_word;
    std::string word;

    for (size_t i = 0; i < infos.size(); ++i) {
        const auto& info = infos[i];
        if (info.preprocessor) {
            continue;
        }
        if (!stack.empty() && stack.back() == BraceKind::INITIALIZER) {
            touches[i] = true;
        }

        for (char c : info.code) {
            if (StringUtils::is_identifier_char(c)) {
                word += c;
                continue;
            }
            if (!word.empty()) {
                last_word = word;
                last_significant = 'w';
                word.clear();
            }
            if (c == ' ' || c == '\t') {
                continue;
            }

            if (c == '(') {
                bool after_name = (last_significant == 'w' && last_word != "return")
                    || last_significant == ')' || last_significant == ']';
                casts.push_back(!after_name);
            } else if (c == ')') {
                closed_cast = !casts.empty() && casts.back();
                if (!casts.empty()) {
                    casts.pop_back();
                }
            } else if (c == '{') {
                bool initializer = (!stack.empty() && stack.back() == BraceKind::INITIALIZER)
                    || std::string("=,([").find(last_significant) != std::string::npos
                    || (last_significant == 'w' && last_word == "return")
                    || (last_significant == ')' && closed_cast);
                stack.push_back(initializer ? BraceKind::INITIALIZER : BraceKind::BLOCK);
                if (initializer) {
                    touches[i] = true;
                }
            } else if (c == '}') {
                if (!stack.empty()) {
                    if (stack.back() == BraceKind::INITIALIZER) {
                        touches[i] = true;
                    }
                    stack.pop_back();
                }
            } else if (c == ';') {
                casts.clear();
            }
            last_significant = c;
        }
        if (!word.empty()) {
            last_word = word;
            last_significant = 'w';
            word.clear();
        }
    }

    return touches;
}

auto has_empty_body(const std::string& code) -> bool {
    for (auto open = code.find('{'); open != std::string::npos; open = code.find('{', open + 1)) {
        auto next = code.find_first_not_of(" \t", open + 1);
        if (next != std::string::npos && code[next] == '}') {
            return true;
        }
    }
    return false;
}

auto starts_with_word(const std::string& text, const std::string& word) -> bool {
    return text.starts_with(word)
        && (text.size() == word.size() || !StringUtils::is_identifier_char(text[word.size()]));
}

// Text that must stay on the closing brace's line: `};`, `} t_list;`, `} while (x);`
auto binds_to_closing_brace(const std::string& text) -> bool {
    if (text.front() == ';' || text.front() == ',' || text.front() == ')') {
        return true;
    }
    if (starts_with_word(text, "while")) {
        return true;
    }
    if (starts_with_word(text, "else") || text.find('(') != std::string::npos || text.back() != ';') {
        return false;
    }
    auto first_word = text.substr(0, text.find_first_not_of(
        "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789_"));
    return !first_word.empty() && !is_statement_keyword(first_word);
}

// Pieces of a line cut at block braces
auto split_brace_pieces(const std::string& line, const std::string& code) -> std::vector<std::string> {
    std::vector<std::string> pieces;
    size_t start = 0;

    auto push_text = [&](size_t begin, size_t end) {
        auto text = StringUtils::trim(line.substr(begin, end - begin));
        if (text.empty()) {
            return;
        }
        if (!pieces.empty() && pieces.back() == "}" && binds_to_closing_brace(text)) {
            auto tail = line.substr(begin, end - begin);
            tail.erase(tail.find_last_not_of(" \t") + 1);
            pieces.back() += tail;
            return;
        }
        pieces.push_back(std::move(text));
    };

    for (size_t i = 0; i < code.size(); ++i) {
        if (code[i] == '{' || code[i] == '}') {
            push_text(start, i);
            pieces.emplace_back(1, code[i]);
            start = i + 1;
        }
    }
    push_text(start, line.size());
    return pieces;
}

auto trimmed_code(const LineInfo& info) -> std::string {
    return StringUtils::trim(info.code);
}

// Last code character before line `index`, skipping blank, comment-only and directive lines
auto previous_code_char(const std::vector<LineInfo>& infos, size_t index) -> char {
    for (size_t k = index; k-- > 0;) {
        if (!infos[k].preprocessor && !is_code_blank(infos[k])) {
            return last_code_char(infos[k]);
        }
    }
    return '\0';
}

auto is_function_opening_brace(const std::vector<LineInfo>& infos, size_t index) -> bool {
    const auto& info = infos[index];
    return !info.preprocessor && info.brace_depth == 0 && trimmed_code(info) == "{"
        && previous_code_char(infos, index) == ')';
}

// Lines inside a function body: below a file-scope `{` whose previous code ends with `)`.
// Struct bodies and file-scope initializers are not function bodies.
auto find_function_body_lines(const std::vector<LineInfo>& infos) -> std::vector<bool> {
    std::vector<bool> inside(infos.size(), false);
    bool in_function = false;

    for (size_t i = 0; i < infos.size(); ++i) {
        const auto& info = infos[i];
        if (info.brace_depth == 0) {
            in_function = false;
        } else {
            inside[i] = in_function;
        }
        if (info.preprocessor || info.brace_depth != 0) {
            continue;
        }

        auto open = info.code.find('{');
        if (open == std::string::npos) {
            continue;
        }
        auto before = info.code.find_last_not_of(" \t", open == 0 ? std::string::npos : open - 1);
        char previous = (open == 0 || before == std::string::npos) ? previous_code_char(infos, i)
                                                                   : info.code[before];
        in_function = previous == ')';
    }

    return inside;
}

} // namespace

auto normalize_indentation(SourceBuffer& buffer, Diagnostics& diagnostics) -> void {
    constexpr const char* pass = "indentation";
    auto infos = scan_lines(buffer.lines);

    for (size_t i = 0; i < buffer.lines.size(); ++i) {
        auto& line = buffer.lines[i];
        if (infos[i].starts_in_comment || infos[i].starts_in_string) {
            continue;
        }

        if (StringUtils::is_blank(line)) {
            if (!line.empty()) {
                line.clear();
                diagnostics.push_back(applied(pass, i + 1));
            }
            continue;
        }

        auto indent_end = line.find_first_not_of(" \t");
        auto first_space = line.find(' ');
        if (first_space == std::string::npos || first_space >= indent_end) {
            continue;  // Already tabs only
        }

        if (line.find('\t', first_space) < indent_end) {
            diagnostics.push_back(skipped(pass, i + 1, "space before tab in indentation"));
            continue;
        }

        size_t spaces = indent_end - first_space;
        if (spaces % kIndentWidth != 0) {
            diagnostics.push_back(skipped(pass, i + 1,
                "indentation of " + std::to_string(spaces) + " spaces is not a multiple of "
                    + std::to_string(kIndentWidth)));
            continue;
        }

        line = std::string(first_space + spaces / kIndentWidth, '\t') + line.substr(indent_end);
        diagnostics.push_back(applied(pass, i + 1));
    }
}

auto split_declarations(SourceBuffer& buffer, Diagnostics& diagnostics) -> void {
    constexpr const char* pass = "split-declarations";
    auto infos = scan_lines(buffer.lines);

    std::vector<std::string> output;
    output.reserve(buffer.lines.size());

    for (size_t i = 0; i < buffer.lines.size(); ++i) {
        const auto& line = buffer.lines[i];
        const auto& info = infos[i];

        // File scope, control headers, directives and comments are never declarations to split
        if (info.preprocessor || info.starts_in_comment || info.starts_in_string || info.ends_in_string
            || info.brace_depth == 0 || info.paren_depth > 0) {
            output.push_back(line);
            continue;
        }

        auto parsed = parse_declaration(line, info.code);
        switch (parsed.kind) {
        case DeclarationParse::Kind::NONE:
            output.push_back(line);
            break;
        case DeclarationParse::Kind::UNSAFE:
            output.push_back(line);
            diagnostics.push_back(skipped(pass, i + 1, parsed.reason));
            break;
        case DeclarationParse::Kind::SPLITTABLE:
            if (info.has_comment) {
                output.push_back(line);
                diagnostics.push_back(skipped(pass, i + 1, "comment on declaration line"));
                break;
            }
            for (auto& split : split_declaration(*parsed.statement)) {
                output.push_back(std::move(split));
            }
            diagnostics.push_back(applied(pass, i + 1));
            break;
        }
    }

    buffer.lines = std::move(output);
}

auto place_braces(SourceBuffer& buffer, Diagnostics& diagnostics) -> void {
    constexpr const char* pass = "braces";
    auto infos = scan_lines(buffer.lines);
    auto initializer_lines = find_initializer_lines(infos);

    std::vector<std::string> output;
    output.reserve(buffer.lines.size());

    for (size_t i = 0; i < buffer.lines.size(); ++i) {
        const auto& line = buffer.lines[i];
        const auto& info = infos[i];

        if (info.preprocessor || info.starts_in_comment || info.starts_in_string || info.ends_in_string
            || initializer_lines[i] || info.code.find_first_of("{}") == std::string::npos
            || has_empty_body(info.code)) {
            output.push_back(line);
            continue;
        }

        auto pieces = split_brace_pieces(line, info.code);
        if (pieces.size() <= 1) {
            output.push_back(line);
            continue;
        }

        if (info.has_comment) {
            output.push_back(line);
            diagnostics.push_back(skipped(pass, i + 1, "comment shares a line with a brace"));
            continue;
        }

        auto indent = StringUtils::extract_indentation(line);
        if (indent.find(' ') != std::string::npos) {
            output.push_back(line);
            diagnostics.push_back(skipped(pass, i + 1, "indentation is not made of tabs"));
            continue;
        }

        int level = static_cast<int>(indent.size());
        bool first = true;
        for (const auto& piece : pieces) {
            if (piece.front() == '}') {
                if (!first) {
                    level = std::max(0, level - 1);
                }
                output.push_back(std::string(level, '\t') + piece);
            } else if (piece == "{") {
                output.push_back(std::string(level, '\t') + piece);
                ++level;
            } else {
                output.push_back(std::string(level, '\t') + piece);
            }
            first = false;
        }
        diagnostics.push_back(applied(pass, i + 1));
    }

    buffer.lines = std::move(output);
}

auto space_blocks(SourceBuffer& buffer, Diagnostics& diagnostics) -> void {
    constexpr const char* pass = "block-spacing";
    auto infos = scan_lines(buffer.lines);
    auto function_body = find_function_body_lines(infos);
    auto initializer_lines = find_initializer_lines(infos);

    std::vector<std::string> output;
    output.reserve(buffer.lines.size());

    for (size_t i = 0; i < buffer.lines.size(); ++i) {
        output.push_back(buffer.lines[i]);

        const auto& info = infos[i];
        if (i + 1 >= buffer.lines.size() || !function_body[i] || initializer_lines[i] || info.preprocessor
            || info.starts_in_comment || info.starts_in_string || info.ends_in_string) {
            continue;
        }

        const auto& next = infos[i + 1];
        if (StringUtils::is_blank(buffer.lines[i + 1]) || next.preprocessor || next.starts_in_comment
            || is_code_blank(next) || trimmed_code(next).front() == '}') {
            continue;
        }

        bool block_brace = trimmed_code(info) == "{"
            && std::string("=,(").find(previous_code_char(infos, i)) == std::string::npos;
        bool last_declaration = is_bare_declaration(info.code) && !is_bare_declaration(next.code);

        if (block_brace || last_declaration) {
            output.emplace_back();
            diagnostics.push_back(applied(pass, i + 1));
        }
    }

    buffer.lines = std::move(output);
}

auto prune_blank_lines(SourceBuffer& buffer, Diagnostics& diagnostics) -> void {
    constexpr const char* pass = "blank-lines";
    auto infos = scan_lines(buffer.lines);

    std::vector<std::string> output;
    output.reserve(buffer.lines.size());

    bool previous_blank = false;
    std::optional<size_t> last_kept;

    for (size_t i = 0; i < buffer.lines.size(); ++i) {
        bool blank = StringUtils::is_blank(buffer.lines[i]) && !infos[i].starts_in_comment
            && !infos[i].starts_in_string;

        if (blank && previous_blank) {
            diagnostics.push_back(applied(pass, i + 1));
            continue;
        }
        if (blank && last_kept && is_function_opening_brace(infos, *last_kept)) {
            diagnostics.push_back(applied(pass, i + 1));
            continue;
        }

        output.push_back(buffer.lines[i]);
        previous_blank = blank;
        last_kept = i;
    }

    buffer.lines = std::move(output);
}

auto apply_header(SourceBuffer& buffer, const FormatOptions& options, Diagnostics& diagnostics) -> void {
    if (!options.add_header) {
        return;
    }
    ensure_header(buffer, options.identity, diagnostics);
}

auto ensure_final_newline(SourceBuffer& buffer, Diagnostics& diagnostics) -> void {
    auto original_size = buffer.lines.size();
    while (!buffer.lines.empty() && StringUtils::is_blank(buffer.lines.back())) {
        buffer.lines.pop_back();
    }
    if (buffer.lines.empty()) {
        buffer.lines.emplace_back();
    }
    if (buffer.lines.size() != original_size) {
        diagnostics.push_back(applied("final-newline", buffer.lines.size()));
    }
}

auto format(const std::string& source, const FormatOptions& options) -> FormatResult {
    auto buffer = parse_source(source);
    Diagnostics diagnostics;

    Diagnostics round;
    for (int i = 0; i < kMaxRounds; ++i) {
        auto before = buffer.lines;
        round.clear();

        normalize_indentation(buffer, round);
        split_declarations(buffer, round);
        place_braces(buffer, round);
        space_blocks(buffer, round);
        prune_blank_lines(buffer, round);

        std::copy_if(round.begin(), round.end(), std::back_inserter(diagnostics),
                     [](const PassOutcome& o) { return o.status == PassOutcome::Status::APPLIED; });
        if (buffer.lines == before) {
            break;
        }
    }
    // Skips reported against the settled buffer
    std::copy_if(round.begin(), round.end(), std::back_inserter(diagnostics),
                 [](const PassOutcome& o) { return o.status == PassOutcome::Status::SKIPPED; });

    apply_header(buffer, options, diagnostics);
    ensure_final_newline(buffer, diagnostics);

    return FormatResult{.text = render_source(buffer), .diagnostics = std::move(diagnostics)};
}

} // namespace normfmt::rule_engine
