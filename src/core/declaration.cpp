#include "normfmt/core/declaration.hpp"
#include "normfmt/string_utils.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace normfmt {

namespace {

using Range = std::pair<size_t, size_t>;  // [begin, end)

const std::unordered_set<std::string> statement_keywords{
    "return", "goto", "case", "default", "else", "do", "if", "while",
    "for", "switch", "break", "continue", "sizeof"};

const std::unordered_set<std::string> storage_classes{"static", "extern", "typedef"};

// Tokens of a declarator head such as `const char *name` or `*next`
struct HeadTokens {
    std::vector<Range> words;
    std::vector<size_t> stars;
    bool has_brackets = false;
    bool invalid = false;
};

auto scan_head(const std::string& code, size_t begin, size_t end) -> HeadTokens {
    HeadTokens tokens;
    size_t i = begin;

    while (i < end) {
        char c = code[i];
        if (c == ' ' || c == '\t') {
            ++i;
        } else if (StringUtils::is_identifier_char(c)) {
            if (tokens.has_brackets) {
                tokens.invalid = true;
                return tokens;
            }
            size_t start = i;
            while (i < end && StringUtils::is_identifier_char(code[i])) {
                ++i;
            }
            tokens.words.emplace_back(start, i);
        } else if (c == '*' && !tokens.has_brackets) {
            tokens.stars.push_back(i);
            ++i;
        } else if (c == '[') {
            tokens.has_brackets = true;
            auto close = code.find(']', i);
            if (close == std::string::npos || close >= end) {
                tokens.invalid = true;
                return tokens;
            }
            i = close + 1;
        } else {
            tokens.invalid = true;
            return tokens;
        }
    }

    if (!tokens.words.empty() && std::isdigit(static_cast<unsigned char>(code[tokens.words.front().first]))) {
        tokens.invalid = true;
    }
    return tokens;
}

auto word_at(const std::string& text, const Range& range) -> std::string {
    return text.substr(range.first, range.second - range.first);
}

// Split [begin, end) of masked code on a delimiter at nesting depth zero
auto split_top_level(const std::string& code, size_t begin, size_t end, char delimiter)
    -> std::vector<Range> {
    std::vector<Range> parts;
    int depth = 0;
    size_t start = begin;

    for (size_t i = begin; i < end; ++i) {
        char c = code[i];
        if (c == '(' || c == '[' || c == '{') {
            ++depth;
        } else if (c == ')' || c == ']' || c == '}') {
            depth = std::max(0, depth - 1);
        } else if (c == delimiter && depth == 0) {
            parts.emplace_back(start, i);
            start = i + 1;
        }
    }
    parts.emplace_back(start, end);
    return parts;
}

// Position of a plain `=` at depth zero, or npos
auto find_assignment(const std::string& code, size_t begin, size_t end) -> size_t {
    int depth = 0;
    for (size_t i = begin; i < end; ++i) {
        char c = code[i];
        if (c == '(' || c == '[' || c == '{') {
            ++depth;
        } else if (c == ')' || c == ']' || c == '}') {
            depth = std::max(0, depth - 1);
        } else if (c == '=' && depth == 0) {
            bool comparison = (i + 1 < end && code[i + 1] == '=')
                || (i > begin && std::string("=!<>").find(code[i - 1]) != std::string::npos);
            if (comparison) {
                ++i;
                continue;
            }
            return i;
        }
    }
    return std::string::npos;
}

// Type words must all come before the first star
auto type_words_before_stars(const HeadTokens& tokens) -> bool {
    if (tokens.stars.empty()) {
        return true;
    }
    auto first_star = tokens.stars.front();
    for (size_t w = 0; w + 1 < tokens.words.size(); ++w) {
        if (tokens.words[w].first > first_star) {
            return false;
        }
    }
    return true;
}

auto stars_before_name(const HeadTokens& tokens) -> bool {
    const auto& name = tokens.words.back();
    return std::all_of(tokens.stars.begin(), tokens.stars.end(),
                       [&](size_t pos) { return pos < name.first; });
}

auto make_unsafe(std::string reason) -> DeclarationParse {
    return DeclarationParse{.kind = DeclarationParse::Kind::UNSAFE,
                            .statement = std::nullopt,
                            .reason = std::move(reason)};
}

} // namespace

auto is_statement_keyword(const std::string& word) -> bool {
    return statement_keywords.contains(word);
}

auto parse_declaration(const std::string& line, const std::string& code) -> DeclarationParse {
    DeclarationParse none;

    auto begin = code.find_first_not_of(" \t");
    auto semicolon = code.find_last_not_of(" \t");
    if (begin == std::string::npos || code[semicolon] != ';') {
        return none;
    }
    if (code.find(';', begin) != semicolon) {
        return none;  // More than one statement on the line
    }

    auto parts = split_top_level(code, begin, semicolon, ',');

    // First part carries the type: `<type words> <stars><name> [= expr]`
    const auto& first = parts.front();
    auto first_assign = find_assignment(code, first.first, first.second);
    auto head = scan_head(code, first.first,
                          first_assign == std::string::npos ? first.second : first_assign);
    if (head.invalid || head.words.size() < 2) {
        return none;
    }

    std::vector<std::string> type_words;
    for (size_t w = 0; w + 1 < head.words.size(); ++w) {
        type_words.push_back(word_at(code, head.words[w]));
    }
    if (is_statement_keyword(type_words.front()) || !stars_before_name(head)) {
        return none;
    }

    bool has_initializer = first_assign != std::string::npos;
    for (size_t p = 1; p < parts.size(); ++p) {
        if (find_assignment(code, parts[p].first, parts[p].second) != std::string::npos) {
            has_initializer = true;
        }
    }
    if (!has_initializer) {
        return none;
    }

    // From here on the line is a declaration with an initializer
    if (!type_words_before_stars(head)) {
        for (size_t w = 0; w + 1 < head.words.size(); ++w) {
            if (head.words[w].first > head.stars.front() && word_at(code, head.words[w]) == "const") {
                return make_unsafe("const pointer cannot be assigned after its declaration");
            }
        }
        return none;
    }
    for (const auto& word : type_words) {
        if (storage_classes.contains(word)) {
            return make_unsafe("'" + word + "' declaration changes meaning when split");
        }
    }
    if (head.has_brackets) {
        return make_unsafe("array initializer cannot be split");
    }

    bool is_const = std::find(type_words.begin(), type_words.end(), "const") != type_words.end();

    DeclarationStatement statement;
    auto indent_end = line.find_first_not_of(" \t");
    statement.indent = line.substr(0, indent_end);
    statement.indent_units = static_cast<size_t>(
        std::count(statement.indent.begin(), statement.indent.end(), '\t'));

    auto type_begin = head.words.front().first;
    auto type_end = head.words[head.words.size() - 2].second;
    statement.type = line.substr(type_begin, type_end - type_begin);

    auto declarator_begin = head.stars.empty() ? head.words.back().first : head.stars.front();
    statement.separator = line.substr(type_end, declarator_begin - type_end);

    for (size_t p = 0; p < parts.size(); ++p) {
        auto [part_begin, part_end] = parts[p];
        auto assign = find_assignment(code, part_begin, part_end);
        auto head_end = assign == std::string::npos ? part_end : assign;

        Declarator declarator;
        if (p == 0) {
            declarator.stars = line.substr(declarator_begin, head.words.back().first - declarator_begin);
            declarator.name = word_at(line, head.words.back());
        } else {
            auto tokens = scan_head(code, part_begin, head_end);
            if (tokens.has_brackets) {
                return make_unsafe("array declarator cannot be split");
            }
            if (tokens.invalid || tokens.words.size() != 1 || !stars_before_name(tokens)) {
                return make_unsafe("declarator '" + StringUtils::trim(line.substr(part_begin, part_end - part_begin))
                                   + "' cannot be split");
            }
            auto stars_begin = tokens.stars.empty() ? tokens.words.front().first : tokens.stars.front();
            declarator.stars = line.substr(stars_begin, tokens.words.front().first - stars_begin);
            declarator.name = word_at(line, tokens.words.front());
        }

        if (assign != std::string::npos) {
            auto expression = StringUtils::trim(line.substr(assign + 1, part_end - assign - 1));
            auto masked = StringUtils::trim(code.substr(assign + 1, part_end - assign - 1));
            if (expression.empty()) {
                return make_unsafe("empty initializer");
            }
            if (masked.front() == '{') {
                return make_unsafe("brace initializer cannot be split");
            }
            if (is_const && declarator.stars.find('*') == std::string::npos) {
                return make_unsafe("const object cannot be assigned after its declaration");
            }
            declarator.initializer = expression;
        }

        statement.declarators.push_back(std::move(declarator));
    }

    return DeclarationParse{.kind = DeclarationParse::Kind::SPLITTABLE,
                            .statement = std::move(statement),
                            .reason = ""};
}

auto split_declaration(const DeclarationStatement& statement) -> std::vector<std::string> {
    std::vector<std::string> lines;

    for (const auto& declarator : statement.declarators) {
        lines.push_back(statement.indent + statement.type + statement.separator
                        + declarator.stars + declarator.name + ";");
    }
    for (const auto& declarator : statement.declarators) {
        if (declarator.initializer) {
            lines.push_back(statement.indent + declarator.name + " = " + *declarator.initializer + ";");
        }
    }

    return lines;
}

auto is_bare_declaration(const std::string& code) -> bool {
    auto begin = code.find_first_not_of(" \t");
    auto semicolon = code.find_last_not_of(" \t");
    if (begin == std::string::npos || code[semicolon] != ';') {
        return false;
    }
    if (code.find_first_of("=;", begin) != semicolon) {
        return false;
    }

    auto parts = split_top_level(code, begin, semicolon, ',');
    auto head = scan_head(code, parts.front().first, parts.front().second);
    if (head.invalid || head.words.size() < 2 || !stars_before_name(head)) {
        return false;
    }
    if (is_statement_keyword(word_at(code, head.words.front()))) {
        return false;
    }

    for (size_t p = 1; p < parts.size(); ++p) {
        auto tokens = scan_head(code, parts[p].first, parts[p].second);
        if (tokens.invalid || tokens.words.size() != 1 || !stars_before_name(tokens)) {
            return false;
        }
    }
    return true;
}

} // namespace normfmt
