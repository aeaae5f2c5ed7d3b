#pragma once

#include <optional>
#include <string>
#include <vector>

namespace normfmt {

struct Declarator {
    std::string stars;                          // Pointer stars, e.g. "*" or "**"
    std::string name;
    std::optional<std::string> initializer;     // Expression text, trimmed

    auto operator==(const Declarator& other) const -> bool = default;
};

// A line of the form `<type> <identifier> = <expr>;` (possibly with several declarators)
struct DeclarationStatement {
    std::string indent;             // Literal leading whitespace
    size_t indent_units{};          // Number of tabs in the indentation
    std::string type;               // e.g. "unsigned int", "const char", "t_list"
    std::string separator;          // Whitespace between type and first declarator
    std::vector<Declarator> declarators;
};

struct DeclarationParse {
    enum class Kind {
        NONE,           // Not a declaration with an initializer
        SPLITTABLE,     // Safe to split
        UNSAFE          // Looks like one but splitting could change meaning
    };

    Kind kind = Kind::NONE;
    std::optional<DeclarationStatement> statement;
    std::string reason;             // Set for UNSAFE
};

// `code` is the masked view of `line` (see line_scanner.hpp)
auto parse_declaration(const std::string& line, const std::string& code) -> DeclarationParse;

// Declarations first, then one assignment per initialized declarator
auto split_declaration(const DeclarationStatement& statement) -> std::vector<std::string>;

// `int a;`, `char *s;`, `t_list *a, *b;`, `int tab[4];` - declarations without initializer
auto is_bare_declaration(const std::string& code) -> bool;

auto is_statement_keyword(const std::string& word) -> bool;

} // namespace normfmt
