#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace normfmt {

class StringUtils {
public:
    // Extract indentation (leading whitespace) from a line
    static auto extract_indentation(const std::string& line) -> std::string;

    static auto trim(std::string_view text) -> std::string;
    static auto is_blank(std::string_view line) -> bool;

    // Split on a single character, keeping empty fields
    static auto split(std::string_view text, char delimiter) -> std::vector<std::string>;

    static auto is_identifier(std::string_view text) -> bool;
    static auto is_identifier_char(char c) -> bool;
};

} // namespace normfmt
