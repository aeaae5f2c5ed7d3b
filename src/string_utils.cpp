#include "normfmt/string_utils.hpp"
#include <cctype>

namespace normfmt {

auto StringUtils::extract_indentation(const std::string& line) -> std::string {
    size_t first_non_space = line.find_first_not_of(" \t");
    if (first_non_space == std::string::npos) {
        return line;
    }
    return line.substr(0, first_non_space);
}

auto StringUtils::trim(std::string_view text) -> std::string {
    auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return "";
    }
    auto last = text.find_last_not_of(" \t\r\n");
    return std::string(text.substr(first, last - first + 1));
}

auto StringUtils::is_blank(std::string_view line) -> bool {
    return line.find_first_not_of(" \t\r") == std::string_view::npos;
}

auto StringUtils::split(std::string_view text, char delimiter) -> std::vector<std::string> {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        auto pos = text.find(delimiter, start);
        if (pos == std::string_view::npos) {
            parts.emplace_back(text.substr(start));
            break;
        }
        parts.emplace_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

auto StringUtils::is_identifier(std::string_view text) -> bool {
    if (text.empty() || std::isdigit(static_cast<unsigned char>(text.front()))) {
        return false;
    }
    for (char c : text) {
        if (!is_identifier_char(c)) {
            return false;
        }
    }
    return true;
}

auto StringUtils::is_identifier_char(char c) -> bool {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

} // namespace normfmt
