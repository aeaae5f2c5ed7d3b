#include "normfmt/core/source_buffer.hpp"

namespace normfmt {

auto parse_source(const std::string& text) -> SourceBuffer {
    SourceBuffer buffer;

    auto first_newline = text.find('\n');
    if (first_newline != std::string::npos && first_newline > 0 && text[first_newline - 1] == '\r') {
        buffer.line_ending = LineEnding::CRLF;
    }

    size_t start = 0;
    while (start < text.size()) {
        auto end = text.find('\n', start);
        if (end == std::string::npos) {
            end = text.size();
        }
        std::string line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        buffer.lines.push_back(std::move(line));
        start = end + 1;
    }

    return buffer;
}

auto render_source(const SourceBuffer& buffer) -> std::string {
    const char* ending = buffer.line_ending == LineEnding::CRLF ? "\r\n" : "\n";

    std::string output;
    for (const auto& line : buffer.lines) {
        output += line;
        output += ending;
    }
    return output;
}

} // namespace normfmt
