#pragma once

#include "normfmt/types.hpp"
#include <string>
#include <vector>

namespace normfmt {

// Lines of one file under formatting. Owned by a single format operation.
struct SourceBuffer {
    std::vector<std::string> lines;     // Without line terminators
    LineEnding line_ending = LineEnding::LF;
};

// Split text into lines, detecting CRLF from the first terminator
auto parse_source(const std::string& text) -> SourceBuffer;

// Join lines with the detected line ending; every line is terminated
auto render_source(const SourceBuffer& buffer) -> std::string;

} // namespace normfmt
