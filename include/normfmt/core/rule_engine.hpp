#pragma once

#include "normfmt/core/source_buffer.hpp"
#include "normfmt/types.hpp"
#include <string>

namespace normfmt::rule_engine {

// Spaces per indentation tab
inline constexpr size_t kIndentWidth = 4;

// Full pipeline: never throws, returns the best output plus skipped lines
auto format(const std::string& source, const FormatOptions& options) -> FormatResult;

// Passes, in pipeline order. Each mutates the buffer and appends outcomes.
auto normalize_indentation(SourceBuffer& buffer, Diagnostics& diagnostics) -> void;
auto split_declarations(SourceBuffer& buffer, Diagnostics& diagnostics) -> void;
auto place_braces(SourceBuffer& buffer, Diagnostics& diagnostics) -> void;
auto space_blocks(SourceBuffer& buffer, Diagnostics& diagnostics) -> void;
auto prune_blank_lines(SourceBuffer& buffer, Diagnostics& diagnostics) -> void;
auto apply_header(SourceBuffer& buffer, const FormatOptions& options, Diagnostics& diagnostics) -> void;
auto ensure_final_newline(SourceBuffer& buffer, Diagnostics& diagnostics) -> void;

} // namespace normfmt::rule_engine
