#pragma once

#include "normfmt/core/source_buffer.hpp"
#include "normfmt/types.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace normfmt {

// Layout of the 42 header: 11 lines of exactly 80 columns
inline constexpr size_t kHeaderWidth = 80;
inline constexpr size_t kHeaderLines = 11;
inline constexpr size_t kHeaderMargin = 5;
inline constexpr size_t kUpdatedLine = 8;    // 0-based index of "Updated:"

struct HeaderBlock {
    std::string filename;
    std::string login;
    std::string email;
    std::string created;        // "YYYY/MM/DD HH:MM:SS"
    std::string created_by;
    std::string updated;
    std::string updated_by;
};

// Render the 11 header lines
auto render_header(const HeaderBlock& block) -> std::vector<std::string>;

// Fresh header for a file that has none: created and updated both stamp the identity
auto build_header(const HeaderIdentity& identity) -> std::vector<std::string>;

// One bordered text line: left field (truncated to fit) and right-aligned art
auto header_text_line(const std::string& left, const std::string& right) -> std::string;

auto header_border_line() -> std::string;

// True when lines [0, 11) form a well-formed header
auto has_header(const std::vector<std::string>& lines) -> bool;

// True when the first line is the header border, whether or not the block is valid
auto starts_with_header_border(const std::vector<std::string>& lines) -> bool;

// Read the fields back out of a well-formed header
auto parse_header(const std::vector<std::string>& lines) -> std::optional<HeaderBlock>;

auto format_header_timestamp(std::chrono::system_clock::time_point timestamp) -> std::string;

// Insert a header when missing, refresh "Updated" when present
auto ensure_header(SourceBuffer& buffer, const HeaderIdentity& identity, Diagnostics& diagnostics) -> void;

} // namespace normfmt
