#include "normfmt/core/header_block.hpp"
#include "normfmt/string_utils.hpp"
#include <array>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace normfmt {

namespace {

const std::string kStart = "/*";
const std::string kEnd = "*/";

// Right-hand art for lines 3 to 9
const std::array<std::string, 7> kArt{
    "        :::      ::::::::",
    "      :+:      :+:    :+:",
    "    +:+ +:+         +:+  ",
    "  +#+  +:+       +#+     ",
    "+#+#+#+#+#+   +#+        ",
    "     #+#    #+#          ",
    "    ###   ########.fr    "};

auto left_field(const std::string& line) -> std::string {
    auto field = line.substr(kHeaderMargin, kHeaderWidth - 2 * kHeaderMargin - kArt[0].size());
    auto last = field.find_last_not_of(' ');
    return last == std::string::npos ? "" : field.substr(0, last + 1);
}

// Split "<prefix><date> by <login>" into its parts
auto parse_stamp(const std::string& field, const std::string& prefix)
    -> std::optional<std::pair<std::string, std::string>> {
    if (!field.starts_with(prefix)) {
        return std::nullopt;
    }
    auto rest = field.substr(prefix.size());
    auto by = rest.find(" by ");
    if (by == std::string::npos) {
        return std::nullopt;
    }
    return std::pair{rest.substr(0, by), rest.substr(by + 4)};
}

auto strip_leading_blank_lines(std::vector<std::string>& lines) -> void {
    auto first = lines.begin();
    while (first != lines.end() && StringUtils::is_blank(*first)) {
        ++first;
    }
    lines.erase(lines.begin(), first);
}

} // namespace

auto header_border_line() -> std::string {
    return kStart + " " + std::string(kHeaderWidth - kStart.size() - kEnd.size() - 2, '*') + " " + kEnd;
}

auto header_text_line(const std::string& left, const std::string& right) -> std::string {
    size_t inner = kHeaderWidth - 2 * kHeaderMargin;
    auto field = left.substr(0, inner - right.size());

    std::string line = kStart + std::string(kHeaderMargin - kStart.size(), ' ');
    line += field;
    line += std::string(inner - field.size() - right.size(), ' ');
    line += right;
    line += std::string(kHeaderMargin - kEnd.size(), ' ') + kEnd;
    return line;
}

auto render_header(const HeaderBlock& block) -> std::vector<std::string> {
    return {
        header_border_line(),
        header_text_line("", ""),
        header_text_line("", kArt[0]),
        header_text_line(block.filename, kArt[1]),
        header_text_line("", kArt[2]),
        header_text_line("By: " + block.login + " <" + block.email + ">", kArt[3]),
        header_text_line("", kArt[4]),
        header_text_line("Created: " + block.created + " by " + block.created_by, kArt[5]),
        header_text_line("Updated: " + block.updated + " by " + block.updated_by, kArt[6]),
        header_text_line("", ""),
        header_border_line(),
    };
}

auto build_header(const HeaderIdentity& identity) -> std::vector<std::string> {
    auto stamp = format_header_timestamp(identity.timestamp);
    return render_header(HeaderBlock{.filename = identity.filename,
                                     .login = identity.login,
                                     .email = identity.email,
                                     .created = stamp,
                                     .created_by = identity.login,
                                     .updated = stamp,
                                     .updated_by = identity.login});
}

auto starts_with_header_border(const std::vector<std::string>& lines) -> bool {
    return !lines.empty() && lines.front() == header_border_line();
}

auto has_header(const std::vector<std::string>& lines) -> bool {
    if (lines.size() < kHeaderLines || !starts_with_header_border(lines)
        || lines[kHeaderLines - 1] != header_border_line()) {
        return false;
    }
    for (size_t i = 1; i + 1 < kHeaderLines; ++i) {
        const auto& line = lines[i];
        if (line.size() != kHeaderWidth || !line.starts_with(kStart) || !line.ends_with(kEnd)) {
            return false;
        }
    }
    return parse_stamp(left_field(lines[kUpdatedLine]), "Updated: ").has_value();
}

auto parse_header(const std::vector<std::string>& lines) -> std::optional<HeaderBlock> {
    if (!has_header(lines)) {
        return std::nullopt;
    }

    HeaderBlock block;
    block.filename = left_field(lines[3]);

    auto author = left_field(lines[5]);
    if (author.starts_with("By: ")) {
        auto open = author.find(" <");
        auto close = author.rfind('>');
        if (open != std::string::npos && close != std::string::npos && close > open) {
            block.login = author.substr(4, open - 4);
            block.email = author.substr(open + 2, close - open - 2);
        }
    }

    if (auto created = parse_stamp(left_field(lines[7]), "Created: ")) {
        block.created = created->first;
        block.created_by = created->second;
    }
    if (auto updated = parse_stamp(left_field(lines[kUpdatedLine]), "Updated: ")) {
        block.updated = updated->first;
        block.updated_by = updated->second;
    }
    return block;
}

auto format_header_timestamp(std::chrono::system_clock::time_point timestamp) -> std::string {
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm local{};
    localtime_r(&time, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%Y/%m/%d %H:%M:%S");
    return oss.str();
}

auto ensure_header(SourceBuffer& buffer, const HeaderIdentity& identity, Diagnostics& diagnostics)
    -> void {
    auto stamp = format_header_timestamp(identity.timestamp);

    if (has_header(buffer.lines)) {
        auto refreshed = header_text_line("Updated: " + stamp + " by " + identity.login, kArt[6]);
        if (buffer.lines[kUpdatedLine] != refreshed) {
            buffer.lines[kUpdatedLine] = refreshed;
            diagnostics.push_back(PassOutcome{.pass = "header",
                                              .status = PassOutcome::Status::APPLIED,
                                              .line_number = kUpdatedLine + 1,
                                              .reason = ""});
        }
        return;
    }

    if (starts_with_header_border(buffer.lines)) {
        diagnostics.push_back(PassOutcome{.pass = "header",
                                          .status = PassOutcome::Status::SKIPPED,
                                          .line_number = 1,
                                          .reason = "existing header block is malformed"});
        return;
    }

    auto body = std::move(buffer.lines);
    strip_leading_blank_lines(body);

    buffer.lines = build_header(identity);
    if (!body.empty()) {
        buffer.lines.emplace_back();
        buffer.lines.insert(buffer.lines.end(), body.begin(), body.end());
    }

    diagnostics.push_back(PassOutcome{.pass = "header",
                                      .status = PassOutcome::Status::APPLIED,
                                      .line_number = 1,
                                      .reason = ""});
}

} // namespace normfmt
