#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace normfmt {

// Line ending style
enum class LineEnding {
    LF,     // Unix/Linux/macOS
    CRLF    // Windows
};

// Outcome of one pass on one line or region
struct PassOutcome {
    enum class Status {
        APPLIED,
        SKIPPED
    };

    std::string pass;       // e.g. "split-declarations"
    Status status = Status::APPLIED;
    size_t line_number{};   // 1-based, in the buffer the pass received
    std::string reason;     // Only set for SKIPPED

    auto operator==(const PassOutcome& other) const -> bool = default;
};

using Diagnostics = std::vector<PassOutcome>;

// Who is stamped into the 42 header
struct HeaderIdentity {
    std::string filename;
    std::string login;
    std::string email;
    std::chrono::system_clock::time_point timestamp;
};

struct FormatOptions {
    HeaderIdentity identity;
    bool add_header = true;
};

struct FormatResult {
    std::string text;
    Diagnostics diagnostics;
};

// Process exit codes of one format invocation
enum ExitCode : int {
    EXIT_OK = 0,
    EXIT_RESOLUTION_FAILURE = 1,
    EXIT_EXECUTION_FAILURE = 2
};

auto skipped_count(const Diagnostics& diagnostics) -> size_t;
auto applied_count(const Diagnostics& diagnostics) -> size_t;

} // namespace normfmt
