#pragma once

#include <optional>
#include <string>
#include <vector>

namespace normfmt {

// Which lookup produced a candidate
enum class CandidateKind {
    EXPLICIT_OVERRIDE,
    SEARCH_PATH,
    MODULE_LOOKUP,
    WELL_KNOWN_DIRECTORY,
    PACKAGE_MANAGER
};

// One location a resolver strategy looked at
struct ResolverCandidate {
    CandidateKind kind = CandidateKind::SEARCH_PATH;
    size_t priority{};                          // Position of the strategy in the chain
    std::string location;                       // What was checked
    bool found = false;
    std::optional<std::string> executable;      // Discovered executable, if any
    std::optional<std::string> module_dir;      // Directory holding the importable package
    bool module_has_main = false;               // Package can run with "-m"

    auto operator==(const ResolverCandidate& other) const -> bool = default;
};

// No strategy located a usable formatter
struct ResolutionError {
    std::string message;
    std::vector<ResolverCandidate> attempts;
};

// The formatter could not be launched or returned nonzero
struct ExecutionError {
    std::string message;
    int exit_code{};
    std::string diagnostics;    // Captured output of the tool
};

// Staging or committing a file failed
struct IoError {
    std::string message;
    std::string path;
};

auto candidate_kind_name(CandidateKind kind) -> std::string;

} // namespace normfmt
